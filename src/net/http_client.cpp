#include "net/http_client.hpp"

#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <curl/curl.h>

namespace wx_agent::net {
namespace {

std::once_flag g_curl_global_once;

void ensure_curl_global_init() {
  std::call_once(g_curl_global_once, []() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("curl_global_init failed");
    }
  });
}

std::size_t write_body(char* data, std::size_t size, std::size_t count, void* user_data) {
  auto* body = static_cast<std::string*>(user_data);
  body->append(data, size * count);
  return size * count;
}

int abort_on_cancel(void* user_data, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/, curl_off_t /*ultotal*/,
                    curl_off_t /*ulnow*/) {
  const auto* cancellation = static_cast<const core::Cancellation*>(user_data);
  return cancellation->requested() ? 1 : 0;
}

TransferError classify(const CURLcode code) {
  switch (code) {
    case CURLE_OK:
      return TransferError::NONE;
    case CURLE_OPERATION_TIMEDOUT:
      return TransferError::TIMEOUT;
    case CURLE_ABORTED_BY_CALLBACK:
      return TransferError::CANCELLED;
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_CONNECT:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_GOT_NOTHING:
    case CURLE_PARTIAL_FILE:
      return TransferError::CONNECTION;
    default:
      return TransferError::OTHER;
  }
}

}  // namespace

class HttpClient::HandlePool {
 public:
  explicit HandlePool(const std::uint32_t capacity) : capacity_(capacity == 0 ? 1U : capacity) {}

  ~HandlePool() {
    for (CURL* handle : idle_) {
      curl_easy_cleanup(handle);
    }
  }

  HandlePool(const HandlePool&) = delete;
  HandlePool& operator=(const HandlePool&) = delete;

  class Lease {
   public:
    explicit Lease(HandlePool& pool) : pool_(pool), handle_(pool.acquire()) {}
    ~Lease() { pool_.release(handle_); }

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    CURL* get() const { return handle_; }

   private:
    HandlePool& pool_;
    CURL* handle_;
  };

  CURL* acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    available_.wait(lock, [this]() { return !idle_.empty() || created_ < capacity_; });
    if (!idle_.empty()) {
      CURL* handle = idle_.back();
      idle_.pop_back();
      return handle;
    }

    CURL* handle = curl_easy_init();
    if (handle == nullptr) {
      throw std::runtime_error("curl_easy_init failed");
    }
    ++created_;
    return handle;
  }

  void release(CURL* handle) {
    // Reset drops per-request options but keeps live connections.
    curl_easy_reset(handle);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      idle_.push_back(handle);
    }
    available_.notify_one();
  }

 private:
  const std::uint32_t capacity_;
  std::uint32_t created_{0};
  std::vector<CURL*> idle_;
  std::mutex mutex_;
  std::condition_variable available_;
};

HttpClient::HttpClient(HttpClientOptions options)
    : options_(std::move(options)), pool_(std::make_unique<HandlePool>(options_.pool_size)) {
  ensure_curl_global_init();
}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::get(const std::string& url, const std::chrono::milliseconds timeout,
                             const core::Cancellation& cancellation) const {
  HttpResponse response{};
  if (timeout.count() <= 0) {
    response.error = TransferError::TIMEOUT;
    response.error_message = "no time left for request";
    return response;
  }
  if (cancellation.requested()) {
    response.error = TransferError::CANCELLED;
    response.error_message = "cancelled before start";
    return response;
  }

  HandlePool::Lease lease(*pool_);
  CURL* curl = lease.get();

  char error_buffer[CURL_ERROR_SIZE] = {0};
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 3L);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, abort_on_cancel);
  curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<core::Cancellation*>(&cancellation));
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);

  const CURLcode code = curl_easy_perform(curl);
  response.error = classify(code);
  if (code != CURLE_OK) {
    response.error_message = error_buffer[0] != '\0' ? std::string(error_buffer) : curl_easy_strerror(code);
    return response;
  }

  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
  return response;
}

std::string HttpClient::escape(const std::string& value) const {
  HandlePool::Lease lease(*pool_);
  char* escaped = curl_easy_escape(lease.get(), value.c_str(), static_cast<int>(value.size()));
  if (escaped == nullptr) {
    throw std::runtime_error("curl_easy_escape failed");
  }
  std::string out(escaped);
  curl_free(escaped);
  return out;
}

}  // namespace wx_agent::net
