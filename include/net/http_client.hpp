#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "core/cancellation.hpp"

namespace wx_agent::net {

enum class TransferError : std::uint8_t {
  NONE = 0,
  TIMEOUT = 1,
  CONNECTION = 2,
  CANCELLED = 3,
  OTHER = 4,
};

struct HttpResponse {
  TransferError error{TransferError::NONE};
  long status{0};
  std::string body{};
  std::string error_message{};
};

struct HttpClientOptions {
  std::uint32_t pool_size{4};
  std::string user_agent{"wx-agent/1.0"};
};

// libcurl client backed by a bounded pool of reusable easy handles; each handle
// keeps its own connection cache. get() is safe to call from many threads and
// blocks while every handle is leased.
class HttpClient {
 public:
  explicit HttpClient(HttpClientOptions options = {});
  ~HttpClient();

  HttpClient(const HttpClient&) = delete;
  HttpClient& operator=(const HttpClient&) = delete;

  // The transfer aborts once `timeout` elapses or `cancellation` fires.
  HttpResponse get(const std::string& url, std::chrono::milliseconds timeout,
                   const core::Cancellation& cancellation) const;

  // Percent-encodes a query component.
  std::string escape(const std::string& value) const;

 private:
  class HandlePool;

  HttpClientOptions options_;
  std::unique_ptr<HandlePool> pool_;
};

}  // namespace wx_agent::net
