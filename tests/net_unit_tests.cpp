#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "core/cancellation.hpp"
#include "net/http_client.hpp"

using wx_agent::core::Cancellation;
using wx_agent::net::HttpClient;
using wx_agent::net::HttpClientOptions;
using wx_agent::net::HttpResponse;
using wx_agent::net::TransferError;

namespace {

using Clock = std::chrono::steady_clock;

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

// TCP listener on 127.0.0.1 with a kernel-chosen port. Connections complete
// in the backlog whether or not anyone accepts them.
class LoopbackListener {
 public:
  LoopbackListener() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd_ < 0) {
      throw std::runtime_error("socket failed");
    }
    const int one = 1;
    ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(fd_, 16) != 0) {
      ::close(fd_);
      throw std::runtime_error("bind/listen failed");
    }

    socklen_t len = sizeof(addr);
    if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
      ::close(fd_);
      throw std::runtime_error("getsockname failed");
    }
    port_ = ntohs(addr.sin_port);
  }

  ~LoopbackListener() { close(); }

  LoopbackListener(const LoopbackListener&) = delete;
  LoopbackListener& operator=(const LoopbackListener&) = delete;

  void close() {
    if (fd_ >= 0) {
      ::shutdown(fd_, SHUT_RDWR);
      ::close(fd_);
      fd_ = -1;
    }
  }

  int fd() const { return fd_; }
  std::uint16_t port() const { return port_; }
  std::string url(const std::string& path) const { return "http://127.0.0.1:" + std::to_string(port_) + path; }

 private:
  int fd_{-1};
  std::uint16_t port_{0};
};

// Accepts one connection, reads the request head and answers with `reply`.
void serve_once(const int listen_fd, const std::string& reply, std::string& request_out) {
  const int client = ::accept(listen_fd, nullptr, nullptr);
  if (client < 0) {
    return;
  }
  char buffer[1024];
  while (request_out.find("\r\n\r\n") == std::string::npos) {
    const auto received = ::recv(client, buffer, sizeof(buffer), 0);
    if (received <= 0) {
      break;
    }
    request_out.append(buffer, static_cast<std::size_t>(received));
  }
  ::send(client, reply.data(), reply.size(), MSG_NOSIGNAL);
  ::close(client);
}

long long elapsed_ms(const Clock::time_point started) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started).count();
}

int test_completed_exchange_reports_status_and_body() {
  LoopbackListener listener;
  const std::string body = R"({"message":"try later"})";
  const std::string reply = "HTTP/1.1 503 Service Unavailable\r\nContent-Type: application/json\r\nContent-Length: " +
                            std::to_string(body.size()) + "\r\nConnection: close\r\n\r\n" + body;
  std::string request;
  std::thread server(serve_once, listener.fd(), std::cref(reply), std::ref(request));

  const HttpClient client;
  const auto response =
      client.get(listener.url("/weather?q=" + client.escape("New York")), std::chrono::milliseconds(3000), {});
  listener.close();
  server.join();

  if (response.error != TransferError::NONE || response.status != 503 || response.body != body) {
    return fail("test_completed_exchange_reports_status_and_body", "expected 503 with body");
  }
  if (request.rfind("GET /weather?q=New%20York ", 0) != 0) {
    return fail("test_completed_exchange_reports_status_and_body", "query component should be escaped");
  }
  return 0;
}

int test_silent_server_times_out() {
  LoopbackListener listener;
  const HttpClient client;

  const auto started = Clock::now();
  const auto response = client.get(listener.url("/"), std::chrono::milliseconds(100), {});
  const auto took = elapsed_ms(started);

  if (response.error != TransferError::TIMEOUT) {
    return fail("test_silent_server_times_out", "expected TIMEOUT");
  }
  if (took > 2000) {
    return fail("test_silent_server_times_out", "timeout was not enforced");
  }
  if (response.error_message.empty()) {
    return fail("test_silent_server_times_out", "expected an error message");
  }
  return 0;
}

int test_raised_flag_aborts_transfer() {
  LoopbackListener listener;
  const HttpClient client;
  auto flag = std::make_shared<std::atomic_bool>(false);

  std::thread canceller([flag]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    flag->store(true);
  });

  const auto started = Clock::now();
  const auto response = client.get(listener.url("/"), std::chrono::milliseconds(10000), Cancellation(flag, std::nullopt));
  const auto took = elapsed_ms(started);
  canceller.join();

  if (response.error != TransferError::CANCELLED) {
    return fail("test_raised_flag_aborts_transfer", "expected CANCELLED");
  }
  if (took > 3000) {
    return fail("test_raised_flag_aborts_transfer", "transfer outlived the cancel flag");
  }
  return 0;
}

int test_passed_deadline_aborts_transfer() {
  LoopbackListener listener;
  const HttpClient client;

  const auto started = Clock::now();
  const auto response =
      client.get(listener.url("/"), std::chrono::milliseconds(10000), Cancellation::after(std::chrono::milliseconds(150)));
  const auto took = elapsed_ms(started);

  if (response.error != TransferError::CANCELLED) {
    return fail("test_passed_deadline_aborts_transfer", "expected CANCELLED");
  }
  if (took > 3000) {
    return fail("test_passed_deadline_aborts_transfer", "transfer outlived the caller deadline");
  }
  return 0;
}

int test_closed_port_is_connection_failure() {
  std::string url;
  {
    LoopbackListener listener;
    url = listener.url("/");
  }

  const HttpClient client;
  const auto response = client.get(url, std::chrono::milliseconds(2000), {});
  if (response.error != TransferError::CONNECTION) {
    return fail("test_closed_port_is_connection_failure", "expected CONNECTION");
  }
  return 0;
}

int test_requests_without_budget_never_start() {
  const HttpClient client;

  const auto no_time = client.get("http://127.0.0.1:9/", std::chrono::milliseconds(0), {});
  if (no_time.error != TransferError::TIMEOUT) {
    return fail("test_requests_without_budget_never_start", "zero timeout should report TIMEOUT");
  }

  auto flag = std::make_shared<std::atomic_bool>(true);
  const auto cancelled =
      client.get("http://127.0.0.1:9/", std::chrono::milliseconds(1000), Cancellation(flag, std::nullopt));
  if (cancelled.error != TransferError::CANCELLED) {
    return fail("test_requests_without_budget_never_start", "raised flag should report CANCELLED");
  }
  return 0;
}

int test_pool_blocks_when_every_handle_is_leased() {
  LoopbackListener listener;
  const HttpClient client(HttpClientOptions{.pool_size = 1, .user_agent = "wx-agent-test"});

  HttpResponse held{};
  std::thread holder([&client, &listener, &held]() {
    held = client.get(listener.url("/"), std::chrono::milliseconds(400), {});
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  const auto started = Clock::now();
  const auto escaped = client.escape("a b");
  const auto waited = elapsed_ms(started);
  holder.join();

  if (escaped != "a%20b") {
    return fail("test_pool_blocks_when_every_handle_is_leased", "unexpected escape result");
  }
  if (held.error != TransferError::TIMEOUT) {
    return fail("test_pool_blocks_when_every_handle_is_leased", "holder request should time out");
  }
  if (waited < 150) {
    return fail("test_pool_blocks_when_every_handle_is_leased", "second lease should wait for the first");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_completed_exchange_reports_status_and_body(); rc != 0) {
    return rc;
  }
  if (int rc = test_silent_server_times_out(); rc != 0) {
    return rc;
  }
  if (int rc = test_raised_flag_aborts_transfer(); rc != 0) {
    return rc;
  }
  if (int rc = test_passed_deadline_aborts_transfer(); rc != 0) {
    return rc;
  }
  if (int rc = test_closed_port_is_connection_failure(); rc != 0) {
    return rc;
  }
  if (int rc = test_requests_without_budget_never_start(); rc != 0) {
    return rc;
  }
  if (int rc = test_pool_blocks_when_every_handle_is_leased(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] net unit tests\n";
  return 0;
}
