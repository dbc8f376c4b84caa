#include "mcp/server.hpp"

#include <condition_variable>
#include <deque>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "mcp/jsonrpc.hpp"

namespace wx::mcp {

namespace {

// Same ceiling as server.invoke_timeout_ms.
constexpr long long kMaxTimeoutMs = 600000;

class LineQueue {
 public:
  void push(std::string line) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      lines_.push_back(std::move(line));
    }
    ready_.notify_one();
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    ready_.notify_all();
  }

  // False once closed and drained.
  bool pop(std::string& line) {
    std::unique_lock<std::mutex> lock(mutex_);
    ready_.wait(lock, [this]() { return closed_ || !lines_.empty(); });
    if (lines_.empty()) {
      return false;
    }
    line = std::move(lines_.front());
    lines_.pop_front();
    return true;
  }

 private:
  std::mutex mutex_;
  std::condition_variable ready_;
  std::deque<std::string> lines_;
  bool closed_{false};
};

}  // namespace

Server::Server(ToolServer tools, ServerOptions options) : tools_(std::move(tools)), options_(std::move(options)) {
  if (options_.workers == 0) {
    options_.workers = 1;
  }
}

int Server::run(std::istream& in, std::ostream& out, std::ostream& err) const {
  std::mutex io_mutex;
  LineQueue queue;

  std::vector<std::thread> workers;
  workers.reserve(options_.workers);
  for (std::uint32_t i = 0; i < options_.workers; ++i) {
    workers.emplace_back([this, &queue, &io_mutex, &out, &err]() {
      std::string line;
      while (queue.pop(line)) {
        std::ostringstream diagnostics;
        const auto response = handle_line(line, diagnostics);

        std::lock_guard<std::mutex> lock(io_mutex);
        err << diagnostics.str();
        if (!response.empty()) {
          out << response << '\n';
          out.flush();
        }
      }
    });
  }

  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }
    queue.push(line);
  }

  queue.close();
  for (auto& worker : workers) {
    worker.join();
  }

  return 0;
}

std::string Server::handle_line(const std::string& line, std::ostream& err) const {
  const auto request = nlohmann::json::parse(line, nullptr, false);
  if (request.is_discarded()) {
    err << "[" << options_.name << "] rejected unparseable request\n";
    return make_error_response(nullptr, JsonRpcError{.code = kParseError, .message = "parse error"}).dump();
  }

  bool should_respond = true;
  try {
    const auto response = handle_request(request, should_respond);
    return should_respond ? response.dump() : std::string{};
  } catch (const std::exception& ex) {
    err << "[" << options_.name << "] failed to process request: " << ex.what() << '\n';
    if (!should_respond) {
      return {};
    }
    return make_error_response(request_id_or_null(request),
                               JsonRpcError{.code = kInternalError, .message = "internal error"})
        .dump();
  }
}

nlohmann::json Server::handle_request(const nlohmann::json& request, bool& should_respond) const {
  JsonRpcRequest parsed;
  try {
    parsed = parse_request(request);
  } catch (const InvalidRequestError& ex) {
    return make_error_response(request_id_or_null(request), JsonRpcError{.code = kInvalidRequest, .message = ex.what()});
  }

  should_respond = parsed.id.has_value();
  const nlohmann::json id = parsed.id.value_or(nullptr);

  try {
    if (parsed.method == "initialize") {
      return make_result_response(id, handle_initialize(parsed.params));
    }
    if (parsed.method == "ping") {
      return make_result_response(id, nlohmann::json::object());
    }
    if (parsed.method == "tools/list") {
      return make_result_response(id, handle_tools_list());
    }
    if (parsed.method == "tools/call") {
      return make_result_response(id, handle_tools_call(parsed.params));
    }

    return make_error_response(id, JsonRpcError{.code = kMethodNotFound, .message = "method not found"});
  } catch (const std::invalid_argument& ex) {
    return make_error_response(id, JsonRpcError{.code = kInvalidParams, .message = ex.what()});
  }
}

nlohmann::json Server::handle_initialize(const nlohmann::json& params) const {
  if (!params.is_object()) {
    throw std::invalid_argument("params must be an object");
  }

  return nlohmann::json{{"serverInfo", {{"name", options_.name}, {"version", options_.version}}},
                        {"capabilities", {{"tools", nlohmann::json::object()}}}};
}

nlohmann::json Server::handle_tools_list() const { return tools_.list_tools(); }

nlohmann::json Server::handle_tools_call(const nlohmann::json& params) const {
  if (!params.is_object()) {
    throw std::invalid_argument("params must be an object");
  }

  const auto name_it = params.find("name");
  if (name_it == params.end() || !name_it->is_string()) {
    throw std::invalid_argument("name must be a string");
  }

  ToolInvocationRequest request{.tool_name = name_it->get<std::string>(), .arguments = nlohmann::json::object()};
  const auto args_it = params.find("arguments");
  if (args_it != params.end()) {
    request.arguments = *args_it;
  }

  InvokeOptions options{};
  if (options_.invoke_timeout.count() > 0) {
    options.timeout = options_.invoke_timeout;
  }
  const auto timeout_it = params.find("timeout_ms");
  if (timeout_it != params.end()) {
    if (!timeout_it->is_number_integer() || timeout_it->get<long long>() < 0 ||
        timeout_it->get<long long>() > kMaxTimeoutMs) {
      throw std::invalid_argument("timeout_ms must be an integer in range 0.." + std::to_string(kMaxTimeoutMs));
    }
    options.timeout = std::chrono::milliseconds(timeout_it->get<long long>());
  }

  return to_json(tools_.invoke(request, options));
}

}  // namespace wx::mcp
