#pragma once

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <string>

#include "mcp/tool_server.hpp"

namespace wx::mcp {

struct ServerOptions {
  std::string name{"wx-agent-mcp"};
  std::string version{"1.0.0"};
  std::uint32_t workers{1};
  // Applied to tools/call when the request carries no timeout_ms; zero disables.
  std::chrono::milliseconds invoke_timeout{0};
};

// Newline-delimited JSON-RPC 2.0 over a pair of streams. Requests are handled
// by `workers` threads; each response is written as one line once its request
// completes.
class Server {
 public:
  Server(ToolServer tools, ServerOptions options = {});

  // Returns when `in` reaches EOF and every accepted request has been answered.
  int run(std::istream& in, std::ostream& out, std::ostream& err) const;

  // Handles one raw line; returns the response line, or an empty string for
  // notifications.
  std::string handle_line(const std::string& line, std::ostream& err) const;

 private:
  nlohmann::json handle_request(const nlohmann::json& request, bool& should_respond) const;
  nlohmann::json handle_initialize(const nlohmann::json& params) const;
  nlohmann::json handle_tools_list() const;
  nlohmann::json handle_tools_call(const nlohmann::json& params) const;

  ToolServer tools_;
  ServerOptions options_;
};

}  // namespace wx::mcp
