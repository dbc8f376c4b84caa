#pragma once

#include <chrono>
#include <cstddef>
#include <iosfwd>
#include <memory>
#include <string>

#include "mcp/tool_server.hpp"
#include "query/interpreter.hpp"

namespace wx_agent::agent {

// quit, exit, bye, q (any case).
bool is_exit_command(const std::string& line);

// Line-oriented front end: each query is interpreted, sent to get_weather
// in process and answered with one JSON line {"query", "result"}.
class QuerySession {
 public:
  QuerySession(std::shared_ptr<const query::QueryInterpreter> interpreter, wx::mcp::ToolServer tools,
               std::chrono::milliseconds invoke_timeout = std::chrono::milliseconds(0));

  // Bytes that are not valid UTF-8 are replaced with U+FFFD in the output.
  std::string answer(const std::string& query_text) const;

  // Stops at EOF or an exit command; blank lines are skipped. Returns the
  // number of queries answered.
  std::size_t run(std::istream& in, std::ostream& out, std::ostream& err) const;

 private:
  std::shared_ptr<const query::QueryInterpreter> interpreter_;
  wx::mcp::ToolServer tools_;
  wx::mcp::InvokeOptions options_{};
};

}  // namespace wx_agent::agent
