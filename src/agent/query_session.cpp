#include "agent/query_session.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include "core/text.hpp"
#include "model/extracted_query.hpp"

namespace wx_agent::agent {

bool is_exit_command(const std::string& line) {
  const auto lower = core::to_lower(core::trim(line));
  return lower == "quit" || lower == "exit" || lower == "bye" || lower == "q";
}

QuerySession::QuerySession(std::shared_ptr<const query::QueryInterpreter> interpreter, wx::mcp::ToolServer tools,
                           const std::chrono::milliseconds invoke_timeout)
    : interpreter_(std::move(interpreter)), tools_(std::move(tools)) {
  if (interpreter_ == nullptr) {
    throw std::invalid_argument("query session requires an interpreter");
  }
  if (invoke_timeout.count() > 0) {
    options_.timeout = invoke_timeout;
  }
}

std::string QuerySession::answer(const std::string& query_text) const {
  const auto query = interpreter_->interpret(query_text);

  wx::mcp::ToolInvocationRequest request{.tool_name = "get_weather", .arguments = nlohmann::json::object()};
  if (query.candidate_city.has_value()) {
    request.arguments["city"] = *query.candidate_city;
  }

  const auto result = tools_.invoke(request, options_);
  const nlohmann::json line{{"query", model::to_json(query)}, {"result", wx::mcp::to_json(result)}};
  return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::size_t QuerySession::run(std::istream& in, std::ostream& out, std::ostream& err) const {
  std::size_t answered = 0;
  std::string line;
  while (std::getline(in, line)) {
    const auto query_text = core::trim(line);
    if (query_text.empty()) {
      continue;
    }
    if (is_exit_command(query_text)) {
      err << "[agent] exit requested\n";
      return answered;
    }

    out << answer(query_text) << '\n';
    out.flush();
    ++answered;
  }

  err << "[agent] input closed; exiting cleanly\n";
  return answered;
}

}  // namespace wx_agent::agent
