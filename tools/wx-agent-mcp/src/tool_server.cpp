#include "mcp/tool_server.hpp"

#include <exception>
#include <string>
#include <utility>

#include "mcp/errors.hpp"

namespace wx::mcp {

namespace {

bool matches_type(const nlohmann::json& value, const std::string& type) {
  if (type == "string") {
    return value.is_string();
  }
  if (type == "integer") {
    return value.is_number_integer();
  }
  if (type == "number") {
    return value.is_number();
  }
  if (type == "boolean") {
    return value.is_boolean();
  }
  if (type == "object") {
    return value.is_object();
  }
  if (type == "array") {
    return value.is_array();
  }
  return false;
}

}  // namespace

const char* to_string(const FailureKind kind) {
  switch (kind) {
    case FailureKind::UNKNOWN_TOOL: return "UnknownTool";
    case FailureKind::VALIDATION_ERROR: return "ValidationError";
    case FailureKind::HANDLER_ERROR: break;
  }
  return "HandlerError";
}

nlohmann::json to_json(const ToolInvocationResult& result) {
  if (const auto* success = std::get_if<ToolSuccess>(&result); success != nullptr) {
    return success->payload;
  }
  const auto& failure = std::get<ToolFailure>(result);
  return nlohmann::json{{"error", {{"kind", to_string(failure.kind)}, {"message", failure.message}}}};
}

void validate_arguments(const ToolDefinition& definition, const nlohmann::json& arguments) {
  if (!arguments.is_null() && !arguments.is_object()) {
    throw ValidationError("arguments", "must be an object");
  }

  for (const auto& [name, param] : definition.input_schema) {
    const bool present = arguments.is_object() && arguments.contains(name) && !arguments.at(name).is_null();
    if (!present) {
      if (param.required) {
        throw ValidationError(name, "required argument is missing");
      }
      continue;
    }
    if (!matches_type(arguments.at(name), param.type)) {
      throw ValidationError(name, "expected " + param.type);
    }
  }

  if (arguments.is_object()) {
    for (const auto& item : arguments.items()) {
      bool declared = false;
      for (const auto& entry : definition.input_schema) {
        declared = declared || entry.first == item.key();
      }
      if (!declared) {
        throw ValidationError(item.key(), "unexpected argument");
      }
    }
  }
}

ToolServer::ToolServer(ToolRegistry registry) : registry_(std::move(registry)) {}

nlohmann::json ToolServer::list_tools() const {
  nlohmann::json tools = nlohmann::json::array();
  for (const auto& definition : registry_.list()) {
    tools.push_back(to_json(definition));
  }
  return nlohmann::json{{"tools", tools}};
}

ToolInvocationResult ToolServer::invoke(const ToolInvocationRequest& request, const InvokeOptions& options) const {
  try {
    return invoke_checked(request, options);
  } catch (const std::exception& ex) {
    return ToolFailure{FailureKind::HANDLER_ERROR, HandlerError(request.tool_name, ex.what()).what()};
  } catch (...) {
    return ToolFailure{FailureKind::HANDLER_ERROR, HandlerError(request.tool_name, "unknown failure").what()};
  }
}

ToolInvocationResult ToolServer::invoke_checked(const ToolInvocationRequest& request,
                                                const InvokeOptions& options) const {
  if (!registry_.contains(request.tool_name)) {
    return ToolFailure{FailureKind::UNKNOWN_TOOL, UnknownToolError(request.tool_name).what()};
  }

  const auto& definition = registry_.definition(request.tool_name);
  try {
    validate_arguments(definition, request.arguments);
  } catch (const ValidationError& ex) {
    return ToolFailure{FailureKind::VALIDATION_ERROR, ex.what()};
  }

  wx_agent::core::Cancellation cancellation(options.cancel_flag, std::nullopt);
  if (options.timeout.has_value() && options.timeout->count() > 0) {
    cancellation = cancellation.with_deadline(wx_agent::core::Cancellation::deadline_after(*options.timeout));
  }

  const nlohmann::json arguments = request.arguments.is_null() ? nlohmann::json::object() : request.arguments;
  try {
    return ToolSuccess{registry_.get(request.tool_name)(arguments, cancellation)};
  } catch (const std::exception& ex) {
    return ToolFailure{FailureKind::HANDLER_ERROR, HandlerError(definition.name, ex.what()).what()};
  }
}

}  // namespace wx::mcp
