#include "mcp/jsonrpc.hpp"

namespace wx::mcp {

namespace {

bool valid_id(const nlohmann::json& id) {
  return id.is_null() || id.is_string() || id.is_number_integer() || id.is_number_unsigned();
}

}  // namespace

JsonRpcRequest parse_request(const nlohmann::json& request) {
  if (!request.is_object()) {
    throw InvalidRequestError("Request must be a JSON object");
  }

  const auto jsonrpc_it = request.find("jsonrpc");
  if (jsonrpc_it == request.end() || !jsonrpc_it->is_string() || *jsonrpc_it != kJsonRpcVersion) {
    throw InvalidRequestError("jsonrpc must be \"2.0\"");
  }

  const auto method_it = request.find("method");
  if (method_it == request.end() || !method_it->is_string()) {
    throw InvalidRequestError("method must be a string");
  }

  JsonRpcRequest parsed{.method = method_it->get<std::string>(), .params = nlohmann::json::object(), .id = std::nullopt};

  const auto id_it = request.find("id");
  if (id_it != request.end()) {
    if (!valid_id(*id_it)) {
      throw InvalidRequestError("JSON-RPC id must be string, integer, or null");
    }
    parsed.id = *id_it;
  }

  const auto params_it = request.find("params");
  if (params_it != request.end()) {
    if (!params_it->is_object() && !params_it->is_array()) {
      throw InvalidRequestError("params must be an object or an array");
    }
    parsed.params = *params_it;
  }

  return parsed;
}

nlohmann::json request_id_or_null(const nlohmann::json& request) {
  if (request.is_object()) {
    const auto id_it = request.find("id");
    if (id_it != request.end() && valid_id(*id_it)) {
      return *id_it;
    }
  }
  return nullptr;
}

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}};
}

nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion},
                        {"id", id},
                        {"error", {{"code", error.code}, {"message", error.message}}}};
}

}  // namespace wx::mcp
