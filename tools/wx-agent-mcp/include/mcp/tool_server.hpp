#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "mcp/tools.hpp"

namespace wx::mcp {

struct ToolInvocationRequest {
  std::string tool_name;
  nlohmann::json arguments = nlohmann::json::object();
};

enum class FailureKind : std::uint8_t {
  UNKNOWN_TOOL = 0,
  VALIDATION_ERROR = 1,
  HANDLER_ERROR = 2,
};

const char* to_string(FailureKind kind);

struct ToolSuccess {
  nlohmann::json payload;
};

struct ToolFailure {
  FailureKind kind;
  std::string message;
};

using ToolInvocationResult = std::variant<ToolSuccess, ToolFailure>;

// Success -> payload; failure -> {"error": {"kind", "message"}}.
nlohmann::json to_json(const ToolInvocationResult& result);

struct InvokeOptions {
  // Caller-side timeout; propagates into the handler's in-flight work.
  std::optional<std::chrono::milliseconds> timeout{};
  std::shared_ptr<std::atomic_bool> cancel_flag{};
};

// Protocol-agnostic front of the registry. invoke() never throws: lookup,
// validation and handler faults all come back as ToolFailure.
class ToolServer {
 public:
  explicit ToolServer(ToolRegistry registry);

  nlohmann::json list_tools() const;

  ToolInvocationResult invoke(const ToolInvocationRequest& request, const InvokeOptions& options = {}) const;

  const ToolRegistry& registry() const { return registry_; }

 private:
  ToolInvocationResult invoke_checked(const ToolInvocationRequest& request, const InvokeOptions& options) const;

  ToolRegistry registry_;
};

// Throws ValidationError naming the first missing, mistyped or unexpected
// argument. `arguments` may be null (treated as empty).
void validate_arguments(const ToolDefinition& definition, const nlohmann::json& arguments);

}  // namespace wx::mcp
