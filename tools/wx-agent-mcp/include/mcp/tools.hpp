#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/cancellation.hpp"

namespace wx_agent::weather {
class WeatherResolver;
}  // namespace wx_agent::weather

namespace wx::mcp {

struct ParamSpec {
  std::string type;  // string, integer, number, boolean, object, array
  bool required{false};
  std::string description{};
};

// Parameters in declaration order; validation reports the first bad one.
using InputSchema = std::vector<std::pair<std::string, ParamSpec>>;

struct ToolDefinition {
  std::string name;
  std::string description;
  std::string version{"1.0.0"};
  InputSchema input_schema;
};

using ToolHandler =
    std::function<nlohmann::json(const nlohmann::json& arguments, const wx_agent::core::Cancellation& cancellation)>;

// Name -> definition + handler. Filled once at startup and read-only while
// serving, so concurrent lookups need no lock.
class ToolRegistry {
 public:
  // Throws DuplicateToolError.
  void register_tool(ToolDefinition definition, ToolHandler handler);

  // Registration order.
  const std::vector<ToolDefinition>& list() const { return definitions_; }

  // Throw UnknownToolError.
  const ToolHandler& get(const std::string& name) const;
  const ToolDefinition& definition(const std::string& name) const;

  bool contains(const std::string& name) const { return index_.find(name) != index_.end(); }
  std::size_t size() const { return definitions_.size(); }

 private:
  std::size_t index_of(const std::string& name) const;

  std::vector<ToolDefinition> definitions_;
  std::vector<ToolHandler> handlers_;
  std::unordered_map<std::string, std::size_t> index_;
};

nlohmann::json to_json(const ToolDefinition& definition);

ToolDefinition get_weather_definition();

ToolRegistry build_tool_registry(std::shared_ptr<const wx_agent::weather::WeatherResolver> resolver);

}  // namespace wx::mcp
