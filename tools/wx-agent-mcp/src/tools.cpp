#include "mcp/tools.hpp"

#include <utility>

#include "mcp/errors.hpp"

namespace wx::mcp {

void ToolRegistry::register_tool(ToolDefinition definition, ToolHandler handler) {
  if (definition.name.empty()) {
    throw std::invalid_argument("tool name must not be empty");
  }
  if (!handler) {
    throw std::invalid_argument("tool handler must be callable: " + definition.name);
  }
  if (contains(definition.name)) {
    throw DuplicateToolError(definition.name);
  }

  index_.emplace(definition.name, definitions_.size());
  definitions_.push_back(std::move(definition));
  handlers_.push_back(std::move(handler));
}

std::size_t ToolRegistry::index_of(const std::string& name) const {
  const auto it = index_.find(name);
  if (it == index_.end()) {
    throw UnknownToolError(name);
  }
  return it->second;
}

const ToolHandler& ToolRegistry::get(const std::string& name) const { return handlers_[index_of(name)]; }

const ToolDefinition& ToolRegistry::definition(const std::string& name) const {
  return definitions_[index_of(name)];
}

nlohmann::json to_json(const ToolDefinition& definition) {
  nlohmann::json schema = nlohmann::json::object();
  for (const auto& [param_name, param] : definition.input_schema) {
    nlohmann::json entry{{"type", param.type}, {"required", param.required}};
    if (!param.description.empty()) {
      entry["description"] = param.description;
    }
    schema[param_name] = std::move(entry);
  }

  return nlohmann::json{{"name", definition.name},
                        {"description", definition.description},
                        {"version", definition.version},
                        {"input_schema", schema}};
}

}  // namespace wx::mcp
