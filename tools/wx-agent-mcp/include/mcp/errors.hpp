#pragma once

#include <stdexcept>
#include <string>

namespace wx::mcp {

class DuplicateToolError : public std::invalid_argument {
 public:
  explicit DuplicateToolError(const std::string& name)
      : std::invalid_argument("tool already registered: " + name), name_(name) {}

  const std::string& name() const { return name_; }

 private:
  std::string name_;
};

class UnknownToolError : public std::invalid_argument {
 public:
  explicit UnknownToolError(const std::string& name)
      : std::invalid_argument("tool not available: " + name), name_(name) {}

  const std::string& name() const { return name_; }

 private:
  std::string name_;
};

// Malformed invocation arguments; `field` names the first offending one.
class ValidationError : public std::invalid_argument {
 public:
  ValidationError(const std::string& field, const std::string& problem)
      : std::invalid_argument(field + ": " + problem), field_(field) {}

  const std::string& field() const { return field_; }

 private:
  std::string field_;
};

// A handler's own failure, tagged with the tool that raised it.
class HandlerError : public std::runtime_error {
 public:
  HandlerError(const std::string& tool_name, const std::string& cause)
      : std::runtime_error(tool_name + ": " + cause), tool_name_(tool_name), cause_(cause) {}

  const std::string& tool_name() const { return tool_name_; }
  const std::string& cause() const { return cause_; }

 private:
  std::string tool_name_;
  std::string cause_;
};

}  // namespace wx::mcp
