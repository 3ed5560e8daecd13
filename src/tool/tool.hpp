#pragma once

#include <atomic>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace convo {

// What a provider sees of a tool
struct ToolSpec {
  std::string name;
  std::string description;
  json parameters;  // JSON schema of the arguments object
  bool read_only = false;
};

// Tool execution context
struct ToolContext {
  SessionId session_id;
  ToolCallId call_id;
  std::filesystem::path working_dir;

  // Abort signal
  std::shared_ptr<std::atomic<bool>> abort_signal;
};

// Tool execution result
struct ToolResult {
  std::string output;
  bool is_error = false;

  static ToolResult success(const std::string& output) {
    return ToolResult{output, false};
  }

  static ToolResult error(const std::string& message) {
    return ToolResult{message, true};
  }
};

// Parameter schema (simplified JSON Schema)
struct ParameterSchema {
  std::string name;
  std::string type;  // "string", "integer", "number", "boolean", "object", "array"
  std::string description;
  bool required = true;
  std::optional<json> default_value;
  std::optional<std::vector<std::string>> enum_values;

  json to_json_schema() const;
};

// Tool definition. Implementations may be local or remote; the registry only
// relies on this interface.
class Tool {
 public:
  virtual ~Tool() = default;

  virtual std::string name() const = 0;

  virtual std::string description() const = 0;

  virtual std::vector<ParameterSchema> parameters() const = 0;

  // Read-only tools are the only ones callable in planning mode
  virtual bool read_only() const = 0;

  virtual std::future<ToolResult> execute(const json& args, const ToolContext& ctx) = 0;

  // JSON Schema of the arguments object
  json parameters_schema() const;

  ToolSpec spec() const;

  // Checks presence and JSON type of declared parameters
  Result<json> validate_args(const json& args) const;
};

// Base class for simpler tool implementation
class SimpleTool : public Tool {
 public:
  SimpleTool(std::string name, std::string description, bool read_only);

  std::string name() const override {
    return name_;
  }

  std::string description() const override {
    return description_;
  }

  bool read_only() const override {
    return read_only_;
  }

 protected:
  std::string name_;
  std::string description_;
  bool read_only_;
};

// Tool registry with mode policy and an optional allow-list.
//
// Planning mode exposes read-only tools only. When an allow-list is set it is
// applied after the mode filter, to listing and resolution alike.
class ToolRegistry {
 public:
  ToolRegistry() = default;

  // Throws DuplicateTool
  void register_tool(std::shared_ptr<Tool> tool);

  // nullptr when unknown, no policy applied
  std::shared_ptr<Tool> get(const std::string& name) const;

  // Throws UnknownTool, or PolicyViolation when the tool may not run in mode
  std::shared_ptr<Tool> resolve(const std::string& name, Mode mode) const;

  // Specs callable under mode, in registration order
  std::vector<ToolSpec> list(Mode mode) const;

  void set_allow_list(std::vector<std::string> names);

  size_t size() const {
    return tools_.size();
  }

 private:
  std::optional<std::string> denial(const Tool& tool, Mode mode) const;

  std::vector<std::shared_ptr<Tool>> tools_;
  std::map<std::string, size_t> index_;
  std::optional<std::set<std::string>> allow_list_;
};

// Truncation helper
namespace Truncate {
struct TruncateResult {
  std::string content;
  bool truncated;
};

// Truncate output if too large; the result is valid UTF-8
TruncateResult output(const std::string& text, size_t max_lines = 2000, size_t max_bytes = 51200);
}  // namespace Truncate

}  // namespace convo
