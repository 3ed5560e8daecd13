#include "tool/tool.hpp"

#include <spdlog/spdlog.h>

#include "core/error.hpp"

namespace convo {

namespace {

bool matches_type(const json& value, const std::string& type) {
  if (type == "string") return value.is_string();
  if (type == "integer") return value.is_number_integer();
  if (type == "number") return value.is_number();
  if (type == "boolean") return value.is_boolean();
  if (type == "object") return value.is_object();
  if (type == "array") return value.is_array();
  return true;
}

}  // namespace

// Parameter schema to JSON
json ParameterSchema::to_json_schema() const {
  json schema;
  schema["type"] = type;
  schema["description"] = description;

  if (default_value) {
    schema["default"] = *default_value;
  }

  if (enum_values && !enum_values->empty()) {
    schema["enum"] = *enum_values;
  }

  return schema;
}

json Tool::parameters_schema() const {
  json properties = json::object();
  json required_props = json::array();

  for (const auto& param : parameters()) {
    properties[param.name] = param.to_json_schema();
    if (param.required) {
      required_props.push_back(param.name);
    }
  }

  return {{"type", "object"}, {"properties", properties}, {"required", required_props}};
}

ToolSpec Tool::spec() const {
  return ToolSpec{name(), description(), parameters_schema(), read_only()};
}

Result<json> Tool::validate_args(const json& args) const {
  if (!args.is_object()) {
    return Result<json>::failure("Arguments must be a JSON object");
  }

  for (const auto& param : parameters()) {
    if (!args.contains(param.name)) {
      if (param.required) {
        return Result<json>::failure("Missing required parameter: " + param.name);
      }
      continue;
    }
    if (!matches_type(args[param.name], param.type)) {
      return Result<json>::failure("Parameter '" + param.name + "' must be of type " + param.type);
    }
  }

  return Result<json>::success(args);
}

// SimpleTool implementation
SimpleTool::SimpleTool(std::string name, std::string description, bool read_only)
    : name_(std::move(name)), description_(std::move(description)), read_only_(read_only) {}

// Tool Registry
void ToolRegistry::register_tool(std::shared_ptr<Tool> tool) {
  auto name = tool->name();
  if (index_.count(name)) {
    throw DuplicateTool(name);
  }
  index_[name] = tools_.size();
  tools_.push_back(std::move(tool));
  spdlog::debug("[ToolRegistry] Registered tool '{}'", name);
}

std::shared_ptr<Tool> ToolRegistry::get(const std::string& name) const {
  auto it = index_.find(name);
  if (it != index_.end()) {
    return tools_[it->second];
  }
  return nullptr;
}

std::optional<std::string> ToolRegistry::denial(const Tool& tool, Mode mode) const {
  if (mode == Mode::Planning && !tool.read_only()) {
    return "tool '" + tool.name() + "' is disabled in planning mode";
  }
  if (allow_list_ && !allow_list_->count(tool.name())) {
    return "tool '" + tool.name() + "' is not in the allowed tool list";
  }
  return std::nullopt;
}

std::shared_ptr<Tool> ToolRegistry::resolve(const std::string& name, Mode mode) const {
  auto tool = get(name);
  if (!tool) {
    throw UnknownTool(name);
  }
  if (auto reason = denial(*tool, mode)) {
    spdlog::warn("[ToolRegistry] Denied '{}' in {} mode: {}", name, to_string(mode), *reason);
    throw PolicyViolation(name, mode, *reason);
  }
  return tool;
}

std::vector<ToolSpec> ToolRegistry::list(Mode mode) const {
  std::vector<ToolSpec> specs;
  for (const auto& tool : tools_) {
    if (!denial(*tool, mode)) {
      specs.push_back(tool->spec());
    }
  }
  return specs;
}

void ToolRegistry::set_allow_list(std::vector<std::string> names) {
  allow_list_ = std::set<std::string>(names.begin(), names.end());
}

// Truncation helpers
namespace Truncate {

TruncateResult output(const std::string& text, size_t max_lines, size_t max_bytes) {
  TruncateResult result;
  result.truncated = false;

  // Sanitize input to ensure valid UTF-8 (prevents nlohmann::json type_error.316)
  std::string safe_text = sanitize_utf8(text);

  // Check byte limit
  if (safe_text.size() > max_bytes) {
    size_t cut = max_bytes;
    // Do not split a multi-byte sequence
    while (cut > 0 && (static_cast<unsigned char>(safe_text[cut]) & 0xC0) == 0x80) {
      --cut;
    }
    result.truncated = true;
    result.content = safe_text.substr(0, cut);
    result.content += "\n... [Output truncated. " + std::to_string(safe_text.size() - cut) + " bytes omitted]";
    return result;
  }

  // Check line limit
  size_t line_count = 0;
  size_t pos = 0;
  size_t last_newline = 0;

  while ((pos = safe_text.find('\n', pos)) != std::string::npos) {
    line_count++;
    last_newline = pos;
    pos++;

    if (line_count >= max_lines) {
      result.truncated = true;
      result.content = safe_text.substr(0, last_newline);

      size_t remaining = 0;
      while ((pos = safe_text.find('\n', pos)) != std::string::npos) {
        remaining++;
        pos++;
      }

      result.content += "\n... [" + std::to_string(remaining) + " lines truncated]";
      return result;
    }
  }

  result.content = safe_text;
  return result;
}

}  // namespace Truncate

}  // namespace convo
