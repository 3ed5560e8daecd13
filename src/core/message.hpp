#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace convo {

enum class Role { System, User, Assistant, Tool };

std::string to_string(Role role);

std::optional<Role> role_from_string(const std::string &str);

// A tool invocation requested by the model
struct ToolCall {
  ToolCallId id;
  std::string name;
  json arguments = json::object();

  bool operator==(const ToolCall &other) const = default;
};

// One conversation entry. Only the factories create messages so that
// tool_call_id is set exactly on tool results.
class Message {
 public:
  Message() = default;

  static Message system(std::string content);
  static Message user(std::string content);
  static Message assistant(std::optional<std::string> content, std::vector<ToolCall> tool_calls = {});
  static Message tool_result(ToolCallId tool_call_id, std::string content);

  Role role() const {
    return role_;
  }

  const std::optional<std::string> &content() const {
    return content_;
  }

  // Content or empty string
  std::string text() const {
    return content_.value_or("");
  }

  const std::vector<ToolCall> &tool_calls() const {
    return tool_calls_;
  }

  bool has_tool_calls() const {
    return !tool_calls_.empty();
  }

  const std::optional<ToolCallId> &tool_call_id() const {
    return tool_call_id_;
  }

  bool operator==(const Message &other) const = default;

  // Serialization
  json to_json() const;
  static Message from_json(const json &j);

 private:
  Message(Role role, std::optional<std::string> content) : role_(role), content_(std::move(content)) {}

  Role role_ = Role::User;
  std::optional<std::string> content_;
  std::vector<ToolCall> tool_calls_;
  std::optional<ToolCallId> tool_call_id_;
};

}  // namespace convo
