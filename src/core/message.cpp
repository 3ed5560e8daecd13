#include "core/message.hpp"

#include "core/error.hpp"

namespace convo {

std::string to_string(Role role) {
  switch (role) {
    case Role::System:
      return "system";
    case Role::User:
      return "user";
    case Role::Assistant:
      return "assistant";
    case Role::Tool:
      return "tool";
  }
  return "user";
}

std::optional<Role> role_from_string(const std::string &str) {
  if (str == "system") return Role::System;
  if (str == "user") return Role::User;
  if (str == "assistant") return Role::Assistant;
  if (str == "tool") return Role::Tool;
  return std::nullopt;
}

Message Message::system(std::string content) {
  return Message(Role::System, std::move(content));
}

Message Message::user(std::string content) {
  return Message(Role::User, std::move(content));
}

Message Message::assistant(std::optional<std::string> content, std::vector<ToolCall> tool_calls) {
  Message msg(Role::Assistant, std::move(content));
  msg.tool_calls_ = std::move(tool_calls);
  return msg;
}

Message Message::tool_result(ToolCallId tool_call_id, std::string content) {
  Message msg(Role::Tool, std::move(content));
  msg.tool_call_id_ = std::move(tool_call_id);
  return msg;
}

json Message::to_json() const {
  json j;
  j["role"] = to_string(role_);

  if (content_) {
    j["content"] = *content_;
  }

  if (!tool_calls_.empty()) {
    json calls = json::array();
    for (const auto &tc : tool_calls_) {
      calls.push_back({{"id", tc.id}, {"name", tc.name}, {"arguments", tc.arguments}});
    }
    j["tool_calls"] = calls;
  }

  if (tool_call_id_) {
    j["tool_call_id"] = *tool_call_id_;
  }

  return j;
}

Message Message::from_json(const json &j) {
  if (!j.is_object()) {
    throw ProtocolError("message entry is not an object");
  }

  auto role = role_from_string(j.value("role", ""));
  if (!role) {
    throw ProtocolError("message has unknown role '" + j.value("role", "") + "'");
  }

  std::optional<std::string> content;
  if (j.contains("content") && j["content"].is_string()) {
    content = j["content"].get<std::string>();
  }

  switch (*role) {
    case Role::System:
      return system(content.value_or(""));
    case Role::User:
      return user(content.value_or(""));
    case Role::Tool: {
      if (!j.contains("tool_call_id") || !j["tool_call_id"].is_string()) {
        throw ProtocolError("tool message without tool_call_id");
      }
      return tool_result(j["tool_call_id"].get<std::string>(), content.value_or(""));
    }
    case Role::Assistant: {
      std::vector<ToolCall> calls;
      if (j.contains("tool_calls")) {
        for (const auto &tc : j["tool_calls"]) {
          ToolCall call;
          call.id = tc.value("id", "");
          call.name = tc.value("name", "");
          call.arguments = tc.value("arguments", json::object());
          calls.push_back(std::move(call));
        }
      }
      return assistant(std::move(content), std::move(calls));
    }
  }
  throw ProtocolError("unreachable role");
}

}  // namespace convo
