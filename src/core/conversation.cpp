#include "core/conversation.hpp"

#include "core/error.hpp"
#include "core/uuid.hpp"

namespace convo {

Conversation::Conversation() : session_id_(UUID::generate()) {}

Conversation::Conversation(SessionId session_id) : session_id_(std::move(session_id)) {}

void Conversation::check(const Message &msg, std::set<ToolCallId> &issued, std::set<ToolCallId> &answered) const {
  switch (msg.role()) {
    case Role::Tool: {
      const auto &id = msg.tool_call_id();
      if (!id || id->empty()) {
        throw ProtocolError("tool result without a tool call id");
      }
      if (!issued.count(*id)) {
        throw ProtocolError("tool result for unknown tool call '" + *id + "'");
      }
      if (!answered.insert(*id).second) {
        throw ProtocolError("tool call '" + *id + "' already has a result");
      }
      break;
    }
    case Role::Assistant:
      for (const auto &call : msg.tool_calls()) {
        if (call.id.empty()) {
          throw ProtocolError("tool call '" + call.name + "' has an empty id");
        }
        if (call.name.empty()) {
          throw ProtocolError("tool call '" + call.id + "' has an empty name");
        }
        if (!issued.insert(call.id).second) {
          throw ProtocolError("duplicate tool call id '" + call.id + "'");
        }
      }
      break;
    default:
      break;
  }
}

void Conversation::append(Message msg) {
  auto issued = issued_;
  auto answered = answered_;
  check(msg, issued, answered);

  issued_ = std::move(issued);
  answered_ = std::move(answered);
  messages_.push_back(std::move(msg));
}

void Conversation::append_all(std::vector<Message> batch) {
  auto issued = issued_;
  auto answered = answered_;
  for (const auto &msg : batch) {
    check(msg, issued, answered);
  }

  issued_ = std::move(issued);
  answered_ = std::move(answered);
  for (auto &msg : batch) {
    messages_.push_back(std::move(msg));
  }
}

std::vector<ToolCall> Conversation::pending_tool_calls() const {
  std::vector<ToolCall> pending;
  for (const auto &msg : messages_) {
    for (const auto &call : msg.tool_calls()) {
      if (!answered_.count(call.id)) {
        pending.push_back(call);
      }
    }
  }
  return pending;
}

json Conversation::to_json() const {
  json messages = json::array();
  for (const auto &msg : messages_) {
    messages.push_back(msg.to_json());
  }

  json j;
  j["session_id"] = session_id_;
  j["turn_count"] = turn_count_;
  j["messages"] = messages;
  return j;
}

Conversation Conversation::from_json(const json &j) {
  if (!j.is_object()) {
    throw ProtocolError("conversation document is not an object");
  }
  if (!j.contains("messages") || !j["messages"].is_array()) {
    throw ProtocolError("conversation document has no messages array");
  }

  Conversation conv(j.value("session_id", ""));
  for (const auto &entry : j["messages"]) {
    conv.append(Message::from_json(entry));
  }
  conv.turn_count_ = j.value("turn_count", 0);
  return conv;
}

}  // namespace convo
