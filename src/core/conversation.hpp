#pragma once

#include <set>
#include <string>
#include <vector>

#include "core/message.hpp"
#include "core/types.hpp"

namespace convo {

// Ordered message history of one session.
//
// Appends are validated: every tool result must answer a tool call issued
// earlier in the same conversation, each call id is answered at most once and
// call ids never repeat. A rejected append leaves the conversation unchanged.
class Conversation {
 public:
  Conversation();
  explicit Conversation(SessionId session_id);

  const SessionId &session_id() const {
    return session_id_;
  }

  const std::vector<Message> &messages() const {
    return messages_;
  }

  size_t size() const {
    return messages_.size();
  }

  bool empty() const {
    return messages_.empty();
  }

  // Completed provider turns recorded in this conversation
  int turn_count() const {
    return turn_count_;
  }

  // Throws ProtocolError when the message would break call/result pairing
  void append(Message msg);

  // All-or-nothing append of a batch
  void append_all(std::vector<Message> batch);

  void record_turn() {
    ++turn_count_;
  }

  // Issued tool calls that have no result yet, in issue order
  std::vector<ToolCall> pending_tool_calls() const;

  json to_json() const;

  // Replays every message through append(), so a document that breaks the
  // pairing rules is rejected with ProtocolError
  static Conversation from_json(const json &j);

 private:
  void check(const Message &msg, std::set<ToolCallId> &issued, std::set<ToolCallId> &answered) const;

  SessionId session_id_;
  std::vector<Message> messages_;
  int turn_count_ = 0;
  std::set<ToolCallId> issued_;
  std::set<ToolCallId> answered_;
};

}  // namespace convo
