#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "llm/adapter.hpp"

namespace convo::llm {

// Folds normalized stream events into one NormalizedResponse.
//
//   Idle -> AccumulatingText <-> AccumulatingToolArgs -> Complete
//
// Text deltas are forwarded to the text sink as they arrive. Argument
// fragments are concatenated per call id in arrival order and parsed once
// the call completes; a fragment set that does not parse fails only that
// call (see NormalizedResponse::argument_errors).
class StreamAssembler {
 public:
  enum class State { Idle, AccumulatingText, AccumulatingToolArgs, Complete };

  using TextSink = std::function<void(const std::string &text)>;

  explicit StreamAssembler(TextSink on_text = nullptr);

  // Throws ProtocolError for events that break the stream grammar: unknown
  // or duplicate call ids, fragments after completion, anything after Done
  void consume(const NormalizedEvent &event);

  void consume_all(const std::vector<NormalizedEvent> &events);

  State state() const {
    return state_;
  }

  bool complete() const {
    return state_ == State::Complete;
  }

  // The assembled reply. Throws ProtocolError before Done was consumed.
  NormalizedResponse result() const;

 private:
  struct PendingCall {
    ToolCallId id;
    std::string name;
    std::string buffer;
    bool completed = false;
    json arguments = json::object();
    std::optional<std::string> error;
  };

  PendingCall &find(const ToolCallId &id);
  void complete_call(PendingCall &call);
  bool has_open_calls() const;

  TextSink on_text_;
  State state_ = State::Idle;

  std::string text_;
  bool saw_text_ = false;

  std::vector<PendingCall> calls_;
  std::map<ToolCallId, size_t> index_;

  FinishReason finish_reason_ = FinishReason::Stop;
  TokenUsage usage_;
};

std::string to_string(StreamAssembler::State state);

}  // namespace convo::llm
