#include "llm/stream_assembler.hpp"

#include <spdlog/spdlog.h>

#include <type_traits>
#include <variant>

#include "core/error.hpp"

namespace convo::llm {

std::string to_string(StreamAssembler::State state) {
  switch (state) {
    case StreamAssembler::State::Idle:
      return "idle";
    case StreamAssembler::State::AccumulatingText:
      return "accumulating_text";
    case StreamAssembler::State::AccumulatingToolArgs:
      return "accumulating_tool_args";
    case StreamAssembler::State::Complete:
      return "complete";
  }
  return "unknown";
}

StreamAssembler::StreamAssembler(TextSink on_text) : on_text_(std::move(on_text)) {}

StreamAssembler::PendingCall &StreamAssembler::find(const ToolCallId &id) {
  auto it = index_.find(id);
  if (it == index_.end()) {
    throw ProtocolError("stream event for unknown tool call '" + id + "'");
  }
  return calls_[it->second];
}

bool StreamAssembler::has_open_calls() const {
  for (const auto &call : calls_) {
    if (!call.completed) return true;
  }
  return false;
}

void StreamAssembler::complete_call(PendingCall &call) {
  call.completed = true;

  std::string error;
  if (auto args = parse_tool_arguments(call.buffer, error)) {
    call.arguments = std::move(*args);
  } else {
    spdlog::warn("[StreamAssembler] Tool call {} ({}): {}", call.id, call.name, error);
    call.error = error;
  }
}

void StreamAssembler::consume(const NormalizedEvent &event) {
  if (state_ == State::Complete) {
    throw ProtocolError("stream event after completion");
  }

  std::visit(
      [this](const auto &e) {
        using T = std::decay_t<decltype(e)>;

        if constexpr (std::is_same_v<T, TextDelta>) {
          text_ += e.text;
          saw_text_ = true;
          if (state_ == State::Idle) {
            state_ = State::AccumulatingText;
          }
          if (on_text_ && !e.text.empty()) {
            on_text_(e.text);
          }
        } else if constexpr (std::is_same_v<T, ToolCallStarted>) {
          if (e.id.empty()) {
            throw ProtocolError("tool call started without an id");
          }
          if (index_.count(e.id)) {
            throw ProtocolError("tool call '" + e.id + "' started twice");
          }
          index_[e.id] = calls_.size();
          calls_.push_back(PendingCall{e.id, e.name});
          state_ = State::AccumulatingToolArgs;
        } else if constexpr (std::is_same_v<T, ToolCallArgDelta>) {
          auto &call = find(e.id);
          if (call.completed) {
            throw ProtocolError("argument fragment for completed tool call '" + e.id + "'");
          }
          call.buffer += e.fragment;
          state_ = State::AccumulatingToolArgs;
        } else if constexpr (std::is_same_v<T, ToolCallCompleted>) {
          auto &call = find(e.id);
          if (call.completed) {
            throw ProtocolError("tool call '" + e.id + "' completed twice");
          }
          complete_call(call);
          state_ = has_open_calls() ? State::AccumulatingToolArgs : State::AccumulatingText;
        } else if constexpr (std::is_same_v<T, Done>) {
          for (auto &call : calls_) {
            if (!call.completed) {
              complete_call(call);
            }
          }
          finish_reason_ = e.reason;
          usage_ = e.usage;
          state_ = State::Complete;
        }
      },
      event);
}

void StreamAssembler::consume_all(const std::vector<NormalizedEvent> &events) {
  for (const auto &event : events) {
    consume(event);
  }
}

NormalizedResponse StreamAssembler::result() const {
  if (state_ != State::Complete) {
    throw ProtocolError("stream ended before completion (state " + to_string(state_) + ")");
  }

  NormalizedResponse response;
  if (saw_text_) {
    response.text = text_;
  }
  for (const auto &call : calls_) {
    response.tool_calls.push_back(ToolCall{call.id, call.name, call.arguments});
    if (call.error) {
      response.argument_errors[call.id] = *call.error;
    }
  }
  response.finish_reason = finish_reason_;
  if (response.has_tool_calls() && response.finish_reason == FinishReason::Stop) {
    response.finish_reason = FinishReason::ToolCalls;
  }
  response.usage = usage_;
  return response;
}

}  // namespace convo::llm
