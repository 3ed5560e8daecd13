#include "llm/openai_adapter.hpp"

#include <spdlog/spdlog.h>

#include "core/error.hpp"
#include "core/uuid.hpp"
#include "llm/sse.hpp"

namespace convo::llm {

namespace {

int64_t count(const json& usage, const char* key) {
  auto it = usage.find(key);
  return it != usage.end() && it->is_number_integer() ? it->get<int64_t>() : 0;
}

TokenUsage parse_usage(const json& usage) {
  TokenUsage result;
  if (usage.is_object()) {
    result.input_tokens = count(usage, "prompt_tokens");
    result.output_tokens = count(usage, "completion_tokens");
  }
  return result;
}

std::string error_message(const json& j) {
  const auto& err = j["error"];
  if (err.is_object()) {
    return err.value("message", "unknown error");
  }
  return err.is_string() ? err.get<std::string>() : err.dump();
}

// SSE "data:" payloads with choices[0].delta, tool call fragments keyed by index
class OpenAIStreamDecoder : public StreamDecoder {
 public:
  explicit OpenAIStreamDecoder(std::string provider) : provider_(std::move(provider)) {}

  std::vector<NormalizedEvent> feed(const std::string& chunk) override {
    std::vector<NormalizedEvent> out;
    for (const auto& event : parser_.feed(chunk)) {
      dispatch(event.data, out);
    }
    return out;
  }

  std::vector<NormalizedEvent> finish() override {
    std::vector<NormalizedEvent> out;
    for (const auto& event : parser_.finish()) {
      dispatch(event.data, out);
    }
    if (!done_) {
      spdlog::debug("[{}] Stream ended without [DONE]", provider_);
      complete_calls(out);
      out.push_back(Done{reason_, usage_});
      done_ = true;
    }
    return out;
  }

 private:
  struct CallState {
    ToolCallId id;
    bool completed = false;
  };

  void dispatch(const std::string& data, std::vector<NormalizedEvent>& out) {
    try {
      handle(data, out);
    } catch (const json::exception& e) {
      throw ProtocolError(provider_ + " sent an unexpected stream event: " + e.what());
    }
  }

  void handle(const std::string& data, std::vector<NormalizedEvent>& out) {
    if (done_) return;

    if (data == "[DONE]") {
      complete_calls(out);
      out.push_back(Done{reason_, usage_});
      done_ = true;
      return;
    }

    json j = parse_json(data, provider_);
    if (j.contains("error")) {
      throw ProtocolError(provider_ + " stream error: " + error_message(j));
    }

    if (j.contains("usage") && j["usage"].is_object()) {
      usage_ = parse_usage(j["usage"]);
    }

    if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
      return;
    }

    const auto& choice = j["choices"][0];
    if (choice.contains("delta") && choice["delta"].is_object()) {
      const auto& delta = choice["delta"];

      if (delta.contains("content") && delta["content"].is_string()) {
        auto text = delta["content"].get<std::string>();
        if (!text.empty()) {
          out.push_back(TextDelta{std::move(text)});
        }
      }

      if (delta.contains("tool_calls") && delta["tool_calls"].is_array()) {
        for (const auto& tc : delta["tool_calls"]) {
          handle_tool_call(tc, out);
        }
      }
    }

    if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
      reason_ = finish_reason_from_string(choice["finish_reason"].get<std::string>());
      complete_calls(out);
    }
  }

  void handle_tool_call(const json& tc, std::vector<NormalizedEvent>& out) {
    int index = tc.value("index", 0);
    const json function = tc.contains("function") && tc["function"].is_object() ? tc["function"] : json::object();

    auto it = calls_.find(index);
    if (it == calls_.end()) {
      CallState call;
      if (tc.contains("id") && tc["id"].is_string() && !tc["id"].get<std::string>().empty()) {
        call.id = tc["id"].get<std::string>();
      } else {
        call.id = "call_" + UUID::short_id(12);
      }
      std::string name = function.contains("name") && function["name"].is_string() ? function["name"].get<std::string>() : "";
      it = calls_.emplace(index, call).first;
      order_.push_back(index);
      out.push_back(ToolCallStarted{call.id, std::move(name)});
    } else if (it->second.completed) {
      throw ProtocolError(provider_ + " sent a fragment for completed tool call '" + it->second.id + "'");
    }

    if (function.contains("arguments") && function["arguments"].is_string()) {
      auto fragment = function["arguments"].get<std::string>();
      if (!fragment.empty()) {
        out.push_back(ToolCallArgDelta{it->second.id, std::move(fragment)});
      }
    }
  }

  void complete_calls(std::vector<NormalizedEvent>& out) {
    for (int index : order_) {
      auto& call = calls_[index];
      if (!call.completed) {
        call.completed = true;
        out.push_back(ToolCallCompleted{call.id});
      }
    }
  }

  std::string provider_;
  SseParser parser_;
  std::map<int, CallState> calls_;
  std::vector<int> order_;
  FinishReason reason_ = FinishReason::Stop;
  TokenUsage usage_;
  bool done_ = false;
};

}  // namespace

OpenAIAdapter::OpenAIAdapter(const ProviderConfig& config, RequestOptions options)
    : ProviderAdapter(config, std::move(options)) {}

WireRequest OpenAIAdapter::encode(const std::vector<Message>& messages, const std::vector<ToolSpec>& tools,
                                  bool stream) const {
  json msgs = json::array();

  // System messages go first
  for (const auto& msg : messages) {
    if (msg.role() == Role::System) {
      msgs.push_back({{"role", "system"}, {"content", msg.text()}});
    }
  }

  for (const auto& msg : messages) {
    switch (msg.role()) {
      case Role::System:
        break;
      case Role::User:
        msgs.push_back({{"role", "user"}, {"content", msg.text()}});
        break;
      case Role::Assistant: {
        json m = {{"role", "assistant"}};
        // null content is only valid next to tool_calls
        m["content"] = msg.has_tool_calls() && !msg.content() ? json(nullptr) : json(msg.text());
        if (msg.has_tool_calls()) {
          json calls = json::array();
          for (const auto& tc : msg.tool_calls()) {
            calls.push_back({{"id", tc.id},
                             {"type", "function"},
                             {"function", {{"name", tc.name}, {"arguments", tc.arguments.dump()}}}});
          }
          m["tool_calls"] = calls;
        }
        msgs.push_back(m);
        break;
      }
      case Role::Tool:
        msgs.push_back({{"role", "tool"}, {"tool_call_id", msg.tool_call_id().value_or("")}, {"content", msg.text()}});
        break;
    }
  }

  json body;
  body["model"] = model();
  body["messages"] = msgs;
  body["stream"] = stream;

  if (!tools.empty()) {
    json tools_json = json::array();
    for (const auto& spec : tools) {
      tools_json.push_back(
          {{"type", "function"},
           {"function", {{"name", spec.name}, {"description", spec.description}, {"parameters", spec.parameters}}}});
    }
    body["tools"] = tools_json;
    body["tool_choice"] = "auto";
  }

  if (options_.max_tokens) {
    body["max_tokens"] = *options_.max_tokens;
  }
  if (options_.temperature) {
    body["temperature"] = *options_.temperature;
  }

  WireRequest request;
  request.url = endpoint("/chat/completions");
  request.headers = {{"Content-Type", "application/json"}, {"Authorization", "Bearer " + config_.api_key}};
  if (stream) {
    request.headers["Accept"] = "text/event-stream";
  }
  request.body = std::move(body);
  return request;
}

NormalizedResponse OpenAIAdapter::parse_response(const std::string& body) const {
  json j = parse_json(body, name());
  if (!j.is_object()) {
    throw ProtocolError(name() + " response is not a JSON object");
  }

  try {
    return decode_response(j);
  } catch (const json::exception& e) {
    throw ProtocolError(name() + " sent an unexpected response: " + e.what());
  }
}

NormalizedResponse OpenAIAdapter::decode_response(const json& j) const {
  if (j.contains("error")) {
    throw ProtocolError(name() + " error: " + error_message(j));
  }
  if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
    throw ProtocolError(name() + " response has no choices");
  }

  const auto& choice = j["choices"][0];
  if (!choice.contains("message") || !choice["message"].is_object()) {
    throw ProtocolError(name() + " response choice has no message");
  }
  const auto& message = choice["message"];

  NormalizedResponse response;

  if (message.contains("content") && message["content"].is_string()) {
    response.text = message["content"].get<std::string>();
  }

  if (message.contains("tool_calls") && message["tool_calls"].is_array()) {
    for (const auto& tc : message["tool_calls"]) {
      if (!tc.contains("function") || !tc["function"].is_object() || !tc["function"].contains("name") ||
          !tc["function"]["name"].is_string()) {
        throw ProtocolError(name() + " tool call without a function name");
      }

      ToolCall call;
      call.id = tc.contains("id") && tc["id"].is_string() ? tc["id"].get<std::string>() : "call_" + UUID::short_id(12);
      call.name = tc["function"]["name"].get<std::string>();

      const json args = tc["function"].value("arguments", json(""));
      if (args.is_object()) {
        call.arguments = args;
      } else if (args.is_string()) {
        std::string error;
        if (auto parsed = parse_tool_arguments(args.get<std::string>(), error)) {
          call.arguments = std::move(*parsed);
        } else {
          response.argument_errors[call.id] = error;
        }
      } else {
        response.argument_errors[call.id] = "tool arguments must be a JSON object";
      }

      response.tool_calls.push_back(std::move(call));
    }
  }

  if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
    response.finish_reason = finish_reason_from_string(choice["finish_reason"].get<std::string>());
  } else if (response.has_tool_calls()) {
    response.finish_reason = FinishReason::ToolCalls;
  }

  if (j.contains("usage")) {
    response.usage = parse_usage(j["usage"]);
  }

  return response;
}

std::unique_ptr<StreamDecoder> OpenAIAdapter::make_stream_decoder() const {
  return std::make_unique<OpenAIStreamDecoder>(name());
}

}  // namespace convo::llm
