#include "llm/anthropic_adapter.hpp"

#include <spdlog/spdlog.h>

#include "core/error.hpp"
#include "llm/sse.hpp"

namespace convo::llm {

namespace {

int64_t count(const json& usage, const char* key, int64_t fallback = 0) {
  auto it = usage.find(key);
  return it != usage.end() && it->is_number_integer() ? it->get<int64_t>() : fallback;
}

std::string error_message(const json& j) {
  if (j.contains("error") && j["error"].is_object()) {
    return j["error"].value("type", "error") + ": " + j["error"].value("message", "unknown error");
  }
  return j.dump();
}

// Appends blocks to the trailing user message, or starts a new one.
// The API wants alternating roles, so tool results and a following prompt
// share one user turn.
void push_user_blocks(json& msgs, const json& blocks) {
  if (!msgs.empty() && msgs.back()["role"] == "user") {
    for (const auto& block : blocks) {
      msgs.back()["content"].push_back(block);
    }
    return;
  }
  msgs.push_back({{"role", "user"}, {"content", blocks}});
}

// Events: message_start, content_block_start/delta/stop, message_delta,
// message_stop, ping, error
class AnthropicStreamDecoder : public StreamDecoder {
 public:
  explicit AnthropicStreamDecoder(std::string provider) : provider_(std::move(provider)) {}

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
      spdlog::warn("[{}] Stream ended without message_stop", provider_);
      for (auto& [index, id] : open_tool_blocks_) {
        out.push_back(ToolCallCompleted{id});
      }
      open_tool_blocks_.clear();
      out.push_back(Done{reason_, usage_});
      done_ = true;
    }
    return out;
  }

 private:
  void dispatch(const std::string& data, std::vector<NormalizedEvent>& out) {
    try {
      handle(data, out);
    } catch (const json::exception& e) {
      throw ProtocolError(provider_ + " sent an unexpected stream event: " + e.what());
    }
  }

  void handle(const std::string& data, std::vector<NormalizedEvent>& out) {
    if (done_) return;

    json j = parse_json(data, provider_);
    std::string type = j.value("type", "");

    if (type == "error") {
      throw ProtocolError(provider_ + " stream error: " + error_message(j));
    }

    if (type == "message_start") {
      if (j.contains("message") && j["message"].contains("usage")) {
        usage_.input_tokens = count(j["message"]["usage"], "input_tokens");
        usage_.output_tokens = count(j["message"]["usage"], "output_tokens");
      }
    } else if (type == "content_block_start") {
      int index = j.value("index", 0);
      const auto& block = j.at("content_block");
      std::string block_type = block.value("type", "");
      if (block_type == "tool_use") {
        std::string id = block.value("id", "");
        if (id.empty()) {
          throw ProtocolError(provider_ + " tool_use block without an id");
        }
        open_tool_blocks_[index] = id;
        out.push_back(ToolCallStarted{id, block.value("name", "")});
        // Some proxies send the whole input up front
        if (block.contains("input") && block["input"].is_object() && !block["input"].empty()) {
          out.push_back(ToolCallArgDelta{id, block["input"].dump()});
        }
      } else if (block_type == "text") {
        std::string text = block.value("text", "");
        if (!text.empty()) {
          out.push_back(TextDelta{std::move(text)});
        }
      }
    } else if (type == "content_block_delta") {
      int index = j.value("index", 0);
      const auto& delta = j.at("delta");
      std::string delta_type = delta.value("type", "");
      if (delta_type == "text_delta") {
        std::string text = delta.value("text", "");
        if (!text.empty()) {
          out.push_back(TextDelta{std::move(text)});
        }
      } else if (delta_type == "input_json_delta") {
        auto it = open_tool_blocks_.find(index);
        if (it == open_tool_blocks_.end()) {
          throw ProtocolError(provider_ + " input_json_delta for unknown block " + std::to_string(index));
        }
        std::string fragment = delta.value("partial_json", "");
        if (!fragment.empty()) {
          out.push_back(ToolCallArgDelta{it->second, std::move(fragment)});
        }
      }
    } else if (type == "content_block_stop") {
      int index = j.value("index", 0);
      auto it = open_tool_blocks_.find(index);
      if (it != open_tool_blocks_.end()) {
        out.push_back(ToolCallCompleted{it->second});
        open_tool_blocks_.erase(it);
      }
    } else if (type == "message_delta") {
      if (j.contains("delta") && j["delta"].contains("stop_reason") && j["delta"]["stop_reason"].is_string()) {
        reason_ = finish_reason_from_string(j["delta"]["stop_reason"].get<std::string>());
      }
      if (j.contains("usage") && j["usage"].is_object()) {
        usage_.output_tokens = count(j["usage"], "output_tokens", usage_.output_tokens);
      }
    } else if (type == "message_stop") {
      for (auto& [index, id] : open_tool_blocks_) {
        out.push_back(ToolCallCompleted{id});
      }
      open_tool_blocks_.clear();
      out.push_back(Done{reason_, usage_});
      done_ = true;
    }
  }

  std::string provider_;
  SseParser parser_;
  std::map<int, ToolCallId> open_tool_blocks_;
  FinishReason reason_ = FinishReason::Stop;
  TokenUsage usage_;
  bool done_ = false;
};

}  // namespace

AnthropicAdapter::AnthropicAdapter(const ProviderConfig& config, RequestOptions options)
    : ProviderAdapter(config, std::move(options)) {}

WireRequest AnthropicAdapter::encode(const std::vector<Message>& messages, const std::vector<ToolSpec>& tools,
                                     bool stream) const {
  std::string system;
  json msgs = json::array();

  for (const auto& msg : messages) {
    switch (msg.role()) {
      case Role::System:
        if (!system.empty()) system += "\n\n";
        system += msg.text();
        break;
      case Role::User:
        push_user_blocks(msgs, json::array({{{"type", "text"}, {"text", msg.text()}}}));
        break;
      case Role::Assistant: {
        json blocks = json::array();
        if (!msg.text().empty()) {
          blocks.push_back({{"type", "text"}, {"text", msg.text()}});
        }
        for (const auto& tc : msg.tool_calls()) {
          blocks.push_back({{"type", "tool_use"}, {"id", tc.id}, {"name", tc.name}, {"input", tc.arguments}});
        }
        // Empty text blocks are rejected by the API
        if (!blocks.empty()) {
          msgs.push_back({{"role", "assistant"}, {"content", blocks}});
        }
        break;
      }
      case Role::Tool:
        push_user_blocks(msgs, json::array({{{"type", "tool_result"},
                                             {"tool_use_id", msg.tool_call_id().value_or("")},
                                             {"content", msg.text()}}}));
        break;
    }
  }

  // Collapse single text blocks to plain strings
  for (auto& m : msgs) {
    auto& content = m["content"];
    if (content.size() == 1 && content[0]["type"] == "text") {
      content = content[0]["text"];
    }
  }

  json body;
  body["model"] = model();
  body["max_tokens"] = options_.max_tokens.value_or(kDefaultMaxTokens);
  body["messages"] = msgs;
  if (!system.empty()) {
    body["system"] = system;
  }
  if (stream) {
    body["stream"] = true;
  }
  if (options_.temperature) {
    body["temperature"] = *options_.temperature;
  }

  if (!tools.empty()) {
    json tools_json = json::array();
    for (const auto& spec : tools) {
      tools_json.push_back({{"name", spec.name}, {"description", spec.description}, {"input_schema", spec.parameters}});
    }
    body["tools"] = tools_json;
  }

  WireRequest request;
  request.url = endpoint("/v1/messages");
  request.headers = {{"Content-Type", "application/json"},
                     {"x-api-key", config_.api_key},
                     {"anthropic-version", config_.api_version.value_or(kDefaultApiVersion)}};
  if (stream) {
    request.headers["Accept"] = "text/event-stream";
  }
  request.body = std::move(body);
  return request;
}

NormalizedResponse AnthropicAdapter::parse_response(const std::string& body) const {
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

NormalizedResponse AnthropicAdapter::decode_response(const json& j) const {
  if (j.value("type", "") == "error") {
    throw ProtocolError(name() + " error: " + error_message(j));
  }
  if (!j.contains("content") || !j["content"].is_array()) {
    throw ProtocolError(name() + " response has no content array");
  }

  NormalizedResponse response;
  std::string text;
  bool has_text = false;

  for (const auto& block : j["content"]) {
    if (!block.is_object()) {
      throw ProtocolError(name() + " content block is not an object");
    }
    std::string type = block.value("type", "");
    if (type == "text") {
      text += block.value("text", "");
      has_text = true;
    } else if (type == "tool_use") {
      ToolCall call;
      call.id = block.value("id", "");
      call.name = block.value("name", "");
      if (call.id.empty() || call.name.empty()) {
        throw ProtocolError(name() + " tool_use block without id or name");
      }
      const json input = block.value("input", json::object());
      if (input.is_object()) {
        call.arguments = input;
      } else {
        response.argument_errors[call.id] = "tool arguments must be a JSON object";
      }
      response.tool_calls.push_back(std::move(call));
    }
  }

  if (has_text) {
    response.text = std::move(text);
  }

  if (j.contains("stop_reason") && j["stop_reason"].is_string()) {
    response.finish_reason = finish_reason_from_string(j["stop_reason"].get<std::string>());
  }

  if (j.contains("usage") && j["usage"].is_object()) {
    response.usage.input_tokens = count(j["usage"], "input_tokens");
    response.usage.output_tokens = count(j["usage"], "output_tokens");
  }

  return response;
}

std::unique_ptr<StreamDecoder> AnthropicAdapter::make_stream_decoder() const {
  return std::make_unique<AnthropicStreamDecoder>(name());
}

}  // namespace convo::llm
