#include "llm/ollama_adapter.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

#include "core/error.hpp"

namespace convo::llm {

namespace {

// One NDJSON object, either /api/chat or /api/generate shaped
struct ChunkLine {
  std::string text;
  bool done = false;
  FinishReason reason = FinishReason::Stop;
  TokenUsage usage;
};

ChunkLine parse_line(const std::string& line, const std::string& provider) {
  json j = parse_json(line, provider);
  if (!j.is_object()) {
    throw ProtocolError(provider + " sent a non-object line");
  }
  if (j.contains("error")) {
    throw ProtocolError(provider + " error: " + (j["error"].is_string() ? j["error"].get<std::string>() : j["error"].dump()));
  }

  ChunkLine chunk;
  try {
    if (j.contains("message") && j["message"].is_object()) {
      chunk.text = j["message"].value("content", "");
    } else if (j.contains("response") && j["response"].is_string()) {
      chunk.text = j["response"].get<std::string>();
    } else if (!j.contains("done")) {
      throw ProtocolError(provider + " line has neither message nor response");
    }

    chunk.done = j.value("done", false);
    if (chunk.done) {
      if (j.value("done_reason", "") == "length") {
        chunk.reason = FinishReason::Length;
      }
      chunk.usage.input_tokens = j.value("prompt_eval_count", 0);
      chunk.usage.output_tokens = j.value("eval_count", 0);
    }
  } catch (const json::exception& e) {
    throw ProtocolError(provider + " sent an unexpected line: " + e.what());
  }
  return chunk;
}

bool blank(const std::string& line) {
  return line.find_first_not_of(" \t\r") == std::string::npos;
}

class OllamaStreamDecoder : public StreamDecoder {
 public:
  explicit OllamaStreamDecoder(std::string provider) : provider_(std::move(provider)) {}

  std::vector<NormalizedEvent> feed(const std::string& chunk) override {
    std::vector<NormalizedEvent> out;
    buffer_ += chunk;

    size_t pos;
    while ((pos = buffer_.find('\n')) != std::string::npos) {
      std::string line = buffer_.substr(0, pos);
      buffer_.erase(0, pos + 1);
      handle(line, out);
    }
    return out;
  }

  std::vector<NormalizedEvent> finish() override {
    std::vector<NormalizedEvent> out;
    if (!buffer_.empty()) {
      std::string line;
      line.swap(buffer_);
      handle(line, out);
    }
    if (!done_) {
      spdlog::warn("[{}] Stream ended without done flag", provider_);
      out.push_back(Done{});
      done_ = true;
    }
    return out;
  }

 private:
  void handle(const std::string& line, std::vector<NormalizedEvent>& out) {
    if (done_ || blank(line)) return;

    auto chunk = parse_line(line, provider_);
    if (!chunk.text.empty()) {
      out.push_back(TextDelta{std::move(chunk.text)});
    }
    if (chunk.done) {
      out.push_back(Done{chunk.reason, chunk.usage});
      done_ = true;
    }
  }

  std::string provider_;
  std::string buffer_;
  bool done_ = false;
};

}  // namespace

OllamaAdapter::OllamaAdapter(const ProviderConfig& config, RequestOptions options)
    : ProviderAdapter(config, std::move(options)) {}

WireRequest OllamaAdapter::encode(const std::vector<Message>& messages, const std::vector<ToolSpec>& tools,
                                  bool stream) const {
  if (!tools.empty()) {
    throw CapabilityUnsupported("provider '" + name() + "' does not support tool calling");
  }

  json msgs = json::array();
  for (const auto& msg : messages) {
    switch (msg.role()) {
      case Role::System:
      case Role::User:
        msgs.push_back({{"role", to_string(msg.role())}, {"content", msg.text()}});
        break;
      case Role::Assistant: {
        std::string content = msg.text();
        for (const auto& tc : msg.tool_calls()) {
          if (!content.empty()) content += "\n";
          content += "[called tool " + tc.name + " with " + tc.arguments.dump() + "]";
        }
        msgs.push_back({{"role", "assistant"}, {"content", content}});
        break;
      }
      case Role::Tool:
        msgs.push_back({{"role", "user"},
                        {"content", "Result of tool call " + msg.tool_call_id().value_or("") + ":\n" + msg.text()}});
        break;
    }
  }

  json body;
  body["model"] = model();
  body["messages"] = msgs;
  body["stream"] = stream;

  json opts = json::object();
  if (options_.temperature) {
    opts["temperature"] = *options_.temperature;
  }
  if (options_.max_tokens) {
    opts["num_predict"] = *options_.max_tokens;
  }
  if (!opts.empty()) {
    body["options"] = opts;
  }

  WireRequest request;
  request.url = endpoint("/api/chat");
  request.headers = {{"Content-Type", "application/json"}};
  if (!config_.api_key.empty()) {
    request.headers["Authorization"] = "Bearer " + config_.api_key;
  }
  request.body = std::move(body);
  return request;
}

NormalizedResponse OllamaAdapter::parse_response(const std::string& body) const {
  NormalizedResponse response;
  std::string text;
  bool any = false;

  auto apply = [&](const ChunkLine& chunk) {
    any = true;
    text += chunk.text;
    if (chunk.done) {
      response.finish_reason = chunk.reason;
      response.usage = chunk.usage;
    }
  };

  // A single object, or NDJSON when the server streamed anyway
  if (json::accept(body)) {
    apply(parse_line(body, name()));
  } else {
    std::istringstream stream(body);
    std::string line;
    while (std::getline(stream, line)) {
      if (blank(line)) continue;
      apply(parse_line(line, name()));
    }
  }

  if (!any) {
    throw ProtocolError(name() + " returned an empty response");
  }

  response.text = std::move(text);
  return response;
}

std::unique_ptr<StreamDecoder> OllamaAdapter::make_stream_decoder() const {
  return std::make_unique<OllamaStreamDecoder>(name());
}

}  // namespace convo::llm
