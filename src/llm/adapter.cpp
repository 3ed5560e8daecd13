#include "llm/adapter.hpp"

#include <spdlog/spdlog.h>

#include "core/context.hpp"
#include "core/error.hpp"
#include "llm/anthropic_adapter.hpp"
#include "llm/ollama_adapter.hpp"
#include "llm/openai_adapter.hpp"

namespace convo::llm {

ProviderAdapter::ProviderAdapter(ProviderConfig config, RequestOptions options)
    : config_(std::move(config)), options_(std::move(options)) {
  if (!options_.max_tokens) {
    options_.max_tokens = config_.max_tokens;
  }
  if (!options_.temperature) {
    options_.temperature = config_.temperature;
  }
}

std::string ProviderAdapter::model() const {
  return options_.model.empty() ? config_.default_model : options_.model;
}

std::string ProviderAdapter::endpoint(const std::string &path) const {
  std::string base = config_.base_url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base + path;
}

WireRequest ProviderAdapter::build_request(const Conversation &conversation, const std::vector<ToolSpec> &tools,
                                           Mode mode, bool stream) const {
  std::vector<ToolSpec> advertised;
  for (const auto &spec : tools) {
    if (mode == Mode::Planning && !spec.read_only) {
      spdlog::warn("[{}] Not advertising mutating tool '{}' in planning mode", config_.name, spec.name);
      continue;
    }
    advertised.push_back(spec);
  }

  auto window = trim_to_budget(conversation.messages(), options_.max_context_tokens, options_.reserve_output_tokens);
  auto request = encode(window, advertised, stream);

  for (const auto &[key, value] : config_.headers) {
    request.headers[key] = value;
  }

  spdlog::debug("[{}] Request {} ({} messages, {} tools, stream={})", config_.name, request.url, window.size(),
                advertised.size(), stream);
  return request;
}

std::vector<NormalizedEvent> ProviderAdapter::parse_stream(const std::vector<std::string> &chunks) const {
  auto decoder = make_stream_decoder();
  std::vector<NormalizedEvent> events;
  for (const auto &chunk : chunks) {
    auto batch = decoder->feed(chunk);
    events.insert(events.end(), std::make_move_iterator(batch.begin()), std::make_move_iterator(batch.end()));
  }
  auto tail = decoder->finish();
  events.insert(events.end(), std::make_move_iterator(tail.begin()), std::make_move_iterator(tail.end()));
  return events;
}

std::unique_ptr<ProviderAdapter> make_adapter(const ProviderConfig &config, RequestOptions options) {
  switch (config.family) {
    case ProtocolFamily::OpenAI:
      return std::make_unique<OpenAIAdapter>(config, std::move(options));
    case ProtocolFamily::Anthropic:
      return std::make_unique<AnthropicAdapter>(config, std::move(options));
    case ProtocolFamily::Ollama:
      return std::make_unique<OllamaAdapter>(config, std::move(options));
  }
  throw ConfigError("unsupported protocol family for provider '" + config.name + "'");
}

json parse_json(const std::string &body, const std::string &provider) {
  try {
    return json::parse(body);
  } catch (const json::parse_error &e) {
    throw ProtocolError(provider + " returned invalid JSON: " + e.what());
  }
}

std::optional<json> parse_tool_arguments(const std::string &raw, std::string &error) {
  if (raw.find_first_not_of(" \t\r\n") == std::string::npos) {
    return json::object();
  }

  json args;
  try {
    args = json::parse(raw);
  } catch (const json::parse_error &e) {
    error = std::string("malformed tool arguments: ") + e.what();
    return std::nullopt;
  }
  if (!args.is_object()) {
    error = "tool arguments must be a JSON object, got " + std::string(args.type_name());
    return std::nullopt;
  }
  return args;
}

}  // namespace convo::llm
