#pragma once

#include <string>
#include <vector>

#include "core/types.hpp"
#include "llm/adapter.hpp"
#include "llm/stream_assembler.hpp"

namespace convo::test {

inline ProviderConfig openai_config() {
  ProviderConfig config;
  config.name = "openai";
  config.family = ProtocolFamily::OpenAI;
  config.api_key = "sk-test";
  config.base_url = "https://api.openai.com/v1";
  config.default_model = "gpt-4o-mini";
  return config;
}

inline ProviderConfig anthropic_config() {
  ProviderConfig config;
  config.name = "anthropic";
  config.family = ProtocolFamily::Anthropic;
  config.api_key = "ak-test";
  config.base_url = "https://api.anthropic.com";
  config.default_model = "claude-3-5-sonnet-latest";
  return config;
}

inline ProviderConfig ollama_config() {
  ProviderConfig config;
  config.name = "ollama";
  config.family = ProtocolFamily::Ollama;
  config.base_url = "http://localhost:11434/";
  config.default_model = "llama3.1";
  return config;
}

// Cut a body into fixed-size pieces, as a network would
inline std::vector<std::string> split(const std::string& body, size_t size) {
  std::vector<std::string> chunks;
  for (size_t i = 0; i < body.size(); i += size) {
    chunks.push_back(body.substr(i, size));
  }
  return chunks;
}

inline llm::NormalizedResponse assemble(const std::vector<llm::NormalizedEvent>& events) {
  llm::StreamAssembler assembler;
  assembler.consume_all(events);
  return assembler.result();
}

// OpenAI-shaped buffered replies for scripted transports
inline std::string openai_text_reply(const std::string& text) {
  json reply = {{"choices", json::array({{{"index", 0},
                                           {"message", {{"role", "assistant"}, {"content", text}}},
                                           {"finish_reason", "stop"}}})},
                {"usage", {{"prompt_tokens", 10}, {"completion_tokens", 5}}}};
  return reply.dump();
}

inline json openai_call(const std::string& id, const std::string& name, const std::string& arguments) {
  return {{"id", id}, {"type", "function"}, {"function", {{"name", name}, {"arguments", arguments}}}};
}

inline std::string openai_tool_reply(const std::vector<json>& calls) {
  json reply = {{"choices", json::array({{{"index", 0},
                                           {"message", {{"role", "assistant"}, {"content", nullptr}, {"tool_calls", calls}}},
                                           {"finish_reason", "tool_calls"}}})},
                {"usage", {{"prompt_tokens", 10}, {"completion_tokens", 5}}}};
  return reply.dump();
}

}  // namespace convo::test
