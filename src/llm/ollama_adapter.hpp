#pragma once

#include "llm/adapter.hpp"

namespace convo::llm {

// Ollama native chat API (/api/chat, NDJSON streaming). No structured tool
// calling: requests that advertise tools are refused.
class OllamaAdapter : public ProviderAdapter {
 public:
  explicit OllamaAdapter(const ProviderConfig& config, RequestOptions options = {});

  bool supports_tools() const override {
    return false;
  }

  NormalizedResponse parse_response(const std::string& body) const override;

  std::unique_ptr<StreamDecoder> make_stream_decoder() const override;

 protected:
  WireRequest encode(const std::vector<Message>& messages, const std::vector<ToolSpec>& tools,
                     bool stream) const override;
};

}  // namespace convo::llm
