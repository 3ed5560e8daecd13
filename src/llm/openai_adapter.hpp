#pragma once

#include "llm/adapter.hpp"

namespace convo::llm {

// OpenAI Chat Completions and compatible endpoints (Grok, DeepSeek, ...)
class OpenAIAdapter : public ProviderAdapter {
 public:
  explicit OpenAIAdapter(const ProviderConfig& config, RequestOptions options = {});

  bool supports_tools() const override {
    return true;
  }

  NormalizedResponse parse_response(const std::string& body) const override;

  std::unique_ptr<StreamDecoder> make_stream_decoder() const override;

 protected:
  WireRequest encode(const std::vector<Message>& messages, const std::vector<ToolSpec>& tools,
                     bool stream) const override;

 private:
  NormalizedResponse decode_response(const json& j) const;
};

}  // namespace convo::llm
