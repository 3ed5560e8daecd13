#pragma once

#include "llm/adapter.hpp"

namespace convo::llm {

// Anthropic Messages API
class AnthropicAdapter : public ProviderAdapter {
 public:
  explicit AnthropicAdapter(const ProviderConfig& config, RequestOptions options = {});

  bool supports_tools() const override {
    return true;
  }

  NormalizedResponse parse_response(const std::string& body) const override;

  std::unique_ptr<StreamDecoder> make_stream_decoder() const override;

  static constexpr const char* kDefaultApiVersion = "2023-06-01";
  static constexpr int kDefaultMaxTokens = 4096;

 protected:
  WireRequest encode(const std::vector<Message>& messages, const std::vector<ToolSpec>& tools,
                     bool stream) const override;

 private:
  NormalizedResponse decode_response(const json& j) const;
};

}  // namespace convo::llm
