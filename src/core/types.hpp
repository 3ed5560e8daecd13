#pragma once

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace convo {

using json = nlohmann::json;

// Type aliases
using SessionId = std::string;
using ToolCallId = std::string;

// Result type for operations that can fail
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<std::string> error;

  bool ok() const {
    return value.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  static Result success(T val) {
    return Result{std::move(val), std::nullopt};
  }

  static Result failure(std::string err) {
    return Result{std::nullopt, std::move(err)};
  }
};

// Token usage as reported by the provider
struct TokenUsage {
  int64_t input_tokens = 0;
  int64_t output_tokens = 0;

  int64_t total() const {
    return input_tokens + output_tokens;
  }

  TokenUsage &operator+=(const TokenUsage &other) {
    input_tokens += other.input_tokens;
    output_tokens += other.output_tokens;
    return *this;
  }
};

// Finish reason for a provider reply
enum class FinishReason {
  Stop,       // Natural completion
  ToolCalls,  // Model wants tools executed
  Length,     // Output token limit reached
  Error,
  Cancelled
};

std::string to_string(FinishReason reason);

FinishReason finish_reason_from_string(const std::string &str);

// Tool exposure policy
enum class Mode {
  Planning,  // Read-only tools only
  Building   // All tools
};

std::string to_string(Mode mode);

std::optional<Mode> mode_from_string(const std::string &str);

// Wire protocol spoken by a provider endpoint
enum class ProtocolFamily {
  OpenAI,  // OpenAI chat completions and compatible endpoints (grok, deepseek, ...)
  Anthropic,
  Ollama
};

std::string to_string(ProtocolFamily family);

std::optional<ProtocolFamily> family_from_string(const std::string &str);

// Provider configuration
struct ProviderConfig {
  std::string name;
  ProtocolFamily family = ProtocolFamily::OpenAI;
  std::string api_key;
  std::string base_url;
  std::string default_model;
  std::optional<std::string> api_version;  // anthropic-version header
  std::optional<int> max_tokens;
  std::optional<double> temperature;
  std::map<std::string, std::string> headers;
};

// Replace invalid UTF-8 sequences with U+FFFD so the text can be stored in json
std::string sanitize_utf8(const std::string &input);

}  // namespace convo
