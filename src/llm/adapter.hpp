#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "core/conversation.hpp"
#include "core/types.hpp"
#include "llm/transport.hpp"
#include "tool/tool.hpp"

namespace convo::llm {

// Normalized stream events, identical for every protocol family
struct TextDelta {
  std::string text;
};

struct ToolCallStarted {
  ToolCallId id;
  std::string name;
};

struct ToolCallArgDelta {
  ToolCallId id;
  std::string fragment;
};

struct ToolCallCompleted {
  ToolCallId id;
};

struct Done {
  FinishReason reason = FinishReason::Stop;
  TokenUsage usage;
};

using NormalizedEvent = std::variant<TextDelta, ToolCallStarted, ToolCallArgDelta, ToolCallCompleted, Done>;

// A complete provider reply
struct NormalizedResponse {
  std::optional<std::string> text;
  std::vector<ToolCall> tool_calls;
  FinishReason finish_reason = FinishReason::Stop;
  TokenUsage usage;

  // Calls whose argument text did not parse, keyed by call id. Such calls
  // keep empty arguments and get an error result instead of running.
  std::map<ToolCallId, std::string> argument_errors;

  bool has_tool_calls() const {
    return !tool_calls.empty();
  }
};

// Incremental decoder for one streamed reply
class StreamDecoder {
 public:
  virtual ~StreamDecoder() = default;

  // Raw body bytes in, events out. Throws ProtocolError on malformed frames.
  virtual std::vector<NormalizedEvent> feed(const std::string &chunk) = 0;

  // End of body. Closes open calls and emits Done if the provider did not.
  virtual std::vector<NormalizedEvent> finish() = 0;
};

// Request shaping knobs that are not part of the conversation
struct RequestOptions {
  std::string model;  // empty = provider default
  std::optional<int> max_tokens;
  std::optional<double> temperature;
  int64_t max_context_tokens = 0;  // 0 = send the whole history
  int64_t reserve_output_tokens = 0;
};

// Translation between the internal conversation model and one wire protocol
class ProviderAdapter {
 public:
  explicit ProviderAdapter(ProviderConfig config, RequestOptions options = {});

  virtual ~ProviderAdapter() = default;

  const std::string &name() const {
    return config_.name;
  }

  ProtocolFamily family() const {
    return config_.family;
  }

  const ProviderConfig &config() const {
    return config_;
  }

  // Model sent with every request
  std::string model() const;

  virtual bool supports_tools() const = 0;

  // Serialize the conversation into a provider request. Only tools callable
  // under mode are advertised.
  WireRequest build_request(const Conversation &conversation, const std::vector<ToolSpec> &tools, Mode mode,
                            bool stream) const;

  // Parse a buffered reply. Throws ProtocolError when the payload lacks the
  // expected shape.
  virtual NormalizedResponse parse_response(const std::string &body) const = 0;

  virtual std::unique_ptr<StreamDecoder> make_stream_decoder() const = 0;

  // Decode a recorded stream
  std::vector<NormalizedEvent> parse_stream(const std::vector<std::string> &chunks) const;

 protected:
  virtual WireRequest encode(const std::vector<Message> &messages, const std::vector<ToolSpec> &tools,
                             bool stream) const = 0;

  // base_url without trailing slash + path
  std::string endpoint(const std::string &path) const;

  ProviderConfig config_;
  RequestOptions options_;
};

// Adapter for the provider's protocol family
std::unique_ptr<ProviderAdapter> make_adapter(const ProviderConfig &config, RequestOptions options = {});

// Parse json or throw ProtocolError naming the provider
json parse_json(const std::string &body, const std::string &provider);

// Parse concatenated tool-call argument text. Empty text is an empty object;
// anything that is not a JSON object yields nullopt and sets error.
std::optional<json> parse_tool_arguments(const std::string &raw, std::string &error);

}  // namespace convo::llm
