#include "core/types.hpp"

namespace convo {

std::string to_string(FinishReason reason) {
  switch (reason) {
    case FinishReason::Stop:
      return "stop";
    case FinishReason::ToolCalls:
      return "tool_calls";
    case FinishReason::Length:
      return "length";
    case FinishReason::Error:
      return "error";
    case FinishReason::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

// Accepts the spellings of all supported protocol families
FinishReason finish_reason_from_string(const std::string &str) {
  if (str == "stop" || str == "end_turn" || str == "stop_sequence") return FinishReason::Stop;
  if (str == "tool_calls" || str == "tool_use" || str == "function_call") return FinishReason::ToolCalls;
  if (str == "length" || str == "max_tokens") return FinishReason::Length;
  if (str == "error") return FinishReason::Error;
  if (str == "cancelled") return FinishReason::Cancelled;
  return FinishReason::Stop;
}

std::string to_string(Mode mode) {
  switch (mode) {
    case Mode::Planning:
      return "planning";
    case Mode::Building:
      return "building";
  }
  return "building";
}

std::optional<Mode> mode_from_string(const std::string &str) {
  if (str == "planning" || str == "plan") return Mode::Planning;
  if (str == "building" || str == "build") return Mode::Building;
  return std::nullopt;
}

std::string to_string(ProtocolFamily family) {
  switch (family) {
    case ProtocolFamily::OpenAI:
      return "openai";
    case ProtocolFamily::Anthropic:
      return "anthropic";
    case ProtocolFamily::Ollama:
      return "ollama";
  }
  return "openai";
}

std::optional<ProtocolFamily> family_from_string(const std::string &str) {
  if (str == "openai" || str == "openai-compatible") return ProtocolFamily::OpenAI;
  if (str == "anthropic") return ProtocolFamily::Anthropic;
  if (str == "ollama") return ProtocolFamily::Ollama;
  return std::nullopt;
}

namespace {

constexpr const char *kReplacement = "\xEF\xBF\xBD";

bool continuation(unsigned char c) {
  return (c & 0xC0) == 0x80;
}

// Length of the well-formed sequence starting at input[pos], or 0
size_t sequence_length(const std::string &input, size_t pos) {
  auto lead = static_cast<unsigned char>(input[pos]);
  size_t len;
  uint32_t cp;
  uint32_t min_cp;
  if (lead < 0x80) {
    return 1;
  } else if ((lead & 0xE0) == 0xC0) {
    len = 2, cp = lead & 0x1F, min_cp = 0x80;
  } else if ((lead & 0xF0) == 0xE0) {
    len = 3, cp = lead & 0x0F, min_cp = 0x800;
  } else if ((lead & 0xF8) == 0xF0) {
    len = 4, cp = lead & 0x07, min_cp = 0x10000;
  } else {
    return 0;
  }

  if (pos + len > input.size()) {
    return 0;
  }
  for (size_t k = 1; k < len; ++k) {
    auto c = static_cast<unsigned char>(input[pos + k]);
    if (!continuation(c)) {
      return 0;
    }
    cp = (cp << 6) | (c & 0x3F);
  }

  // Overlong forms, surrogates and out-of-range code points
  if (cp < min_cp || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
    return 0;
  }
  return len;
}

}  // namespace

std::string sanitize_utf8(const std::string &input) {
  std::string output;
  output.reserve(input.size());

  size_t pos = 0;
  while (pos < input.size()) {
    size_t len = sequence_length(input, pos);
    if (len == 0) {
      output.append(kReplacement);
      ++pos;
      continue;
    }
    output.append(input, pos, len);
    pos += len;
  }
  return output;
}

}  // namespace convo
