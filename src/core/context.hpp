#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/message.hpp"

namespace convo {

// Fixed per-message overhead used by the token estimate
constexpr int64_t kMessageTokenOverhead = 6;

// Rough token count: one token per four characters, at least one
int64_t estimate_tokens(const std::string &text);

int64_t estimate_tokens(const Message &msg);

int64_t estimate_tokens(const std::vector<Message> &messages);

// Select the request window for a history.
//
// Keeps a leading system message plus the newest messages that fit in
// max_context - reserve_output. The window never starts with a tool result
// whose call was trimmed away. max_context <= 0 disables trimming.
std::vector<Message> trim_to_budget(const std::vector<Message> &messages, int64_t max_context, int64_t reserve_output);

}  // namespace convo
