#include "core/context.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace convo {

int64_t estimate_tokens(const std::string &text) {
  return std::max<int64_t>(1, static_cast<int64_t>(text.size()) / 4);
}

int64_t estimate_tokens(const Message &msg) {
  int64_t tokens = kMessageTokenOverhead + estimate_tokens(msg.text());
  for (const auto &call : msg.tool_calls()) {
    tokens += estimate_tokens(call.name) + estimate_tokens(call.arguments.dump());
  }
  return tokens;
}

int64_t estimate_tokens(const std::vector<Message> &messages) {
  int64_t total = 0;
  for (const auto &msg : messages) {
    total += estimate_tokens(msg);
  }
  return total;
}

std::vector<Message> trim_to_budget(const std::vector<Message> &messages, int64_t max_context, int64_t reserve_output) {
  if (max_context <= 0 || messages.empty()) {
    return messages;
  }

  int64_t budget = std::max<int64_t>(0, max_context - reserve_output);
  if (estimate_tokens(messages) <= budget) {
    return messages;
  }

  size_t head = 0;
  if (messages.front().role() == Role::System) {
    budget -= estimate_tokens(messages.front());
    head = 1;
  }

  // Walk back from the newest message while it fits
  size_t start = messages.size();
  while (start > head) {
    int64_t cost = estimate_tokens(messages[start - 1]);
    if (cost > budget) break;
    budget -= cost;
    --start;
  }

  // Tool results whose assistant message was cut cannot lead the window
  while (start < messages.size() && messages[start].role() == Role::Tool) {
    ++start;
  }

  // Nothing fits: fall back to the latest user message and what follows it
  if (start == messages.size()) {
    start = head;
    for (size_t i = messages.size(); i > head; --i) {
      if (messages[i - 1].role() == Role::User) {
        start = i - 1;
        break;
      }
    }
  }

  std::vector<Message> window;
  window.reserve(head + messages.size() - start);
  if (head == 1) {
    window.push_back(messages.front());
  }
  window.insert(window.end(), messages.begin() + static_cast<std::ptrdiff_t>(start), messages.end());

  spdlog::debug("[Context] Trimmed {} of {} messages to fit {} tokens", messages.size() - window.size(), messages.size(),
                max_context - reserve_output);
  return window;
}

}  // namespace convo
