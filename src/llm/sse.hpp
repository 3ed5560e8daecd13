#pragma once

#include <string>
#include <vector>

namespace convo::llm {

// A parsed Server-Sent Event
struct SseEvent {
  std::string event;  // "event:" field, empty when absent
  std::string data;   // "data:" lines joined with '\n'
};

// Splits an SSE byte stream into events. Chunks may cut events anywhere.
class SseParser {
 public:
  std::vector<SseEvent> feed(const std::string &chunk);

  // Flush a trailing event that was not terminated by a blank line
  std::vector<SseEvent> finish();

 private:
  static bool parse_block(const std::string &block, SseEvent &out);

  std::string buffer_;
};

}  // namespace convo::llm
