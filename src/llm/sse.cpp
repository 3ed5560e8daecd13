#include "llm/sse.hpp"

#include <algorithm>
#include <sstream>

namespace convo::llm {

bool SseParser::parse_block(const std::string &block, SseEvent &out) {
  std::istringstream stream(block);
  std::string line;
  bool has_data = false;

  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty() || line.front() == ':') {
      continue;
    }

    auto colon = line.find(':');
    std::string field = line.substr(0, colon);
    std::string value = colon == std::string::npos ? "" : line.substr(colon + 1);
    if (!value.empty() && value.front() == ' ') {
      value.erase(0, 1);
    }

    if (field == "data") {
      if (has_data) out.data += "\n";
      out.data += value;
      has_data = true;
    } else if (field == "event") {
      out.event = value;
    }
  }

  return has_data;
}

std::vector<SseEvent> SseParser::feed(const std::string &chunk) {
  std::vector<SseEvent> events;
  buffer_ += chunk;

  // Events end with a blank line (\n\n or \r\n\r\n)
  while (true) {
    size_t lf = buffer_.find("\n\n");
    size_t crlf = buffer_.find("\r\n\r\n");
    size_t pos = std::min(lf, crlf);
    if (pos == std::string::npos) break;

    size_t skip = (pos == crlf) ? 4 : 2;
    std::string block = buffer_.substr(0, pos);
    buffer_.erase(0, pos + skip);

    SseEvent event;
    if (parse_block(block, event)) {
      events.push_back(std::move(event));
    }
  }

  return events;
}

std::vector<SseEvent> SseParser::finish() {
  std::vector<SseEvent> events;
  SseEvent event;
  if (!buffer_.empty() && parse_block(buffer_, event)) {
    events.push_back(std::move(event));
  }
  buffer_.clear();
  return events;
}

}  // namespace convo::llm
