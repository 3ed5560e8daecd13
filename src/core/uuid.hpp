#pragma once

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace convo {

// UUID v4 and short random ids for sessions and synthesized tool call ids
class UUID {
 public:
  static std::string generate() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t ab = dist(gen);
    uint64_t cd = dist(gen);

    // Version 4, RFC 4122 variant
    ab = (ab & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    cd = (cd & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(8) << (ab >> 32) << "-";
    ss << std::setw(4) << ((ab >> 16) & 0xFFFF) << "-";
    ss << std::setw(4) << (ab & 0xFFFF) << "-";
    ss << std::setw(4) << (cd >> 48) << "-";
    ss << std::setw(12) << (cd & 0x0000FFFFFFFFFFFFULL);
    return ss.str();
  }

  static std::string short_id(size_t length = 8) {
    static const char charset[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<size_t> dist(0, sizeof(charset) - 2);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) {
      result += charset[dist(gen)];
    }
    return result;
  }
};

}  // namespace convo
