#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include "core/types.hpp"

namespace convo {

// Raw provider response bodies keyed by a hash of the request.
// Storage layout:
//   dir/
//     {sha256}.json    {"key", "created_at", "body"}
class ResponseCache {
 public:
  explicit ResponseCache(std::filesystem::path dir);

  // Hex SHA-256 over the provider name, endpoint and request body
  static std::string key(const std::string &provider, const std::string &url, const json &body);

  // Cached body, or nullopt on a miss. Unreadable entries count as misses.
  std::optional<std::string> get(const std::string &key) const;

  // Throws SessionIOError
  void put(const std::string &key, const std::string &body);

  std::filesystem::path path(const std::string &key) const;

  const std::filesystem::path &dir() const {
    return dir_;
  }

 private:
  std::filesystem::path dir_;
  mutable std::mutex mutex_;
};

}  // namespace convo
