#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "core/conversation.hpp"

namespace convo {

// JSON file per session
// Storage layout:
//   base_dir/
//     {session}.json    {"session_id", "turn_count", "messages": [...]}
class SessionStore {
 public:
  explicit SessionStore(const std::filesystem::path &base_dir);

  // Load a session; a session that does not exist yet is an empty
  // conversation with that id. Throws SessionIOError on unreadable or
  // malformed files.
  Conversation load(const std::string &name) const;

  // Atomic replace of {session}.json. Throws SessionIOError.
  void save(const Conversation &conversation);

  bool exists(const std::string &name) const;

  // Sorted session names
  std::vector<std::string> list() const;

  std::filesystem::path path(const std::string &name) const;

  const std::filesystem::path &base_dir() const {
    return base_dir_;
  }

  // Rejects empty names, path separators and dot segments
  static bool valid_name(const std::string &name);

  // Write to .tmp then rename. Throws SessionIOError.
  static void atomic_write(const std::filesystem::path &path, const std::string &content);

 private:
  std::filesystem::path base_dir_;
  mutable std::mutex mutex_;
};

}  // namespace convo
