#include "session/session_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>

#include "core/error.hpp"

namespace convo {

namespace fs = std::filesystem;

namespace {

constexpr const char *kExtension = ".json";

}  // namespace

SessionStore::SessionStore(const fs::path &base_dir) : base_dir_(base_dir) {}

bool SessionStore::valid_name(const std::string &name) {
  if (name.empty() || name == "." || name == "..") return false;
  if (name.find_first_of("/\\") != std::string::npos) return false;
  if (name.find('\0') != std::string::npos) return false;
  return name.front() != '.';
}

fs::path SessionStore::path(const std::string &name) const {
  if (!valid_name(name)) {
    throw SessionIOError("invalid session name '" + name + "'");
  }
  return base_dir_ / (name + kExtension);
}

bool SessionStore::exists(const std::string &name) const {
  std::error_code ec;
  return fs::exists(path(name), ec);
}

Conversation SessionStore::load(const std::string &name) const {
  auto file_path = path(name);
  std::lock_guard lock(mutex_);

  std::error_code ec;
  if (!fs::exists(file_path, ec)) {
    spdlog::debug("[SessionStore] No session file for '{}', starting fresh", name);
    return Conversation(name);
  }

  std::ifstream file(file_path, std::ios::binary);
  if (!file.is_open()) {
    throw SessionIOError("cannot open session file " + file_path.string());
  }

  std::ostringstream content;
  content << file.rdbuf();

  try {
    auto doc = json::parse(content.str());
    if (doc.is_object() && doc.value("session_id", "").empty()) {
      doc["session_id"] = name;
    }
    auto conversation = Conversation::from_json(doc);
    spdlog::debug("[SessionStore] Loaded '{}' ({} messages)", name, conversation.size());
    return conversation;
  } catch (const json::exception &e) {
    throw SessionIOError("malformed session file " + file_path.string() + ": " + e.what());
  } catch (const ProtocolError &e) {
    throw SessionIOError("invalid session file " + file_path.string() + ": " + e.what());
  }
}

void SessionStore::save(const Conversation &conversation) {
  auto file_path = path(conversation.session_id());
  std::lock_guard lock(mutex_);

  std::error_code ec;
  fs::create_directories(base_dir_, ec);
  if (ec) {
    throw SessionIOError("cannot create sessions directory " + base_dir_.string() + ": " + ec.message());
  }

  atomic_write(file_path, conversation.to_json().dump(2) + "\n");
  spdlog::debug("[SessionStore] Saved '{}' ({} messages)", conversation.session_id(), conversation.size());
}

std::vector<std::string> SessionStore::list() const {
  std::lock_guard lock(mutex_);
  std::vector<std::string> names;

  std::error_code ec;
  if (!fs::is_directory(base_dir_, ec)) {
    return names;
  }

  for (const auto &entry : fs::directory_iterator(base_dir_, ec)) {
    if (!entry.is_regular_file()) continue;
    const auto &p = entry.path();
    if (p.extension() != kExtension) continue;
    auto name = p.stem().string();
    if (valid_name(name)) {
      names.push_back(name);
    }
  }

  std::sort(names.begin(), names.end());
  return names;
}

void SessionStore::atomic_write(const fs::path &path, const std::string &content) {
  auto tmp_path = path;
  tmp_path += ".tmp";

  std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    throw SessionIOError("cannot open temp file " + tmp_path.string());
  }

  file << content;
  file.close();

  std::error_code ec;
  if (file.fail()) {
    fs::remove(tmp_path, ec);
    throw SessionIOError("failed to write temp file " + tmp_path.string());
  }

  fs::rename(tmp_path, path, ec);
  if (ec) {
    std::string reason = ec.message();
    fs::remove(tmp_path, ec);
    throw SessionIOError("failed to rename " + tmp_path.string() + " -> " + path.string() + ": " + reason);
  }
}

}  // namespace convo
