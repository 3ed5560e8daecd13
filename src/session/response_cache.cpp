#include "session/response_cache.hpp"

#include <openssl/sha.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <sstream>

#include "core/error.hpp"
#include "session/session_store.hpp"

namespace convo {

namespace fs = std::filesystem;

ResponseCache::ResponseCache(fs::path dir) : dir_(std::move(dir)) {}

std::string ResponseCache::key(const std::string &provider, const std::string &url, const json &body) {
  // NUL separated so field boundaries cannot shift
  std::string material = provider;
  material += '\0';
  material += url;
  material += '\0';
  material += body.dump();

  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(material.data()), material.size(), hash);

  static const char kHex[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(SHA256_DIGEST_LENGTH * 2);
  for (unsigned char byte : hash) {
    hex.push_back(kHex[byte >> 4]);
    hex.push_back(kHex[byte & 0x0F]);
  }
  return hex;
}

fs::path ResponseCache::path(const std::string &key) const {
  return dir_ / (key + ".json");
}

std::optional<std::string> ResponseCache::get(const std::string &key) const {
  std::lock_guard lock(mutex_);
  auto file_path = path(key);

  std::ifstream file(file_path, std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }

  std::ostringstream content;
  content << file.rdbuf();

  try {
    json entry = json::parse(content.str());
    if (!entry.is_object() || entry.value("key", "") != key || !entry.contains("body") || !entry["body"].is_string()) {
      spdlog::warn("[ResponseCache] Ignoring malformed entry {}", file_path.string());
      return std::nullopt;
    }
    return entry["body"].get<std::string>();
  } catch (const json::exception &e) {
    spdlog::warn("[ResponseCache] Ignoring unreadable entry {}: {}", file_path.string(), e.what());
    return std::nullopt;
  }
}

void ResponseCache::put(const std::string &key, const std::string &body) {
  std::lock_guard lock(mutex_);

  std::error_code ec;
  fs::create_directories(dir_, ec);
  if (ec) {
    throw SessionIOError("cannot create cache directory " + dir_.string() + ": " + ec.message());
  }

  auto now = std::chrono::system_clock::now().time_since_epoch();
  json entry = {{"key", key},
                {"created_at", std::chrono::duration_cast<std::chrono::seconds>(now).count()},
                {"body", body}};
  SessionStore::atomic_write(path(key), entry.dump(2) + "\n");
  spdlog::debug("[ResponseCache] Stored {}", key);
}

}  // namespace convo
