#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace convo {

// Application configuration. Loaded once at startup and passed by value or
// const reference to the components that need it.
struct Config {
  // Provider configs keyed by provider name
  std::map<std::string, ProviderConfig> providers;

  std::string default_provider = "openai";

  // Model override for the selected provider (empty = provider default)
  std::string model;

  // Tool policy
  Mode mode = Mode::Building;
  std::vector<std::string> allowed_tools;  // empty = no allow-list
  bool enable_tools = false;

  // Turn loop
  int max_turns = 8;
  bool stream = false;
  std::optional<std::string> system_prompt;

  // Sessions
  std::filesystem::path sessions_dir;

  // Response cache for buffered requests sent without tools
  bool cache_enabled = true;
  std::filesystem::path cache_dir;

  // Context management settings
  struct ContextSettings {
    int64_t max_context_tokens = 16000;  // 0 disables trimming
    int64_t reserve_output_tokens = 1024;
    size_t max_tool_output_bytes = 51200;
    size_t max_tool_output_lines = 2000;
  } context;

  std::chrono::seconds request_timeout{120};

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;

  // Built-in providers and defaults, no file or environment involved
  static Config defaults();

  // Load from file on top of the defaults. Throws ConfigError when the file
  // cannot be read or is malformed.
  static Config load(const std::filesystem::path& path);

  // Load default config from project/global config files
  static Config load_default();

  // load_default() plus the environment overlay
  // Reads: OPENAI_API_KEY, OPENAI_BASE_URL, OPENAI_MODEL
  //        ANTHROPIC_API_KEY/AUTH_TOKEN, ANTHROPIC_BASE_URL, ANTHROPIC_MODEL
  //        XAI_API_KEY or GROK_API_KEY, DEEPSEEK_API_KEY, OLLAMA_HOST
  static Config from_env();

  void apply_env();

  // Save to file
  void save(const std::filesystem::path& path) const;

  // Get provider config
  std::optional<ProviderConfig> get_provider(const std::string& name) const;

  // Provider ready for use: known, and with an API key unless it is Ollama.
  // Throws ConfigError otherwise.
  ProviderConfig require_provider(const std::string& name) const;
};

// Integer option value; the whole text must be a number ("5abc" is rejected).
// Throws ConfigError naming the option.
int parse_count(const std::string& text, const std::string& option);

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();

std::filesystem::path config_dir();

std::filesystem::path default_config_file();

std::filesystem::path project_config_file();

std::filesystem::path data_dir();

std::filesystem::path default_sessions_dir();

std::filesystem::path default_cache_dir();

std::filesystem::path default_log_file();
}  // namespace config_paths

}  // namespace convo
