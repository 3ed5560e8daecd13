#include "config.hpp"

#include <cstdlib>
#include <fstream>

#include "core/error.hpp"

namespace convo {

namespace fs = std::filesystem;

namespace {

ProviderConfig make_provider(const std::string& name, ProtocolFamily family, const std::string& base_url,
                             const std::string& model) {
  ProviderConfig provider;
  provider.name = name;
  provider.family = family;
  provider.base_url = base_url;
  provider.default_model = model;
  return provider;
}

const char* env(const char* name) {
  const char* value = std::getenv(name);
  return (value && *value) ? value : nullptr;
}

// Fields present in the document override the given base
ProviderConfig parse_provider(const std::string& name, const json& j, ProviderConfig base) {
  if (!j.is_object()) {
    throw ConfigError("provider '" + name + "' must be an object");
  }

  base.name = name;
  if (j.contains("family")) {
    auto family = family_from_string(j["family"].get<std::string>());
    if (!family) {
      throw ConfigError("provider '" + name + "' has unknown family '" + j["family"].get<std::string>() + "'");
    }
    base.family = *family;
  } else if (base.base_url.empty()) {
    throw ConfigError("provider '" + name + "' needs a family");
  }

  base.api_key = j.value("api_key", base.api_key);
  base.base_url = j.value("base_url", base.base_url);
  base.default_model = j.value("default_model", base.default_model);
  if (j.contains("api_version")) {
    base.api_version = j["api_version"].get<std::string>();
  }
  if (j.contains("max_tokens")) {
    base.max_tokens = j["max_tokens"].get<int>();
  }
  if (j.contains("temperature")) {
    base.temperature = j["temperature"].get<double>();
  }
  if (j.contains("headers")) {
    for (auto& [k, v] : j["headers"].items()) {
      base.headers[k] = v.get<std::string>();
    }
  }
  return base;
}

}  // namespace

Config Config::defaults() {
  Config config;

  config.providers["openai"] =
      make_provider("openai", ProtocolFamily::OpenAI, "https://api.openai.com/v1", "gpt-4o-mini");
  config.providers["grok"] = make_provider("grok", ProtocolFamily::OpenAI, "https://api.x.ai/v1", "grok-2-latest");
  config.providers["deepseek"] =
      make_provider("deepseek", ProtocolFamily::OpenAI, "https://api.deepseek.com", "deepseek-chat");
  config.providers["ollama"] = make_provider("ollama", ProtocolFamily::Ollama, "http://localhost:11434", "llama3.1");

  auto anthropic = make_provider("anthropic", ProtocolFamily::Anthropic, "https://api.anthropic.com",
                                 "claude-3-5-sonnet-latest");
  anthropic.api_version = "2023-06-01";
  config.providers["anthropic"] = anthropic;

  config.sessions_dir = config_paths::default_sessions_dir();
  config.cache_dir = config_paths::default_cache_dir();
  return config;
}

Config Config::load(const fs::path& path) {
  Config config = defaults();

  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigError("cannot open config file " + path.string());
  }

  try {
    json j = json::parse(file);
    if (!j.is_object()) {
      throw ConfigError("config file " + path.string() + " must contain a JSON object");
    }

    // Load providers
    if (j.contains("providers")) {
      for (auto& [name, provider_json] : j["providers"].items()) {
        ProviderConfig base;
        if (auto it = config.providers.find(name); it != config.providers.end()) {
          base = it->second;
        }
        config.providers[name] = parse_provider(name, provider_json, base);
      }
    }

    config.default_provider = j.value("default_provider", config.default_provider);
    config.model = j.value("model", config.model);

    if (j.contains("mode")) {
      auto mode = mode_from_string(j["mode"].get<std::string>());
      if (!mode) {
        throw ConfigError("unknown mode '" + j["mode"].get<std::string>() + "'");
      }
      config.mode = *mode;
    }

    if (j.contains("allowed_tools")) {
      for (const auto& tool : j["allowed_tools"]) {
        config.allowed_tools.push_back(tool.get<std::string>());
      }
    }

    config.enable_tools = j.value("enable_tools", config.enable_tools);
    config.max_turns = j.value("max_turns", config.max_turns);
    config.stream = j.value("stream", config.stream);
    if (j.contains("system_prompt")) {
      config.system_prompt = j["system_prompt"].get<std::string>();
    }

    if (j.contains("sessions_dir")) {
      config.sessions_dir = j["sessions_dir"].get<std::string>();
    }

    config.cache_enabled = j.value("cache_enabled", config.cache_enabled);
    if (j.contains("cache_dir")) {
      config.cache_dir = j["cache_dir"].get<std::string>();
    }

    // Load context settings
    config.context.max_context_tokens = j.value("max_context_tokens", config.context.max_context_tokens);
    config.context.reserve_output_tokens = j.value("reserve_output_tokens", config.context.reserve_output_tokens);
    config.context.max_tool_output_bytes = j.value("max_tool_output_bytes", config.context.max_tool_output_bytes);
    config.context.max_tool_output_lines = j.value("max_tool_output_lines", config.context.max_tool_output_lines);

    config.request_timeout = std::chrono::seconds(j.value("request_timeout_secs", config.request_timeout.count()));

    config.log_level = j.value("log_level", config.log_level);
    if (j.contains("log_file")) {
      config.log_file = j["log_file"].get<std::string>();
    }
  } catch (const json::exception& e) {
    throw ConfigError("invalid config file " + path.string() + ": " + e.what());
  }

  if (config.max_turns < 1) {
    throw ConfigError("max_turns must be at least 1");
  }

  return config;
}

Config Config::load_default() {
  // Try to load from project config first, then global
  auto project_config = config_paths::project_config_file();
  if (fs::exists(project_config)) {
    return load(project_config);
  }

  auto global_config = config_paths::default_config_file();
  if (fs::exists(global_config)) {
    return load(global_config);
  }

  return defaults();
}

Config Config::from_env() {
  Config config = load_default();
  config.apply_env();
  return config;
}

void Config::apply_env() {
  auto& openai = providers["openai"];
  if (auto key = env("OPENAI_API_KEY")) openai.api_key = key;
  if (auto url = env("OPENAI_BASE_URL")) openai.base_url = url;
  if (auto model = env("OPENAI_MODEL")) openai.default_model = model;

  auto& anthropic = providers["anthropic"];
  const char* anthropic_key = env("ANTHROPIC_API_KEY");
  if (!anthropic_key) {
    anthropic_key = env("ANTHROPIC_AUTH_TOKEN");
  }
  if (anthropic_key) anthropic.api_key = anthropic_key;
  if (auto url = env("ANTHROPIC_BASE_URL")) anthropic.base_url = url;
  if (auto model = env("ANTHROPIC_MODEL")) anthropic.default_model = model;

  const char* grok_key = env("XAI_API_KEY");
  if (!grok_key) {
    grok_key = env("GROK_API_KEY");
  }
  if (grok_key) providers["grok"].api_key = grok_key;

  if (auto key = env("DEEPSEEK_API_KEY")) providers["deepseek"].api_key = key;

  if (auto host = env("OLLAMA_HOST")) {
    std::string url = host;
    if (!url.starts_with("http://") && !url.starts_with("https://")) {
      url = "http://" + url;
    }
    providers["ollama"].base_url = url;
  }
}

void Config::save(const fs::path& path) const {
  json j;

  // Save providers
  json providers_json = json::object();
  for (const auto& [name, provider] : providers) {
    json p;
    p["family"] = to_string(provider.family);
    p["api_key"] = provider.api_key;
    p["base_url"] = provider.base_url;
    p["default_model"] = provider.default_model;
    if (provider.api_version) {
      p["api_version"] = *provider.api_version;
    }
    if (provider.max_tokens) {
      p["max_tokens"] = *provider.max_tokens;
    }
    if (provider.temperature) {
      p["temperature"] = *provider.temperature;
    }
    if (!provider.headers.empty()) {
      p["headers"] = provider.headers;
    }
    providers_json[name] = p;
  }
  j["providers"] = providers_json;

  j["default_provider"] = default_provider;
  if (!model.empty()) {
    j["model"] = model;
  }
  j["mode"] = to_string(mode);
  j["allowed_tools"] = allowed_tools;
  j["enable_tools"] = enable_tools;
  j["max_turns"] = max_turns;
  j["stream"] = stream;
  if (system_prompt) {
    j["system_prompt"] = *system_prompt;
  }
  j["sessions_dir"] = sessions_dir.string();
  j["cache_enabled"] = cache_enabled;
  j["cache_dir"] = cache_dir.string();

  j["max_context_tokens"] = context.max_context_tokens;
  j["reserve_output_tokens"] = context.reserve_output_tokens;
  j["max_tool_output_bytes"] = context.max_tool_output_bytes;
  j["max_tool_output_lines"] = context.max_tool_output_lines;
  j["request_timeout_secs"] = request_timeout.count();

  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }

  if (path.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
  }

  std::ofstream file(path);
  if (!file.is_open()) {
    throw ConfigError("cannot write config file " + path.string());
  }
  file << j.dump(2);
}

std::optional<ProviderConfig> Config::get_provider(const std::string& name) const {
  auto it = providers.find(name);
  if (it != providers.end()) {
    return it->second;
  }
  return std::nullopt;
}

ProviderConfig Config::require_provider(const std::string& name) const {
  auto provider = get_provider(name);
  if (!provider) {
    throw ConfigError("unknown provider '" + name + "'");
  }
  if (provider->base_url.empty()) {
    throw ConfigError("provider '" + name + "' has no base_url");
  }
  if (provider->family != ProtocolFamily::Ollama && provider->api_key.empty()) {
    throw ConfigError("missing API key for provider '" + name + "'");
  }
  if (!model.empty()) {
    provider->default_model = model;
  }
  return *provider;
}

int parse_count(const std::string& text, const std::string& option) {
  size_t consumed = 0;
  int result = 0;
  try {
    result = std::stoi(text, &consumed);
  } catch (const std::logic_error&) {
    consumed = 0;
  }
  if (consumed == 0 || consumed != text.size()) {
    throw ConfigError(option + " expects a number, got '" + text + "'");
  }
  return result;
}

namespace config_paths {

fs::path home_dir() {
  const char* home = std::getenv("HOME");
  if (home) {
    return fs::path(home);
  }
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "convo";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

fs::path project_config_file() {
  return fs::current_path() / ".convo" / "config.json";
}

fs::path data_dir() {
  if (const char* xdg = env("XDG_DATA_HOME")) {
    return fs::path(xdg) / "convo";
  }
  return home_dir() / ".local" / "share" / "convo";
}

fs::path default_sessions_dir() {
  return data_dir() / "sessions";
}

fs::path default_cache_dir() {
  return data_dir() / "cache";
}

fs::path default_log_file() {
  return config_dir() / "log" / "convo.log";
}

}  // namespace config_paths

}  // namespace convo
