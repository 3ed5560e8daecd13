// convo - chat with an LLM provider from the command line
#include <pthread.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include "convo/convo.hpp"
#include "core/version.hpp"
#include "log/log.h"

using namespace convo;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitTurnLimit = 2;
constexpr int kExitCancelled = 130;

struct CliOptions {
  std::optional<std::string> provider;
  std::optional<std::string> model;
  std::optional<std::string> prompt;
  std::optional<std::string> session;
  std::optional<std::string> mode;
  std::vector<std::string> allowed_tools;
  std::optional<bool> enable_tools;
  std::optional<bool> stream;
  std::optional<int> max_turns;
  std::optional<std::string> system_prompt;
  std::vector<std::string> files;
  std::optional<std::string> config_path;
  std::optional<std::string> log_level;
  std::optional<std::string> export_path;
  std::optional<std::string> show_session;
  std::optional<std::string> export_session;
  bool no_cache = false;
  bool list_sessions = false;
  bool list_providers = false;
  bool show_version = false;
  bool show_help = false;
};

void print_usage(std::ostream& out) {
  out << "Usage: convo [options] <prompt>\n"
      << "\n"
      << "Options:\n"
      << "  -p, --provider <name>   Provider (openai, anthropic, grok, deepseek, ollama, ...)\n"
      << "  -m, --model <model>     Model override\n"
      << "      --prompt <text>     Prompt text (alternative to the positional prompt)\n"
      << "  -s, --session <name>    Resume or create a named session\n"
      << "      --mode <mode>       planning or building\n"
      << "      --tools             Enable tool calling\n"
      << "      --no-tools          Disable tool calling\n"
      << "      --allow-tool <name> Restrict tools to this list (repeatable)\n"
      << "      --stream            Stream the response\n"
      << "      --max-turns <n>     Provider calls allowed per prompt\n"
      << "      --system <text>     System prompt for new sessions\n"
      << "  -f, --file <path>       Attach a file (repeatable)\n"
      << "      --config <path>     Config file\n"
      << "      --log-level <lvl>   trace, debug, info, warn, err, off\n"
      << "      --no-cache          Bypass the response cache\n"
      << "      --export <path>     Write the conversation to path (.md, .json or .html)\n"
      << "      --list-sessions     List saved sessions\n"
      << "      --show-session <n>  Print a saved session\n"
      << "      --export-session <n>\n"
      << "                          Export a saved session to the --export path\n"
      << "      --list-providers    List configured providers\n"
      << "  -v, --version           Print version\n"
      << "  -h, --help              Show this help\n";
}

// Throws ConfigError on unknown flags or missing values
CliOptions parse_args(int argc, char* argv[]) {
  CliOptions opts;
  std::vector<std::string> positional;

  auto value = [&](int& i, const std::string& flag) -> std::string {
    if (i + 1 >= argc) {
      throw ConfigError("option " + flag + " requires a value");
    }
    return argv[++i];
  };

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-p" || arg == "--provider") {
      opts.provider = value(i, arg);
    } else if (arg == "-m" || arg == "--model") {
      opts.model = value(i, arg);
    } else if (arg == "--prompt") {
      opts.prompt = value(i, arg);
    } else if (arg == "-s" || arg == "--session") {
      opts.session = value(i, arg);
    } else if (arg == "--mode") {
      opts.mode = value(i, arg);
    } else if (arg == "--tools") {
      opts.enable_tools = true;
    } else if (arg == "--no-tools") {
      opts.enable_tools = false;
    } else if (arg == "--allow-tool") {
      opts.allowed_tools.push_back(value(i, arg));
    } else if (arg == "--stream") {
      opts.stream = true;
    } else if (arg == "--max-turns") {
      opts.max_turns = parse_count(value(i, arg), arg);
    } else if (arg == "--system") {
      opts.system_prompt = value(i, arg);
    } else if (arg == "-f" || arg == "--file") {
      opts.files.push_back(value(i, arg));
    } else if (arg == "--config") {
      opts.config_path = value(i, arg);
    } else if (arg == "--log-level") {
      opts.log_level = value(i, arg);
    } else if (arg == "--no-cache") {
      opts.no_cache = true;
    } else if (arg == "--export") {
      opts.export_path = value(i, arg);
    } else if (arg == "--show-session") {
      opts.show_session = value(i, arg);
    } else if (arg == "--export-session") {
      opts.export_session = value(i, arg);
    } else if (arg == "--list-sessions") {
      opts.list_sessions = true;
    } else if (arg == "--list-providers") {
      opts.list_providers = true;
    } else if (arg == "-v" || arg == "--version") {
      opts.show_version = true;
    } else if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
    } else if (arg == "--") {
      for (++i; i < argc; ++i) positional.push_back(argv[i]);
    } else if (arg.size() > 1 && arg[0] == '-') {
      throw ConfigError("unknown option " + arg);
    } else {
      positional.push_back(arg);
    }
  }

  if (!positional.empty()) {
    if (opts.prompt) {
      throw ConfigError("prompt given both with --prompt and as an argument");
    }
    std::string joined;
    for (const auto& word : positional) {
      if (!joined.empty()) joined += ' ';
      joined += word;
    }
    opts.prompt = joined;
  }
  return opts;
}

// Config file (explicit or default locations), environment, then flags
Config resolve_config(const CliOptions& opts) {
  Config config;
  if (opts.config_path) {
    config = Config::load(*opts.config_path);
    config.apply_env();
  } else {
    config = Config::from_env();
  }

  if (opts.provider) config.default_provider = *opts.provider;
  if (opts.model) config.model = *opts.model;
  if (opts.mode) {
    auto mode = mode_from_string(*opts.mode);
    if (!mode) {
      throw ConfigError("unknown mode '" + *opts.mode + "', expected planning or building");
    }
    config.mode = *mode;
  }
  if (!opts.allowed_tools.empty()) {
    config.allowed_tools = opts.allowed_tools;
    config.enable_tools = true;
  }
  if (opts.enable_tools) config.enable_tools = *opts.enable_tools;
  if (opts.stream) config.stream = *opts.stream;
  if (opts.max_turns) {
    if (*opts.max_turns < 1) {
      throw ConfigError("--max-turns must be at least 1");
    }
    config.max_turns = *opts.max_turns;
  }
  if (opts.system_prompt) config.system_prompt = *opts.system_prompt;
  if (opts.log_level) config.log_level = *opts.log_level;
  if (opts.no_cache) config.cache_enabled = false;
  return config;
}

std::vector<Attachment> read_attachments(const std::vector<std::string>& files) {
  std::vector<Attachment> attachments;
  for (const auto& file : files) {
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
      throw ConfigError("cannot read attached file '" + file + "'");
    }
    std::ostringstream content;
    content << in.rdbuf();
    attachments.push_back({file, sanitize_utf8(content.str())});
  }
  return attachments;
}

void print_providers(const Config& config) {
  for (const auto& [name, provider] : config.providers) {
    std::cout << name << (name == config.default_provider ? " *" : "") << "\n"
              << "    family:  " << to_string(provider.family) << "\n"
              << "    url:     " << provider.base_url << "\n"
              << "    model:   " << provider.default_model << "\n"
              << "    api key: " << (provider.api_key.empty() ? "(not set)" : "set") << "\n";
  }
}

// Saved sessions only, a typo must not look like an empty session
Conversation load_existing(const SessionStore& store, const std::string& name) {
  if (!store.exists(name)) {
    throw SessionIOError("no saved session named '" + name + "' in " + store.base_dir().string());
  }
  return store.load(name);
}

void print_sessions(const SessionStore& store) {
  auto names = store.list();
  if (names.empty()) {
    std::cout << "No saved sessions in " << store.base_dir().string() << "\n";
    return;
  }
  for (const auto& name : names) {
    std::cout << name << "\n";
  }
}

// Routes SIGINT to Engine::cancel() from an ordinary thread, so cancel()
// never runs inside a signal handler
class InterruptWatcher {
 public:
  explicit InterruptWatcher(Engine& engine) : engine_(engine) {
    thread_ = std::thread([this]() {
      sigset_t set;
      sigemptyset(&set);
      sigaddset(&set, SIGINT);
      while (true) {
        int sig = 0;
        if (sigwait(&set, &sig) != 0) break;
        if (stopping_.load()) break;
        static const char kMsg[] = "\n[Interrupted]\n";
        [[maybe_unused]] auto written = ::write(STDERR_FILENO, kMsg, sizeof(kMsg) - 1);
        engine_.cancel();
      }
    });
  }

  ~InterruptWatcher() {
    stopping_.store(true);
    pthread_kill(thread_.native_handle(), SIGINT);
    thread_.join();
  }

  // SIGINT must be blocked before any thread starts so only sigwait sees it
  static void block_sigint() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);
  }

 private:
  Engine& engine_;
  std::atomic<bool> stopping_{false};
  std::thread thread_;
};

int run(const CliOptions& opts) {
  Config config = resolve_config(opts);

  init_log(config.log_file ? config.log_file->string() : "", 10, config.log_level);
  spdlog::info("convo {} starting", CONVO_VERSION_STRING);

  if (opts.list_providers) {
    print_providers(config);
    return kExitOk;
  }

  SessionStore store(config.sessions_dir);
  if (opts.list_sessions) {
    print_sessions(store);
    return kExitOk;
  }
  if (opts.show_session) {
    std::cout << render_conversation(load_existing(store, *opts.show_session), ExportFormat::Text);
    return kExitOk;
  }
  if (opts.export_session) {
    if (!opts.export_path) {
      throw ConfigError("--export-session needs an --export <path>");
    }
    export_conversation(load_existing(store, *opts.export_session), *opts.export_path);
    std::cout << "exported " << *opts.export_session << " to " << *opts.export_path << "\n";
    return kExitOk;
  }

  if (!opts.prompt || opts.prompt->empty()) {
    std::cerr << "Error: no prompt given\n\n";
    print_usage(std::cerr);
    return kExitError;
  }

  auto provider = config.require_provider(config.default_provider);

  llm::RequestOptions request_options;
  request_options.max_context_tokens = config.context.max_context_tokens;
  request_options.reserve_output_tokens = config.context.reserve_output_tokens;
  auto adapter = llm::make_adapter(provider, request_options);

  ToolRegistry registry;
  tools::register_builtins(registry);
  if (!config.allowed_tools.empty()) {
    registry.set_allow_list(config.allowed_tools);
  }
  spdlog::debug("{} tools registered", registry.size());

  auto attachments = read_attachments(opts.files);
  Conversation conversation = opts.session ? store.load(*opts.session) : Conversation();

  EngineOptions engine_options;
  engine_options.mode = config.mode;
  engine_options.stream = config.stream;
  engine_options.enable_tools = config.enable_tools;
  engine_options.max_turns = config.max_turns;
  engine_options.working_dir = std::filesystem::current_path();
  engine_options.system_prompt = config.system_prompt;
  engine_options.max_tool_output_bytes = config.context.max_tool_output_bytes;
  engine_options.max_tool_output_lines = config.context.max_tool_output_lines;

  llm::HttpTransport transport(config.request_timeout);
  Engine engine(*adapter, transport, registry, &store, engine_options);

  std::optional<ResponseCache> cache;
  if (config.cache_enabled) {
    cache.emplace(config.cache_dir);
    engine.use_cache(&*cache);
  }

  bool printed_text = false;
  engine.on_text([&printed_text](const std::string& text) {
    std::cout << text << std::flush;
    printed_text = true;
  });
  engine.on_tool_call([&printed_text](const ToolCall& call) {
    if (printed_text) std::cout << "\n";
    printed_text = false;
    std::cerr << "[Calling tool: " << call.name << " " << call.arguments.dump() << "]\n";
  });
  engine.on_tool_result([](const ToolCall& call, const std::string& result, bool is_error) {
    std::cerr << "[Tool " << call.name << " " << (is_error ? "failed" : "completed") << ", " << result.size()
              << " chars]\n";
  });

  spdlog::info("provider={} model={} mode={} session={}", provider.name, adapter->model(), to_string(config.mode),
               conversation.session_id());

  RunOutcome outcome;
  {
    InterruptWatcher watcher(engine);
    outcome = engine.run(conversation, *opts.prompt, attachments);
  }

  if (printed_text) std::cout << "\n";

  if (outcome.cache_hits > 0) {
    std::cerr << "[cache hit]\n";
  }
  if (outcome.persist_error) {
    std::cerr << "Warning: session not saved: " << *outcome.persist_error << "\n";
  }
  if (outcome.usage.total() > 0) {
    spdlog::info("usage: input={} output={} turns={}", outcome.usage.input_tokens, outcome.usage.output_tokens,
                 outcome.turns);
  }
  if (!opts.session) {
    std::cerr << "[session " << conversation.session_id() << "]\n";
  }

  bool committed = outcome.state == TerminalState::FinalContent || outcome.state == TerminalState::TurnLimitExceeded;
  if (opts.export_path && committed) {
    try {
      export_conversation(conversation, *opts.export_path);
    } catch (const SessionIOError& e) {
      std::cerr << "Error: " << e.describe() << "\n";
      return kExitError;
    }
  }

  switch (outcome.state) {
    case TerminalState::FinalContent:
      return kExitOk;
    case TerminalState::TurnLimitExceeded:
      std::cerr << "Error: " << outcome.error << "\n";
      return kExitTurnLimit;
    case TerminalState::Cancelled:
      return kExitCancelled;
    case TerminalState::FatalError:
      std::cerr << "Error: " << outcome.error << "\n";
      return kExitError;
  }
  return kExitError;
}

}  // namespace

int main(int argc, char* argv[]) {
  InterruptWatcher::block_sigint();

  CliOptions opts;
  try {
    opts = parse_args(argc, argv);
  } catch (const ConfigError& e) {
    std::cerr << "Error: " << e.what() << "\n\n";
    print_usage(std::cerr);
    return kExitError;
  }

  if (opts.show_help) {
    print_usage(std::cout);
    return kExitOk;
  }
  if (opts.show_version) {
    std::cout << "convo " << version() << "\n";
    return kExitOk;
  }

  try {
    return run(opts);
  } catch (const Error& e) {
    std::cerr << "Error: " << e.describe() << "\n";
    spdlog::error("{}", e.describe());
    return kExitError;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    spdlog::error("{}", e.what());
    return kExitError;
  }
}
