#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/conversation.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "llm/adapter.hpp"
#include "llm/transport.hpp"
#include "session/response_cache.hpp"
#include "session/session_store.hpp"
#include "tool/tool.hpp"

namespace convo {

// How a run ended
enum class TerminalState { FinalContent, TurnLimitExceeded, FatalError, Cancelled };

std::string to_string(TerminalState state);

// A file inlined into the conversation ahead of the prompt
struct Attachment {
  std::string path;
  std::string content;
};

struct EngineOptions {
  Mode mode = Mode::Building;
  bool stream = false;
  bool enable_tools = false;
  int max_turns = 8;  // provider calls per run
  std::filesystem::path working_dir;
  std::optional<std::string> system_prompt;  // added to empty conversations only
  size_t max_tool_output_bytes = 51200;
  size_t max_tool_output_lines = 2000;
};

struct RunOutcome {
  TerminalState state = TerminalState::FatalError;
  std::string final_content;
  std::string error;  // "<Kind>: message" for FatalError / Cancelled
  std::optional<ErrorKind> error_kind;
  int turns = 0;
  int cache_hits = 0;
  TokenUsage usage;

  // Last failed save, the run itself is unaffected
  std::optional<std::string> persist_error;

  bool ok() const {
    return state == TerminalState::FinalContent;
  }
};

// Runs the request / tool-execution loop for one user prompt.
//
// Each provider turn works on a staged copy of the conversation that is
// committed only when the turn completes, so a cancelled or failed turn
// leaves the caller's conversation as it was after the last completed turn.
class Engine {
 public:
  Engine(llm::ProviderAdapter &adapter, llm::Transport &transport, ToolRegistry &registry, SessionStore *store,
         EngineOptions options);

  RunOutcome run(Conversation &conversation, const std::string &prompt,
                 const std::vector<Attachment> &attachments = {});

  // Thread-safe. Interrupts the request in flight and stops before the next
  // tool or turn.
  void cancel();

  // Replay buffered replies to requests sent without tools. Null disables.
  void use_cache(ResponseCache *cache) {
    cache_ = cache;
  }

  const EngineOptions &options() const {
    return options_;
  }

  // Event callbacks
  using OnTextCallback = std::function<void(const std::string &text)>;
  using OnToolCallCallback = std::function<void(const ToolCall &call)>;
  using OnToolResultCallback = std::function<void(const ToolCall &call, const std::string &result, bool is_error)>;

  void on_text(OnTextCallback cb) {
    on_text_ = std::move(cb);
  }

  void on_tool_call(OnToolCallCallback cb) {
    on_tool_call_ = std::move(cb);
  }

  void on_tool_result(OnToolResultCallback cb) {
    on_tool_result_ = std::move(cb);
  }

 private:
  llm::NormalizedResponse request_turn(const Conversation &working, RunOutcome &outcome);

  // Returns the recorded content and whether it is an error
  std::pair<std::string, bool> execute_tool(const ToolCall &call, const llm::NormalizedResponse &response,
                                            const SessionId &session_id);

  void persist(const Conversation &conversation, RunOutcome &outcome);

  void check_cancelled() const;

  llm::ProviderAdapter &adapter_;
  llm::Transport &transport_;
  ToolRegistry &registry_;
  SessionStore *store_;
  ResponseCache *cache_ = nullptr;
  EngineOptions options_;

  std::shared_ptr<std::atomic<bool>> abort_signal_;

  OnTextCallback on_text_;
  OnToolCallCallback on_tool_call_;
  OnToolResultCallback on_tool_result_;
};

// {"error": "<Kind>: <message>"}
std::string error_payload(const Error &error);

}  // namespace convo
