#include "agent/engine.hpp"

#include <spdlog/spdlog.h>

#include "llm/stream_assembler.hpp"

namespace convo {

std::string to_string(TerminalState state) {
  switch (state) {
    case TerminalState::FinalContent:
      return "final_content";
    case TerminalState::TurnLimitExceeded:
      return "turn_limit_exceeded";
    case TerminalState::FatalError:
      return "fatal_error";
    case TerminalState::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

std::string error_payload(const Error &error) {
  return json{{"error", error.describe()}}.dump();
}

Engine::Engine(llm::ProviderAdapter &adapter, llm::Transport &transport, ToolRegistry &registry, SessionStore *store,
               EngineOptions options)
    : adapter_(adapter),
      transport_(transport),
      registry_(registry),
      store_(store),
      options_(std::move(options)),
      abort_signal_(std::make_shared<std::atomic<bool>>(false)) {
  if (options_.max_turns < 1) {
    throw ConfigError("max_turns must be at least 1");
  }
}

void Engine::cancel() {
  spdlog::info("[Engine] Cancel requested");
  abort_signal_->store(true);
  transport_.cancel();
}

void Engine::check_cancelled() const {
  if (abort_signal_->load()) {
    throw Cancelled("run cancelled by user");
  }
}

RunOutcome Engine::run(Conversation &conversation, const std::string &prompt,
                       const std::vector<Attachment> &attachments) {
  RunOutcome outcome;
  abort_signal_->store(false);
  transport_.reset();

  spdlog::debug("[Engine {}] Run: provider={}, model={}, mode={}, stream={}, max_turns={}", conversation.session_id(),
                adapter_.name(), adapter_.model(), to_string(options_.mode), options_.stream, options_.max_turns);

  // The prompt and attachments are committed together with the first turn
  Conversation working = conversation;

  try {
    if (options_.enable_tools && !registry_.list(options_.mode).empty() && !adapter_.supports_tools()) {
      throw CapabilityUnsupported("provider '" + adapter_.name() + "' does not support tool calling");
    }

    if (working.empty() && options_.system_prompt && !options_.system_prompt->empty()) {
      working.append(Message::system(*options_.system_prompt));
    }
    for (const auto &attachment : attachments) {
      working.append(Message::system("Attached file '" + attachment.path + "':\n" + attachment.content));
    }
    working.append(Message::user(prompt));

    for (int turn = 1; turn <= options_.max_turns; ++turn) {
      check_cancelled();
      spdlog::debug("[Engine {}] Turn {}/{}", working.session_id(), turn, options_.max_turns);

      auto response = request_turn(working, outcome);
      outcome.usage += response.usage;
      outcome.turns = turn;

      working.append(Message::assistant(response.text, response.tool_calls));

      if (!response.has_tool_calls()) {
        working.record_turn();
        conversation = working;
        persist(conversation, outcome);

        outcome.state = TerminalState::FinalContent;
        outcome.final_content = response.text.value_or("");
        spdlog::debug("[Engine {}] Final content after {} turn(s), finish={}", conversation.session_id(), turn,
                      to_string(response.finish_reason));
        return outcome;
      }

      spdlog::debug("[Engine {}] {} tool call(s) requested", working.session_id(), response.tool_calls.size());
      std::vector<Message> results;
      for (const auto &call : response.tool_calls) {
        check_cancelled();
        if (on_tool_call_) {
          on_tool_call_(call);
        }

        auto [content, is_error] = execute_tool(call, response, working.session_id());
        results.push_back(Message::tool_result(call.id, content));

        if (on_tool_result_) {
          on_tool_result_(call, content, is_error);
        }
      }
      working.append_all(std::move(results));

      // A turn is committed only with every call answered
      if (auto pending = working.pending_tool_calls(); !pending.empty()) {
        throw ProtocolError("tool call '" + pending.front().id + "' has no result");
      }

      working.record_turn();
      conversation = working;
      persist(conversation, outcome);
    }

    outcome.state = TerminalState::TurnLimitExceeded;
    outcome.error = "turn limit of " + std::to_string(options_.max_turns) + " reached without final content";
    spdlog::warn("[Engine {}] {}", conversation.session_id(), outcome.error);
    return outcome;

  } catch (const Cancelled &e) {
    outcome.state = TerminalState::Cancelled;
    outcome.error = e.describe();
    outcome.error_kind = ErrorKind::Cancelled;
    spdlog::info("[Engine {}] Cancelled: {}", conversation.session_id(), e.what());
    return outcome;
  } catch (const Error &e) {
    outcome.state = TerminalState::FatalError;
    outcome.error = e.describe();
    outcome.error_kind = e.kind();
    spdlog::error("[Engine {}] Fatal: {}", conversation.session_id(), outcome.error);
    return outcome;
  } catch (const json::exception &e) {
    outcome.state = TerminalState::FatalError;
    outcome.error = ProtocolError(e.what()).describe();
    outcome.error_kind = ErrorKind::Protocol;
    spdlog::error("[Engine {}] Fatal: {}", conversation.session_id(), outcome.error);
    return outcome;
  }
}

llm::NormalizedResponse Engine::request_turn(const Conversation &working, RunOutcome &outcome) {
  std::vector<ToolSpec> tools;
  if (options_.enable_tools) {
    tools = registry_.list(options_.mode);
  }

  auto request = adapter_.build_request(working, tools, options_.mode, options_.stream);
  spdlog::debug("[Engine {}] Request: url={}, messages={}, tools={}", working.session_id(), request.url,
                working.size(), tools.size());

  if (!options_.stream) {
    std::optional<std::string> cache_key;
    std::optional<std::string> body;
    if (cache_ && tools.empty()) {
      cache_key = ResponseCache::key(adapter_.name(), request.url, request.body);
      body = cache_->get(*cache_key);
      if (body) {
        ++outcome.cache_hits;
        spdlog::info("[Engine {}] Cache hit {}", working.session_id(), *cache_key);
      }
    }

    bool from_cache = body.has_value();
    if (!body) {
      body = transport_.send(request);
    }
    auto response = adapter_.parse_response(*body);

    if (cache_key && !from_cache && !response.has_tool_calls()) {
      try {
        cache_->put(*cache_key, *body);
      } catch (const SessionIOError &e) {
        spdlog::warn("[Engine {}] Cache store failed: {}", working.session_id(), e.what());
      }
    }

    if (response.text && !response.text->empty() && on_text_) {
      on_text_(*response.text);
    }
    return response;
  }

  llm::StreamAssembler assembler(on_text_);
  auto decoder = adapter_.make_stream_decoder();
  transport_.stream(request, [&](const std::string &chunk) {
    assembler.consume_all(decoder->feed(chunk));
  });
  assembler.consume_all(decoder->finish());
  return assembler.result();
}

std::pair<std::string, bool> Engine::execute_tool(const ToolCall &call, const llm::NormalizedResponse &response,
                                                  const SessionId &session_id) {
  spdlog::debug("[Engine {}] Tool call: id={}, name={}, args={}", session_id, call.id, call.name,
                call.arguments.dump());

  auto arg_error = response.argument_errors.find(call.id);
  if (arg_error != response.argument_errors.end()) {
    spdlog::warn("[Engine {}] Malformed arguments for {}: {}", session_id, call.name, arg_error->second);
    return {error_payload(ProtocolError("malformed arguments for '" + call.name + "': " + arg_error->second)), true};
  }

  try {
    auto tool = registry_.resolve(call.name, options_.mode);

    auto validated = tool->validate_args(call.arguments);
    if (!validated.ok()) {
      throw ToolExecutionError(validated.error.value_or("invalid arguments"));
    }

    ToolContext ctx;
    ctx.session_id = session_id;
    ctx.call_id = call.id;
    ctx.working_dir = options_.working_dir;
    ctx.abort_signal = abort_signal_;

    auto result = tool->execute(*validated.value, ctx).get();
    spdlog::debug("[Engine {}] Tool {} completed, is_error={}, output length={}", session_id, call.name,
                  result.is_error, result.output.size());

    if (result.is_error) {
      throw ToolExecutionError(result.output);
    }

    auto truncated =
        Truncate::output(sanitize_utf8(result.output), options_.max_tool_output_lines, options_.max_tool_output_bytes);
    return {truncated.content, false};

  } catch (const PolicyViolation &e) {
    spdlog::info("[Engine {}] Policy violation for {}: {}", session_id, call.name, e.what());
    return {error_payload(e), true};
  } catch (const Error &e) {
    if (!is_recoverable(e.kind())) {
      throw;
    }
    spdlog::warn("[Engine {}] Tool {} failed: {}", session_id, call.name, e.describe());
    return {error_payload(e), true};
  } catch (const std::exception &e) {
    spdlog::error("[Engine {}] Tool {} exception: {}", session_id, call.name, e.what());
    return {error_payload(ToolExecutionError(e.what())), true};
  }
}

void Engine::persist(const Conversation &conversation, RunOutcome &outcome) {
  if (!store_) {
    return;
  }
  try {
    store_->save(conversation);
  } catch (const SessionIOError &e) {
    outcome.persist_error = e.describe();
    spdlog::error("[Engine {}] Persist failed: {}", conversation.session_id(), e.what());
  }
}

}  // namespace convo
