#include <gtest/gtest.h>

#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>

#include "agent/engine.hpp"
#include "core/uuid.hpp"
#include "fixtures.hpp"
#include "llm/anthropic_adapter.hpp"
#include "llm/ollama_adapter.hpp"
#include "llm/openai_adapter.hpp"
#include "tool/builtin/builtins.hpp"

using namespace convo;
using namespace convo::test;

namespace fs = std::filesystem;

namespace {

// Replays canned provider bodies and records every request
class ScriptedTransport : public llm::Transport {
 public:
  void reply(std::string body) {
    steps_.push_back({std::move(body), std::nullopt});
  }

  void fail(std::string message) {
    steps_.push_back({"", std::move(message)});
  }

  std::string send(const llm::WireRequest& request) override {
    return next(request);
  }

  void stream(const llm::WireRequest& request, const llm::ChunkCallback& on_chunk) override {
    for (const auto& chunk : split(next(request), 16)) {
      on_chunk(chunk);
    }
  }

  void cancel() override {
    cancelled_ = true;
  }

  void reset() override {
    cancelled_ = false;
  }

  const std::vector<llm::WireRequest>& requests() const {
    return requests_;
  }

  // Runs before each reply is produced
  std::function<void()> before_reply;

 private:
  struct Step {
    std::string body;
    std::optional<std::string> error;
  };

  std::string next(const llm::WireRequest& request) {
    requests_.push_back(request);
    if (before_reply) {
      before_reply();
    }
    if (cancelled_) {
      throw Cancelled("request cancelled");
    }
    if (steps_.empty()) {
      throw NetworkError("no scripted reply left");
    }
    auto step = steps_.front();
    steps_.pop_front();
    if (step.error) {
      throw NetworkError(*step.error, 503);
    }
    return step.body;
  }

  std::deque<Step> steps_;
  std::vector<llm::WireRequest> requests_;
  bool cancelled_ = false;
};

std::string openai_stream_text(const std::string& text) {
  json delta = {{"choices", json::array({{{"index", 0}, {"delta", {{"content", text}}}}})}};
  json finish = {{"choices", json::array({{{"index", 0}, {"delta", json::object()}, {"finish_reason", "stop"}}})}};
  return "data: " + delta.dump() + "\n\ndata: " + finish.dump() + "\n\ndata: [DONE]\n\n";
}

std::string openai_stream_call(const std::string& id, const std::string& name, const std::string& arguments) {
  json start = {{"choices",
                 json::array({{{"index", 0},
                               {"delta",
                                {{"tool_calls", json::array({{{"index", 0},
                                                              {"id", id},
                                                              {"type", "function"},
                                                              {"function", {{"name", name}, {"arguments", ""}}}}})}}}}})}};
  json args = {{"choices",
                json::array({{{"index", 0},
                              {"delta",
                               {{"tool_calls",
                                 json::array({{{"index", 0}, {"function", {{"arguments", arguments}}}}})}}}}})}};
  json finish = {
      {"choices", json::array({{{"index", 0}, {"delta", json::object()}, {"finish_reason", "tool_calls"}}})}};
  return "data: " + start.dump() + "\n\ndata: " + args.dump() + "\n\ndata: " + finish.dump() + "\n\ndata: [DONE]\n\n";
}

}  // namespace

class EngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = fs::temp_directory_path() / ("convo_engine_" + UUID::generate());
    fs::create_directories(test_dir_);
    store_ = std::make_unique<SessionStore>(test_dir_ / "sessions");
    tools::register_builtins(registry_);

    options_.enable_tools = true;
    options_.max_turns = 4;
    options_.working_dir = test_dir_;
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(test_dir_, ec);
  }

  Engine make_engine() {
    return Engine(adapter_, transport_, registry_, store_.get(), options_);
  }

  fs::path test_dir_;
  llm::OpenAIAdapter adapter_{openai_config()};
  ScriptedTransport transport_;
  ToolRegistry registry_;
  std::unique_ptr<SessionStore> store_;
  EngineOptions options_;
};

TEST_F(EngineTest, FinalContentWithoutTools) {
  transport_.reply(openai_text_reply("Hello!"));

  auto engine = make_engine();
  std::string streamed;
  engine.on_text([&streamed](const std::string& text) { streamed += text; });

  Conversation conv("greet");
  auto outcome = engine.run(conv, "Hi");

  EXPECT_EQ(outcome.state, TerminalState::FinalContent);
  EXPECT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.final_content, "Hello!");
  EXPECT_EQ(outcome.turns, 1);
  EXPECT_EQ(outcome.usage.total(), 15);
  EXPECT_EQ(streamed, "Hello!");

  ASSERT_EQ(conv.size(), 2u);
  EXPECT_EQ(conv.messages()[0], Message::user("Hi"));
  EXPECT_EQ(conv.messages()[1].text(), "Hello!");
  EXPECT_EQ(conv.turn_count(), 1);

  // Tools are advertised when enabled
  ASSERT_EQ(transport_.requests().size(), 1u);
  EXPECT_EQ(transport_.requests()[0].body["tools"].size(), 3u);

  EXPECT_EQ(store_->load("greet").messages(), conv.messages());
}

TEST_F(EngineTest, ToolCallThenFinalAnswer) {
  transport_.reply(openai_tool_reply({openai_call("call_1", "echo", R"({"text":"hi"})")}));
  transport_.reply(openai_text_reply("The tool said hi."));

  auto engine = make_engine();
  std::vector<std::string> called;
  std::vector<bool> errors;
  engine.on_tool_call([&called](const ToolCall& call) { called.push_back(call.name); });
  engine.on_tool_result(
      [&errors](const ToolCall&, const std::string&, bool is_error) { errors.push_back(is_error); });

  Conversation conv("tools");
  auto outcome = engine.run(conv, "Echo hi");

  EXPECT_EQ(outcome.state, TerminalState::FinalContent);
  EXPECT_EQ(outcome.final_content, "The tool said hi.");
  EXPECT_EQ(outcome.turns, 2);
  EXPECT_EQ(called, std::vector<std::string>{"echo"});
  EXPECT_EQ(errors, std::vector<bool>{false});

  const auto& msgs = conv.messages();
  ASSERT_EQ(msgs.size(), 4u);
  EXPECT_EQ(msgs[1].role(), Role::Assistant);
  ASSERT_EQ(msgs[1].tool_calls().size(), 1u);
  EXPECT_EQ(msgs[2].role(), Role::Tool);
  EXPECT_EQ(msgs[2].tool_call_id().value_or(""), "call_1");
  EXPECT_EQ(json::parse(msgs[2].text()), json({{"echo", {{"text", "hi"}}}}));
  EXPECT_EQ(msgs[3].text(), "The tool said hi.");
  EXPECT_EQ(conv.turn_count(), 2);

  // The second request carries the tool result
  ASSERT_EQ(transport_.requests().size(), 2u);
  const auto& sent = transport_.requests()[1].body["messages"];
  ASSERT_EQ(sent.size(), 3u);
  EXPECT_EQ(sent[2]["role"], "tool");
  EXPECT_EQ(sent[2]["tool_call_id"], "call_1");
}

TEST_F(EngineTest, TurnLimitExceeded) {
  options_.max_turns = 2;
  for (int i = 1; i <= 3; ++i) {
    transport_.reply(openai_tool_reply({openai_call("call_" + std::to_string(i), "echo", R"({"text":"again"})")}));
  }

  auto engine = make_engine();
  Conversation conv("loop");
  auto outcome = engine.run(conv, "Loop forever");

  EXPECT_EQ(outcome.state, TerminalState::TurnLimitExceeded);
  EXPECT_EQ(outcome.turns, 2);
  EXPECT_EQ(transport_.requests().size(), 2u);

  // Completed turns stay committed
  EXPECT_EQ(conv.size(), 5u);
  EXPECT_EQ(conv.turn_count(), 2);
  EXPECT_TRUE(conv.pending_tool_calls().empty());
}

TEST_F(EngineTest, PolicyViolationBecomesToolResult) {
  options_.mode = Mode::Planning;
  transport_.reply(openai_tool_reply(
      {openai_call("call_w", "write_file", R"({"path":"out.txt","content":"x"})")}));
  transport_.reply(openai_text_reply("I cannot write in planning mode."));

  auto engine = make_engine();
  Conversation conv("plan");
  auto outcome = engine.run(conv, "Write out.txt");

  EXPECT_EQ(outcome.state, TerminalState::FinalContent);
  EXPECT_FALSE(fs::exists(test_dir_ / "out.txt"));

  // Mutating tools are not advertised in planning mode
  EXPECT_EQ(transport_.requests()[0].body["tools"].size(), 2u);

  auto result = json::parse(conv.messages()[2].text());
  EXPECT_EQ(result["error"], "PolicyViolation: tool 'write_file' is disabled in planning mode");
}

TEST_F(EngineTest, AllowListDenial) {
  registry_.set_allow_list({"read_file"});
  transport_.reply(openai_tool_reply({openai_call("call_e", "echo", R"({"text":"x"})")}));
  transport_.reply(openai_text_reply("ok"));

  auto engine = make_engine();
  Conversation conv("allow");
  engine.run(conv, "echo x");

  EXPECT_EQ(transport_.requests()[0].body["tools"].size(), 1u);
  auto result = json::parse(conv.messages()[2].text());
  EXPECT_EQ(result["error"], "PolicyViolation: tool 'echo' is not in the allowed tool list");
}

TEST_F(EngineTest, UnknownToolAndMalformedArgumentsAreRecoverable) {
  transport_.reply(openai_tool_reply({openai_call("call_u", "launch_rockets", "{}"),
                                      openai_call("call_m", "echo", R"({"text":)"),
                                      openai_call("call_ok", "echo", R"({"text":"fine"})")}));
  transport_.reply(openai_text_reply("Recovered."));

  auto engine = make_engine();
  Conversation conv("recover");
  auto outcome = engine.run(conv, "go");

  EXPECT_EQ(outcome.state, TerminalState::FinalContent);

  const auto& msgs = conv.messages();
  ASSERT_EQ(msgs.size(), 6u);
  EXPECT_EQ(json::parse(msgs[2].text())["error"], "UnknownTool: unknown tool 'launch_rockets'");

  auto malformed = json::parse(msgs[3].text())["error"].get<std::string>();
  EXPECT_EQ(malformed.rfind("ProtocolError: ", 0), 0u);

  EXPECT_EQ(json::parse(msgs[4].text())["echo"]["text"], "fine");
}

TEST_F(EngineTest, InvalidArgumentsReportToolExecutionError) {
  transport_.reply(openai_tool_reply({openai_call("call_r", "read_file", R"({"max_bytes":10})")}));
  transport_.reply(openai_text_reply("Missing path."));

  auto engine = make_engine();
  Conversation conv("args");
  engine.run(conv, "read");

  auto error = json::parse(conv.messages()[2].text())["error"].get<std::string>();
  EXPECT_EQ(error, "ToolExecutionError: Missing required parameter: path");
}

TEST_F(EngineTest, CancelDuringRequestLeavesConversationUnchanged) {
  Conversation conv("cancel");
  conv.append(Message::user("earlier"));
  conv.append(Message::assistant("earlier answer"));
  conv.record_turn();
  auto before = conv.messages();

  transport_.reply(openai_text_reply("never seen"));
  auto engine = make_engine();
  transport_.before_reply = [&engine]() { engine.cancel(); };

  auto outcome = engine.run(conv, "new prompt");

  EXPECT_EQ(outcome.state, TerminalState::Cancelled);
  ASSERT_TRUE(outcome.error_kind.has_value());
  EXPECT_EQ(*outcome.error_kind, ErrorKind::Cancelled);
  EXPECT_EQ(conv.messages(), before);
  EXPECT_EQ(conv.turn_count(), 1);
  EXPECT_FALSE(store_->exists("cancel"));
}

TEST_F(EngineTest, CancelAfterToolTurnKeepsCompletedTurn) {
  transport_.reply(openai_tool_reply({openai_call("call_1", "echo", R"({"text":"a"})")}));
  transport_.reply(openai_text_reply("unused"));

  auto engine = make_engine();
  engine.on_tool_result([&engine](const ToolCall&, const std::string&, bool) { engine.cancel(); });

  Conversation conv("partial");
  auto outcome = engine.run(conv, "go");

  EXPECT_EQ(outcome.state, TerminalState::Cancelled);
  EXPECT_EQ(transport_.requests().size(), 1u);
  EXPECT_EQ(conv.size(), 3u);
  EXPECT_EQ(conv.turn_count(), 1);

  // A new run starts clean
  auto next = engine.run(conv, "continue");
  EXPECT_EQ(next.state, TerminalState::FinalContent);
  EXPECT_EQ(next.final_content, "unused");
}

TEST_F(EngineTest, NetworkErrorIsFatal) {
  transport_.fail("HTTP 503: overloaded");

  auto engine = make_engine();
  Conversation conv("net");
  auto outcome = engine.run(conv, "hello?");

  EXPECT_EQ(outcome.state, TerminalState::FatalError);
  ASSERT_TRUE(outcome.error_kind.has_value());
  EXPECT_EQ(*outcome.error_kind, ErrorKind::Network);
  EXPECT_EQ(outcome.error, "NetworkError: HTTP 503: overloaded");
  EXPECT_TRUE(conv.empty());
}

TEST_F(EngineTest, MalformedResponseIsFatal) {
  transport_.reply(R"({"choices": []})");

  auto engine = make_engine();
  Conversation conv("bad");
  auto outcome = engine.run(conv, "hello?");

  EXPECT_EQ(outcome.state, TerminalState::FatalError);
  ASSERT_TRUE(outcome.error_kind.has_value());
  EXPECT_EQ(*outcome.error_kind, ErrorKind::Protocol);
  EXPECT_TRUE(conv.empty());
}

TEST_F(EngineTest, WrongShapedResponseIsFatal) {
  transport_.reply(R"({"content":[{"type":"text","text":"first"}],"stop_reason":"end_turn"})");
  transport_.reply(R"({"content":["not a block"]})");

  llm::AnthropicAdapter anthropic(anthropic_config());
  Engine engine(anthropic, transport_, registry_, store_.get(), options_);

  Conversation conv("shape");
  ASSERT_EQ(engine.run(conv, "one").state, TerminalState::FinalContent);

  auto outcome = engine.run(conv, "two");
  EXPECT_EQ(outcome.state, TerminalState::FatalError);
  ASSERT_TRUE(outcome.error_kind.has_value());
  EXPECT_EQ(*outcome.error_kind, ErrorKind::Protocol);
  EXPECT_EQ(outcome.error.rfind("ProtocolError: ", 0), 0u);
  EXPECT_EQ(conv.size(), 2u);
}

TEST_F(EngineTest, StreamingRun) {
  options_.stream = true;
  transport_.reply(openai_stream_call("call_s", "echo", R"({"text":"streamed"})"));
  transport_.reply(openai_stream_text("All done."));

  auto engine = make_engine();
  std::string streamed;
  engine.on_text([&streamed](const std::string& text) { streamed += text; });

  Conversation conv("stream");
  auto outcome = engine.run(conv, "stream it");

  EXPECT_EQ(outcome.state, TerminalState::FinalContent);
  EXPECT_EQ(outcome.final_content, "All done.");
  EXPECT_EQ(streamed, "All done.");
  EXPECT_EQ(transport_.requests()[0].body["stream"], true);

  ASSERT_EQ(conv.size(), 4u);
  EXPECT_EQ(conv.messages()[1].tool_calls()[0].arguments["text"], "streamed");
  EXPECT_EQ(json::parse(conv.messages()[2].text())["echo"]["text"], "streamed");
}

TEST_F(EngineTest, SystemPromptAndAttachments) {
  options_.system_prompt = "Be brief.";
  transport_.reply(openai_text_reply("Summary."));
  transport_.reply(openai_text_reply("Again."));

  auto engine = make_engine();
  Conversation conv("attach");
  engine.run(conv, "Summarize", {{"notes.md", "# Notes"}});

  const auto& msgs = conv.messages();
  ASSERT_EQ(msgs.size(), 4u);
  EXPECT_EQ(msgs[0], Message::system("Be brief."));
  EXPECT_EQ(msgs[1], Message::system("Attached file 'notes.md':\n# Notes"));
  EXPECT_EQ(msgs[2], Message::user("Summarize"));

  // Only empty conversations get the system prompt
  engine.run(conv, "Again");
  EXPECT_EQ(conv.size(), 6u);
  EXPECT_EQ(conv.messages()[4], Message::user("Again"));
}

TEST_F(EngineTest, ToolsDisabledAdvertiseNothing) {
  options_.enable_tools = false;
  transport_.reply(openai_text_reply("plain"));

  auto engine = make_engine();
  Conversation conv("plain");
  engine.run(conv, "hi");

  EXPECT_FALSE(transport_.requests()[0].body.contains("tools"));
}

TEST_F(EngineTest, OllamaWithToolsIsUnsupported) {
  llm::OllamaAdapter ollama(ollama_config());
  Engine engine(ollama, transport_, registry_, store_.get(), options_);

  Conversation conv("ollama");
  auto outcome = engine.run(conv, "hi");

  EXPECT_EQ(outcome.state, TerminalState::FatalError);
  ASSERT_TRUE(outcome.error_kind.has_value());
  EXPECT_EQ(*outcome.error_kind, ErrorKind::CapabilityUnsupported);
  EXPECT_TRUE(transport_.requests().empty());
  EXPECT_TRUE(conv.empty());
}

TEST_F(EngineTest, OllamaWithoutTools) {
  options_.enable_tools = false;
  transport_.reply(R"({"message":{"role":"assistant","content":"Hi from llama"},"done":true})");

  llm::OllamaAdapter ollama(ollama_config());
  Engine engine(ollama, transport_, registry_, store_.get(), options_);

  Conversation conv("ollama");
  auto outcome = engine.run(conv, "hi");

  EXPECT_EQ(outcome.state, TerminalState::FinalContent);
  EXPECT_EQ(outcome.final_content, "Hi from llama");
}

TEST_F(EngineTest, CachedReplyForToollessRequest) {
  options_.enable_tools = false;
  transport_.reply(openai_text_reply("Cached answer"));

  ResponseCache cache(test_dir_ / "cache");
  auto engine = make_engine();
  engine.use_cache(&cache);

  Conversation first("cached");
  auto outcome = engine.run(first, "What is 2+2?");
  EXPECT_EQ(outcome.state, TerminalState::FinalContent);
  EXPECT_EQ(outcome.cache_hits, 0);
  ASSERT_EQ(transport_.requests().size(), 1u);

  auto key = ResponseCache::key("openai", transport_.requests()[0].url, transport_.requests()[0].body);
  EXPECT_TRUE(fs::exists(cache.path(key)));

  // Same request again is answered without the transport
  Conversation second("cached");
  std::string streamed;
  engine.on_text([&streamed](const std::string& text) { streamed += text; });
  outcome = engine.run(second, "What is 2+2?");

  EXPECT_EQ(outcome.state, TerminalState::FinalContent);
  EXPECT_EQ(outcome.cache_hits, 1);
  EXPECT_EQ(outcome.final_content, "Cached answer");
  EXPECT_EQ(outcome.turns, 1);
  EXPECT_EQ(streamed, "Cached answer");
  EXPECT_EQ(transport_.requests().size(), 1u);
  EXPECT_EQ(second.messages(), first.messages());
}

TEST_F(EngineTest, CacheSkippedWhenToolsAdvertised) {
  transport_.reply(openai_text_reply("one"));
  transport_.reply(openai_text_reply("two"));

  ResponseCache cache(test_dir_ / "cache");
  auto engine = make_engine();
  engine.use_cache(&cache);

  Conversation first("tooled");
  EXPECT_EQ(engine.run(first, "Hi").final_content, "one");
  Conversation second("tooled");
  auto outcome = engine.run(second, "Hi");

  EXPECT_EQ(outcome.final_content, "two");
  EXPECT_EQ(outcome.cache_hits, 0);
  EXPECT_EQ(transport_.requests().size(), 2u);
  EXPECT_FALSE(fs::exists(test_dir_ / "cache"));
}

TEST_F(EngineTest, PersistFailureDoesNotStopRun) {
  std::ofstream(test_dir_ / "blocker") << "x";
  SessionStore broken(test_dir_ / "blocker" / "sessions");

  transport_.reply(openai_text_reply("Still answered."));
  Engine engine(adapter_, transport_, registry_, &broken, options_);

  Conversation conv("unsaved");
  auto outcome = engine.run(conv, "hi");

  EXPECT_EQ(outcome.state, TerminalState::FinalContent);
  ASSERT_TRUE(outcome.persist_error.has_value());
  EXPECT_EQ(outcome.persist_error->rfind("SessionIOError: ", 0), 0u);
  EXPECT_EQ(conv.size(), 2u);
}

TEST_F(EngineTest, RejectsZeroTurns) {
  options_.max_turns = 0;
  EXPECT_THROW(make_engine(), ConfigError);
}

TEST(EngineErrorTest, ErrorPayload) {
  EXPECT_EQ(error_payload(UnknownTool("x")), R"({"error":"UnknownTool: unknown tool 'x'"})");
  EXPECT_EQ(to_string(TerminalState::TurnLimitExceeded), "turn_limit_exceeded");
}
