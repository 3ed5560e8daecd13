#include <gtest/gtest.h>

#include "core/error.hpp"
#include "llm/stream_assembler.hpp"

using namespace convo;
using namespace convo::llm;

using State = StreamAssembler::State;

TEST(StreamAssemblerTest, TextIsForwardedImmediately) {
  std::string seen;
  StreamAssembler assembler([&seen](const std::string& text) { seen += text; });

  EXPECT_EQ(assembler.state(), State::Idle);
  assembler.consume(TextDelta{"Hel"});
  EXPECT_EQ(seen, "Hel");
  EXPECT_EQ(assembler.state(), State::AccumulatingText);
  assembler.consume(TextDelta{"lo"});
  EXPECT_EQ(seen, "Hello");

  assembler.consume(Done{FinishReason::Stop, {3, 2}});
  EXPECT_TRUE(assembler.complete());

  auto response = assembler.result();
  EXPECT_EQ(response.text, "Hello");
  EXPECT_FALSE(response.has_tool_calls());
  EXPECT_EQ(response.usage.total(), 5);
}

TEST(StreamAssemblerTest, InterleavedToolCallsKeyedById) {
  StreamAssembler assembler;
  assembler.consume_all({
      ToolCallStarted{"a", "echo"},
      ToolCallStarted{"b", "read_file"},
      ToolCallArgDelta{"b", "{\"path\":"},
      ToolCallArgDelta{"a", "{\"text\":"},
      ToolCallArgDelta{"a", "\"hi\"}"},
      ToolCallArgDelta{"b", "\"x.txt\"}"},
  });
  EXPECT_EQ(assembler.state(), State::AccumulatingToolArgs);

  assembler.consume(ToolCallCompleted{"a"});
  EXPECT_EQ(assembler.state(), State::AccumulatingToolArgs);
  assembler.consume(ToolCallCompleted{"b"});
  assembler.consume(Done{});

  auto response = assembler.result();
  ASSERT_EQ(response.tool_calls.size(), 2u);
  EXPECT_EQ(response.tool_calls[0].id, "a");
  EXPECT_EQ(response.tool_calls[0].arguments["text"], "hi");
  EXPECT_EQ(response.tool_calls[1].id, "b");
  EXPECT_EQ(response.tool_calls[1].arguments["path"], "x.txt");
  EXPECT_EQ(response.finish_reason, FinishReason::ToolCalls);
  EXPECT_FALSE(response.text.has_value());
}

TEST(StreamAssemblerTest, MalformedArgumentsAreCallScoped) {
  StreamAssembler assembler;
  assembler.consume_all({
      ToolCallStarted{"good", "echo"},
      ToolCallArgDelta{"good", "{\"text\":\"ok\"}"},
      ToolCallStarted{"bad", "echo"},
      ToolCallArgDelta{"bad", "{\"text\":"},
      ToolCallCompleted{"good"},
      ToolCallCompleted{"bad"},
      Done{FinishReason::ToolCalls, {}},
  });

  auto response = assembler.result();
  ASSERT_EQ(response.tool_calls.size(), 2u);
  EXPECT_EQ(response.tool_calls[0].arguments["text"], "ok");
  EXPECT_EQ(response.tool_calls[1].arguments, json::object());
  EXPECT_EQ(response.argument_errors.count("bad"), 1u);
  EXPECT_EQ(response.argument_errors.count("good"), 0u);
}

TEST(StreamAssemblerTest, DoneClosesOpenCalls) {
  StreamAssembler assembler;
  assembler.consume_all({ToolCallStarted{"a", "echo"}, ToolCallArgDelta{"a", "{}"}, Done{}});

  auto response = assembler.result();
  ASSERT_EQ(response.tool_calls.size(), 1u);
  EXPECT_EQ(response.tool_calls[0].arguments, json::object());
  EXPECT_TRUE(response.argument_errors.empty());
}

TEST(StreamAssemblerTest, RejectsBrokenStreams) {
  {
    StreamAssembler assembler;
    EXPECT_THROW(assembler.consume(ToolCallArgDelta{"ghost", "{}"}), ProtocolError);
  }
  {
    StreamAssembler assembler;
    assembler.consume(ToolCallStarted{"a", "echo"});
    EXPECT_THROW(assembler.consume(ToolCallStarted{"a", "echo"}), ProtocolError);
  }
  {
    StreamAssembler assembler;
    assembler.consume(ToolCallStarted{"a", "echo"});
    assembler.consume(ToolCallCompleted{"a"});
    EXPECT_THROW(assembler.consume(ToolCallArgDelta{"a", "x"}), ProtocolError);
    EXPECT_THROW(assembler.consume(ToolCallCompleted{"a"}), ProtocolError);
  }
  {
    StreamAssembler assembler;
    assembler.consume(Done{});
    EXPECT_THROW(assembler.consume(TextDelta{"late"}), ProtocolError);
  }
}

TEST(StreamAssemblerTest, ResultBeforeDoneThrows) {
  StreamAssembler assembler;
  assembler.consume(TextDelta{"partial"});
  EXPECT_FALSE(assembler.complete());
  EXPECT_THROW(assembler.result(), ProtocolError);
}
