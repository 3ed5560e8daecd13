#include <gtest/gtest.h>

#include "core/conversation.hpp"
#include "core/error.hpp"
#include "core/message.hpp"

using namespace convo;

namespace {

ToolCall call(const std::string& id, const std::string& name, json args = json::object()) {
  return ToolCall{id, name, std::move(args)};
}

}  // namespace

TEST(MessageTest, Factories) {
  auto sys = Message::system("You are terse.");
  EXPECT_EQ(sys.role(), Role::System);
  EXPECT_EQ(sys.text(), "You are terse.");
  EXPECT_FALSE(sys.tool_call_id().has_value());

  auto assistant = Message::assistant(std::nullopt, {call("c1", "echo", {{"text", "hi"}})});
  EXPECT_EQ(assistant.role(), Role::Assistant);
  EXPECT_FALSE(assistant.content().has_value());
  EXPECT_EQ(assistant.text(), "");
  ASSERT_TRUE(assistant.has_tool_calls());
  EXPECT_EQ(assistant.tool_calls()[0].arguments["text"], "hi");

  auto result = Message::tool_result("c1", "{\"echo\":1}");
  EXPECT_EQ(result.role(), Role::Tool);
  ASSERT_TRUE(result.tool_call_id().has_value());
  EXPECT_EQ(*result.tool_call_id(), "c1");
}

TEST(MessageTest, JsonOmitsAbsentFields) {
  auto j = Message::user("hello").to_json();
  EXPECT_EQ(j["role"], "user");
  EXPECT_EQ(j["content"], "hello");
  EXPECT_FALSE(j.contains("tool_calls"));
  EXPECT_FALSE(j.contains("tool_call_id"));

  auto a = Message::assistant(std::nullopt, {call("c1", "read_file", {{"path", "a.txt"}})}).to_json();
  EXPECT_FALSE(a.contains("content"));
  ASSERT_EQ(a["tool_calls"].size(), 1u);
  EXPECT_EQ(a["tool_calls"][0]["id"], "c1");
  EXPECT_EQ(a["tool_calls"][0]["name"], "read_file");
  EXPECT_EQ(a["tool_calls"][0]["arguments"]["path"], "a.txt");
}

TEST(MessageTest, FromJsonRestoresMessage) {
  auto original = Message::assistant("thinking", {call("c9", "echo", {{"text", "x"}})});
  auto restored = Message::from_json(original.to_json());
  EXPECT_EQ(restored, original);

  auto tool = Message::tool_result("c9", "done");
  EXPECT_EQ(Message::from_json(tool.to_json()), tool);
}

TEST(MessageTest, FromJsonRejectsBadEntries) {
  EXPECT_THROW(Message::from_json(json::array()), ProtocolError);
  EXPECT_THROW(Message::from_json(json{{"role", "narrator"}, {"content", "x"}}), ProtocolError);
  EXPECT_THROW(Message::from_json(json{{"role", "tool"}, {"content", "x"}}), ProtocolError);
}

TEST(MessageTest, RoleStrings) {
  EXPECT_EQ(to_string(Role::Assistant), "assistant");
  EXPECT_EQ(role_from_string("tool"), Role::Tool);
  EXPECT_FALSE(role_from_string("bot").has_value());
}

TEST(ConversationTest, NewConversationHasSessionId) {
  Conversation a;
  Conversation b;
  EXPECT_FALSE(a.session_id().empty());
  EXPECT_NE(a.session_id(), b.session_id());
  EXPECT_TRUE(a.empty());
  EXPECT_EQ(a.turn_count(), 0);

  Conversation named("work");
  EXPECT_EQ(named.session_id(), "work");
}

TEST(ConversationTest, ToolResultMustAnswerIssuedCall) {
  Conversation conv("s");
  conv.append(Message::user("read it"));

  EXPECT_THROW(conv.append(Message::tool_result("c1", "orphan")), ProtocolError);
  EXPECT_EQ(conv.size(), 1u);

  conv.append(Message::assistant(std::nullopt, {call("c1", "read_file")}));
  conv.append(Message::tool_result("c1", "contents"));
  EXPECT_EQ(conv.size(), 3u);

  // Each call is answered once
  EXPECT_THROW(conv.append(Message::tool_result("c1", "again")), ProtocolError);
  EXPECT_EQ(conv.size(), 3u);
}

TEST(ConversationTest, ToolCallIdsNeverRepeat) {
  Conversation conv("s");
  conv.append(Message::assistant(std::nullopt, {call("c1", "echo")}));
  conv.append(Message::tool_result("c1", "ok"));

  EXPECT_THROW(conv.append(Message::assistant(std::nullopt, {call("c1", "echo")})), ProtocolError);
  EXPECT_THROW(conv.append(Message::assistant(std::nullopt, {call("c2", "echo"), call("c2", "echo")})),
               ProtocolError);
  EXPECT_THROW(conv.append(Message::assistant(std::nullopt, {call("", "echo")})), ProtocolError);
  EXPECT_EQ(conv.size(), 2u);
}

TEST(ConversationTest, AppendAllIsAtomic) {
  Conversation conv("s");
  conv.append(Message::assistant(std::nullopt, {call("c1", "echo"), call("c2", "echo")}));

  std::vector<Message> bad{Message::tool_result("c1", "one"), Message::tool_result("c3", "unknown")};
  EXPECT_THROW(conv.append_all(bad), ProtocolError);
  EXPECT_EQ(conv.size(), 1u);
  EXPECT_EQ(conv.pending_tool_calls().size(), 2u);

  conv.append_all({Message::tool_result("c1", "one"), Message::tool_result("c2", "two")});
  EXPECT_EQ(conv.size(), 3u);
  EXPECT_TRUE(conv.pending_tool_calls().empty());
}

TEST(ConversationTest, PendingToolCallsInIssueOrder) {
  Conversation conv("s");
  conv.append(Message::assistant(std::nullopt, {call("a", "echo"), call("b", "read_file")}));
  conv.append(Message::tool_result("a", "done"));

  auto pending = conv.pending_tool_calls();
  ASSERT_EQ(pending.size(), 1u);
  EXPECT_EQ(pending[0].id, "b");
}

TEST(ConversationTest, JsonRoundTripKeepsTurnsAndMessages) {
  Conversation conv("round");
  conv.append(Message::system("sys"));
  conv.append(Message::user("hi"));
  conv.append(Message::assistant(std::nullopt, {call("c1", "echo", {{"text", "hi"}})}));
  conv.append(Message::tool_result("c1", "{\"echo\":{\"text\":\"hi\"}}"));
  conv.record_turn();
  conv.append(Message::assistant("hi back"));
  conv.record_turn();

  auto j = conv.to_json();
  EXPECT_EQ(j["session_id"], "round");
  EXPECT_EQ(j["turn_count"], 2);

  auto restored = Conversation::from_json(j);
  EXPECT_EQ(restored.session_id(), "round");
  EXPECT_EQ(restored.turn_count(), 2);
  EXPECT_EQ(restored.messages(), conv.messages());
  EXPECT_EQ(restored.to_json().dump(2), j.dump(2));
}

TEST(ConversationTest, FromJsonRejectsBrokenPairing) {
  json doc = {{"session_id", "bad"},
              {"messages", json::array({{{"role", "user"}, {"content", "hi"}},
                                        {{"role", "tool"}, {"content", "x"}, {"tool_call_id", "nope"}}})}};
  EXPECT_THROW(Conversation::from_json(doc), ProtocolError);
  EXPECT_THROW(Conversation::from_json(json{{"session_id", "x"}}), ProtocolError);
}

TEST(Utf8Test, SanitizeReplacesInvalidBytes) {
  EXPECT_EQ(sanitize_utf8("plain h\xC3\xA9llo \xF0\x9F\x98\x80"), "plain h\xC3\xA9llo \xF0\x9F\x98\x80");
  EXPECT_EQ(sanitize_utf8("a\xFF" "b"), "a\xEF\xBF\xBD" "b");
  // Truncated sequence at the end
  EXPECT_EQ(sanitize_utf8("x\xE2\x82"), "x\xEF\xBF\xBD\xEF\xBF\xBD");
  // Encoded surrogate
  EXPECT_EQ(sanitize_utf8("\xED\xA0\x80"), "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
}
