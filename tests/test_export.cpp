#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "core/error.hpp"
#include "core/uuid.hpp"
#include "session/export.hpp"

using namespace convo;
namespace fs = std::filesystem;

namespace {

Conversation sample() {
  Conversation conv("notes");
  conv.append(Message::system("be brief"));
  conv.append(Message::user("read <a.txt> & summarize"));
  conv.append(Message::assistant(std::nullopt, {ToolCall{"c1", "read_file", {{"path", "a.txt"}}}}));
  conv.append(Message::tool_result("c1", "{\"content\":\"hi\"}"));
  conv.append(Message::assistant("It says \"hi\"."));
  return conv;
}

std::string file_contents(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  std::ostringstream content;
  content << in.rdbuf();
  return content.str();
}

}  // namespace

TEST(ExportTest, FormatFromExtension) {
  EXPECT_EQ(export_format_for("out.json"), ExportFormat::Json);
  EXPECT_EQ(export_format_for("out.HTML"), ExportFormat::Html);
  EXPECT_EQ(export_format_for("dir/out.htm"), ExportFormat::Html);
  EXPECT_EQ(export_format_for("out.md"), ExportFormat::Markdown);
  EXPECT_EQ(export_format_for("out"), ExportFormat::Markdown);
}

TEST(ExportTest, Markdown) {
  auto md = render_conversation(sample(), ExportFormat::Markdown);

  EXPECT_EQ(md.rfind("# Session notes\n\n### system\n\nbe brief\n\n### user\n\n", 0), 0u);
  EXPECT_NE(md.find("### assistant\n\n- tool call: `read_file {\"path\":\"a.txt\"} [c1]`\n"), std::string::npos);
  EXPECT_NE(md.find("### tool (c1)\n\n{\"content\":\"hi\"}\n\n"), std::string::npos);
  EXPECT_NE(md.find("### assistant\n\nIt says \"hi\".\n\n"), std::string::npos);
}

TEST(ExportTest, HtmlIsEscaped) {
  auto html = render_conversation(sample(), ExportFormat::Html);

  EXPECT_EQ(html.rfind("<html><head><meta charset=\"utf-8\">", 0), 0u);
  EXPECT_NE(html.find("<pre>read &lt;a.txt&gt; &amp; summarize</pre>"), std::string::npos);
  EXPECT_NE(html.find("<pre>It says &quot;hi&quot;.</pre>"), std::string::npos);
  EXPECT_EQ(html.find("<a.txt>"), std::string::npos);
  EXPECT_NE(html.find("</body></html>\n"), std::string::npos);

  EXPECT_EQ(html_escape("a'b"), "a&#39;b");
}

TEST(ExportTest, JsonMatchesSessionDocument) {
  auto conv = sample();
  auto text = render_conversation(conv, ExportFormat::Json);

  EXPECT_EQ(json::parse(text), conv.to_json());
}

TEST(ExportTest, TextListing) {
  auto text = render_conversation(sample(), ExportFormat::Text);

  EXPECT_EQ(text,
            "system: be brief\n"
            "user: read <a.txt> & summarize\n"
            "assistant: -> read_file {\"path\":\"a.txt\"} [c1]\n"
            "tool (c1): {\"content\":\"hi\"}\n"
            "assistant: It says \"hi\".\n");
}

class ExportFileTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = fs::temp_directory_path() / ("convo_export_" + UUID::generate());
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(test_dir_, ec);
  }

  fs::path test_dir_;
};

TEST_F(ExportFileTest, WritesByExtension) {
  auto conv = sample();

  export_conversation(conv, test_dir_ / "out" / "chat.html");
  export_conversation(conv, test_dir_ / "chat.json");
  export_conversation(conv, test_dir_ / "chat.md");

  EXPECT_EQ(file_contents(test_dir_ / "out" / "chat.html"), render_conversation(conv, ExportFormat::Html));
  EXPECT_EQ(json::parse(file_contents(test_dir_ / "chat.json")), conv.to_json());
  EXPECT_EQ(file_contents(test_dir_ / "chat.md"), render_conversation(conv, ExportFormat::Markdown));
  EXPECT_FALSE(fs::exists(test_dir_ / "chat.md.tmp"));
}

TEST_F(ExportFileTest, UnwritablePath) {
  fs::create_directories(test_dir_);
  std::ofstream(test_dir_ / "file") << "x";

  EXPECT_THROW(export_conversation(sample(), test_dir_ / "file" / "chat.md"), SessionIOError);
  EXPECT_THROW(export_conversation(sample(), ""), SessionIOError);
}
