#include "session/export.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

#include "core/error.hpp"
#include "session/session_store.hpp"

namespace convo {

namespace fs = std::filesystem;

namespace {

// "tool (call_1)" for results, the plain role otherwise
std::string heading(const Message &msg) {
  if (msg.role() == Role::Tool) {
    return "tool (" + msg.tool_call_id().value_or("") + ")";
  }
  return to_string(msg.role());
}

std::string call_line(const ToolCall &call) {
  return call.name + " " + call.arguments.dump() + " [" + call.id + "]";
}

std::string render_markdown(const Conversation &conversation) {
  std::string out = "# Session " + conversation.session_id() + "\n\n";
  for (const auto &msg : conversation.messages()) {
    out += "### " + heading(msg) + "\n\n";
    if (!msg.text().empty()) {
      out += msg.text() + "\n\n";
    }
    for (const auto &call : msg.tool_calls()) {
      out += "- tool call: `" + call_line(call) + "`\n";
    }
    if (msg.has_tool_calls()) {
      out += "\n";
    }
  }
  return out;
}

std::string render_html(const Conversation &conversation) {
  std::string out = "<html><head><meta charset=\"utf-8\"><title>convo " + html_escape(conversation.session_id()) +
                    "</title></head><body>\n";
  for (const auto &msg : conversation.messages()) {
    out += "<h3>" + html_escape(heading(msg)) + "</h3>\n";
    if (!msg.text().empty()) {
      out += "<pre>" + html_escape(msg.text()) + "</pre>\n";
    }
    for (const auto &call : msg.tool_calls()) {
      out += "<p>tool call: <code>" + html_escape(call_line(call)) + "</code></p>\n";
    }
  }
  out += "</body></html>\n";
  return out;
}

std::string render_text(const Conversation &conversation) {
  std::string out;
  for (const auto &msg : conversation.messages()) {
    if (!msg.text().empty() || !msg.has_tool_calls()) {
      out += heading(msg) + ": " + msg.text() + "\n";
    }
    for (const auto &call : msg.tool_calls()) {
      out += heading(msg) + ": -> " + call_line(call) + "\n";
    }
  }
  return out;
}

}  // namespace

ExportFormat export_format_for(const fs::path &path) {
  auto ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
  if (ext == ".json") return ExportFormat::Json;
  if (ext == ".html" || ext == ".htm") return ExportFormat::Html;
  return ExportFormat::Markdown;
}

std::string render_conversation(const Conversation &conversation, ExportFormat format) {
  switch (format) {
    case ExportFormat::Json:
      return conversation.to_json().dump(2) + "\n";
    case ExportFormat::Html:
      return render_html(conversation);
    case ExportFormat::Text:
      return render_text(conversation);
    case ExportFormat::Markdown:
      break;
  }
  return render_markdown(conversation);
}

void export_conversation(const Conversation &conversation, const fs::path &path) {
  if (path.empty()) {
    throw SessionIOError("export path is empty");
  }
  if (path.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      throw SessionIOError("cannot create directory " + path.parent_path().string() + ": " + ec.message());
    }
  }

  SessionStore::atomic_write(path, render_conversation(conversation, export_format_for(path)));
  spdlog::info("[Export] Wrote '{}' ({} messages) to {}", conversation.session_id(), conversation.size(),
               path.string());
}

std::string html_escape(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      case '\'':
        out += "&#39;";
        break;
      default:
        out.push_back(c);
    }
  }
  return out;
}

}  // namespace convo
