#pragma once

#include <filesystem>
#include <string>

#include "core/conversation.hpp"

namespace convo {

enum class ExportFormat { Markdown, Json, Html, Text };

// By extension: .json, .html/.htm, anything else is Markdown
ExportFormat export_format_for(const std::filesystem::path &path);

// Text is the "role: content" listing printed by --show-session
std::string render_conversation(const Conversation &conversation, ExportFormat format);

// Atomic write of the rendered conversation. Throws SessionIOError.
void export_conversation(const Conversation &conversation, const std::filesystem::path &path);

std::string html_escape(const std::string &text);

}  // namespace convo
