#include <spdlog/spdlog.h>

#include <fstream>

#include "builtins.hpp"

namespace convo::tools {

ReadFileTool::ReadFileTool()
    : SimpleTool("read_file", "Read a UTF-8 text file from the local filesystem. Returns the content, the bytes read and "
                              "whether the content was cut at max_bytes.",
                 true) {}

std::vector<ParameterSchema> ReadFileTool::parameters() const {
  return {{"path", "string", "Path of the file, absolute or relative to the working directory", true, std::nullopt,
           std::nullopt},
          {"max_bytes", "integer", "Maximum number of bytes to read", false, json(DEFAULT_MAX_BYTES), std::nullopt}};
}

std::future<ToolResult> ReadFileTool::execute(const json& args, const ToolContext& ctx) {
  return std::async(std::launch::async, [args, ctx]() -> ToolResult {
    std::string path_arg = args.value("path", "");
    int64_t max_bytes = args.value("max_bytes", DEFAULT_MAX_BYTES);

    if (path_arg.empty()) {
      return ToolResult::error("path is required");
    }
    if (max_bytes <= 0) {
      return ToolResult::error("max_bytes must be positive");
    }

    auto path = resolve_path(path_arg, ctx);
    spdlog::debug("[ReadFileTool] Reading {} (max {} bytes)", path.string(), max_bytes);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
      return ToolResult::error("not a readable file: " + path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
      return ToolResult::error("failed to open " + path.string());
    }

    std::string content(static_cast<size_t>(max_bytes), '\0');
    file.read(content.data(), max_bytes);
    content.resize(static_cast<size_t>(file.gcount()));

    // One more byte tells whether the file was longer
    bool truncated = file.peek() != std::char_traits<char>::eof();

    json result;
    result["path"] = path_arg;
    result["bytes"] = content.size();
    result["truncated"] = truncated;
    result["content"] = sanitize_utf8(content);
    return ToolResult::success(result.dump());
  });
}

}  // namespace convo::tools
