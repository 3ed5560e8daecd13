#include <spdlog/spdlog.h>

#include <fstream>

#include "builtins.hpp"

namespace convo::tools {

WriteFileTool::WriteFileTool()
    : SimpleTool("write_file", "Write text to a file, creating parent directories as needed. Overwrites by default.",
                 false) {}

std::vector<ParameterSchema> WriteFileTool::parameters() const {
  return {{"path", "string", "Path of the file, absolute or relative to the working directory", true, std::nullopt,
           std::nullopt},
          {"content", "string", "Text to write", true, std::nullopt, std::nullopt},
          {"append", "boolean", "Append instead of overwriting", false, json(false), std::nullopt}};
}

std::future<ToolResult> WriteFileTool::execute(const json& args, const ToolContext& ctx) {
  return std::async(std::launch::async, [args, ctx]() -> ToolResult {
    std::string path_arg = args.value("path", "");
    std::string content = args.value("content", "");
    bool append = args.value("append", false);

    if (path_arg.empty()) {
      return ToolResult::error("path is required");
    }
    if (ctx.abort_signal && ctx.abort_signal->load()) {
      return ToolResult::error("Cancelled");
    }

    auto path = resolve_path(path_arg, ctx);
    spdlog::info("[WriteFileTool] {} {} bytes to {}", append ? "Appending" : "Writing", content.size(), path.string());

    std::error_code ec;
    if (path.has_parent_path()) {
      std::filesystem::create_directories(path.parent_path(), ec);
      if (ec) {
        return ToolResult::error("failed to create " + path.parent_path().string() + ": " + ec.message());
      }
    }

    std::ofstream file(path, std::ios::binary | (append ? std::ios::app : std::ios::trunc));
    if (!file.is_open()) {
      return ToolResult::error("failed to open " + path.string() + " for writing");
    }
    file << content;
    file.close();
    if (!file) {
      return ToolResult::error("failed to write " + path.string());
    }

    json result;
    result["path"] = path_arg;
    result["bytes_written"] = content.size();
    result["appended"] = append;
    return ToolResult::success(result.dump());
  });
}

}  // namespace convo::tools
