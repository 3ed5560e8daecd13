#include "builtins.hpp"

#include <spdlog/spdlog.h>

#include "core/error.hpp"

namespace convo::tools {

EchoTool::EchoTool() : SimpleTool("echo", "Echo the given arguments back. Useful for testing tool calling.", true) {}

std::vector<ParameterSchema> EchoTool::parameters() const {
  return {{"text", "string", "Text to echo back", true, std::nullopt, std::nullopt}};
}

std::future<ToolResult> EchoTool::execute(const json& args, const ToolContext&) {
  std::promise<ToolResult> promise;
  promise.set_value(ToolResult::success(json{{"echo", args}}.dump()));
  return promise.get_future();
}

std::filesystem::path resolve_path(const std::string& path, const ToolContext& ctx) {
  std::filesystem::path p(path);
  if (p.is_relative() && !ctx.working_dir.empty()) {
    p = ctx.working_dir / p;
  }
  return p.lexically_normal();
}

void register_builtins(ToolRegistry& registry) {
  spdlog::debug("[ToolRegistry] Initializing built-in tools");
  registry.register_tool(std::make_shared<ReadFileTool>());
  registry.register_tool(std::make_shared<EchoTool>());
  registry.register_tool(std::make_shared<WriteFileTool>());
}

}  // namespace convo::tools
