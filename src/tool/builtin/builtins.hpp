#pragma once

#include "tool/tool.hpp"

namespace convo::tools {

// read_file - read a text file, optionally capped
class ReadFileTool : public SimpleTool {
 public:
  ReadFileTool();

  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json& args, const ToolContext& ctx) override;

  static constexpr int64_t DEFAULT_MAX_BYTES = 65536;
};

// echo - return the arguments unchanged
class EchoTool : public SimpleTool {
 public:
  EchoTool();

  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json& args, const ToolContext& ctx) override;
};

// write_file - create, overwrite or append to a file
class WriteFileTool : public SimpleTool {
 public:
  WriteFileTool();

  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json& args, const ToolContext& ctx) override;
};

// Resolve a tool path argument against the context working directory
std::filesystem::path resolve_path(const std::string& path, const ToolContext& ctx);

// Register all builtin tools
void register_builtins(ToolRegistry& registry);

}  // namespace convo::tools
