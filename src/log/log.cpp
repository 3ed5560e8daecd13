#include "log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

#include "core/config.hpp"

namespace convo {

namespace {

namespace fs = std::filesystem;

fs::path numbered(const fs::path& log_file, size_t index) {
  return log_file.parent_path() / (log_file.stem().string() + "." + std::to_string(index) + log_file.extension().string());
}

// convo.log -> convo.0.log -> ... -> convo.{max_files-1}.log, oldest removed
void rotate_logs_on_startup(const fs::path& log_file, size_t max_files) {
  std::error_code ec;
  fs::create_directories(log_file.parent_path(), ec);
  if (ec) {
    std::cerr << "Failed to create log directory: " << ec.message() << "\n";
    return;
  }

  if (!fs::exists(log_file) || max_files == 0) {
    return;
  }

  fs::path oldest = numbered(log_file, max_files - 1);
  if (fs::exists(oldest)) {
    fs::remove(oldest, ec);
  }

  for (int i = static_cast<int>(max_files) - 2; i >= 0; --i) {
    fs::path old_name = numbered(log_file, static_cast<size_t>(i));
    if (fs::exists(old_name)) {
      fs::rename(old_name, numbered(log_file, static_cast<size_t>(i) + 1), ec);
    }
  }

  fs::rename(log_file, numbered(log_file, 0), ec);
}

}  // namespace

void init_log(const std::string& log_path, size_t max_files, const std::string& level) {
  try {
    fs::path actual_path = log_path.empty() ? config_paths::default_log_file() : fs::path(log_path);

    rotate_logs_on_startup(actual_path, max_files);

    // Fresh file on every start
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true);
    auto logger = std::make_shared<spdlog::logger>("convo", file_sink);

    logger->set_level(spdlog::level::from_str(level));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
    logger->flush_on(spdlog::level::trace);

    spdlog::drop("convo");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::info("=== convo started (log: {}) ===", actual_path.string());
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

}  // namespace convo
