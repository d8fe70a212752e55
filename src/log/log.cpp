#include "claire/log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

#include "claire/core/config.hpp"

namespace claire {

namespace {

// Rotate on every startup: <stem>.log -> <stem>.0.log -> ... -> <stem>.{max_files-1}.log
void rotate_logs_on_startup(const std::filesystem::path& current_log, size_t max_files) {
  namespace fs = std::filesystem;

  if (!fs::exists(current_log) || max_files == 0) {
    return;
  }

  std::error_code ec;
  auto dir = current_log.parent_path();
  auto stem = current_log.stem().string();
  auto rotated = [&](size_t index) {
    return dir / (stem + "." + std::to_string(index) + ".log");
  };

  fs::remove(rotated(max_files - 1), ec);

  for (int i = static_cast<int>(max_files) - 2; i >= 0; --i) {
    auto from = rotated(static_cast<size_t>(i));
    if (fs::exists(from)) {
      fs::rename(from, rotated(static_cast<size_t>(i) + 1), ec);
    }
  }

  fs::rename(current_log, rotated(0), ec);
  if (ec) {
    std::cerr << "Failed to rotate log " << current_log.string() << ": " << ec.message() << "\n";
  }
}

spdlog::level::level_enum parse_level(const std::string& level) {
  if (level == "trace") return spdlog::level::trace;
  if (level == "debug") return spdlog::level::debug;
  if (level == "warn") return spdlog::level::warn;
  if (level == "err") return spdlog::level::err;
  if (level == "critical") return spdlog::level::critical;
  if (level == "off") return spdlog::level::off;
  return spdlog::level::info;
}

}  // namespace

void init_log(const std::string& log_path, size_t max_files, const std::string& level) {
  try {
    namespace fs = std::filesystem;

    fs::path actual_path = log_path.empty() ? config_paths::config_dir() / "log" / "claire.log" : fs::path(log_path);

    std::error_code ec;
    if (actual_path.has_parent_path()) {
      fs::create_directories(actual_path.parent_path(), ec);
      if (ec) {
        std::cerr << "Failed to create log directory: " << ec.message() << "\n";
        return;
      }
    }

    rotate_logs_on_startup(actual_path, max_files);

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true);
    auto logger = std::make_shared<spdlog::logger>("claire", file_sink);

    logger->set_level(parse_level(level));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
    logger->flush_on(spdlog::level::trace);

    spdlog::drop("claire");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::info("=== claire started (log: {}) ===", actual_path.string());
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

std::shared_ptr<spdlog::logger> get_logger() {
  return spdlog::default_logger();
}

}  // namespace claire
