#include "docsync/util/logging.hpp"

#include <algorithm>
#include <atomic>
#include <memory>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "docsync/util/xdg.hpp"

namespace docsync::util {

namespace {

constexpr const char* kLoggerName = "docsync";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";

std::atomic<bool> g_initialized{false};

}  // namespace

void Logging::initialize(const LoggingOptions& options) {
  auto level = spdlog::level::from_str(options.level);

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_sink->set_level(options.console_verbose ? spdlog::level::debug : spdlog::level::warn);

  std::vector<spdlog::sink_ptr> sinks = {console_sink};

  if (options.file_enabled) {
    auto log_file = options.file.empty() ? Xdg::logDir() / "docsync.log" : options.file;
    try {
      std::filesystem::create_directories(log_file.parent_path());
      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          log_file.string(), 1024 * 1024 * 5, 3);  // 5MB files, 3 backups
      file_sink->set_level(level);
      sinks.push_back(file_sink);
    } catch (const std::exception& e) {
      // Fallback to console-only logging if file setup fails
      console_sink->set_level(spdlog::level::warn);
      auto logger = std::make_shared<spdlog::logger>(kLoggerName, console_sink);
      logger->set_pattern(kPattern);
      spdlog::set_default_logger(logger);
      spdlog::warn("Failed to setup file logging: {}", e.what());
      g_initialized.store(true);
      return;
    }
  }

  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(kPattern);
  logger->set_level(options.console_verbose ? std::min(level, spdlog::level::debug) : level);
  logger->flush_on(spdlog::level::warn);

  spdlog::set_default_logger(logger);
  g_initialized.store(true);
}

void Logging::initializeConsoleOnly() {
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_sink->set_level(spdlog::level::warn);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, console_sink);
  logger->set_pattern(kPattern);
  logger->set_level(spdlog::level::warn);
  spdlog::set_default_logger(logger);
  g_initialized.store(true);
}

bool Logging::isInitialized() {
  return g_initialized.load();
}

}  // namespace docsync::util
