#pragma once

#include <filesystem>
#include <string>

namespace docsync::util {

struct LoggingOptions {
  std::string level = "info";          // trace, debug, info, warn, error, critical, off
  std::filesystem::path file;          // empty: Xdg::logDir() / "docsync.log"
  bool console_verbose = false;        // console sink at debug instead of warn
  bool file_enabled = true;
};

// Process-wide spdlog setup: rotating file sink plus a stderr sink for warnings
class Logging {
 public:
  static void initialize(const LoggingOptions& options);

  // Console-only logging at warn level; used before config is loaded and in tests
  static void initializeConsoleOnly();

  static bool isInitialized();
};

}  // namespace docsync::util
