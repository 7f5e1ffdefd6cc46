#pragma once

#include <filesystem>
#include <string>

namespace docsync::util {

// XDG Base Directory Specification utilities
class Xdg {
 public:
  // Get XDG data home directory (~/.local/share/docsync)
  static std::filesystem::path dataHome();

  // Get XDG config home directory (~/.config/docsync)
  static std::filesystem::path configHome();

  // Get config file path
  static std::filesystem::path configFile();

  // Get log directory
  static std::filesystem::path logDir();

  // Per-workspace sync lock files
  static std::filesystem::path lockDir();

 private:
  // Get environment variable with default
  static std::string getEnvVar(const std::string& name, const std::string& default_value);
};

}  // namespace docsync::util
