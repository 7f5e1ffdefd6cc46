#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "docsync/common.hpp"

namespace docsync::config {

// Configuration for docsync
class Config {
 public:
  // Defaults only; call load() to read a file
  Config();

  // Workspace containing the artifact; empty means current directory
  std::filesystem::path workspace;
  std::string artifact_name = "copilot-instructions.md";
  std::string artifact_dir = ".github";

  // Remote replica configuration
  struct RemoteConfig {
    std::string token;               // Can be "env:VARNAME" reference
    std::string id;                  // Empty until the first upload
    std::string api_url = "https://api.github.com";
    int timeout_seconds = 30;
  };
  RemoteConfig remote;

  // Reconciliation and trigger configuration
  struct SyncConfig {
    bool auto_exclude = true;             // Add artifact path to .gitignore
    bool auto_check_on_start = true;      // Run a pass shortly after start
    bool interval_enabled = true;         // Periodic passes
    int interval_minutes = 30;            // 1..1440
    bool change_enabled = true;           // Passes on local file changes
    bool notifications_enabled = false;   // One-line notice after actions
    int debounce_ms = 2000;
    int startup_delay_ms = 2000;
  };
  SyncConfig sync;

  struct LoggingConfig {
    std::string level = "info";
    std::string file;
  };
  LoggingConfig logging;

  // Load configuration from file
  Result<void> load(const std::filesystem::path& config_path);

  // Save configuration to file
  Result<void> save(const std::filesystem::path& config_path = {}) const;

  // Get/set configuration values using dot notation
  Result<std::string> get(const std::string& key) const;
  Result<void> set(const std::string& key, const std::string& value);

  // All known keys with their current values, in file order
  std::vector<std::pair<std::string, std::string>> list() const;

  // Validate configuration
  Result<void> validate() const;

  // Path this configuration was loaded from or will be saved to
  const std::filesystem::path& configPath() const { return config_path_; }
  void setConfigPath(std::filesystem::path path) { config_path_ = std::move(path); }

  // Workspace with the current directory substituted when unset
  std::filesystem::path resolvedWorkspace() const;

  // Remote token after env: resolution
  std::string resolvedToken() const;

  // Get default configuration file path
  static std::filesystem::path defaultConfigPath();

  // Environment variable resolution
  static std::string resolveEnvVar(const std::string& value);

  static const std::vector<std::string>& knownKeys();

 private:
  std::filesystem::path config_path_;

  // Dot notation helpers
  Result<std::string> getValueByPath(const std::vector<std::string>& path) const;
  Result<void> setValueByPath(const std::vector<std::string>& path, const std::string& value);

  static std::vector<std::string> splitPath(const std::string& path);
};

}  // namespace docsync::config
