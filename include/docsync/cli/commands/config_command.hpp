#pragma once

#include <string>

#include "docsync/cli/application.hpp"
#include "docsync/common.hpp"

namespace docsync::cli {

/**
 * Command for managing configuration
 *
 * Subcommands:
 * - get <key>: Get configuration value
 * - set <key> <value>: Set configuration value
 * - list: List all configuration
 * - path: Show configuration file path
 * - validate: Validate current configuration
 * - reset <key>: Reset key to default value
 */
class ConfigCommand : public Command {
public:
  explicit ConfigCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return "config"; }
  std::string description() const override { return "Manage configuration settings"; }

  // Literal tokens are shown as their first four characters
  static std::string maskSecret(const std::string& key, const std::string& value);

private:
  enum class Mode { kNone, kGet, kSet, kList, kPath, kValidate, kReset };

  Result<int> executeGet(const GlobalOptions& options);
  Result<int> executeSet(const GlobalOptions& options);
  Result<int> executeList(const GlobalOptions& options);
  Result<int> executePath(const GlobalOptions& options);
  Result<int> executeValidate(const GlobalOptions& options);
  Result<int> executeReset(const GlobalOptions& options);

  // Applies `value` to `key`, validates and saves; the live config is untouched on failure
  Result<void> applyAndSave(const std::string& key, const std::string& value);

  bool isValidConfigKey(const std::string& key) const;

  Application& app_;
  Mode mode_ = Mode::kNone;
  std::string key_;
  std::string value_;
};

}  // namespace docsync::cli
