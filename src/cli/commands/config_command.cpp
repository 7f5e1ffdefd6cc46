#include "docsync/cli/commands/config_command.hpp"

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>

#include <nlohmann/json.hpp>

#include "docsync/cli/command_output.hpp"

namespace docsync::cli {

ConfigCommand::ConfigCommand(Application& app) : app_(app) {}

void ConfigCommand::setupCommand(CLI::App* cmd) {
  cmd->alias("configure");

  auto get_cmd = cmd->add_subcommand("get", "Get configuration value");
  get_cmd->add_option("key", key_, "Configuration key (dot notation)")->required();
  get_cmd->callback([this]() { mode_ = Mode::kGet; });

  auto set_cmd = cmd->add_subcommand("set", "Set configuration value");
  set_cmd->add_option("key", key_, "Configuration key (dot notation)")->required();
  set_cmd->add_option("value", value_, "Configuration value")->required();
  set_cmd->callback([this]() { mode_ = Mode::kSet; });

  auto list_cmd = cmd->add_subcommand("list", "List all configuration settings");
  list_cmd->callback([this]() { mode_ = Mode::kList; });

  auto path_cmd = cmd->add_subcommand("path", "Show configuration file path");
  path_cmd->callback([this]() { mode_ = Mode::kPath; });

  auto validate_cmd = cmd->add_subcommand("validate", "Validate current configuration");
  validate_cmd->callback([this]() { mode_ = Mode::kValidate; });

  auto reset_cmd = cmd->add_subcommand("reset", "Reset configuration key to default value");
  reset_cmd->add_option("key", key_, "Configuration key to reset")->required();
  reset_cmd->callback([this]() { mode_ = Mode::kReset; });

  cmd->require_subcommand(1);
}

Result<int> ConfigCommand::execute(const GlobalOptions& options) {
  switch (mode_) {
    case Mode::kGet:      return executeGet(options);
    case Mode::kSet:      return executeSet(options);
    case Mode::kList:     return executeList(options);
    case Mode::kPath:     return executePath(options);
    case Mode::kValidate: return executeValidate(options);
    case Mode::kReset:    return executeReset(options);
    case Mode::kNone:     break;
  }
  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "No subcommand specified"));
}

std::string ConfigCommand::maskSecret(const std::string& key, const std::string& value) {
  if (key != "remote.token" || value.empty() || value.rfind("env:", 0) == 0) {
    return value;
  }
  if (value.size() <= 4) {
    return "****";
  }
  return value.substr(0, 4) + "****";
}

Result<int> ConfigCommand::executeGet(const GlobalOptions& options) {
  if (!isValidConfigKey(key_)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Invalid configuration key: " + key_));
  }

  std::string value;
  {
    std::lock_guard<std::mutex> lock(app_.configMutex());
    auto result = app_.config().get(key_);
    if (!result.has_value()) {
      return std::unexpected(result.error());
    }
    value = *result;
  }

  if (options.json) {
    nlohmann::json output;
    output["key"] = key_;
    output["value"] = value;
    std::cout << output.dump(2) << "\n";
  } else {
    std::cout << value << "\n";
  }
  return 0;
}

Result<void> ConfigCommand::applyAndSave(const std::string& key, const std::string& value) {
  std::lock_guard<std::mutex> lock(app_.configMutex());
  auto& live = app_.config();

  config::Config updated = live;
  auto set_result = updated.set(key, value);
  if (!set_result.has_value()) {
    return set_result;
  }
  auto valid = updated.validate();
  if (!valid.has_value()) {
    return valid;
  }
  auto saved = updated.save(updated.configPath());
  if (!saved.has_value()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Failed to save configuration: " + saved.error().message()));
  }

  live = std::move(updated);
  return {};
}

Result<int> ConfigCommand::executeSet(const GlobalOptions& options) {
  if (!isValidConfigKey(key_)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Invalid configuration key: " + key_));
  }

  auto result = applyAndSave(key_, value_);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  CommandOutput output(options);
  if (options.json) {
    output.printJson({{"success", true},
                      {"key", key_},
                      {"value", maskSecret(key_, value_)}});
  } else {
    output.displaySuccess("Configuration updated: " + key_ + " = " + maskSecret(key_, value_));
  }
  return 0;
}

Result<int> ConfigCommand::executeList(const GlobalOptions& options) {
  std::vector<std::pair<std::string, std::string>> entries;
  {
    std::lock_guard<std::mutex> lock(app_.configMutex());
    entries = app_.config().list();
  }

  if (options.json) {
    nlohmann::json output = nlohmann::json::object();
    for (const auto& [key, value] : entries) {
      output[key] = maskSecret(key, value);
    }
    std::cout << output.dump(2) << "\n";
    return 0;
  }

  std::string section;
  for (const auto& [key, value] : entries) {
    auto dot = key.find('.');
    std::string group = dot == std::string::npos ? "general" : key.substr(0, dot);
    if (group != section) {
      if (!section.empty()) {
        std::cout << "\n";
      }
      std::cout << "[" << group << "]\n";
      section = group;
    }
    std::cout << "  " << std::setw(28) << std::left << key << " = " << maskSecret(key, value) << "\n";
  }
  return 0;
}

Result<int> ConfigCommand::executePath(const GlobalOptions& options) {
  std::filesystem::path config_path;
  {
    std::lock_guard<std::mutex> lock(app_.configMutex());
    config_path = app_.config().configPath();
  }
  std::error_code ec;
  bool exists = std::filesystem::exists(config_path, ec);

  if (options.json) {
    nlohmann::json output;
    output["config_path"] = config_path.string();
    output["exists"] = exists;
    std::cout << output.dump(2) << "\n";
  } else {
    std::cout << "Configuration file: " << config_path.string() << "\n";
    if (exists) {
      std::cout << "Status: file exists\n";
    } else {
      std::cout << "Status: file not found (using defaults)\n";
    }
  }
  return 0;
}

Result<int> ConfigCommand::executeValidate(const GlobalOptions& options) {
  Result<void> result;
  {
    std::lock_guard<std::mutex> lock(app_.configMutex());
    result = app_.config().validate();
  }

  CommandOutput output(options);
  if (options.json) {
    nlohmann::json json;
    json["valid"] = result.has_value();
    if (!result.has_value()) {
      json["error"] = result.error().message();
    }
    output.printJson(json);
  } else if (result.has_value()) {
    output.displaySuccess("Configuration is valid");
  } else {
    std::cerr << "Configuration validation failed: " << result.error().message() << "\n";
  }
  return result.has_value() ? 0 : 1;
}

Result<int> ConfigCommand::executeReset(const GlobalOptions& options) {
  if (!isValidConfigKey(key_)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Invalid configuration key: " + key_));
  }

  const config::Config defaults;
  auto default_value = defaults.get(key_);
  if (!default_value.has_value()) {
    return std::unexpected(default_value.error());
  }

  auto result = applyAndSave(key_, *default_value);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  CommandOutput output(options);
  if (options.json) {
    output.printJson({{"success", true}, {"key", key_}, {"default_value", *default_value}});
  } else {
    output.displaySuccess("Reset " + key_ + " to default: " + *default_value);
  }
  return 0;
}

bool ConfigCommand::isValidConfigKey(const std::string& key) const {
  const auto& keys = config::Config::knownKeys();
  return std::find(keys.begin(), keys.end(), key) != keys.end();
}

}  // namespace docsync::cli
