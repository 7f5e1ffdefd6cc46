#include "docsync/config/config.hpp"

#include <charconv>
#include <cstdlib>
#include <sstream>

#include <toml++/toml.hpp>

#include "docsync/util/filesystem.hpp"
#include "docsync/util/xdg.hpp"

namespace docsync::config {

namespace {

Result<int> parseInt(const std::string& key, const std::string& value) {
  int out = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
  if (ec != std::errc{} || ptr != value.data() + value.size()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Expected integer for " + key + ": " + value));
  }
  return out;
}

Result<bool> parseBool(const std::string& key, const std::string& value) {
  if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
  if (value == "false" || value == "0" || value == "no" || value == "off") return false;
  return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                   "Expected boolean for " + key + ": " + value));
}

std::string boolToString(bool value) {
  return value ? "true" : "false";
}

template <typename T>
void readValue(const toml::node_view<toml::node>& node, T& target) {
  if (auto value = node.value<T>()) {
    target = *value;
  }
}

}  // namespace

Config::Config() = default;

Result<void> Config::load(const std::filesystem::path& config_path) {
  config_path_ = config_path;

  if (!std::filesystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config file not found: " + config_path.string()));
  }

  try {
    auto config_data = toml::parse_file(config_path.string());

    if (auto value = config_data["workspace"].value<std::string>()) {
      workspace = *value;
    }
    readValue(config_data["artifact_name"], artifact_name);
    readValue(config_data["artifact_dir"], artifact_dir);

    if (auto remote_table = config_data["remote"].as_table()) {
      readValue((*remote_table)["token"], remote.token);
      readValue((*remote_table)["id"], remote.id);
      readValue((*remote_table)["api_url"], remote.api_url);
      readValue((*remote_table)["timeout_seconds"], remote.timeout_seconds);
    }

    if (auto sync_table = config_data["sync"].as_table()) {
      readValue((*sync_table)["auto_exclude"], sync.auto_exclude);
      readValue((*sync_table)["auto_check_on_start"], sync.auto_check_on_start);
      readValue((*sync_table)["interval_enabled"], sync.interval_enabled);
      readValue((*sync_table)["interval_minutes"], sync.interval_minutes);
      readValue((*sync_table)["change_enabled"], sync.change_enabled);
      readValue((*sync_table)["notifications_enabled"], sync.notifications_enabled);
      readValue((*sync_table)["debounce_ms"], sync.debounce_ms);
      readValue((*sync_table)["startup_delay_ms"], sync.startup_delay_ms);
    }

    if (auto logging_table = config_data["logging"].as_table()) {
      readValue((*logging_table)["level"], logging.level);
      readValue((*logging_table)["file"], logging.file);
    }

    return {};

  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Config parse error: " + std::string(e.description())));
  } catch (const std::exception& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config load error: " + std::string(e.what())));
  }
}

Result<void> Config::save(const std::filesystem::path& config_path) const {
  std::filesystem::path save_path = config_path.empty() ? config_path_ : config_path;

  if (save_path.empty()) {
    save_path = defaultConfigPath();
  }

  try {
    toml::table config_data;

    if (!workspace.empty()) config_data.insert_or_assign("workspace", workspace.string());
    config_data.insert_or_assign("artifact_name", artifact_name);
    config_data.insert_or_assign("artifact_dir", artifact_dir);

    auto remote_table = toml::table{};
    if (!remote.token.empty()) remote_table.insert_or_assign("token", remote.token);
    if (!remote.id.empty()) remote_table.insert_or_assign("id", remote.id);
    remote_table.insert_or_assign("api_url", remote.api_url);
    remote_table.insert_or_assign("timeout_seconds", remote.timeout_seconds);
    config_data.insert_or_assign("remote", remote_table);

    auto sync_table = toml::table{};
    sync_table.insert_or_assign("auto_exclude", sync.auto_exclude);
    sync_table.insert_or_assign("auto_check_on_start", sync.auto_check_on_start);
    sync_table.insert_or_assign("interval_enabled", sync.interval_enabled);
    sync_table.insert_or_assign("interval_minutes", sync.interval_minutes);
    sync_table.insert_or_assign("change_enabled", sync.change_enabled);
    sync_table.insert_or_assign("notifications_enabled", sync.notifications_enabled);
    sync_table.insert_or_assign("debounce_ms", sync.debounce_ms);
    sync_table.insert_or_assign("startup_delay_ms", sync.startup_delay_ms);
    config_data.insert_or_assign("sync", sync_table);

    auto logging_table = toml::table{};
    logging_table.insert_or_assign("level", logging.level);
    if (!logging.file.empty()) logging_table.insert_or_assign("file", logging.file);
    config_data.insert_or_assign("logging", logging_table);

    std::ostringstream oss;
    oss << config_data;

    auto write_result = util::FileSystem::writeFileAtomic(save_path, oss.str());
    if (!write_result.has_value()) {
      return std::unexpected(makeError(ErrorCode::kConfigError,
                                       "Cannot write config file: " + write_result.error().message()));
    }

    return {};

  } catch (const std::exception& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config save error: " + std::string(e.what())));
  }
}

Result<std::string> Config::get(const std::string& key) const {
  auto path = splitPath(key);
  return getValueByPath(path);
}

Result<void> Config::set(const std::string& key, const std::string& value) {
  auto path = splitPath(key);
  return setValueByPath(path, value);
}

const std::vector<std::string>& Config::knownKeys() {
  static const std::vector<std::string> kKeys = {
      "workspace",
      "artifact_name",
      "artifact_dir",
      "remote.token",
      "remote.id",
      "remote.api_url",
      "remote.timeout_seconds",
      "sync.auto_exclude",
      "sync.auto_check_on_start",
      "sync.interval_enabled",
      "sync.interval_minutes",
      "sync.change_enabled",
      "sync.notifications_enabled",
      "sync.debounce_ms",
      "sync.startup_delay_ms",
      "logging.level",
      "logging.file",
  };
  return kKeys;
}

std::vector<std::pair<std::string, std::string>> Config::list() const {
  std::vector<std::pair<std::string, std::string>> entries;
  for (const auto& key : knownKeys()) {
    auto value = get(key);
    entries.emplace_back(key, value.has_value() ? *value : std::string{});
  }
  return entries;
}

Result<void> Config::validate() const {
  if (artifact_name.empty()) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "artifact_name must not be empty"));
  }
  if (artifact_name.find('/') != std::string::npos) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "artifact_name must be a file name, not a path: " + artifact_name));
  }

  if (sync.interval_minutes < 1 || sync.interval_minutes > 1440) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "sync.interval_minutes must be between 1 and 1440"));
  }
  if (sync.debounce_ms < 0) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "sync.debounce_ms must not be negative"));
  }
  if (sync.startup_delay_ms < 0) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "sync.startup_delay_ms must not be negative"));
  }

  if (remote.timeout_seconds <= 0 || remote.timeout_seconds > 600) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "remote.timeout_seconds must be between 1 and 600"));
  }
  if (remote.api_url.empty()) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "remote.api_url must not be empty"));
  }

  static const std::vector<std::string> kLevels = {
      "trace", "debug", "info", "warn", "warning", "error", "critical", "off"};
  bool level_ok = false;
  for (const auto& level : kLevels) {
    if (logging.level == level) {
      level_ok = true;
      break;
    }
  }
  if (!level_ok) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "Invalid logging.level: " + logging.level));
  }

  return {};
}

std::filesystem::path Config::resolvedWorkspace() const {
  if (!workspace.empty()) {
    return workspace;
  }
  std::error_code ec;
  auto cwd = std::filesystem::current_path(ec);
  return ec ? std::filesystem::path(".") : cwd;
}

std::string Config::resolvedToken() const {
  return resolveEnvVar(remote.token);
}

std::filesystem::path Config::defaultConfigPath() {
  return util::Xdg::configFile();
}

std::string Config::resolveEnvVar(const std::string& value) {
  if (value.substr(0, 4) == "env:") {
    std::string var_name = value.substr(4);
    const char* env_value = std::getenv(var_name.c_str());
    return env_value ? std::string(env_value) : "";
  }
  return value;
}

Result<std::string> Config::getValueByPath(const std::vector<std::string>& path) const {
  if (path.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Empty config path"));
  }

  if (path.size() == 1) {
    const std::string& key = path[0];

    if (key == "workspace") return workspace.string();
    if (key == "artifact_name") return artifact_name;
    if (key == "artifact_dir") return artifact_dir;
  } else if (path.size() == 2) {
    const std::string& key = path[1];

    if (path[0] == "remote") {
      if (key == "token") return remote.token;
      if (key == "id") return remote.id;
      if (key == "api_url") return remote.api_url;
      if (key == "timeout_seconds") return std::to_string(remote.timeout_seconds);
    } else if (path[0] == "sync") {
      if (key == "auto_exclude") return boolToString(sync.auto_exclude);
      if (key == "auto_check_on_start") return boolToString(sync.auto_check_on_start);
      if (key == "interval_enabled") return boolToString(sync.interval_enabled);
      if (key == "interval_minutes") return std::to_string(sync.interval_minutes);
      if (key == "change_enabled") return boolToString(sync.change_enabled);
      if (key == "notifications_enabled") return boolToString(sync.notifications_enabled);
      if (key == "debounce_ms") return std::to_string(sync.debounce_ms);
      if (key == "startup_delay_ms") return std::to_string(sync.startup_delay_ms);
    } else if (path[0] == "logging") {
      if (key == "level") return logging.level;
      if (key == "file") return logging.file;
    }
  }

  return std::unexpected(makeError(ErrorCode::kConfigError,
                                   "Unknown config key: " + path[0] +
                                   (path.size() > 1 ? "." + path[1] : "")));
}

Result<void> Config::setValueByPath(const std::vector<std::string>& path, const std::string& value) {
  if (path.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Empty config path"));
  }

  auto assignInt = [&](const std::string& name, int& target) -> Result<void> {
    auto parsed = parseInt(name, value);
    if (!parsed.has_value()) return std::unexpected(parsed.error());
    target = *parsed;
    return {};
  };
  auto assignBool = [&](const std::string& name, bool& target) -> Result<void> {
    auto parsed = parseBool(name, value);
    if (!parsed.has_value()) return std::unexpected(parsed.error());
    target = *parsed;
    return {};
  };

  if (path.size() == 1) {
    const std::string& key = path[0];

    if (key == "workspace") { workspace = value; return {}; }
    if (key == "artifact_name") { artifact_name = value; return {}; }
    if (key == "artifact_dir") { artifact_dir = value; return {}; }
  } else if (path.size() == 2) {
    const std::string& key = path[1];
    const std::string full = path[0] + "." + key;

    if (path[0] == "remote") {
      if (key == "token") { remote.token = value; return {}; }
      if (key == "id") { remote.id = value; return {}; }
      if (key == "api_url") { remote.api_url = value; return {}; }
      if (key == "timeout_seconds") return assignInt(full, remote.timeout_seconds);
    } else if (path[0] == "sync") {
      if (key == "auto_exclude") return assignBool(full, sync.auto_exclude);
      if (key == "auto_check_on_start") return assignBool(full, sync.auto_check_on_start);
      if (key == "interval_enabled") return assignBool(full, sync.interval_enabled);
      if (key == "interval_minutes") return assignInt(full, sync.interval_minutes);
      if (key == "change_enabled") return assignBool(full, sync.change_enabled);
      if (key == "notifications_enabled") return assignBool(full, sync.notifications_enabled);
      if (key == "debounce_ms") return assignInt(full, sync.debounce_ms);
      if (key == "startup_delay_ms") return assignInt(full, sync.startup_delay_ms);
    } else if (path[0] == "logging") {
      if (key == "level") { logging.level = value; return {}; }
      if (key == "file") { logging.file = value; return {}; }
    }
  }

  return std::unexpected(makeError(ErrorCode::kConfigError,
                                   "Unknown config key: " + path[0] +
                                   (path.size() > 1 ? "." + path[1] : "")));
}

std::vector<std::string> Config::splitPath(const std::string& path) {
  std::vector<std::string> parts;
  std::istringstream stream(path);
  std::string part;

  while (std::getline(stream, part, '.')) {
    if (!part.empty()) {
      parts.push_back(part);
    }
  }

  return parts;
}

}  // namespace docsync::config
