#include "docsync/cli/application.hpp"

#include <iostream>
#include <filesystem>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "docsync/core/fingerprint.hpp"
#include "docsync/remote/gist_remote_store.hpp"
#include "docsync/util/logging.hpp"
#include "docsync/util/xdg.hpp"

// Command includes
#include "docsync/cli/commands/sync_command.hpp"
#include "docsync/cli/commands/status_command.hpp"
#include "docsync/cli/commands/push_command.hpp"
#include "docsync/cli/commands/pull_command.hpp"
#include "docsync/cli/commands/init_command.hpp"
#include "docsync/cli/commands/watch_command.hpp"

// Configuration management
#include "docsync/cli/commands/config_command.hpp"

namespace docsync::cli {

namespace {

std::unique_ptr<remote::RemoteStore> makeGistStore(const config::Config& config) {
  remote::GistOptions options;
  options.token = config.resolvedToken();
  options.api_url = config.remote.api_url;
  options.file_name = config.artifact_name;
  options.timeout_seconds = config.remote.timeout_seconds;
  return std::make_unique<remote::GistRemoteStore>(std::move(options));
}

}  // namespace

Application::Application()
    : Application(RemoteStoreFactory(&makeGistStore)) {}

Application::Application(RemoteStoreFactory remote_factory)
    : app_("docsync", "Keep an instructions file in sync with a remote gist")
    , remote_factory_(std::move(remote_factory))
    , prompt_in_(&std::cin)
    , prompt_out_(&std::cout) {

  app_.set_version_flag("--version", getVersion().toString());
  app_.set_help_all_flag("--help-all", "Expand all help");
  app_.require_subcommand(1);

  setupGlobalOptions();
  setupCommands();
  setupHelp();
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  // The command has already been executed by CLI11's callback system
  return 0;
}

Result<void> Application::initialize() {
  return initializeServices();
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Verbose output");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Suppress normal output");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
  app_.add_option("--workspace", global_options_.workspace, "Workspace directory (default: current directory)");
}

void Application::setupCommands() {
  // Reconciliation commands
  registerCommand(std::make_unique<SyncCommand>(*this));
  registerCommand(std::make_unique<StatusCommand>(*this));
  registerCommand(std::make_unique<PushCommand>(*this));
  registerCommand(std::make_unique<PullCommand>(*this));
  registerCommand(std::make_unique<InitCommand>(*this));

  // Background triggers
  registerCommand(std::make_unique<WatchCommand>(*this));

  // Configuration management commands
  registerCommand(std::make_unique<ConfigCommand>(*this));
}

void Application::setupHelp() {
  app_.get_formatter()->column_width(40);

  app_.footer(R"(Examples:
  docsync config set remote.token env:GITHUB_TOKEN
  docsync sync                  # Reconcile, asking before any change
  docsync sync --yes            # Accept the suggested action
  docsync status --json
  docsync push --force
  docsync watch                 # Startup, interval and change triggers

For more information on a specific command, run:
  docsync <command> --help)");
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());
  cmd_ptr->setupCommand(sub);

  sub->callback([this, cmd_ptr]() {
    auto init_result = initializeServices();
    if (!init_result.has_value()) {
      if (global_options_.json) {
        nlohmann::json output;
        output["error"] = {{"code", std::string(errorCodeToString(init_result.error().code()))},
                           {"message", init_result.error().message()}};
        std::cout << output.dump() << "\n";
      } else {
        std::cerr << "Error: " << init_result.error().message() << "\n";
      }
      throw CLI::RuntimeError(1);
    }

    auto result = cmd_ptr->execute(global_options_);
    if (!result.has_value()) {
      if (global_options_.json) {
        nlohmann::json output;
        output["error"] = {{"code", std::string(errorCodeToString(result.error().code()))},
                           {"message", result.error().message()}};
        std::cout << output.dump() << "\n";
      } else {
        std::cerr << "Error: " << result.error().message() << "\n";
      }
      throw CLI::RuntimeError(1);
    }
    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  commands_.push_back(std::move(command));
}

std::filesystem::path Application::resolveConfigPath() const {
  if (!global_options_.config_file.empty()) {
    return global_options_.config_file;
  }
  return config::Config::defaultConfigPath();
}

Result<void> Application::initializeServices() {
  if (services_initialized_) {
    return {};
  }

  const auto config_path = resolveConfigPath();
  {
    std::lock_guard<std::mutex> lock(config_mutex_);
    if (std::filesystem::exists(config_path)) {
      auto load_result = config_.load(config_path);
      if (!load_result.has_value()) {
        return std::unexpected(load_result.error());
      }
    } else {
      config_.setConfigPath(config_path);
    }
  }

  util::LoggingOptions logging;
  logging.level = config_.logging.level;
  logging.file = config_.logging.file;
  logging.console_verbose = global_options_.verbose > 0;
  logging.file_enabled = file_logging_;
  util::Logging::initialize(logging);

  spdlog::debug("Using configuration {}", config_path.string());

  services_initialized_ = true;
  return {};
}

const GlobalOptions& Application::globalOptions() const {
  return global_options_;
}

config::Config& Application::config() {
  if (!services_initialized_) {
    throw std::runtime_error("Services not initialized");
  }
  return config_;
}

std::filesystem::path Application::workspace() const {
  if (!global_options_.workspace.empty()) {
    return global_options_.workspace;
  }
  return config_.resolvedWorkspace();
}

Result<void> Application::reloadConfig() {
  config::Config fresh;
  auto load_result = fresh.load(config_.configPath());
  if (!load_result.has_value()) {
    return load_result;
  }
  auto valid = fresh.validate();
  if (!valid.has_value()) {
    return valid;
  }

  std::lock_guard<std::mutex> lock(config_mutex_);
  config_ = std::move(fresh);
  spdlog::info("Reloaded configuration from {}", config_.configPath().string());
  return {};
}

Result<SyncContext> Application::createSyncContext(const config::Config& snapshot) {
  auto valid = snapshot.validate();
  if (!valid.has_value()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, valid.error().message()));
  }

  auto workspace_root = global_options_.workspace.empty()
                            ? snapshot.resolvedWorkspace()
                            : std::filesystem::path(global_options_.workspace);

  SyncContext context;
  auto lock = util::FileLock::tryAcquire(syncLockPath(workspace_root));
  if (!lock.has_value()) {
    return std::unexpected(lock.error());
  }
  context.lock.emplace(std::move(*lock));

  context.local = std::make_unique<store::LocalArtifactStore>(
      workspace_root, snapshot.artifact_name, snapshot.artifact_dir);
  context.remote = remote_factory_(snapshot);
  if (!context.remote) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "No remote store available"));
  }

  std::optional<std::string> remote_id;
  if (!snapshot.remote.id.empty()) {
    remote_id = snapshot.remote.id;
  }

  sync::EngineOptions engine_options;
  engine_options.auto_exclude = snapshot.sync.auto_exclude;

  context.engine = std::make_unique<sync::ReconciliationEngine>(
      *context.local, *context.remote, remote_id, engine_options);
  context.engine->setRemoteIdPersister([this](const std::string& id) {
    return persistRemoteId(id);
  });
  return context;
}

Result<SyncContext> Application::createSyncContext() {
  config::Config snapshot;
  {
    std::lock_guard<std::mutex> lock(config_mutex_);
    snapshot = config_;
  }
  return createSyncContext(snapshot);
}

std::filesystem::path Application::syncLockPath(const std::filesystem::path& workspace) {
  std::error_code ec;
  auto canonical = std::filesystem::weakly_canonical(workspace, ec);
  if (ec) {
    canonical = std::filesystem::absolute(workspace, ec);
  }
  if (ec) {
    canonical = workspace;
  }
  const auto digest = core::Fingerprint::compute(canonical.generic_string());
  return util::Xdg::lockDir() / (digest.substr(0, 16) + ".lock");
}

Result<void> Application::persistRemoteId(const std::string& id) {
  std::lock_guard<std::mutex> lock(config_mutex_);
  config_.remote.id = id;
  auto saved = config_.save(config_.configPath());
  if (!saved.has_value()) {
    return saved;
  }
  spdlog::info("Saved remote id {} to {}", id, config_.configPath().string());
  return {};
}

void Application::setPromptStreams(std::istream& in, std::ostream& out) {
  prompt_in_ = &in;
  prompt_out_ = &out;
}

} // namespace docsync::cli
