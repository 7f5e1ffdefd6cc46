#include "docsync/cli/commands/watch_command.hpp"

#include <atomic>
#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

#include "docsync/cli/command_output.hpp"
#include "docsync/store/local_artifact_store.hpp"
#include "docsync/util/file_watcher.hpp"

namespace docsync::cli {

namespace {

std::atomic<bool> g_running{true};

void handleSignal(int) {
  g_running = false;
}

bool shouldNotify(const sync::SyncOutcome& outcome) {
  switch (outcome.action) {
    case sync::ActionTaken::kDownloaded:
    case sync::ActionTaken::kUploaded:
    case sync::ActionTaken::kCreatedTemplate:
      return true;
    default:
      return false;
  }
}

}  // namespace

WatchCommand::WatchCommand(Application& app) : app_(app) {}

void WatchCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("--poll-ms", poll_ms_, "File polling interval in milliseconds")
     ->check(CLI::Range(50, 60000));
}

sync::SyncOutcome WatchCommand::runPass(sync::TriggerSource source) {
  spdlog::debug("Running {} pass", sync::toString(source));

  auto context = app_.createSyncContext();
  if (!context.has_value()) {
    sync::SyncOutcome outcome;
    outcome.error = context.error();
    return outcome;
  }
  return context->engine->reconcile(sync::SyncMode::kAutonomous);
}

Result<int> WatchCommand::execute(const GlobalOptions& options) {
  config::Config snapshot;
  {
    std::lock_guard<std::mutex> lock(app_.configMutex());
    snapshot = app_.config();
  }
  auto valid = snapshot.validate();
  if (!valid.has_value()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, valid.error().message()));
  }

  CommandOutput output(options);
  std::atomic<bool> notifications{snapshot.sync.notifications_enabled};
  std::mutex output_mutex;

  sync::TriggerCoordinator coordinator(
      [this](sync::TriggerSource source) { return runPass(source); },
      sync::CoordinatorOptions::fromConfig(snapshot));

  coordinator.setOutcomeListener(
      [&](sync::TriggerSource source, const sync::SyncOutcome& outcome) {
        std::lock_guard<std::mutex> lock(output_mutex);
        if (options.json) {
          auto json = sync::toJson(outcome);
          json["trigger"] = std::string(sync::toString(source));
          output.printJson(json);
          return;
        }
        if (notifications.load() && outcome.ok() && shouldNotify(outcome)) {
          output.displayInfo(summarize(outcome));
        }
      });

  store::LocalArtifactStore local(app_.workspace(), snapshot.artifact_name, snapshot.artifact_dir);
  const auto poll = std::chrono::milliseconds(poll_ms_);

  util::PollingFileWatcher artifact_watcher(
      local.candidatePaths(), poll,
      [&coordinator](const std::filesystem::path&) { coordinator.notifyChanged(); });

  util::PollingFileWatcher config_watcher(
      {snapshot.configPath()}, poll,
      [&](const std::filesystem::path& path) {
        auto reloaded = app_.reloadConfig();
        if (!reloaded.has_value()) {
          spdlog::warn("Ignoring change to {}: {}", path.string(), reloaded.error().message());
          return;
        }
        config::Config fresh;
        {
          std::lock_guard<std::mutex> lock(app_.configMutex());
          fresh = app_.config();
        }
        notifications = fresh.sync.notifications_enabled;
        auto restarted = coordinator.restart(sync::CoordinatorOptions::fromConfig(fresh));
        if (!restarted.has_value()) {
          spdlog::error("Could not reschedule triggers: {}", restarted.error().message());
        }
      });

  auto started = coordinator.start();
  if (!started.has_value()) {
    return std::unexpected(started.error());
  }
  auto watching = artifact_watcher.start();
  if (!watching.has_value()) {
    coordinator.stop();
    return std::unexpected(watching.error());
  }
  auto watching_config = config_watcher.start();
  if (!watching_config.has_value()) {
    artifact_watcher.stop();
    coordinator.stop();
    return std::unexpected(watching_config.error());
  }

  g_running = true;
  std::signal(SIGINT, handleSignal);
  std::signal(SIGTERM, handleSignal);

  if (!options.json) {
    output.displayInfo("Watching " + local.defaultPath().string() + " (Ctrl-C to stop)");
  }

  while (g_running) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  spdlog::info("Shutting down watch");
  config_watcher.stop();
  artifact_watcher.stop();
  coordinator.stop();

  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);

  auto stats = coordinator.stats();
  if (options.json) {
    std::lock_guard<std::mutex> lock(output_mutex);
    output.printJson({{"passes", stats.started},
                      {"completed", stats.completed},
                      {"failed", stats.failed},
                      {"dropped", stats.dropped}});
  } else {
    output.displayInfo("Stopped after " + std::to_string(stats.started) + " pass(es), " +
                       std::to_string(stats.failed) + " failed, " +
                       std::to_string(stats.dropped) + " dropped");
  }
  return 0;
}

}  // namespace docsync::cli
