#pragma once

#include <chrono>

#include "docsync/cli/application.hpp"
#include "docsync/common.hpp"
#include "docsync/sync/sync_types.hpp"
#include "docsync/sync/trigger_coordinator.hpp"

namespace docsync::cli {

/**
 * Foreground daemon: runs autonomous passes from the startup, interval and
 * file-change triggers until SIGINT/SIGTERM. Edits to the configuration
 * file are picked up and the triggers rescheduled.
 */
class WatchCommand : public Command {
public:
  explicit WatchCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return "watch"; }
  std::string description() const override { return "Keep syncing in the foreground until interrupted"; }

private:
  sync::SyncOutcome runPass(sync::TriggerSource source);

  Application& app_;
  int poll_ms_ = 1000;
};

}  // namespace docsync::cli
