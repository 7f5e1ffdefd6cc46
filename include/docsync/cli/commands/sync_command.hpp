#pragma once

#include "docsync/cli/application.hpp"
#include "docsync/common.hpp"

namespace docsync::cli {

/**
 * Interactive reconciliation: classifies both replicas and asks before
 * changing either of them unless --yes is given.
 */
class SyncCommand : public Command {
public:
  explicit SyncCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return "sync"; }
  std::string description() const override { return "Reconcile the local and remote copies"; }

private:
  Application& app_;
  bool assume_yes_ = false;
};

}  // namespace docsync::cli
