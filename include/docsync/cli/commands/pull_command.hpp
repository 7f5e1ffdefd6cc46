#pragma once

#include "docsync/cli/application.hpp"
#include "docsync/common.hpp"

namespace docsync::cli {

// Explicit download of the remote replica.
class PullCommand : public Command {
public:
  explicit PullCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return "pull"; }
  std::string description() const override { return "Download the remote copy over the local one"; }

private:
  Application& app_;
};

}  // namespace docsync::cli
