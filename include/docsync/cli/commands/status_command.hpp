#pragma once

#include "docsync/cli/application.hpp"
#include "docsync/common.hpp"

namespace docsync::cli {

/**
 * Read-only report of the classification, fingerprints and versions.
 */
class StatusCommand : public Command {
public:
  explicit StatusCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return "status"; }
  std::string description() const override { return "Show how the local and remote copies relate"; }

private:
  Application& app_;
};

}  // namespace docsync::cli
