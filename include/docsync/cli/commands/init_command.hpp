#pragma once

#include "docsync/cli/application.hpp"
#include "docsync/common.hpp"

namespace docsync::cli {

// Writes the template to the preferred local path.
class InitCommand : public Command {
public:
  explicit InitCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return "init"; }
  std::string description() const override { return "Create a starter file in the workspace"; }

private:
  Application& app_;
};

}  // namespace docsync::cli
