#pragma once

#include "docsync/cli/application.hpp"
#include "docsync/common.hpp"

namespace docsync::cli {

/**
 * Explicit upload. Identical content is skipped unless --force is given.
 */
class PushCommand : public Command {
public:
  explicit PushCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return "push"; }
  std::string description() const override { return "Upload the local copy to the remote"; }

private:
  Application& app_;
  bool force_ = false;
};

}  // namespace docsync::cli
