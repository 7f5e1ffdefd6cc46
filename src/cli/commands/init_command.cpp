#include "docsync/cli/commands/init_command.hpp"

#include "docsync/cli/command_output.hpp"

namespace docsync::cli {

InitCommand::InitCommand(Application& app) : app_(app) {}

void InitCommand::setupCommand(CLI::App* cmd) {
  (void)cmd;
}

Result<int> InitCommand::execute(const GlobalOptions& options) {
  auto context = app_.createSyncContext();
  if (!context.has_value()) {
    return std::unexpected(context.error());
  }

  auto outcome = context->engine->createTemplate();
  CommandOutput output(options);
  return output.reportOutcome(outcome);
}

}  // namespace docsync::cli
