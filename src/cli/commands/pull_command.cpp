#include "docsync/cli/commands/pull_command.hpp"

#include "docsync/cli/command_output.hpp"

namespace docsync::cli {

PullCommand::PullCommand(Application& app) : app_(app) {}

void PullCommand::setupCommand(CLI::App* cmd) {
  (void)cmd;
}

Result<int> PullCommand::execute(const GlobalOptions& options) {
  auto context = app_.createSyncContext();
  if (!context.has_value()) {
    return std::unexpected(context.error());
  }

  if (!context->engine->remoteId().has_value()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "No remote id configured; run `docsync push` first "
                                     "or set remote.id"));
  }

  auto outcome = context->engine->download();
  CommandOutput output(options);
  return output.reportOutcome(outcome);
}

}  // namespace docsync::cli
