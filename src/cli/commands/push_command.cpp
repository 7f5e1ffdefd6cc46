#include "docsync/cli/commands/push_command.hpp"

#include "docsync/cli/command_output.hpp"

namespace docsync::cli {

PushCommand::PushCommand(Application& app) : app_(app) {}

void PushCommand::setupCommand(CLI::App* cmd) {
  cmd->add_flag("-f,--force", force_, "Upload even when the remote already has this content");
}

Result<int> PushCommand::execute(const GlobalOptions& options) {
  auto context = app_.createSyncContext();
  if (!context.has_value()) {
    return std::unexpected(context.error());
  }

  auto outcome = context->engine->upload(force_);
  CommandOutput output(options);
  return output.reportOutcome(outcome);
}

}  // namespace docsync::cli
