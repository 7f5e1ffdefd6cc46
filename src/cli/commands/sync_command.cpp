#include "docsync/cli/commands/sync_command.hpp"

#include <iostream>

#include "docsync/cli/command_output.hpp"
#include "docsync/cli/console_prompt.hpp"

namespace docsync::cli {

SyncCommand::SyncCommand(Application& app) : app_(app) {}

void SyncCommand::setupCommand(CLI::App* cmd) {
  cmd->add_flag("-y,--yes", assume_yes_, "Accept the suggested action without prompting");
}

Result<int> SyncCommand::execute(const GlobalOptions& options) {
  auto context = app_.createSyncContext();
  if (!context.has_value()) {
    return std::unexpected(context.error());
  }

  // Keep stdout clean for the JSON document
  std::ostream& prompt_out = options.json ? std::cerr : app_.promptOutput();
  ConsolePrompt prompt(app_.promptInput(), prompt_out, assume_yes_);

  auto outcome = context->engine->reconcile(sync::SyncMode::kInteractive, &prompt);

  CommandOutput output(options);
  return output.reportOutcome(outcome);
}

}  // namespace docsync::cli
