#include "docsync/cli/commands/status_command.hpp"

#include <iomanip>
#include <iostream>

#include "docsync/cli/command_output.hpp"
#include "docsync/util/time.hpp"

namespace docsync::cli {

namespace {

std::string orDash(const std::optional<std::string>& value) {
  return value.has_value() ? *value : "-";
}

void printRow(const std::string& label, const std::string& value) {
  std::cout << "  " << std::setw(18) << std::left << label << value << "\n";
}

}  // namespace

StatusCommand::StatusCommand(Application& app) : app_(app) {}

void StatusCommand::setupCommand(CLI::App* cmd) {
  (void)cmd;
}

Result<int> StatusCommand::execute(const GlobalOptions& options) {
  auto context = app_.createSyncContext();
  if (!context.has_value()) {
    return std::unexpected(context.error());
  }

  auto report = context->engine->inspect();
  CommandOutput output(options);
  if (!report.has_value()) {
    return output.reportError(report.error());
  }

  if (options.json) {
    output.printJson(sync::toJson(*report));
    return 0;
  }

  std::cout << "Status: " << sync::describe(report->classification) << "\n\n";
  printRow("Local file", report->local_path ? report->local_path->string() : "-");
  printRow("Local version", orDash(report->local_version));
  printRow("Local sha256", orDash(report->local_fingerprint));
  printRow("Remote id", orDash(report->remote_id));
  printRow("Remote version", orDash(report->remote_version));
  printRow("Remote sha256", orDash(report->remote_fingerprint));
  printRow("Remote updated", report->remote_updated_at
                                 ? util::Time::toRfc3339(*report->remote_updated_at)
                                 : "-");
  return 0;
}

}  // namespace docsync::cli
