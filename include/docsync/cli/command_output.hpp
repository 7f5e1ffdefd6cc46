#pragma once

#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "docsync/cli/application.hpp"
#include "docsync/sync/sync_types.hpp"

namespace docsync::cli {

// Formats command results for the terminal or as JSON
class CommandOutput {
public:
  explicit CommandOutput(const GlobalOptions& options,
                         std::ostream& out = std::cout,
                         std::ostream& err = std::cerr)
      : options_(options), out_(out), err_(err) {}

  // Prints a pass outcome; returns the exit code (0 on success)
  int reportOutcome(const sync::SyncOutcome& outcome);

  // Prints an error; returns the exit code
  int reportError(const Error& error);

  void displaySuccess(const std::string& message);
  void displayWarning(const std::string& message);
  void displayInfo(const std::string& message);

  void printJson(const nlohmann::json& value);

  bool json() const { return options_.json; }

private:
  const GlobalOptions& options_;
  std::ostream& out_;
  std::ostream& err_;
};

// One-line human summary of an outcome, e.g. "Downloaded .github/x.md"
std::string summarize(const sync::SyncOutcome& outcome);

} // namespace docsync::cli
