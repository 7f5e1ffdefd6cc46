#include "docsync/cli/command_output.hpp"

#include <spdlog/spdlog.h>

namespace docsync::cli {

std::string summarize(const sync::SyncOutcome& outcome) {
  using sync::ActionTaken;

  const std::string path = outcome.local_path.string();
  switch (outcome.action) {
    case ActionTaken::kDownloaded:
      return "Downloaded remote copy to " + path;
    case ActionTaken::kUploaded: {
      std::string where = outcome.remote ? (outcome.remote->url.empty() ? outcome.remote->id
                                                                        : outcome.remote->url)
                                         : std::string("remote");
      return "Uploaded " + path + " to " + where;
    }
    case ActionTaken::kCreatedTemplate:
      return "Created template at " + path;
    case ActionTaken::kAlreadySynced:
      return "Already in sync";
    case ActionTaken::kCancelled:
      return "Cancelled; nothing changed";
    case ActionTaken::kNoOp:
      break;
  }
  return "No action taken (" + sync::describe({outcome.classification, outcome.direction}) + ")";
}

int CommandOutput::reportOutcome(const sync::SyncOutcome& outcome) {
  if (options_.json) {
    printJson(sync::toJson(outcome));
    return outcome.ok() ? 0 : 1;
  }

  if (!outcome.ok()) {
    return reportError(*outcome.error);
  }

  if (outcome.action == sync::ActionTaken::kCancelled ||
      outcome.action == sync::ActionTaken::kNoOp) {
    displayInfo(summarize(outcome));
  } else {
    displaySuccess(summarize(outcome));
  }
  return 0;
}

int CommandOutput::reportError(const Error& error) {
  spdlog::debug("Command failed: {} ({})", error.message(), errorCodeToString(error.code()));

  if (options_.json) {
    nlohmann::json output;
    output["error"] = {{"code", std::string(errorCodeToString(error.code()))},
                       {"message", error.message()}};
    out_ << output.dump() << std::endl;
  } else {
    err_ << "Error: " << error.message() << std::endl;
  }
  return 1;
}

void CommandOutput::displaySuccess(const std::string& message) {
  if (options_.json) {
    nlohmann::json success_json;
    success_json["success"] = true;
    success_json["message"] = message;
    out_ << success_json.dump() << std::endl;
  } else if (!options_.quiet) {
    out_ << "\033[32m✓\033[0m " << message << std::endl;
  }
}

void CommandOutput::displayWarning(const std::string& message) {
  if (options_.json) {
    nlohmann::json warning_json;
    warning_json["warning"] = true;
    warning_json["message"] = message;
    out_ << warning_json.dump() << std::endl;
  } else {
    err_ << "\033[33m⚠\033[0m " << message << std::endl;
  }
}

void CommandOutput::displayInfo(const std::string& message) {
  if (options_.json) {
    nlohmann::json info_json;
    info_json["info"] = true;
    info_json["message"] = message;
    out_ << info_json.dump() << std::endl;
  } else if (!options_.quiet) {
    out_ << "\033[36mℹ\033[0m " << message << std::endl;
  }
}

void CommandOutput::printJson(const nlohmann::json& value) {
  out_ << value.dump() << std::endl;
}

} // namespace docsync::cli
