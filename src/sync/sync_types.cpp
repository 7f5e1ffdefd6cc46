#include "docsync/sync/sync_types.hpp"

#include "docsync/sync/decision_provider.hpp"
#include "docsync/util/time.hpp"

namespace docsync::sync {

std::string_view toString(SyncMode mode) {
  switch (mode) {
    case SyncMode::kAutonomous: return "autonomous";
    case SyncMode::kInteractive: return "interactive";
  }
  return "unknown";
}

std::string_view toString(Classification classification) {
  switch (classification) {
    case Classification::kBothAbsent: return "BothAbsent";
    case Classification::kRemoteOnly: return "RemoteOnly";
    case Classification::kLocalOnly: return "LocalOnly";
    case Classification::kIdentical: return "Identical";
    case Classification::kDiverged: return "Diverged";
  }
  return "Unknown";
}

std::string_view toString(Direction direction) {
  switch (direction) {
    case Direction::kNone: return "None";
    case Direction::kLocalNewer: return "LocalNewer";
    case Direction::kRemoteNewer: return "RemoteNewer";
    case Direction::kAmbiguous: return "Ambiguous";
  }
  return "Unknown";
}

std::string_view toString(ActionTaken action) {
  switch (action) {
    case ActionTaken::kNoOp: return "no-op";
    case ActionTaken::kDownloaded: return "downloaded";
    case ActionTaken::kUploaded: return "uploaded";
    case ActionTaken::kCreatedTemplate: return "created-template";
    case ActionTaken::kAlreadySynced: return "already-synced";
    case ActionTaken::kCancelled: return "cancelled";
  }
  return "unknown";
}

std::string_view toString(Choice choice) {
  switch (choice) {
    case Choice::kDownload: return "download";
    case Choice::kUpload: return "upload";
    case Choice::kCreateTemplate: return "create-template";
    case Choice::kConfirm: return "confirm";
    case Choice::kCancel: return "cancel";
  }
  return "cancel";
}

std::string describe(const ClassificationResult& result) {
  std::string label(toString(result.classification));
  if (result.classification == Classification::kDiverged) {
    label += "/";
    label += toString(result.direction);
  }
  return label;
}

nlohmann::json toJson(const SyncOutcome& outcome) {
  nlohmann::json json;
  json["classification"] = describe({outcome.classification, outcome.direction});
  json["actionTaken"] = std::string(toString(outcome.action));
  if (!outcome.local_path.empty()) {
    json["localPath"] = outcome.local_path.string();
  }
  if (outcome.remote.has_value()) {
    json["remote"] = {{"id", outcome.remote->id}, {"url", outcome.remote->url}};
  }
  if (outcome.error.has_value()) {
    json["error"] = {
        {"code", std::string(errorCodeToString(outcome.error->code()))},
        {"message", outcome.error->message()}};
  }
  return json;
}

nlohmann::json toJson(const StatusReport& report) {
  nlohmann::json json;
  json["classification"] = describe(report.classification);

  auto optional = [](const auto& value) -> nlohmann::json {
    if (value.has_value()) return *value;
    return nullptr;
  };

  json["localPath"] = report.local_path ? nlohmann::json(report.local_path->string())
                                        : nlohmann::json(nullptr);
  json["localFingerprint"] = optional(report.local_fingerprint);
  json["remoteFingerprint"] = optional(report.remote_fingerprint);
  json["localVersion"] = optional(report.local_version);
  json["remoteVersion"] = optional(report.remote_version);
  json["remoteUpdatedAt"] = report.remote_updated_at
                                ? nlohmann::json(util::Time::toRfc3339(*report.remote_updated_at))
                                : nlohmann::json(nullptr);
  json["remoteId"] = optional(report.remote_id);
  return json;
}

}  // namespace docsync::sync
