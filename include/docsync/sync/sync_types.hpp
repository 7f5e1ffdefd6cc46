#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "docsync/common.hpp"
#include "docsync/remote/remote_store.hpp"

namespace docsync::sync {

// Who is driving a pass
enum class SyncMode {
  kAutonomous,   // Triggers: never prompts, no-op on ambiguity
  kInteractive   // CLI: asks a DecisionProvider where policy needs a human
};

/**
 * @brief Relationship between the local and remote replica.
 */
enum class Classification {
  kBothAbsent,
  kRemoteOnly,
  kLocalOnly,
  kIdentical,
  kDiverged
};

// Refines kDiverged using the marker timestamps
enum class Direction {
  kNone,
  kLocalNewer,
  kRemoteNewer,
  kAmbiguous
};

enum class ActionTaken {
  kNoOp,
  kDownloaded,
  kUploaded,
  kCreatedTemplate,
  kAlreadySynced,
  kCancelled
};

struct ClassificationResult {
  Classification classification = Classification::kBothAbsent;
  Direction direction = Direction::kNone;

  bool operator==(const ClassificationResult&) const = default;
};

/**
 * @brief Structured result of one reconciliation pass.
 *
 * Always produced, including on failure: `error` is set when the pass was
 * aborted, and `action` then describes what had completed (normally kNoOp).
 */
struct SyncOutcome {
  Classification classification = Classification::kBothAbsent;
  Direction direction = Direction::kNone;
  ActionTaken action = ActionTaken::kNoOp;
  std::filesystem::path local_path;
  std::optional<remote::RemoteLocation> remote;
  std::optional<Error> error;

  bool ok() const { return !error.has_value(); }
};

// Read-only view used by `status`
struct StatusReport {
  ClassificationResult classification;
  std::optional<std::filesystem::path> local_path;
  std::optional<std::string> local_fingerprint;
  std::optional<std::string> remote_fingerprint;
  std::optional<std::string> local_version;
  std::optional<std::string> remote_version;
  std::optional<std::chrono::system_clock::time_point> remote_updated_at;
  std::optional<std::string> remote_id;
};

std::string_view toString(SyncMode mode);
std::string_view toString(Classification classification);
std::string_view toString(Direction direction);
std::string_view toString(ActionTaken action);

// Human-readable label, e.g. "Diverged/RemoteNewer"
std::string describe(const ClassificationResult& result);

nlohmann::json toJson(const SyncOutcome& outcome);
nlohmann::json toJson(const StatusReport& report);

}  // namespace docsync::sync
