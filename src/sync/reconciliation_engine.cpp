#include "docsync/sync/reconciliation_engine.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "docsync/core/artifact_template.hpp"
#include "docsync/core/fingerprint.hpp"
#include "docsync/core/version_metadata.hpp"
#include "docsync/store/exclusion_list.hpp"
#include "docsync/util/time.hpp"

namespace docsync::sync {

using core::Fingerprint;
using core::VersionMetadata;
using core::VersionMetadataCodec;

ReconciliationEngine::ReconciliationEngine(const store::LocalArtifactStore& local,
                                           remote::RemoteStore& remote,
                                           std::optional<std::string> remote_id,
                                           EngineOptions options)
    : local_(local),
      remote_(remote),
      remote_id_(std::move(remote_id)),
      options_(std::move(options)),
      clock_(&util::Time::now) {
  if (remote_id_.has_value() && remote_id_->empty()) {
    remote_id_.reset();
  }
}

void ReconciliationEngine::setRemoteIdPersister(RemoteIdPersister persister) {
  persister_ = std::move(persister);
}

void ReconciliationEngine::setClock(Clock clock) {
  clock_ = std::move(clock);
}

ClassificationResult ReconciliationEngine::classify(const std::optional<std::string>& local,
                                                    const std::optional<std::string>& remote) {
  if (!local.has_value() && !remote.has_value()) {
    return {Classification::kBothAbsent, Direction::kNone};
  }
  if (!local.has_value()) {
    return {Classification::kRemoteOnly, Direction::kNone};
  }
  if (!remote.has_value()) {
    return {Classification::kLocalOnly, Direction::kNone};
  }
  if (Fingerprint::equal(*local, *remote)) {
    return {Classification::kIdentical, Direction::kNone};
  }

  auto local_meta = VersionMetadataCodec::extract(*local);
  auto remote_meta = VersionMetadataCodec::extract(*remote);
  if (!local_meta || !remote_meta || !local_meta->last_modified || !remote_meta->last_modified) {
    return {Classification::kDiverged, Direction::kAmbiguous};
  }

  if (*local_meta->last_modified < *remote_meta->last_modified) {
    return {Classification::kDiverged, Direction::kRemoteNewer};
  }
  if (*local_meta->last_modified > *remote_meta->last_modified) {
    return {Classification::kDiverged, Direction::kLocalNewer};
  }

  spdlog::warn("Local and remote content differ but carry the same LAST_MODIFIED ({}); "
               "leaving both untouched",
               util::Time::toRfc3339(*local_meta->last_modified));
  return {Classification::kDiverged, Direction::kAmbiguous};
}

Result<std::optional<remote::RemoteArtifact>> ReconciliationEngine::fetchRemote() {
  if (!remote_id_.has_value()) {
    spdlog::debug("No remote id configured; treating remote as absent");
    return std::optional<remote::RemoteArtifact>{};
  }
  return remote_.fetch(*remote_id_);
}

Result<ReconciliationEngine::Snapshot> ReconciliationEngine::loadSnapshot() {
  Snapshot snapshot;

  auto local = local_.load();
  if (!local.has_value()) {
    return std::unexpected(local.error());
  }
  snapshot.local = std::move(*local);

  auto remote = fetchRemote();
  if (!remote.has_value()) {
    return std::unexpected(remote.error());
  }
  snapshot.remote = std::move(*remote);

  std::optional<std::string> local_text;
  std::optional<std::string> remote_text;
  if (snapshot.local) local_text = snapshot.local->content;
  if (snapshot.remote) remote_text = snapshot.remote->content;
  snapshot.classification = classify(local_text, remote_text);

  spdlog::debug("Classified artifact as {}", describe(snapshot.classification));
  return snapshot;
}

SyncOutcome ReconciliationEngine::fail(SyncOutcome outcome, const Error& error) const {
  if (isTransportError(error.code())) {
    spdlog::warn("Remote unavailable: {} ({})", error.message(), errorCodeToString(error.code()));
  } else {
    spdlog::error("Sync pass failed: {} ({})", error.message(), errorCodeToString(error.code()));
  }
  outcome.error = error;
  return outcome;
}

Choice ReconciliationEngine::ask(DecisionProvider& decisions,
                                 const ClassificationResult& classification,
                                 std::string message,
                                 std::vector<Choice> options) const {
  if (std::find(options.begin(), options.end(), Choice::kCancel) == options.end()) {
    options.push_back(Choice::kCancel);
  }
  DecisionRequest request{classification, std::move(message), options};
  Choice choice = decisions.choose(request);
  if (std::find(options.begin(), options.end(), choice) == options.end()) {
    spdlog::debug("Decision {} not offered; cancelling", toString(choice));
    return Choice::kCancel;
  }
  return choice;
}

SyncOutcome ReconciliationEngine::reconcile(SyncMode mode, DecisionProvider* decisions) {
  SyncOutcome outcome;

  if (mode == SyncMode::kInteractive && decisions == nullptr) {
    return fail(std::move(outcome),
                makeError(ErrorCode::kInvalidArgument, "Interactive sync requires a decision provider"));
  }

  auto snapshot = loadSnapshot();
  if (!snapshot.has_value()) {
    return fail(std::move(outcome), snapshot.error());
  }

  const auto& classification = snapshot->classification;
  outcome.classification = classification.classification;
  outcome.direction = classification.direction;
  outcome.local_path = snapshot->local ? snapshot->local->path : local_.defaultPath();

  const bool interactive = mode == SyncMode::kInteractive;
  Choice choice = Choice::kCancel;

  switch (classification.classification) {
    case Classification::kBothAbsent:
      if (!interactive) {
        outcome.action = ActionTaken::kNoOp;
        return outcome;
      }
      choice = ask(*decisions, classification,
                   "No " + local_.artifactName() + " exists locally or remotely. Create a template?",
                   {Choice::kCreateTemplate, Choice::kCancel});
      break;

    case Classification::kRemoteOnly:
      if (!interactive) {
        choice = Choice::kDownload;
        break;
      }
      choice = ask(*decisions, classification,
                   "No local " + local_.artifactName() + " found. Download it from the remote?",
                   {Choice::kConfirm, Choice::kCancel});
      if (choice == Choice::kConfirm) choice = Choice::kDownload;
      break;

    case Classification::kLocalOnly:
      if (!interactive) {
        choice = Choice::kUpload;
        break;
      }
      choice = ask(*decisions, classification,
                   "The remote has no copy of " + local_.artifactName() + ". Upload the local file?",
                   {Choice::kConfirm, Choice::kCancel});
      if (choice == Choice::kConfirm) choice = Choice::kUpload;
      break;

    case Classification::kIdentical:
      outcome.action = interactive ? ActionTaken::kAlreadySynced : ActionTaken::kNoOp;
      spdlog::info("{} is already in sync", local_.artifactName());
      return outcome;

    case Classification::kDiverged:
      switch (classification.direction) {
        case Direction::kRemoteNewer:
          if (!interactive) {
            choice = Choice::kDownload;
            break;
          }
          choice = ask(*decisions, classification,
                       "The remote version is newer. Download it, or upload the local version instead?",
                       {Choice::kDownload, Choice::kUpload, Choice::kCancel});
          break;
        case Direction::kLocalNewer:
          if (!interactive) {
            choice = Choice::kUpload;
            break;
          }
          choice = ask(*decisions, classification,
                       "The local version is newer. Upload it, or download the remote version instead?",
                       {Choice::kUpload, Choice::kDownload, Choice::kCancel});
          break;
        case Direction::kAmbiguous:
        case Direction::kNone:
          if (!interactive) {
            spdlog::warn("Local and remote {} differ and neither is provably newer; skipping",
                         local_.artifactName());
            outcome.action = ActionTaken::kNoOp;
            return outcome;
          }
          choice = ask(*decisions, classification,
                       "Local and remote versions differ. Which one should be kept?",
                       {Choice::kUpload, Choice::kDownload, Choice::kCancel});
          break;
      }
      break;
  }

  Result<ActionTaken> action = ActionTaken::kCancelled;
  switch (choice) {
    case Choice::kDownload:
      action = applyDownload(*snapshot, outcome);
      break;
    case Choice::kUpload:
      action = applyUpload(*snapshot, false, outcome);
      break;
    case Choice::kCreateTemplate:
      action = applyCreateTemplate(*snapshot, outcome);
      break;
    case Choice::kConfirm:
    case Choice::kCancel:
      spdlog::info("Sync cancelled");
      action = ActionTaken::kCancelled;
      break;
  }

  if (!action.has_value()) {
    return fail(std::move(outcome), action.error());
  }
  outcome.action = *action;
  return outcome;
}

SyncOutcome ReconciliationEngine::upload(bool force) {
  SyncOutcome outcome;
  auto snapshot = loadSnapshot();
  if (!snapshot.has_value()) {
    return fail(std::move(outcome), snapshot.error());
  }
  outcome.classification = snapshot->classification.classification;
  outcome.direction = snapshot->classification.direction;
  outcome.local_path = snapshot->local ? snapshot->local->path : local_.defaultPath();

  auto action = applyUpload(*snapshot, force, outcome);
  if (!action.has_value()) {
    return fail(std::move(outcome), action.error());
  }
  outcome.action = *action;
  return outcome;
}

SyncOutcome ReconciliationEngine::download() {
  SyncOutcome outcome;
  auto snapshot = loadSnapshot();
  if (!snapshot.has_value()) {
    return fail(std::move(outcome), snapshot.error());
  }
  outcome.classification = snapshot->classification.classification;
  outcome.direction = snapshot->classification.direction;
  outcome.local_path = snapshot->local ? snapshot->local->path : local_.defaultPath();

  auto action = applyDownload(*snapshot, outcome);
  if (!action.has_value()) {
    return fail(std::move(outcome), action.error());
  }
  outcome.action = *action;
  return outcome;
}

SyncOutcome ReconciliationEngine::createTemplate() {
  SyncOutcome outcome;
  Snapshot snapshot;

  auto local = local_.load();
  if (!local.has_value()) {
    return fail(std::move(outcome), local.error());
  }
  snapshot.local = std::move(*local);
  outcome.classification = snapshot.local ? Classification::kLocalOnly : Classification::kBothAbsent;
  outcome.local_path = snapshot.local ? snapshot.local->path : local_.defaultPath();

  auto action = applyCreateTemplate(snapshot, outcome);
  if (!action.has_value()) {
    return fail(std::move(outcome), action.error());
  }
  outcome.action = *action;
  return outcome;
}

Result<StatusReport> ReconciliationEngine::inspect() {
  auto snapshot = loadSnapshot();
  if (!snapshot.has_value()) {
    return std::unexpected(snapshot.error());
  }

  StatusReport report;
  report.classification = snapshot->classification;
  report.remote_id = remote_id_;

  if (snapshot->local) {
    report.local_path = snapshot->local->path;
    report.local_fingerprint = Fingerprint::compute(snapshot->local->content);
    auto meta = VersionMetadataCodec::extract(snapshot->local->content);
    report.local_version = meta ? meta->version.toString() : core::SemVer{}.toString();
  }
  if (snapshot->remote) {
    report.remote_fingerprint = Fingerprint::compute(snapshot->remote->content);
    auto meta = VersionMetadataCodec::extract(snapshot->remote->content);
    report.remote_version = meta ? meta->version.toString() : core::SemVer{}.toString();
    report.remote_updated_at = snapshot->remote->server_updated_at;
  }
  return report;
}

Result<ActionTaken> ReconciliationEngine::applyDownload(const Snapshot& snapshot, SyncOutcome& outcome) {
  if (!snapshot.remote.has_value()) {
    return makeErrorResult<ActionTaken>(ErrorCode::kNotFound,
                                        "No remote copy of " + local_.artifactName() + " to download");
  }

  const auto target = snapshot.local ? snapshot.local->path : local_.defaultPath();
  auto written = local_.write(target, snapshot.remote->content);
  if (!written.has_value()) {
    return std::unexpected(written.error());
  }

  outcome.local_path = target;
  if (remote_id_) {
    outcome.remote = remote::RemoteLocation{*remote_id_, {}};
  }
  spdlog::info("Downloaded {} to {}", local_.artifactName(), target.string());

  if (options_.auto_exclude) {
    ensureExcluded(target);
  }
  return ActionTaken::kDownloaded;
}

Result<ActionTaken> ReconciliationEngine::applyUpload(const Snapshot& snapshot, bool force,
                                                      SyncOutcome& outcome) {
  if (!snapshot.local.has_value()) {
    return makeErrorResult<ActionTaken>(ErrorCode::kFileNotFound,
                                        "No local " + local_.artifactName() + " to upload");
  }

  const bool unchanged = snapshot.remote.has_value() &&
                         Fingerprint::equal(snapshot.local->content, snapshot.remote->content);
  if (unchanged && !force) {
    spdlog::info("Remote already has this content; nothing to upload");
    return ActionTaken::kAlreadySynced;
  }

  std::string content = snapshot.local->content;
  if (!unchanged) {
    VersionMetadata metadata;
    metadata.version = VersionMetadataCodec::nextVersion(content);
    metadata.last_modified =
        std::chrono::time_point_cast<std::chrono::milliseconds>(clock_());
    content = VersionMetadataCodec::inject(content, metadata);

    auto written = local_.write(snapshot.local->path, content);
    if (!written.has_value()) {
      return std::unexpected(written.error());
    }
    spdlog::debug("Bumped local version to {}", metadata.version.toString());
  }

  auto location = remote_.put(remote_id_, content);
  if (!location.has_value()) {
    return std::unexpected(location.error());
  }

  const bool created = !remote_id_.has_value() || *remote_id_ != location->id;
  remote_id_ = location->id;
  outcome.remote = *location;
  spdlog::info("Uploaded {} to {}", local_.artifactName(),
               location->url.empty() ? location->id : location->url);

  if (created && persister_) {
    auto persisted = persister_(location->id);
    if (!persisted.has_value()) {
      spdlog::error("Uploaded to new remote {} but could not save its id: {}",
                    location->id, persisted.error().message());
    }
  }
  return ActionTaken::kUploaded;
}

Result<ActionTaken> ReconciliationEngine::applyCreateTemplate(const Snapshot& snapshot,
                                                              SyncOutcome& outcome) {
  if (snapshot.local.has_value()) {
    return makeErrorResult<ActionTaken>(ErrorCode::kInvalidState,
                                        snapshot.local->path.string() + " already exists");
  }

  const auto target = local_.defaultPath();
  auto now = std::chrono::time_point_cast<std::chrono::milliseconds>(clock_());
  auto written = local_.write(target, core::ArtifactTemplate::render(now));
  if (!written.has_value()) {
    return std::unexpected(written.error());
  }

  outcome.local_path = target;
  spdlog::info("Created template at {}", target.string());
  return ActionTaken::kCreatedTemplate;
}

void ReconciliationEngine::ensureExcluded(const std::filesystem::path& path) const {
  store::ExclusionList exclusions(local_.workspaceRoot() / options_.ignore_file);
  auto result = exclusions.ensureEntry(local_.relativePath(path));
  if (!result.has_value()) {
    spdlog::warn("Could not update {}: {}", exclusions.path().string(), result.error().message());
  }
}

}  // namespace docsync::sync
