#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "docsync/common.hpp"
#include "docsync/remote/remote_store.hpp"
#include "docsync/store/local_artifact_store.hpp"
#include "docsync/sync/decision_provider.hpp"
#include "docsync/sync/sync_types.hpp"

namespace docsync::sync {

struct EngineOptions {
  bool auto_exclude = true;          // Keep the artifact out of .gitignore'd VCS
  std::string ignore_file = ".gitignore";
};

/**
 * @brief Decides and performs the sync action for one artifact.
 *
 * Each call loads both replicas fresh, classifies them and applies the policy
 * table for the given mode. Nothing is cached between calls. A remote
 * transport error aborts the pass; it is never treated as "remote absent".
 */
class ReconciliationEngine {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;
  // Stores an id returned by the first successful put
  using RemoteIdPersister = std::function<Result<void>(const std::string& id)>;

  ReconciliationEngine(const store::LocalArtifactStore& local,
                       remote::RemoteStore& remote,
                       std::optional<std::string> remote_id,
                       EngineOptions options = {});

  void setRemoteIdPersister(RemoteIdPersister persister);
  void setClock(Clock clock);

  // Pure classification of two replicas' text (nullopt = absent)
  static ClassificationResult classify(const std::optional<std::string>& local,
                                       const std::optional<std::string>& remote);

  // Full pass: classify then act according to policy for `mode`.
  // Interactive mode requires a non-null `decisions`.
  SyncOutcome reconcile(SyncMode mode, DecisionProvider* decisions = nullptr);

  // Explicit one-way actions
  SyncOutcome upload(bool force = false);
  SyncOutcome download();
  SyncOutcome createTemplate();

  // Classification plus fingerprints and versions, no side effects
  Result<StatusReport> inspect();

  const std::optional<std::string>& remoteId() const { return remote_id_; }

 private:
  struct Snapshot {
    std::optional<store::LocalArtifact> local;
    std::optional<remote::RemoteArtifact> remote;
    ClassificationResult classification;
  };

  Result<Snapshot> loadSnapshot();
  Result<std::optional<remote::RemoteArtifact>> fetchRemote();

  Result<ActionTaken> applyDownload(const Snapshot& snapshot, SyncOutcome& outcome);
  Result<ActionTaken> applyUpload(const Snapshot& snapshot, bool force, SyncOutcome& outcome);
  Result<ActionTaken> applyCreateTemplate(const Snapshot& snapshot, SyncOutcome& outcome);

  Choice ask(DecisionProvider& decisions, const ClassificationResult& classification,
             std::string message, std::vector<Choice> options) const;
  void ensureExcluded(const std::filesystem::path& path) const;
  SyncOutcome fail(SyncOutcome outcome, const Error& error) const;

  const store::LocalArtifactStore& local_;
  remote::RemoteStore& remote_;
  std::optional<std::string> remote_id_;
  EngineOptions options_;
  RemoteIdPersister persister_;
  Clock clock_;
};

}  // namespace docsync::sync
