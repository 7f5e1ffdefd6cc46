#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "docsync/common.hpp"

namespace docsync::store {

// Loaded local replica; lives for one reconciliation pass
struct LocalArtifact {
  std::filesystem::path path;
  std::string content;
};

/**
 * @brief Filesystem side of the artifact.
 *
 * The artifact lives at one of two well-known locations under the workspace:
 * `<workspace>/<artifact_dir>/<name>` (preferred) or `<workspace>/<name>`.
 * All writes go through an atomic temp-file-and-rename.
 */
class LocalArtifactStore {
 public:
  LocalArtifactStore(std::filesystem::path workspace_root,
                     std::string artifact_name,
                     std::string artifact_dir = ".github");

  const std::filesystem::path& workspaceRoot() const { return workspace_root_; }
  const std::string& artifactName() const { return artifact_name_; }

  // Candidate paths in preference order
  std::vector<std::filesystem::path> candidatePaths() const;

  // Where a new artifact is created
  std::filesystem::path defaultPath() const;

  // Current local replica, or nullopt when absent
  Result<std::optional<LocalArtifact>> load() const;

  // Atomic write, creating missing parent directories
  Result<void> write(const std::filesystem::path& path, const std::string& content) const;

  // Path relative to the workspace with '/' separators (for exclusion entries)
  std::string relativePath(const std::filesystem::path& path) const;

 private:
  std::filesystem::path workspace_root_;
  std::string artifact_name_;
  std::string artifact_dir_;
};

}  // namespace docsync::store
