#include "docsync/store/local_artifact_store.hpp"

#include <spdlog/spdlog.h>

#include "docsync/util/filesystem.hpp"

namespace docsync::store {

LocalArtifactStore::LocalArtifactStore(std::filesystem::path workspace_root,
                                       std::string artifact_name,
                                       std::string artifact_dir)
    : workspace_root_(std::move(workspace_root)),
      artifact_name_(std::move(artifact_name)),
      artifact_dir_(std::move(artifact_dir)) {}

std::vector<std::filesystem::path> LocalArtifactStore::candidatePaths() const {
  std::vector<std::filesystem::path> paths;
  if (!artifact_dir_.empty()) {
    paths.push_back(workspace_root_ / artifact_dir_ / artifact_name_);
  }
  paths.push_back(workspace_root_ / artifact_name_);
  return paths;
}

std::filesystem::path LocalArtifactStore::defaultPath() const {
  return candidatePaths().front();
}

Result<std::optional<LocalArtifact>> LocalArtifactStore::load() const {
  for (const auto& path : candidatePaths()) {
    auto content = util::FileSystem::readFileIfExists(path);
    if (!content.has_value()) {
      return std::unexpected(content.error());
    }
    if (content->has_value()) {
      spdlog::debug("Local artifact found at {}", path.string());
      return std::optional<LocalArtifact>(LocalArtifact{path, std::move(**content)});
    }
  }
  return std::optional<LocalArtifact>{};
}

Result<void> LocalArtifactStore::write(const std::filesystem::path& path,
                                       const std::string& content) const {
  auto result = util::FileSystem::writeFileAtomic(path, content);
  if (!result.has_value()) {
    spdlog::error("Failed to write {}: {}", path.string(), result.error().message());
    return result;
  }
  spdlog::debug("Wrote {} bytes to {}", content.size(), path.string());
  return {};
}

std::string LocalArtifactStore::relativePath(const std::filesystem::path& path) const {
  std::error_code ec;
  auto relative = std::filesystem::relative(path, workspace_root_, ec);
  if (ec || relative.empty() || *relative.begin() == "..") {
    return path.filename().generic_string();
  }
  return relative.generic_string();
}

}  // namespace docsync::store
