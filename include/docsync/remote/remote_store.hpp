#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "docsync/common.hpp"

namespace docsync::remote {

// Remote replica of the artifact as read by fetch()
struct RemoteArtifact {
  std::string content;
  std::optional<std::chrono::system_clock::time_point> server_updated_at;
};

// Address of the replica after a successful put()
struct RemoteLocation {
  std::string id;
  std::string url;
};

/**
 * @brief Opaque remote replica of the artifact.
 *
 * fetch() returns nullopt when the replica or the artifact inside it does not
 * exist. Transport failures come back as an Error with one of kNetworkError,
 * kTimeout, kAuthError, kRateLimited or kRemoteError. Reads and writes are
 * whole-artifact; there are no partial results.
 */
class RemoteStore {
 public:
  virtual ~RemoteStore() = default;

  virtual Result<std::optional<RemoteArtifact>> fetch(const std::string& id) = 0;

  // Creates a replica when id is empty, otherwise overwrites it
  virtual Result<RemoteLocation> put(const std::optional<std::string>& id,
                                     const std::string& content) = 0;
};

}  // namespace docsync::remote
