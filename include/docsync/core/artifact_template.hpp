#pragma once

#include <chrono>
#include <string>

namespace docsync::core {

// Starter content written when neither replica exists
class ArtifactTemplate {
 public:
  // Template body prefixed with a 1.0.0 marker stamped with `now`
  static std::string render(std::chrono::system_clock::time_point now);

  // Template body without marker
  static const std::string& body();
};

}  // namespace docsync::core
