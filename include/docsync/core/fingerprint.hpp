#pragma once

#include <string>
#include <string_view>

namespace docsync::core {

// Content identity of an artifact, independent of its version marker
class Fingerprint {
 public:
  // Marker-stripped, whitespace-trimmed text that the digest is computed over
  static std::string normalize(std::string_view text);

  // Lowercase hex SHA-256 of normalize(text). Throws std::runtime_error if
  // the digest backend fails.
  static std::string compute(std::string_view text);

  static bool equal(std::string_view a, std::string_view b);
};

}  // namespace docsync::core
