#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace docsync::core {

// Three-component version carried in the artifact marker
struct SemVer {
  static constexpr std::int64_t kMaxComponent = std::numeric_limits<std::int64_t>::max();

  std::int64_t major = 1;
  std::int64_t minor = 0;
  std::int64_t patch = 0;

  std::string toString() const;

  // Lenient parse: missing or non-numeric components fall back to 1.0.0 defaults,
  // components beyond kMaxComponent saturate
  static SemVer parseLenient(std::string_view text);

  auto operator<=>(const SemVer&) const = default;
};

// {version, lastModified} embedded in the artifact as a single marker line:
//   <!-- VERSION: 1.0.3 LAST_MODIFIED: 2025-01-01T10:00:00.000Z -->
// The marker stores last_modified at millisecond precision; a missing
// timestamp is written as "unknown".
struct VersionMetadata {
  SemVer version;
  std::optional<std::chrono::system_clock::time_point> last_modified;

  bool operator==(const VersionMetadata&) const = default;
};

/**
 * @brief Encodes and decodes the version marker.
 *
 * The marker text never leaves this class: callers work with VersionMetadata.
 * Parsing never fails loudly; a missing or malformed marker is reported as
 * absence and downstream code applies the 1.0.0 default.
 */
class VersionMetadataCodec {
 public:
  // Parsed marker, or nullopt when none is present
  static std::optional<VersionMetadata> extract(std::string_view text);

  // Replace the existing marker in place, or prepend a new marker line
  static std::string inject(std::string_view text, const VersionMetadata& metadata);

  // Current embedded version (1.0.0 when absent) with patch incremented; a
  // saturated patch carries into minor, then major
  static SemVer nextVersion(std::string_view current_text);

  // Text with the first marker (and one directly following newline) removed
  static std::string strip(std::string_view text);

  // Marker line for the given metadata, without trailing newline
  static std::string formatMarker(const VersionMetadata& metadata);
};

}  // namespace docsync::core
