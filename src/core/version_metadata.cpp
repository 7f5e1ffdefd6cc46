#include "docsync/core/version_metadata.hpp"

#include <cctype>
#include <charconv>
#include <regex>
#include <sstream>
#include <vector>

#include "docsync/util/time.hpp"

namespace docsync::core {

namespace {

// Whitespace around the fields is optional so hand-edited markers still match
const std::regex& markerRegex() {
  static const std::regex regex(
      R"(<!--\s*VERSION:\s*([^\s]+)\s*LAST_MODIFIED:\s*([^\s]+?)\s*-->)");
  return regex;
}

constexpr const char* kUnknownTimestamp = "unknown";

// Leading digits of a component, or nullopt if it has none
std::optional<std::int64_t> parseComponent(const std::string& component) {
  size_t i = 0;
  while (i < component.size() && std::isspace(static_cast<unsigned char>(component[i]))) {
    ++i;
  }
  size_t start = i;
  while (i < component.size() && std::isdigit(static_cast<unsigned char>(component[i]))) {
    ++i;
  }
  if (i == start) {
    return std::nullopt;
  }

  std::int64_t value = 0;
  auto [ptr, ec] = std::from_chars(component.data() + start, component.data() + i, value);
  if (ec == std::errc::result_out_of_range) {
    return SemVer::kMaxComponent;
  }
  if (ec != std::errc()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::string SemVer::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  return oss.str();
}

SemVer SemVer::parseLenient(std::string_view text) {
  SemVer version;

  std::vector<std::string> parts;
  std::string current;
  for (char c : text) {
    if (c == '.') {
      parts.push_back(current);
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  parts.push_back(current);

  if (parts.size() >= 1) {
    if (auto value = parseComponent(parts[0]); value && *value > 0) {
      version.major = *value;
    }
  }
  if (parts.size() >= 2) {
    if (auto value = parseComponent(parts[1])) {
      version.minor = *value;
    }
  }
  if (parts.size() >= 3) {
    if (auto value = parseComponent(parts[2])) {
      version.patch = *value;
    }
  }

  return version;
}

std::optional<VersionMetadata> VersionMetadataCodec::extract(std::string_view text) {
  std::match_results<std::string_view::const_iterator> match;
  if (!std::regex_search(text.begin(), text.end(), match, markerRegex())) {
    return std::nullopt;
  }

  VersionMetadata metadata;
  metadata.version = SemVer::parseLenient(match[1].str());

  auto timestamp = util::Time::fromRfc3339(match[2].str());
  if (timestamp.has_value()) {
    metadata.last_modified = *timestamp;
  }

  return metadata;
}

std::string VersionMetadataCodec::formatMarker(const VersionMetadata& metadata) {
  std::string timestamp = metadata.last_modified
      ? util::Time::toRfc3339(*metadata.last_modified)
      : std::string(kUnknownTimestamp);
  return "<!-- VERSION: " + metadata.version.toString() + " LAST_MODIFIED: " + timestamp + " -->";
}

std::string VersionMetadataCodec::inject(std::string_view text, const VersionMetadata& metadata) {
  const std::string marker = formatMarker(metadata);

  std::match_results<std::string_view::const_iterator> match;
  if (std::regex_search(text.begin(), text.end(), match, markerRegex())) {
    auto begin = static_cast<size_t>(match.position(0));
    auto length = static_cast<size_t>(match.length(0));
    std::string result;
    result.reserve(text.size() + marker.size());
    result.append(text.substr(0, begin));
    result.append(marker);
    result.append(text.substr(begin + length));
    return result;
  }

  std::string result;
  result.reserve(text.size() + marker.size() + 1);
  result.append(marker);
  result.push_back('\n');
  result.append(text);
  return result;
}

SemVer VersionMetadataCodec::nextVersion(std::string_view current_text) {
  SemVer version;
  if (auto metadata = extract(current_text)) {
    version = metadata->version;
  }
  if (version.patch < SemVer::kMaxComponent) {
    version.patch += 1;
  } else if (version.minor < SemVer::kMaxComponent) {
    version.minor += 1;
    version.patch = 0;
  } else if (version.major < SemVer::kMaxComponent) {
    version.major += 1;
    version.minor = 0;
    version.patch = 0;
  }
  return version;
}

std::string VersionMetadataCodec::strip(std::string_view text) {
  std::match_results<std::string_view::const_iterator> match;
  if (!std::regex_search(text.begin(), text.end(), match, markerRegex())) {
    return std::string(text);
  }

  auto begin = static_cast<size_t>(match.position(0));
  auto end = begin + static_cast<size_t>(match.length(0));
  if (end < text.size() && text[end] == '\n') {
    ++end;
  }

  std::string result;
  result.reserve(text.size() - (end - begin));
  result.append(text.substr(0, begin));
  result.append(text.substr(end));
  return result;
}

}  // namespace docsync::core
