#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "docsync/common.hpp"

namespace docsync::store {

// Keeps the artifact out of version control via the workspace .gitignore
class ExclusionList {
 public:
  explicit ExclusionList(std::filesystem::path ignore_file);

  const std::filesystem::path& path() const { return ignore_file_; }

  // True when a line of `content` already covers `entry`: the entry itself,
  // its file name, or its directory as `dir/` or `dir/*`
  static bool covers(std::string_view content, std::string_view entry);

  // Appends `entry` unless covered. Returns true when the file was changed.
  Result<bool> ensureEntry(const std::string& entry) const;

 private:
  std::filesystem::path ignore_file_;
};

}  // namespace docsync::store
