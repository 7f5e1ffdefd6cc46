#include "docsync/store/exclusion_list.hpp"

#include <spdlog/spdlog.h>

#include "docsync/util/filesystem.hpp"

namespace docsync::store {

namespace {

std::string_view trim(std::string_view s) {
  constexpr std::string_view kWhitespace = " \t\r\n";
  auto first = s.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = s.find_last_not_of(kWhitespace);
  return s.substr(first, last - first + 1);
}

}  // namespace

ExclusionList::ExclusionList(std::filesystem::path ignore_file)
    : ignore_file_(std::move(ignore_file)) {}

bool ExclusionList::covers(std::string_view content, std::string_view entry) {
  std::string_view name = entry;
  std::string dir_slash;
  std::string dir_star;
  if (auto slash = entry.rfind('/'); slash != std::string_view::npos) {
    name = entry.substr(slash + 1);
    std::string_view dir = entry.substr(0, slash);
    dir_slash = std::string(dir) + "/";
    dir_star = std::string(dir) + "/*";
  }

  size_t pos = 0;
  while (pos <= content.size()) {
    size_t end = content.find('\n', pos);
    if (end == std::string_view::npos) {
      end = content.size();
    }
    std::string_view line = trim(content.substr(pos, end - pos));
    if (!line.empty()) {
      if (line == entry || line == name) return true;
      if (!dir_slash.empty() && (line == dir_slash || line == dir_star)) return true;
    }
    pos = end + 1;
  }
  return false;
}

Result<bool> ExclusionList::ensureEntry(const std::string& entry) const {
  auto existing = util::FileSystem::readFileIfExists(ignore_file_);
  if (!existing.has_value()) {
    return std::unexpected(existing.error());
  }

  std::string content = existing->value_or(std::string{});
  if (existing->has_value() && covers(content, entry)) {
    spdlog::debug("{} already covered in {}", entry, ignore_file_.string());
    return false;
  }

  if (!content.empty() && content.back() != '\n') {
    content += '\n';
  }
  content += entry;
  content += '\n';

  auto written = util::FileSystem::writeFileAtomic(ignore_file_, content);
  if (!written.has_value()) {
    return std::unexpected(written.error());
  }

  spdlog::info("{} {} with {} entry", existing->has_value() ? "Updated" : "Created",
               ignore_file_.string(), entry);
  return true;
}

}  // namespace docsync::store
