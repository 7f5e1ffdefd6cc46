#include "docsync/cli/console_prompt.hpp"

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>
#include <string>

namespace docsync::cli {

namespace {

std::string label(sync::Choice choice) {
  switch (choice) {
    case sync::Choice::kDownload: return "Download remote version";
    case sync::Choice::kUpload: return "Upload local version";
    case sync::Choice::kCreateTemplate: return "Create template";
    case sync::Choice::kConfirm: return "Yes";
    case sync::Choice::kCancel: return "Cancel";
  }
  return "Cancel";
}

// First letter shortcut: d, u, t, y, c (n also cancels)
bool matchesShortcut(sync::Choice choice, char c) {
  switch (choice) {
    case sync::Choice::kDownload: return c == 'd';
    case sync::Choice::kUpload: return c == 'u';
    case sync::Choice::kCreateTemplate: return c == 't';
    case sync::Choice::kConfirm: return c == 'y';
    case sync::Choice::kCancel: return c == 'c' || c == 'n';
  }
  return false;
}

}  // namespace

ConsolePrompt::ConsolePrompt(std::istream& in, std::ostream& out, bool assume_yes)
    : in_(in), out_(out), assume_yes_(assume_yes) {}

sync::Choice ConsolePrompt::choose(const sync::DecisionRequest& request) {
  if (request.options.empty()) {
    return sync::Choice::kCancel;
  }
  if (assume_yes_) {
    return request.options.front();
  }

  out_ << request.message << "\n";
  for (size_t i = 0; i < request.options.size(); ++i) {
    out_ << "  " << (i + 1) << ") " << label(request.options[i]) << "\n";
  }

  for (int attempt = 0; attempt < 3; ++attempt) {
    out_ << "Choice [1-" << request.options.size() << "]: " << std::flush;

    std::string line;
    if (!std::getline(in_, line)) {
      out_ << "\n";
      return sync::Choice::kCancel;
    }

    line.erase(0, line.find_first_not_of(" \t"));
    line.erase(line.find_last_not_of(" \t\r") + 1);
    if (line.empty()) {
      continue;
    }

    if (line.size() <= 3 &&
        std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isdigit(c); })) {
      size_t index = std::stoul(line);
      if (index >= 1 && index <= request.options.size()) {
        return request.options[index - 1];
      }
    } else {
      char c = static_cast<char>(std::tolower(static_cast<unsigned char>(line.front())));
      for (auto option : request.options) {
        if (matchesShortcut(option, c)) {
          return option;
        }
      }
    }
    out_ << "Invalid choice\n";
  }

  return sync::Choice::kCancel;
}

} // namespace docsync::cli
