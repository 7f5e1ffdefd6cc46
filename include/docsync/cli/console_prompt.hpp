#pragma once

#include <iosfwd>

#include "docsync/sync/decision_provider.hpp"

namespace docsync::cli {

// Numbered-menu prompt on a pair of streams. End of input cancels.
class ConsolePrompt : public sync::DecisionProvider {
public:
  ConsolePrompt(std::istream& in, std::ostream& out, bool assume_yes = false);

  sync::Choice choose(const sync::DecisionRequest& request) override;

private:
  std::istream& in_;
  std::ostream& out_;
  bool assume_yes_;
};

} // namespace docsync::cli
