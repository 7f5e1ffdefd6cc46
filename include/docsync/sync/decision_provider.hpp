#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "docsync/sync/sync_types.hpp"

namespace docsync::sync {

enum class Choice {
  kDownload,
  kUpload,
  kCreateTemplate,
  kConfirm,
  kCancel
};

std::string_view toString(Choice choice);

// Question put to the user when policy needs a human
struct DecisionRequest {
  ClassificationResult classification;
  std::string message;
  std::vector<Choice> options;  // Always ends with kCancel
};

/**
 * @brief Host-side prompt used by interactive passes.
 *
 * Implementations must return one of `request.options`; anything else is
 * treated as kCancel.
 */
class DecisionProvider {
 public:
  virtual ~DecisionProvider() = default;

  virtual Choice choose(const DecisionRequest& request) = 0;
};

}  // namespace docsync::sync
