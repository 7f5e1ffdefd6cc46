#pragma once

#include <chrono>
#include <string>

#include "docsync/common.hpp"

namespace docsync::util {

// Time utilities for RFC3339 formatting and parsing
class Time {
 public:
  // Format time as RFC3339 string (UTC, millisecond precision)
  static std::string toRfc3339(std::chrono::system_clock::time_point time);

  // Parse RFC3339 string to time_point. Accepts a 'Z' or +hh:mm offset and
  // any number of fractional digits (truncated to milliseconds).
  static Result<std::chrono::system_clock::time_point> fromRfc3339(const std::string& str);

  // Get current time
  static std::chrono::system_clock::time_point now();
};

}  // namespace docsync::util
