#include "docsync/util/time.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace docsync::util {

std::string Time::toRfc3339(std::chrono::system_clock::time_point time) {
  auto seconds = std::chrono::floor<std::chrono::seconds>(time);
  auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(time - seconds);
  auto time_t = std::chrono::system_clock::to_time_t(seconds);

  std::tm tm = {};
  gmtime_r(&time_t, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << milliseconds.count() << 'Z';

  return oss.str();
}

Result<std::chrono::system_clock::time_point> Time::fromRfc3339(const std::string& str) {
  static const std::regex rfc3339_regex(
      R"((\d{4})-(\d{2})-(\d{2})[Tt ](\d{2}):(\d{2}):(\d{2})(?:\.(\d+))?(Z|z|[+-]\d{2}:\d{2})?)");

  std::smatch match;
  if (!std::regex_match(str, match, rfc3339_regex)) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid RFC3339 format: " + str));
  }

  const std::chrono::year_month_day date{
      std::chrono::year(std::stoi(match[1])),
      std::chrono::month(static_cast<unsigned>(std::stoi(match[2]))),
      std::chrono::day(static_cast<unsigned>(std::stoi(match[3])))};
  const int hour = std::stoi(match[4]);
  const int minute = std::stoi(match[5]);
  const int second = std::stoi(match[6]);

  if (!date.ok() || hour > 23 || minute > 59 || second > 60) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid time values: " + str));
  }

  // Timestamps are UTC on the wire
  std::chrono::system_clock::time_point time_point =
      std::chrono::sys_days(date) + std::chrono::hours(hour) +
      std::chrono::minutes(minute) + std::chrono::seconds(second);

  if (match[7].matched) {
    std::string fraction = match[7].str().substr(0, 3);
    while (fraction.size() < 3) {
      fraction.push_back('0');
    }
    time_point += std::chrono::milliseconds(std::stoi(fraction));
  }

  if (match[8].matched) {
    const std::string zone = match[8].str();
    if (zone != "Z" && zone != "z") {
      int hours = std::stoi(zone.substr(1, 2));
      int minutes = std::stoi(zone.substr(4, 2));
      auto offset = std::chrono::hours(hours) + std::chrono::minutes(minutes);
      // Local time = UTC + offset
      if (zone[0] == '+') {
        time_point -= offset;
      } else {
        time_point += offset;
      }
    }
  }

  return time_point;
}

std::chrono::system_clock::time_point Time::now() {
  return std::chrono::system_clock::now();
}

}  // namespace docsync::util
