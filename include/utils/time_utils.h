#ifndef TIME_UTILS_H
#define TIME_UTILS_H

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace TimeUtils {

inline std::string getCurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::stringstream ss;
  struct tm tm_buf;
  std::tm *tm_ptr = localtime_r(&time_t, &tm_buf);
  if (!tm_ptr) {
    return "";
  }
  ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  ss << "." << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

// yyyyMMddHHmmss in local time, used to name backup units.
inline std::string getCompactTimestamp() {
  auto time_t = std::chrono::system_clock::to_time_t(
      std::chrono::system_clock::now());
  struct tm tm_buf;
  if (!localtime_r(&time_t, &tm_buf)) {
    return "";
  }
  std::stringstream ss;
  ss << std::put_time(&tm_buf, "%Y%m%d%H%M%S");
  return ss.str();
}

// 2024-05-01T12:30:00.250Z
std::string toIso8601(std::chrono::system_clock::time_point tp);

// Parses "YYYY-MM-DD", "YYYY-MM-DD HH:MM[:SS[.fraction]]" and the same with a
// 'T' separator and an optional "Z" / "+HH:MM" / "-HHMM" offset. The result is
// microseconds since the Unix epoch, UTC. Zero dates and out-of-range fields
// yield std::nullopt.
std::optional<int64_t> parseDateTimeMicros(std::string_view text);

// Renders microseconds since the epoch as "YYYY-MM-DD<sep>HH:MM:SS" with a
// ".ffffff" fraction only when it is non-zero, plus a trailing 'Z' when
// withZone is set.
std::string formatDateTimeMicros(int64_t micros, char separator,
                                 bool withZone);

} // namespace TimeUtils

#endif
