#ifndef GLANCELAB_CORE_TIME_UTILS_HPP_
#define GLANCELAB_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace glancelab::core {

namespace detail {

inline bool ToUtcCalendar(std::chrono::system_clock::time_point timestamp, std::tm& utc_time) {
  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
#if defined(_WIN32)
  return gmtime_s(&utc_time, &epoch_seconds) == 0;
#else
  return gmtime_r(&epoch_seconds, &utc_time) != nullptr;
#endif
}

} // namespace detail

// ISO-8601 UTC with millisecond precision, used by log lines.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  std::tm utc_time{};
  if (!detail::ToUtcCalendar(timestamp, utc_time)) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

// Formats a timestamp with a caller-chosen strftime pattern in UTC.
// Run ids and default output file names use "%Y%m%d_%H%M%S" so they sort
// lexicographically by creation time.
inline std::string FormatUtcStamp(std::chrono::system_clock::time_point timestamp,
                                  std::string_view pattern) {
  std::tm utc_time{};
  if (!detail::ToUtcCalendar(timestamp, utc_time)) {
    return "";
  }

  const std::string owned_pattern(pattern);
  std::ostringstream out;
  out << std::put_time(&utc_time, owned_pattern.c_str());
  return out.str();
}

} // namespace glancelab::core

#endif // GLANCELAB_CORE_TIME_UTILS_HPP_
