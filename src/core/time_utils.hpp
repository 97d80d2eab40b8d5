#ifndef PINGWATCH_CORE_TIME_UTILS_HPP_
#define PINGWATCH_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace pingwatch::core {

// Canonical UTC timestamp formatter used by the operational logger.
// Millisecond precision keeps traces readable while preserving triage value.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
#if defined(_WIN32)
  const errno_t result = gmtime_s(&utc_time, &epoch_seconds);
  if (result != 0) {
    return "";
  }
#else
  const std::tm* result = gmtime_r(&epoch_seconds, &utc_time);
  if (result == nullptr) {
    return "";
  }
#endif

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

// Wall-clock seconds since epoch with sub-second precision, the same unit ping
// prints inside its `[...]` prefix.
inline double WallClockSeconds() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration<double>(now).count();
}

// Formats epoch seconds through a strftime pattern.
//
// Contract:
// - fractional seconds are truncated toward negative infinity.
// - `utc` selects gmtime instead of the process-local timezone.
// - returns false (and leaves `formatted` empty) when the value does not fit
//   time_t or cannot be represented as a calendar time.
inline bool FormatEpochSeconds(double epoch_seconds, std::string_view pattern, bool utc,
                               std::string& formatted) {
  formatted.clear();
  if (!std::isfinite(epoch_seconds)) {
    return false;
  }

  // The cast below is only defined for values time_t can hold. max() itself
  // rounds up to the next power of two as a double, hence `>=`.
  const double floored = std::floor(epoch_seconds);
  if (floored < static_cast<double>(std::numeric_limits<std::time_t>::min()) ||
      floored >= static_cast<double>(std::numeric_limits<std::time_t>::max())) {
    return false;
  }

  const std::time_t whole_seconds = static_cast<std::time_t>(floored);
  std::tm calendar{};
#if defined(_WIN32)
  const errno_t result =
      utc ? gmtime_s(&calendar, &whole_seconds) : localtime_s(&calendar, &whole_seconds);
  if (result != 0) {
    return false;
  }
#else
  const std::tm* result =
      utc ? gmtime_r(&whole_seconds, &calendar) : localtime_r(&whole_seconds, &calendar);
  if (result == nullptr) {
    return false;
  }
#endif

  if (pattern.empty()) {
    return true;
  }

  // strftime reports 0 both for "buffer too small" and for patterns that
  // legitimately expand to nothing, so grow a few times before giving up.
  const std::string pattern_text(pattern);
  std::vector<char> buffer(64 + pattern_text.size() * 4);
  for (int attempt = 0; attempt < 4; ++attempt) {
    const std::size_t written =
        std::strftime(buffer.data(), buffer.size(), pattern_text.c_str(), &calendar);
    if (written > 0U) {
      formatted.assign(buffer.data(), written);
      return true;
    }
    buffer.resize(buffer.size() * 4);
  }
  return true;
}

} // namespace pingwatch::core

#endif // PINGWATCH_CORE_TIME_UTILS_HPP_
