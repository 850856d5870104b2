#ifndef TIME_UTILS_H
#define TIME_UTILS_H

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

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

// UTC, second precision, e.g. "2024-05-01T12:30:00Z".
inline std::string toIso8601(std::chrono::system_clock::time_point tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  struct tm tm_buf;
  if (!gmtime_r(&time_t, &tm_buf)) {
    return "";
  }
  std::ostringstream ss;
  ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
  return ss.str();
}

inline bool fromIso8601(const std::string &value,
                        std::chrono::system_clock::time_point &out) {
  std::tm tm_buf{};
  std::istringstream ss(value);
  ss >> std::get_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
  if (ss.fail()) {
    return false;
  }
  out = std::chrono::system_clock::from_time_t(timegm(&tm_buf));
  return true;
}

// Local time packed as yyyymmddHHMMSS.
inline std::string compactTimestamp(std::chrono::system_clock::time_point tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  struct tm tm_buf;
  if (!localtime_r(&time_t, &tm_buf)) {
    return "";
  }
  std::ostringstream ss;
  ss << std::put_time(&tm_buf, "%Y%m%d%H%M%S");
  return ss.str();
}

// Renders a duration the way progress output shows it: "45s", "5m30s",
// "2h3m0s". Sub-second remainders are truncated.
inline std::string formatDuration(std::chrono::milliseconds duration) {
  long long totalSeconds = duration.count() / 1000;
  if (totalSeconds < 0) {
    totalSeconds = 0;
  }
  long long hours = totalSeconds / 3600;
  long long minutes = (totalSeconds % 3600) / 60;
  long long seconds = totalSeconds % 60;

  std::ostringstream ss;
  if (hours > 0) {
    ss << hours << "h" << minutes << "m" << seconds << "s";
  } else if (minutes > 0) {
    ss << minutes << "m" << seconds << "s";
  } else {
    ss << seconds << "s";
  }
  return ss.str();
}

} // namespace TimeUtils

#endif
