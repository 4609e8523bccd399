#ifndef TIME_UTILS_H
#define TIME_UTILS_H

#include <chrono>
#include <cstdint>
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

// "42s", "3m 5s", "2h 0m 7s". Negative input is treated as zero.
inline std::string formatDuration(double seconds) {
  if (seconds < 0)
    seconds = 0;
  int64_t total = static_cast<int64_t>(seconds);
  int64_t hours = total / 3600;
  int64_t minutes = (total % 3600) / 60;
  int64_t secs = total % 60;

  std::ostringstream oss;
  if (hours > 0) {
    oss << hours << "h " << minutes << "m " << secs << "s";
  } else if (minutes > 0) {
    oss << minutes << "m " << secs << "s";
  } else {
    oss << secs << "s";
  }
  return oss.str();
}

inline double secondsSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                       start)
      .count();
}

} // namespace TimeUtils

#endif
