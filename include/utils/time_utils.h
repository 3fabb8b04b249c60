#ifndef TIME_UTILS_H
#define TIME_UTILS_H

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#ifdef _WIN32
#include <errno.h>
#endif

namespace TimeUtils {

// ISO-8601 UTC timestamp with microseconds, e.g. 2024-05-01T12:00:00.000000+00:00.
inline std::string toIso8601Utc(std::chrono::system_clock::time_point point) {
  auto time_t = std::chrono::system_clock::to_time_t(point);
  auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                point.time_since_epoch()) %
            1000000;
  if (us.count() < 0)
    us += std::chrono::microseconds(1000000);

  std::stringstream ss;
  struct tm tm_buf;
#ifdef _WIN32
  errno_t err = gmtime_s(&tm_buf, &time_t);
  if (err != 0) {
    return "";
  }
#else
  std::tm *tm_ptr = gmtime_r(&time_t, &tm_buf);
  if (!tm_ptr) {
    return "";
  }
#endif
  ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
  ss << "." << std::setfill('0') << std::setw(6) << us.count() << "+00:00";
  return ss.str();
}

inline std::string currentIso8601Utc() {
  return toIso8601Utc(std::chrono::system_clock::now());
}

// Local wall-clock time with milliseconds, e.g. 2024-05-01 12:00:00.123.
inline std::string localTimestampMillis() {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  struct tm tm_buf;
#ifdef _WIN32
  localtime_s(&tm_buf, &time_t);
#else
  localtime_r(&time_t, &tm_buf);
#endif
  std::stringstream ss;
  ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0')
     << std::setw(3) << ms.count();
  return ss.str();
}

} // namespace TimeUtils

#endif
