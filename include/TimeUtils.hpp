#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace nassync {

class TimeUtils {
public:
  // UTC ISO-8601 with second precision, e.g. "2024-05-01T12:30:00Z"
  static std::string toIsoString(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
  }

  static std::string nowIso() {
    return toIsoString(std::chrono::system_clock::now());
  }
};

} // namespace nassync
