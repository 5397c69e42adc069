#pragma once

#include <chrono>
#include <string>

#include "noted/common.hpp"

namespace noted::util {

// Time utilities for RFC3339 formatting and parsing
class Time {
 public:
  // Format time as RFC3339 UTC string with milliseconds (2021-01-01T00:00:00.000Z)
  static std::string toRfc3339(std::chrono::system_clock::time_point time);

  // Parse RFC3339 UTC string to time_point
  static Result<std::chrono::system_clock::time_point> fromRfc3339(const std::string& str);

  // Get current time
  static std::chrono::system_clock::time_point now();

  // Format a request duration for log lines ("850us", "12.345ms", "2.010s")
  static std::string formatDuration(std::chrono::nanoseconds elapsed);
};

}  // namespace noted::util
