#include "noted/util/time.hpp"

#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace noted::util {

std::string Time::toRfc3339(std::chrono::system_clock::time_point time) {
  auto time_t = std::chrono::system_clock::to_time_t(time);
  auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(
      time.time_since_epoch()) % 1000;
  if (milliseconds.count() < 0) {
    milliseconds += std::chrono::milliseconds(1000);
    --time_t;
  }

  std::tm tm{};
  gmtime_r(&time_t, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << milliseconds.count() << 'Z';

  return oss.str();
}

Result<std::chrono::system_clock::time_point> Time::fromRfc3339(const std::string& str) {
  static const std::regex rfc3339_regex(
      R"((\d{4})-(\d{2})-(\d{2})T(\d{2}):(\d{2}):(\d{2})(?:\.(\d{1,9}))?Z)");

  std::smatch match;
  if (!std::regex_match(str, match, rfc3339_regex)) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid RFC3339 format: " + str));
  }

  std::tm tm = {};
  tm.tm_year = std::stoi(match[1]) - 1900;
  tm.tm_mon = std::stoi(match[2]) - 1;
  tm.tm_mday = std::stoi(match[3]);
  tm.tm_hour = std::stoi(match[4]);
  tm.tm_min = std::stoi(match[5]);
  tm.tm_sec = std::stoi(match[6]);

  if (tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
      tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid time values: " + str));
  }

  // The string is UTC, so timegm rather than mktime
  auto time_t = timegm(&tm);
  if (time_t == -1) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid time values: " + str));
  }

  auto time_point = std::chrono::system_clock::from_time_t(time_t);

  // Fractional seconds, truncated to milliseconds
  if (match[7].matched) {
    std::string fraction = match[7].str();
    fraction.resize(3, '0');
    time_point += std::chrono::milliseconds(std::stoi(fraction));
  }

  return time_point;
}

std::chrono::system_clock::time_point Time::now() {
  return std::chrono::system_clock::now();
}

std::string Time::formatDuration(std::chrono::nanoseconds elapsed) {
  using namespace std::chrono;

  std::ostringstream oss;
  oss << std::fixed << std::setprecision(3);

  if (elapsed < microseconds(1000)) {
    oss.unsetf(std::ios_base::floatfield);
    oss << duration_cast<microseconds>(elapsed).count() << "us";
  } else if (elapsed < seconds(1)) {
    oss << duration_cast<duration<double, std::milli>>(elapsed).count() << "ms";
  } else {
    oss << duration_cast<duration<double>>(elapsed).count() << "s";
  }

  return oss.str();
}

}  // namespace noted::util
