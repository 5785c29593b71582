#include "ragkit_core/utils/time_utils.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace ragkit_core {

namespace {

std::tm to_utc_tm(const std::chrono::system_clock::time_point& tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_struct = {};
  gmtime_r(&time_t, &tm_struct);
  return tm_struct;
}

}  // namespace

std::string time_point_to_string(const std::chrono::system_clock::time_point& tp) {
  auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
  if (millis < 0) {
    millis += 1000;
  }
  std::tm tm_struct = to_utc_tm(tp);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3)
     << std::setfill('0') << millis;
  return ss.str();
}

std::chrono::system_clock::time_point string_to_time_point(const std::string& time_str) {
  std::tm tm_struct = {};
  std::stringstream ss(time_str);
  ss >> std::get_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  if (ss.fail()) {
    throw std::runtime_error("Failed to parse time string: " + time_str +
                             ". Expected format YYYY-MM-DD HH:MM:SS.mmm");
  }
  int millis = 0;
  if (ss.peek() == '.') {
    ss.get();
    ss >> millis;
  }
  // Stored as GMT.
  return std::chrono::system_clock::from_time_t(timegm(&tm_struct)) +
         std::chrono::milliseconds(millis);
}

std::string to_iso8601(const std::chrono::system_clock::time_point& tp) {
  std::tm tm_struct = to_utc_tm(tp);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%dT%H:%M:%SZ");
  return ss.str();
}

}  // namespace ragkit_core
