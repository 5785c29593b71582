#pragma once

#include <chrono>
#include <string>

namespace ragkit_core {

// Storage format, UTC with milliseconds: "YYYY-MM-DD HH:MM:SS.mmm".
std::string time_point_to_string(const std::chrono::system_clock::time_point& tp);
std::chrono::system_clock::time_point string_to_time_point(const std::string& time_str);

// ISO-8601 UTC, e.g. "2024-05-01T12:30:00Z".
std::string to_iso8601(const std::chrono::system_clock::time_point& tp);

}  // namespace ragkit_core
