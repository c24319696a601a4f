#pragma once

#include <string>
#include <chrono>

namespace timeutil {

// ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T12:00:00.250Z
std::string format_time(std::chrono::system_clock::time_point tp);

// Accepts what format_time produces; the fraction and the trailing Z are
// optional. Throws std::invalid_argument.
std::chrono::system_clock::time_point parse_time(const std::string& text);

} // namespace timeutil
