#pragma once

#include <chrono>
#include <string>

namespace sftpgate::core {

namespace timeutil {

// RFC 3339 in UTC with nanosecond precision, trailing zeros of the fraction trimmed.
// e.g. 2024-05-01T10:20:30.1234Z
std::string FormatRfc3339(std::chrono::system_clock::time_point tp);

// Compact duration notation: "0s", "850ns", "12.5µs", "250ms", "1.5s", "2m3.25s", "1h0m5s".
std::string FormatDuration(std::chrono::nanoseconds d);

} // namespace timeutil

} // namespace sftpgate::core
