#pragma once
/*
 * Timestamp
 *
 * Purpose: RFC 3339 text <-> system_clock time points, nanosecond precision.
 * Format: 2024-05-01T10:02:03.5+02:00 (fraction trimmed, Z for UTC).
 */
#include <chrono>
#include <string>

using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

Timestamp now_timestamp();

// offset_seconds is added to UTC to obtain the printed wall clock
std::string format_timestamp(Timestamp t, int offset_seconds);
// uses the local UTC offset in effect at t
std::string format_timestamp(Timestamp t);

bool parse_timestamp(const std::string& text, Timestamp& out, std::string& msg);
