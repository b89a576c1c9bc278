#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace tasktrack::time {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// RFC 3339 in UTC with up to nine fractional digits, trailing zeros trimmed:
// "2026-10-19T08:15:30.5Z".
std::string format_rfc3339(TimePoint tp);

// Accepts "Z" or a numeric "+hh:mm" / "-hh:mm" offset and 0..9 fractional digits.
// Instants outside the nanosecond range (about 1678..2262) yield nullopt.
std::optional<TimePoint> parse_rfc3339(std::string_view text);

// "19 Oct 26 10:15 CEST", local time.
std::string format_display(TimePoint tp);

}
