#pragma once
#include <chrono>
#include <optional>
#include <string>

namespace ipscout {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// ISO-8601 UTC with microseconds, e.g. 2025-03-14T09:26:53.589793Z
std::string format_iso8601(TimePoint tp);

// Accepts "YYYY-MM-DDTHH:MM:SS", optional ".ffffff" fraction, optional "Z" or
// "+HH:MM" / "-HH:MM" zone. A missing zone is read as UTC.
std::optional<TimePoint> parse_iso8601(const std::string& text);

// "YYYY-MM-DD HH:MM:SS" in local time, for tables.
std::string format_local(TimePoint tp);

} // namespace ipscout
