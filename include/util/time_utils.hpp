#pragma once

#include <chrono>
#include <string>

namespace fwfleet {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

// "2024-10-01T12:34:56Z"
std::string FormatIso8601Utc(TimePoint tp);
std::string UtcNowIso8601();

// "2024-10-01"
std::string FormatDateUtc(TimePoint tp);
std::string UtcToday();

// Date part of an ISO-8601 timestamp, or the input when it is already a date.
std::string DatePart(const std::string& timestamp);

} // namespace fwfleet
