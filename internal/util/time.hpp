#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace roipack::util {

/*
  Time utilities: one place for the clock source and UTC rendering.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

// YYYY-MM-DDTHH:MM:SS.sssZ
std::string ToIso8601(TimePoint tp);

// YYYY-MM-DD, UTC calendar date
std::string ToCalendarDate(TimePoint tp);

} // namespace roipack::util
