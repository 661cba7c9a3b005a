#pragma once

#include <chrono>
#include <cstdint>

namespace flowlog::util {

/*
  Time utilities. Persisted timestamps are unix millis.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// Now() in unix millis; the unit every persisted timestamp uses.
uint64_t NowMillis();

} // namespace flowlog::util
