#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace circulate::util {

/*
  Time utilities. Single place to control the clock source.

  Components that reason about expiry take a ClockFn so tests can drive time.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using ClockFn   = std::function<TimePoint()>;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

} // namespace circulate::util
