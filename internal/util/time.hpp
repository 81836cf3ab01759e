#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace loyalty::util {

/*
  Time utilities: single place to control clock source.

  Persisted timestamps are signed unix milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using ClockFn   = std::function<TimePoint()>;

TimePoint Now();

std::int64_t ToUnixMillis(TimePoint tp);
TimePoint    FromUnixMillis(std::int64_t ms);

std::int64_t DurationMillis(std::chrono::milliseconds d);

} // namespace loyalty::util
