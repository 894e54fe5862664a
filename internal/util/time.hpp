#pragma once

#include <chrono>
#include <cstdint>

namespace dbtarget::util {

/*
  Time utilities. Single place to control the clock source.

  Rows persist timestamps as signed epoch nanoseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

std::int64_t ToUnixNanos(TimePoint tp);
TimePoint    FromUnixNanos(std::int64_t nanos);

std::int64_t ToUnixMillis(TimePoint tp);

} // namespace dbtarget::util
