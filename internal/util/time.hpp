#pragma once

#include <chrono>
#include <cstdint>

namespace medsync::util {

/*
  Time utilities: single place to control clock source later.

  Eligibility times are wall-clock because they are persisted across restarts.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

} // namespace medsync::util
