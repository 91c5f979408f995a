#pragma once

#include <chrono>
#include <cstdint>

namespace roster::util {

/*
  Time utilities. Single place to control the clock source.

  Records carry unix seconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t ToUnixSeconds(TimePoint tp);
int64_t UnixNow();

uint64_t ToUnixMillis(TimePoint tp);

} // namespace roster::util
