#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"

namespace saga::util {

/*
  Time utilities. Single place to control the clock source.

  Persisted timestamps are unix milliseconds (wall clock). Backoff and
  breaker cool-downs use steady_clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);
uint64_t  NowMillis();

// Config durations; an unset Duration yields the fallback.
std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d, std::chrono::milliseconds fallback);

} // namespace saga::util
