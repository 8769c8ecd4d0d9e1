#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace rentledger::util {

/*
  Time utilities. Single place to control the clock source.

  Ledger timestamps are unix seconds. The host takes a ClockFn so tests can
  pin the ledger time.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using ClockFn   = std::function<TimePoint()>;

TimePoint Now();

TimePoint FromUnixSeconds(std::uint64_t seconds);

std::uint64_t ToUnixSeconds(TimePoint tp);

} // namespace rentledger::util
