#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace hive::util {

/*
  Time utilities. The clock source lives here.

  Every persisted timestamp is epoch milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
uint64_t NowMillis();

// 2026-01-31T12:00:00.000Z
std::string FormatUnixMillis(uint64_t ms);

} // namespace hive::util
