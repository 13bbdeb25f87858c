#pragma once

#include <chrono>

namespace turbo {

/// Alias some types to make it easier to use.
/// Deadlines and timeouts are measured with steady_clock as they must not jump with wall clock adjustments.
using SysClock = std::chrono::system_clock;
using SysTimePoint = SysClock::time_point;
using SysDuration = SysClock::duration;

using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

}  // namespace turbo
