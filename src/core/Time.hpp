// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace agentlink
{

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/// @brief Source of the current wall-clock time. Injected where cooldowns are evaluated.
using NowFunction = std::function<TimePoint()>;

/// @brief Returns the system clock as a NowFunction.
[[nodiscard]] inline auto systemNow() -> NowFunction
{
    return [] { return Clock::now(); };
}

/// @brief Converts a time point to milliseconds since the Unix epoch (the persisted form).
[[nodiscard]] inline auto toEpochMillis(TimePoint tp) -> int64_t
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

/// @brief Converts milliseconds since the Unix epoch back to a time point.
[[nodiscard]] inline auto fromEpochMillis(int64_t millis) -> TimePoint
{
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(millis)));
}

} // namespace agentlink
