#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <cstdint>

using TimePoint = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;
using ClockFn   = std::function<TimePoint()>;

namespace NTimeUtils {
    // wall clock truncated to milliseconds, the resolution every timestamp in the protocol carries
    TimePoint                now();
    ClockFn                  systemClock();

    int64_t                  toEpochMs(const TimePoint& tp);
    TimePoint                fromEpochMs(int64_t ms);

    // YYYY-MM-DDTHH:MM:SS.mmmZ
    std::string              toIso8601(const TimePoint& tp);
    std::optional<TimePoint> fromIso8601(std::string_view str);

    bool                     patternsCompiled();
};
