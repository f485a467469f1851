#include "TimeUtils.hpp"

#include <ctime>

#include <fmt/format.h>
#include <re2/re2.h>

#include "../debug/log.hpp"

static const re2::RE2 ISO_RE(R"((\d{4})-(\d{2})-(\d{2})T(\d{2}):(\d{2}):(\d{2})\.(\d{3})Z)");

TimePoint NTimeUtils::now() {
    return std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

ClockFn NTimeUtils::systemClock() {
    return [] { return NTimeUtils::now(); };
}

int64_t NTimeUtils::toEpochMs(const TimePoint& tp) {
    return tp.time_since_epoch().count();
}

TimePoint NTimeUtils::fromEpochMs(int64_t ms) {
    return TimePoint{std::chrono::milliseconds{ms}};
}

std::string NTimeUtils::toIso8601(const TimePoint& tp) {
    const auto  MS      = toEpochMs(tp);
    const auto  SECONDS = (time_t)(MS >= 0 ? MS / 1000 : (MS - 999) / 1000);
    const auto  FRAC    = MS - (int64_t)SECONDS * 1000;

    std::tm     tm{};
    gmtime_r(&SECONDS, &tm);

    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, FRAC);
}

bool NTimeUtils::patternsCompiled() {
    return ISO_RE.ok();
}

std::optional<TimePoint> NTimeUtils::fromIso8601(std::string_view str) {
    if (!ISO_RE.ok()) {
        Debug::log(CRIT, "timestamp pattern failed to compile: {}", ISO_RE.error());
        return std::nullopt;
    }

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0, millis = 0;
    if (!RE2::FullMatch(re2::StringPiece{str.data(), str.size()}, ISO_RE, &year, &month, &day, &hour, &minute, &second, &millis))
        return std::nullopt;

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon  = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min  = minute;
    tm.tm_sec  = second;

    const time_t SECONDS = timegm(&tm);
    const auto   TP      = fromEpochMs((int64_t)SECONDS * 1000 + millis);

    // timegm normalizes out-of-range fields (month 13, second 60), reject anything that does not render back verbatim
    if (toIso8601(TP) != str)
        return std::nullopt;

    return TP;
}
