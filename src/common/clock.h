#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace c4::sddp {

// ---------------------------------------------------------------------------
// Clock utilities used to timestamp received datagrams
// ---------------------------------------------------------------------------
class Clock {
public:
    using SteadyClock = std::chrono::steady_clock;
    using SystemClock = std::chrono::system_clock;
    using SteadyTime  = SteadyClock::time_point;
    using WallTime    = SystemClock::time_point;

    static SteadyTime steadyNow() { return SteadyClock::now(); }
    static WallTime   wallNow()   { return SystemClock::now(); }

    // Seconds (fractional) on the monotonic clock, for JSON output
    static double steadySeconds(SteadyTime t) {
        return std::chrono::duration<double>(t.time_since_epoch()).count();
    }

    // Milliseconds since epoch (wall-clock)
    static uint64_t epochMillis(WallTime t) {
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                t.time_since_epoch())
                .count());
    }

    // ISO-8601 UTC with microseconds, e.g. "2024-03-01T12:00:00.000123Z"
    static std::string toIso8601(WallTime t) {
        auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                          t.time_since_epoch()).count();
        std::time_t secs = static_cast<std::time_t>(micros / 1'000'000);
        long frac = static_cast<long>(micros % 1'000'000);
        if (frac < 0) {
            frac += 1'000'000;
            --secs;
        }
        struct tm tm_buf;
        gmtime_r(&secs, &tm_buf);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
        char result[48];
        std::snprintf(result, sizeof(result), "%s.%06ldZ", buf, frac);
        return result;
    }
};

} // namespace c4::sddp
