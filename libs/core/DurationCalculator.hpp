/*
Vantage — DurationCalculator
Role: Parses human duration strings and decomposes elapsed spans for status messages.
Inputs/Outputs: Strings like "2h30m", start timestamps and millisecond counts; returns milliseconds or breakdowns.
Threading: Stateless static functions; thread-safe.
Performance: Trivial.
Integration: Called by bot orchestration for run-time reporting and schedule parsing.
Observability: No internal logging.
Related: DurationCalculator.cpp.
Assumptions: Month and year lengths are conventions, not calendar-accurate; see each function.
*/
#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace Vantage {

struct DurationBreakdown {
    int64_t years = 0;
    int64_t months = 0;
    int64_t days = 0;
    int64_t hours = 0;
    int64_t minutes = 0;
    int64_t seconds = 0;
};

struct RunDuration {
    double runDurationInDays = 0.0;
    std::string runDurationDisplay;   // "{Y}Y{M}M{D}D {H}H{m}m{s}s"
};

class DurationCalculator {
public:
    static constexpr int64_t kSecondsPerMinute = 60;
    static constexpr int64_t kSecondsPerHour   = 3600;
    static constexpr int64_t kSecondsPerDay    = 24 * kSecondsPerHour;
    static constexpr int64_t kSecondsPerMonth  = 30 * kSecondsPerDay;    // fixed, not calendar
    static constexpr int64_t kSecondsPerYear   = 365 * kSecondsPerDay;   // fixed, not calendar

    /**
     * First "<digits>h" and first "<digits>m" are read independently.
     * Missing or unreadable tokens contribute 0; this never fails.
     */
    static int64_t parseDurationStringIntoMs(std::string_view input);

    /**
     * Elapsed time since startTime, as fractional days and a Y/M/D H/m/s display string.
     * Clock fields are the sub-day remainder; whole days split into 146097/4800-day months.
     * A start time in the future reports a zero display.
     */
    static RunDuration getRunDuration(std::chrono::system_clock::time_point startTime,
                                      std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    /**
     * Fixed-divisor decomposition: 1 year = 365 days, 1 month = 30 days.
     * Sub-second remainder is truncated. Negative input decomposes to all zeros.
     */
    static DurationBreakdown getMsDetailDuration(int64_t millis);

    /// "{h}h{m}m": whole hours and leftover minutes.
    static std::string formatShortElapsed(int64_t millis);

private:
    static int64_t extractUnitCount(std::string_view input, char unit);
};

} // namespace Vantage
