#include "DurationCalculator.hpp"
#include "StringUtils.hpp"
#include <fmt/format.h>
#include <limits>

namespace Vantage {

int64_t DurationCalculator::extractUnitCount(std::string_view input, char unit) {
    // Leftmost digit run that is immediately followed by the unit character.
    size_t i = 0;
    while (i < input.size()) {
        if (input[i] < '0' || input[i] > '9') {
            ++i;
            continue;
        }
        size_t runEnd = i;
        while (runEnd < input.size() && input[runEnd] >= '0' && input[runEnd] <= '9') ++runEnd;
        if (runEnd < input.size() && input[runEnd] == unit) {
            return StringUtils::parseDigits(input.substr(i, runEnd - i)).value_or(0);
        }
        i = runEnd;
    }
    return 0;
}

int64_t DurationCalculator::parseDurationStringIntoMs(std::string_view input) {
    auto trimmed = StringUtils::trim(input);
    int64_t hours = extractUnitCount(trimmed, 'h');
    int64_t minutes = extractUnitCount(trimmed, 'm');

    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    if (hours > kMax / (kSecondsPerHour * 1000)) hours = 0;
    if (minutes > kMax / (kSecondsPerMinute * 1000)) minutes = 0;

    int64_t seconds = hours * kSecondsPerHour;
    int64_t minuteSeconds = minutes * kSecondsPerMinute;
    if (seconds > kMax / 1000 - minuteSeconds) return 0;
    return (seconds + minuteSeconds) * 1000;
}

RunDuration DurationCalculator::getRunDuration(std::chrono::system_clock::time_point startTime,
                                               std::chrono::system_clock::time_point now) {
    using namespace std::chrono;

    const auto elapsed = duration_cast<milliseconds>(now - startTime);

    RunDuration result;
    result.runDurationInDays = static_cast<double>(elapsed.count()) / 1000.0 / 60.0 / 60.0 / 24.0;

    // Time of day comes from the sub-day remainder; whole days are split into
    // months of 146097/4800 days (Gregorian average) and each month consumes
    // the ceiling of its day span, so the clock fields never drift.
    milliseconds remaining = elapsed.count() > 0 ? elapsed : milliseconds::zero();
    int64_t dayCount = std::chrono::floor<days>(remaining).count();
    remaining -= days(dayCount);
    const int64_t totalMonths = dayCount * 4800 / 146097;
    dayCount -= (totalMonths * 146097 + 4799) / 4800;
    const int64_t y = totalMonths / 12;
    const int64_t mo = totalMonths % 12;
    const auto h = std::chrono::floor<hours>(remaining);
    remaining -= h;
    const auto mi = std::chrono::floor<minutes>(remaining);
    remaining -= mi;
    const auto s = std::chrono::floor<seconds>(remaining);

    result.runDurationDisplay = fmt::format("{}Y{}M{}D {}H{}m{}s",
                                            y, mo, dayCount,
                                            h.count(), mi.count(), s.count());
    return result;
}

DurationBreakdown DurationCalculator::getMsDetailDuration(int64_t millis) {
    DurationBreakdown breakdown;
    if (millis <= 0) return breakdown;

    int64_t remainingSeconds = millis / 1000;

    breakdown.years = remainingSeconds / kSecondsPerYear;
    remainingSeconds %= kSecondsPerYear;

    breakdown.months = remainingSeconds / kSecondsPerMonth;
    remainingSeconds %= kSecondsPerMonth;

    breakdown.days = remainingSeconds / kSecondsPerDay;
    remainingSeconds %= kSecondsPerDay;

    breakdown.hours = remainingSeconds / kSecondsPerHour;
    remainingSeconds %= kSecondsPerHour;

    breakdown.minutes = remainingSeconds / kSecondsPerMinute;
    breakdown.seconds = remainingSeconds % kSecondsPerMinute;
    return breakdown;
}

std::string DurationCalculator::formatShortElapsed(int64_t millis) {
    const int64_t totalSeconds = millis > 0 ? millis / 1000 : 0;
    const int64_t hours = totalSeconds / kSecondsPerHour;
    const int64_t minutes = (totalSeconds % kSecondsPerHour) / kSecondsPerMinute;
    return fmt::format("{}h{}m", hours, minutes);
}

} // namespace Vantage
