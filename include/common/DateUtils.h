#pragma once

#include <string>

namespace stratopt {
namespace utils {

class DateUtils {
public:
    // Days since 1970-01-01 for an ISO date; throws InvalidArgumentError on malformed input.
    static long long toEpochDay(const std::string& iso_date);
    static std::string fromEpochDay(long long epoch_day);

    static std::string addDays(const std::string& iso_date, long long days);
    static bool isValidDate(const std::string& iso_date);

    static long long nowMs();
    // 2026-10-19T08:15:02.120Z
    static std::string toIsoUtc(long long epoch_ms);
    // 20261019_081502, used in run identifiers
    static std::string toCompactUtc(long long epoch_ms);
    static long long epochDayOfMs(long long epoch_ms);
};

} // namespace utils
} // namespace stratopt
