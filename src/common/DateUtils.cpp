#include "common/DateUtils.h"
#include "common/Errors.h"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace stratopt {
namespace utils {

namespace {
constexpr long long kMsPerDay = 86400000LL;

// Proleptic Gregorian calendar conversions (H. Hinnant's civil-day algorithms).
long long daysFromCivil(long long y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

void civilFromDays(long long z, long long& y, unsigned& m, unsigned& d) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<long long>(yoe) + era * 400 + (m <= 2 ? 1 : 0);
}

bool parseDigits(const std::string& s, size_t pos, size_t len, int& out) {
    out = 0;
    for (size_t i = pos; i < pos + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
        out = out * 10 + (s[i] - '0');
    }
    return true;
}

bool splitDate(const std::string& iso_date, int& y, int& m, int& d) {
    if (iso_date.size() != 10 || iso_date[4] != '-' || iso_date[7] != '-') {
        return false;
    }
    if (!parseDigits(iso_date, 0, 4, y) || !parseDigits(iso_date, 5, 2, m) ||
        !parseDigits(iso_date, 8, 2, d)) {
        return false;
    }
    if (m < 1 || m > 12 || d < 1 || d > 31) {
        return false;
    }
    // Reject dates like 2023-02-30 that normalize into the next month.
    const long long day = daysFromCivil(y, static_cast<unsigned>(m), static_cast<unsigned>(d));
    long long ry = 0;
    unsigned rm = 0;
    unsigned rd = 0;
    civilFromDays(day, ry, rm, rd);
    return ry == y && static_cast<int>(rm) == m && static_cast<int>(rd) == d;
}

std::tm toUtcTm(long long epoch_ms) {
    std::time_t secs = static_cast<std::time_t>(epoch_ms / 1000);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    return tm;
}
}

long long DateUtils::toEpochDay(const std::string& iso_date) {
    int y = 0;
    int m = 0;
    int d = 0;
    if (!splitDate(iso_date, y, m, d)) {
        throw InvalidArgumentError("Invalid date (expected YYYY-MM-DD): '" + iso_date + "'");
    }
    return daysFromCivil(y, static_cast<unsigned>(m), static_cast<unsigned>(d));
}

std::string DateUtils::fromEpochDay(long long epoch_day) {
    long long y = 0;
    unsigned m = 0;
    unsigned d = 0;
    civilFromDays(epoch_day, y, m, d);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u", y, m, d);
    return buf;
}

std::string DateUtils::addDays(const std::string& iso_date, long long days) {
    return fromEpochDay(toEpochDay(iso_date) + days);
}

bool DateUtils::isValidDate(const std::string& iso_date) {
    int y = 0;
    int m = 0;
    int d = 0;
    return splitDate(iso_date, y, m, d);
}

long long DateUtils::nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string DateUtils::toIsoUtc(long long epoch_ms) {
    const std::tm tm = toUtcTm(epoch_ms);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec,
                  static_cast<int>(epoch_ms % 1000));
    return buf;
}

std::string DateUtils::toCompactUtc(long long epoch_ms) {
    const std::tm tm = toUtcTm(epoch_ms);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d%02d%02d_%02d%02d%02d",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buf;
}

long long DateUtils::epochDayOfMs(long long epoch_ms) {
    long long day = epoch_ms / kMsPerDay;
    if (epoch_ms < 0 && epoch_ms % kMsPerDay != 0) {
        --day;
    }
    return day;
}

} // namespace utils
} // namespace stratopt
