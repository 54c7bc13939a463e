/**
 * @file LocalTime.cpp
 * @brief Implementation of the calendar and wall-clock helpers.
 */

#include "domain/time/LocalTime.hpp"

#include <cstdio>
#include <ctime>

namespace moveslot::domain {

namespace {

// Howard Hinnant's days_from_civil / civil_from_days.
long DaysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long>(doe) - 719468;
}

bool IsLeap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int DaysInMonth(int y, int m) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && IsLeap(y)) return 29;
    return kDays[m - 1];
}

std::tm ToLocalTm(const Instant& instant) {
    std::time_t tt = std::chrono::system_clock::to_time_t(instant);
    std::tm tm{};
    localtime_r(&tt, &tm);
    return tm;
}

} // namespace

CivilDate CivilDate::FromDaysSinceEpoch(long z) {
    z += 719468;
    const long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long y = static_cast<long>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return CivilDate{static_cast<int>(y + (m <= 2)), static_cast<int>(m), static_cast<int>(d)};
}

long CivilDate::daysSinceEpoch() const {
    return DaysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
}

CivilDate CivilDate::addDays(int days) const {
    return FromDaysSinceEpoch(daysSinceEpoch() + days);
}

int CivilDate::weekday() const {
    // 1970-01-01 was a Thursday.
    long z = daysSinceEpoch();
    long w = ((z + 4) % 7 + 7) % 7; // 0 = Sunday
    return static_cast<int>(w) + 1;
}

std::string CivilDate::toString() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

std::optional<CivilDate> CivilDate::Parse(const std::string& text) {
    int y = 0, m = 0, d = 0;
    char trailing = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%c", &y, &m, &d, &trailing) != 3) {
        return std::nullopt;
    }
    if (m < 1 || m > 12 || d < 1 || d > DaysInMonth(y, m)) {
        return std::nullopt;
    }
    return CivilDate{y, m, d};
}

Instant MakeInstant(const CivilDate& date, int hour, int minute) {
    std::tm tm{};
    tm.tm_year = date.year - 1900;
    tm.tm_mon = date.month - 1;
    tm.tm_mday = date.day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = 0;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

Instant MakeInstantAtMinutes(const CivilDate& date, int minutesSinceMidnight) {
    return MakeInstant(date, 0, minutesSinceMidnight);
}

CivilDate DateOf(const Instant& instant) {
    std::tm tm = ToLocalTm(instant);
    return CivilDate{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
}

int HourOf(const Instant& instant) {
    return ToLocalTm(instant).tm_hour;
}

int MinutesSinceMidnight(const Instant& instant) {
    std::tm tm = ToLocalTm(instant);
    return tm.tm_hour * 60 + tm.tm_min;
}

std::string FormatClock(const Instant& instant) {
    return FormatClockMinutes(MinutesSinceMidnight(instant));
}

std::string FormatClockMinutes(int minutesSinceMidnight) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", minutesSinceMidnight / 60, minutesSinceMidnight % 60);
    return buf;
}

std::string FormatLocalDateTime(const Instant& instant) {
    return DateOf(instant).toString() + "T" + FormatClock(instant);
}

std::optional<Instant> ParseLocalDateTime(const std::string& text) {
    if (text.size() < 16) return std::nullopt;
    auto date = CivilDate::Parse(text.substr(0, 10));
    if (!date || (text[10] != 'T' && text[10] != ' ')) return std::nullopt;
    auto minutes = ParseClockMinutes(text.substr(11, 5));
    if (!minutes) return std::nullopt;
    return MakeInstantAtMinutes(*date, *minutes);
}

std::optional<int> ParseClockMinutes(const std::string& text) {
    int h = 0, m = 0;
    char trailing = 0;
    if (std::sscanf(text.c_str(), "%2d:%2d%c", &h, &m, &trailing) != 2) {
        return std::nullopt;
    }
    if (h < 0 || h > 23 || m < 0 || m > 59) return std::nullopt;
    return h * 60 + m;
}

} // namespace moveslot::domain
