/**
 * @file LocalTime.hpp
 * @brief Calendar-day and local wall-clock helpers used by every planner component.
 *
 * Instants are system_clock time points. Days are civil dates with no time zone;
 * conversion between the two goes through the process local time zone.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace moveslot::domain {

using Instant = std::chrono::system_clock::time_point;

/**
 * @struct CivilDate
 * @brief A calendar day (proleptic Gregorian), independent of any time zone.
 */
struct CivilDate {
    int year = 1970;
    int month = 1;  ///< 1..12
    int day = 1;    ///< 1..31

    /** @brief Returns the date shifted by a number of days (negative allowed). */
    CivilDate addDays(int days) const;

    /** @brief Day of week, 1 = Sunday ... 7 = Saturday. */
    int weekday() const;

    bool isWeekend() const { int w = weekday(); return w == 1 || w == 7; }

    /** @brief Days since 1970-01-01. */
    long daysSinceEpoch() const;

    /** @brief "yyyy-MM-dd". */
    std::string toString() const;

    /** @brief Parses "yyyy-MM-dd"; nullopt on malformed or out-of-range input. */
    static std::optional<CivilDate> Parse(const std::string& text);

    static CivilDate FromDaysSinceEpoch(long days);
};

inline bool operator==(const CivilDate& a, const CivilDate& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}
inline bool operator!=(const CivilDate& a, const CivilDate& b) { return !(a == b); }
inline bool operator<(const CivilDate& a, const CivilDate& b) {
    if (a.year != b.year) return a.year < b.year;
    if (a.month != b.month) return a.month < b.month;
    return a.day < b.day;
}
inline bool operator<=(const CivilDate& a, const CivilDate& b) { return !(b < a); }
inline bool operator>(const CivilDate& a, const CivilDate& b) { return b < a; }

/** @brief Local instant for hour:minute on the given day (minutes may exceed 59). */
Instant MakeInstant(const CivilDate& date, int hour, int minute = 0);

/** @brief Local instant at a given number of minutes after midnight. */
Instant MakeInstantAtMinutes(const CivilDate& date, int minutesSinceMidnight);

/** @brief Start of the local day. */
inline Instant StartOfDay(const CivilDate& date) { return MakeInstant(date, 0, 0); }

/** @brief Local calendar day containing the instant. */
CivilDate DateOf(const Instant& instant);

int HourOf(const Instant& instant);

int MinutesSinceMidnight(const Instant& instant);

/** @brief Whole minutes from a to b (negative when b precedes a). */
inline int MinutesBetween(const Instant& a, const Instant& b) {
    return static_cast<int>(std::chrono::duration_cast<std::chrono::minutes>(b - a).count());
}

inline Instant AddMinutes(const Instant& t, int minutes) {
    return t + std::chrono::minutes(minutes);
}

/** @brief "HH:MM" in local time. */
std::string FormatClock(const Instant& instant);

/** @brief "yyyy-MM-ddTHH:MM" in local time. */
std::string FormatLocalDateTime(const Instant& instant);

/** @brief Parses "yyyy-MM-ddTHH:MM" (or with a space separator) as local time. */
std::optional<Instant> ParseLocalDateTime(const std::string& text);

/** @brief Parses "HH:MM" into minutes since midnight. */
std::optional<int> ParseClockMinutes(const std::string& text);

std::string FormatClockMinutes(int minutesSinceMidnight);

inline long long ToEpochSeconds(const Instant& t) {
    return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
}

inline Instant FromEpochSeconds(long long seconds) {
    return Instant(std::chrono::seconds(seconds));
}

} // namespace moveslot::domain
