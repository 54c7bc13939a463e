/**
 * @file UserPreferences.hpp
 * @brief Daily rhythm and goal settings that constrain planning.
 */

#pragma once

#include <optional>
#include <string>
#include "domain/time/LocalTime.hpp"

namespace moveslot::domain {

enum class PreferredTime {
    Morning,
    Afternoon,
    Evening,
    NoPreference
};

inline std::string PreferredTimeToString(PreferredTime p) {
    switch (p) {
        case PreferredTime::Morning: return "morning";
        case PreferredTime::Afternoon: return "afternoon";
        case PreferredTime::Evening: return "evening";
        case PreferredTime::NoPreference: return "none";
    }
    return "none";
}

inline std::optional<PreferredTime> PreferredTimeFromString(const std::string& s) {
    if (s == "morning") return PreferredTime::Morning;
    if (s == "afternoon") return PreferredTime::Afternoon;
    if (s == "evening") return PreferredTime::Evening;
    if (s == "none" || s == "no_preference") return PreferredTime::NoPreference;
    return std::nullopt;
}

/**
 * @struct UserPreferences
 * @brief Times are stored as minutes since local midnight.
 */
struct UserPreferences {
    int wakeMinutes = 7 * 60;
    int sleepMinutes = 23 * 60;
    int breakfastMinutes = 8 * 60;
    int lunchMinutes = 12 * 60 + 30;
    int dinnerMinutes = 19 * 60;
    int dailyStepGoal = 10000;
    PreferredTime preferredWalkTime = PreferredTime::NoPreference;
    PreferredTime preferredGymTime = PreferredTime::NoPreference;
    int workoutDurationMinutes = 45;
    int gymDaysPerWeek = 3;

    /** @brief True when the instant falls less than 30 minutes from a meal time. */
    bool isDuringMeal(const Instant& instant) const;

    /** @brief True when the hour lies in the preferred walking band. */
    bool isPreferredWalkHour(int hour) const;

    bool hasValidDay() const { return wakeMinutes < sleepMinutes; }
};

/** @brief Hour band [first, last) for a time-of-day preference. */
struct HourBand {
    int first;
    int last;
};

HourBand BandFor(PreferredTime preference);

} // namespace moveslot::domain
