/**
 * @file ScheduledActivity.hpp
 * @brief User-managed recurring activities and the conflicts they can raise.
 */

#pragma once

#include <optional>
#include <string>
#include "domain/PlannedActivity.hpp"

namespace moveslot::domain {

enum class Recurrence {
    Once,
    Weekly,
    Weekdays,   ///< Monday to Friday
    Biweekly,
    Monthly     ///< Same day of month as the start date
};

inline std::string RecurrenceToString(Recurrence r) {
    switch (r) {
        case Recurrence::Once: return "once";
        case Recurrence::Weekly: return "weekly";
        case Recurrence::Weekdays: return "weekdays";
        case Recurrence::Biweekly: return "biweekly";
        case Recurrence::Monthly: return "monthly";
    }
    return "once";
}

inline std::optional<Recurrence> RecurrenceFromString(const std::string& s) {
    if (s == "once") return Recurrence::Once;
    if (s == "weekly") return Recurrence::Weekly;
    if (s == "weekdays") return Recurrence::Weekdays;
    if (s == "biweekly") return Recurrence::Biweekly;
    if (s == "monthly") return Recurrence::Monthly;
    return std::nullopt;
}

/**
 * @struct ScheduledActivity
 * @brief A manually scheduled walk or workout, possibly recurring.
 */
struct ScheduledActivity {
    std::string id;
    ActivityType type = ActivityType::ScheduledWalk;
    std::optional<WorkoutType> workoutType;
    std::string title;
    int startMinutes = 0; ///< Minutes since local midnight.
    int durationMinutes = 30;
    Recurrence recurrence = Recurrence::Once;
    CivilDate startDate;
    std::optional<CivilDate> endDate;
    bool isActive = true;

    /** @brief Whether an occurrence falls on the given date. */
    bool occursOn(const CivilDate& date) const;

    /** @brief The occurrence on `date` as a planned activity. Caller checks occursOn first. */
    PlannedActivity occurrenceOn(const CivilDate& date) const;
};

enum class ConflictType {
    Overlap,
    TooClose    ///< Less than 30 minutes between the two.
};

inline std::string ConflictTypeToString(ConflictType c) {
    return c == ConflictType::Overlap ? "overlap" : "too_close";
}

struct ScheduleConflict {
    std::string activityId;
    std::string activityTitle;
    std::string meetingId;
    std::string meetingTitle;
    ConflictType type = ConflictType::Overlap;
    Instant activityStart;
    Instant meetingStart;
};

/**
 * @struct ActivityTimeStats
 * @brief Success counts for one (activity type, weekday, hour) combination.
 */
struct ActivityTimeStats {
    ActivityType type = ActivityType::ScheduledWalk;
    int weekday = 1;
    int hour = 0;
    int successes = 0;
    int attempts = 0;

    double successRate() const {
        return attempts == 0 ? 0.0 : static_cast<double>(successes) / static_cast<double>(attempts);
    }
};

} // namespace moveslot::domain
