/**
 * @file PlannedActivity.hpp
 * @brief Activities placed into free time, and the daily plan that owns them.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "domain/CalendarMeeting.hpp"

namespace moveslot::domain {

enum class ActivityType {
    MicroWalk,
    ScheduledWalk,
    MorningWalk,
    LunchWalk,
    EveningWalk,
    PostMeetingWalk,
    Workout
};

enum class ActivityPriority {
    Critical,
    Recommended,
    Optional
};

enum class ActivityStatus {
    Planned,
    InProgress,
    Completed,
    Skipped,
    Rescheduled
};

/**
 * @enum WorkoutType
 * @brief Gym session split, rotated push -> pull -> legs.
 */
enum class WorkoutType {
    Push,
    Pull,
    Legs
};

inline std::string ActivityTypeToString(ActivityType type) {
    switch (type) {
        case ActivityType::MicroWalk: return "micro_walk";
        case ActivityType::ScheduledWalk: return "scheduled_walk";
        case ActivityType::MorningWalk: return "morning_walk";
        case ActivityType::LunchWalk: return "lunch_walk";
        case ActivityType::EveningWalk: return "evening_walk";
        case ActivityType::PostMeetingWalk: return "post_meeting_walk";
        case ActivityType::Workout: return "workout";
    }
    return "scheduled_walk";
}

inline std::optional<ActivityType> ActivityTypeFromString(const std::string& s) {
    if (s == "micro_walk") return ActivityType::MicroWalk;
    if (s == "scheduled_walk") return ActivityType::ScheduledWalk;
    if (s == "morning_walk") return ActivityType::MorningWalk;
    if (s == "lunch_walk") return ActivityType::LunchWalk;
    if (s == "evening_walk") return ActivityType::EveningWalk;
    if (s == "post_meeting_walk") return ActivityType::PostMeetingWalk;
    if (s == "workout") return ActivityType::Workout;
    return std::nullopt;
}

/** @brief Title used when the activity is written to a calendar. */
inline std::string ActivityTypeDisplayName(ActivityType type) {
    switch (type) {
        case ActivityType::MicroWalk: return "Quick Walk";
        case ActivityType::ScheduledWalk: return "Walk";
        case ActivityType::MorningWalk: return "Morning Walk";
        case ActivityType::LunchWalk: return "Lunch Walk";
        case ActivityType::EveningWalk: return "Evening Walk";
        case ActivityType::PostMeetingWalk: return "Post-Meeting Walk";
        case ActivityType::Workout: return "Workout";
    }
    return "Walk";
}

inline bool IsWalk(ActivityType type) {
    return type != ActivityType::Workout;
}

inline std::string PriorityToString(ActivityPriority p) {
    switch (p) {
        case ActivityPriority::Critical: return "critical";
        case ActivityPriority::Recommended: return "recommended";
        case ActivityPriority::Optional: return "optional";
    }
    return "optional";
}

inline std::optional<ActivityPriority> PriorityFromString(const std::string& s) {
    if (s == "critical") return ActivityPriority::Critical;
    if (s == "recommended") return ActivityPriority::Recommended;
    if (s == "optional") return ActivityPriority::Optional;
    return std::nullopt;
}

inline std::string StatusToString(ActivityStatus s) {
    switch (s) {
        case ActivityStatus::Planned: return "planned";
        case ActivityStatus::InProgress: return "in_progress";
        case ActivityStatus::Completed: return "completed";
        case ActivityStatus::Skipped: return "skipped";
        case ActivityStatus::Rescheduled: return "rescheduled";
    }
    return "planned";
}

inline std::optional<ActivityStatus> StatusFromString(const std::string& s) {
    if (s == "planned") return ActivityStatus::Planned;
    if (s == "in_progress") return ActivityStatus::InProgress;
    if (s == "completed") return ActivityStatus::Completed;
    if (s == "skipped") return ActivityStatus::Skipped;
    if (s == "rescheduled") return ActivityStatus::Rescheduled;
    return std::nullopt;
}

inline std::string WorkoutTypeToString(WorkoutType w) {
    switch (w) {
        case WorkoutType::Push: return "push";
        case WorkoutType::Pull: return "pull";
        case WorkoutType::Legs: return "legs";
    }
    return "push";
}

inline std::optional<WorkoutType> WorkoutTypeFromString(const std::string& s) {
    if (s == "push") return WorkoutType::Push;
    if (s == "pull") return WorkoutType::Pull;
    if (s == "legs") return WorkoutType::Legs;
    return std::nullopt;
}

inline std::string WorkoutDisplayName(WorkoutType w) {
    switch (w) {
        case WorkoutType::Push: return "Push Day";
        case WorkoutType::Pull: return "Pull Day";
        case WorkoutType::Legs: return "Leg Day";
    }
    return "Workout";
}

/**
 * @struct PlannedActivity
 * @brief A walk or workout placed inside a free slot.
 */
struct PlannedActivity {
    std::string id;
    ActivityType type = ActivityType::ScheduledWalk;
    std::string title;
    Instant startTime;
    int durationMinutes = 0;
    int estimatedSteps = 0;
    ActivityPriority priority = ActivityPriority::Optional;
    ActivityStatus status = ActivityStatus::Planned;
    std::string reason;
    bool isIdeal = true; ///< False when placed by a fallback search instead of a free slot.
    std::optional<WorkoutType> workoutType;
    std::optional<std::string> calendarEventId;

    Instant endTime() const { return AddMinutes(startTime, durationMinutes); }
    TimeInterval interval() const { return TimeInterval{startTime, endTime()}; }
};

/**
 * @struct DailyMovementPlan
 * @brief The authoritative activity list for one date. Replaced wholesale on regeneration.
 */
struct DailyMovementPlan {
    std::string id;
    CivilDate date;
    int targetSteps = 0;
    int currentSteps = 0;
    int stepsNeeded = 0;
    std::vector<PlannedActivity> activities;
    std::vector<WalkabilityAssessment> walkableMeetings;
    int plannedSteps = 0;
    int remainingGap = 0;
    double confidence = 0.0; ///< Never above 0.95.
    std::string reasoning;
    long long epoch = 0;
    Instant generatedAt;

    bool isOnTrack() const { return remainingGap < 500; }
};

} // namespace moveslot::domain
