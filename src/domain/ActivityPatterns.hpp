/**
 * @file ActivityPatterns.hpp
 * @brief Learned statistics consumed by the slot scorer.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "domain/PlannedActivity.hpp"

namespace moveslot::domain {

enum class TimeOfDay {
    Morning,    ///< before 12:00
    Afternoon,  ///< 12:00 - 16:59
    Evening     ///< 17:00 onwards
};

inline TimeOfDay TimeOfDayForHour(int hour) {
    if (hour < 12) return TimeOfDay::Morning;
    if (hour < 17) return TimeOfDay::Afternoon;
    return TimeOfDay::Evening;
}

inline std::string TimeOfDayToString(TimeOfDay t) {
    switch (t) {
        case TimeOfDay::Morning: return "morning";
        case TimeOfDay::Afternoon: return "afternoon";
        case TimeOfDay::Evening: return "evening";
    }
    return "morning";
}

inline std::optional<TimeOfDay> TimeOfDayFromString(const std::string& s) {
    if (s == "morning") return TimeOfDay::Morning;
    if (s == "afternoon") return TimeOfDay::Afternoon;
    if (s == "evening") return TimeOfDay::Evening;
    return std::nullopt;
}

struct ConsistentWalkTime {
    int hour = 0;
    double consistency = 0.0; ///< [0, 1]
};

/**
 * @struct UserActivityPatterns
 * @brief Rolling history statistics. Rebuilt from history, persisted across runs.
 */
struct UserActivityPatterns {
    int averageDailySteps = 6000;
    int weekdayAverage = 5500;
    int weekendAverage = 7000;
    std::vector<int> bestPerformingDays{7, 1};   ///< Weekdays, 1 = Sunday.
    std::vector<int> peakActivityHours{8, 12, 17};
    int typicalWalkDuration = 20;
    int stepsPerMinuteWalking = 100;
    double goalAchievementRate = 0.3;
    double workoutDayRate = 0.0;
    std::vector<ConsistentWalkTime> consistentWalkTimes{{8, 0.4}, {12, 0.5}, {18, 0.3}};
    std::optional<Instant> lastUpdated;

    bool isPeakHour(int hour) const {
        for (int h : peakActivityHours) {
            if (h == hour) return true;
        }
        return false;
    }
};

/**
 * @struct PlanAdherence
 * @brief Outcome feedback per time-of-day bucket.
 */
struct PlanAdherence {
    int totalPlansGenerated = 0;
    int activitiesCompleted = 0;
    int activitiesSkipped = 0;
    std::map<TimeOfDay, double> bestTimeSlots;           ///< EMA completion rate per bucket.
    std::map<ActivityType, double> typeCompletionRates;  ///< EMA completion rate per activity type.
    double averageCompletionRate = 0.5;
    int preferredWalkDuration = 20;
    std::optional<Instant> lastUpdated;

    /** @brief Rate for a bucket, absent until the first outcome in that bucket. */
    std::optional<double> rateFor(TimeOfDay bucket) const {
        auto it = bestTimeSlots.find(bucket);
        if (it == bestTimeSlots.end()) return std::nullopt;
        return it->second;
    }
};

} // namespace moveslot::domain
