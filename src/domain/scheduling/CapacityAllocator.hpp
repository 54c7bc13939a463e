/**
 * @file CapacityAllocator.hpp
 * @brief Walk + workout placement for days with a gym session, tiered by how many
 *        one-hour windows the day offers.
 */

#pragma once

#include <optional>
#include <vector>
#include "domain/CalendarMeeting.hpp"
#include "domain/PlannedActivity.hpp"
#include "domain/Schedule.hpp"
#include "domain/UserPreferences.hpp"

namespace moveslot::domain::scheduling {

struct CapacityConfig {
    int candidateMinMinutes = 45;
    int hourSlotMinutes = 60;
    int maxWalkMinutes = 45;
    int stepsPerMinute = 100;
    int extraWalkOptions = 2;
    int fallbackStepMinutes = 30;
};

/**
 * @struct WalkWorkoutAllocation
 * @brief Outcome of capacity-tiered allocation.
 */
struct WalkWorkoutAllocation {
    std::optional<PlannedActivity> workout;
    std::optional<PlannedActivity> walk;
    std::optional<WalkabilityAssessment> walkingMeeting; ///< Set when the walk is a meeting.
    std::vector<PlannedActivity> extraWalkOptions;
    int oneHourSlotCount = 0;
};

/** @brief 0..3 preference of a gym session starting at `hour`. */
int GymPreferenceScore(int hour, PreferredTime preference);

/** @brief 0..3 preference of a walk starting at `hour`. */
int WalkPreferenceScore(int hour, PreferredTime preference);

class CapacityAllocator {
public:
    explicit CapacityAllocator(CapacityConfig config = {}) : m_config(config) {}

    /**
     * @param busy Occupied time of the day, used by the preferred-time fallback.
     * @param needsWorkout False once the weekly gym target is met.
     */
    WalkWorkoutAllocation allocate(const CivilDate& date,
                                   const std::vector<FreeSlot>& freeSlots,
                                   const std::vector<WalkabilityAssessment>& walkableMeetings,
                                   const std::vector<TimeInterval>& busy,
                                   const UserPreferences& prefs,
                                   bool needsWorkout,
                                   WorkoutType nextWorkout) const;

    PlannedActivity makeWalk(const FreeSlot& slot) const;
    PlannedActivity makeWorkout(const Instant& start, int durationMinutes, WorkoutType type) const;

private:
    std::optional<Instant> findPreferredStart(const CivilDate& date,
                                              PreferredTime preference,
                                              int durationMinutes,
                                              const std::vector<TimeInterval>& busy,
                                              const UserPreferences& prefs) const;

    CapacityConfig m_config;
};

} // namespace moveslot::domain::scheduling
