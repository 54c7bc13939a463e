/**
 * @file WorkoutRotation.hpp
 * @brief Tracks which gym split comes next and how many sessions this week.
 */

#pragma once

#include <optional>
#include "domain/PlannedActivity.hpp"

namespace moveslot::domain {

struct WorkoutRotationState {
    std::optional<WorkoutType> lastWorkout;
    std::optional<CivilDate> weekStart; ///< Monday of the counted week.
    int sessionsThisWeek = 0;
};

/** @brief push -> pull -> legs -> push */
inline WorkoutType NextWorkoutAfter(WorkoutType w) {
    switch (w) {
        case WorkoutType::Push: return WorkoutType::Pull;
        case WorkoutType::Pull: return WorkoutType::Legs;
        case WorkoutType::Legs: return WorkoutType::Push;
    }
    return WorkoutType::Push;
}

class WorkoutRotation {
public:
    WorkoutRotation() = default;
    explicit WorkoutRotation(WorkoutRotationState state) : m_state(std::move(state)) {}

    WorkoutType nextWorkout() const {
        return m_state.lastWorkout ? NextWorkoutAfter(*m_state.lastWorkout) : WorkoutType::Push;
    }

    /** @brief Sessions counted in the week containing `today`. */
    int sessionsInWeekOf(const CivilDate& today) const;

    /** @brief True while the weekly gym target is not yet met. */
    bool needsWorkout(const CivilDate& today, int gymDaysPerWeek) const {
        return sessionsInWeekOf(today) < gymDaysPerWeek;
    }

    /** @brief Advances the rotation and counts the session, resetting on a new week. */
    void recordWorkout(const CivilDate& date, WorkoutType type);

    const WorkoutRotationState& state() const { return m_state; }

    static CivilDate WeekStartOf(const CivilDate& date);

private:
    WorkoutRotationState m_state;
};

} // namespace moveslot::domain
