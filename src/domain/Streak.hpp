/**
 * @file Streak.hpp
 * @brief Consecutive goal-achievement days, at calendar-day granularity.
 */

#pragma once

#include <functional>
#include <optional>
#include "domain/time/LocalTime.hpp"

namespace moveslot::domain {

struct StreakState {
    int currentStreak = 0;
    int longestStreak = 0;
    std::optional<CivilDate> lastGoalDate;
};

/**
 * @class Streak
 * @brief Streak aggregate. Commands mutate at most once per calendar day.
 */
class Streak {
public:
    Streak() = default;
    explicit Streak(StreakState state) : m_state(std::move(state)) {}

    /**
     * @brief Records that the goal was reached on `today`.
     * @return False when today was already recorded (no-op).
     */
    bool recordGoalHit(const CivilDate& today);

    /**
     * @brief Resets the current streak when the last goal day is older than yesterday.
     * @return True when the streak was reset.
     */
    bool validate(const CivilDate& today);

    /** @brief Records the goal hit if steps reached the goal. */
    bool recordDailyTotal(const CivilDate& today, int steps, int goal);

    /**
     * @brief Recomputes the running streak by walking backwards from today.
     * @param stepsOn Steps for a given day.
     * @return Number of consecutive goal days found (capped at 365).
     */
    int rebuildFromHistory(const CivilDate& today, int goal,
                           const std::function<int(const CivilDate&)>& stepsOn);

    const StreakState& state() const { return m_state; }
    int current() const { return m_state.currentStreak; }
    int longest() const { return m_state.longestStreak; }

private:
    StreakState m_state;
};

} // namespace moveslot::domain
