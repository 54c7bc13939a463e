/**
 * @file PatternLearner.hpp
 * @brief Rolling statistics from step history and EMA feedback from activity outcomes.
 */

#pragma once

#include <map>
#include "domain/ActivityPatterns.hpp"

namespace moveslot::domain::learning {

struct LearnerConfig {
    double smoothing = 0.2;     ///< EMA alpha.
    double neutralPrior = 0.5;  ///< Rate assumed before the first observation.
    int bestDaysCount = 3;
};

/**
 * @class PatternLearner
 * @brief Pure statistics; never reads calendar data.
 */
class PatternLearner {
public:
    PatternLearner(UserActivityPatterns patterns = {}, PlanAdherence adherence = {}, LearnerConfig config = {})
        : m_patterns(std::move(patterns)), m_adherence(std::move(adherence)), m_config(config) {}

    /**
     * @brief Rebuilds the day-level statistics from history.
     *
     * Empty history leaves the current patterns untouched.
     * @param dailyWorkouts Whether a workout was logged on each day.
     */
    const UserActivityPatterns& updateFromHistory(const std::map<CivilDate, int>& dailySteps,
                                                  const std::map<CivilDate, bool>& dailyWorkouts,
                                                  int dailyGoal,
                                                  const Instant& now);

    /** @brief Folds one completion or skip into the bucket and type rates. */
    void recordOutcome(ActivityType type, TimeOfDay timeOfDay, bool completed, const Instant& now);

    /** @brief As above, also tracking how consistently the user walks at `startHour`. */
    void recordOutcomeAtHour(ActivityType type, int startHour, bool completed, const Instant& now);

    void recordPlanGenerated() { m_adherence.totalPlansGenerated += 1; }

    const UserActivityPatterns& patterns() const { return m_patterns; }
    const PlanAdherence& adherence() const { return m_adherence; }

private:
    double ema(double previous, bool outcome) const;

    UserActivityPatterns m_patterns;
    PlanAdherence m_adherence;
    LearnerConfig m_config;
};

} // namespace moveslot::domain::learning
