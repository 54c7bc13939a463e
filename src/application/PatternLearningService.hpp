/**
 * @file PatternLearningService.hpp
 * @brief Feeds history and outcomes into the pattern learner and persists the result.
 */

#pragma once

#include <memory>
#include <mutex>

#include "domain/ActivityDataProvider.hpp"
#include "domain/KeyValueStore.hpp"
#include "domain/learning/PatternLearner.hpp"

namespace moveslot::application {

class PatternLearningService {
public:
    PatternLearningService(std::shared_ptr<domain::ActivityDataProvider> activityData,
                           std::shared_ptr<domain::KeyValueStore> store);

    /**
     * @brief Rebuilds patterns from the `days` complete days before `today`.
     *
     * Days whose data cannot be fetched are left out. When nothing could be fetched
     * the stored patterns are kept.
     * @return Number of days that contributed.
     */
    int refreshFromHistory(const domain::CivilDate& today, int dailyGoal, const domain::Instant& now, int days = 30);

    /** @brief Records a completion or skip of a planned activity. */
    void recordOutcome(const domain::PlannedActivity& activity, bool completed, const domain::Instant& now);

    void recordPlanGenerated();

    domain::UserActivityPatterns patterns() const;
    domain::PlanAdherence adherence() const;

private:
    void persist();

    std::shared_ptr<domain::ActivityDataProvider> m_activityData;
    std::shared_ptr<domain::KeyValueStore> m_store;
    domain::learning::PatternLearner m_learner;
    mutable std::mutex m_mutex;
};

} // namespace moveslot::application
