/**
 * @file StreakService.hpp
 * @brief Thread-safe, persisted wrapper around the streak aggregate.
 */

#pragma once

#include <memory>
#include <mutex>

#include "domain/ActivityDataProvider.hpp"
#include "domain/KeyValueStore.hpp"
#include "domain/Streak.hpp"

namespace moveslot::application {

class StreakService {
public:
    explicit StreakService(std::shared_ptr<domain::KeyValueStore> store);

    /** @brief Resets a lapsed streak. Run once at process start. */
    void validate(const domain::CivilDate& today);

    bool recordGoalHit(const domain::CivilDate& today);

    /** @brief Records the goal when `steps >= goal`. */
    bool recordDailyTotal(const domain::CivilDate& today, int steps, int goal);

    /**
     * @brief Recomputes the streak from recorded step history.
     * A provider failure leaves the streak unchanged.
     */
    int rebuildFromHistory(const domain::CivilDate& today, int goal, domain::ActivityDataProvider& activityData);

    domain::StreakState snapshot() const;

private:
    void persist();

    std::shared_ptr<domain::KeyValueStore> m_store;
    domain::Streak m_streak;
    mutable std::mutex m_mutex;
};

} // namespace moveslot::application
