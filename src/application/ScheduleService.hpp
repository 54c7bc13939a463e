/**
 * @file ScheduleService.hpp
 * @brief Manual schedule of recurring walks and workouts, with conflict checks
 *        and per-hour success tracking.
 */

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "domain/CalendarMeeting.hpp"
#include "domain/KeyValueStore.hpp"
#include "domain/ScheduledActivity.hpp"
#include "domain/scheduling/ConflictDetector.hpp"

namespace moveslot::application {

class ScheduleService {
public:
    explicit ScheduleService(std::shared_ptr<domain::KeyValueStore> store);

    /**
     * @brief Adds an entry. An empty id is replaced by a generated one.
     * @throws std::invalid_argument on a non-positive duration, a start outside the day,
     *         or an end date before the start date.
     * @return The stored entry.
     */
    domain::ScheduledActivity add(domain::ScheduledActivity activity);

    /** @return False when the id is unknown. */
    bool remove(const std::string& id);

    /** @throws std::invalid_argument when the id is unknown. */
    void setActive(const std::string& id, bool active);

    std::vector<domain::ScheduledActivity> list() const;

    /** @brief Occurrences of active entries on `date`, ordered by start. */
    std::vector<domain::PlannedActivity> occurrencesOn(const domain::CivilDate& date) const;

    std::vector<domain::ScheduleConflict> checkConflicts(const domain::CivilDate& date,
                                                         const std::vector<domain::CalendarMeeting>& meetings) const;

    /** @brief Counts an attempt of `type` at (weekday, hour); success bumps the hit count. */
    void recordOutcome(domain::ActivityType type, int weekday, int hour, bool success);

    /**
     * @brief Hour with the best success rate for `type` on `weekday`.
     * Only hours with a rate of at least 50% qualify; ties go to the earlier hour.
     */
    std::optional<int> suggestBestTime(domain::ActivityType type, int weekday) const;

    std::vector<domain::ActivityTimeStats> timeStats() const;

private:
    void persistSchedule();
    void persistStats();

    std::shared_ptr<domain::KeyValueStore> m_store;
    domain::scheduling::ConflictDetector m_detector;
    std::vector<domain::ScheduledActivity> m_activities;
    std::vector<domain::ActivityTimeStats> m_stats;
    int m_nextSequence = 1;
    mutable std::mutex m_mutex;
};

} // namespace moveslot::application
