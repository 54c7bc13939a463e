/**
 * @file PlanSyncService.hpp
 * @brief Mirrors a daily plan into the calendar, replacing what it wrote before.
 */

#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include "domain/CalendarProvider.hpp"
#include "domain/KeyValueStore.hpp"
#include "domain/PlanSync.hpp"
#include "domain/PlannedActivity.hpp"

namespace moveslot::application {

struct PlanSyncResult {
    std::vector<std::string> createdEventIds;
    std::vector<domain::SyncError> errors;
};

class PlanSyncService {
public:
    PlanSyncService(std::shared_ptr<domain::CalendarProvider> calendar,
                    std::shared_ptr<domain::KeyValueStore> store,
                    int alarmOffsetMinutes = 5);

    /**
     * @brief Deletes the events written for the plan's date, then writes one per
     *        planned or in-progress activity. Failures are collected, not thrown.
     */
    PlanSyncResult syncPlan(const domain::DailyMovementPlan& plan);

    /** @brief Forgets records for dates older than `retentionDays`. */
    int cleanupOldRecords(const domain::CivilDate& today, int retentionDays = 7);

    std::vector<std::string> eventIdsFor(const domain::CivilDate& date) const;

private:
    void persistLocked();

    std::shared_ptr<domain::CalendarProvider> m_calendar;
    std::shared_ptr<domain::KeyValueStore> m_store;
    int m_alarmOffsetMinutes;
    domain::SyncLedger m_ledger;
    mutable std::mutex m_mutex;
};

} // namespace moveslot::application
