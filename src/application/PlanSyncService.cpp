#include "application/PlanSyncService.hpp"
#include "infrastructure/StateCodec.hpp"

#include <iostream>
#include <sstream>

namespace moveslot::application {

using namespace moveslot::domain;
using infrastructure::StateCodec;

namespace {
std::string EventTitle(const PlannedActivity& a) {
    if (a.type == ActivityType::Workout && a.workoutType) {
        return WorkoutDisplayName(*a.workoutType);
    }
    return ActivityTypeDisplayName(a.type);
}

std::string EventNotes(const PlannedActivity& a) {
    std::ostringstream notes;
    if (!a.reason.empty()) notes << a.reason << "\n\n";
    if (a.estimatedSteps > 0) notes << "Steps: ~" << a.estimatedSteps << "\n";
    notes << "Duration: " << a.durationMinutes << " minutes\n";
    notes << "Priority: " << PriorityToString(a.priority);
    return notes.str();
}
}

PlanSyncService::PlanSyncService(std::shared_ptr<CalendarProvider> calendar,
                                 std::shared_ptr<KeyValueStore> store,
                                 int alarmOffsetMinutes)
    : m_calendar(std::move(calendar)), m_store(std::move(store)), m_alarmOffsetMinutes(alarmOffsetMinutes) {
    if (auto raw = m_store->get(StateCodec::kSyncKey)) {
        if (auto ledger = StateCodec::DecodeSync(*raw)) {
            m_ledger = std::move(*ledger);
        } else {
            std::cerr << "[PlanSync] Stored sync records unreadable, starting empty." << std::endl;
        }
    }
}

PlanSyncResult PlanSyncService::syncPlan(const DailyMovementPlan& plan) {
    std::lock_guard<std::mutex> lock(m_mutex);
    PlanSyncResult result;

    std::vector<std::string> kept;
    auto previous = m_ledger.eventIdsByDate.find(plan.date);
    if (previous != m_ledger.eventIdsByDate.end()) {
        for (const auto& id : previous->second) {
            bool deleted = false;
            try {
                deleted = m_calendar->deleteEvent(id);
            } catch (const std::exception& e) {
                std::cerr << "[PlanSync] Delete threw: " << e.what() << std::endl;
            }
            if (!deleted) {
                // Still ours; try again on the next sync.
                kept.push_back(id);
                result.errors.push_back({SyncErrorKind::EventDeletionFailed, id, "Could not delete event " + id});
            }
        }
    }

    for (const auto& activity : plan.activities) {
        if (activity.status != ActivityStatus::Planned && activity.status != ActivityStatus::InProgress) continue;

        std::optional<std::string> id;
        try {
            id = m_calendar->createEvent(EventTitle(activity), activity.startTime, activity.endTime(),
                                         EventNotes(activity), m_alarmOffsetMinutes);
        } catch (const std::exception& e) {
            result.errors.push_back({SyncErrorKind::CalendarUnavailable, activity.id, e.what()});
            continue;
        }
        if (!id) {
            result.errors.push_back({SyncErrorKind::EventCreationFailed, activity.id,
                                     "Could not create event for " + activity.title});
            continue;
        }
        kept.push_back(*id);
        result.createdEventIds.push_back(*id);
    }

    if (kept.empty()) {
        m_ledger.eventIdsByDate.erase(plan.date);
    } else {
        m_ledger.eventIdsByDate[plan.date] = kept;
    }
    persistLocked();

    std::cout << "[PlanSync] " << plan.date.toString() << ": " << result.createdEventIds.size()
              << " events written, " << result.errors.size() << " errors" << std::endl;
    return result;
}

int PlanSyncService::cleanupOldRecords(const CivilDate& today, int retentionDays) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const CivilDate cutoff = today.addDays(-retentionDays);
    int removed = 0;
    for (auto it = m_ledger.eventIdsByDate.begin(); it != m_ledger.eventIdsByDate.end();) {
        if (it->first < cutoff) {
            it = m_ledger.eventIdsByDate.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) persistLocked();
    return removed;
}

std::vector<std::string> PlanSyncService::eventIdsFor(const CivilDate& date) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_ledger.eventIdsByDate.find(date);
    return it == m_ledger.eventIdsByDate.end() ? std::vector<std::string>{} : it->second;
}

void PlanSyncService::persistLocked() {
    m_store->put(StateCodec::kSyncKey, StateCodec::Encode(m_ledger));
}

} // namespace moveslot::application
