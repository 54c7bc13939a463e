/**
 * @file PlanSync.hpp
 * @brief Bookkeeping for plan activities mirrored into the calendar.
 */

#pragma once

#include <map>
#include <string>
#include <vector>
#include "domain/time/LocalTime.hpp"

namespace moveslot::domain {

enum class SyncErrorKind {
    CalendarUnavailable,
    EventCreationFailed,
    EventDeletionFailed
};

inline std::string SyncErrorKindToString(SyncErrorKind k) {
    switch (k) {
        case SyncErrorKind::CalendarUnavailable: return "calendar_unavailable";
        case SyncErrorKind::EventCreationFailed: return "event_creation_failed";
        case SyncErrorKind::EventDeletionFailed: return "event_deletion_failed";
    }
    return "calendar_unavailable";
}

struct SyncError {
    SyncErrorKind kind;
    std::string subject; ///< Activity or event id.
    std::string message;
};

/**
 * @struct SyncLedger
 * @brief Calendar event ids the planner created, per plan date.
 */
struct SyncLedger {
    std::map<CivilDate, std::vector<std::string>> eventIdsByDate;
};

} // namespace moveslot::domain
