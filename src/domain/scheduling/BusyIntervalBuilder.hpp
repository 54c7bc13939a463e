/**
 * @file BusyIntervalBuilder.hpp
 * @brief Unions meetings and committed activities into one sorted busy list for a day.
 */

#pragma once

#include <vector>
#include "domain/CalendarMeeting.hpp"
#include "domain/PlannedActivity.hpp"

namespace moveslot::domain::scheduling {

struct BusyIntervalOptions {
    bool realMeetingsOnly = true; ///< Drop all-day and out-of-office entries.
};

/**
 * @brief Builds the busy list for `date`.
 *
 * Only entries overlapping the local day are kept, sorted by start then end.
 * Skipped and rescheduled activities do not occupy time.
 */
std::vector<BusyInterval> BuildBusyIntervals(const CivilDate& date,
                                             const std::vector<CalendarMeeting>& meetings,
                                             const std::vector<PlannedActivity>& activities,
                                             const BusyIntervalOptions& options = {});

/** @brief Drops the source tags. */
std::vector<TimeInterval> ToIntervals(const std::vector<BusyInterval>& busy);

} // namespace moveslot::domain::scheduling
