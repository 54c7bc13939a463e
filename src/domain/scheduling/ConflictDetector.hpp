/**
 * @file ConflictDetector.hpp
 * @brief Reports manual schedule entries that collide with, or crowd, calendar meetings.
 */

#pragma once

#include <vector>
#include "domain/CalendarMeeting.hpp"
#include "domain/ScheduledActivity.hpp"

namespace moveslot::domain::scheduling {

class ConflictDetector {
public:
    explicit ConflictDetector(int minimumGapMinutes = 30) : m_minimumGapMinutes(minimumGapMinutes) {}

    /** @brief Conflict between one occurrence and one meeting, if any. */
    std::optional<ScheduleConflict> check(const PlannedActivity& occurrence,
                                          const CalendarMeeting& meeting) const;

    /**
     * @brief Every conflict on `date` between active scheduled activities and real meetings.
     * Conflicts are reported in activity order, then meeting order. Nothing is resolved.
     */
    std::vector<ScheduleConflict> checkConflicts(const CivilDate& date,
                                                 const std::vector<ScheduledActivity>& activities,
                                                 const std::vector<CalendarMeeting>& meetings) const;

    /** @brief Same check for activities already materialised for a day. */
    std::vector<ScheduleConflict> checkPlanned(const std::vector<PlannedActivity>& activities,
                                               const std::vector<CalendarMeeting>& meetings) const;

private:
    int m_minimumGapMinutes;
};

} // namespace moveslot::domain::scheduling
