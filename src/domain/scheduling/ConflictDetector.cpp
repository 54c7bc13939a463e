#include "domain/scheduling/ConflictDetector.hpp"
#include "domain/scheduling/IntervalMath.hpp"

#include <cstdlib>

namespace moveslot::domain::scheduling {

std::optional<ScheduleConflict> ConflictDetector::check(const PlannedActivity& occurrence,
                                                        const CalendarMeeting& meeting) const {
    if (!meeting.isRealMeeting()) return std::nullopt;

    ScheduleConflict conflict;
    conflict.activityId = occurrence.id;
    conflict.activityTitle = occurrence.title;
    conflict.meetingId = meeting.id;
    conflict.meetingTitle = meeting.title;
    conflict.activityStart = occurrence.startTime;
    conflict.meetingStart = meeting.start;

    if (Overlaps(occurrence.interval(), meeting.interval())) {
        conflict.type = ConflictType::Overlap;
        return conflict;
    }

    const int endToStart = std::abs(MinutesBetween(occurrence.endTime(), meeting.start));
    const int startToEnd = std::abs(MinutesBetween(meeting.end, occurrence.startTime));
    if (endToStart < m_minimumGapMinutes || startToEnd < m_minimumGapMinutes) {
        conflict.type = ConflictType::TooClose;
        return conflict;
    }
    return std::nullopt;
}

std::vector<ScheduleConflict> ConflictDetector::checkPlanned(const std::vector<PlannedActivity>& activities,
                                                             const std::vector<CalendarMeeting>& meetings) const {
    std::vector<ScheduleConflict> conflicts;
    for (const auto& a : activities) {
        for (const auto& m : meetings) {
            if (auto c = check(a, m)) conflicts.push_back(*c);
        }
    }
    return conflicts;
}

std::vector<ScheduleConflict> ConflictDetector::checkConflicts(const CivilDate& date,
                                                               const std::vector<ScheduledActivity>& activities,
                                                               const std::vector<CalendarMeeting>& meetings) const {
    std::vector<PlannedActivity> occurrences;
    for (const auto& a : activities) {
        if (a.occursOn(date)) occurrences.push_back(a.occurrenceOn(date));
    }
    return checkPlanned(occurrences, meetings);
}

} // namespace moveslot::domain::scheduling
