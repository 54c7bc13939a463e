#include "domain/scheduling/BusyIntervalBuilder.hpp"
#include "domain/scheduling/IntervalMath.hpp"

#include <algorithm>

namespace moveslot::domain::scheduling {

std::vector<BusyInterval> BuildBusyIntervals(const CivilDate& date,
                                             const std::vector<CalendarMeeting>& meetings,
                                             const std::vector<PlannedActivity>& activities,
                                             const BusyIntervalOptions& options) {
    const TimeInterval day{StartOfDay(date), StartOfDay(date.addDays(1))};
    std::vector<BusyInterval> busy;
    busy.reserve(meetings.size() + activities.size());

    for (const auto& m : meetings) {
        if (options.realMeetingsOnly && !m.isRealMeeting()) continue;
        TimeInterval i = m.interval();
        if (!i.isValid() || !Overlaps(i, day)) continue;
        busy.push_back(BusyInterval{i, BusySource::Meeting, m.title});
    }

    for (const auto& a : activities) {
        if (a.status == ActivityStatus::Skipped || a.status == ActivityStatus::Rescheduled) continue;
        TimeInterval i = a.interval();
        if (!i.isValid() || !Overlaps(i, day)) continue;
        busy.push_back(BusyInterval{i, BusySource::Activity, a.title});
    }

    std::stable_sort(busy.begin(), busy.end(), [](const BusyInterval& a, const BusyInterval& b) {
        if (a.interval.start != b.interval.start) return a.interval.start < b.interval.start;
        return a.interval.end < b.interval.end;
    });
    return busy;
}

std::vector<TimeInterval> ToIntervals(const std::vector<BusyInterval>& busy) {
    std::vector<TimeInterval> out;
    out.reserve(busy.size());
    for (const auto& b : busy) out.push_back(b.interval);
    return out;
}

} // namespace moveslot::domain::scheduling
