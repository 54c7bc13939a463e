#include "domain/ScheduledActivity.hpp"

namespace moveslot::domain {

bool ScheduledActivity::occursOn(const CivilDate& date) const {
    if (!isActive || date < startDate) return false;
    if (endDate && *endDate < date) return false;

    switch (recurrence) {
        case Recurrence::Once:
            return date == startDate;
        case Recurrence::Weekly:
            return date.weekday() == startDate.weekday();
        case Recurrence::Weekdays: {
            int w = date.weekday();
            return w >= 2 && w <= 6;
        }
        case Recurrence::Biweekly: {
            if (date.weekday() != startDate.weekday()) return false;
            long weeks = (date.daysSinceEpoch() - startDate.daysSinceEpoch()) / 7;
            return weeks % 2 == 0;
        }
        case Recurrence::Monthly:
            return date.day == startDate.day;
    }
    return false;
}

PlannedActivity ScheduledActivity::occurrenceOn(const CivilDate& date) const {
    PlannedActivity a;
    a.id = id + "@" + date.toString();
    a.type = type;
    a.title = title.empty() ? ActivityTypeDisplayName(type) : title;
    a.startTime = MakeInstantAtMinutes(date, startMinutes);
    a.durationMinutes = durationMinutes;
    a.workoutType = workoutType;
    a.reason = "Scheduled " + RecurrenceToString(recurrence);
    return a;
}

} // namespace moveslot::domain
