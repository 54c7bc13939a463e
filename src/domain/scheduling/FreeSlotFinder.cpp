#include "domain/scheduling/FreeSlotFinder.hpp"
#include "domain/scheduling/IntervalMath.hpp"

#include <algorithm>

namespace moveslot::domain::scheduling {

TimeInterval ActiveWindowFor(const CivilDate& date,
                             const UserPreferences& prefs,
                             const std::optional<Instant>& now,
                             const ActiveWindowConfig& config) {
    const int startMinutes = prefs.wakeMinutes + config.wakeBufferMinutes;
    const int endMinutes = std::min(prefs.sleepMinutes - config.sleepBufferMinutes, config.latestEndMinutes);

    TimeInterval window{MakeInstantAtMinutes(date, startMinutes), MakeInstantAtMinutes(date, endMinutes)};
    if (now && DateOf(*now) == date && *now > window.start) {
        window.start = *now;
    }
    return window;
}

FreeSlot FreeSlotFinder::annotate(const TimeInterval& gap) const {
    FreeSlot slot;
    slot.interval = gap;
    slot.durationMinutes = gap.durationMinutes();
    slot.slotClass = SlotClassFor(slot.durationMinutes);
    slot.isDuringMeal = m_prefs.isDuringMeal(gap.start);
    slot.isPreferredTime = m_prefs.isPreferredWalkHour(HourOf(gap.start));
    return slot;
}

std::vector<FreeSlot> FreeSlotFinder::findFreeSlots(const CivilDate& date,
                                                    const std::vector<BusyInterval>& busyIntervals,
                                                    const TimeInterval& activeWindow,
                                                    int minDurationMinutes) const {
    std::vector<FreeSlot> slots;
    if (!m_prefs.hasValidDay() || !activeWindow.isValid()) {
        return slots;
    }

    const TimeInterval day{StartOfDay(date), StartOfDay(date.addDays(1))};
    auto window = Intersect(activeWindow, day);
    if (!window) return slots;

    std::vector<BusyInterval> sorted = busyIntervals;
    std::stable_sort(sorted.begin(), sorted.end(), [](const BusyInterval& a, const BusyInterval& b) {
        return a.interval.start < b.interval.start;
    });

    Instant cursor = window->start;
    for (const auto& busy : sorted) {
        auto clamped = ClampToWindow(busy.interval, *window);
        if (!clamped) continue;

        if (clamped->start > cursor) {
            TimeInterval gap{cursor, clamped->start};
            if (gap.durationMinutes() >= minDurationMinutes) {
                slots.push_back(annotate(gap));
            }
        }
        cursor = std::max(cursor, clamped->end);
    }

    if (cursor < window->end) {
        TimeInterval tail{cursor, window->end};
        if (tail.durationMinutes() >= minDurationMinutes) {
            slots.push_back(annotate(tail));
        }
    }
    return slots;
}

} // namespace moveslot::domain::scheduling
