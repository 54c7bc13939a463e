#undef NDEBUG
#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "application/ScheduleService.hpp"
#include "test/TestDoubles.hpp"

using namespace moveslot::domain;
using namespace moveslot::application;
using namespace moveslot::test;

static ScheduledActivity Entry(Recurrence recurrence, int hour, int minute, int duration,
                               const CivilDate& startDate) {
    ScheduledActivity a;
    a.type = ActivityType::ScheduledWalk;
    a.recurrence = recurrence;
    a.startMinutes = hour * 60 + minute;
    a.durationMinutes = duration;
    a.startDate = startDate;
    return a;
}

template <typename Fn>
static bool Throws(Fn fn) {
    try {
        fn();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

static void TestRecurrence() {
    std::cout << "[Test] Recurrence rules..." << std::endl;
    const CivilDate monday = Day("2026-06-15");

    ScheduledActivity once = Entry(Recurrence::Once, 9, 0, 30, monday);
    assert(once.occursOn(monday));
    assert(!once.occursOn(monday.addDays(7)));
    assert(!once.occursOn(monday.addDays(-1)));

    ScheduledActivity weekly = Entry(Recurrence::Weekly, 9, 0, 30, monday);
    assert(weekly.occursOn(Day("2026-06-22")));
    assert(!weekly.occursOn(Day("2026-06-16")));
    weekly.endDate = Day("2026-06-30");
    assert(weekly.occursOn(Day("2026-06-29")));
    assert(!weekly.occursOn(Day("2026-07-06")));

    ScheduledActivity weekdays = Entry(Recurrence::Weekdays, 9, 0, 30, monday);
    assert(weekdays.occursOn(Day("2026-06-19")));
    assert(!weekdays.occursOn(Day("2026-06-20")));
    assert(!weekdays.occursOn(Day("2026-06-21")));

    ScheduledActivity biweekly = Entry(Recurrence::Biweekly, 9, 0, 30, monday);
    assert(!biweekly.occursOn(Day("2026-06-22")));
    assert(biweekly.occursOn(Day("2026-06-29")));

    ScheduledActivity monthly = Entry(Recurrence::Monthly, 9, 0, 30, monday);
    assert(monthly.occursOn(Day("2026-07-15")));
    assert(!monthly.occursOn(Day("2026-07-16")));

    ScheduledActivity paused = Entry(Recurrence::Weekly, 9, 0, 30, monday);
    paused.isActive = false;
    assert(!paused.occursOn(monday));

    PlannedActivity occurrence = weekly.occurrenceOn(Day("2026-06-22"));
    assert(occurrence.startTime == At(Day("2026-06-22"), 9));
    assert(occurrence.durationMinutes == 30);
    std::cout << "[PASS] Recurrence" << std::endl;
}

static void TestAddValidationAndDefaults() {
    std::cout << "[Test] Adding entries validates and fills defaults..." << std::endl;
    const CivilDate monday = Day("2026-06-15");
    auto store = std::make_shared<InMemoryStore>();
    ScheduleService service(store);

    assert(Throws([&] { service.add(Entry(Recurrence::Once, 9, 0, 0, monday)); }));
    assert(Throws([&] { service.add(Entry(Recurrence::Once, 23, 45, 30, monday)); }));
    ScheduledActivity backwards = Entry(Recurrence::Weekly, 9, 0, 30, monday);
    backwards.endDate = monday.addDays(-1);
    assert(Throws([&] { service.add(backwards); }));
    assert(service.list().empty());

    ScheduledActivity walk = service.add(Entry(Recurrence::Weekly, 12, 0, 30, monday));
    assert(walk.id == "sched-1");
    assert(walk.title == "Walk");

    ScheduledActivity gym = Entry(Recurrence::Weekdays, 18, 0, 60, monday);
    gym.type = ActivityType::Workout;
    gym = service.add(gym);
    assert(gym.id == "sched-2");
    assert(gym.workoutType && *gym.workoutType == WorkoutType::Push);
    assert(gym.title == "Push Day");

    ScheduledActivity named = Entry(Recurrence::Once, 7, 0, 20, monday);
    named.id = "sched-1";
    assert(Throws([&] { service.add(named); }));
    assert(service.list().size() == 2);
    std::cout << "[PASS] Add validation" << std::endl;
}

static void TestOccurrencesAndPersistence() {
    std::cout << "[Test] Occurrences are ordered and survive a reload..." << std::endl;
    const CivilDate monday = Day("2026-06-15");
    auto store = std::make_shared<InMemoryStore>();
    {
        ScheduleService service(store);
        service.add(Entry(Recurrence::Weekdays, 18, 0, 30, monday));
        service.add(Entry(Recurrence::Weekly, 7, 0, 30, monday));
        ScheduledActivity lunch = service.add(Entry(Recurrence::Once, 12, 30, 20, monday));

        auto today = service.occurrencesOn(monday);
        assert(today.size() == 3);
        assert(today[0].startTime == At(monday, 7));
        assert(today[1].startTime == At(monday, 12, 30));
        assert(today[2].startTime == At(monday, 18));

        auto tuesday = service.occurrencesOn(Day("2026-06-16"));
        assert(tuesday.size() == 1);
        assert(tuesday[0].id == "sched-1@2026-06-16");

        service.setActive("sched-1", false);
        assert(service.occurrencesOn(Day("2026-06-16")).empty());
        assert(Throws([&] { service.setActive("missing", true); }));

        assert(service.remove(lunch.id));
        assert(!service.remove(lunch.id));
    }

    ScheduleService reloaded(store);
    auto entries = reloaded.list();
    assert(entries.size() == 2);
    assert(!entries[0].isActive);
    assert(entries[1].recurrence == Recurrence::Weekly);

    // Generated ids skip the ones still in use.
    ScheduledActivity extra = reloaded.add(Entry(Recurrence::Once, 10, 0, 15, monday));
    assert(extra.id == "sched-3");
    std::cout << "[PASS] Occurrences and persistence" << std::endl;
}

static void TestConflicts() {
    std::cout << "[Test] Conflicts with calendar meetings..." << std::endl;
    const CivilDate monday = Day("2026-06-15");
    auto store = std::make_shared<InMemoryStore>();
    ScheduleService service(store);
    service.add(Entry(Recurrence::Weekly, 12, 0, 30, monday));

    std::vector<CalendarMeeting> meetings = {
        Meeting("overlap", "Design sync", monday, 12, 15, 13, 0),
        Meeting("close", "Budget", monday, 12, 45, 13, 15),
        Meeting("far", "Planning", monday, 14, 0, 15, 0),
    };
    CalendarMeeting holiday = Meeting("holiday", "Company holiday", monday, 0, 0, 23, 59);
    holiday.isAllDay = true;
    meetings.push_back(holiday);

    auto conflicts = service.checkConflicts(monday, meetings);
    assert(conflicts.size() == 2);
    assert(conflicts[0].meetingId == "overlap");
    assert(conflicts[0].type == ConflictType::Overlap);
    assert(conflicts[0].activityId == "sched-1@2026-06-15");
    assert(conflicts[1].meetingId == "close");
    assert(conflicts[1].type == ConflictType::TooClose);

    assert(service.checkConflicts(Day("2026-06-16"), meetings).empty());
    std::cout << "[PASS] Conflicts" << std::endl;
}

static void TestSuggestBestTime() {
    std::cout << "[Test] Best time from recorded outcomes..." << std::endl;
    auto store = std::make_shared<InMemoryStore>();
    ScheduleService service(store);
    const ActivityType walk = ActivityType::ScheduledWalk;

    assert(!service.suggestBestTime(walk, 2));

    service.recordOutcome(walk, 2, 7, false);
    service.recordOutcome(walk, 2, 7, false);
    assert(!service.suggestBestTime(walk, 2));

    service.recordOutcome(walk, 2, 17, true);
    service.recordOutcome(walk, 2, 17, false);
    assert(*service.suggestBestTime(walk, 2) == 17);

    service.recordOutcome(walk, 2, 9, true);
    service.recordOutcome(walk, 2, 9, true);
    service.recordOutcome(walk, 2, 9, false);
    assert(*service.suggestBestTime(walk, 2) == 9);

    service.recordOutcome(walk, 2, 8, true);
    service.recordOutcome(walk, 2, 8, false);
    service.recordOutcome(walk, 2, 8, true);
    assert(*service.suggestBestTime(walk, 2) == 8);

    assert(!service.suggestBestTime(walk, 3));
    assert(!service.suggestBestTime(ActivityType::Workout, 2));

    assert(Throws([&] { service.recordOutcome(walk, 0, 9, true); }));
    assert(Throws([&] { service.recordOutcome(walk, 2, 24, true); }));

    ScheduleService reloaded(store);
    assert(reloaded.timeStats().size() == 4);
    assert(*reloaded.suggestBestTime(walk, 2) == 8);
    std::cout << "[PASS] Suggest best time" << std::endl;
}

int main() {
    TestRecurrence();
    TestAddValidationAndDefaults();
    TestOccurrencesAndPersistence();
    TestConflicts();
    TestSuggestBestTime();
    std::cout << "[Test] All schedule tests passed." << std::endl;
    return 0;
}
