#undef NDEBUG
#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "application/PlanSyncService.hpp"
#include "test/TestDoubles.hpp"

using namespace moveslot::domain;
using namespace moveslot::application;
using namespace moveslot::test;

namespace {

const CivilDate kDay = Day("2026-06-16");

class UnreachableCalendar : public FakeCalendar {
public:
    std::optional<std::string> createEvent(const std::string&, const Instant&, const Instant&,
                                           const std::string&, int) override {
        throw std::runtime_error("calendar access revoked");
    }
};

DailyMovementPlan SamplePlan(const CivilDate& date) {
    DailyMovementPlan plan;
    plan.id = "plan-" + date.toString() + "-1";
    plan.date = date;

    PlannedActivity lunch;
    lunch.id = "walk-lunch";
    lunch.type = ActivityType::LunchWalk;
    lunch.title = "Lunch Walk";
    lunch.startTime = At(date, 12);
    lunch.durationMinutes = 30;
    lunch.estimatedSteps = 3000;
    lunch.priority = ActivityPriority::Critical;
    lunch.reason = "Quick walk to boost your step count";

    PlannedActivity gym;
    gym.id = "workout-evening";
    gym.type = ActivityType::Workout;
    gym.workoutType = WorkoutType::Pull;
    gym.title = "Pull Day";
    gym.startTime = At(date, 18);
    gym.durationMinutes = 45;
    gym.priority = ActivityPriority::Recommended;

    PlannedActivity done;
    done.id = "walk-morning";
    done.type = ActivityType::MorningWalk;
    done.startTime = At(date, 8, 30);
    done.durationMinutes = 20;
    done.status = ActivityStatus::Completed;

    plan.activities = {done, lunch, gym};
    return plan;
}

} // namespace

static void TestWritesPlannedActivities() {
    std::cout << "[Test] Planned activities become calendar events..." << std::endl;
    auto calendar = std::make_shared<FakeCalendar>();
    auto store = std::make_shared<InMemoryStore>();
    PlanSyncService sync(calendar, store, 10);

    PlanSyncResult result = sync.syncPlan(SamplePlan(kDay));
    assert(result.errors.empty());
    assert(result.createdEventIds.size() == 2);
    assert(calendar->createdEvents.size() == 2);

    const CalendarMeeting& lunch = calendar->createdEvents[0];
    assert(lunch.title == "Lunch Walk");
    assert(lunch.start == At(kDay, 12));
    assert(lunch.end == At(kDay, 12, 30));
    assert(lunch.notes == "Quick walk to boost your step count\n\nSteps: ~3000\nDuration: 30 minutes\nPriority: critical");

    const CalendarMeeting& gym = calendar->createdEvents[1];
    assert(gym.title == "Pull Day");
    assert(gym.notes == "Duration: 45 minutes\nPriority: recommended");
    assert(calendar->lastAlarmOffset == 10);

    assert(sync.eventIdsFor(kDay) == result.createdEventIds);
    std::cout << "[PASS] Writes planned activities" << std::endl;
}

static void TestResyncReplacesEvents() {
    std::cout << "[Test] Syncing again replaces earlier events..." << std::endl;
    auto calendar = std::make_shared<FakeCalendar>();
    auto store = std::make_shared<InMemoryStore>();
    PlanSyncService sync(calendar, store);

    sync.syncPlan(SamplePlan(kDay));
    PlanSyncResult second = sync.syncPlan(SamplePlan(kDay));
    assert(second.errors.empty());
    assert(calendar->deletedIds == (std::vector<std::string>{"evt-1", "evt-2"}));
    assert(second.createdEventIds == (std::vector<std::string>{"evt-3", "evt-4"}));
    assert(sync.eventIdsFor(kDay) == second.createdEventIds);

    // Other dates are untouched.
    sync.syncPlan(SamplePlan(kDay.addDays(1)));
    assert(sync.eventIdsFor(kDay).size() == 2);
    assert(sync.eventIdsFor(kDay.addDays(1)).size() == 2);
    assert(calendar->deletedIds.size() == 2);

    // Records survive a restart.
    PlanSyncService reloaded(calendar, store);
    assert(reloaded.eventIdsFor(kDay) == second.createdEventIds);
    std::cout << "[PASS] Resync replaces" << std::endl;
}

static void TestFailuresAreCollected() {
    std::cout << "[Test] Calendar failures are reported per activity..." << std::endl;
    auto calendar = std::make_shared<FakeCalendar>();
    auto store = std::make_shared<InMemoryStore>();
    PlanSyncService sync(calendar, store);
    sync.syncPlan(SamplePlan(kDay));

    calendar->failDelete = true;
    PlanSyncResult stuck = sync.syncPlan(SamplePlan(kDay));
    assert(stuck.errors.size() == 2);
    assert(stuck.errors[0].kind == SyncErrorKind::EventDeletionFailed);
    assert(stuck.errors[0].subject == "evt-1");
    // Undeleted events stay on record next to the new ones.
    assert(sync.eventIdsFor(kDay).size() == 4);

    calendar->failDelete = false;
    calendar->failCreate = true;
    PlanSyncResult failed = sync.syncPlan(SamplePlan(kDay));
    assert(failed.createdEventIds.empty());
    assert(failed.errors.size() == 2);
    assert(failed.errors[0].kind == SyncErrorKind::EventCreationFailed);
    assert(failed.errors[0].subject == "walk-lunch");
    assert(sync.eventIdsFor(kDay).empty());

    auto unreachable = std::make_shared<UnreachableCalendar>();
    PlanSyncService offline(unreachable, std::make_shared<InMemoryStore>());
    PlanSyncResult down = offline.syncPlan(SamplePlan(kDay));
    assert(down.errors.size() == 2);
    assert(down.errors[1].kind == SyncErrorKind::CalendarUnavailable);
    assert(down.errors[1].subject == "workout-evening");
    assert(down.errors[1].message == "calendar access revoked");
    std::cout << "[PASS] Failures collected" << std::endl;
}

static void TestCleanupOldRecords() {
    std::cout << "[Test] Old sync records are forgotten..." << std::endl;
    auto calendar = std::make_shared<FakeCalendar>();
    auto store = std::make_shared<InMemoryStore>();
    PlanSyncService sync(calendar, store);
    sync.syncPlan(SamplePlan(Day("2026-06-01")));
    sync.syncPlan(SamplePlan(Day("2026-06-09")));
    sync.syncPlan(SamplePlan(kDay));

    assert(sync.cleanupOldRecords(kDay) == 1);
    assert(sync.eventIdsFor(Day("2026-06-01")).empty());
    assert(sync.eventIdsFor(Day("2026-06-09")).size() == 2);
    assert(sync.cleanupOldRecords(kDay) == 0);
    assert(sync.cleanupOldRecords(kDay, 0) == 1);
    assert(sync.eventIdsFor(kDay).size() == 2);
    std::cout << "[PASS] Cleanup" << std::endl;
}

int main() {
    TestWritesPlannedActivities();
    TestResyncReplacesEvents();
    TestFailuresAreCollected();
    TestCleanupOldRecords();
    std::cout << "[Test] All plan sync tests passed." << std::endl;
    return 0;
}
