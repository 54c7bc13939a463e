#undef NDEBUG
#include <atomic>
#include <cassert>
#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

#include "application/MovementPlanService.hpp"
#include "application/PatternLearningService.hpp"
#include "test/TestDoubles.hpp"

using namespace moveslot::domain;
using namespace moveslot::application;
using namespace moveslot::test;

namespace {

const CivilDate kDay = Day("2026-06-16");

struct Fixture {
    std::shared_ptr<FakeCalendar> calendar = std::make_shared<FakeCalendar>();
    std::shared_ptr<FakeActivityData> activity = std::make_shared<FakeActivityData>();
    std::shared_ptr<InMemoryStore> store = std::make_shared<InMemoryStore>();
    std::shared_ptr<PatternLearningService> learning;

    Fixture() {
        learning = std::make_shared<PatternLearningService>(activity, store);
        // Free after 13:00: 13:00-14:00 and 15:00-16:00.
        calendar->events = {
            Meeting("m1", "Budget review", kDay, 14, 0, 15, 0),
            Meeting("m2", "Design review", kDay, 16, 0, 21, 0),
        };
        activity->steps[kDay] = 8000;
    }

    std::unique_ptr<MovementPlanService> make(UserPreferences prefs = UserPreferences{}) {
        return std::make_unique<MovementPlanService>(calendar, activity, learning, store, prefs);
    }
};

std::string WalkIdAt(int hour, int minute = 0) {
    return "walk-" + std::to_string(ToEpochSeconds(At(kDay, hour, minute)));
}

} // namespace

static void TestGenerateForToday() {
    std::cout << "[Test] Plan for the rest of today..." << std::endl;
    Fixture f;
    auto service = f.make();

    PlanGenerationResult result = service->generatePlan(kDay, At(kDay, 13));
    assert(result.committed);
    const DailyMovementPlan& plan = result.plan;
    assert(plan.date == kDay);
    assert(plan.epoch == 1);
    assert(plan.id == "plan-2026-06-16-1");
    assert(plan.targetSteps == 10000);
    assert(plan.currentSteps == 8000);
    assert(plan.stepsNeeded == 2000);

    assert(plan.activities.size() == 1);
    const PlannedActivity& walk = plan.activities[0];
    assert(walk.id == WalkIdAt(13));
    assert(walk.startTime == At(kDay, 13));
    assert(walk.durationMinutes == 25);
    assert(walk.estimatedSteps == 2500);
    assert(walk.priority == ActivityPriority::Critical);
    assert(walk.status == ActivityStatus::Planned);
    assert(plan.plannedSteps == 2500);
    assert(plan.remainingGap == 0);
    assert(plan.isOnTrack());
    assert(plan.confidence <= 0.95);

    assert(f.learning->adherence().totalPlansGenerated == 1);

    auto stored = service->currentPlan(kDay);
    assert(stored && stored->id == plan.id);
    auto reloaded = f.make()->currentPlan(kDay);
    assert(reloaded && reloaded->id == plan.id);
    assert(reloaded->activities.size() == 1);
    assert(!service->currentPlan(kDay.addDays(1)));
    std::cout << "[PASS] Generate for today" << std::endl;
}

static void TestGenerateForFutureDay() {
    std::cout << "[Test] Future days ignore today's steps..." << std::endl;
    Fixture f;
    f.activity->steps[kDay.addDays(1)] = 9000;
    auto service = f.make();

    PlanGenerationResult result = service->generatePlan(kDay.addDays(1), At(kDay, 20));
    assert(result.committed);
    assert(result.plan.currentSteps == 0);
    assert(result.plan.stepsNeeded == 10000);
    std::cout << "[PASS] Future day" << std::endl;
}

static void TestProviderFailuresDegrade() {
    std::cout << "[Test] Provider failures yield a plan without data..." << std::endl;
    Fixture f;
    f.calendar->failFetch = true;
    f.activity->failFetch = true;
    auto service = f.make();

    PlanGenerationResult result = service->generatePlan(kDay, At(kDay, 13));
    assert(result.committed);
    assert(result.plan.currentSteps == 0);
    assert(result.plan.stepsNeeded == 10000);
    assert(result.plan.walkableMeetings.empty());
    // One open slot from 13:00 to 21:00, capped at a 45 minute walk.
    assert(result.plan.activities.size() == 1);
    assert(result.plan.activities[0].durationMinutes == 45);
    assert(result.plan.remainingGap == 5500);
    assert(!result.plan.isOnTrack());
    std::cout << "[PASS] Degraded providers" << std::endl;
}

static void TestGoalAlreadyMet() {
    std::cout << "[Test] Nothing to plan once the goal is met..." << std::endl;
    Fixture f;
    f.activity->steps[kDay] = 12000;
    auto service = f.make();

    PlanGenerationResult result = service->generatePlan(kDay, At(kDay, 13));
    assert(result.plan.stepsNeeded == 0);
    assert(result.plan.activities.empty());
    assert(result.plan.reasoning == "You've already hit your step goal! Great job!");
    std::cout << "[PASS] Goal met" << std::endl;
}

static void TestPreferenceChangeDiscardsInFlightPlan() {
    std::cout << "[Test] A preference change supersedes a running generation..." << std::endl;
    Fixture f;
    auto service = f.make();

    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::atomic<bool> armed{true};
    f.calendar->onFetch = [&] {
        if (armed.exchange(false)) {
            entered.set_value();
            released.wait();
        }
    };

    PlanGenerationResult stale;
    std::thread worker([&] { stale = service->generatePlan(kDay, At(kDay, 13)); });
    entered.get_future().wait();

    UserPreferences prefs;
    prefs.dailyStepGoal = 12000;
    service->updatePreferences(prefs);
    release.set_value();
    worker.join();

    assert(!stale.committed);
    assert(stale.plan.targetSteps == 10000);
    assert(!service->currentPlan(kDay));
    assert(f.learning->adherence().totalPlansGenerated == 0);

    PlanGenerationResult fresh = service->generatePlan(kDay, At(kDay, 13));
    assert(fresh.committed);
    assert(fresh.plan.targetSteps == 12000);
    assert(fresh.plan.stepsNeeded == 4000);
    assert(service->currentPlan(kDay)->epoch == fresh.plan.epoch);
    assert(service->preferences().dailyStepGoal == 12000);
    std::cout << "[PASS] Preference change" << std::endl;
}

static void TestInvalidateMarksEarlierGenerationsStale() {
    std::cout << "[Test] Invalidation during a fetch discards the result..." << std::endl;
    Fixture f;
    auto service = f.make();
    bool armed = true;
    f.calendar->onFetch = [&] {
        if (armed) {
            armed = false;
            service->invalidate();
        }
    };

    assert(!service->generatePlan(kDay, At(kDay, 13)).committed);
    assert(service->generatePlan(kDay, At(kDay, 13)).committed);
    std::cout << "[PASS] Invalidate" << std::endl;
}

static void TestConcurrentGenerationSameDate() {
    std::cout << "[Test] Concurrent generations for one date are serialized..." << std::endl;
    Fixture f;
    auto service = f.make();

    PlanGenerationResult a;
    PlanGenerationResult b;
    std::thread t1([&] { a = service->generatePlan(kDay, At(kDay, 13)); });
    std::thread t2([&] { b = service->generatePlan(kDay, At(kDay, 13)); });
    t1.join();
    t2.join();

    assert(a.committed && b.committed);
    assert(a.plan.epoch != b.plan.epoch);
    const long long latest = std::max(a.plan.epoch, b.plan.epoch);
    assert(latest == 2);
    assert(service->currentPlan(kDay)->epoch == latest);
    assert(f.calendar->fetchCount == 2);
    assert(f.learning->adherence().totalPlansGenerated == 2);
    std::cout << "[PASS] Concurrent generation" << std::endl;
}

static void TestMarkActivity() {
    std::cout << "[Test] Marking activities feeds the learner..." << std::endl;
    Fixture f;
    auto service = f.make();
    service->generatePlan(kDay, At(kDay, 13));

    PlannedActivity done = service->markActivity(kDay, WalkIdAt(13), ActivityStatus::Completed, At(kDay, 13, 30));
    assert(done.status == ActivityStatus::Completed);
    assert(service->currentPlan(kDay)->activities[0].status == ActivityStatus::Completed);
    assert(f.learning->adherence().activitiesCompleted == 1);

    service->markActivity(kDay, WalkIdAt(13), ActivityStatus::InProgress, At(kDay, 13, 31));
    assert(f.learning->adherence().activitiesCompleted == 1);
    assert(f.learning->adherence().activitiesSkipped == 0);

    service->markActivity(kDay, WalkIdAt(13), ActivityStatus::Skipped, At(kDay, 13, 32));
    assert(f.learning->adherence().activitiesSkipped == 1);

    bool unknownThrew = false;
    try {
        service->markActivity(kDay, "walk-0", ActivityStatus::Completed, At(kDay, 14));
    } catch (const std::invalid_argument&) {
        unknownThrew = true;
    }
    assert(unknownThrew);

    bool noPlanThrew = false;
    try {
        service->markActivity(kDay.addDays(3), WalkIdAt(13), ActivityStatus::Completed, At(kDay, 14));
    } catch (const std::invalid_argument&) {
        noPlanThrew = true;
    }
    assert(noPlanThrew);

    // Status survives a restart.
    auto reloaded = f.make();
    assert(reloaded->currentPlan(kDay)->activities[0].status == ActivityStatus::Skipped);
    std::cout << "[PASS] Mark activity" << std::endl;
}

static void TestWalkAndWorkoutRotation() {
    std::cout << "[Test] Walk and workout follow the rotation..." << std::endl;
    Fixture f;
    auto service = f.make();
    const Instant evening = At(kDay.addDays(-1), 20);

    auto first = service->planWalkAndWorkout(kDay, evening);
    assert(first.workout);
    assert(first.workout->workoutType == WorkoutType::Push);
    assert(first.oneHourSlotCount >= 1);

    service->recordWorkoutDone(Day("2026-06-15"), WorkoutType::Push);
    assert(service->rotation().sessionsThisWeek == 1);
    auto second = service->planWalkAndWorkout(kDay, evening);
    assert(second.workout && second.workout->workoutType == WorkoutType::Pull);

    service->recordWorkoutDone(Day("2026-06-15"), WorkoutType::Pull);
    service->recordWorkoutDone(kDay, WorkoutType::Legs);
    assert(service->rotation().sessionsThisWeek == 3);
    auto rested = service->planWalkAndWorkout(kDay, evening);
    assert(!rested.workout);

    // Rotation state is persisted.
    auto reloaded = f.make();
    assert(reloaded->rotation().sessionsThisWeek == 3);
    assert(*reloaded->rotation().lastWorkout == WorkoutType::Legs);
    std::cout << "[PASS] Walk and workout" << std::endl;
}

int main() {
    TestGenerateForToday();
    TestGenerateForFutureDay();
    TestProviderFailuresDegrade();
    TestGoalAlreadyMet();
    TestPreferenceChangeDiscardsInFlightPlan();
    TestInvalidateMarksEarlierGenerationsStale();
    TestConcurrentGenerationSameDate();
    TestMarkActivity();
    TestWalkAndWorkoutRotation();
    std::cout << "[Test] All movement plan tests passed." << std::endl;
    return 0;
}
