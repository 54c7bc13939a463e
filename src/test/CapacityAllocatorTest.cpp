#undef NDEBUG
#include <cassert>
#include <iostream>

#include "domain/WorkoutRotation.hpp"
#include "domain/scheduling/CapacityAllocator.hpp"
#include "test/TestDoubles.hpp"

using namespace moveslot::domain;
using namespace moveslot::domain::scheduling;
using namespace moveslot::test;

static FreeSlot Slot(const CivilDate& d, int hour, int minute, int minutes) {
    FreeSlot s;
    s.interval = TimeInterval{At(d, hour, minute), AddMinutes(At(d, hour, minute), minutes)};
    s.durationMinutes = minutes;
    s.slotClass = SlotClassFor(minutes);
    return s;
}

static void TestNoHourSlots() {
    std::cout << "[Test] Short slots only..." << std::endl;
    const CivilDate d = Day("2026-06-16");
    CapacityAllocator allocator;
    UserPreferences prefs;

    auto result = allocator.allocate(d, {Slot(d, 10, 0, 50), Slot(d, 15, 0, 45)}, {}, {}, prefs, true, WorkoutType::Pull);
    assert(result.oneHourSlotCount == 0);
    assert(result.workout);
    assert(result.workout->startTime == At(d, 10));
    assert(result.workout->durationMinutes == 45);
    assert(result.workout->workoutType == WorkoutType::Pull);
    assert(result.workout->title == "Pull Day");
    assert(result.workout->priority == ActivityPriority::Critical);
    assert(result.walk);
    assert(result.walk->startTime == At(d, 15));
    assert(result.walk->title == "Afternoon Walk");
    assert(result.walk->estimatedSteps == 4500);
    std::cout << "[PASS] Short slots only" << std::endl;
}

static void TestOneHourSlot() {
    std::cout << "[Test] One hour-long slot..." << std::endl;
    const CivilDate d = Day("2026-06-16");
    CapacityAllocator allocator;
    UserPreferences prefs;

    WalkabilityAssessment meeting;
    meeting.meetingId = "m1";
    meeting.title = "Coffee chat";
    meeting.start = At(d, 11);
    meeting.isRecommended = true;

    auto withGym = allocator.allocate(d, {Slot(d, 14, 0, 90)}, {meeting}, {}, prefs, true, WorkoutType::Legs);
    assert(withGym.oneHourSlotCount == 1);
    assert(withGym.workout && withGym.workout->startTime == At(d, 14));
    assert(withGym.walkingMeeting && withGym.walkingMeeting->meetingId == "m1");
    assert(!withGym.walk);

    auto walkOnly = allocator.allocate(d, {Slot(d, 14, 0, 90)}, {}, {}, prefs, false, WorkoutType::Legs);
    assert(!walkOnly.workout);
    assert(walkOnly.walk && walkOnly.walk->durationMinutes == 45);
    assert(walkOnly.walk->isIdeal);
    std::cout << "[PASS] One hour-long slot" << std::endl;
}

static void TestSeveralHourSlots() {
    std::cout << "[Test] Several hour-long slots use preferences..." << std::endl;
    const CivilDate d = Day("2026-06-16");
    CapacityAllocator allocator;
    UserPreferences prefs;
    prefs.preferredGymTime = PreferredTime::Evening;
    prefs.preferredWalkTime = PreferredTime::Morning;

    std::vector<FreeSlot> slots{Slot(d, 9, 0, 60), Slot(d, 13, 30, 90), Slot(d, 17, 30, 60), Slot(d, 20, 0, 60)};
    auto result = allocator.allocate(d, slots, {}, {}, prefs, true, WorkoutType::Push);
    assert(result.oneHourSlotCount == 4);
    assert(result.workout && result.workout->startTime == At(d, 17, 30));
    assert(result.walk && result.walk->startTime == At(d, 9));
    assert(result.walk->title == "Morning Walk");
    assert(result.extraWalkOptions.size() == 2);
    assert(result.extraWalkOptions[0].startTime == At(d, 13, 30));
    assert(result.extraWalkOptions[1].startTime == At(d, 20));
    std::cout << "[PASS] Several hour-long slots use preferences" << std::endl;
}

static void TestPreferredTimeFallback() {
    std::cout << "[Test] Fallback search when no slot fits..." << std::endl;
    const CivilDate d = Day("2026-06-16");
    CapacityAllocator allocator;
    UserPreferences prefs;
    prefs.preferredGymTime = PreferredTime::Morning;

    auto result = allocator.allocate(d, {}, {}, {}, prefs, true, WorkoutType::Push);
    assert(result.workout);
    assert(result.workout->startTime == At(d, 7));
    assert(!result.workout->isIdeal);
    // 08:00 is breakfast; the next candidate clears the workout and the meal.
    assert(result.walk);
    assert(result.walk->startTime == At(d, 8, 30));
    assert(!result.walk->isIdeal);

    std::vector<TimeInterval> busy{TimeInterval{At(d, 6), At(d, 11)}};
    auto blocked = allocator.allocate(d, {}, {}, busy, prefs, true, WorkoutType::Push);
    assert(!blocked.workout);
    std::cout << "[PASS] Fallback search when no slot fits" << std::endl;
}

static void TestPreferenceTables() {
    std::cout << "[Test] Preference score tables..." << std::endl;
    assert(GymPreferenceScore(7, PreferredTime::Morning) == 3);
    assert(GymPreferenceScore(11, PreferredTime::Morning) == 1);
    assert(GymPreferenceScore(13, PreferredTime::Morning) == 0);
    assert(GymPreferenceScore(18, PreferredTime::NoPreference) == 2);
    assert(GymPreferenceScore(12, PreferredTime::NoPreference) == 1);
    assert(WalkPreferenceScore(12, PreferredTime::Afternoon) == 3);
    assert(WalkPreferenceScore(21, PreferredTime::Evening) == 0);
    assert(WalkPreferenceScore(3, PreferredTime::NoPreference) == 1);
    std::cout << "[PASS] Preference score tables" << std::endl;
}

static void TestRotation() {
    std::cout << "[Test] Workout rotation..." << std::endl;
    WorkoutRotation rotation;
    const CivilDate monday = Day("2026-06-15");
    assert(WorkoutRotation::WeekStartOf(Day("2026-06-21")) == monday); // Sunday
    assert(WorkoutRotation::WeekStartOf(monday) == monday);
    assert(rotation.nextWorkout() == WorkoutType::Push);

    rotation.recordWorkout(monday, WorkoutType::Push);
    rotation.recordWorkout(monday.addDays(2), WorkoutType::Pull);
    assert(rotation.nextWorkout() == WorkoutType::Legs);
    assert(rotation.needsWorkout(monday.addDays(3), 3));
    rotation.recordWorkout(monday.addDays(4), WorkoutType::Legs);
    assert(!rotation.needsWorkout(monday.addDays(5), 3));
    assert(rotation.nextWorkout() == WorkoutType::Push);

    // A new week starts the count again.
    assert(rotation.sessionsInWeekOf(monday.addDays(7)) == 0);
    assert(rotation.needsWorkout(monday.addDays(7), 3));
    std::cout << "[PASS] Workout rotation" << std::endl;
}

int main() {
    TestNoHourSlots();
    TestOneHourSlot();
    TestSeveralHourSlots();
    TestPreferredTimeFallback();
    TestPreferenceTables();
    TestRotation();
    std::cout << "[PASS] CapacityAllocatorTest" << std::endl;
    return 0;
}
