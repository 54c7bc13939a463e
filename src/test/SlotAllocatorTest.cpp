#undef NDEBUG
#include <cassert>
#include <cmath>
#include <iostream>

#include "domain/scheduling/IntervalMath.hpp"
#include "domain/scheduling/SlotAllocator.hpp"
#include "test/TestDoubles.hpp"

using namespace moveslot::domain;
using namespace moveslot::domain::scheduling;
using namespace moveslot::test;

static FreeSlot Slot(const CivilDate& d, int hour, int minute, int minutes, bool meal = false) {
    FreeSlot s;
    s.interval = TimeInterval{At(d, hour, minute), AddMinutes(At(d, hour, minute), minutes)};
    s.durationMinutes = minutes;
    s.slotClass = SlotClassFor(minutes);
    s.isDuringMeal = meal;
    return s;
}

static bool Near(double a, double b) { return std::fabs(a - b) < 1e-9; }

static void TestSingleSlotGap() {
    std::cout << "[Test] 3000 steps into one 40-minute slot..." << std::endl;
    const CivilDate d = Day("2026-06-15");
    SlotAllocator allocator;
    UserActivityPatterns patterns;
    PlanAdherence adherence;

    auto plan = allocator.allocate(3000, {Slot(d, 15, 0, 40)}, {}, patterns, adherence, UserPreferences{});
    assert(plan.size() == 1);
    assert(plan[0].durationMinutes == 35);
    assert(plan[0].estimatedSteps == 3500);
    assert(plan[0].priority == ActivityPriority::Critical);
    assert(plan[0].type == ActivityType::ScheduledWalk);
    assert(plan[0].startTime == At(d, 15));
    assert(plan[0].reason.find("40-min slot covers significant steps") != std::string::npos);

    auto summary = allocator.summarize(3000, plan, {}, patterns);
    assert(summary.plannedSteps == 3500);
    assert(summary.remainingGap == 0);
    assert(Near(summary.coverage, 1.0));
    assert(Near(summary.confidence, 0.6 + 0.4 * 0.3));
    assert(summary.reasoning.find("covers your step goal") != std::string::npos);
    std::cout << "[PASS] 3000 steps into one 40-minute slot" << std::endl;
}

static void TestRankingAndMeals() {
    std::cout << "[Test] Ranking, ties and meal slots..." << std::endl;
    const CivilDate d = Day("2026-06-15");
    SlotAllocator allocator;
    UserActivityPatterns patterns; // peaks 8, 12, 17
    PlanAdherence adherence;

    // Peak hour wins over an otherwise identical slot.
    auto peak = allocator.allocate(2000, {Slot(d, 9, 0, 30), Slot(d, 12, 0, 30)}, {}, patterns, adherence, {});
    assert(peak.size() == 1);
    assert(peak[0].startTime == At(d, 12));
    assert(peak[0].type == ActivityType::LunchWalk);
    assert(peak[0].durationMinutes == 25);

    // Equal scores fall back to the earliest start.
    auto tie = allocator.allocate(2000, {Slot(d, 14, 0, 30), Slot(d, 9, 0, 30)}, {}, patterns, adherence, {});
    assert(tie.size() == 1);
    assert(tie[0].startTime == At(d, 9));
    assert(tie[0].type == ActivityType::MorningWalk);

    // Afternoon adherence breaks the tie the other way.
    adherence.bestTimeSlots[TimeOfDay::Afternoon] = 0.9;
    auto learned = allocator.allocate(2000, {Slot(d, 14, 0, 30), Slot(d, 9, 0, 30)}, {}, patterns, adherence, {});
    assert(learned[0].startTime == At(d, 14));

    // Meal-flagged slots are never used.
    auto meal = allocator.allocate(2000, {Slot(d, 12, 15, 45, true)}, {}, patterns, PlanAdherence{}, {});
    assert(meal.empty());
    std::cout << "[PASS] Ranking, ties and meal slots" << std::endl;
}

static void TestWalkingMeetingCredit() {
    std::cout << "[Test] Walking meetings are credited first..." << std::endl;
    const CivilDate d = Day("2026-06-15");
    SlotAllocator allocator;
    UserActivityPatterns patterns;

    WalkabilityAssessment meeting;
    meeting.meetingId = "m1";
    meeting.title = "1:1 sync";
    meeting.isRecommended = true;
    meeting.estimatedSteps = 3000;
    WalkabilityAssessment notRecommended = meeting;
    notRecommended.isRecommended = false;

    auto none = allocator.allocate(3000, {Slot(d, 15, 0, 40)}, {meeting}, patterns, PlanAdherence{}, {});
    assert(none.empty());

    auto summary = allocator.summarize(3000, none, {meeting, notRecommended}, patterns);
    assert(summary.plannedSteps == 3000);
    assert(summary.remainingGap == 0);
    assert(summary.reasoning.find("Walking meeting opportunities identified.") != std::string::npos);

    auto partial = allocator.allocate(5000, {Slot(d, 15, 0, 60)}, {meeting}, patterns, PlanAdherence{}, {});
    assert(partial.size() == 1);
    assert(partial[0].durationMinutes == 25);
    std::cout << "[PASS] Walking meetings are credited first" << std::endl;
}

static void TestDeterminismAndNoOverlap() {
    std::cout << "[Test] Deterministic, non-overlapping output..." << std::endl;
    const CivilDate d = Day("2026-06-15");
    SlotAllocator allocator;
    UserActivityPatterns patterns;
    PlanAdherence adherence;
    adherence.bestTimeSlots[TimeOfDay::Morning] = 0.7;

    std::vector<FreeSlot> slots{Slot(d, 8, 0, 50), Slot(d, 10, 0, 15), Slot(d, 13, 30, 90),
                                Slot(d, 17, 0, 25), Slot(d, 19, 0, 8)};
    auto first = allocator.allocate(9000, slots, {}, patterns, adherence, {});
    auto second = allocator.allocate(9000, slots, {}, patterns, adherence, {});

    assert(first.size() == second.size());
    assert(!first.empty());
    for (size_t i = 0; i < first.size(); ++i) {
        assert(first[i].id == second[i].id);
        assert(first[i].startTime == second[i].startTime);
        assert(first[i].durationMinutes == second[i].durationMinutes);
        assert(first[i].estimatedSteps == second[i].estimatedSteps);
        assert(first[i].priority == second[i].priority);
        assert(first[i].reason == second[i].reason);
    }

    for (size_t i = 0; i < first.size(); ++i) {
        if (i > 0) assert(first[i - 1].startTime < first[i].startTime);
        bool inside = false;
        for (const auto& s : slots) {
            if (s.interval.start <= first[i].startTime && first[i].endTime() <= s.interval.end) inside = true;
        }
        assert(inside);
        for (size_t j = i + 1; j < first.size(); ++j) {
            assert(!Overlaps(first[i].interval(), first[j].interval()));
        }
    }
    std::cout << "[PASS] Deterministic, non-overlapping output" << std::endl;
}

static void TestMonotonicGap() {
    std::cout << "[Test] More free time never widens the gap..." << std::endl;
    const CivilDate d = Day("2026-06-15");
    SlotAllocator allocator;
    UserActivityPatterns patterns;

    std::vector<FreeSlot> all{Slot(d, 9, 0, 20), Slot(d, 11, 0, 35), Slot(d, 14, 0, 60),
                              Slot(d, 16, 0, 30), Slot(d, 18, 0, 50)};
    int previousGap = 1 << 30;
    for (size_t n = 0; n <= all.size(); ++n) {
        std::vector<FreeSlot> subset(all.begin(), all.begin() + static_cast<long>(n));
        auto plan = allocator.allocate(12000, subset, {}, patterns, PlanAdherence{}, {});
        int gap = allocator.summarize(12000, plan, {}, patterns).remainingGap;
        assert(gap <= previousGap);
        previousGap = gap;
    }

    // Lengthening a slot never hurts either.
    int narrow = allocator.summarize(6000, allocator.allocate(6000, {Slot(d, 14, 0, 20)}, {}, patterns, PlanAdherence{}, {}), {}, patterns).remainingGap;
    int wide = allocator.summarize(6000, allocator.allocate(6000, {Slot(d, 14, 0, 50)}, {}, patterns, PlanAdherence{}, {}), {}, patterns).remainingGap;
    assert(wide <= narrow);
    std::cout << "[PASS] More free time never widens the gap" << std::endl;
}

static void TestSummaryText() {
    std::cout << "[Test] Confidence and reasoning..." << std::endl;
    const CivilDate d = Day("2026-06-15");
    SlotAllocator allocator;
    UserActivityPatterns patterns;

    auto done = allocator.summarize(0, {}, {}, patterns);
    assert(Near(done.coverage, 1.0));
    assert(done.reasoning == "You've already hit your step goal! Great job!");

    auto plan = allocator.allocate(10000, {Slot(d, 15, 0, 20)}, {}, patterns, PlanAdherence{}, {});
    auto limited = allocator.summarize(10000, plan, {}, patterns);
    assert(limited.plannedSteps == 1500);
    assert(limited.remainingGap == 8500);
    assert(limited.reasoning.find("Limited availability") != std::string::npos);
    assert(limited.reasoning.find("8500") != std::string::npos);

    UserActivityPatterns achiever;
    achiever.goalAchievementRate = 1.0;
    assert(Near(allocator.summarize(0, {}, {}, achiever).confidence, 0.95));

    assert(SlotAllocator::PriorityForShare(3500, 3000) == ActivityPriority::Critical);
    assert(SlotAllocator::PriorityForShare(1000, 4000) == ActivityPriority::Recommended);
    assert(SlotAllocator::PriorityForShare(500, 4000) == ActivityPriority::Optional);
    assert(SlotAllocator::ActivityTypeForSlot(SlotClass::Micro, 12) == ActivityType::MicroWalk);
    assert(SlotAllocator::ActivityTypeForSlot(SlotClass::Extended, 12) == ActivityType::ScheduledWalk);
    assert(SlotAllocator::ActivityTypeForSlot(SlotClass::Extended, 18) == ActivityType::EveningWalk);
    std::cout << "[PASS] Confidence and reasoning" << std::endl;
}

static void TestReasonNamesPreferredBand() {
    std::cout << "[Test] Reasons name the user's preferred walking time..." << std::endl;
    const CivilDate d = Day("2026-06-15");
    SlotAllocator allocator;
    UserActivityPatterns patterns;
    FreeSlot morning = Slot(d, 9, 0, 40);
    morning.isPreferredTime = true;

    UserPreferences early;
    early.preferredWalkTime = PreferredTime::Morning;
    auto plan = allocator.allocate(3000, {morning}, {}, patterns, PlanAdherence{}, early);
    assert(plan.size() == 1);
    assert(plan[0].reason.find("Matches your preferred morning walking time") == 0);

    // Without a preference every slot is flagged, so nothing is claimed.
    auto any = allocator.allocate(3000, {morning}, {}, patterns, PlanAdherence{}, UserPreferences{});
    assert(any.size() == 1);
    assert(any[0].reason.find("preferred") == std::string::npos);
    assert(any[0].reason == "40-min slot covers significant steps");
    std::cout << "[PASS] Preferred band in reason" << std::endl;
}

int main() {
    TestSingleSlotGap();
    TestRankingAndMeals();
    TestWalkingMeetingCredit();
    TestDeterminismAndNoOverlap();
    TestMonotonicGap();
    TestSummaryText();
    TestReasonNamesPreferredBand();
    std::cout << "[PASS] SlotAllocatorTest" << std::endl;
    return 0;
}
