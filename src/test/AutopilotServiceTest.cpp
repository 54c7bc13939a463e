#undef NDEBUG
#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "application/AutopilotService.hpp"
#include "test/TestDoubles.hpp"

using namespace moveslot::domain;
using namespace moveslot::application;
using namespace moveslot::test;

namespace {

const CivilDate kTarget = Day("2026-06-16");

// Free: 09:00-10:00, 11:30-12:00, 14:00-15:00, 17:00-17:20.
std::vector<CalendarMeeting> BusyTuesday() {
    return {
        Meeting("m1", "Standup", kTarget, 8, 0, 9, 0),
        Meeting("m2", "Roadmap", kTarget, 10, 0, 11, 30),
        Meeting("m3", "Offsite lunch", kTarget, 12, 0, 14, 0),
        Meeting("m4", "Review", kTarget, 15, 0, 17, 0),
        Meeting("m5", "Hackathon", kTarget, 17, 20, 21, 0),
    };
}

struct Fixture {
    std::shared_ptr<FakeCalendar> calendar = std::make_shared<FakeCalendar>();
    std::shared_ptr<InMemoryStore> store = std::make_shared<InMemoryStore>();
    std::shared_ptr<RecordingNotifications> notifications = std::make_shared<RecordingNotifications>();

    explicit Fixture(TrustLevel trust) {
        calendar->events = BusyTuesday();
        settings.trustLevel = trust;
    }

    std::unique_ptr<AutopilotService> make() {
        return std::make_unique<AutopilotService>(calendar, store, notifications, settings, UserPreferences{});
    }

    AutopilotSettings settings;
};

template <typename Fn>
bool Throws(Fn fn) {
    try {
        fn();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

} // namespace

static void TestConfirmFirstQueuesPrompts() {
    std::cout << "[Test] Confirm-first queues three walks for approval..." << std::endl;
    Fixture f(TrustLevel::ConfirmFirst);
    auto service = f.make();

    AutopilotRunResult result = service->runNightly(kTarget);
    assert(!result.skipped);
    assert(result.errors.empty());
    assert(result.walks.size() == 3);
    assert(result.walks[0].startTime == At(kTarget, 9));
    assert(result.walks[0].durationMinutes == 30);
    assert(result.walks[0].type == AutopilotWalkType::Standard);
    assert(result.walks[1].startTime == At(kTarget, 11, 30));
    assert(result.walks[2].startTime == At(kTarget, 17));
    assert(result.walks[2].durationMinutes == 20);
    assert(result.walks[2].type == AutopilotWalkType::Short);
    assert(result.walks[0].id == "autopilot-2026-06-16-0900");

    for (const auto& w : result.walks) {
        assert(w.approvalState == ApprovalState::Pending);
        assert(!w.calendarEventId);
    }
    assert(f.notifications->prompts.size() == 3);
    assert(f.notifications->summaries.empty());
    assert(f.calendar->createdEvents.empty());
    assert(service->pendingWalks().size() == 3);
    assert(*service->lastScheduledDate() == kTarget);
    std::cout << "[PASS] Confirm first" << std::endl;
}

static void TestFullAutoCommits() {
    std::cout << "[Test] Full-auto writes every walk to the calendar..." << std::endl;
    Fixture f(TrustLevel::FullAuto);
    auto service = f.make();

    AutopilotRunResult result = service->runNightly(kTarget);
    assert(result.errors.empty());
    assert(result.walks.size() == 3);
    for (const auto& w : result.walks) {
        assert(w.approvalState == ApprovalState::Approved);
        assert(w.calendarEventId);
    }
    assert(f.calendar->createdEvents.size() == 3);
    assert(f.calendar->createdEvents[0].title == "Power Walk");
    assert(f.calendar->createdEvents[0].notes == "Duration: 30 minutes\nType: standard");
    assert(f.calendar->createdEvents[2].title == "Energy Boost");
    assert(f.calendar->createdEvents[2].end == At(kTarget, 17, 20));
    assert(f.calendar->lastAlarmOffset == 5);
    assert(f.notifications->prompts.empty());
    assert(f.notifications->summaries.size() == 1);
    assert(f.notifications->summaries[0].size() == 3);
    assert(service->pendingWalks().empty());
    std::cout << "[PASS] Full auto" << std::endl;
}

static void TestSuggestOnlyLeavesCalendarAlone() {
    std::cout << "[Test] Suggest-only never touches the calendar..." << std::endl;
    Fixture f(TrustLevel::SuggestOnly);
    auto service = f.make();

    AutopilotRunResult result = service->runNightly(kTarget);
    assert(result.walks.size() == 3);
    assert(f.calendar->createdEvents.empty());
    assert(f.notifications->prompts.empty());
    assert(f.notifications->summaries.empty());
    std::cout << "[PASS] Suggest only" << std::endl;
}

static void TestCommitFailureAndRetry() {
    std::cout << "[Test] Failed calendar writes are reported and retried..." << std::endl;
    Fixture f(TrustLevel::FullAuto);
    f.calendar->failCreate = true;
    auto service = f.make();

    AutopilotRunResult result = service->runNightly(kTarget);
    assert(result.walks.size() == 3);
    assert(result.errors.size() == 3);
    assert(result.errors[0] == "Failed to create calendar event for Power Walk at 09:00");
    for (const auto& w : result.walks) {
        assert(w.approvalState == ApprovalState::Pending);
        assert(!w.lastError.empty());
    }
    assert(f.notifications->summaries.empty());

    assert(service->retryFailedCommits().size() == 3);

    f.calendar->failCreate = false;
    assert(service->retryFailedCommits().empty());
    for (const auto& w : service->walksFor(kTarget)) {
        assert(w.approvalState == ApprovalState::Approved);
        assert(w.lastError.empty());
        assert(w.calendarEventId);
    }
    assert(f.calendar->createdEvents.size() == 3);
    assert(service->retryFailedCommits().empty());
    assert(f.calendar->createdEvents.size() == 3);
    std::cout << "[PASS] Commit failure and retry" << std::endl;
}

static void TestIdempotentRunAndForce() {
    std::cout << "[Test] A second run is skipped unless forced..." << std::endl;
    Fixture f(TrustLevel::FullAuto);
    auto service = f.make();

    service->runNightly(kTarget);
    const int fetches = f.calendar->fetchCount;

    AutopilotRunResult again = service->runNightly(kTarget);
    assert(again.skipped);
    assert(again.walks.size() == 3);
    assert(f.calendar->fetchCount == fetches);
    assert(f.calendar->createdEvents.size() == 3);

    AutopilotRunResult forced = service->runNightly(kTarget, {}, true);
    assert(!forced.skipped);
    assert(forced.walks.size() == 3);
    assert(f.calendar->deletedIds.size() == 3);
    assert(f.calendar->deletedIds[0] == "evt-1");
    assert(f.calendar->createdEvents.size() == 6);
    assert(service->walksFor(kTarget).size() == 3);
    assert(*service->walksFor(kTarget)[0].calendarEventId == "evt-4");

    // A failed deletion is reported but does not stop the rerun.
    f.calendar->failDelete = true;
    AutopilotRunResult forcedAgain = service->runNightly(kTarget, {}, true);
    assert(forcedAgain.errors.size() == 3);
    assert(forcedAgain.errors[0] == "Failed to delete superseded event evt-4");
    assert(service->walksFor(kTarget).size() == 3);
    std::cout << "[PASS] Idempotency and force" << std::endl;
}

static void TestExtraBusyAvoided() {
    std::cout << "[Test] Already planned activities block autopilot slots..." << std::endl;
    Fixture f(TrustLevel::SuggestOnly);
    auto service = f.make();

    PlannedActivity planned;
    planned.id = "sched-1@2026-06-16";
    planned.title = "Walk";
    planned.startTime = At(kTarget, 9);
    planned.durationMinutes = 60;

    AutopilotRunResult result = service->runNightly(kTarget, {planned});
    for (const auto& w : result.walks) {
        assert(!(w.startTime >= At(kTarget, 9) && w.startTime < At(kTarget, 10)));
    }
    assert(result.walks.size() == 3);
    assert(result.walks[0].startTime == At(kTarget, 11, 30));
    assert(result.walks[1].startTime == At(kTarget, 14));
    assert(result.walks[2].startTime == At(kTarget, 17));
    std::cout << "[PASS] Extra busy" << std::endl;
}

static void TestApproveRejectAdjust() {
    std::cout << "[Test] Approve, reject and adjust a pending walk..." << std::endl;
    Fixture f(TrustLevel::ConfirmFirst);
    auto service = f.make();
    auto walks = service->runNightly(kTarget).walks;

    AutopilotWalk approved = service->approve(walks[0].id);
    assert(approved.approvalState == ApprovalState::Approved);
    assert(approved.calendarEventId && *approved.calendarEventId == "evt-1");
    assert(Throws([&] { service->approve(walks[0].id); }));
    assert(Throws([&] { service->approve("autopilot-unknown"); }));

    AutopilotWalk rejected = service->reject(walks[0].id);
    assert(rejected.approvalState == ApprovalState::Rejected);
    assert(!rejected.calendarEventId);
    assert(f.calendar->deletedIds.size() == 1 && f.calendar->deletedIds[0] == "evt-1");
    assert(Throws([&] { service->adjustTime(walks[0].id, At(kTarget, 9, 15)); }));
    assert(Throws([&] { service->reject("autopilot-unknown"); }));

    AutopilotWalk moved = service->adjustTime(walks[1].id, At(kTarget, 11, 35));
    assert(moved.startTime == At(kTarget, 11, 35));
    assert(moved.approvalState == ApprovalState::Approved);
    assert(f.calendar->createdEvents.back().start == At(kTarget, 11, 35));

    // Approval failure keeps the walk pending with the error recorded.
    f.calendar->failCreate = true;
    AutopilotWalk failed = service->approve(walks[2].id);
    assert(failed.approvalState == ApprovalState::Pending);
    assert(failed.lastError == "Failed to create calendar event for Energy Boost at 17:00");

    assert(service->pendingWalks().size() == 1);
    assert(moved.id == "autopilot-2026-06-16-1135");
    assert(service->findWalk(moved.id)->startTime == At(kTarget, 11, 35));
    assert(!service->findWalk(walks[1].id));
    assert(!service->findWalk("autopilot-unknown"));
    std::cout << "[PASS] Approve, reject, adjust" << std::endl;
}

static void TestPersistenceReload() {
    std::cout << "[Test] Ledger survives a restart..." << std::endl;
    Fixture f(TrustLevel::ConfirmFirst);
    {
        auto service = f.make();
        auto walks = service->runNightly(kTarget).walks;
        service->reject(walks[1].id);
    }

    auto reloaded = f.make();
    auto walks = reloaded->walksFor(kTarget);
    assert(walks.size() == 3);
    assert(walks[1].approvalState == ApprovalState::Rejected);
    assert(walks[2].type == AutopilotWalkType::Short);
    assert(*reloaded->lastScheduledDate() == kTarget);
    assert(reloaded->runNightly(kTarget).skipped);
    std::cout << "[PASS] Persistence reload" << std::endl;
}

static void TestGarbageCollection() {
    std::cout << "[Test] Old walks are dropped after the retention period..." << std::endl;
    Fixture f(TrustLevel::SuggestOnly);
    auto service = f.make();
    service->runNightly(kTarget);

    assert(service->collectGarbage(Day("2026-06-23")) == 0);
    assert(service->walksFor(kTarget).size() == 3);
    assert(service->collectGarbage(Day("2026-06-24")) == 3);
    assert(service->walksFor(kTarget).empty());
    std::cout << "[PASS] Garbage collection" << std::endl;
}

static void TestDegradedAndDisabled() {
    std::cout << "[Test] Calendar outage and disabled autopilot..." << std::endl;
    Fixture outage(TrustLevel::ConfirmFirst);
    outage.calendar->failFetch = true;
    auto service = outage.make();
    AutopilotRunResult result = service->runNightly(kTarget);
    assert(!result.skipped);
    assert(result.errors.size() == 1);
    assert(result.errors[0] == "Calendar unavailable: calendar offline");

    Fixture disabled(TrustLevel::FullAuto);
    disabled.settings.enabled = false;
    auto off = disabled.make();
    AutopilotRunResult none = off->runNightly(kTarget);
    assert(none.skipped);
    assert(none.walks.empty());
    assert(disabled.calendar->fetchCount == 0);
    assert(!off->lastScheduledDate());
    std::cout << "[PASS] Degraded and disabled" << std::endl;
}

static void TestPostMeetingAndSittingBreak() {
    std::cout << "[Test] Post-meeting walks and sitting breaks..." << std::endl;
    Fixture f(TrustLevel::ConfirmFirst);
    auto service = f.make();
    const auto events = BusyTuesday();

    auto afterLunch = service->suggestPostMeetingWalk(At(kTarget, 14), events);
    assert(afterLunch);
    assert(afterLunch->startTime == At(kTarget, 14));
    assert(afterLunch->durationMinutes == 15);
    assert(afterLunch->type == AutopilotWalkType::Short);

    auto squeezed = service->suggestPostMeetingWalk(At(kTarget, 17, 15), events);
    assert(!squeezed);

    auto openEnded = service->suggestPostMeetingWalk(At(kTarget, 21), events);
    assert(openEnded);
    assert(openEnded->durationMinutes == 10);
    assert(openEnded->type == AutopilotWalkType::Micro);

    auto mealtime = service->suggestPostMeetingWalk(At(kTarget, 12, 20), events);
    assert(!mealtime);

    AutopilotWalk pause = service->suggestSittingBreak(At(kTarget, 16, 5));
    assert(pause.durationMinutes == 5);
    assert(pause.type == AutopilotWalkType::Micro);
    assert(pause.date == kTarget);
    std::cout << "[PASS] Post-meeting and sitting break" << std::endl;
}

static void TestSuggestionsStayInApp() {
    std::cout << "[Test] Suggested walks cannot be approved, moved or rejected..." << std::endl;
    Fixture f(TrustLevel::SuggestOnly);
    auto service = f.make();
    auto walks = service->runNightly(kTarget).walks;
    assert(walks.size() == 3);
    for (const auto& w : walks) assert(w.suggestionOnly);

    assert(service->pendingWalks().empty());
    assert(Throws([&] { service->approve(walks[0].id); }));
    assert(Throws([&] { service->adjustTime(walks[0].id, At(kTarget, 9, 15)); }));
    assert(Throws([&] { service->reject(walks[0].id); }));
    assert(service->retryFailedCommits().empty());

    assert(f.calendar->createdEvents.empty());
    assert(f.calendar->deletedIds.empty());
    auto stored = service->findWalk(walks[0].id);
    assert(stored->approvalState == ApprovalState::Pending);
    assert(stored->startTime == At(kTarget, 9));

    auto reloaded = f.make();
    assert(reloaded->findWalk(walks[0].id)->suggestionOnly);
    assert(reloaded->pendingWalks().empty());
    std::cout << "[PASS] Suggestions stay in app" << std::endl;
}

static void TestAdjustKeepsOneWalkPerSlot() {
    std::cout << "[Test] Adjusting never stacks two walks on one start..." << std::endl;
    Fixture f(TrustLevel::ConfirmFirst);
    auto service = f.make();
    auto walks = service->runNightly(kTarget).walks;

    assert(Throws([&] { service->adjustTime(walks[1].id, walks[0].startTime); }));
    assert(Throws([&] { service->adjustTime(walks[1].id, At(kTarget.addDays(1), 11, 30)); }));
    assert(f.calendar->createdEvents.empty());
    assert(service->findWalk(walks[1].id)->startTime == At(kTarget, 11, 30));

    // A rejected walk frees its start.
    service->reject(walks[0].id);
    AutopilotWalk moved = service->adjustTime(walks[1].id, walks[0].startTime);
    assert(moved.id == walks[0].id);
    assert(moved.approvalState == ApprovalState::Approved);
    assert(!service->findWalk(walks[1].id));

    auto day = service->walksFor(kTarget);
    assert(day.size() == 2);
    int atNine = 0;
    for (const auto& w : day) {
        if (w.startTime == At(kTarget, 9) && w.approvalState != ApprovalState::Rejected) ++atNine;
    }
    assert(atNine == 1);
    std::cout << "[PASS] One walk per slot" << std::endl;
}

static void TestUndeletedEventsAreRetried() {
    std::cout << "[Test] Events that could not be deleted stay on record..." << std::endl;
    Fixture f(TrustLevel::FullAuto);
    auto service = f.make();
    service->runNightly(kTarget);

    f.calendar->failDelete = true;
    AutopilotRunResult forced = service->runNightly(kTarget, {}, true);
    assert(forced.errors.size() == 3);
    assert(service->undeletedEventIds() == (std::vector<std::string>{"evt-1", "evt-2", "evt-3"}));
    assert(*service->walksFor(kTarget)[0].calendarEventId == "evt-4");

    AutopilotWalk dropped = service->reject(service->walksFor(kTarget)[0].id);
    assert(!dropped.calendarEventId);
    assert(service->undeletedEventIds().size() == 4);
    assert(service->retryFailedCommits().size() == 4);

    auto reloaded = f.make();
    assert(reloaded->undeletedEventIds().size() == 4);

    f.calendar->failDelete = false;
    const size_t attempts = f.calendar->deletedIds.size();
    assert(reloaded->retryFailedCommits().empty());
    assert(reloaded->undeletedEventIds().empty());
    assert(f.calendar->deletedIds.size() == attempts + 4);
    assert(f.calendar->deletedIds[attempts] == "evt-1");
    assert(f.calendar->deletedIds.back() == "evt-4");
    std::cout << "[PASS] Undeleted events retried" << std::endl;
}

int main() {
    TestConfirmFirstQueuesPrompts();
    TestFullAutoCommits();
    TestSuggestOnlyLeavesCalendarAlone();
    TestSuggestionsStayInApp();
    TestAdjustKeepsOneWalkPerSlot();
    TestUndeletedEventsAreRetried();
    TestCommitFailureAndRetry();
    TestIdempotentRunAndForce();
    TestExtraBusyAvoided();
    TestApproveRejectAdjust();
    TestPersistenceReload();
    TestGarbageCollection();
    TestDegradedAndDisabled();
    TestPostMeetingAndSittingBreak();
    std::cout << "[Test] All autopilot tests passed." << std::endl;
    return 0;
}
