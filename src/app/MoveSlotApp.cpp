/**
 * @file MoveSlotApp.cpp
 * @brief Implementation of the MoveSlotApp class.
 */
#include "app/MoveSlotApp.hpp"

#include <chrono>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "infrastructure/HttpCalendarProvider.hpp"
#include "infrastructure/JsonActivityDataProvider.hpp"
#include "infrastructure/JsonCalendarProvider.hpp"
#include "infrastructure/OutboxNotificationDispatcher.hpp"
#include "infrastructure/PathUtils.hpp"

namespace moveslot::app {

using namespace moveslot::domain;
namespace fs = std::filesystem;

namespace {

CivilDate Today() {
    return DateOf(std::chrono::system_clock::now());
}

CivilDate DateArg(const std::vector<std::string>& args, size_t index, const CivilDate& fallback) {
    if (index >= args.size()) return fallback;
    auto parsed = CivilDate::Parse(args[index]);
    if (!parsed) {
        throw std::invalid_argument("Bad date '" + args[index] + "', expected yyyy-MM-dd");
    }
    return *parsed;
}

const std::string& RequireArg(const std::vector<std::string>& args, size_t index, const char* what) {
    if (index >= args.size()) {
        throw std::invalid_argument(std::string("Missing ") + what);
    }
    return args[index];
}

bool HasFlag(const std::vector<std::string>& args, const std::string& flag) {
    for (const auto& a : args) {
        if (a == flag) return true;
    }
    return false;
}

void PrintActivity(const PlannedActivity& a) {
    std::cout << "  " << FormatClock(a.startTime) << "-" << FormatClock(a.endTime())
              << "  " << std::left << std::setw(18) << a.title
              << " " << std::setw(6) << a.estimatedSteps << " steps  "
              << PriorityToString(a.priority) << "  [" << a.id << "]";
    if (a.status != ActivityStatus::Planned) std::cout << " (" << StatusToString(a.status) << ")";
    std::cout << std::endl;
    if (!a.reason.empty()) std::cout << "      " << a.reason << std::endl;
}

void PrintWalk(const AutopilotWalk& w) {
    std::cout << "  " << w.date.toString() << " " << FormatClock(w.startTime) << "  "
              << w.title() << " (" << w.durationMinutes << " min)  "
              << (w.suggestionOnly ? std::string("suggestion") : ApprovalStateToString(w.approvalState))
              << "  [" << w.id << "]";
    if (w.calendarEventId) std::cout << " event=" << *w.calendarEventId;
    std::cout << std::endl;
    if (!w.lastError.empty()) std::cout << "      error: " << w.lastError << std::endl;
}

void PrintPlan(const DailyMovementPlan& plan) {
    std::cout << "Plan for " << plan.date.toString() << " (" << plan.id << ")" << std::endl;
    std::cout << "  Goal " << plan.targetSteps << ", walked " << plan.currentSteps
              << ", needed " << plan.stepsNeeded << ", planned " << plan.plannedSteps
              << ", gap " << plan.remainingGap << (plan.isOnTrack() ? " (on track)" : "") << std::endl;
    for (const auto& m : plan.walkableMeetings) {
        std::cout << "  " << FormatClock(m.start) << "  walk during '" << m.title << "' ~"
                  << m.estimatedSteps << " steps" << std::endl;
    }
    for (const auto& a : plan.activities) PrintActivity(a);
    std::cout << "  Confidence " << std::fixed << std::setprecision(2) << plan.confidence
              << ". " << plan.reasoning << std::endl;
}

/** @brief "walk", "micro_walk", ..., or a gym split ("push", "pull", "legs"). */
void ApplyActivityKind(const std::string& kind, ScheduledActivity& activity) {
    if (auto workout = WorkoutTypeFromString(kind)) {
        activity.type = ActivityType::Workout;
        activity.workoutType = workout;
        return;
    }
    if (kind == "walk") {
        activity.type = ActivityType::ScheduledWalk;
        return;
    }
    auto type = ActivityTypeFromString(kind);
    if (!type) throw std::invalid_argument("Unknown activity kind: " + kind);
    activity.type = *type;
}

} // namespace

bool MoveSlotApp::Init(const infrastructure::AppPaths& paths) {
    m_config = infrastructure::ConfigLoader::Load(paths.configDir);

    // Dependency Injection / Composition Root
    auto& services = m_services;
    services.persistenceService = std::make_shared<infrastructure::PersistenceService>();
    services.taskManager = std::make_shared<application::AsyncTaskManager>();

    const std::string statePath = paths.dataFile(m_config.stateFile).string();
    services.store = std::make_shared<infrastructure::JsonFileStore>(statePath, services.persistenceService);

    if (m_config.calendar.kind == infrastructure::CalendarSourceKind::Http) {
        services.calendar = std::make_shared<infrastructure::HttpCalendarProvider>(m_config.calendar.host,
                                                                                  m_config.calendar.port);
    } else {
        services.calendar = std::make_shared<infrastructure::JsonCalendarProvider>(
            paths.dataFile(m_config.calendar.path).string(),
            services.persistenceService);
    }
    services.activityData = std::make_shared<infrastructure::JsonActivityDataProvider>(
        paths.dataFile(m_config.activityDataPath).string());
    auto notifications = std::make_shared<infrastructure::OutboxNotificationDispatcher>(
        paths.dataFile(m_config.outboxFile).string(),
        services.persistenceService);

    services.learningService = std::make_shared<application::PatternLearningService>(services.activityData, services.store);
    services.planService = std::make_unique<application::MovementPlanService>(
        services.calendar, services.activityData, services.learningService, services.store, m_config.preferences);
    services.autopilotService = std::make_unique<application::AutopilotService>(
        services.calendar, services.store, notifications, m_config.autopilot, m_config.preferences);
    services.streakService = std::make_unique<application::StreakService>(services.store);
    services.scheduleService = std::make_unique<application::ScheduleService>(services.store);
    services.syncService = std::make_unique<application::PlanSyncService>(
        services.calendar, services.store, m_config.autopilot.alarmOffsetMinutes);

    services.streakService->validate(Today());
    m_initialized = true;
    return true;
}

void MoveSlotApp::Shutdown() {
    if (!m_initialized) return;
    m_services.taskManager->WaitForAll();
    m_services.store->flush();
    m_services.persistenceService->stop();
    if (m_services.persistenceService->failedWrites() > 0) {
        std::cerr << "[MoveSlotApp] " << m_services.persistenceService->failedWrites()
                  << " writes failed." << std::endl;
    }
    m_initialized = false;
}

int MoveSlotApp::Run(int argc, char** argv) {
    std::vector<std::string> args;
    std::optional<fs::path> home;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--home" && i + 1 < argc) {
            home = fs::path(argv[++i]);
            continue;
        }
        args.push_back(a);
    }

    if (args.empty() || args[0] == "help" || args[0] == "--help") {
        PrintUsage();
        return args.empty() ? 1 : 0;
    }

    int code = 1;
    try {
        const infrastructure::AppPaths paths = infrastructure::PathUtils::Discover(home);
        if (!Init(paths)) {
            std::fprintf(stderr, "Failed to initialize MoveSlot in %s\n", paths.dataDir.string().c_str());
            return 1;
        }
        code = Dispatch(args);
    } catch (const std::exception& e) {
        std::cerr << "[MoveSlotApp] " << e.what() << std::endl;
        code = 2;
    }

    Shutdown();
    return code;
}

int MoveSlotApp::Dispatch(const std::vector<std::string>& args) {
    const std::string& cmd = args[0];
    std::vector<std::string> rest(args.begin() + 1, args.end());

    if (cmd == "plan") return CmdPlan(rest);
    if (cmd == "workout") return CmdWorkout(rest);
    if (cmd == "mark") return CmdMark(rest);
    if (cmd == "autopilot") return CmdAutopilot(rest);
    if (cmd == "pending") return CmdPending();
    if (cmd == "approve") return CmdApprove(rest);
    if (cmd == "reject") return CmdReject(rest);
    if (cmd == "adjust") return CmdAdjust(rest);
    if (cmd == "after-meeting") return CmdAfterMeeting(rest);
    if (cmd == "learn") return CmdLearn();
    if (cmd == "streak") return CmdStreak();
    if (cmd == "conflicts") return CmdConflicts(rest);
    if (cmd == "schedule") return CmdSchedule(rest);
    if (cmd == "refresh") return CmdRefresh();

    std::cerr << "Unknown command: " << cmd << std::endl;
    PrintUsage();
    return 1;
}

int MoveSlotApp::CmdPlan(const std::vector<std::string>& args) {
    const auto now = std::chrono::system_clock::now();
    const CivilDate date = DateArg(args, 0, DateOf(now));
    auto scheduled = m_services.scheduleService->occurrencesOn(date);

    auto result = m_services.planService->generatePlan(date, now, scheduled);
    PrintPlan(result.plan);
    if (!result.committed) {
        std::cout << "  (superseded by a newer plan, not saved)" << std::endl;
    }

    if (HasFlag(args, "--sync") && result.committed) {
        auto sync = m_services.syncService->syncPlan(result.plan);
        for (const auto& e : sync.errors) {
            std::cerr << "  sync " << SyncErrorKindToString(e.kind) << ": " << e.message << std::endl;
        }
        return sync.errors.empty() ? 0 : 3;
    }
    return 0;
}

int MoveSlotApp::CmdWorkout(const std::vector<std::string>& args) {
    const auto now = std::chrono::system_clock::now();
    const CivilDate date = DateArg(args, 0, DateOf(now));
    auto allocation = m_services.planService->planWalkAndWorkout(
        date, now, m_services.scheduleService->occurrencesOn(date));

    std::cout << "Walk + workout for " << date.toString() << " (" << allocation.oneHourSlotCount
              << " one-hour windows)" << std::endl;
    if (allocation.workout) PrintActivity(*allocation.workout);
    else std::cout << "  No gym session needed or possible." << std::endl;
    if (allocation.walkingMeeting) {
        std::cout << "  Walk during '" << allocation.walkingMeeting->title << "' at "
                  << FormatClock(allocation.walkingMeeting->start) << std::endl;
    } else if (allocation.walk) {
        PrintActivity(*allocation.walk);
    }
    if (!allocation.extraWalkOptions.empty()) {
        std::cout << "  Other walk options:" << std::endl;
        for (const auto& w : allocation.extraWalkOptions) PrintActivity(w);
    }
    return 0;
}

int MoveSlotApp::CmdMark(const std::vector<std::string>& args) {
    const CivilDate date = DateArg(args, 0, Today());
    const std::string& id = RequireArg(args, 1, "activity id");
    auto status = StatusFromString(RequireArg(args, 2, "status"));
    if (!status) throw std::invalid_argument("Unknown status: " + args[2]);

    auto updated = m_services.planService->markActivity(date, id, *status, std::chrono::system_clock::now());
    PrintActivity(updated);
    return 0;
}

int MoveSlotApp::CmdAutopilot(const std::vector<std::string>& args) {
    const CivilDate today = Today();
    std::vector<std::string> positional;
    for (const auto& a : args) {
        if (a != "--force") positional.push_back(a);
    }
    const CivilDate target = DateArg(positional, 0, today.addDays(1));

    m_services.autopilotService->collectGarbage(today);
    auto result = m_services.autopilotService->runNightly(
        target, m_services.scheduleService->occurrencesOn(target), HasFlag(args, "--force"));

    if (result.skipped) std::cout << "Autopilot skipped for " << target.toString() << std::endl;
    for (const auto& w : result.walks) PrintWalk(w);
    for (const auto& e : result.errors) std::cerr << "  error: " << e << std::endl;
    return result.errors.empty() ? 0 : 3;
}

int MoveSlotApp::CmdPending() {
    auto pending = m_services.autopilotService->pendingWalks();
    if (pending.empty()) std::cout << "No walks waiting for approval." << std::endl;
    for (const auto& w : pending) PrintWalk(w);
    return 0;
}

int MoveSlotApp::CmdApprove(const std::vector<std::string>& args) {
    auto walk = m_services.autopilotService->approve(RequireArg(args, 0, "walk id"));
    PrintWalk(walk);
    return walk.lastError.empty() ? 0 : 3;
}

int MoveSlotApp::CmdReject(const std::vector<std::string>& args) {
    PrintWalk(m_services.autopilotService->reject(RequireArg(args, 0, "walk id")));
    return 0;
}

int MoveSlotApp::CmdAdjust(const std::vector<std::string>& args) {
    const std::string& id = RequireArg(args, 0, "walk id");
    auto minutes = ParseClockMinutes(RequireArg(args, 1, "new time (HH:MM)"));
    if (!minutes) throw std::invalid_argument("Bad time: " + args[1]);

    auto existing = m_services.autopilotService->findWalk(id);
    if (!existing) throw std::invalid_argument("Unknown walk: " + id);

    auto walk = m_services.autopilotService->adjustTime(id, MakeInstantAtMinutes(existing->date, *minutes));
    PrintWalk(walk);
    return walk.lastError.empty() ? 0 : 3;
}

int MoveSlotApp::CmdAfterMeeting(const std::vector<std::string>& args) {
    auto end = ParseLocalDateTime(RequireArg(args, 0, "meeting end (yyyy-MM-ddTHH:MM)"));
    if (!end) throw std::invalid_argument("Bad date-time: " + args[0]);

    std::vector<CalendarMeeting> events;
    try {
        events = m_services.calendar->fetchEvents(DateOf(*end));
    } catch (const std::exception& e) {
        std::cerr << "[MoveSlotApp] Calendar unavailable: " << e.what() << std::endl;
    }

    auto walk = m_services.autopilotService->suggestPostMeetingWalk(*end, events);
    if (!walk) {
        std::cout << "No room for a walk after this meeting." << std::endl;
        return 0;
    }
    PrintWalk(*walk);
    return 0;
}

int MoveSlotApp::CmdLearn() {
    const auto now = std::chrono::system_clock::now();
    int days = m_services.learningService->refreshFromHistory(DateOf(now), m_config.preferences.dailyStepGoal, now);
    auto patterns = m_services.learningService->patterns();
    std::cout << "Learned from " << days << " days. Weekday avg " << patterns.weekdayAverage
              << ", weekend avg " << patterns.weekendAverage << ", goal rate "
              << std::fixed << std::setprecision(2) << patterns.goalAchievementRate << std::endl;
    return 0;
}

int MoveSlotApp::CmdStreak() {
    const CivilDate today = Today();
    m_services.streakService->rebuildFromHistory(today, m_config.preferences.dailyStepGoal, *m_services.activityData);
    auto s = m_services.streakService->snapshot();
    std::cout << "Current streak " << s.currentStreak << ", longest " << s.longestStreak;
    if (s.lastGoalDate) std::cout << ", last goal day " << s.lastGoalDate->toString();
    std::cout << std::endl;
    return 0;
}

int MoveSlotApp::CmdConflicts(const std::vector<std::string>& args) {
    const CivilDate date = DateArg(args, 0, Today());
    std::vector<CalendarMeeting> meetings;
    try {
        meetings = m_services.calendar->fetchEvents(date);
    } catch (const std::exception& e) {
        std::cerr << "[MoveSlotApp] Calendar unavailable: " << e.what() << std::endl;
        return 3;
    }

    auto conflicts = m_services.scheduleService->checkConflicts(date, meetings);
    if (conflicts.empty()) std::cout << "No conflicts on " << date.toString() << std::endl;
    for (const auto& c : conflicts) {
        std::cout << "  " << ConflictTypeToString(c.type) << ": '" << c.activityTitle << "' at "
                  << FormatClock(c.activityStart) << " vs '" << c.meetingTitle << "' at "
                  << FormatClock(c.meetingStart) << std::endl;
    }
    return 0;
}

int MoveSlotApp::CmdSchedule(const std::vector<std::string>& args) {
    const std::string& sub = RequireArg(args, 0, "schedule subcommand");
    auto& schedule = *m_services.scheduleService;

    if (sub == "list") {
        for (const auto& a : schedule.list()) {
            std::cout << "  [" << a.id << "] " << a.title << " " << FormatClockMinutes(a.startMinutes)
                      << " " << a.durationMinutes << " min " << RecurrenceToString(a.recurrence)
                      << " from " << a.startDate.toString() << (a.isActive ? "" : " (paused)") << std::endl;
        }
        return 0;
    }
    if (sub == "remove") {
        const std::string& id = RequireArg(args, 1, "schedule id");
        if (!schedule.remove(id)) throw std::invalid_argument("Unknown schedule id: " + id);
        std::cout << "Removed " << id << std::endl;
        return 0;
    }
    if (sub == "add") {
        ScheduledActivity activity;
        ApplyActivityKind(RequireArg(args, 1, "activity kind"), activity);
        auto start = ParseClockMinutes(RequireArg(args, 2, "start time (HH:MM)"));
        if (!start) throw std::invalid_argument("Bad time: " + args[2]);
        activity.startMinutes = *start;
        activity.durationMinutes = std::stoi(RequireArg(args, 3, "duration in minutes"));
        if (args.size() > 4) {
            auto recurrence = RecurrenceFromString(args[4]);
            if (!recurrence) throw std::invalid_argument("Unknown recurrence: " + args[4]);
            activity.recurrence = *recurrence;
        }
        activity.startDate = DateArg(args, 5, Today());
        for (size_t i = 6; i < args.size(); ++i) {
            if (!activity.title.empty()) activity.title += " ";
            activity.title += args[i];
        }
        auto stored = schedule.add(activity);
        std::cout << "Added [" << stored.id << "] " << stored.title << std::endl;
        return 0;
    }
    throw std::invalid_argument("Unknown schedule subcommand: " + sub);
}

int MoveSlotApp::CmdRefresh() {
    using application::TaskStatus;
    using application::TaskType;

    const auto now = std::chrono::system_clock::now();
    const CivilDate today = DateOf(now);
    const int goal = m_config.preferences.dailyStepGoal;
    auto& services = m_services;
    auto& tasks = *services.taskManager;

    const int firstTask = tasks.LastTaskId();

    // Learning first so today's plan scores slots with fresh patterns.
    tasks.SubmitTask(TaskType::PatternLearning, "Learn from history",
        [&services, today, goal, now](std::shared_ptr<TaskStatus> status) {
            services.learningService->refreshFromHistory(today, goal, now);
            status->progress = 1.0f;
        });
    tasks.WaitForAll();

    tasks.SubmitTask(TaskType::StreakUpdate, "Update streak",
        [&services, today, goal](std::shared_ptr<TaskStatus>) {
            services.streakService->rebuildFromHistory(today, goal, *services.activityData);
        });
    tasks.SubmitTask(TaskType::PlanGeneration, "Plan today",
        [&services, today, now](std::shared_ptr<TaskStatus>) {
            services.planService->generatePlan(today, now, services.scheduleService->occurrencesOn(today));
        });
    tasks.SubmitTask(TaskType::AutopilotRun, "Schedule tomorrow",
        [&services, today](std::shared_ptr<TaskStatus>) {
            const CivilDate tomorrow = today.addDays(1);
            services.autopilotService->collectGarbage(today);
            services.autopilotService->runNightly(tomorrow, services.scheduleService->occurrencesOn(tomorrow));
            services.autopilotService->retryFailedCommits();
        });
    tasks.SubmitTask(TaskType::CalendarSync, "Clean sync records",
        [&services, today](std::shared_ptr<TaskStatus>) {
            services.syncService->cleanupOldRecords(today);
        });
    tasks.WaitForAll();

    const auto failures = tasks.FailuresSince(firstTask);
    for (const auto& f : failures) {
        std::cerr << "[MoveSlotApp] " << application::TaskTypeToString(f.type) << " failed: "
                  << f.errorMessage << std::endl;
    }
    if (auto plan = services.planService->currentPlan(today)) PrintPlan(*plan);
    std::cout << "Streak " << services.streakService->snapshot().currentStreak << std::endl;
    return failures.empty() ? 0 : 3;
}

void MoveSlotApp::PrintUsage() const {
    std::cout <<
        "usage: moveslot [--home DIR] <command> [args]\n"
        "  plan [DATE] [--sync]           build the day's walking plan\n"
        "  workout [DATE]                 walk plus gym session for the day\n"
        "  mark DATE ID STATUS            completed | skipped | in_progress | rescheduled\n"
        "  autopilot [DATE] [--force]     schedule walks (default: tomorrow)\n"
        "  pending                        walks waiting for approval\n"
        "  approve ID | reject ID         answer an approval prompt\n"
        "  adjust ID HH:MM                move a walk and approve it\n"
        "  after-meeting yyyy-MM-ddTHH:MM walk suggestion for a meeting end\n"
        "  learn                          relearn patterns from 30 days of history\n"
        "  streak                         recompute and show the goal streak\n"
        "  conflicts [DATE]               manual schedule vs calendar\n"
        "  schedule add KIND HH:MM MIN [RECURRENCE] [START] [TITLE...]\n"
        "  schedule list | schedule remove ID\n"
        "  refresh                        learn, plan today, streak and autopilot at once\n"
        "DIR defaults to $MOVESLOT_HOME, then the XDG config and data directories.\n";
}

} // namespace moveslot::app
