#include "application/MovementPlanService.hpp"
#include "domain/scheduling/BusyIntervalBuilder.hpp"
#include "domain/scheduling/FreeSlotFinder.hpp"
#include "infrastructure/StateCodec.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace moveslot::application {

using namespace moveslot::domain;
using infrastructure::StateCodec;

MovementPlanService::MovementPlanService(std::shared_ptr<CalendarProvider> calendar,
                                         std::shared_ptr<ActivityDataProvider> activityData,
                                         std::shared_ptr<PatternLearningService> learning,
                                         std::shared_ptr<KeyValueStore> store,
                                         UserPreferences prefs)
    : m_calendar(std::move(calendar)),
      m_activityData(std::move(activityData)),
      m_learning(std::move(learning)),
      m_store(std::move(store)),
      m_prefs(std::move(prefs)) {
    if (auto raw = m_store->get(StateCodec::kRotationKey)) {
        if (auto state = StateCodec::DecodeRotation(*raw)) {
            m_rotation = WorkoutRotation(*state);
        } else {
            std::cerr << "[MovementPlan] Stored workout rotation unreadable, starting fresh." << std::endl;
        }
    }
}

MovementPlanService::Snapshot MovementPlanService::beginGeneration() {
    std::lock_guard<std::mutex> lock(m_prefsMutex);
    return Snapshot{++m_epochCounter, m_prefs};
}

std::shared_ptr<std::mutex> MovementPlanService::dateMutex(const CivilDate& date) {
    std::lock_guard<std::mutex> lock(m_dateMutexesGuard);
    auto& slot = m_dateMutexes[date];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

std::vector<CalendarMeeting> MovementPlanService::fetchMeetings(const CivilDate& date) {
    try {
        return m_calendar->fetchEvents(date);
    } catch (const std::exception& e) {
        std::cerr << "[MovementPlan] Calendar unavailable for " << date.toString() << ": " << e.what() << std::endl;
        return {};
    }
}

int MovementPlanService::fetchCurrentSteps(const CivilDate& date, const Instant& now) {
    // Future days have no steps yet.
    if (DateOf(now) < date) return 0;
    try {
        return std::max(0, m_activityData->fetchSteps(date));
    } catch (const std::exception& e) {
        std::cerr << "[MovementPlan] Step count unavailable for " << date.toString() << ": " << e.what() << std::endl;
        return 0;
    }
}

PlanGenerationResult MovementPlanService::generatePlan(const CivilDate& date,
                                                       const Instant& now,
                                                       const std::vector<PlannedActivity>& extraBusy) {
    auto guard = dateMutex(date);
    std::lock_guard<std::mutex> single(*guard);

    const Snapshot snap = beginGeneration();
    const UserPreferences& prefs = snap.prefs;
    const bool isToday = DateOf(now) == date;

    std::vector<CalendarMeeting> meetings = fetchMeetings(date);
    const int currentSteps = fetchCurrentSteps(date, now);
    const int stepsNeeded = std::max(0, prefs.dailyStepGoal - currentSteps);

    auto busy = scheduling::BuildBusyIntervals(date, meetings, extraBusy);
    std::optional<Instant> clampTo;
    if (isToday) clampTo = now;
    TimeInterval window = scheduling::ActiveWindowFor(date, prefs, clampTo);

    scheduling::FreeSlotFinder finder(prefs);
    std::vector<FreeSlot> slots = finder.findFreeSlots(date, busy, window);

    std::vector<WalkabilityAssessment> walkable = m_classifier.recommended(meetings);
    if (isToday) {
        // A walking meeting that already started cannot be walked any more.
        walkable.erase(std::remove_if(walkable.begin(), walkable.end(),
                                      [&now](const WalkabilityAssessment& w) { return w.start < now; }),
                       walkable.end());
    }

    const UserActivityPatterns patterns = m_learning->patterns();
    const PlanAdherence adherence = m_learning->adherence();

    DailyMovementPlan plan;
    plan.date = date;
    plan.epoch = snap.epoch;
    plan.id = "plan-" + date.toString() + "-" + std::to_string(snap.epoch);
    plan.targetSteps = prefs.dailyStepGoal;
    plan.currentSteps = currentSteps;
    plan.stepsNeeded = stepsNeeded;
    plan.activities = m_allocator.allocate(stepsNeeded, slots, walkable, patterns, adherence, prefs);
    plan.walkableMeetings = walkable;
    plan.generatedAt = now;

    scheduling::AllocationSummary summary = m_allocator.summarize(stepsNeeded, plan.activities, walkable, patterns);
    plan.plannedSteps = summary.plannedSteps;
    plan.remainingGap = summary.remainingGap;
    plan.confidence = summary.confidence;
    plan.reasoning = summary.reasoning;

    PlanGenerationResult result{plan, false};
    {
        std::lock_guard<std::mutex> lock(m_plansMutex);
        auto committed = m_committedEpochs.find(date);
        bool stale = snap.epoch < m_minValidEpoch.load() ||
                     (committed != m_committedEpochs.end() && snap.epoch < committed->second);
        if (stale) {
            std::cout << "[MovementPlan] Discarding stale plan for " << date.toString()
                      << " (epoch " << snap.epoch << ")" << std::endl;
            return result;
        }
        m_plans[date] = plan;
        m_committedEpochs[date] = snap.epoch;
        m_store->put(StateCodec::PlanKey(date), StateCodec::Encode(plan));
        result.committed = true;
    }

    m_learning->recordPlanGenerated();
    std::cout << "[MovementPlan] " << date.toString() << ": " << plan.activities.size()
              << " activities, " << plan.plannedSteps << " planned steps, confidence "
              << plan.confidence << std::endl;
    return result;
}

std::optional<DailyMovementPlan> MovementPlanService::loadPlanLocked(const CivilDate& date) const {
    auto it = m_plans.find(date);
    if (it != m_plans.end()) return it->second;

    auto raw = m_store->get(StateCodec::PlanKey(date));
    if (!raw) return std::nullopt;
    auto decoded = StateCodec::DecodePlan(*raw);
    if (decoded) m_plans[date] = *decoded;
    return decoded;
}

std::optional<DailyMovementPlan> MovementPlanService::currentPlan(const CivilDate& date) const {
    std::lock_guard<std::mutex> lock(m_plansMutex);
    return loadPlanLocked(date);
}

PlannedActivity MovementPlanService::markActivity(const CivilDate& date,
                                                  const std::string& activityId,
                                                  ActivityStatus status,
                                                  const Instant& now) {
    PlannedActivity updated;
    {
        std::lock_guard<std::mutex> lock(m_plansMutex);
        auto plan = loadPlanLocked(date);
        if (!plan) {
            throw std::invalid_argument("No plan for " + date.toString());
        }
        auto it = std::find_if(plan->activities.begin(), plan->activities.end(),
                               [&activityId](const PlannedActivity& a) { return a.id == activityId; });
        if (it == plan->activities.end()) {
            throw std::invalid_argument("Unknown activity: " + activityId);
        }
        it->status = status;
        updated = *it;
        m_plans[date] = *plan;
        m_store->put(StateCodec::PlanKey(date), StateCodec::Encode(*plan));
    }

    if (status == ActivityStatus::Completed || status == ActivityStatus::Skipped) {
        m_learning->recordOutcome(updated, status == ActivityStatus::Completed, now);
    }
    if (status == ActivityStatus::Completed && updated.type == ActivityType::Workout && updated.workoutType) {
        recordWorkoutDone(date, *updated.workoutType);
    }
    return updated;
}

scheduling::WalkWorkoutAllocation MovementPlanService::planWalkAndWorkout(
    const CivilDate& date,
    const Instant& now,
    const std::vector<PlannedActivity>& extraBusy) {
    const UserPreferences prefs = preferences();
    std::vector<CalendarMeeting> meetings = fetchMeetings(date);

    auto busy = scheduling::BuildBusyIntervals(date, meetings, extraBusy);
    std::optional<Instant> clampTo;
    if (DateOf(now) == date) clampTo = now;
    TimeInterval window = scheduling::ActiveWindowFor(date, prefs, clampTo);
    std::vector<FreeSlot> slots = scheduling::FreeSlotFinder(prefs).findFreeSlots(date, busy, window);

    bool needsWorkout;
    WorkoutType next;
    {
        std::lock_guard<std::mutex> lock(m_rotationMutex);
        needsWorkout = m_rotation.needsWorkout(date, prefs.gymDaysPerWeek);
        next = m_rotation.nextWorkout();
    }

    return m_capacityAllocator.allocate(date, slots, m_classifier.assessAll(meetings),
                                        scheduling::ToIntervals(busy), prefs, needsWorkout, next);
}

void MovementPlanService::recordWorkoutDone(const CivilDate& date, WorkoutType type) {
    std::lock_guard<std::mutex> lock(m_rotationMutex);
    m_rotation.recordWorkout(date, type);
    m_store->put(StateCodec::kRotationKey, StateCodec::Encode(m_rotation.state()));
    std::cout << "[MovementPlan] Recorded " << WorkoutDisplayName(type) << ", next is "
              << WorkoutDisplayName(m_rotation.nextWorkout()) << std::endl;
}

WorkoutRotationState MovementPlanService::rotation() const {
    std::lock_guard<std::mutex> lock(m_rotationMutex);
    return m_rotation.state();
}

void MovementPlanService::updatePreferences(const UserPreferences& prefs) {
    std::lock_guard<std::mutex> lock(m_prefsMutex);
    m_prefs = prefs;
    m_minValidEpoch.store(m_epochCounter + 1);
}

UserPreferences MovementPlanService::preferences() const {
    std::lock_guard<std::mutex> lock(m_prefsMutex);
    return m_prefs;
}

void MovementPlanService::invalidate() {
    std::lock_guard<std::mutex> lock(m_prefsMutex);
    m_minValidEpoch.store(m_epochCounter + 1);
}

} // namespace moveslot::application
