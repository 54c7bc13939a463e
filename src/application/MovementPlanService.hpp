/**
 * @file MovementPlanService.hpp
 * @brief Generates, stores and updates the daily movement plan.
 *
 * One generation per date runs at a time. Each generation is stamped with an epoch
 * taken together with the preference snapshot it uses; a result only replaces the
 * stored plan when no newer generation or preference change has happened since.
 */

#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "application/PatternLearningService.hpp"
#include "domain/ActivityDataProvider.hpp"
#include "domain/CalendarProvider.hpp"
#include "domain/KeyValueStore.hpp"
#include "domain/PlannedActivity.hpp"
#include "domain/UserPreferences.hpp"
#include "domain/WorkoutRotation.hpp"
#include "domain/scheduling/CapacityAllocator.hpp"
#include "domain/scheduling/SlotAllocator.hpp"
#include "domain/scheduling/WalkabilityClassifier.hpp"

namespace moveslot::application {

struct PlanGenerationResult {
    domain::DailyMovementPlan plan;
    bool committed = false; ///< False when a newer generation superseded this one.
};

class MovementPlanService {
public:
    MovementPlanService(std::shared_ptr<domain::CalendarProvider> calendar,
                        std::shared_ptr<domain::ActivityDataProvider> activityData,
                        std::shared_ptr<PatternLearningService> learning,
                        std::shared_ptr<domain::KeyValueStore> store,
                        domain::UserPreferences prefs);

    /**
     * @brief Builds the plan for `date` and stores it unless superseded.
     *
     * When `date` is the day of `now`, today's step count is fetched and the plan only
     * uses time after `now`. Provider failures are logged and treated as no data.
     * @param extraBusy Already-scheduled activities that block time (e.g. manual schedule).
     */
    PlanGenerationResult generatePlan(const domain::CivilDate& date,
                                      const domain::Instant& now,
                                      const std::vector<domain::PlannedActivity>& extraBusy = {});

    /** @brief The last committed plan for `date`, from memory or storage. */
    std::optional<domain::DailyMovementPlan> currentPlan(const domain::CivilDate& date) const;

    /**
     * @brief Updates an activity's status and feeds completions and skips to the learner.
     * @throws std::invalid_argument when there is no plan or no such activity.
     */
    domain::PlannedActivity markActivity(const domain::CivilDate& date,
                                         const std::string& activityId,
                                         domain::ActivityStatus status,
                                         const domain::Instant& now);

    /** @brief Walk plus gym session for `date`, using the workout rotation. */
    domain::scheduling::WalkWorkoutAllocation planWalkAndWorkout(
        const domain::CivilDate& date,
        const domain::Instant& now,
        const std::vector<domain::PlannedActivity>& extraBusy = {});

    /** @brief Counts a finished gym session and advances the rotation. */
    void recordWorkoutDone(const domain::CivilDate& date, domain::WorkoutType type);

    domain::WorkoutRotationState rotation() const;

    /** @brief Replaces the preferences and discards in-flight generations. */
    void updatePreferences(const domain::UserPreferences& prefs);
    domain::UserPreferences preferences() const;

    /** @brief Marks every generation started so far as stale. */
    void invalidate();

private:
    struct Snapshot {
        long long epoch;
        domain::UserPreferences prefs;
    };

    Snapshot beginGeneration();
    std::shared_ptr<std::mutex> dateMutex(const domain::CivilDate& date);
    std::vector<domain::CalendarMeeting> fetchMeetings(const domain::CivilDate& date);
    int fetchCurrentSteps(const domain::CivilDate& date, const domain::Instant& now);
    std::optional<domain::DailyMovementPlan> loadPlanLocked(const domain::CivilDate& date) const;

    std::shared_ptr<domain::CalendarProvider> m_calendar;
    std::shared_ptr<domain::ActivityDataProvider> m_activityData;
    std::shared_ptr<PatternLearningService> m_learning;
    std::shared_ptr<domain::KeyValueStore> m_store;

    domain::scheduling::WalkabilityClassifier m_classifier;
    domain::scheduling::SlotAllocator m_allocator;
    domain::scheduling::CapacityAllocator m_capacityAllocator;

    domain::UserPreferences m_prefs;
    long long m_epochCounter = 0;
    std::atomic<long long> m_minValidEpoch{0};
    mutable std::mutex m_prefsMutex;

    std::map<domain::CivilDate, std::shared_ptr<std::mutex>> m_dateMutexes;
    std::mutex m_dateMutexesGuard;

    mutable std::map<domain::CivilDate, domain::DailyMovementPlan> m_plans;
    std::map<domain::CivilDate, long long> m_committedEpochs;
    mutable std::mutex m_plansMutex;

    domain::WorkoutRotation m_rotation;
    mutable std::mutex m_rotationMutex;
};

} // namespace moveslot::application
