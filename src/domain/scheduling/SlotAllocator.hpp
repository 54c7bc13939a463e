/**
 * @file SlotAllocator.hpp
 * @brief Greedy, explainable placement of walks into scored free slots.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/ActivityPatterns.hpp"
#include "domain/CalendarMeeting.hpp"
#include "domain/PlannedActivity.hpp"
#include "domain/Schedule.hpp"
#include "domain/UserPreferences.hpp"

namespace moveslot::domain::scheduling {

struct AllocatorConfig {
    int bufferMinutes = 5;          ///< Trimmed from every slot and added to the needed time.
    int maxActivityMinutes = 45;
    int minActivityMinutes = 5;
    double peakHourWeight = 0.3;
    double preferredWeight = 0.25;
    double twentyMinuteWeight = 0.2;
    double thirtyMinuteWeight = 0.15;
    double adherenceWeight = 0.3;
    double maxConfidence = 0.95;
};

struct ScoredSlot {
    FreeSlot slot;
    double score = 0.0;
};

/**
 * @struct AllocationSummary
 * @brief Coverage, confidence and the user-facing explanation of a plan.
 */
struct AllocationSummary {
    int plannedSteps = 0;
    int remainingGap = 0;
    double coverage = 0.0;
    double confidence = 0.0;
    std::string reasoning;
};

class SlotAllocator {
public:
    explicit SlotAllocator(AllocatorConfig config = {}) : m_config(config) {}

    /**
     * @brief Allocates walks to close the step gap.
     *
     * Recommended walking meetings are credited first, meal slots are skipped,
     * the remaining slots are ranked by score (ties by earliest start) and consumed
     * greedily. The result is ordered by start time and depends only on the inputs.
     */
    std::vector<PlannedActivity> allocate(int stepsNeeded,
                                          const std::vector<FreeSlot>& freeSlots,
                                          const std::vector<WalkabilityAssessment>& walkableMeetings,
                                          const UserActivityPatterns& patterns,
                                          const PlanAdherence& adherence,
                                          const UserPreferences& prefs) const;

    double scoreSlot(const FreeSlot& slot,
                     const UserActivityPatterns& patterns,
                     const PlanAdherence& adherence) const;

    /** @brief Non-meal slots ranked best first. */
    std::vector<ScoredSlot> rankSlots(const std::vector<FreeSlot>& freeSlots,
                                      const UserActivityPatterns& patterns,
                                      const PlanAdherence& adherence) const;

    AllocationSummary summarize(int stepsNeeded,
                                const std::vector<PlannedActivity>& activities,
                                const std::vector<WalkabilityAssessment>& walkableMeetings,
                                const UserActivityPatterns& patterns) const;

    static ActivityType ActivityTypeForSlot(SlotClass cls, int hour);
    static ActivityPriority PriorityForShare(int estimatedSteps, int remainingSteps);

private:
    std::string buildReason(const FreeSlot& slot, bool isPeak, PreferredTime band) const;

    AllocatorConfig m_config;
};

} // namespace moveslot::domain::scheduling
