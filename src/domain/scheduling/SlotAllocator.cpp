#include "domain/scheduling/SlotAllocator.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace moveslot::domain::scheduling {

namespace {

std::string Join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

} // namespace

ActivityType SlotAllocator::ActivityTypeForSlot(SlotClass cls, int hour) {
    switch (cls) {
        case SlotClass::Micro:
            return ActivityType::MicroWalk;
        case SlotClass::Short:
        case SlotClass::Standard:
            if (hour >= 11 && hour <= 13) return ActivityType::LunchWalk;
            if (hour < 10) return ActivityType::MorningWalk;
            if (hour >= 17) return ActivityType::EveningWalk;
            return ActivityType::ScheduledWalk;
        case SlotClass::Extended:
            if (hour < 10) return ActivityType::MorningWalk;
            if (hour >= 17) return ActivityType::EveningWalk;
            return ActivityType::ScheduledWalk;
    }
    return ActivityType::ScheduledWalk;
}

ActivityPriority SlotAllocator::PriorityForShare(int estimatedSteps, int remainingSteps) {
    if (remainingSteps <= 0) return ActivityPriority::Optional;
    const double share = static_cast<double>(estimatedSteps) / static_cast<double>(remainingSteps);
    if (share > 0.4) return ActivityPriority::Critical;
    if (share > 0.2) return ActivityPriority::Recommended;
    return ActivityPriority::Optional;
}

double SlotAllocator::scoreSlot(const FreeSlot& slot,
                                const UserActivityPatterns& patterns,
                                const PlanAdherence& adherence) const {
    const int hour = slot.startHour();
    double s = 0.0;
    if (patterns.isPeakHour(hour)) s += m_config.peakHourWeight;
    if (slot.isPreferredTime) s += m_config.preferredWeight;
    if (slot.durationMinutes >= 20) s += m_config.twentyMinuteWeight;
    if (slot.durationMinutes >= 30) s += m_config.thirtyMinuteWeight;
    if (auto rate = adherence.rateFor(TimeOfDayForHour(hour))) {
        s += m_config.adherenceWeight * *rate;
    }
    return s;
}

std::vector<ScoredSlot> SlotAllocator::rankSlots(const std::vector<FreeSlot>& freeSlots,
                                                 const UserActivityPatterns& patterns,
                                                 const PlanAdherence& adherence) const {
    std::vector<ScoredSlot> ranked;
    for (const auto& slot : freeSlots) {
        if (slot.isDuringMeal) continue;
        ranked.push_back(ScoredSlot{slot, scoreSlot(slot, patterns, adherence)});
    }
    std::stable_sort(ranked.begin(), ranked.end(), [](const ScoredSlot& a, const ScoredSlot& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.slot.interval.start < b.slot.interval.start;
    });
    return ranked;
}

std::string SlotAllocator::buildReason(const FreeSlot& slot, bool isPeak, PreferredTime band) const {
    std::vector<std::string> parts;
    // With no preference every slot is "preferred", which says nothing to the user.
    if (slot.isPreferredTime && band != PreferredTime::NoPreference) {
        parts.push_back("Matches your preferred " + PreferredTimeToString(band) + " walking time");
    }
    if (isPeak) parts.push_back("You're typically most active around this time");

    if (slot.durationMinutes >= 30) {
        parts.push_back(std::to_string(slot.durationMinutes) + "-min slot covers significant steps");
    } else if (slot.durationMinutes >= 15) {
        parts.push_back("Quick walk to boost your step count");
    } else {
        parts.push_back("Micro-break to keep moving");
    }
    return Join(parts, ". ");
}

std::vector<PlannedActivity> SlotAllocator::allocate(int stepsNeeded,
                                                     const std::vector<FreeSlot>& freeSlots,
                                                     const std::vector<WalkabilityAssessment>& walkableMeetings,
                                                     const UserActivityPatterns& patterns,
                                                     const PlanAdherence& adherence,
                                                     const UserPreferences& prefs) const {
    std::vector<PlannedActivity> activities;

    int remaining = stepsNeeded;
    for (const auto& meeting : walkableMeetings) {
        if (meeting.isRecommended) remaining -= meeting.estimatedSteps;
    }
    if (remaining <= 0) return activities;

    const int pace = std::max(1, patterns.stepsPerMinuteWalking);

    for (const auto& ranked : rankSlots(freeSlots, patterns, adherence)) {
        if (remaining <= 0) break;
        const FreeSlot& slot = ranked.slot;

        const int minutesNeeded = remaining / pace + m_config.bufferMinutes;
        const int duration = std::min({slot.durationMinutes - m_config.bufferMinutes,
                                       minutesNeeded,
                                       m_config.maxActivityMinutes});
        if (duration < m_config.minActivityMinutes) continue;

        const int hour = slot.startHour();
        PlannedActivity a;
        a.id = "walk-" + std::to_string(ToEpochSeconds(slot.interval.start));
        a.type = ActivityTypeForSlot(slot.slotClass, hour);
        a.title = ActivityTypeDisplayName(a.type);
        a.startTime = slot.interval.start;
        a.durationMinutes = duration;
        a.estimatedSteps = duration * pace;
        a.priority = PriorityForShare(a.estimatedSteps, remaining);
        a.reason = buildReason(slot, patterns.isPeakHour(hour), prefs.preferredWalkTime);
        a.isIdeal = slot.isPreferredTime;

        remaining -= a.estimatedSteps;
        activities.push_back(std::move(a));
    }

    std::stable_sort(activities.begin(), activities.end(), [](const auto& a, const auto& b) {
        return a.startTime < b.startTime;
    });
    return activities;
}

AllocationSummary SlotAllocator::summarize(int stepsNeeded,
                                           const std::vector<PlannedActivity>& activities,
                                           const std::vector<WalkabilityAssessment>& walkableMeetings,
                                           const UserActivityPatterns& patterns) const {
    AllocationSummary s;
    bool anyMeeting = false;
    for (const auto& m : walkableMeetings) {
        if (!m.isRecommended) continue;
        anyMeeting = true;
        s.plannedSteps += m.estimatedSteps;
    }
    int walkCount = 0;
    for (const auto& a : activities) {
        s.plannedSteps += a.estimatedSteps;
        if (IsWalk(a.type)) ++walkCount;
    }

    s.remainingGap = std::max(0, stepsNeeded - s.plannedSteps);
    s.coverage = stepsNeeded <= 0
        ? 1.0
        : std::min(1.0, static_cast<double>(s.plannedSteps) / static_cast<double>(stepsNeeded));
    s.confidence = std::min(m_config.maxConfidence, 0.6 * s.coverage + 0.4 * patterns.goalAchievementRate);

    if (stepsNeeded <= 0) {
        s.reasoning = "You've already hit your step goal! Great job!";
        return s;
    }

    std::ostringstream out;
    if (s.coverage >= 0.9) {
        out << "This plan covers your step goal. " << walkCount << " walks scheduled across the day.";
    } else if (s.coverage >= 0.7) {
        out << "Plan covers " << static_cast<int>(std::lround(s.coverage * 100))
            << "% of steps needed. Consider walking meetings to close the gap.";
    } else {
        out << "Limited availability today. You'll need ~" << s.remainingGap
            << " extra steps from walking meetings or longer walks.";
    }
    if (anyMeeting) {
        out << " Walking meeting opportunities identified.";
    }
    s.reasoning = out.str();
    return s;
}

} // namespace moveslot::domain::scheduling
