#include "domain/scheduling/CapacityAllocator.hpp"
#include "domain/scheduling/IntervalMath.hpp"

#include <algorithm>

namespace moveslot::domain::scheduling {

namespace {

bool InRange(int hour, int first, int last) {
    return hour >= first && hour < last;
}

int IdealHourFor(PreferredTime preference) {
    switch (preference) {
        case PreferredTime::Morning: return 7;
        case PreferredTime::Afternoon: return 13;
        case PreferredTime::Evening: return 18;
        case PreferredTime::NoPreference: return 8;
    }
    return 8;
}

HourBand SearchBandFor(PreferredTime preference) {
    if (preference == PreferredTime::NoPreference) return {6, 21};
    return BandFor(preference);
}

// Index of the highest-scoring slot; ties keep the earlier slot.
template <typename ScoreFn>
std::optional<size_t> BestIndex(const std::vector<FreeSlot>& slots,
                                const std::vector<bool>& used,
                                ScoreFn scoreFn) {
    std::optional<size_t> best;
    int bestScore = -1;
    for (size_t i = 0; i < slots.size(); ++i) {
        if (used[i]) continue;
        int s = scoreFn(slots[i].startHour());
        if (s > bestScore) {
            bestScore = s;
            best = i;
        }
    }
    return best;
}

} // namespace

int GymPreferenceScore(int hour, PreferredTime preference) {
    switch (preference) {
        case PreferredTime::Morning:
            if (InRange(hour, 5, 10)) return 3;
            if (InRange(hour, 10, 12)) return 1;
            return 0;
        case PreferredTime::Afternoon:
            return InRange(hour, 12, 17) ? 3 : 0;
        case PreferredTime::Evening:
            return InRange(hour, 17, 21) ? 3 : 0;
        case PreferredTime::NoPreference:
            return (InRange(hour, 6, 9) || InRange(hour, 17, 20)) ? 2 : 1;
    }
    return 0;
}

int WalkPreferenceScore(int hour, PreferredTime preference) {
    switch (preference) {
        case PreferredTime::Morning:
            if (InRange(hour, 6, 10)) return 3;
            if (InRange(hour, 10, 12)) return 1;
            return 0;
        case PreferredTime::Afternoon:
            return InRange(hour, 12, 17) ? 3 : 0;
        case PreferredTime::Evening:
            return InRange(hour, 17, 21) ? 3 : 0;
        case PreferredTime::NoPreference:
            return 1;
    }
    return 0;
}

PlannedActivity CapacityAllocator::makeWalk(const FreeSlot& slot) const {
    const int hour = slot.startHour();
    PlannedActivity walk;
    walk.id = "walk-" + std::to_string(ToEpochSeconds(slot.interval.start));
    walk.startTime = slot.interval.start;
    walk.durationMinutes = std::min(slot.durationMinutes, m_config.maxWalkMinutes);
    walk.estimatedSteps = walk.durationMinutes * m_config.stepsPerMinute;
    walk.priority = ActivityPriority::Recommended;

    if (hour < 10) {
        walk.type = ActivityType::MorningWalk;
        walk.title = "Morning Walk";
    } else if (hour < 14) {
        walk.type = ActivityType::LunchWalk;
        walk.title = "Midday Walk";
    } else if (hour < 17) {
        walk.type = ActivityType::ScheduledWalk;
        walk.title = "Afternoon Walk";
    } else {
        walk.type = ActivityType::EveningWalk;
        walk.title = "Evening Walk";
    }
    walk.reason = "Free " + std::to_string(slot.durationMinutes) + "-minute window";
    return walk;
}

PlannedActivity CapacityAllocator::makeWorkout(const Instant& start, int durationMinutes, WorkoutType type) const {
    PlannedActivity w;
    w.id = "workout-" + std::to_string(ToEpochSeconds(start));
    w.type = ActivityType::Workout;
    w.workoutType = type;
    w.title = WorkoutDisplayName(type);
    w.startTime = start;
    w.durationMinutes = durationMinutes;
    w.estimatedSteps = 0;
    w.priority = ActivityPriority::Critical;
    w.reason = WorkoutTypeToString(type) + " session";
    return w;
}

std::optional<Instant> CapacityAllocator::findPreferredStart(const CivilDate& date,
                                                             PreferredTime preference,
                                                             int durationMinutes,
                                                             const std::vector<TimeInterval>& busy,
                                                             const UserPreferences& prefs) const {
    const HourBand band = SearchBandFor(preference);
    const int ideal = std::clamp(IdealHourFor(preference), band.first, band.last - 1);

    std::vector<int> candidates;
    for (int m = ideal * 60; m < band.last * 60; m += m_config.fallbackStepMinutes) candidates.push_back(m);
    for (int m = band.first * 60; m < ideal * 60; m += m_config.fallbackStepMinutes) candidates.push_back(m);

    for (int startMinutes : candidates) {
        if (startMinutes < prefs.wakeMinutes || startMinutes + durationMinutes > prefs.sleepMinutes) continue;
        TimeInterval candidate{MakeInstantAtMinutes(date, startMinutes),
                               MakeInstantAtMinutes(date, startMinutes + durationMinutes)};
        if (prefs.isDuringMeal(candidate.start)) continue;
        if (IsFree(candidate, busy)) return candidate.start;
    }
    return std::nullopt;
}

WalkWorkoutAllocation CapacityAllocator::allocate(const CivilDate& date,
                                                  const std::vector<FreeSlot>& freeSlots,
                                                  const std::vector<WalkabilityAssessment>& walkableMeetings,
                                                  const std::vector<TimeInterval>& busy,
                                                  const UserPreferences& prefs,
                                                  bool needsWorkout,
                                                  WorkoutType nextWorkout) const {
    WalkWorkoutAllocation result;

    std::vector<FreeSlot> hourSlots;
    std::vector<FreeSlot> shortSlots;
    for (const auto& slot : freeSlots) {
        if (slot.isDuringMeal || slot.durationMinutes < m_config.candidateMinMinutes) continue;
        if (slot.durationMinutes >= m_config.hourSlotMinutes) {
            hourSlots.push_back(slot);
        } else {
            shortSlots.push_back(slot);
        }
    }
    result.oneHourSlotCount = static_cast<int>(hourSlots.size());

    std::optional<WalkabilityAssessment> meeting;
    for (const auto& m : walkableMeetings) {
        if (m.isRecommended) {
            meeting = m;
            break;
        }
    }

    auto workoutIn = [&](const FreeSlot& slot) {
        return makeWorkout(slot.interval.start,
                           std::min(prefs.workoutDurationMinutes, slot.durationMinutes),
                           nextWorkout);
    };
    auto walkFromMeetingOrShort = [&](std::optional<size_t> skipShort) {
        if (meeting) {
            result.walkingMeeting = meeting;
            return;
        }
        for (size_t i = 0; i < shortSlots.size(); ++i) {
            if (skipShort && *skipShort == i) continue;
            result.walk = makeWalk(shortSlots[i]);
            return;
        }
    };

    if (hourSlots.empty()) {
        std::optional<size_t> usedShort;
        if (needsWorkout) {
            for (size_t i = 0; i < shortSlots.size(); ++i) {
                if (shortSlots[i].durationMinutes >= prefs.workoutDurationMinutes) {
                    result.workout = workoutIn(shortSlots[i]);
                    usedShort = i;
                    break;
                }
            }
        }
        walkFromMeetingOrShort(usedShort);
    } else if (hourSlots.size() == 1) {
        if (needsWorkout) {
            result.workout = workoutIn(hourSlots.front());
            walkFromMeetingOrShort(std::nullopt);
        } else {
            result.walk = makeWalk(hourSlots.front());
        }
    } else {
        std::vector<bool> used(hourSlots.size(), false);
        if (needsWorkout) {
            auto w = BestIndex(hourSlots, used, [&](int h) { return GymPreferenceScore(h, prefs.preferredGymTime); });
            if (w) {
                used[*w] = true;
                result.workout = workoutIn(hourSlots[*w]);
            }
        }
        auto k = BestIndex(hourSlots, used, [&](int h) { return WalkPreferenceScore(h, prefs.preferredWalkTime); });
        if (k) {
            used[*k] = true;
            result.walk = makeWalk(hourSlots[*k]);
        }
        for (size_t i = 0; i < hourSlots.size(); ++i) {
            if (static_cast<int>(result.extraWalkOptions.size()) >= m_config.extraWalkOptions) break;
            if (used[i]) continue;
            result.extraWalkOptions.push_back(makeWalk(hourSlots[i]));
        }
    }

    // Preferred-time fallback when the free slots gave nothing.
    std::vector<TimeInterval> occupied = busy;
    if (result.workout) occupied.push_back(result.workout->interval());
    if (result.walk) occupied.push_back(result.walk->interval());

    if (needsWorkout && !result.workout) {
        if (auto start = findPreferredStart(date, prefs.preferredGymTime, prefs.workoutDurationMinutes, occupied, prefs)) {
            result.workout = makeWorkout(*start, prefs.workoutDurationMinutes, nextWorkout);
            result.workout->isIdeal = false;
            occupied.push_back(result.workout->interval());
        }
    }
    if (!result.walk && !result.walkingMeeting) {
        if (auto start = findPreferredStart(date, prefs.preferredWalkTime, m_config.maxWalkMinutes, occupied, prefs)) {
            FreeSlot synthetic;
            synthetic.interval = TimeInterval{*start, AddMinutes(*start, m_config.maxWalkMinutes)};
            synthetic.durationMinutes = m_config.maxWalkMinutes;
            synthetic.slotClass = SlotClassFor(synthetic.durationMinutes);
            result.walk = makeWalk(synthetic);
            result.walk->isIdeal = false;
            result.walk->reason = "Best available time near your preferred walking window";
        }
    }
    return result;
}

} // namespace moveslot::domain::scheduling
