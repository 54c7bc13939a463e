#include "domain/learning/PatternLearner.hpp"

#include <algorithm>
#include <vector>

namespace moveslot::domain::learning {

namespace {

struct Accumulator {
    long long total = 0;
    int count = 0;

    void add(int v) { total += v; ++count; }
    int mean(int fallback) const { return count == 0 ? fallback : static_cast<int>(total / count); }
};

} // namespace

double PatternLearner::ema(double previous, bool outcome) const {
    const double value = outcome ? 1.0 : 0.0;
    return m_config.smoothing * value + (1.0 - m_config.smoothing) * previous;
}

const UserActivityPatterns& PatternLearner::updateFromHistory(const std::map<CivilDate, int>& dailySteps,
                                                              const std::map<CivilDate, bool>& dailyWorkouts,
                                                              int dailyGoal,
                                                              const Instant& now) {
    if (dailySteps.empty()) {
        return m_patterns;
    }

    Accumulator overall, weekday, weekend;
    std::map<int, Accumulator> byWeekday;
    int goalDays = 0;

    for (const auto& [date, steps] : dailySteps) {
        overall.add(steps);
        if (date.isWeekend()) {
            weekend.add(steps);
        } else {
            weekday.add(steps);
        }
        byWeekday[date.weekday()].add(steps);
        if (steps >= dailyGoal) ++goalDays;
    }

    m_patterns.averageDailySteps = overall.mean(0);
    m_patterns.weekdayAverage = weekday.mean(m_patterns.averageDailySteps);
    m_patterns.weekendAverage = weekend.mean(m_patterns.averageDailySteps);
    m_patterns.goalAchievementRate = static_cast<double>(goalDays) / static_cast<double>(overall.count);

    std::vector<std::pair<int, int>> ranked; // (weekday, mean)
    for (const auto& [wd, acc] : byWeekday) {
        ranked.emplace_back(wd, acc.mean(0));
    }
    std::stable_sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        return a.second > b.second;
    });
    m_patterns.bestPerformingDays.clear();
    for (size_t i = 0; i < ranked.size() && static_cast<int>(i) < m_config.bestDaysCount; ++i) {
        m_patterns.bestPerformingDays.push_back(ranked[i].first);
    }

    int workoutDays = 0;
    for (const auto& [date, didWorkout] : dailyWorkouts) {
        if (didWorkout && dailySteps.count(date)) ++workoutDays;
    }
    m_patterns.workoutDayRate = static_cast<double>(workoutDays) / static_cast<double>(overall.count);

    m_patterns.lastUpdated = now;
    return m_patterns;
}

void PatternLearner::recordOutcome(ActivityType type, TimeOfDay timeOfDay, bool completed, const Instant& now) {
    if (completed) {
        m_adherence.activitiesCompleted += 1;
    } else {
        m_adherence.activitiesSkipped += 1;
    }

    double previous = m_adherence.rateFor(timeOfDay).value_or(m_config.neutralPrior);
    m_adherence.bestTimeSlots[timeOfDay] = ema(previous, completed);

    auto typeIt = m_adherence.typeCompletionRates.find(type);
    double previousType = typeIt == m_adherence.typeCompletionRates.end() ? m_config.neutralPrior : typeIt->second;
    m_adherence.typeCompletionRates[type] = ema(previousType, completed);

    const int total = m_adherence.activitiesCompleted + m_adherence.activitiesSkipped;
    m_adherence.averageCompletionRate =
        static_cast<double>(m_adherence.activitiesCompleted) / static_cast<double>(std::max(1, total));
    m_adherence.lastUpdated = now;
}

void PatternLearner::recordOutcomeAtHour(ActivityType type, int startHour, bool completed, const Instant& now) {
    recordOutcome(type, TimeOfDayForHour(startHour), completed, now);
    if (!IsWalk(type)) return;

    auto& times = m_patterns.consistentWalkTimes;
    auto it = std::find_if(times.begin(), times.end(), [&](const ConsistentWalkTime& t) { return t.hour == startHour; });
    if (it == times.end()) {
        times.push_back(ConsistentWalkTime{startHour, ema(m_config.neutralPrior, completed)});
        std::sort(times.begin(), times.end(), [](const auto& a, const auto& b) { return a.hour < b.hour; });
    } else {
        it->consistency = ema(it->consistency, completed);
    }
}

} // namespace moveslot::domain::learning
