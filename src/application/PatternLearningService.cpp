#include "application/PatternLearningService.hpp"
#include "infrastructure/StateCodec.hpp"

#include <iostream>
#include <map>

namespace moveslot::application {

using infrastructure::StateCodec;

namespace {

domain::learning::PatternLearner LoadLearner(const domain::KeyValueStore& store) {
    domain::UserActivityPatterns patterns;
    domain::PlanAdherence adherence;

    if (auto raw = store.get(StateCodec::kPatternsKey)) {
        if (auto decoded = StateCodec::DecodePatterns(*raw)) {
            patterns = *decoded;
        } else {
            std::cerr << "[PatternLearningService] Stored patterns unreadable, using defaults." << std::endl;
        }
    }
    if (auto raw = store.get(StateCodec::kAdherenceKey)) {
        if (auto decoded = StateCodec::DecodeAdherence(*raw)) {
            adherence = *decoded;
        } else {
            std::cerr << "[PatternLearningService] Stored adherence unreadable, using defaults." << std::endl;
        }
    }
    return domain::learning::PatternLearner(patterns, adherence);
}

} // namespace

PatternLearningService::PatternLearningService(std::shared_ptr<domain::ActivityDataProvider> activityData,
                                               std::shared_ptr<domain::KeyValueStore> store)
    : m_activityData(std::move(activityData)), m_store(std::move(store)), m_learner(LoadLearner(*m_store)) {}

int PatternLearningService::refreshFromHistory(const domain::CivilDate& today, int dailyGoal,
                                               const domain::Instant& now, int days) {
    std::map<domain::CivilDate, int> steps;
    std::map<domain::CivilDate, bool> workouts;

    // Fetch outside the lock; providers may block.
    for (int offset = 1; offset <= days; ++offset) {
        const domain::CivilDate day = today.addDays(-offset);
        try {
            steps[day] = m_activityData->fetchSteps(day);
            workouts[day] = !m_activityData->fetchWorkouts(day).empty();
        } catch (const std::exception& e) {
            std::cerr << "[PatternLearningService] No activity data for " << day.toString() << ": " << e.what() << std::endl;
            steps.erase(day);
        }
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_learner.updateFromHistory(steps, workouts, dailyGoal, now);
    persist();
    std::cout << "[PatternLearningService] Learned from " << steps.size() << " days." << std::endl;
    return static_cast<int>(steps.size());
}

void PatternLearningService::recordOutcome(const domain::PlannedActivity& activity, bool completed,
                                           const domain::Instant& now) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_learner.recordOutcomeAtHour(activity.type, domain::HourOf(activity.startTime), completed, now);
    persist();
}

void PatternLearningService::recordPlanGenerated() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_learner.recordPlanGenerated();
    m_store->put(StateCodec::kAdherenceKey, StateCodec::Encode(m_learner.adherence()));
}

domain::UserActivityPatterns PatternLearningService::patterns() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_learner.patterns();
}

domain::PlanAdherence PatternLearningService::adherence() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_learner.adherence();
}

void PatternLearningService::persist() {
    m_store->put(StateCodec::kPatternsKey, StateCodec::Encode(m_learner.patterns()));
    m_store->put(StateCodec::kAdherenceKey, StateCodec::Encode(m_learner.adherence()));
}

} // namespace moveslot::application
