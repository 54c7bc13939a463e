#include "application/StreakService.hpp"
#include "infrastructure/StateCodec.hpp"

#include <iostream>
#include <map>

namespace moveslot::application {

using infrastructure::StateCodec;

StreakService::StreakService(std::shared_ptr<domain::KeyValueStore> store)
    : m_store(std::move(store)) {
    if (auto raw = m_store->get(StateCodec::kStreakKey)) {
        if (auto state = StateCodec::DecodeStreak(*raw)) {
            m_streak = domain::Streak(*state);
        } else {
            std::cerr << "[StreakService] Stored streak unreadable, starting at zero." << std::endl;
        }
    }
}

void StreakService::validate(const domain::CivilDate& today) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_streak.validate(today)) {
        std::cout << "[StreakService] Streak lapsed, reset to 0." << std::endl;
        persist();
    }
}

bool StreakService::recordGoalHit(const domain::CivilDate& today) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_streak.recordGoalHit(today)) return false;
    persist();
    std::cout << "[StreakService] Goal hit on " << today.toString() << ", streak " << m_streak.current() << std::endl;
    return true;
}

bool StreakService::recordDailyTotal(const domain::CivilDate& today, int steps, int goal) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_streak.recordDailyTotal(today, steps, goal)) return false;
    persist();
    return true;
}

int StreakService::rebuildFromHistory(const domain::CivilDate& today, int goal,
                                      domain::ActivityDataProvider& activityData) {
    // Fetch first so the provider is not called under the lock.
    std::map<domain::CivilDate, int> history;
    try {
        for (int offset = 0; offset <= 365; ++offset) {
            const domain::CivilDate day = today.addDays(-offset);
            int steps = activityData.fetchSteps(day);
            history[day] = steps;
            if (offset > 0 && steps < goal) break;
        }
    } catch (const std::exception& e) {
        std::cerr << "[StreakService] Cannot rebuild streak: " << e.what() << std::endl;
        return snapshot().currentStreak;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    int count = m_streak.rebuildFromHistory(today, goal, [&history](const domain::CivilDate& d) {
        auto it = history.find(d);
        return it == history.end() ? 0 : it->second;
    });
    persist();
    return count;
}

domain::StreakState StreakService::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_streak.state();
}

void StreakService::persist() {
    m_store->put(StateCodec::kStreakKey, StateCodec::Encode(m_streak.state()));
}

} // namespace moveslot::application
