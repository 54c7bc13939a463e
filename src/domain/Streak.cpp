#include "domain/Streak.hpp"

#include <algorithm>

namespace moveslot::domain {

namespace {
constexpr int kMaxHistoryDays = 365;
}

bool Streak::recordGoalHit(const CivilDate& today) {
    if (m_state.lastGoalDate && *m_state.lastGoalDate == today) {
        return false;
    }

    if (m_state.lastGoalDate && *m_state.lastGoalDate == today.addDays(-1)) {
        m_state.currentStreak += 1;
    } else {
        m_state.currentStreak = 1;
    }
    m_state.longestStreak = std::max(m_state.longestStreak, m_state.currentStreak);
    m_state.lastGoalDate = today;
    return true;
}

bool Streak::validate(const CivilDate& today) {
    if (!m_state.lastGoalDate) {
        bool changed = m_state.currentStreak != 0;
        m_state.currentStreak = 0;
        return changed;
    }
    const CivilDate& last = *m_state.lastGoalDate;
    if (last == today || last == today.addDays(-1)) {
        return false;
    }
    bool changed = m_state.currentStreak != 0;
    m_state.currentStreak = 0;
    return changed;
}

bool Streak::recordDailyTotal(const CivilDate& today, int steps, int goal) {
    if (goal <= 0 || steps < goal) return false;
    return recordGoalHit(today);
}

int Streak::rebuildFromHistory(const CivilDate& today, int goal,
                               const std::function<int(const CivilDate&)>& stepsOn) {
    // Today still counts as "in progress": start from today if met, else from yesterday.
    int count = 0;
    std::optional<CivilDate> mostRecent;
    CivilDate cursor = today;
    if (stepsOn(today) < goal) {
        cursor = today.addDays(-1);
    }
    while (count < kMaxHistoryDays && stepsOn(cursor) >= goal) {
        if (!mostRecent) mostRecent = cursor;
        ++count;
        cursor = cursor.addDays(-1);
    }

    m_state.currentStreak = count;
    m_state.longestStreak = std::max(m_state.longestStreak, count);
    if (mostRecent) {
        m_state.lastGoalDate = mostRecent;
    }
    return count;
}

} // namespace moveslot::domain
