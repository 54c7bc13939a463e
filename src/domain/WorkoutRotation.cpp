#include "domain/WorkoutRotation.hpp"

namespace moveslot::domain {

CivilDate WorkoutRotation::WeekStartOf(const CivilDate& date) {
    // weekday(): 1 = Sunday, 2 = Monday ...
    int offsetFromMonday = (date.weekday() + 5) % 7;
    return date.addDays(-offsetFromMonday);
}

int WorkoutRotation::sessionsInWeekOf(const CivilDate& today) const {
    if (!m_state.weekStart || *m_state.weekStart != WeekStartOf(today)) {
        return 0;
    }
    return m_state.sessionsThisWeek;
}

void WorkoutRotation::recordWorkout(const CivilDate& date, WorkoutType type) {
    CivilDate week = WeekStartOf(date);
    if (!m_state.weekStart || *m_state.weekStart != week) {
        m_state.weekStart = week;
        m_state.sessionsThisWeek = 0;
    }
    m_state.sessionsThisWeek += 1;
    m_state.lastWorkout = type;
}

} // namespace moveslot::domain
