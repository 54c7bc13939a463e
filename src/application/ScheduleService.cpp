#include "application/ScheduleService.hpp"
#include "infrastructure/StateCodec.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace moveslot::application {

using infrastructure::StateCodec;

namespace {
constexpr double kMinSuggestRate = 0.5;
}

ScheduleService::ScheduleService(std::shared_ptr<domain::KeyValueStore> store)
    : m_store(std::move(store)) {
    if (auto raw = m_store->get(StateCodec::kScheduleKey)) {
        if (auto decoded = StateCodec::DecodeSchedule(*raw)) {
            m_activities = std::move(*decoded);
        } else {
            std::cerr << "[ScheduleService] Stored schedule unreadable, starting empty." << std::endl;
        }
    }
    if (auto raw = m_store->get(StateCodec::kTimeStatsKey)) {
        if (auto decoded = StateCodec::DecodeTimeStats(*raw)) {
            m_stats = std::move(*decoded);
        }
    }
    m_nextSequence = static_cast<int>(m_activities.size()) + 1;
}

domain::ScheduledActivity ScheduleService::add(domain::ScheduledActivity activity) {
    if (activity.durationMinutes <= 0) {
        throw std::invalid_argument("Duration must be positive");
    }
    if (activity.startMinutes < 0 || activity.startMinutes + activity.durationMinutes > 24 * 60) {
        throw std::invalid_argument("Activity must fit inside one day");
    }
    if (activity.endDate && *activity.endDate < activity.startDate) {
        throw std::invalid_argument("End date is before start date");
    }
    if (activity.type == domain::ActivityType::Workout && !activity.workoutType) {
        activity.workoutType = domain::WorkoutType::Push;
    }
    if (activity.title.empty()) {
        activity.title = activity.workoutType ? domain::WorkoutDisplayName(*activity.workoutType)
                                              : domain::ActivityTypeDisplayName(activity.type);
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (activity.id.empty()) {
        auto taken = [this](const std::string& id) {
            return std::any_of(m_activities.begin(), m_activities.end(),
                               [&id](const domain::ScheduledActivity& a) { return a.id == id; });
        };
        std::string candidate;
        do {
            candidate = "sched-" + std::to_string(m_nextSequence++);
        } while (taken(candidate));
        activity.id = candidate;
    } else {
        for (const auto& existing : m_activities) {
            if (existing.id == activity.id) {
                throw std::invalid_argument("Duplicate schedule id: " + activity.id);
            }
        }
    }

    m_activities.push_back(activity);
    persistSchedule();
    std::cout << "[ScheduleService] Added " << activity.id << " (" << activity.title << ", "
              << domain::RecurrenceToString(activity.recurrence) << ")" << std::endl;
    return activity;
}

bool ScheduleService::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::find_if(m_activities.begin(), m_activities.end(),
                           [&id](const domain::ScheduledActivity& a) { return a.id == id; });
    if (it == m_activities.end()) return false;
    m_activities.erase(it);
    persistSchedule();
    return true;
}

void ScheduleService::setActive(const std::string& id, bool active) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& a : m_activities) {
        if (a.id == id) {
            a.isActive = active;
            persistSchedule();
            return;
        }
    }
    throw std::invalid_argument("Unknown schedule id: " + id);
}

std::vector<domain::ScheduledActivity> ScheduleService::list() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_activities;
}

std::vector<domain::PlannedActivity> ScheduleService::occurrencesOn(const domain::CivilDate& date) const {
    std::vector<domain::PlannedActivity> result;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& a : m_activities) {
            if (a.isActive && a.occursOn(date)) {
                result.push_back(a.occurrenceOn(date));
            }
        }
    }
    std::stable_sort(result.begin(), result.end(),
                     [](const domain::PlannedActivity& a, const domain::PlannedActivity& b) {
                         return a.startTime < b.startTime;
                     });
    return result;
}

std::vector<domain::ScheduleConflict> ScheduleService::checkConflicts(
    const domain::CivilDate& date,
    const std::vector<domain::CalendarMeeting>& meetings) const {
    std::vector<domain::ScheduledActivity> snapshot = list();
    return m_detector.checkConflicts(date, snapshot, meetings);
}

void ScheduleService::recordOutcome(domain::ActivityType type, int weekday, int hour, bool success) {
    if (weekday < 1 || weekday > 7 || hour < 0 || hour > 23) {
        throw std::invalid_argument("Weekday or hour out of range");
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::find_if(m_stats.begin(), m_stats.end(), [&](const domain::ActivityTimeStats& s) {
        return s.type == type && s.weekday == weekday && s.hour == hour;
    });
    if (it == m_stats.end()) {
        domain::ActivityTimeStats fresh;
        fresh.type = type;
        fresh.weekday = weekday;
        fresh.hour = hour;
        m_stats.push_back(fresh);
        it = m_stats.end() - 1;
    }
    it->attempts += 1;
    if (success) it->successes += 1;
    persistStats();
}

std::optional<int> ScheduleService::suggestBestTime(domain::ActivityType type, int weekday) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::optional<int> bestHour;
    double bestRate = 0.0;
    for (const auto& s : m_stats) {
        if (s.type != type || s.weekday != weekday || s.attempts == 0) continue;
        double rate = s.successRate();
        if (rate < kMinSuggestRate) continue;
        if (!bestHour || rate > bestRate || (rate == bestRate && s.hour < *bestHour)) {
            bestHour = s.hour;
            bestRate = rate;
        }
    }
    return bestHour;
}

std::vector<domain::ActivityTimeStats> ScheduleService::timeStats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

void ScheduleService::persistSchedule() {
    m_store->put(StateCodec::kScheduleKey, StateCodec::Encode(m_activities));
}

void ScheduleService::persistStats() {
    m_store->put(StateCodec::kTimeStatsKey, StateCodec::Encode(m_stats));
}

} // namespace moveslot::application
