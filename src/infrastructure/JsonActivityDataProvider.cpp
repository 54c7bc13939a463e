#include "infrastructure/JsonActivityDataProvider.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <nlohmann/json.hpp>

namespace moveslot::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

JsonActivityDataProvider::JsonActivityDataProvider(std::string filePath)
    : m_filePath(std::move(filePath)) {}

void JsonActivityDataProvider::refreshIfChanged() {
    std::error_code ec;
    if (!fs::exists(m_filePath, ec)) {
        m_days.clear();
        m_loadedStamp = -1;
        return;
    }
    auto stamp = static_cast<long long>(fs::last_write_time(m_filePath, ec).time_since_epoch().count());
    if (!ec && stamp == m_loadedStamp) return;

    std::map<domain::CivilDate, DayRecord> days;
    try {
        std::ifstream f(m_filePath);
        json doc;
        f >> doc;
        const json& entries = doc.contains("days") ? doc["days"] : doc;
        for (auto it = entries.begin(); it != entries.end(); ++it) {
            auto date = domain::CivilDate::Parse(it.key());
            if (!date) {
                std::cerr << "[JsonActivityDataProvider] Skipping malformed date '" << it.key() << "'" << std::endl;
                continue;
            }
            DayRecord day;
            day.steps = it.value().value("steps", 0);
            for (const auto& w : it.value().value("workouts", json::array())) {
                day.workouts.push_back(domain::WorkoutRecord{w.value("activity", "workout"), w.value("duration", 0)});
            }
            days[*date] = std::move(day);
        }
    } catch (const std::exception& e) {
        std::cerr << "[JsonActivityDataProvider] Failed to parse " << m_filePath << ": " << e.what() << std::endl;
        throw std::runtime_error("activity data unreadable: " + m_filePath);
    }

    m_days = std::move(days);
    m_loadedStamp = stamp;
}

int JsonActivityDataProvider::fetchSteps(const domain::CivilDate& date) {
    std::lock_guard<std::mutex> lock(m_mutex);
    refreshIfChanged();
    auto it = m_days.find(date);
    return it == m_days.end() ? 0 : it->second.steps;
}

std::vector<domain::WorkoutRecord> JsonActivityDataProvider::fetchWorkouts(const domain::CivilDate& date) {
    std::lock_guard<std::mutex> lock(m_mutex);
    refreshIfChanged();
    auto it = m_days.find(date);
    return it == m_days.end() ? std::vector<domain::WorkoutRecord>{} : it->second.workouts;
}

} // namespace moveslot::infrastructure
