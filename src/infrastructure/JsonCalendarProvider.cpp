/**
 * @file JsonCalendarProvider.cpp
 * @brief Implementation of JsonCalendarProvider.
 */

#include "infrastructure/JsonCalendarProvider.hpp"
#include "infrastructure/StateCodec.hpp"
#include "domain/scheduling/IntervalMath.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace moveslot::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

JsonCalendarProvider::JsonCalendarProvider(std::string filePath, std::shared_ptr<PersistenceService> persistence)
    : m_filePath(std::move(filePath)), m_persistence(std::move(persistence)) {
    load();
}

void JsonCalendarProvider::load() {
    if (!fs::exists(m_filePath)) {
        std::cout << "[JsonCalendarProvider] No calendar file at " << m_filePath << ", starting empty." << std::endl;
        return;
    }
    try {
        std::ifstream f(m_filePath);
        json doc;
        f >> doc;
        for (const auto& item : doc.value("events", json::array())) {
            StoredEvent e;
            e.meeting = StateCodec::MeetingFromJson(item);
            e.alarmOffsetMinutes = item.value("alarm_offset_minutes", 0);
            e.createdByPlanner = item.value("created_by_moveslot", false);
            m_events.push_back(std::move(e));
        }
        m_nextId = static_cast<long>(m_events.size()) + 1;
    } catch (const std::exception& e) {
        std::cerr << "[JsonCalendarProvider] Failed to read " << m_filePath << ": " << e.what() << std::endl;
        m_events.clear();
        m_loadFailed = true;
    }
}

void JsonCalendarProvider::save() {
    json events = json::array();
    for (const auto& e : m_events) {
        json j = StateCodec::MeetingToJson(e.meeting);
        if (e.alarmOffsetMinutes > 0) j["alarm_offset_minutes"] = e.alarmOffsetMinutes;
        if (e.createdByPlanner) j["created_by_moveslot"] = true;
        events.push_back(std::move(j));
    }
    m_persistence->saveTextAsync(m_filePath, json{{"events", events}}.dump(2));
}

std::vector<domain::CalendarMeeting> JsonCalendarProvider::fetchEvents(const domain::CivilDate& date) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_loadFailed) {
        throw std::runtime_error("calendar file " + m_filePath + " is unreadable");
    }
    const domain::TimeInterval day{domain::StartOfDay(date), domain::StartOfDay(date.addDays(1))};
    std::vector<domain::CalendarMeeting> out;
    for (const auto& e : m_events) {
        if (domain::scheduling::Overlaps(e.meeting.interval(), day)) {
            out.push_back(e.meeting);
        }
    }
    return out;
}

std::optional<std::string> JsonCalendarProvider::createEvent(const std::string& title,
                                                             const domain::Instant& start,
                                                             const domain::Instant& end,
                                                             const std::string& notes,
                                                             int alarmOffsetMinutes) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_loadFailed || !(start < end)) {
        return std::nullopt;
    }

    StoredEvent e;
    e.meeting.id = "moveslot-" + std::to_string(domain::ToEpochSeconds(start)) + "-" + std::to_string(m_nextId++);
    e.meeting.title = title;
    e.meeting.start = start;
    e.meeting.end = end;
    e.meeting.attendeeCount = 1;
    e.meeting.isOrganizer = true;
    e.meeting.notes = notes;
    e.alarmOffsetMinutes = alarmOffsetMinutes;
    e.createdByPlanner = true;
    m_events.push_back(e);
    save();
    return e.meeting.id;
}

bool JsonCalendarProvider::deleteEvent(const std::string& eventId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::find_if(m_events.begin(), m_events.end(),
                           [&](const StoredEvent& e) { return e.meeting.id == eventId; });
    if (it == m_events.end()) return false;
    m_events.erase(it);
    save();
    return true;
}

size_t JsonCalendarProvider::eventCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events.size();
}

} // namespace moveslot::infrastructure
