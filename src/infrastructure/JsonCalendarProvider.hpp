/**
 * @file JsonCalendarProvider.hpp
 * @brief CalendarProvider backed by a local JSON document.
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "domain/CalendarProvider.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace moveslot::infrastructure {

/**
 * @class JsonCalendarProvider
 * @brief Reads {"events": [...]} once; created and deleted events are written back.
 *
 * Event times are local "yyyy-MM-ddTHH:MM" strings.
 */
class JsonCalendarProvider : public domain::CalendarProvider {
public:
    JsonCalendarProvider(std::string filePath, std::shared_ptr<PersistenceService> persistence);

    std::vector<domain::CalendarMeeting> fetchEvents(const domain::CivilDate& date) override;
    std::optional<std::string> createEvent(const std::string& title,
                                           const domain::Instant& start,
                                           const domain::Instant& end,
                                           const std::string& notes,
                                           int alarmOffsetMinutes) override;
    bool deleteEvent(const std::string& eventId) override;

    size_t eventCount() const;

private:
    struct StoredEvent {
        domain::CalendarMeeting meeting;
        int alarmOffsetMinutes = 0;
        bool createdByPlanner = false;
    };

    void load();
    void save();

    std::string m_filePath;
    std::shared_ptr<PersistenceService> m_persistence;
    std::vector<StoredEvent> m_events;
    long m_nextId = 1;
    bool m_loadFailed = false;
    mutable std::mutex m_mutex;
};

} // namespace moveslot::infrastructure
