/**
 * @file HttpCalendarProvider.hpp
 * @brief CalendarProvider talking to a REST calendar bridge.
 *
 * GET /events?date=yyyy-MM-dd, POST /events, DELETE /events/{id}.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/CalendarProvider.hpp"

namespace moveslot::infrastructure {

class HttpCalendarProvider : public domain::CalendarProvider {
public:
    HttpCalendarProvider(const std::string& host = "localhost", int port = 8088);

    /** @brief Throws std::runtime_error when the bridge is unreachable or replies with garbage. */
    std::vector<domain::CalendarMeeting> fetchEvents(const domain::CivilDate& date) override;

    std::optional<std::string> createEvent(const std::string& title,
                                           const domain::Instant& start,
                                           const domain::Instant& end,
                                           const std::string& notes,
                                           int alarmOffsetMinutes) override;

    bool deleteEvent(const std::string& eventId) override;

private:
    std::string m_host;
    int m_port;
};

} // namespace moveslot::infrastructure
