/**
 * @file CalendarProvider.hpp
 * @brief Interface to the user's calendar.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "domain/CalendarMeeting.hpp"

namespace moveslot::domain {

/**
 * @class CalendarProvider
 * @brief Read and write access to calendar events. Implementations may throw on transport errors.
 */
class CalendarProvider {
public:
    virtual ~CalendarProvider() = default;

    /** @brief All events overlapping the given local day, including all-day ones. */
    virtual std::vector<CalendarMeeting> fetchEvents(const CivilDate& date) = 0;

    /**
     * @brief Creates an event.
     * @param alarmOffsetMinutes Reminder lead time before start.
     * @return The new event id, or nullopt if the calendar rejected it.
     */
    virtual std::optional<std::string> createEvent(const std::string& title,
                                                   const Instant& start,
                                                   const Instant& end,
                                                   const std::string& notes,
                                                   int alarmOffsetMinutes) = 0;

    /** @brief Removes an event. Returns false when it could not be deleted. */
    virtual bool deleteEvent(const std::string& eventId) = 0;
};

} // namespace moveslot::domain
