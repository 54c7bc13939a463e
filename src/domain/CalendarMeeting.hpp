/**
 * @file CalendarMeeting.hpp
 * @brief Calendar events as seen by the planner, and their walkability verdicts.
 */

#pragma once

#include <string>
#include "domain/Schedule.hpp"

namespace moveslot::domain {

/**
 * @struct CalendarMeeting
 * @brief An event supplied by the calendar provider. Immutable within a planning run.
 */
struct CalendarMeeting {
    std::string id;
    std::string title;
    Instant start;
    Instant end;
    int attendeeCount = 0;
    bool isOrganizer = false;
    bool isAllDay = false;
    bool isOutOfOffice = false;
    std::string location;
    std::string notes;

    /** @brief All-day blocks and out-of-office markers never occupy walkable time. */
    bool isRealMeeting() const { return !isAllDay && !isOutOfOffice; }

    int durationMinutes() const { return MinutesBetween(start, end); }

    TimeInterval interval() const { return TimeInterval{start, end}; }
};

/**
 * @struct WalkabilityAssessment
 * @brief Score and explanation for attending a meeting on foot.
 */
struct WalkabilityAssessment {
    std::string meetingId;
    std::string title;
    Instant start;
    int durationMinutes = 0;
    int attendeeCount = 0;
    bool isOneOnOne = false;
    double score = 0.0;         ///< Clamped to [0, 1].
    bool isRecommended = false; ///< Walking 1:1 predicate.
    int estimatedSteps = 0;
    std::string reason;
};

/**
 * @struct WalkabilityVerdict
 * @brief Condensed classifier output.
 */
struct WalkabilityVerdict {
    bool isWalkable = false;
    double score = 0.0;
    std::string reason;
};

} // namespace moveslot::domain
