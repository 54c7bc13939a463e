/**
 * @file WalkabilityClassifier.hpp
 * @brief Decides which meetings can be attended on foot.
 *
 * Two predicates coexist and are not interchangeable:
 *  - isBackgroundListenable(): large meetings the user only listens to, used to
 *    fill the general step gap.
 *  - IsWalkingOneOnOne(): small, friendly meetings recommended by the planner.
 */

#pragma once

#include <vector>
#include "domain/CalendarMeeting.hpp"

namespace moveslot::domain::scheduling {

struct WalkabilityConfig {
    int stepsPerMinute = 100;
    double recommendThreshold = 0.5;
    int listenMinDuration = 20;
    int listenMaxDuration = 120;
    int listenMinAttendees = 4;
};

class WalkabilityClassifier {
public:
    explicit WalkabilityClassifier(WalkabilityConfig config = {}) : m_config(config) {}

    /** @brief Additive score clamped to [0, 1]. Deterministic for identical input. */
    double score(const CalendarMeeting& meeting) const;

    /** @brief Full assessment including the walking 1:1 recommendation. */
    WalkabilityAssessment assess(const CalendarMeeting& meeting) const;

    /** @brief isWalkable is the walking 1:1 predicate. */
    WalkabilityVerdict classify(const CalendarMeeting& meeting) const;

    /** @brief Large meeting where the user is a passive listener. */
    bool isBackgroundListenable(const CalendarMeeting& meeting) const;

    /** @brief Assessments for the real meetings in `meetings`, ordered by start. */
    std::vector<WalkabilityAssessment> assessAll(const std::vector<CalendarMeeting>& meetings) const;

    /** @brief Only the recommended ones. */
    std::vector<WalkabilityAssessment> recommended(const std::vector<CalendarMeeting>& meetings) const;

    static bool IsWalkingOneOnOne(const WalkabilityAssessment& assessment, double threshold = 0.5);

    static bool HasWalkFriendlyKeyword(const std::string& title);
    static bool HasNonWalkableKeyword(const std::string& title);

private:
    WalkabilityConfig m_config;
};

} // namespace moveslot::domain::scheduling
