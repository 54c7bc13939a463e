/**
 * @file AutopilotSlotPicker.hpp
 * @brief Chooses the next day's autopilot walks from fixed time-of-day categories.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/AutopilotWalk.hpp"
#include "domain/Schedule.hpp"
#include "domain/UserPreferences.hpp"

namespace moveslot::domain::scheduling {

/**
 * @struct WalkCategory
 * @brief Hour band [startHour, endHour) with a priority (1 = visited first).
 */
struct WalkCategory {
    std::string name;
    int startHour;
    int endHour;
    int priority;
};

/** @brief morning 8-11 (2), midday 11-14 (1), afternoon 14-17 (3), evening 17-20 (2). */
std::vector<WalkCategory> DefaultWalkCategories();

struct PickedWalk {
    Instant start;
    int durationMinutes = 0;
    AutopilotWalkType type = AutopilotWalkType::Standard;
    std::string category;
};

struct AutopilotPickerConfig {
    int categorySpacingMinutes = 60;
    int microSpacingMinutes = 30;
    int microMinMinutes = 5;
    int microMaxGapMinutes = 15;
    int microMaxDuration = 10;
};

class AutopilotSlotPicker {
public:
    explicit AutopilotSlotPicker(AutopilotPickerConfig config = {},
                                 std::vector<WalkCategory> categories = DefaultWalkCategories());

    /**
     * @brief Picks up to settings.targetWalksPerDay walks, ordered by start time.
     * @param busy Real meetings and already-scheduled activities of the day.
     */
    std::vector<PickedWalk> pick(const CivilDate& date,
                                 const std::vector<TimeInterval>& busy,
                                 const UserPreferences& prefs,
                                 const AutopilotSettings& settings) const;

private:
    AutopilotPickerConfig m_config;
    std::vector<WalkCategory> m_categories;
};

} // namespace moveslot::domain::scheduling
