/**
 * @file FreeSlotFinder.hpp
 * @brief Complement of the busy list inside the buffered active-hours window.
 */

#pragma once

#include <optional>
#include <vector>
#include "domain/Schedule.hpp"
#include "domain/UserPreferences.hpp"

namespace moveslot::domain::scheduling {

struct ActiveWindowConfig {
    int wakeBufferMinutes = 60;
    int sleepBufferMinutes = 60;
    int latestEndMinutes = 21 * 60; ///< Hard ceiling regardless of sleep time.
};

/**
 * @brief Active window for a day: wake + buffer to min(sleep - buffer, ceiling).
 *
 * When `now` falls inside the day and after the window start, the window starts at `now`.
 * The result is invalid (start >= end) for a misconfigured day.
 */
TimeInterval ActiveWindowFor(const CivilDate& date,
                             const UserPreferences& prefs,
                             const std::optional<Instant>& now = std::nullopt,
                             const ActiveWindowConfig& config = {});

/**
 * @class FreeSlotFinder
 * @brief Linear sweep over sorted busy intervals, annotating each gap.
 */
class FreeSlotFinder {
public:
    explicit FreeSlotFinder(UserPreferences prefs) : m_prefs(std::move(prefs)) {}

    /**
     * @brief Free slots of at least `minDurationMinutes` inside `activeWindow`.
     *
     * Meal-adjacent slots are flagged, not dropped. Returns empty for an invalid window
     * or when wake time is not before sleep time.
     */
    std::vector<FreeSlot> findFreeSlots(const CivilDate& date,
                                        const std::vector<BusyInterval>& busyIntervals,
                                        const TimeInterval& activeWindow,
                                        int minDurationMinutes = 5) const;

    /** @brief Classifies and flags a raw gap. */
    FreeSlot annotate(const TimeInterval& gap) const;

private:
    UserPreferences m_prefs;
};

} // namespace moveslot::domain::scheduling
