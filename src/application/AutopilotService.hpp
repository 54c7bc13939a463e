/**
 * @file AutopilotService.hpp
 * @brief Nightly autopilot: picks tomorrow's walks and commits them according to the
 *        user's trust level.
 */

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "domain/AutopilotWalk.hpp"
#include "domain/CalendarProvider.hpp"
#include "domain/KeyValueStore.hpp"
#include "domain/NotificationDispatcher.hpp"
#include "domain/PlannedActivity.hpp"
#include "domain/UserPreferences.hpp"
#include "domain/scheduling/AutopilotSlotPicker.hpp"

namespace moveslot::application {

struct AutopilotRunResult {
    bool skipped = false;                 ///< Already ran for the date, or autopilot disabled.
    std::vector<domain::AutopilotWalk> walks;
    std::vector<std::string> errors;      ///< Calendar failures. Non-fatal.
};

class AutopilotService {
public:
    AutopilotService(std::shared_ptr<domain::CalendarProvider> calendar,
                     std::shared_ptr<domain::KeyValueStore> store,
                     std::shared_ptr<domain::NotificationDispatcher> notifications,
                     domain::AutopilotSettings settings,
                     domain::UserPreferences prefs);

    /**
     * @brief Schedules walks for `target`. Runs at most once per date unless forced.
     *
     * A forced run replaces the date's walks and deletes the calendar events they created.
     * Events that cannot be deleted are kept in undeletedEventIds() for retryFailedCommits().
     * Under SuggestOnly the walks are stored as suggestions and nothing reaches the calendar.
     * @param extraBusy Activities already scheduled for the date.
     */
    AutopilotRunResult runNightly(const domain::CivilDate& target,
                                  const std::vector<domain::PlannedActivity>& extraBusy = {},
                                  bool force = false);

    /**
     * @brief Approves a pending walk and writes it to the calendar.
     * A failed write leaves the walk pending with lastError set.
     * @throws std::invalid_argument for an unknown, suggested or non-pending walk.
     */
    domain::AutopilotWalk approve(const std::string& walkId);

    /**
     * @brief Marks a walk rejected and deletes its calendar event.
     * @throws std::invalid_argument for an unknown or suggested walk.
     */
    domain::AutopilotWalk reject(const std::string& walkId);

    /**
     * @brief Moves a walk to `newStart` on the same day and approves it there.
     *
     * The walk's id follows its new start. A rejected walk already holding that start is dropped.
     * @throws std::invalid_argument for an unknown, suggested or rejected walk, a start on
     *         another day, or a start another active walk of the day already holds.
     */
    domain::AutopilotWalk adjustTime(const std::string& walkId, const domain::Instant& newStart);

    /** @brief Retries calendar writes and deletions that failed earlier. Returns the remaining errors. */
    std::vector<std::string> retryFailedCommits();

    /** @brief Drops walks older than the retention period. Returns how many were dropped. */
    int collectGarbage(const domain::CivilDate& today);

    std::vector<domain::AutopilotWalk> walksFor(const domain::CivilDate& date) const;
    /** @brief Walks waiting for approval. Suggestions are never listed. */
    std::vector<domain::AutopilotWalk> pendingWalks() const;
    std::optional<domain::AutopilotWalk> findWalk(const std::string& walkId) const;
    std::optional<domain::CivilDate> lastScheduledDate() const;
    std::vector<std::string> undeletedEventIds() const;

    /**
     * @brief Walk proposal for the gap after a meeting ends.
     * @return nullopt when the gap is shorter than 10 minutes or falls on a meal.
     */
    std::optional<domain::AutopilotWalk> suggestPostMeetingWalk(
        const domain::Instant& meetingEnd,
        const std::vector<domain::CalendarMeeting>& todaysEvents) const;

    /** @brief Five-minute break after a long sitting stretch. */
    domain::AutopilotWalk suggestSittingBreak(const domain::Instant& now) const;

    void updateSettings(const domain::AutopilotSettings& settings, const domain::UserPreferences& prefs);
    domain::AutopilotSettings settings() const;

private:
    bool commit(domain::AutopilotWalk& walk, int alarmOffsetMinutes);
    bool removeEvent(const std::string& eventId);
    domain::AutopilotWalk* findLocked(const std::string& walkId);
    domain::AutopilotWalk editableLocked(const std::string& walkId, const char* action);
    void storeLocked(const std::string& walkId, const domain::AutopilotWalk& walk);
    void persistLocked();

    static std::string WalkId(const domain::CivilDate& date, const domain::Instant& start);

    std::shared_ptr<domain::CalendarProvider> m_calendar;
    std::shared_ptr<domain::KeyValueStore> m_store;
    std::shared_ptr<domain::NotificationDispatcher> m_notifications;
    domain::AutopilotSettings m_settings;
    domain::UserPreferences m_prefs;
    domain::scheduling::AutopilotSlotPicker m_picker;

    domain::AutopilotLedger m_ledger;
    mutable std::mutex m_mutex;   ///< Ledger and settings. Never held across a calendar call.
    std::mutex m_writeMutex;      ///< Serializes mutations, including their calendar calls.
};

} // namespace moveslot::application
