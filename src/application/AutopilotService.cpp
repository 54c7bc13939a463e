#include "application/AutopilotService.hpp"
#include "domain/scheduling/BusyIntervalBuilder.hpp"
#include "infrastructure/StateCodec.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace moveslot::application {

using namespace moveslot::domain;
using infrastructure::StateCodec;

namespace {
constexpr int kPostMeetingMinGap = 10;
constexpr int kPostMeetingBuffer = 5;
constexpr int kPostMeetingMaxWalk = 15;
constexpr int kOpenEndedWalk = 10;
constexpr int kSittingBreak = 5;

std::string EventNotes(const AutopilotWalk& walk) {
    return "Duration: " + std::to_string(walk.durationMinutes) + " minutes\nType: " +
           WalkTypeToString(walk.type);
}

AutopilotWalk MakeWalk(const CivilDate& date, const Instant& start, int duration) {
    AutopilotWalk walk;
    walk.date = date;
    walk.startTime = start;
    walk.durationMinutes = duration;
    walk.type = WalkTypeForDuration(duration);
    return walk;
}
}

AutopilotService::AutopilotService(std::shared_ptr<CalendarProvider> calendar,
                                   std::shared_ptr<KeyValueStore> store,
                                   std::shared_ptr<NotificationDispatcher> notifications,
                                   AutopilotSettings settings,
                                   UserPreferences prefs)
    : m_calendar(std::move(calendar)),
      m_store(std::move(store)),
      m_notifications(std::move(notifications)),
      m_settings(settings),
      m_prefs(std::move(prefs)) {
    if (auto raw = m_store->get(StateCodec::kAutopilotKey)) {
        if (auto ledger = StateCodec::DecodeAutopilot(*raw)) {
            m_ledger = std::move(*ledger);
        } else {
            std::cerr << "[Autopilot] Stored walks unreadable, starting empty." << std::endl;
        }
    }
}

std::string AutopilotService::WalkId(const CivilDate& date, const Instant& start) {
    std::string clock = FormatClock(start);
    clock.erase(std::remove(clock.begin(), clock.end(), ':'), clock.end());
    return "autopilot-" + date.toString() + "-" + clock;
}

AutopilotRunResult AutopilotService::runNightly(const CivilDate& target,
                                                const std::vector<PlannedActivity>& extraBusy,
                                                bool force) {
    std::lock_guard<std::mutex> writer(m_writeMutex);
    AutopilotRunResult result;

    AutopilotSettings settings;
    UserPreferences prefs;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        settings = m_settings;
        prefs = m_prefs;
        if (!settings.enabled) {
            result.skipped = true;
            return result;
        }
        if (!force && m_ledger.lastScheduledDate && *m_ledger.lastScheduledDate == target) {
            std::cout << "[Autopilot] Already scheduled " << target.toString() << ", skipping." << std::endl;
            result.skipped = true;
            for (const auto& w : m_ledger.walks) {
                if (w.date == target) result.walks.push_back(w);
            }
            return result;
        }
    }

    std::vector<CalendarMeeting> meetings;
    try {
        meetings = m_calendar->fetchEvents(target);
    } catch (const std::exception& e) {
        std::cerr << "[Autopilot] Calendar unavailable: " << e.what() << std::endl;
        result.errors.push_back(std::string("Calendar unavailable: ") + e.what());
    }

    auto busy = scheduling::ToIntervals(scheduling::BuildBusyIntervals(target, meetings, extraBusy));
    std::vector<scheduling::PickedWalk> picks = m_picker.pick(target, busy, prefs, settings);

    std::vector<std::string> superseded;
    std::vector<AutopilotWalk> fresh;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto& walks = m_ledger.walks;
        if (force) {
            for (const auto& w : walks) {
                if (w.date == target && w.calendarEventId) superseded.push_back(*w.calendarEventId);
            }
            walks.erase(std::remove_if(walks.begin(), walks.end(),
                                       [&target](const AutopilotWalk& w) { return w.date == target; }),
                        walks.end());
        }

        for (const auto& pick : picks) {
            bool taken = std::any_of(walks.begin(), walks.end(), [&](const AutopilotWalk& w) {
                return w.date == target && w.startTime == pick.start;
            });
            if (taken) continue;

            AutopilotWalk walk = MakeWalk(target, pick.start, pick.durationMinutes);
            walk.type = pick.type;
            walk.id = WalkId(target, pick.start);
            walk.suggestionOnly = settings.trustLevel == TrustLevel::SuggestOnly;
            fresh.push_back(walk);
        }
    }

    // Calendar traffic happens without m_mutex so readers are never stuck behind it.
    std::vector<std::string> undeleted;
    for (const auto& eventId : superseded) {
        if (!removeEvent(eventId)) {
            result.errors.push_back("Failed to delete superseded event " + eventId);
            undeleted.push_back(eventId);
        }
    }

    std::vector<AutopilotWalk> committed;
    for (auto& walk : fresh) {
        switch (settings.trustLevel) {
            case TrustLevel::FullAuto:
                if (commit(walk, settings.alarmOffsetMinutes)) {
                    committed.push_back(walk);
                } else {
                    result.errors.push_back(walk.lastError);
                }
                break;
            case TrustLevel::ConfirmFirst:
                m_notifications->scheduleApprovalPrompt(walk);
                break;
            case TrustLevel::SuggestOnly:
                break;
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_ledger.undeletedEventIds.insert(m_ledger.undeletedEventIds.end(), undeleted.begin(), undeleted.end());
        m_ledger.walks.insert(m_ledger.walks.end(), fresh.begin(), fresh.end());
        m_ledger.lastScheduledDate = target;
        persistLocked();
    }
    result.walks = fresh;

    if (settings.trustLevel == TrustLevel::FullAuto && !committed.empty()) {
        m_notifications->scheduleSummary(committed);
    }

    std::cout << "[Autopilot] " << target.toString() << ": " << result.walks.size() << " walks ("
              << TrustLevelToString(settings.trustLevel) << "), " << result.errors.size() << " errors" << std::endl;
    return result;
}

bool AutopilotService::commit(AutopilotWalk& walk, int alarmOffsetMinutes) {
    std::optional<std::string> eventId;
    try {
        eventId = m_calendar->createEvent(walk.title(), walk.startTime, walk.endTime(), EventNotes(walk),
                                          alarmOffsetMinutes);
    } catch (const std::exception& e) {
        std::cerr << "[Autopilot] Calendar write threw: " << e.what() << std::endl;
    }

    if (!eventId) {
        walk.lastError = "Failed to create calendar event for " + walk.title() + " at " + FormatClock(walk.startTime);
        std::cerr << "[Autopilot] " << walk.lastError << std::endl;
        return false;
    }
    walk.calendarEventId = *eventId;
    walk.approvalState = ApprovalState::Approved;
    walk.lastError.clear();
    return true;
}

bool AutopilotService::removeEvent(const std::string& eventId) {
    try {
        if (m_calendar->deleteEvent(eventId)) return true;
    } catch (const std::exception& e) {
        std::cerr << "[Autopilot] Calendar delete threw: " << e.what() << std::endl;
    }
    std::cerr << "[Autopilot] Could not delete event " << eventId << std::endl;
    return false;
}

AutopilotWalk* AutopilotService::findLocked(const std::string& walkId) {
    for (auto& w : m_ledger.walks) {
        if (w.id == walkId) return &w;
    }
    return nullptr;
}

AutopilotWalk AutopilotService::editableLocked(const std::string& walkId, const char* action) {
    AutopilotWalk* walk = findLocked(walkId);
    if (!walk) throw std::invalid_argument("Unknown walk: " + walkId);
    if (walk->suggestionOnly) {
        throw std::invalid_argument(std::string("Suggested walks cannot be ") + action + ": " + walkId);
    }
    return *walk;
}

void AutopilotService::storeLocked(const std::string& walkId, const AutopilotWalk& walk) {
    AutopilotWalk* stored = findLocked(walkId);
    // Every mutation holds m_writeMutex, so nothing removes the walk in between.
    if (!stored) throw std::logic_error("Walk vanished during update: " + walkId);
    *stored = walk;
}

void AutopilotService::persistLocked() {
    m_store->put(StateCodec::kAutopilotKey, StateCodec::Encode(m_ledger));
}

AutopilotWalk AutopilotService::approve(const std::string& walkId) {
    std::lock_guard<std::mutex> writer(m_writeMutex);
    AutopilotWalk walk;
    int alarmOffset = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        walk = editableLocked(walkId, "approved");
        if (walk.approvalState != ApprovalState::Pending) {
            throw std::invalid_argument("Walk is not pending: " + walkId);
        }
        alarmOffset = m_settings.alarmOffsetMinutes;
    }

    commit(walk, alarmOffset);

    std::lock_guard<std::mutex> lock(m_mutex);
    storeLocked(walkId, walk);
    persistLocked();
    return walk;
}

AutopilotWalk AutopilotService::reject(const std::string& walkId) {
    std::lock_guard<std::mutex> writer(m_writeMutex);
    AutopilotWalk walk;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        walk = editableLocked(walkId, "rejected");
    }

    std::optional<std::string> undeleted;
    if (walk.calendarEventId) {
        if (!removeEvent(*walk.calendarEventId)) undeleted = walk.calendarEventId;
        walk.calendarEventId.reset();
    }
    walk.approvalState = ApprovalState::Rejected;
    walk.lastError.clear();

    std::lock_guard<std::mutex> lock(m_mutex);
    storeLocked(walkId, walk);
    if (undeleted) m_ledger.undeletedEventIds.push_back(*undeleted);
    persistLocked();
    return walk;
}

AutopilotWalk AutopilotService::adjustTime(const std::string& walkId, const Instant& newStart) {
    std::lock_guard<std::mutex> writer(m_writeMutex);
    AutopilotWalk walk;
    int alarmOffset = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        walk = editableLocked(walkId, "moved");
        if (walk.approvalState == ApprovalState::Rejected) {
            throw std::invalid_argument("Walk was rejected: " + walkId);
        }
        if (DateOf(newStart) != walk.date) {
            throw std::invalid_argument("Walk cannot move to another day: " + walkId);
        }
        for (const auto& other : m_ledger.walks) {
            if (other.id == walkId || other.date != walk.date || other.approvalState == ApprovalState::Rejected) {
                continue;
            }
            if (other.startTime == newStart) {
                throw std::invalid_argument("Another walk already starts at " + FormatClock(newStart) + ": " + other.id);
            }
        }
        alarmOffset = m_settings.alarmOffsetMinutes;
    }

    std::optional<std::string> undeleted;
    if (walk.calendarEventId) {
        if (!removeEvent(*walk.calendarEventId)) undeleted = walk.calendarEventId;
        walk.calendarEventId.reset();
    }
    walk.startTime = newStart;
    walk.id = WalkId(walk.date, newStart);
    walk.approvalState = ApprovalState::Pending;
    walk.lastError.clear();
    commit(walk, alarmOffset);

    std::lock_guard<std::mutex> lock(m_mutex);
    auto& walks = m_ledger.walks;
    // A rejected walk at the new start gives up its id.
    walks.erase(std::remove_if(walks.begin(), walks.end(), [&](const AutopilotWalk& w) {
                    return w.id == walk.id && w.id != walkId;
                }),
                walks.end());
    storeLocked(walkId, walk);
    if (undeleted) m_ledger.undeletedEventIds.push_back(*undeleted);
    persistLocked();
    return walk;
}

std::vector<std::string> AutopilotService::retryFailedCommits() {
    std::lock_guard<std::mutex> writer(m_writeMutex);
    std::vector<AutopilotWalk> uncommitted;
    std::vector<std::string> toDelete;
    int alarmOffset = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& walk : m_ledger.walks) {
            if (walk.lastError.empty() || walk.calendarEventId || walk.suggestionOnly ||
                walk.approvalState == ApprovalState::Rejected) {
                continue;
            }
            uncommitted.push_back(walk);
        }
        toDelete = m_ledger.undeletedEventIds;
        alarmOffset = m_settings.alarmOffsetMinutes;
    }
    std::vector<std::string> errors;
    if (uncommitted.empty() && toDelete.empty()) return errors;

    std::vector<std::string> stillUndeleted;
    for (const auto& eventId : toDelete) {
        if (!removeEvent(eventId)) {
            stillUndeleted.push_back(eventId);
            errors.push_back("Failed to delete calendar event " + eventId);
        }
    }
    for (auto& walk : uncommitted) {
        if (!commit(walk, alarmOffset)) errors.push_back(walk.lastError);
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& walk : uncommitted) storeLocked(walk.id, walk);
    m_ledger.undeletedEventIds = stillUndeleted;
    persistLocked();
    return errors;
}

int AutopilotService::collectGarbage(const CivilDate& today) {
    std::lock_guard<std::mutex> writer(m_writeMutex);
    std::lock_guard<std::mutex> lock(m_mutex);
    const CivilDate cutoff = today.addDays(-m_settings.retentionDays);
    auto& walks = m_ledger.walks;
    auto before = walks.size();
    walks.erase(std::remove_if(walks.begin(), walks.end(),
                               [&cutoff](const AutopilotWalk& w) { return w.date < cutoff; }),
                walks.end());
    int dropped = static_cast<int>(before - walks.size());
    if (dropped > 0) {
        persistLocked();
        std::cout << "[Autopilot] Dropped " << dropped << " walks older than " << cutoff.toString() << std::endl;
    }
    return dropped;
}

std::vector<AutopilotWalk> AutopilotService::walksFor(const CivilDate& date) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<AutopilotWalk> out;
    for (const auto& w : m_ledger.walks) {
        if (w.date == date) out.push_back(w);
    }
    return out;
}

std::vector<AutopilotWalk> AutopilotService::pendingWalks() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<AutopilotWalk> out;
    for (const auto& w : m_ledger.walks) {
        if (w.approvalState == ApprovalState::Pending && !w.suggestionOnly) out.push_back(w);
    }
    return out;
}

std::optional<AutopilotWalk> AutopilotService::findWalk(const std::string& walkId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& w : m_ledger.walks) {
        if (w.id == walkId) return w;
    }
    return std::nullopt;
}

std::vector<std::string> AutopilotService::undeletedEventIds() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_ledger.undeletedEventIds;
}

std::optional<CivilDate> AutopilotService::lastScheduledDate() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_ledger.lastScheduledDate;
}

std::optional<AutopilotWalk> AutopilotService::suggestPostMeetingWalk(
    const Instant& meetingEnd,
    const std::vector<CalendarMeeting>& todaysEvents) const {
    UserPreferences prefs;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        prefs = m_prefs;
    }
    const CivilDate date = DateOf(meetingEnd);

    std::optional<Instant> nextStart;
    for (const auto& e : todaysEvents) {
        if (!e.isRealMeeting() || e.start < meetingEnd) continue;
        if (!nextStart || e.start < *nextStart) nextStart = e.start;
    }

    if (!nextStart) {
        AutopilotWalk walk = MakeWalk(date, meetingEnd, kOpenEndedWalk);
        walk.id = WalkId(date, meetingEnd);
        return walk;
    }

    int gap = MinutesBetween(meetingEnd, *nextStart);
    if (gap < kPostMeetingMinGap || prefs.isDuringMeal(meetingEnd)) return std::nullopt;

    AutopilotWalk walk = MakeWalk(date, meetingEnd, std::min(gap - kPostMeetingBuffer, kPostMeetingMaxWalk));
    walk.id = WalkId(date, meetingEnd);
    return walk;
}

AutopilotWalk AutopilotService::suggestSittingBreak(const Instant& now) const {
    AutopilotWalk walk = MakeWalk(DateOf(now), now, kSittingBreak);
    walk.id = WalkId(walk.date, now);
    return walk;
}

void AutopilotService::updateSettings(const AutopilotSettings& settings, const UserPreferences& prefs) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_settings = settings;
    m_prefs = prefs;
}

AutopilotSettings AutopilotService::settings() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_settings;
}

} // namespace moveslot::application
