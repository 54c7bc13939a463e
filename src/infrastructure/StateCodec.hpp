/**
 * @file StateCodec.hpp
 * @brief JSON encoding of planner state for the key-value store and file adapters.
 *
 * Decoders return nullopt (and log) on corrupt input so callers can fall back to defaults.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "domain/ActivityPatterns.hpp"
#include "domain/AutopilotWalk.hpp"
#include "domain/CalendarMeeting.hpp"
#include "domain/PlanSync.hpp"
#include "domain/PlannedActivity.hpp"
#include "domain/ScheduledActivity.hpp"
#include "domain/Streak.hpp"
#include "domain/WorkoutRotation.hpp"

namespace moveslot::infrastructure {

class StateCodec {
public:
    // Store keys.
    static constexpr const char* kPatternsKey = "activity_patterns";
    static constexpr const char* kAdherenceKey = "plan_adherence";
    static constexpr const char* kStreakKey = "streak";
    static constexpr const char* kAutopilotKey = "autopilot";
    static constexpr const char* kScheduleKey = "scheduled_activities";
    static constexpr const char* kTimeStatsKey = "activity_time_stats";
    static constexpr const char* kRotationKey = "workout_rotation";
    static constexpr const char* kSyncKey = "plan_sync";
    static std::string PlanKey(const domain::CivilDate& date) { return "plan/" + date.toString(); }

    static std::string Encode(const domain::UserActivityPatterns& patterns);
    static std::optional<domain::UserActivityPatterns> DecodePatterns(const std::string& text);

    static std::string Encode(const domain::PlanAdherence& adherence);
    static std::optional<domain::PlanAdherence> DecodeAdherence(const std::string& text);

    static std::string Encode(const domain::StreakState& streak);
    static std::optional<domain::StreakState> DecodeStreak(const std::string& text);

    static std::string Encode(const domain::AutopilotLedger& ledger);
    static std::optional<domain::AutopilotLedger> DecodeAutopilot(const std::string& text);

    static std::string Encode(const std::vector<domain::ScheduledActivity>& activities);
    static std::optional<std::vector<domain::ScheduledActivity>> DecodeSchedule(const std::string& text);

    static std::string Encode(const std::vector<domain::ActivityTimeStats>& stats);
    static std::optional<std::vector<domain::ActivityTimeStats>> DecodeTimeStats(const std::string& text);

    static std::string Encode(const domain::WorkoutRotationState& rotation);
    static std::optional<domain::WorkoutRotationState> DecodeRotation(const std::string& text);

    static std::string Encode(const domain::SyncLedger& ledger);
    static std::optional<domain::SyncLedger> DecodeSync(const std::string& text);

    static std::string Encode(const domain::DailyMovementPlan& plan);
    static std::optional<domain::DailyMovementPlan> DecodePlan(const std::string& text);

    static nlohmann::json MeetingToJson(const domain::CalendarMeeting& meeting);
    /** @brief Accepts "start"/"end" as "yyyy-MM-ddTHH:MM" local time. Throws on malformed input. */
    static domain::CalendarMeeting MeetingFromJson(const nlohmann::json& j);

    static nlohmann::json ActivityToJson(const domain::PlannedActivity& activity);
    static domain::PlannedActivity ActivityFromJson(const nlohmann::json& j);
};

} // namespace moveslot::infrastructure
