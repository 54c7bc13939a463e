/**
 * @file AutopilotWalk.hpp
 * @brief Walks proposed by the nightly autopilot and the policy governing them.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "domain/time/LocalTime.hpp"

namespace moveslot::domain {

/**
 * @enum TrustLevel
 * @brief How much the autopilot may do without asking.
 */
enum class TrustLevel {
    FullAuto,       ///< Commit to calendar immediately.
    ConfirmFirst,   ///< Queue for approval and prompt the user.
    SuggestOnly     ///< Display only. Never touches the calendar.
};

enum class ApprovalState {
    Pending,
    Approved,
    Rejected
};

enum class AutopilotWalkType {
    Micro,      ///< <= 10 minutes
    Short,      ///< <= 20 minutes
    Standard
};

inline std::string TrustLevelToString(TrustLevel t) {
    switch (t) {
        case TrustLevel::FullAuto: return "full_auto";
        case TrustLevel::ConfirmFirst: return "confirm_first";
        case TrustLevel::SuggestOnly: return "suggest_only";
    }
    return "confirm_first";
}

inline std::optional<TrustLevel> TrustLevelFromString(const std::string& s) {
    if (s == "full_auto") return TrustLevel::FullAuto;
    if (s == "confirm_first") return TrustLevel::ConfirmFirst;
    if (s == "suggest_only") return TrustLevel::SuggestOnly;
    return std::nullopt;
}

inline std::string ApprovalStateToString(ApprovalState s) {
    switch (s) {
        case ApprovalState::Pending: return "pending";
        case ApprovalState::Approved: return "approved";
        case ApprovalState::Rejected: return "rejected";
    }
    return "pending";
}

inline std::optional<ApprovalState> ApprovalStateFromString(const std::string& s) {
    if (s == "pending") return ApprovalState::Pending;
    if (s == "approved") return ApprovalState::Approved;
    if (s == "rejected") return ApprovalState::Rejected;
    return std::nullopt;
}

inline AutopilotWalkType WalkTypeForDuration(int minutes) {
    if (minutes <= 10) return AutopilotWalkType::Micro;
    if (minutes <= 20) return AutopilotWalkType::Short;
    return AutopilotWalkType::Standard;
}

inline std::string WalkTypeToString(AutopilotWalkType t) {
    switch (t) {
        case AutopilotWalkType::Micro: return "micro";
        case AutopilotWalkType::Short: return "short";
        case AutopilotWalkType::Standard: return "standard";
    }
    return "standard";
}

inline std::optional<AutopilotWalkType> WalkTypeFromString(const std::string& s) {
    if (s == "micro") return AutopilotWalkType::Micro;
    if (s == "short") return AutopilotWalkType::Short;
    if (s == "standard") return AutopilotWalkType::Standard;
    return std::nullopt;
}

inline std::string WalkTypeTitle(AutopilotWalkType t) {
    switch (t) {
        case AutopilotWalkType::Micro: return "Quick Reset";
        case AutopilotWalkType::Short: return "Energy Boost";
        case AutopilotWalkType::Standard: return "Power Walk";
    }
    return "Walk";
}

/**
 * @struct AutopilotSettings
 * @brief User-tunable autopilot behaviour.
 */
struct AutopilotSettings {
    bool enabled = true;
    TrustLevel trustLevel = TrustLevel::ConfirmFirst;
    int targetWalksPerDay = 3;
    bool includeMicroWalks = true;
    int minWalkDuration = 15;
    int maxWalkDuration = 30;
    int alarmOffsetMinutes = 5;
    int retentionDays = 7;
};

/**
 * @struct AutopilotWalk
 * @brief One proposed walk. At most one non-rejected walk per (date, startTime).
 */
struct AutopilotWalk {
    std::string id;
    CivilDate date;
    Instant startTime;
    int durationMinutes = 0;
    AutopilotWalkType type = AutopilotWalkType::Standard;
    ApprovalState approvalState = ApprovalState::Pending;
    std::optional<std::string> calendarEventId;
    std::string lastError; ///< Non-empty when the last calendar commit failed.
    bool suggestionOnly = false; ///< Created under SuggestOnly. Never approved or written to the calendar.

    Instant endTime() const { return AddMinutes(startTime, durationMinutes); }
    std::string title() const { return WalkTypeTitle(type); }
};

/**
 * @struct AutopilotLedger
 * @brief Persisted autopilot state: every known walk plus the idempotency marker.
 */
struct AutopilotLedger {
    std::vector<AutopilotWalk> walks;
    std::optional<CivilDate> lastScheduledDate;
    std::vector<std::string> undeletedEventIds; ///< Calendar events whose removal failed. Retried.
};

} // namespace moveslot::domain
