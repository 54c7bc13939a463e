/**
 * @file StateCodec.cpp
 * @brief Implementation of StateCodec.
 */

#include "infrastructure/StateCodec.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace moveslot::infrastructure {

using json = nlohmann::json;
using namespace moveslot::domain;

namespace {

template <typename T, typename Fn>
std::optional<T> DecodeWith(const std::string& text, const char* what, Fn fn) {
    try {
        return fn(json::parse(text));
    } catch (const std::exception& e) {
        std::cerr << "[StateCodec] Cannot decode " << what << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

template <typename T>
T Require(const std::optional<T>& value, const std::string& raw) {
    if (!value) throw std::runtime_error("unknown enum value '" + raw + "'");
    return *value;
}

json InstantToJson(const std::optional<Instant>& t) {
    if (!t) return nullptr;
    return ToEpochSeconds(*t);
}

std::optional<Instant> InstantFromJson(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return FromEpochSeconds(j[key].get<long long>());
}

CivilDate DateFromJson(const json& j) {
    std::string raw = j.get<std::string>();
    auto date = CivilDate::Parse(raw);
    if (!date) throw std::runtime_error("malformed date '" + raw + "'");
    return *date;
}

std::optional<CivilDate> OptionalDate(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return DateFromJson(j[key]);
}

json WalkabilityToJson(const WalkabilityAssessment& a) {
    return {
        {"meeting_id", a.meetingId}, {"title", a.title}, {"start", ToEpochSeconds(a.start)},
        {"duration", a.durationMinutes}, {"attendees", a.attendeeCount},
        {"one_on_one", a.isOneOnOne}, {"score", a.score}, {"recommended", a.isRecommended},
        {"estimated_steps", a.estimatedSteps}, {"reason", a.reason}
    };
}

WalkabilityAssessment WalkabilityFromJson(const json& j) {
    WalkabilityAssessment a;
    a.meetingId = j.at("meeting_id").get<std::string>();
    a.title = j.value("title", "");
    a.start = FromEpochSeconds(j.at("start").get<long long>());
    a.durationMinutes = j.value("duration", 0);
    a.attendeeCount = j.value("attendees", 0);
    a.isOneOnOne = j.value("one_on_one", false);
    a.score = j.value("score", 0.0);
    a.isRecommended = j.value("recommended", false);
    a.estimatedSteps = j.value("estimated_steps", 0);
    a.reason = j.value("reason", "");
    return a;
}

json WalkToJson(const AutopilotWalk& w) {
    json j = {
        {"id", w.id}, {"date", w.date.toString()}, {"start", ToEpochSeconds(w.startTime)},
        {"duration", w.durationMinutes}, {"type", WalkTypeToString(w.type)},
        {"state", ApprovalStateToString(w.approvalState)},
        {"event_id", w.calendarEventId ? json(*w.calendarEventId) : json(nullptr)}
    };
    if (!w.lastError.empty()) j["last_error"] = w.lastError;
    if (w.suggestionOnly) j["suggestion_only"] = true;
    return j;
}

AutopilotWalk WalkFromJson(const json& j) {
    AutopilotWalk w;
    w.id = j.at("id").get<std::string>();
    w.date = DateFromJson(j.at("date"));
    w.startTime = FromEpochSeconds(j.at("start").get<long long>());
    w.durationMinutes = j.at("duration").get<int>();
    std::string type = j.value("type", "standard");
    w.type = Require(WalkTypeFromString(type), type);
    std::string state = j.value("state", "pending");
    w.approvalState = Require(ApprovalStateFromString(state), state);
    if (j.contains("event_id") && j["event_id"].is_string()) {
        w.calendarEventId = j["event_id"].get<std::string>();
    }
    w.lastError = j.value("last_error", "");
    w.suggestionOnly = j.value("suggestion_only", false);
    return w;
}

} // namespace

// --- Patterns ---

std::string StateCodec::Encode(const UserActivityPatterns& p) {
    json times = json::array();
    for (const auto& t : p.consistentWalkTimes) {
        times.push_back({{"hour", t.hour}, {"consistency", t.consistency}});
    }
    json j = {
        {"average_daily_steps", p.averageDailySteps},
        {"weekday_average", p.weekdayAverage},
        {"weekend_average", p.weekendAverage},
        {"best_performing_days", p.bestPerformingDays},
        {"peak_activity_hours", p.peakActivityHours},
        {"typical_walk_duration", p.typicalWalkDuration},
        {"steps_per_minute_walking", p.stepsPerMinuteWalking},
        {"goal_achievement_rate", p.goalAchievementRate},
        {"workout_day_rate", p.workoutDayRate},
        {"consistent_walk_times", times},
        {"last_updated", InstantToJson(p.lastUpdated)}
    };
    return j.dump();
}

std::optional<UserActivityPatterns> StateCodec::DecodePatterns(const std::string& text) {
    return DecodeWith<UserActivityPatterns>(text, "activity patterns", [](const json& j) {
        UserActivityPatterns p;
        p.averageDailySteps = j.value("average_daily_steps", p.averageDailySteps);
        p.weekdayAverage = j.value("weekday_average", p.weekdayAverage);
        p.weekendAverage = j.value("weekend_average", p.weekendAverage);
        p.bestPerformingDays = j.value("best_performing_days", p.bestPerformingDays);
        p.peakActivityHours = j.value("peak_activity_hours", p.peakActivityHours);
        p.typicalWalkDuration = j.value("typical_walk_duration", p.typicalWalkDuration);
        p.stepsPerMinuteWalking = j.value("steps_per_minute_walking", p.stepsPerMinuteWalking);
        p.goalAchievementRate = j.value("goal_achievement_rate", p.goalAchievementRate);
        p.workoutDayRate = j.value("workout_day_rate", p.workoutDayRate);
        if (j.contains("consistent_walk_times")) {
            p.consistentWalkTimes.clear();
            for (const auto& t : j["consistent_walk_times"]) {
                p.consistentWalkTimes.push_back({t.at("hour").get<int>(), t.at("consistency").get<double>()});
            }
        }
        p.lastUpdated = InstantFromJson(j, "last_updated");
        return p;
    });
}

// --- Adherence ---

std::string StateCodec::Encode(const PlanAdherence& a) {
    json slots = json::object();
    for (const auto& [bucket, rate] : a.bestTimeSlots) {
        slots[TimeOfDayToString(bucket)] = rate;
    }
    json types = json::object();
    for (const auto& [type, rate] : a.typeCompletionRates) {
        types[ActivityTypeToString(type)] = rate;
    }
    json j = {
        {"total_plans_generated", a.totalPlansGenerated},
        {"activities_completed", a.activitiesCompleted},
        {"activities_skipped", a.activitiesSkipped},
        {"best_time_slots", slots},
        {"type_completion_rates", types},
        {"average_completion_rate", a.averageCompletionRate},
        {"preferred_walk_duration", a.preferredWalkDuration},
        {"last_updated", InstantToJson(a.lastUpdated)}
    };
    return j.dump();
}

std::optional<PlanAdherence> StateCodec::DecodeAdherence(const std::string& text) {
    return DecodeWith<PlanAdherence>(text, "plan adherence", [](const json& j) {
        PlanAdherence a;
        a.totalPlansGenerated = j.value("total_plans_generated", 0);
        a.activitiesCompleted = j.value("activities_completed", 0);
        a.activitiesSkipped = j.value("activities_skipped", 0);
        if (j.contains("best_time_slots")) {
            for (auto it = j["best_time_slots"].begin(); it != j["best_time_slots"].end(); ++it) {
                a.bestTimeSlots[Require(TimeOfDayFromString(it.key()), it.key())] = it.value().get<double>();
            }
        }
        if (j.contains("type_completion_rates")) {
            for (auto it = j["type_completion_rates"].begin(); it != j["type_completion_rates"].end(); ++it) {
                a.typeCompletionRates[Require(ActivityTypeFromString(it.key()), it.key())] = it.value().get<double>();
            }
        }
        a.averageCompletionRate = j.value("average_completion_rate", a.averageCompletionRate);
        a.preferredWalkDuration = j.value("preferred_walk_duration", a.preferredWalkDuration);
        a.lastUpdated = InstantFromJson(j, "last_updated");
        return a;
    });
}

// --- Streak ---

std::string StateCodec::Encode(const StreakState& s) {
    json j = {
        {"current", s.currentStreak},
        {"longest", s.longestStreak},
        {"last_goal_date", s.lastGoalDate ? json(s.lastGoalDate->toString()) : json(nullptr)}
    };
    return j.dump();
}

std::optional<StreakState> StateCodec::DecodeStreak(const std::string& text) {
    return DecodeWith<StreakState>(text, "streak", [](const json& j) {
        StreakState s;
        s.currentStreak = std::max(0, j.value("current", 0));
        s.longestStreak = std::max(s.currentStreak, j.value("longest", 0));
        s.lastGoalDate = OptionalDate(j, "last_goal_date");
        return s;
    });
}

// --- Autopilot ---

std::string StateCodec::Encode(const AutopilotLedger& ledger) {
    json walks = json::array();
    for (const auto& w : ledger.walks) walks.push_back(WalkToJson(w));
    json j = {
        {"walks", walks},
        {"last_scheduled_date", ledger.lastScheduledDate ? json(ledger.lastScheduledDate->toString()) : json(nullptr)},
        {"undeleted_event_ids", ledger.undeletedEventIds}
    };
    return j.dump();
}

std::optional<AutopilotLedger> StateCodec::DecodeAutopilot(const std::string& text) {
    return DecodeWith<AutopilotLedger>(text, "autopilot ledger", [](const json& j) {
        AutopilotLedger ledger;
        for (const auto& w : j.value("walks", json::array())) {
            ledger.walks.push_back(WalkFromJson(w));
        }
        ledger.lastScheduledDate = OptionalDate(j, "last_scheduled_date");
        for (const auto& id : j.value("undeleted_event_ids", json::array())) {
            ledger.undeletedEventIds.push_back(id.get<std::string>());
        }
        return ledger;
    });
}

// --- Schedule ---

std::string StateCodec::Encode(const std::vector<ScheduledActivity>& activities) {
    json arr = json::array();
    for (const auto& a : activities) {
        arr.push_back({
            {"id", a.id}, {"type", ActivityTypeToString(a.type)},
            {"workout_type", a.workoutType ? json(WorkoutTypeToString(*a.workoutType)) : json(nullptr)},
            {"title", a.title}, {"start", FormatClockMinutes(a.startMinutes)},
            {"duration", a.durationMinutes}, {"recurrence", RecurrenceToString(a.recurrence)},
            {"start_date", a.startDate.toString()},
            {"end_date", a.endDate ? json(a.endDate->toString()) : json(nullptr)},
            {"active", a.isActive}
        });
    }
    return arr.dump();
}

std::optional<std::vector<ScheduledActivity>> StateCodec::DecodeSchedule(const std::string& text) {
    return DecodeWith<std::vector<ScheduledActivity>>(text, "scheduled activities", [](const json& j) {
        std::vector<ScheduledActivity> out;
        for (const auto& item : j) {
            ScheduledActivity a;
            a.id = item.at("id").get<std::string>();
            std::string type = item.value("type", "scheduled_walk");
            a.type = Require(ActivityTypeFromString(type), type);
            if (item.contains("workout_type") && item["workout_type"].is_string()) {
                std::string w = item["workout_type"].get<std::string>();
                a.workoutType = Require(WorkoutTypeFromString(w), w);
            }
            a.title = item.value("title", "");
            std::string start = item.at("start").get<std::string>();
            a.startMinutes = Require(ParseClockMinutes(start), start);
            a.durationMinutes = item.value("duration", 30);
            std::string rec = item.value("recurrence", "once");
            a.recurrence = Require(RecurrenceFromString(rec), rec);
            a.startDate = DateFromJson(item.at("start_date"));
            a.endDate = OptionalDate(item, "end_date");
            a.isActive = item.value("active", true);
            out.push_back(std::move(a));
        }
        return out;
    });
}

std::string StateCodec::Encode(const std::vector<ActivityTimeStats>& stats) {
    json arr = json::array();
    for (const auto& s : stats) {
        arr.push_back({{"type", ActivityTypeToString(s.type)}, {"weekday", s.weekday}, {"hour", s.hour},
                       {"successes", s.successes}, {"attempts", s.attempts}});
    }
    return arr.dump();
}

std::optional<std::vector<ActivityTimeStats>> StateCodec::DecodeTimeStats(const std::string& text) {
    return DecodeWith<std::vector<ActivityTimeStats>>(text, "activity time stats", [](const json& j) {
        std::vector<ActivityTimeStats> out;
        for (const auto& item : j) {
            ActivityTimeStats s;
            std::string type = item.at("type").get<std::string>();
            s.type = Require(ActivityTypeFromString(type), type);
            s.weekday = item.at("weekday").get<int>();
            s.hour = item.at("hour").get<int>();
            s.successes = item.value("successes", 0);
            s.attempts = item.value("attempts", 0);
            out.push_back(s);
        }
        return out;
    });
}

// --- Workout rotation ---

std::string StateCodec::Encode(const WorkoutRotationState& r) {
    json j = {
        {"last_workout", r.lastWorkout ? json(WorkoutTypeToString(*r.lastWorkout)) : json(nullptr)},
        {"week_start", r.weekStart ? json(r.weekStart->toString()) : json(nullptr)},
        {"sessions_this_week", r.sessionsThisWeek}
    };
    return j.dump();
}

std::optional<WorkoutRotationState> StateCodec::DecodeRotation(const std::string& text) {
    return DecodeWith<WorkoutRotationState>(text, "workout rotation", [](const json& j) {
        WorkoutRotationState r;
        if (j.contains("last_workout") && j["last_workout"].is_string()) {
            std::string w = j["last_workout"].get<std::string>();
            r.lastWorkout = Require(WorkoutTypeFromString(w), w);
        }
        r.weekStart = OptionalDate(j, "week_start");
        r.sessionsThisWeek = j.value("sessions_this_week", 0);
        return r;
    });
}

// --- Plan sync ---

std::string StateCodec::Encode(const SyncLedger& ledger) {
    json j = json::object();
    for (const auto& [date, ids] : ledger.eventIdsByDate) {
        j[date.toString()] = ids;
    }
    return j.dump();
}

std::optional<SyncLedger> StateCodec::DecodeSync(const std::string& text) {
    return DecodeWith<SyncLedger>(text, "plan sync ledger", [](const json& j) {
        SyncLedger ledger;
        for (auto it = j.begin(); it != j.end(); ++it) {
            auto date = CivilDate::Parse(it.key());
            if (!date) throw std::runtime_error("malformed date '" + it.key() + "'");
            ledger.eventIdsByDate[*date] = it.value().get<std::vector<std::string>>();
        }
        return ledger;
    });
}

// --- Plans ---

json StateCodec::ActivityToJson(const PlannedActivity& a) {
    return {
        {"id", a.id}, {"type", ActivityTypeToString(a.type)}, {"title", a.title},
        {"start", ToEpochSeconds(a.startTime)}, {"duration", a.durationMinutes},
        {"estimated_steps", a.estimatedSteps}, {"priority", PriorityToString(a.priority)},
        {"status", StatusToString(a.status)}, {"reason", a.reason}, {"ideal", a.isIdeal},
        {"workout_type", a.workoutType ? json(WorkoutTypeToString(*a.workoutType)) : json(nullptr)},
        {"event_id", a.calendarEventId ? json(*a.calendarEventId) : json(nullptr)}
    };
}

PlannedActivity StateCodec::ActivityFromJson(const json& j) {
    PlannedActivity a;
    a.id = j.at("id").get<std::string>();
    std::string type = j.at("type").get<std::string>();
    a.type = Require(ActivityTypeFromString(type), type);
    a.title = j.value("title", ActivityTypeDisplayName(a.type));
    a.startTime = FromEpochSeconds(j.at("start").get<long long>());
    a.durationMinutes = j.at("duration").get<int>();
    a.estimatedSteps = j.value("estimated_steps", 0);
    std::string priority = j.value("priority", "optional");
    a.priority = Require(PriorityFromString(priority), priority);
    std::string status = j.value("status", "planned");
    a.status = Require(StatusFromString(status), status);
    a.reason = j.value("reason", "");
    a.isIdeal = j.value("ideal", true);
    if (j.contains("workout_type") && j["workout_type"].is_string()) {
        std::string w = j["workout_type"].get<std::string>();
        a.workoutType = Require(WorkoutTypeFromString(w), w);
    }
    if (j.contains("event_id") && j["event_id"].is_string()) {
        a.calendarEventId = j["event_id"].get<std::string>();
    }
    return a;
}

std::string StateCodec::Encode(const DailyMovementPlan& plan) {
    json activities = json::array();
    for (const auto& a : plan.activities) activities.push_back(ActivityToJson(a));
    json meetings = json::array();
    for (const auto& m : plan.walkableMeetings) meetings.push_back(WalkabilityToJson(m));

    json j = {
        {"id", plan.id}, {"date", plan.date.toString()},
        {"target_steps", plan.targetSteps}, {"current_steps", plan.currentSteps},
        {"steps_needed", plan.stepsNeeded}, {"activities", activities},
        {"walkable_meetings", meetings}, {"planned_steps", plan.plannedSteps},
        {"remaining_gap", plan.remainingGap}, {"confidence", plan.confidence},
        {"reasoning", plan.reasoning}, {"epoch", plan.epoch},
        {"generated_at", ToEpochSeconds(plan.generatedAt)}
    };
    return j.dump();
}

std::optional<DailyMovementPlan> StateCodec::DecodePlan(const std::string& text) {
    return DecodeWith<DailyMovementPlan>(text, "movement plan", [](const json& j) {
        DailyMovementPlan plan;
        plan.id = j.at("id").get<std::string>();
        plan.date = DateFromJson(j.at("date"));
        plan.targetSteps = j.value("target_steps", 0);
        plan.currentSteps = j.value("current_steps", 0);
        plan.stepsNeeded = j.value("steps_needed", 0);
        for (const auto& a : j.value("activities", json::array())) {
            plan.activities.push_back(ActivityFromJson(a));
        }
        for (const auto& m : j.value("walkable_meetings", json::array())) {
            plan.walkableMeetings.push_back(WalkabilityFromJson(m));
        }
        plan.plannedSteps = j.value("planned_steps", 0);
        plan.remainingGap = j.value("remaining_gap", 0);
        plan.confidence = j.value("confidence", 0.0);
        plan.reasoning = j.value("reasoning", "");
        plan.epoch = j.value("epoch", 0LL);
        plan.generatedAt = FromEpochSeconds(j.value("generated_at", 0LL));
        return plan;
    });
}

// --- Calendar meetings ---

json StateCodec::MeetingToJson(const CalendarMeeting& m) {
    return {
        {"id", m.id}, {"title", m.title},
        {"start", FormatLocalDateTime(m.start)}, {"end", FormatLocalDateTime(m.end)},
        {"attendees", m.attendeeCount}, {"is_organizer", m.isOrganizer},
        {"all_day", m.isAllDay}, {"out_of_office", m.isOutOfOffice},
        {"location", m.location}, {"notes", m.notes}
    };
}

CalendarMeeting StateCodec::MeetingFromJson(const json& j) {
    CalendarMeeting m;
    m.id = j.at("id").get<std::string>();
    m.title = j.value("title", "");
    std::string start = j.at("start").get<std::string>();
    std::string end = j.at("end").get<std::string>();
    auto s = ParseLocalDateTime(start);
    auto e = ParseLocalDateTime(end);
    if (!s || !e) throw std::runtime_error("malformed event time in '" + m.id + "'");
    m.start = *s;
    m.end = *e;
    m.attendeeCount = j.value("attendees", 0);
    m.isOrganizer = j.value("is_organizer", false);
    m.isAllDay = j.value("all_day", false);
    m.isOutOfOffice = j.value("out_of_office", false);
    m.location = j.value("location", "");
    m.notes = j.value("notes", "");
    return m;
}

} // namespace moveslot::infrastructure
