/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace moveslot::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

constexpr const char* kSettingsFile = "settings.json";

void ReadClock(const json& j, const char* key, int& target) {
    if (!j.contains(key) || !j[key].is_string()) return;
    if (auto minutes = domain::ParseClockMinutes(j[key].get<std::string>())) {
        target = *minutes;
    } else {
        std::cerr << "[ConfigLoader] Ignoring malformed time for '" << key << "'" << std::endl;
    }
}

template <typename T>
void ReadValue(const json& j, const char* key, T& target) {
    if (j.contains(key) && !j[key].is_null()) {
        target = j[key].get<T>();
    }
}

void ReadPreferred(const json& j, const char* key, domain::PreferredTime& target) {
    if (!j.contains(key) || !j[key].is_string()) return;
    if (auto p = domain::PreferredTimeFromString(j[key].get<std::string>())) {
        target = *p;
    }
}

AppConfig FromJson(const json& j) {
    AppConfig cfg;
    auto& prefs = cfg.preferences;

    ReadClock(j, "wake_time", prefs.wakeMinutes);
    ReadClock(j, "sleep_time", prefs.sleepMinutes);
    if (j.contains("meals") && j["meals"].is_object()) {
        const auto& meals = j["meals"];
        ReadClock(meals, "breakfast", prefs.breakfastMinutes);
        ReadClock(meals, "lunch", prefs.lunchMinutes);
        ReadClock(meals, "dinner", prefs.dinnerMinutes);
    }
    ReadValue(j, "daily_step_goal", prefs.dailyStepGoal);
    ReadPreferred(j, "preferred_walk_time", prefs.preferredWalkTime);
    ReadPreferred(j, "preferred_gym_time", prefs.preferredGymTime);
    ReadValue(j, "workout_duration_minutes", prefs.workoutDurationMinutes);
    ReadValue(j, "gym_days_per_week", prefs.gymDaysPerWeek);

    if (j.contains("autopilot") && j["autopilot"].is_object()) {
        const auto& a = j["autopilot"];
        ReadValue(a, "enabled", cfg.autopilot.enabled);
        if (a.contains("trust_level") && a["trust_level"].is_string()) {
            if (auto t = domain::TrustLevelFromString(a["trust_level"].get<std::string>())) {
                cfg.autopilot.trustLevel = *t;
            }
        }
        ReadValue(a, "walks_per_day", cfg.autopilot.targetWalksPerDay);
        ReadValue(a, "include_micro_walks", cfg.autopilot.includeMicroWalks);
        ReadValue(a, "min_walk_minutes", cfg.autopilot.minWalkDuration);
        ReadValue(a, "max_walk_minutes", cfg.autopilot.maxWalkDuration);
        ReadValue(a, "alarm_offset_minutes", cfg.autopilot.alarmOffsetMinutes);
        ReadValue(a, "retention_days", cfg.autopilot.retentionDays);
    }

    if (j.contains("calendar") && j["calendar"].is_object()) {
        const auto& c = j["calendar"];
        if (c.contains("source") && c["source"].is_string()) {
            cfg.calendar.kind = c["source"].get<std::string>() == "http" ? CalendarSourceKind::Http
                                                                          : CalendarSourceKind::File;
        }
        ReadValue(c, "path", cfg.calendar.path);
        ReadValue(c, "host", cfg.calendar.host);
        ReadValue(c, "port", cfg.calendar.port);
    }

    ReadValue(j, "activity_data", cfg.activityDataPath);
    ReadValue(j, "state_file", cfg.stateFile);
    ReadValue(j, "outbox_file", cfg.outboxFile);
    return cfg;
}

} // namespace

std::optional<AppConfig> ConfigLoader::Parse(const std::string& text) {
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            std::cerr << "[ConfigLoader] settings.json must contain an object" << std::endl;
            return std::nullopt;
        }
        return FromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
    }
    return std::nullopt;
}

AppConfig ConfigLoader::Load(const fs::path& configDir) {
    fs::path configPath = configDir / kSettingsFile;
    if (!fs::exists(configPath)) {
        std::cout << "[ConfigLoader] No settings.json in " << configDir << ", using defaults." << std::endl;
        return AppConfig{};
    }

    std::ifstream f(configPath);
    if (!f) {
        std::cerr << "[ConfigLoader] Cannot open " << configPath << std::endl;
        return AppConfig{};
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    return Parse(buffer.str()).value_or(AppConfig{});
}

std::string ConfigLoader::ToJsonText(const AppConfig& cfg) {
    const auto& prefs = cfg.preferences;
    json j = {
        {"wake_time", domain::FormatClockMinutes(prefs.wakeMinutes)},
        {"sleep_time", domain::FormatClockMinutes(prefs.sleepMinutes)},
        {"meals", {
            {"breakfast", domain::FormatClockMinutes(prefs.breakfastMinutes)},
            {"lunch", domain::FormatClockMinutes(prefs.lunchMinutes)},
            {"dinner", domain::FormatClockMinutes(prefs.dinnerMinutes)}
        }},
        {"daily_step_goal", prefs.dailyStepGoal},
        {"preferred_walk_time", domain::PreferredTimeToString(prefs.preferredWalkTime)},
        {"preferred_gym_time", domain::PreferredTimeToString(prefs.preferredGymTime)},
        {"workout_duration_minutes", prefs.workoutDurationMinutes},
        {"gym_days_per_week", prefs.gymDaysPerWeek},
        {"autopilot", {
            {"enabled", cfg.autopilot.enabled},
            {"trust_level", domain::TrustLevelToString(cfg.autopilot.trustLevel)},
            {"walks_per_day", cfg.autopilot.targetWalksPerDay},
            {"include_micro_walks", cfg.autopilot.includeMicroWalks},
            {"min_walk_minutes", cfg.autopilot.minWalkDuration},
            {"max_walk_minutes", cfg.autopilot.maxWalkDuration},
            {"alarm_offset_minutes", cfg.autopilot.alarmOffsetMinutes},
            {"retention_days", cfg.autopilot.retentionDays}
        }},
        {"calendar", {
            {"source", cfg.calendar.kind == CalendarSourceKind::Http ? "http" : "file"},
            {"path", cfg.calendar.path},
            {"host", cfg.calendar.host},
            {"port", cfg.calendar.port}
        }},
        {"activity_data", cfg.activityDataPath},
        {"state_file", cfg.stateFile},
        {"outbox_file", cfg.outboxFile}
    };
    return j.dump(4);
}

bool ConfigLoader::Save(const fs::path& configDir, const AppConfig& config) {
    fs::path configPath = configDir / kSettingsFile;
    try {
        fs::create_directories(configDir);
        std::ofstream f(configPath);
        f << ToJsonText(config);
        return static_cast<bool>(f);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing settings.json: " << e.what() << std::endl;
    }
    return false;
}

} // namespace moveslot::infrastructure
