/**
 * @file ConfigLoader.hpp
 * @brief Loads and saves settings.json (daily rhythm, goals, autopilot, data sources).
 *
 * Missing keys keep their defaults; a malformed file is reported and ignored.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "domain/AutopilotWalk.hpp"
#include "domain/UserPreferences.hpp"

namespace moveslot::infrastructure {

enum class CalendarSourceKind {
    File,
    Http
};

struct CalendarSourceConfig {
    CalendarSourceKind kind = CalendarSourceKind::File;
    std::string path = "calendar.json";
    std::string host = "localhost";
    int port = 8088;
};

/**
 * @struct AppConfig
 * @brief Everything read from settings.json. Relative paths are resolved against the data dir.
 */
struct AppConfig {
    domain::UserPreferences preferences;
    domain::AutopilotSettings autopilot;
    CalendarSourceConfig calendar;
    std::string activityDataPath = "activity.json";
    std::string stateFile = "state.json";
    std::string outboxFile = "notifications.ndjson";
};

class ConfigLoader {
public:
    /**
     * @brief Reads <configDir>/settings.json.
     * @return Defaults when the file is missing or unreadable.
     */
    static AppConfig Load(const std::filesystem::path& configDir);

    /** @brief Parses settings text. nullopt when it is not valid JSON. */
    static std::optional<AppConfig> Parse(const std::string& text);

    /** @brief Writes the configuration to <configDir>/settings.json. */
    static bool Save(const std::filesystem::path& configDir, const AppConfig& config);

    static std::string ToJsonText(const AppConfig& config);
};

} // namespace moveslot::infrastructure
