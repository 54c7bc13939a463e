/**
 * @file MoveSlotApp.hpp
 * @brief Command-line front end: wires the services and dispatches one command per run.
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"

namespace moveslot::app {

/**
 * @class MoveSlotApp
 * @brief Orchestrates the application lifecycle: initialization, one command, shutdown.
 */
class MoveSlotApp {
public:
    /**
     * @brief Parses global options, runs the command and flushes state.
     * @return Exit code (0 for success).
     */
    int Run(int argc, char** argv);

private:
    /**
     * @brief Loads settings.json and builds every service.
     * @return True if initialization succeeded.
     */
    bool Init(const infrastructure::AppPaths& paths);

    /** @brief Waits for background work and pending writes. */
    void Shutdown();

    int Dispatch(const std::vector<std::string>& args);

    int CmdPlan(const std::vector<std::string>& args);
    int CmdWorkout(const std::vector<std::string>& args);
    int CmdMark(const std::vector<std::string>& args);
    int CmdAutopilot(const std::vector<std::string>& args);
    int CmdPending();
    int CmdApprove(const std::vector<std::string>& args);
    int CmdReject(const std::vector<std::string>& args);
    int CmdAdjust(const std::vector<std::string>& args);
    int CmdAfterMeeting(const std::vector<std::string>& args);
    int CmdLearn();
    int CmdStreak();
    int CmdConflicts(const std::vector<std::string>& args);
    int CmdSchedule(const std::vector<std::string>& args);
    int CmdRefresh();
    void PrintUsage() const;

    infrastructure::AppConfig m_config;
    application::AppServices m_services;
    bool m_initialized = false;
};

} // namespace moveslot::app
