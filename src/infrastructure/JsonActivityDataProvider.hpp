/**
 * @file JsonActivityDataProvider.hpp
 * @brief ActivityDataProvider reading an exported step/workout history.
 */

#pragma once

#include <map>
#include <mutex>
#include <string>

#include "domain/ActivityDataProvider.hpp"

namespace moveslot::infrastructure {

/**
 * @class JsonActivityDataProvider
 * @brief Document shape: {"days": {"yyyy-MM-dd": {"steps": N, "workouts": [{"activity": s, "duration": m}]}}}
 *
 * The file is re-read when its modification time changes. Days without an entry have zero steps.
 */
class JsonActivityDataProvider : public domain::ActivityDataProvider {
public:
    explicit JsonActivityDataProvider(std::string filePath);

    int fetchSteps(const domain::CivilDate& date) override;
    std::vector<domain::WorkoutRecord> fetchWorkouts(const domain::CivilDate& date) override;

private:
    struct DayRecord {
        int steps = 0;
        std::vector<domain::WorkoutRecord> workouts;
    };

    /** @brief Throws std::runtime_error when the file exists but cannot be parsed. */
    void refreshIfChanged();

    std::string m_filePath;
    std::map<domain::CivilDate, DayRecord> m_days;
    long long m_loadedStamp = -1;
    std::mutex m_mutex;
};

} // namespace moveslot::infrastructure
