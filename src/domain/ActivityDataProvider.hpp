/**
 * @file ActivityDataProvider.hpp
 * @brief Interface to recorded step counts and workouts.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/time/LocalTime.hpp"

namespace moveslot::domain {

struct WorkoutRecord {
    std::string activity; ///< e.g. "strength", "running"
    int durationMinutes = 0;
};

class ActivityDataProvider {
public:
    virtual ~ActivityDataProvider() = default;

    /** @brief Total steps recorded on a local day. */
    virtual int fetchSteps(const CivilDate& date) = 0;

    virtual std::vector<WorkoutRecord> fetchWorkouts(const CivilDate& date) = 0;
};

} // namespace moveslot::domain
