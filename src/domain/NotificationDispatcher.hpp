/**
 * @file NotificationDispatcher.hpp
 * @brief Fire-and-forget user notifications raised by the autopilot.
 */

#pragma once

#include <vector>
#include "domain/AutopilotWalk.hpp"

namespace moveslot::domain {

class NotificationDispatcher {
public:
    virtual ~NotificationDispatcher() = default;

    /** @brief Asks the user to approve or reject a pending walk. */
    virtual void scheduleApprovalPrompt(const AutopilotWalk& walk) = 0;

    /** @brief Tells the user which walks were committed for the day. */
    virtual void scheduleSummary(const std::vector<AutopilotWalk>& walks) = 0;
};

} // namespace moveslot::domain
