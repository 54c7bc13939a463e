/**
 * @file OutboxNotificationDispatcher.hpp
 * @brief NotificationDispatcher that appends notifications to an NDJSON outbox file.
 *
 * A separate delivery agent drains the outbox; this process only records intent.
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "domain/NotificationDispatcher.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace moveslot::infrastructure {

class OutboxNotificationDispatcher : public domain::NotificationDispatcher {
public:
    OutboxNotificationDispatcher(std::string outboxPath, std::shared_ptr<PersistenceService> persistence);

    void scheduleApprovalPrompt(const domain::AutopilotWalk& walk) override;
    void scheduleSummary(const std::vector<domain::AutopilotWalk>& walks) override;

private:
    void append(const std::string& line);

    std::string m_outboxPath;
    std::shared_ptr<PersistenceService> m_persistence;
    std::string m_content;
    std::mutex m_mutex;
};

} // namespace moveslot::infrastructure
