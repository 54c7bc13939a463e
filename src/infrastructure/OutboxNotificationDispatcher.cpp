#include "infrastructure/OutboxNotificationDispatcher.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace moveslot::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

OutboxNotificationDispatcher::OutboxNotificationDispatcher(std::string outboxPath,
                                                           std::shared_ptr<PersistenceService> persistence)
    : m_outboxPath(std::move(outboxPath)), m_persistence(std::move(persistence)) {
    if (fs::exists(m_outboxPath)) {
        std::ifstream in(m_outboxPath);
        if (in) {
            std::stringstream buffer;
            buffer << in.rdbuf();
            m_content = buffer.str();
            if (!m_content.empty() && m_content.back() != '\n') {
                m_content += "\n";
            }
        }
    }
}

void OutboxNotificationDispatcher::append(const std::string& line) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_content += line;
    m_content += "\n";
    m_persistence->saveTextAsync(m_outboxPath, m_content);
}

void OutboxNotificationDispatcher::scheduleApprovalPrompt(const domain::AutopilotWalk& walk) {
    json j = {
        {"kind", "approval_prompt"},
        {"walk_id", walk.id},
        {"title", walk.title()},
        {"start", domain::FormatLocalDateTime(walk.startTime)},
        {"duration", walk.durationMinutes},
        {"body", walk.title() + " at " + domain::FormatClock(walk.startTime) + " for " +
                 std::to_string(walk.durationMinutes) + " min. Approve?"}
    };
    append(j.dump());
    std::cout << "[Notifications] Approval requested for " << walk.id << std::endl;
}

void OutboxNotificationDispatcher::scheduleSummary(const std::vector<domain::AutopilotWalk>& walks) {
    json items = json::array();
    for (const auto& w : walks) {
        items.push_back({{"walk_id", w.id}, {"start", domain::FormatLocalDateTime(w.startTime)},
                         {"duration", w.durationMinutes}, {"title", w.title()}});
    }
    json j = {
        {"kind", "summary"},
        {"walks", items},
        {"body", std::to_string(walks.size()) + " walks scheduled for tomorrow"}
    };
    append(j.dump());
    std::cout << "[Notifications] Summary queued (" << walks.size() << " walks)" << std::endl;
}

} // namespace moveslot::infrastructure
