/**
 * @file PersistenceService.hpp
 * @brief Write-behind file replacement for planner state, calendar files and outboxes.
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace moveslot::infrastructure {

/**
 * @class PersistenceService
 * @brief One background writer with at most one pending replacement per path.
 *
 * Services persist their whole document on every mutation. When a path is
 * saved again before its previous content reached the disk, the pending
 * content is replaced in place and the older snapshot is never written.
 * Paths are written in the order they were first queued.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /** @brief Queues `content` to replace `filename` (temp file + rename). */
    void saveTextAsync(const std::string& filename, const std::string& content);

    /** @brief Blocks until nothing is pending or being written. */
    void flush();

    /** @brief Paths waiting for the writer. */
    size_t pendingWrites();

    int failedWrites() const { return m_failedWrites.load(); }

    /** @brief Saves whose content was replaced by a newer save before being written. */
    int supersededWrites() const { return m_supersededWrites.load(); }

    /** @brief Writes everything still pending, then joins the writer. Idempotent. */
    void stop();

private:
    void writerLoop();
    static bool replaceFile(const std::string& filename, const std::string& content);

    std::deque<std::string> m_order;
    std::map<std::string, std::string> m_pending;
    std::mutex m_mutex;
    std::condition_variable m_wake;
    std::condition_variable m_drained;
    bool m_writing = false;
    bool m_stopping = false;

    std::atomic<int> m_failedWrites{0};
    std::atomic<int> m_supersededWrites{0};
    std::thread m_writer;
};

} // namespace moveslot::infrastructure
