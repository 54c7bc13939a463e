/**
 * @file AsyncTaskManager.hpp
 * @brief Runs lifecycle triggers (refresh, nightly autopilot, learning) in the background.
 *
 * At most one task per TaskType runs at a time. A trigger that fires while
 * its type is still running joins the running task instead of starting a
 * second one, so an app-active refresh racing a manual refresh does the
 * work once.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace moveslot::application {

/**
 * @enum TaskType
 * @brief Categories of background work.
 */
enum class TaskType {
    PlanGeneration,
    AutopilotRun,
    PatternLearning,
    StreakUpdate,
    CalendarSync
};

inline std::string TaskTypeToString(TaskType type) {
    switch (type) {
        case TaskType::PlanGeneration: return "plan";
        case TaskType::AutopilotRun: return "autopilot";
        case TaskType::PatternLearning: return "learning";
        case TaskType::StreakUpdate: return "streak";
        case TaskType::CalendarSync: return "sync";
    }
    return "task";
}

/**
 * @struct TaskStatus
 * @brief Information about a running or completed task.
 */
struct TaskStatus {
    int id = 0;
    TaskType type = TaskType::PlanGeneration;
    std::string description;
    std::atomic<float> progress{0.0f};
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::atomic<int> joinedTriggers{0}; ///< Submissions folded into this run.
    std::string errorMessage;           ///< Written before isCompleted is set.
};

/**
 * @struct TaskFailure
 * @brief A finished task that threw.
 */
struct TaskFailure {
    int id = 0;
    TaskType type = TaskType::PlanGeneration;
    std::string description;
    std::string errorMessage;
};

/**
 * @class AsyncTaskManager
 * @brief Background execution keyed by trigger type. The destructor waits for running tasks.
 */
class AsyncTaskManager {
public:
    explicit AsyncTaskManager(size_t failureHistory = 32)
        : m_failureHistory(failureHistory) {}
    ~AsyncTaskManager() {
        WaitForAll();
    }

    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    /**
     * @brief Runs `f(status, args...)` on its own thread.
     *
     * If a task of the same type is still running, `f` is dropped and the
     * running task's status is returned.
     */
    template<typename F, typename... Args>
    std::shared_ptr<TaskStatus> SubmitTask(TaskType type, const std::string& description, F&& f, Args&&... args) {
        std::shared_ptr<TaskStatus> status;
        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            auto running = m_running.find(type);
            if (running != m_running.end()) {
                ++running->second->joinedTriggers;
                return running->second;
            }
            status = std::make_shared<TaskStatus>();
            status->id = ++m_lastId;
            status->type = type;
            status->description = description;
            m_running.emplace(type, status);
        }

        std::thread([this, status](auto userFunc, auto... userArgs) {
            try {
                userFunc(status, std::move(userArgs)...);
                status->progress = 1.0f;
            } catch (const std::exception& e) {
                status->failed = true;
                status->errorMessage = e.what();
            }
            status->isCompleted = true;
            Finish(status);
        }, std::forward<F>(f), std::forward<Args>(args)...).detach();

        return status;
    }

    /** @brief Snapshot of tasks that have not finished yet. */
    std::vector<std::shared_ptr<TaskStatus>> GetActiveTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        std::vector<std::shared_ptr<TaskStatus>> active;
        for (const auto& [type, status] : m_running) active.push_back(status);
        return active;
    }

    bool IsRunning(TaskType type) {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_running.count(type) > 0;
    }

    /** @brief Failures with an id above `afterId`, oldest first. */
    std::vector<TaskFailure> FailuresSince(int afterId) {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        std::vector<TaskFailure> out;
        for (const auto& f : m_failures) {
            if (f.id > afterId) out.push_back(f);
        }
        return out;
    }

    /** @brief Id of the most recently started task, 0 before the first. */
    int LastTaskId() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_lastId;
    }

    /** @brief Blocks until no task is running. */
    void WaitForAll() {
        std::unique_lock<std::mutex> lock(m_tasksMutex);
        m_idle.wait(lock, [this] { return m_running.empty(); });
    }

private:
    void Finish(const std::shared_ptr<TaskStatus>& status) {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_running.erase(status->type);
        if (status->failed) {
            m_failures.push_back({status->id, status->type, status->description, status->errorMessage});
            while (m_failures.size() > m_failureHistory) m_failures.pop_front();
        }
        m_idle.notify_all();
    }

    size_t m_failureHistory;
    int m_lastId = 0;
    std::map<TaskType, std::shared_ptr<TaskStatus>> m_running;
    std::deque<TaskFailure> m_failures;
    std::mutex m_tasksMutex;
    std::condition_variable m_idle;
};

} // namespace moveslot::application
