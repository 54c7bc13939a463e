/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace moveslot::infrastructure {

namespace fs = std::filesystem;

PersistenceService::PersistenceService() {
    m_writer = std::thread(&PersistenceService::writerLoop, this);
}

PersistenceService::~PersistenceService() {
    stop();
}

void PersistenceService::saveTextAsync(const std::string& filename, const std::string& content) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping) {
            std::cerr << "[PersistenceService] Dropping write after stop: " << filename << std::endl;
            m_failedWrites++;
            return;
        }
        auto it = m_pending.find(filename);
        if (it != m_pending.end()) {
            it->second = content;
            m_supersededWrites++;
            return;
        }
        m_pending.emplace(filename, content);
        m_order.push_back(filename);
    }
    m_wake.notify_one();
}

void PersistenceService::flush() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_drained.wait(lock, [this] { return m_order.empty() && !m_writing; });
}

size_t PersistenceService::pendingWrites() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_order.size();
}

void PersistenceService::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping) return;
        m_stopping = true;
    }
    m_wake.notify_all();
    if (m_writer.joinable()) m_writer.join();
}

void PersistenceService::writerLoop() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (true) {
        m_wake.wait(lock, [this] { return !m_order.empty() || m_stopping; });
        if (m_order.empty()) {
            // Stopping with nothing left.
            m_drained.notify_all();
            return;
        }

        std::string filename = std::move(m_order.front());
        m_order.pop_front();
        auto node = m_pending.extract(filename);
        m_writing = true;

        lock.unlock();
        const bool ok = replaceFile(filename, node.mapped());
        lock.lock();

        if (!ok) m_failedWrites++;
        m_writing = false;
        if (m_order.empty()) m_drained.notify_all();
    }
}

bool PersistenceService::replaceFile(const std::string& filename, const std::string& content) {
    const fs::path target(filename);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            std::cerr << "[PersistenceService] Cannot create " << target.parent_path() << ": "
                      << ec.message() << std::endl;
            return false;
        }
    }

    fs::path staging = target;
    staging += ".tmp" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());

    std::ofstream out(staging, std::ios::binary | std::ios::trunc);
    if (!out) {
        std::cerr << "[PersistenceService] Cannot open " << staging << std::endl;
        return false;
    }
    out << content;
    out.close();
    if (out.fail()) {
        std::cerr << "[PersistenceService] Short write to " << staging << std::endl;
        fs::remove(staging, ec);
        return false;
    }

    fs::rename(staging, target, ec);
    if (ec) {
        std::cerr << "[PersistenceService] Cannot replace " << target << ": " << ec.message() << std::endl;
        std::error_code ignored;
        fs::remove(staging, ignored);
        return false;
    }
    return true;
}

} // namespace moveslot::infrastructure
