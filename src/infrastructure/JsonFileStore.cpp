/**
 * @file JsonFileStore.cpp
 * @brief Implementation of JsonFileStore.
 */

#include "infrastructure/JsonFileStore.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace moveslot::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

JsonFileStore::JsonFileStore(std::string filePath, std::shared_ptr<PersistenceService> persistence)
    : m_filePath(std::move(filePath)), m_persistence(std::move(persistence)) {
    load();
}

void JsonFileStore::load() {
    if (!fs::exists(m_filePath)) return;

    try {
        std::ifstream f(m_filePath);
        json doc;
        f >> doc;
        if (!doc.is_object()) {
            std::cerr << "[JsonFileStore] Ignoring non-object document: " << m_filePath << std::endl;
            return;
        }
        for (auto it = doc.begin(); it != doc.end(); ++it) {
            if (it.value().is_string()) {
                m_values[it.key()] = it.value().get<std::string>();
            }
        }
        std::cout << "[JsonFileStore] Loaded " << m_values.size() << " entries from " << m_filePath << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[JsonFileStore] Corrupt store " << m_filePath << ": " << e.what()
                  << ". Starting empty." << std::endl;
        m_values.clear();
    }
}

std::optional<std::string> JsonFileStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_values.find(key);
    if (it == m_values.end()) return std::nullopt;
    return it->second;
}

void JsonFileStore::put(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_values[key] = value;
    scheduleSave();
}

void JsonFileStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_values.erase(key) > 0) {
        scheduleSave();
    }
}

void JsonFileStore::scheduleSave() {
    // Called with m_mutex held so queued snapshots keep the order of mutations.
    json doc = json::object();
    for (const auto& [k, v] : m_values) {
        doc[k] = v;
    }
    m_persistence->saveTextAsync(m_filePath, doc.dump(2));
}

void JsonFileStore::flush() {
    m_persistence->flush();
}

} // namespace moveslot::infrastructure
