/**
 * @file JsonFileStore.hpp
 * @brief KeyValueStore persisted as a single JSON document.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "domain/KeyValueStore.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace moveslot::infrastructure {

/**
 * @class JsonFileStore
 * @brief Loads the document once; every put/remove queues an atomic rewrite.
 */
class JsonFileStore : public domain::KeyValueStore {
public:
    JsonFileStore(std::string filePath, std::shared_ptr<PersistenceService> persistence);

    std::optional<std::string> get(const std::string& key) const override;
    void put(const std::string& key, const std::string& value) override;
    void remove(const std::string& key) override;

    /** @brief Waits for pending writes. */
    void flush();

    const std::string& path() const { return m_filePath; }

private:
    void load();
    void scheduleSave();

    std::string m_filePath;
    std::shared_ptr<PersistenceService> m_persistence;
    std::map<std::string, std::string> m_values;
    mutable std::mutex m_mutex;
};

} // namespace moveslot::infrastructure
