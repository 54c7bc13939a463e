/**
 * @file KeyValueStore.hpp
 * @brief Narrow persistence interface for planner state.
 */

#pragma once

#include <optional>
#include <string>

namespace moveslot::domain {

/**
 * @class KeyValueStore
 * @brief String-keyed store. Values are opaque encoded documents.
 */
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual std::optional<std::string> get(const std::string& key) const = 0;
    virtual void put(const std::string& key, const std::string& value) = 0;
    virtual void remove(const std::string& key) = 0;
};

} // namespace moveslot::domain
