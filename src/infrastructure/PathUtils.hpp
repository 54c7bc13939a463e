/**
 * @file PathUtils.hpp
 * @brief Where MoveSlot keeps its settings and state.
 */

#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace moveslot::infrastructure {

/**
 * @struct AppPaths
 * @brief Config and data directories of one MoveSlot installation.
 */
struct AppPaths {
    std::filesystem::path configDir;
    std::filesystem::path dataDir;

    /** @brief `name` inside the data directory unless it is already absolute. */
    std::filesystem::path dataFile(const std::string& name) const;
};

class PathUtils {
public:
    /**
     * @brief Picks the directories, in order: `homeOverride`, $MOVESLOT_HOME,
     *        then $XDG_CONFIG_HOME/MoveSlot and $XDG_DATA_HOME/MoveSlot.
     *
     * With an override or $MOVESLOT_HOME both directories are the same.
     * Directories are created on demand.
     */
    static AppPaths Discover(const std::optional<std::filesystem::path>& homeOverride = std::nullopt);

    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /** @brief Resolves `value` against `base` unless it is already absolute. */
    static std::filesystem::path Resolve(const std::filesystem::path& base, const std::string& value);
};

} // namespace moveslot::infrastructure
