#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <iostream>
#include <system_error>

namespace moveslot::infrastructure {

namespace fs = std::filesystem;

namespace {

constexpr const char* kAppDirName = "MoveSlot";
constexpr const char* kHomeVariable = "MOVESLOT_HOME";

std::optional<fs::path> FromEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value && *value) return fs::path(value);
    return std::nullopt;
}

fs::path UserHomeOr(const fs::path& suffix) {
    if (auto home = FromEnv("HOME")) return *home / suffix;
    std::cerr << "[PathUtils] HOME is not set, using the working directory." << std::endl;
    return fs::current_path();
}

fs::path EnsureDir(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        std::cerr << "[PathUtils] Could not create " << dir << ": " << ec.message() << std::endl;
    }
    return dir;
}

} // namespace

fs::path AppPaths::dataFile(const std::string& name) const {
    return PathUtils::Resolve(dataDir, name);
}

AppPaths PathUtils::Discover(const std::optional<fs::path>& homeOverride) {
    std::optional<fs::path> single = homeOverride;
    if (!single) single = FromEnv(kHomeVariable);

    AppPaths paths;
    if (single) {
        paths.configDir = EnsureDir(*single);
        paths.dataDir = paths.configDir;
    } else {
        paths.configDir = EnsureDir(GetConfigHome() / kAppDirName);
        paths.dataDir = EnsureDir(GetDataHome() / kAppDirName);
    }
    return paths;
}

fs::path PathUtils::GetDataHome() {
    if (auto xdg = FromEnv("XDG_DATA_HOME")) return *xdg;
    return UserHomeOr(fs::path(".local") / "share");
}

fs::path PathUtils::GetConfigHome() {
    if (auto xdg = FromEnv("XDG_CONFIG_HOME")) return *xdg;
    return UserHomeOr(".config");
}

fs::path PathUtils::Resolve(const fs::path& base, const std::string& value) {
    fs::path p(value);
    if (p.is_absolute()) return p;
    return base / p;
}

} // namespace moveslot::infrastructure
