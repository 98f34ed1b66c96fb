#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace crmterm::infrastructure {

namespace fs = std::filesystem;

namespace {

constexpr const char* kAppDir = "crmterm";

} // namespace

fs::path PathUtils::GetDataHome() {
    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && *xdgDataHome) {
        return fs::path(xdgDataHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".local" / "share";
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetDefaultDataFile() {
    return GetDataHome() / kAppDir / "crmterm.json";
}

fs::path PathUtils::GetDefaultConfigFile() {
    return GetConfigHome() / kAppDir / "config.json";
}

fs::path PathUtils::ExpandUserPath(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return fs::path(path);
    }
    if (path.size() > 1 && path[1] != '/') {
        return fs::path(path); // ~user is not supported
    }
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        return fs::path(path);
    }
    if (path.size() <= 2) {
        return fs::path(home);
    }
    return fs::path(home) / path.substr(2);
}

} // namespace crmterm::infrastructure
