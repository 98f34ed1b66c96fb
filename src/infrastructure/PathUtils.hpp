// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace crmterm::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /** @brief $XDG_DATA_HOME/crmterm/crmterm.json */
    static std::filesystem::path GetDefaultDataFile();
    /** @brief $XDG_CONFIG_HOME/crmterm/config.json */
    static std::filesystem::path GetDefaultConfigFile();

    /** @brief Replaces a leading "~" or "~/" with $HOME. Other paths are returned unchanged. */
    static std::filesystem::path ExpandUserPath(const std::string& path);
};

} // namespace crmterm::infrastructure
