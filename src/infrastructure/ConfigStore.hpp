/**
 * @file ConfigStore.hpp
 * @brief PreferencesStore backed by config.json (display name and time zone).
 */

#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "domain/PreferencesStore.hpp"
#include "domain/TimeZone.hpp"

namespace crmterm::infrastructure {

class PersistenceService;

/**
 * @class ConfigStore
 * @brief Reads and writes {"name": ..., "timezone": ...}.
 *
 * A missing file is created with defaults taken from the environment.
 * A failed save leaves the in-memory values unchanged.
 */
class ConfigStore : public domain::PreferencesStore {
public:
    /**
     * @throws std::runtime_error when the file exists but cannot be parsed,
     *         or when the defaults cannot be written.
     */
    explicit ConfigStore(std::filesystem::path configFile,
                         std::shared_ptr<PersistenceService> persistence = nullptr);

    std::string displayName() const override { return m_name; }
    std::string timezone() const override { return m_timezone; }
    domain::TimeZone location() const override { return m_location; }

    void saveDisplayName(const std::string& name) override;
    void saveTimezone(const std::string& zone) override;

    const std::filesystem::path& configFile() const { return m_configFile; }

    /** @brief $USER, or "CRM User". */
    static std::string DefaultDisplayName();

    /** @brief $TZ, /etc/timezone, the /etc/localtime link target, or "UTC". */
    static std::string DetectSystemTimezone();

private:
    void write(const std::string& name, const std::string& zone);

    std::filesystem::path m_configFile;
    std::shared_ptr<PersistenceService> m_persistence;
    std::string m_name;
    std::string m_timezone;
    domain::TimeZone m_location; ///< Loaded once per change of m_timezone; UTC when not loadable.
};

} // namespace crmterm::infrastructure
