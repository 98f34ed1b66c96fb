/**
 * @file PreferencesStore.hpp
 * @brief User preference contract (display name and time zone).
 */

#pragma once

#include <string>

#include "domain/TimeZone.hpp"

namespace crmterm::domain {

class PreferencesStore {
public:
    virtual ~PreferencesStore() = default;

    /** @brief Name recorded as the creator of new records. */
    virtual std::string displayName() const = 0;

    /** @brief Configured zone identifier, e.g. "America/New_York". */
    virtual std::string timezone() const = 0;

    /** @brief Zone used for all timestamp conversions. Falls back to UTC. */
    virtual TimeZone location() const = 0;

    /**
     * @brief Persists a new display name.
     * @throws std::runtime_error when the preferences cannot be written.
     */
    virtual void saveDisplayName(const std::string& name) = 0;

    /**
     * @brief Persists a new zone identifier.
     * @throws std::invalid_argument when the zone cannot be loaded.
     * @throws std::runtime_error when the preferences cannot be written.
     */
    virtual void saveTimezone(const std::string& zone) = 0;
};

} // namespace crmterm::domain
