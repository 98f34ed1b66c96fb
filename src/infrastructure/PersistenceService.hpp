/**
 * @file PersistenceService.hpp
 * @brief Centralized service for atomic file writes.
 */

#pragma once
#include <string>

namespace crmterm::infrastructure {

/**
 * @class PersistenceService
 * @brief Writes whole files atomically (temp file in the same directory, then rename).
 *
 * A reader never observes a half-written file: either the previous content or
 * the new one is on disk.
 */
class PersistenceService {
public:
    /**
     * @brief Replaces @p filename with @p content, creating parent directories.
     * @throws std::runtime_error when any step fails; the previous file is left untouched.
     */
    void saveText(const std::string& filename, const std::string& content);
};

} // namespace crmterm::infrastructure
