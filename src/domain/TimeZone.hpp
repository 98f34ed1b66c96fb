/**
 * @file TimeZone.hpp
 * @brief IANA time zone value object backed by the system zoneinfo database.
 */

#pragma once

#include <ctime>
#include <optional>
#include <string>

#include "domain/Records.hpp"

namespace crmterm::domain {

/**
 * @class TimeZone
 * @brief Converts between absolute time points and wall-clock fields of one zone.
 *
 * Conversions go through the C library (TZ + localtime_r/mktime), so a
 * TimeZone must only be used from the session thread. After a conversion in
 * a named zone the process TZ variable holds that zone.
 */
class TimeZone {
public:
    /** @brief Constructs the UTC zone. */
    TimeZone();

    static TimeZone Utc();

    /**
     * @brief Loads a zone by identifier.
     * @return std::nullopt when the identifier is not in the zoneinfo database.
     */
    static std::optional<TimeZone> Load(const std::string& name);

    /** @brief True if @p name can be loaded ("UTC" or a TZif file under the zoneinfo root). */
    static bool IsLoadable(const std::string& name);

    const std::string& name() const { return m_name; }

    /** @brief Wall-clock fields of @p t in this zone (sub-second part dropped). */
    std::tm toLocal(TimePoint t) const;

    /** @brief Interprets @p fields as wall-clock time in this zone. */
    TimePoint fromLocal(const std::tm& fields) const;

    /** @brief Local midnight of the calendar day containing @p t. */
    TimePoint startOfDay(TimePoint t) const;

    /** @brief strftime-style formatting in this zone. */
    std::string format(TimePoint t, const char* pattern) const;

    /**
     * @brief Parses wall-clock text (std::get_time pattern) in this zone.
     * @return std::nullopt when the text does not match or names an impossible date.
     */
    std::optional<TimePoint> parseLocal(const std::string& text, const char* pattern) const;

private:
    explicit TimeZone(std::string name);

    bool isUtc() const;

    std::string m_name;
};

/** @brief "2006-01-02T15:04:05Z" form used for persisted timestamps. */
std::string FormatRfc3339Utc(TimePoint t);

/** @brief Like FormatRfc3339Utc with the sub-second part kept ("...05.25Z"), trailing zeros dropped. */
std::string FormatRfc3339UtcNano(TimePoint t);

/**
 * @brief Parses RFC 3339 timestamps ("Z" or +hh:mm offsets, optional fraction).
 */
std::optional<TimePoint> ParseRfc3339(const std::string& text);

} // namespace crmterm::domain
