/**
 * @file Records.hpp
 * @brief Value snapshots of the records kept by the CRM (accounts, notes, events, activity).
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace crmterm::domain {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @struct Account
 * @brief A customer account. Names are unique, compared case-insensitively.
 */
struct Account {
    std::int64_t id = 0;        ///< Storage identifier (0 = not persisted yet).
    std::string name;
    std::string phone;
    std::string address;
    std::string email;
    std::string decisionMaker;
    std::string creator;        ///< Display name of the user who created it.
    TimePoint createdAt{};
};

/**
 * @struct Note
 * @brief A free-form note, optionally linked to an account.
 */
struct Note {
    std::int64_t id = 0;
    std::string content;
    std::optional<std::int64_t> accountId;
    std::string creator;
    TimePoint createdAt{};
    std::optional<std::string> accountName; ///< Filled on reads when the account still exists.
};

/**
 * @struct Event
 * @brief A scheduled interaction, optionally linked to an account.
 */
struct Event {
    std::int64_t id = 0;
    std::string title;
    std::string details;
    TimePoint eventTime{};
    std::optional<std::int64_t> accountId;
    std::string creator;
    TimePoint createdAt{};
    std::optional<std::string> accountName;
};

/**
 * @enum ActivityKind
 * @brief Closed set of record kinds that appear in the activity feed.
 */
enum class ActivityKind {
    Account,
    Note,
    Event
};

/**
 * @brief Lowercase identifier used for storage and display ("account", "note", "event").
 */
inline std::string ActivityKindToString(ActivityKind kind) {
    switch (kind) {
        case ActivityKind::Account: return "account";
        case ActivityKind::Note: return "note";
        case ActivityKind::Event: return "event";
        default: return "account";
    }
}

/**
 * @struct Activity
 * @brief One entry of the unified, newest-first activity feed.
 */
struct Activity {
    std::int64_t id = 0;        ///< Identifier of the underlying record.
    ActivityKind kind = ActivityKind::Account;
    std::string title;          ///< Never null; empty when the source has none.
    std::string detail;         ///< Truncated detail text, possibly empty.
    TimePoint createdAt{};
};

} // namespace crmterm::domain
