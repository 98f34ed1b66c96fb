/**
 * @file RecordRepository.hpp
 * @brief Storage contract consumed by the navigation engine.
 */

#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "domain/Records.hpp"
#include "domain/TimeZone.hpp"

namespace crmterm::domain {

/**
 * @class StorageError
 * @brief Any failure raised by the storage collaborator. Always recoverable for the session.
 */
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @class AccountExistsError
 * @brief Raised by create/update when another account already uses the name.
 */
class AccountExistsError : public StorageError {
public:
    AccountExistsError() : StorageError("account already exists") {}
};

/**
 * @struct ImportResult
 * @brief Outcome of a CSV batch import.
 */
struct ImportResult {
    int created = 0;
    int skipped = 0;
    std::vector<std::string> errors; ///< One "row N: reason" entry per rejected row.
};

/**
 * @class RecordRepository
 * @brief Abstract interface for persistent storage of accounts, notes and events.
 *
 * Every method may throw StorageError. Lookups report "not found" through an
 * empty optional, never through an exception.
 */
class RecordRepository {
public:
    virtual ~RecordRepository() = default;

    /** @brief All accounts, ordered by name case-insensitively. */
    virtual std::vector<Account> listAccounts() = 0;

    /**
     * @brief Accounts whose name contains the term (case-insensitive).
     * @param term Search term; blank returns every account.
     */
    virtual std::vector<Account> searchAccounts(const std::string& term) = 0;

    /** @brief Exact, case-insensitive name lookup. */
    virtual std::optional<Account> findAccountByName(const std::string& name) = 0;

    /** @brief Lookup by identifier. */
    virtual std::optional<Account> findAccountById(std::int64_t id) = 0;

    /**
     * @brief Inserts a new account and assigns its identifier.
     * @throws AccountExistsError when the name is already taken.
     */
    virtual void createAccount(Account& account) = 0;

    /**
     * @brief Persists changes to an existing account.
     * @throws AccountExistsError when the new name collides with another account.
     */
    virtual void updateAccount(const Account& account) = 0;

    /** @brief Every event, ascending by event time, with the linked account name. */
    virtual std::vector<Event> listEvents() = 0;

    /** @brief Global activity feed, newest first, at most @p limit entries. */
    virtual std::vector<Activity> listActivity(int limit) = 0;

    /** @brief Activity scoped to one account, newest first, at most @p limit entries. */
    virtual std::vector<Activity> listAccountActivity(std::int64_t accountId, int limit) = 0;

    virtual void createNote(Note& note) = 0;

    virtual void createEvent(Event& event) = 0;

    /**
     * @brief Loads accounts from CSV text (header row with at least a "name" column).
     * @param input CSV stream.
     * @param defaultCreator Creator used when the row has none.
     * @param zone Zone used to interpret created_at values without offset.
     */
    virtual ImportResult importAccountsCsv(std::istream& input, const std::string& defaultCreator, const TimeZone& zone) = 0;
};

} // namespace crmterm::domain
