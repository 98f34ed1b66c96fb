/**
 * @file JsonRecordRepository.hpp
 * @brief RecordRepository kept in a single JSON document on disk.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

#include "domain/RecordRepository.hpp"

namespace crmterm::infrastructure {

class PersistenceService;

/**
 * @class JsonRecordRepository
 * @brief Loads every record at construction and rewrites the whole file after each mutation.
 *
 * Mutations work on a copy of the in-memory store which only replaces the
 * current one once the file write succeeded, so a failed write leaves both
 * memory and disk unchanged.
 */
class JsonRecordRepository : public domain::RecordRepository {
public:
    /**
     * @param dataFile Path of the JSON document (created on first write).
     * @param persistence Atomic writer; a private one is created when null.
     * @throws domain::StorageError when an existing file cannot be read or parsed.
     */
    explicit JsonRecordRepository(std::filesystem::path dataFile,
                                  std::shared_ptr<PersistenceService> persistence = nullptr);

    std::vector<domain::Account> listAccounts() override;
    std::vector<domain::Account> searchAccounts(const std::string& term) override;
    std::optional<domain::Account> findAccountByName(const std::string& name) override;
    std::optional<domain::Account> findAccountById(std::int64_t id) override;
    void createAccount(domain::Account& account) override;
    void updateAccount(const domain::Account& account) override;
    std::vector<domain::Event> listEvents() override;
    std::vector<domain::Activity> listActivity(int limit) override;
    std::vector<domain::Activity> listAccountActivity(std::int64_t accountId, int limit) override;
    void createNote(domain::Note& note) override;
    void createEvent(domain::Event& event) override;
    domain::ImportResult importAccountsCsv(std::istream& input, const std::string& defaultCreator,
                                           const domain::TimeZone& zone) override;

    const std::filesystem::path& dataFile() const { return m_dataFile; }

private:
    struct Store {
        std::vector<domain::Account> accounts;
        std::vector<domain::Note> notes;
        std::vector<domain::Event> events;
        std::int64_t nextAccountId = 1;
        std::int64_t nextNoteId = 1;
        std::int64_t nextEventId = 1;
    };

    void load();
    void persist(const Store& next);

    /** @brief Validates and inserts into @p store; throws AccountExistsError on a name clash. */
    static void insertAccount(Store& store, domain::Account& account);
    static const domain::Account* findByName(const Store& store, const std::string& name);
    static std::vector<domain::Account> sortedByName(std::vector<domain::Account> accounts);

    std::filesystem::path m_dataFile;
    std::shared_ptr<PersistenceService> m_persistence;
    Store m_store;
};

} // namespace crmterm::infrastructure
