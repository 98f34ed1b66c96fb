/**
 * @file JsonRecordRepository.cpp
 * @brief Implementation of JsonRecordRepository.
 */

#include "infrastructure/JsonRecordRepository.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <nlohmann/json.hpp>

#include "domain/ActivityFeed.hpp"
#include "domain/TextUtils.hpp"
#include "infrastructure/CsvReader.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace crmterm::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

domain::TimePoint ReadTime(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string()) {
        return domain::TimePoint{};
    }
    return domain::ParseRfc3339(j[key].get<std::string>()).value_or(domain::TimePoint{});
}

std::optional<std::int64_t> ReadOptionalId(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<std::int64_t>();
}

json AccountToJson(const domain::Account& a) {
    json j;
    j["id"] = a.id;
    j["name"] = a.name;
    j["phone"] = a.phone;
    j["address"] = a.address;
    j["email"] = a.email;
    j["decision_maker"] = a.decisionMaker;
    j["creator"] = a.creator;
    j["created_at"] = domain::FormatRfc3339UtcNano(a.createdAt);
    return j;
}

domain::Account AccountFromJson(const json& j) {
    domain::Account a;
    a.id = j.value("id", std::int64_t{0});
    a.name = j.value("name", std::string());
    a.phone = j.value("phone", std::string());
    a.address = j.value("address", std::string());
    a.email = j.value("email", std::string());
    a.decisionMaker = j.value("decision_maker", std::string());
    a.creator = j.value("creator", std::string());
    a.createdAt = ReadTime(j, "created_at");
    return a;
}

json NoteToJson(const domain::Note& n) {
    json j;
    j["id"] = n.id;
    j["content"] = n.content;
    j["account_id"] = n.accountId ? json(*n.accountId) : json(nullptr);
    j["creator"] = n.creator;
    j["created_at"] = domain::FormatRfc3339UtcNano(n.createdAt);
    return j;
}

domain::Note NoteFromJson(const json& j) {
    domain::Note n;
    n.id = j.value("id", std::int64_t{0});
    n.content = j.value("content", std::string());
    n.accountId = ReadOptionalId(j, "account_id");
    n.creator = j.value("creator", std::string());
    n.createdAt = ReadTime(j, "created_at");
    return n;
}

json EventToJson(const domain::Event& e) {
    json j;
    j["id"] = e.id;
    j["title"] = e.title;
    j["details"] = e.details;
    j["event_time"] = domain::FormatRfc3339UtcNano(e.eventTime);
    j["account_id"] = e.accountId ? json(*e.accountId) : json(nullptr);
    j["creator"] = e.creator;
    j["created_at"] = domain::FormatRfc3339UtcNano(e.createdAt);
    return j;
}

domain::Event EventFromJson(const json& j) {
    domain::Event e;
    e.id = j.value("id", std::int64_t{0});
    e.title = j.value("title", std::string());
    e.details = j.value("details", std::string());
    e.eventTime = ReadTime(j, "event_time");
    e.accountId = ReadOptionalId(j, "account_id");
    e.creator = j.value("creator", std::string());
    e.createdAt = ReadTime(j, "created_at");
    return e;
}

bool IsUnset(domain::TimePoint t) {
    return t == domain::TimePoint{};
}

std::optional<domain::TimePoint> ParseImportTime(const std::string& value, const domain::TimeZone& zone) {
    if (auto t = domain::ParseRfc3339(value)) {
        return t;
    }
    if (auto t = zone.parseLocal(value, "%Y-%m-%d %H:%M")) {
        return t;
    }
    return zone.parseLocal(value, "%Y-%m-%d");
}

std::string Field(const std::vector<std::string>& record, const std::map<std::string, std::size_t>& index,
                  const char* column) {
    auto it = index.find(column);
    if (it == index.end() || it->second >= record.size()) {
        return {};
    }
    return domain::Trim(record[it->second]);
}

} // namespace

JsonRecordRepository::JsonRecordRepository(fs::path dataFile, std::shared_ptr<PersistenceService> persistence)
    : m_dataFile(std::move(dataFile)), m_persistence(std::move(persistence)) {
    if (!m_persistence) {
        m_persistence = std::make_shared<PersistenceService>();
    }
    load();
}

void JsonRecordRepository::load() {
    std::error_code ec;
    if (!fs::exists(m_dataFile, ec)) {
        std::cout << "[JsonRecordRepository] Starting with an empty store at " << m_dataFile << std::endl;
        return;
    }

    std::ifstream in(m_dataFile);
    if (!in.is_open()) {
        throw domain::StorageError("open " + m_dataFile.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    const std::string content = buffer.str();
    if (domain::Trim(content).empty()) {
        return;
    }

    Store store;
    try {
        const json j = json::parse(content);
        for (const auto& item : j.value("accounts", json::array())) {
            store.accounts.push_back(AccountFromJson(item));
        }
        for (const auto& item : j.value("notes", json::array())) {
            store.notes.push_back(NoteFromJson(item));
        }
        for (const auto& item : j.value("events", json::array())) {
            store.events.push_back(EventFromJson(item));
        }
        const json ids = j.value("next_ids", json::object());
        store.nextAccountId = ids.value("account", std::int64_t{1});
        store.nextNoteId = ids.value("note", std::int64_t{1});
        store.nextEventId = ids.value("event", std::int64_t{1});
    } catch (const json::exception& e) {
        std::cerr << "[JsonRecordRepository] Error reading " << m_dataFile << ": " << e.what() << std::endl;
        throw domain::StorageError("parse " + m_dataFile.string() + ": " + e.what());
    }

    // Never hand out an identifier that is already on disk.
    for (const auto& a : store.accounts) store.nextAccountId = std::max(store.nextAccountId, a.id + 1);
    for (const auto& n : store.notes) store.nextNoteId = std::max(store.nextNoteId, n.id + 1);
    for (const auto& e : store.events) store.nextEventId = std::max(store.nextEventId, e.id + 1);

    m_store = std::move(store);
    std::cout << "[JsonRecordRepository] Loaded " << m_store.accounts.size() << " account(s), "
              << m_store.notes.size() << " note(s), " << m_store.events.size() << " event(s)" << std::endl;
}

void JsonRecordRepository::persist(const Store& next) {
    json j;
    j["next_ids"] = {{"account", next.nextAccountId}, {"note", next.nextNoteId}, {"event", next.nextEventId}};
    j["accounts"] = json::array();
    for (const auto& a : next.accounts) j["accounts"].push_back(AccountToJson(a));
    j["notes"] = json::array();
    for (const auto& n : next.notes) j["notes"].push_back(NoteToJson(n));
    j["events"] = json::array();
    for (const auto& e : next.events) j["events"].push_back(EventToJson(e));

    std::string content;
    try {
        content = j.dump(2);
    } catch (const json::exception& e) {
        std::cerr << "[JsonRecordRepository] Error encoding records: " << e.what() << std::endl;
        throw domain::StorageError(std::string("encode records: ") + e.what());
    }
    try {
        m_persistence->saveText(m_dataFile.string(), content);
    } catch (const std::runtime_error& e) {
        throw domain::StorageError(std::string("save records: ") + e.what());
    }
}

const domain::Account* JsonRecordRepository::findByName(const Store& store, const std::string& name) {
    const std::string wanted = domain::Trim(name);
    for (const auto& a : store.accounts) {
        if (domain::EqualsIgnoreCase(a.name, wanted)) {
            return &a;
        }
    }
    return nullptr;
}

std::vector<domain::Account> JsonRecordRepository::sortedByName(std::vector<domain::Account> accounts) {
    std::stable_sort(accounts.begin(), accounts.end(), [](const domain::Account& a, const domain::Account& b) {
        return domain::ToLower(a.name) < domain::ToLower(b.name);
    });
    return accounts;
}

void JsonRecordRepository::insertAccount(Store& store, domain::Account& account) {
    account.name = domain::Trim(account.name);
    if (account.name.empty()) {
        throw domain::StorageError("account name required");
    }
    if (findByName(store, account.name)) {
        throw domain::AccountExistsError();
    }
    account.phone = domain::Trim(account.phone);
    account.address = domain::Trim(account.address);
    account.email = domain::Trim(account.email);
    account.decisionMaker = domain::Trim(account.decisionMaker);
    if (IsUnset(account.createdAt)) {
        account.createdAt = domain::Clock::now();
    }
    account.id = store.nextAccountId++;
    store.accounts.push_back(account);
}

std::vector<domain::Account> JsonRecordRepository::listAccounts() {
    return sortedByName(m_store.accounts);
}

std::vector<domain::Account> JsonRecordRepository::searchAccounts(const std::string& term) {
    const std::string needle = domain::ToLower(domain::Trim(term));
    if (needle.empty()) {
        return listAccounts();
    }
    std::vector<domain::Account> matches;
    for (const auto& a : m_store.accounts) {
        if (domain::ToLower(a.name).find(needle) != std::string::npos) {
            matches.push_back(a);
        }
    }
    return sortedByName(std::move(matches));
}

std::optional<domain::Account> JsonRecordRepository::findAccountByName(const std::string& name) {
    if (const domain::Account* found = findByName(m_store, name)) {
        return *found;
    }
    return std::nullopt;
}

std::optional<domain::Account> JsonRecordRepository::findAccountById(std::int64_t id) {
    for (const auto& a : m_store.accounts) {
        if (a.id == id) {
            return a;
        }
    }
    return std::nullopt;
}

void JsonRecordRepository::createAccount(domain::Account& account) {
    Store next = m_store;
    domain::Account pending = account;
    insertAccount(next, pending);
    persist(next);
    m_store = std::move(next);
    account = pending;
}

void JsonRecordRepository::updateAccount(const domain::Account& account) {
    const std::string name = domain::Trim(account.name);
    if (name.empty()) {
        throw domain::StorageError("account name required");
    }
    Store next = m_store;
    auto it = std::find_if(next.accounts.begin(), next.accounts.end(),
                           [&](const domain::Account& a) { return a.id == account.id; });
    if (it == next.accounts.end()) {
        throw domain::StorageError("account not found");
    }
    const domain::Account* clash = findByName(next, name);
    if (clash && clash->id != account.id) {
        throw domain::AccountExistsError();
    }
    it->name = name;
    it->phone = domain::Trim(account.phone);
    it->address = domain::Trim(account.address);
    it->email = domain::Trim(account.email);
    it->decisionMaker = domain::Trim(account.decisionMaker);
    persist(next);
    m_store = std::move(next);
}

std::vector<domain::Event> JsonRecordRepository::listEvents() {
    std::vector<domain::Event> events = m_store.events;
    for (auto& e : events) {
        e.accountName.reset();
        if (e.accountId) {
            if (auto account = findAccountById(*e.accountId)) {
                e.accountName = account->name;
            }
        }
    }
    std::stable_sort(events.begin(), events.end(), [](const domain::Event& a, const domain::Event& b) {
        return a.eventTime < b.eventTime;
    });
    return events;
}

std::vector<domain::Activity> JsonRecordRepository::listActivity(int limit) {
    std::vector<domain::Activity> entries;
    for (const auto& a : m_store.accounts) entries.push_back(domain::ActivityFromAccount(a));
    for (const auto& n : m_store.notes) entries.push_back(domain::ActivityFromNote(n));
    for (const auto& e : m_store.events) entries.push_back(domain::ActivityFromEvent(e));
    return domain::MergeActivity(std::move(entries), limit);
}

std::vector<domain::Activity> JsonRecordRepository::listAccountActivity(std::int64_t accountId, int limit) {
    std::vector<domain::Activity> entries;
    for (const auto& a : m_store.accounts) {
        if (a.id == accountId) entries.push_back(domain::ActivityFromAccount(a));
    }
    for (const auto& n : m_store.notes) {
        if (n.accountId && *n.accountId == accountId) entries.push_back(domain::ActivityFromNote(n));
    }
    for (const auto& e : m_store.events) {
        if (e.accountId && *e.accountId == accountId) entries.push_back(domain::ActivityFromEvent(e));
    }
    return domain::MergeActivity(std::move(entries), limit);
}

void JsonRecordRepository::createNote(domain::Note& note) {
    if (domain::Trim(note.content).empty()) {
        throw domain::StorageError("note content required");
    }
    if (note.accountId && !findAccountById(*note.accountId)) {
        throw domain::StorageError("account not found");
    }
    Store next = m_store;
    domain::Note stored = note;
    if (IsUnset(stored.createdAt)) {
        stored.createdAt = domain::Clock::now();
    }
    stored.id = next.nextNoteId++;
    stored.accountName.reset();
    next.notes.push_back(stored);
    persist(next);
    m_store = std::move(next);
    note.id = stored.id;
    note.createdAt = stored.createdAt;
}

void JsonRecordRepository::createEvent(domain::Event& event) {
    if (domain::Trim(event.title).empty()) {
        throw domain::StorageError("event title required");
    }
    if (event.accountId && !findAccountById(*event.accountId)) {
        throw domain::StorageError("account not found");
    }
    Store next = m_store;
    domain::Event stored = event;
    const domain::TimePoint now = domain::Clock::now();
    if (IsUnset(stored.eventTime)) {
        stored.eventTime = now;
    }
    if (IsUnset(stored.createdAt)) {
        stored.createdAt = now;
    }
    stored.id = next.nextEventId++;
    stored.accountName.reset();
    next.events.push_back(stored);
    persist(next);
    m_store = std::move(next);
    event.id = stored.id;
    event.eventTime = stored.eventTime;
    event.createdAt = stored.createdAt;
}

domain::ImportResult JsonRecordRepository::importAccountsCsv(std::istream& input, const std::string& defaultCreator,
                                                             const domain::TimeZone& zone) {
    domain::ImportResult result;
    CsvReader reader(input);

    std::vector<std::string> header;
    try {
        if (!reader.next(header)) {
            throw domain::StorageError("read header: empty input");
        }
    } catch (const CsvError& e) {
        throw domain::StorageError(std::string("read header: ") + e.what());
    }

    std::map<std::string, std::size_t> index;
    for (std::size_t i = 0; i < header.size(); ++i) {
        const std::string key = domain::ToLower(domain::Trim(header[i]));
        if (!key.empty()) {
            index[key] = i;
        }
    }
    if (!index.count("name")) {
        throw domain::StorageError("csv missing 'name' column");
    }

    Store next = m_store;
    int row = 1;
    std::vector<std::string> record;
    while (true) {
        try {
            if (!reader.next(record)) {
                break;
            }
        } catch (const CsvError& e) {
            result.errors.push_back("row " + std::to_string(row + 1) + ": " + e.what());
            break;
        }
        ++row;

        if (!std::all_of(record.begin(), record.end(), domain::IsValidUtf8)) {
            result.errors.push_back("row " + std::to_string(row) + ": invalid UTF-8 text");
            ++result.skipped;
            continue;
        }
        if (index["name"] >= record.size()) {
            result.errors.push_back("row " + std::to_string(row) + ": missing name field");
            ++result.skipped;
            continue;
        }
        domain::Account account;
        account.name = Field(record, index, "name");
        if (account.name.empty()) {
            result.errors.push_back("row " + std::to_string(row) + ": account name required");
            ++result.skipped;
            continue;
        }
        account.phone = Field(record, index, "phone");
        account.address = Field(record, index, "address");
        account.email = Field(record, index, "email");
        account.decisionMaker = Field(record, index, "decision_maker");

        account.creator = Field(record, index, "creator");
        if (account.creator.empty()) account.creator = defaultCreator;
        if (account.creator.empty()) account.creator = "Import";

        const std::string stamp = Field(record, index, "created_at");
        if (!stamp.empty()) {
            account.createdAt = ParseImportTime(stamp, zone).value_or(domain::TimePoint{});
        }

        try {
            insertAccount(next, account);
        } catch (const domain::AccountExistsError&) {
            result.errors.push_back("row " + std::to_string(row) + ": duplicate account '" + account.name + "'");
            ++result.skipped;
            continue;
        }
        ++result.created;
    }

    if (result.created > 0) {
        persist(next);
        m_store = std::move(next);
    }
    std::cout << "[JsonRecordRepository] CSV import: " << result.created << " created, "
              << result.skipped << " skipped" << std::endl;
    return result;
}

} // namespace crmterm::infrastructure
