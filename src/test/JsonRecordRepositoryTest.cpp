#include <cassert>
#include <fstream>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "infrastructure/JsonRecordRepository.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "TestDoubles.hpp"

using namespace crmterm;
using namespace crmterm::domain;
using infrastructure::JsonRecordRepository;
using test::At;

namespace {

Account NewAccount(const std::string& name, TimePoint createdAt) {
    Account a;
    a.name = name;
    a.creator = "Tester";
    a.createdAt = createdAt;
    return a;
}

template <typename Fn>
bool Throws(Fn fn) {
    try {
        fn();
    } catch (const StorageError&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    std::cout << "[Test] Starting JsonRecordRepository Test..." << std::endl;
    test::TempDir dir("crmterm_repo");
    const auto dataFile = dir.path() / "nested" / "crmterm.json";

    std::int64_t acmeId = 0;
    {
        JsonRecordRepository repo(dataFile);
        assert(repo.listAccounts().empty());
        assert(!std::filesystem::exists(dataFile) && "Nothing is written before the first mutation.");

        std::cout << "[Test] Accounts..." << std::endl;
        Account acme = NewAccount("  Acme  ", At(1, 9));
        acme.phone = " 555-0100 ";
        repo.createAccount(acme);
        acmeId = acme.id;
        assert(acmeId > 0);
        assert(acme.name == "Acme" && acme.phone == "555-0100");
        assert(std::filesystem::exists(dataFile));

        Account beta = NewAccount("beta", At(2, 9));
        repo.createAccount(beta);
        Account corp = NewAccount("Acme Corp", At(3, 9));
        repo.createAccount(corp);
        assert(beta.id != acmeId && corp.id != beta.id);

        Account dup = NewAccount("ACME", At(4, 9));
        bool duplicate = false;
        try {
            repo.createAccount(dup);
        } catch (const AccountExistsError&) {
            duplicate = true;
        }
        assert(duplicate && "Names are unique case-insensitively.");
        Account blank = NewAccount("   ", At(4, 9));
        assert(Throws([&] { repo.createAccount(blank); }));

        auto all = repo.listAccounts();
        assert(all.size() == 3);
        assert(all[0].name == "Acme" && all[1].name == "Acme Corp" && all[2].name == "beta");

        assert(repo.searchAccounts(" acme ").size() == 2);
        assert(repo.searchAccounts("CORP").size() == 1);
        assert(repo.searchAccounts("").size() == 3);
        assert(repo.searchAccounts("zzz").empty());

        assert(repo.findAccountByName("acme corp")->id == corp.id);
        assert(!repo.findAccountByName("acm"));
        assert(repo.findAccountById(beta.id)->name == "beta");
        assert(!repo.findAccountById(9999));

        std::cout << "[Test] Update..." << std::endl;
        Account renamed = *repo.findAccountById(beta.id);
        renamed.name = "Beta Labs";
        renamed.email = "hi@beta.test";
        repo.updateAccount(renamed);
        assert(repo.findAccountById(beta.id)->email == "hi@beta.test");
        assert(repo.findAccountById(beta.id)->creator == "Tester");
        renamed.name = "acme";
        bool clash = false;
        try {
            repo.updateAccount(renamed);
        } catch (const AccountExistsError&) {
            clash = true;
        }
        assert(clash);
        // Same account keeping its own name with different case is fine.
        Account self = *repo.findAccountById(acmeId);
        self.name = "ACME";
        repo.updateAccount(self);
        self.name = "Acme";
        repo.updateAccount(self);

        std::cout << "[Test] Notes and events..." << std::endl;
        Note note;
        note.content = "Call back Monday";
        note.accountId = acmeId;
        note.creator = "Tester";
        note.createdAt = At(5, 9);
        repo.createNote(note);
        assert(note.id > 0);

        Note empty;
        empty.content = "  ";
        assert(Throws([&] { repo.createNote(empty); }));
        Note orphan;
        orphan.content = "x";
        orphan.accountId = 4242;
        assert(Throws([&] { repo.createNote(orphan); }));

        Event later;
        later.title = "Renewal";
        later.eventTime = At(20, 10);
        later.accountId = acmeId;
        later.createdAt = At(6, 9);
        repo.createEvent(later);
        Event sooner;
        sooner.title = "Intro";
        sooner.details = "first call";
        sooner.eventTime = At(10, 10);
        sooner.createdAt = At(7, 9);
        repo.createEvent(sooner);
        Event untitled;
        assert(Throws([&] { repo.createEvent(untitled); }));

        auto events = repo.listEvents();
        assert(events.size() == 2);
        assert(events[0].title == "Intro" && !events[0].accountName);
        assert(events[1].title == "Renewal" && events[1].accountName && *events[1].accountName == "Acme");

        std::cout << "[Test] Activity..." << std::endl;
        auto activity = repo.listActivity(10);
        assert(activity.size() == 6);
        assert(activity[0].kind == ActivityKind::Event && activity[0].title == "Intro");
        assert(activity[1].title == "Renewal");
        assert(activity[2].kind == ActivityKind::Note);
        assert(repo.listActivity(2).size() == 2);

        auto scoped = repo.listAccountActivity(acmeId, 10);
        assert(scoped.size() == 3);
        assert(scoped[0].kind == ActivityKind::Event);
        assert(scoped[1].kind == ActivityKind::Note);
        assert(scoped[2].kind == ActivityKind::Account && scoped[2].detail == "555-0100");
    }

    std::cout << "[Test] Reload from disk..." << std::endl;
    {
        JsonRecordRepository repo(dataFile);
        assert(repo.listAccounts().size() == 3);
        auto acme = repo.findAccountById(acmeId);
        assert(acme && acme->createdAt == At(1, 9) && acme->creator == "Tester");
        auto events = repo.listEvents();
        assert(events.size() == 2 && events[1].eventTime == At(20, 10));
        assert(repo.listAccountActivity(acmeId, 10).size() == 3);

        Account fresh = NewAccount("Gamma", At(8, 9));
        repo.createAccount(fresh);
        assert(fresh.id > acmeId && "Identifiers are never reused after a reload.");

        std::ifstream in(dataFile);
        nlohmann::json j;
        in >> j;
        assert(j["accounts"].size() == 4);
        assert(j["notes"][0]["account_id"] == acmeId);
        assert(j["events"][1]["account_id"].is_null());
        assert(j["accounts"][0]["created_at"] == "2024-03-01T09:00:00Z");
    }

    std::cout << "[Test] Failed write leaves memory unchanged..." << std::endl;
    {
        const auto blocked = dir.path() / "blocked";
        std::ofstream(blocked) << "not a directory";
        JsonRecordRepository repo(blocked / "crmterm.json");
        Account acme = NewAccount("Acme", At(1, 9));
        assert(Throws([&] { repo.createAccount(acme); }));
        assert(repo.listAccounts().empty());
    }

    std::cout << "[Test] Corrupt file is rejected at startup..." << std::endl;
    {
        const auto corrupt = dir.path() / "corrupt.json";
        std::ofstream(corrupt) << "{ not json";
        assert(Throws([&] { JsonRecordRepository repo(corrupt); }));
    }

    std::cout << "[Test] Text that cannot be encoded is a storage error..." << std::endl;
    {
        JsonRecordRepository repo(dir.path() / "encoding.json");
        Account latin1 = NewAccount("Caf\xE9", At(1, 9));
        assert(Throws([&] { repo.createAccount(latin1); }));
        assert(repo.listAccounts().empty());

        Account ok = NewAccount("Caf\xC3\xA9", At(1, 9));
        repo.createAccount(ok);
        Note note;
        note.content = "bad \xFF byte";
        note.accountId = ok.id;
        assert(Throws([&] { repo.createNote(note); }));
        assert(repo.listAccountActivity(ok.id, 10).size() == 1);
    }

    std::cout << "[Test] Sub-second order survives a reload..." << std::endl;
    {
        const auto file = dir.path() / "subsecond.json";
        const TimePoint second = At(2, 9);
        {
            JsonRecordRepository repo(file);
            Account account = NewAccount("Acme", second + std::chrono::milliseconds(100));
            repo.createAccount(account);
            Note note;
            note.content = "noted";
            note.createdAt = second + std::chrono::milliseconds(200);
            repo.createNote(note);
            Event event;
            event.title = "Kickoff";
            event.eventTime = At(3, 9) + std::chrono::microseconds(250);
            event.createdAt = second + std::chrono::milliseconds(300);
            repo.createEvent(event);
        }
        JsonRecordRepository repo(file);
        auto activity = repo.listActivity(10);
        assert(activity.size() == 3);
        assert(activity[0].kind == ActivityKind::Event);
        assert(activity[1].kind == ActivityKind::Note);
        assert(activity[2].kind == ActivityKind::Account);
        assert(repo.findAccountByName("Acme")->createdAt == second + std::chrono::milliseconds(100));
        assert(repo.listEvents()[0].eventTime == At(3, 9) + std::chrono::microseconds(250));

        std::ifstream in(file);
        nlohmann::json j;
        in >> j;
        assert(j["accounts"][0]["created_at"] == "2024-03-02T09:00:00.1Z");
        assert(j["events"][0]["event_time"] == "2024-03-03T09:00:00.00025Z");
    }

    std::cout << "[PASS] JsonRecordRepository Test Passed!" << std::endl;
    return 0;
}
