#include <cassert>
#include <fstream>
#include <iostream>
#include <sstream>

#include "application/Session.hpp"
#include "application/SessionController.hpp"
#include "infrastructure/CsvReader.hpp"
#include "infrastructure/JsonRecordRepository.hpp"
#include "domain/TextUtils.hpp"
#include "TestDoubles.hpp"

using namespace crmterm;
using namespace crmterm::domain;
using infrastructure::CsvError;
using infrastructure::CsvReader;
using infrastructure::JsonRecordRepository;
using test::At;

namespace {

std::vector<std::vector<std::string>> ReadAll(const std::string& text) {
    std::istringstream in(text);
    CsvReader reader(in);
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> record;
    while (reader.next(record)) {
        rows.push_back(record);
    }
    return rows;
}

void TestReader() {
    std::cout << "[Test] CSV reader..." << std::endl;
    auto rows = ReadAll("name,phone\r\nAcme,555\r\n\r\n\"Beta, Inc\",\"say \"\"hi\"\"\"\n");
    assert(rows.size() == 3);
    assert(rows[0][0] == "name" && rows[0][1] == "phone");
    assert(rows[1][1] == "555");
    assert(rows[2][0] == "Beta, Inc");
    assert(rows[2][1] == "say \"hi\"");

    rows = ReadAll("a, b,c\n\"multi\nline\",x");
    assert(rows.size() == 2);
    assert(rows[0][1] == "b" && "Leading spaces are dropped.");
    assert(rows[1][0] == "multi\nline" && rows[1][1] == "x");

    rows = ReadAll("one\ntwo,three,four\n");
    assert(rows[0].size() == 1 && rows[1].size() == 3);
    assert(ReadAll("").empty());
    assert(ReadAll("\n  \n").empty());

    bool failed = false;
    try {
        ReadAll("name\n\"open");
    } catch (const CsvError& e) {
        failed = std::string(e.what()).find("line 2") != std::string::npos;
    }
    assert(failed);
}

void TestUtf8Check() {
    std::cout << "[Test] UTF-8 validation..." << std::endl;
    assert(IsValidUtf8(""));
    assert(IsValidUtf8("plain ascii"));
    assert(IsValidUtf8("Caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80"));
    assert(!IsValidUtf8("Caf\xE9"));
    assert(!IsValidUtf8("\xC3"));
    assert(!IsValidUtf8("\xC0\xAF") && "Overlong encodings are rejected.");
    assert(!IsValidUtf8("\xED\xA0\x80") && "Surrogates are rejected.");
    assert(!IsValidUtf8("\xF4\x90\x80\x80"));
    assert(!IsValidUtf8("\x80"));
}

void TestImport(const std::filesystem::path& dir) {
    std::cout << "[Test] CSV import..." << std::endl;
    JsonRecordRepository repo(dir / "import.json");
    Account existing;
    existing.name = "Acme";
    existing.creator = "Tester";
    repo.createAccount(existing);

    const TimeZone utc = TimeZone::Utc();
    std::istringstream csv(
        " Name ,PHONE,Email,Creator,Created_At,Decision_Maker\n"
        "Beta,555-0101,b@beta.test,Dana,2024-03-02T08:30:00Z,Bo\n"
        "acme,555,,,,\n"
        ",nobody,,,,\n"
        "Gamma,,,,2024-03-04 10:15,\n"
        "Delta,,,,2024-03-05,\n"
        "Epsilon,,,,garbage,\n"
        "beta,dup in file,,,,\n");
    const ImportResult result = repo.importAccountsCsv(csv, "Importer", utc);

    assert(result.created == 4);
    assert(result.skipped == 3);
    assert(result.errors.size() == 3);
    assert(result.errors[0] == "row 3: duplicate account 'acme'");
    assert(result.errors[1] == "row 4: account name required");
    assert(result.errors[2] == "row 8: duplicate account 'beta'");

    auto beta = repo.findAccountByName("beta");
    assert(beta && beta->phone == "555-0101" && beta->email == "b@beta.test");
    assert(beta->decisionMaker == "Bo");
    assert(beta->creator == "Dana");
    assert(beta->createdAt == At(2, 8, 30));

    auto gamma = repo.findAccountByName("Gamma");
    assert(gamma && gamma->creator == "Importer");
    assert(gamma->createdAt == At(4, 10, 15));
    assert(repo.findAccountByName("Delta")->createdAt == At(5, 0));
    assert(repo.findAccountByName("Epsilon")->createdAt != TimePoint{} && "Unparseable stamps fall back to now.");

    std::istringstream fallback("name\nZeta\n");
    repo.importAccountsCsv(fallback, "", utc);
    assert(repo.findAccountByName("Zeta")->creator == "Import");

    std::cout << "[Test] Short rows and header errors..." << std::endl;
    std::istringstream shortRow("phone,name\n555\nEta,Theta\n");
    auto partial = repo.importAccountsCsv(shortRow, "Importer", utc);
    assert(partial.created == 1 && partial.skipped == 1);
    assert(partial.errors[0] == "row 2: missing name field");
    assert(repo.findAccountByName("Theta")->phone == "Eta");

    std::istringstream unterminated("name\nIota\n\"Kappa\n");
    auto stopped = repo.importAccountsCsv(unterminated, "Importer", utc);
    assert(stopped.created == 1);
    assert(stopped.errors.size() == 1 && stopped.errors[0].rfind("row 3: ", 0) == 0);
    assert(repo.findAccountByName("Iota"));

    auto throwsStorage = [&](const std::string& text) {
        std::istringstream in(text);
        try {
            repo.importAccountsCsv(in, "Importer", utc);
        } catch (const StorageError& e) {
            return std::string(e.what());
        }
        return std::string();
    };
    assert(throwsStorage("") == "read header: empty input");
    assert(throwsStorage("phone,email\n1,2\n") == "csv missing 'name' column");
    assert(throwsStorage("\"name\n").rfind("read header: ", 0) == 0);

    std::cout << "[Test] Rows that are not UTF-8..." << std::endl;
    std::istringstream latin1("name,phone\nCaf\xE9 Roma,555\nCaf\xC3\xA9 Milano,556\nOslo,\xFF\n");
    auto encoded = repo.importAccountsCsv(latin1, "Importer", utc);
    assert(encoded.created == 1 && encoded.skipped == 2);
    assert(encoded.errors.size() == 2);
    assert(encoded.errors[0] == "row 2: invalid UTF-8 text");
    assert(encoded.errors[1] == "row 4: invalid UTF-8 text");
    assert(repo.findAccountByName("Caf\xC3\xA9 Milano"));
    assert(!repo.findAccountByName("Oslo"));

    JsonRecordRepository reloaded(dir / "import.json");
    assert(reloaded.listAccounts().size() == repo.listAccounts().size());
}

void TestImportCommand(const std::filesystem::path& dir) {
    std::cout << "[Test] Import command in the account list..." << std::endl;
    JsonRecordRepository repo(dir / "command.json");
    test::InMemoryPreferences prefs;
    application::Session session(repo, prefs, [] { return At(15, 12); });
    application::SessionController controller(session);

    const auto csvPath = dir / "accounts.csv";
    std::ofstream(csvPath) << "name,phone\nAcme,555\n,\nBeta,556\n";

    controller.Submit("accounts");
    assert(controller.ActiveView() == application::ViewId::AccountList);
    assert(session.accountList.accounts.empty());

    controller.Edit("import " + csvPath.string());
    assert(session.accountList.filter.empty() && "Typing an import command does not filter.");

    controller.Submit("import " + csvPath.string());
    assert(controller.ActiveView() == application::ViewId::AccountList);
    assert(session.info() == "Imported 2 account(s), skipped 1");
    assert(session.error() == "row 3: account name required");
    assert(session.accountList.accounts.size() == 2);
    assert(session.accountList.filtered.size() == 2);

    controller.Submit("import " + (dir / "missing.csv").string());
    assert(session.error().rfind("open file: ", 0) == 0);

    controller.Submit("import");
    assert(session.error() == "Provide a CSV path");
    assert(controller.ActiveView() == application::ViewId::AccountList);
}

} // namespace

int main() {
    std::cout << "[Test] Starting CSV Import Test..." << std::endl;
    test::TempDir dir("crmterm_csv");
    TestReader();
    TestUtf8Check();
    TestImport(dir.path());
    TestImportCommand(dir.path());
    std::cout << "[PASS] CSV Import Test Passed!" << std::endl;
    return 0;
}
