#include <cassert>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "infrastructure/ConfigStore.hpp"
#include "TestDoubles.hpp"

using crmterm::infrastructure::ConfigStore;
namespace fs = std::filesystem;

namespace {

nlohmann::json ReadJson(const fs::path& path) {
    std::ifstream in(path);
    nlohmann::json j;
    in >> j;
    return j;
}

void TestDefaults(const fs::path& dir) {
    std::cout << "[Test] Defaults for a missing file..." << std::endl;
    setenv("USER", "dana", 1);
    setenv("TZ", ":UTC", 1);
    assert(ConfigStore::DefaultDisplayName() == "dana");
    assert(ConfigStore::DetectSystemTimezone() == "UTC");

    const fs::path file = dir / "fresh" / "config.json";
    ConfigStore store(file);
    assert(fs::exists(file));
    assert(store.displayName() == "dana");
    assert(store.timezone() == "UTC");
    assert(store.location().name() == "UTC");

    const auto j = ReadJson(file);
    assert(j["name"] == "dana");
    assert(j["timezone"] == "UTC");

    setenv("USER", "", 1);
    assert(ConfigStore::DefaultDisplayName() == "CRM User");
}

void TestSaveAndReload(const fs::path& dir) {
    std::cout << "[Test] Save and reload..." << std::endl;
    const fs::path file = dir / "config.json";
    {
        ConfigStore store(file);
        store.saveDisplayName("  Sam Rivera ");
        assert(store.displayName() == "Sam Rivera");

        bool rejected = false;
        try {
            store.saveDisplayName("   ");
        } catch (const std::invalid_argument&) {
            rejected = true;
        }
        assert(rejected && store.displayName() == "Sam Rivera");

        bool unencodable = false;
        try {
            store.saveDisplayName("Caf\xE9");
        } catch (const std::runtime_error&) {
            unencodable = true;
        }
        assert(unencodable && store.displayName() == "Sam Rivera");

        rejected = false;
        try {
            store.saveTimezone("Mars/Olympus_Mons");
        } catch (const std::invalid_argument& e) {
            rejected = std::string(e.what()) == "unknown time zone 'Mars/Olympus_Mons'";
        }
        assert(rejected && store.timezone() == "UTC");

        if (crmterm::domain::TimeZone::IsLoadable("Europe/Berlin")) {
            store.saveTimezone("Europe/Berlin");
            assert(store.timezone() == "Europe/Berlin");
            assert(store.location().name() == "Europe/Berlin");
        }
    }

    ConfigStore reloaded(file);
    assert(reloaded.displayName() == "Sam Rivera");
    assert(ReadJson(file)["name"] == "Sam Rivera");
}

void TestBlankValues(const fs::path& dir) {
    std::cout << "[Test] Blank values fall back to defaults..." << std::endl;
    setenv("USER", "robin", 1);
    const fs::path file = dir / "blank.json";
    std::ofstream(file) << R"({"name": "  ", "timezone": ""})";
    ConfigStore store(file);
    assert(store.displayName() == "robin");
    assert(store.timezone() == "UTC");
}

void TestUnknownZoneOnDisk(const fs::path& dir) {
    std::cout << "[Test] Unknown zone on disk behaves as UTC..." << std::endl;
    const fs::path file = dir / "odd.json";
    std::ofstream(file) << R"({"name": "Kim", "timezone": "Nowhere/Special"})";
    ConfigStore store(file);
    assert(store.timezone() == "Nowhere/Special");
    assert(store.location().name() == "UTC");
}

void TestZoneLoadedOnce(const fs::path& dir) {
    std::cout << "[Test] Zone is read once, not on every lookup..." << std::endl;
    const fs::path system("/usr/share/zoneinfo/Europe/Berlin");
    if (!fs::exists(system)) {
        std::cout << "[Test] Europe/Berlin not installed, skipped." << std::endl;
        return;
    }
    const fs::path zoneRoot = dir / "zoneinfo";
    fs::create_directories(zoneRoot / "Europe");
    fs::copy_file(system, zoneRoot / "Europe" / "Berlin");
    setenv("TZDIR", zoneRoot.c_str(), 1);

    const fs::path file = dir / "berlin.json";
    std::ofstream(file) << R"({"name": "Kim", "timezone": "Europe/Berlin"})";
    ConfigStore store(file);
    assert(store.location().name() == "Europe/Berlin");

    fs::remove(zoneRoot / "Europe" / "Berlin");
    assert(!crmterm::domain::TimeZone::IsLoadable("Europe/Berlin"));
    assert(store.location().name() == "Europe/Berlin");
    assert(store.location().name() == "Europe/Berlin");

    bool rejected = false;
    try {
        store.saveTimezone("Europe/Berlin");
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    assert(rejected && "Saving validates against the database again.");
    store.saveTimezone("UTC");
    assert(store.location().name() == "UTC");

    unsetenv("TZDIR");
}

void TestCorruptFile(const fs::path& dir) {
    std::cout << "[Test] Corrupt file..." << std::endl;
    const fs::path file = dir / "corrupt.json";
    std::ofstream(file) << "{\"name\": ";
    bool failed = false;
    try {
        ConfigStore store(file);
    } catch (const std::runtime_error&) {
        failed = true;
    }
    assert(failed);
}

void TestFailedWriteKeepsValues(const fs::path& dir) {
    std::cout << "[Test] Failed write keeps the previous values..." << std::endl;
    const fs::path sub = dir / "gone";
    const fs::path file = sub / "config.json";
    ConfigStore store(file);
    store.saveDisplayName("Before");

    // Replace the directory by a plain file so the next write cannot land.
    fs::remove_all(sub);
    std::ofstream(sub) << "blocker";

    bool failed = false;
    try {
        store.saveDisplayName("After");
    } catch (const std::runtime_error&) {
        failed = true;
    }
    assert(failed);
    assert(store.displayName() == "Before");
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConfigStore Test..." << std::endl;
    crmterm::test::TempDir dir("crmterm_config");
    TestDefaults(dir.path());
    TestSaveAndReload(dir.path());
    TestBlankValues(dir.path());
    TestUnknownZoneOnDisk(dir.path());
    TestZoneLoadedOnce(dir.path());
    TestCorruptFile(dir.path());
    TestFailedWriteKeepsValues(dir.path());
    std::cout << "[PASS] ConfigStore Test Passed!" << std::endl;
    return 0;
}
