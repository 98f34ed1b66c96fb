/**
 * @file ConfigStore.cpp
 * @brief Implementation of ConfigStore.
 */

#include "infrastructure/ConfigStore.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include "domain/TextUtils.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace crmterm::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

constexpr const char* kFallbackName = "CRM User";
constexpr const char* kFallbackZone = "UTC";

std::string ZoneFromLocaltimeLink() {
    std::error_code ec;
    const fs::path link("/etc/localtime");
    if (!fs::is_symlink(link, ec)) {
        return {};
    }
    const std::string target = fs::read_symlink(link, ec).string();
    if (ec) {
        return {};
    }
    const std::string marker = "zoneinfo/";
    const auto pos = target.find(marker);
    if (pos == std::string::npos) {
        return {};
    }
    return target.substr(pos + marker.size());
}

} // namespace

ConfigStore::ConfigStore(fs::path configFile, std::shared_ptr<PersistenceService> persistence)
    : m_configFile(std::move(configFile)), m_persistence(std::move(persistence)) {
    if (!m_persistence) {
        m_persistence = std::make_shared<PersistenceService>();
    }

    std::error_code ec;
    if (!fs::exists(m_configFile, ec)) {
        m_name = DefaultDisplayName();
        m_timezone = DetectSystemTimezone();
        write(m_name, m_timezone);
        m_location = domain::TimeZone::Load(m_timezone).value_or(domain::TimeZone::Utc());
        std::cout << "[ConfigStore] Created " << m_configFile << " (zone " << m_timezone << ")" << std::endl;
        return;
    }

    try {
        std::ifstream f(m_configFile);
        json j;
        f >> j;
        m_name = domain::Trim(j.value("name", std::string()));
        m_timezone = domain::Trim(j.value("timezone", std::string()));
    } catch (const json::exception& e) {
        std::cerr << "[ConfigStore] Error reading " << m_configFile << ": " << e.what() << std::endl;
        throw std::runtime_error("parse " + m_configFile.string() + ": " + e.what());
    }

    if (m_name.empty()) {
        m_name = DefaultDisplayName();
    }
    if (m_timezone.empty()) {
        m_timezone = kFallbackZone;
    }
    m_location = domain::TimeZone::Load(m_timezone).value_or(domain::TimeZone::Utc());
    if (m_location.name() != m_timezone) {
        std::cerr << "[ConfigStore] Unknown time zone '" << m_timezone << "', using UTC" << std::endl;
    }
}

void ConfigStore::saveDisplayName(const std::string& name) {
    const std::string trimmed = domain::Trim(name);
    if (trimmed.empty()) {
        throw std::invalid_argument("name cannot be empty");
    }
    write(trimmed, m_timezone);
    m_name = trimmed;
}

void ConfigStore::saveTimezone(const std::string& zone) {
    const std::string trimmed = domain::Trim(zone);
    auto loaded = domain::TimeZone::Load(trimmed);
    if (!loaded) {
        throw std::invalid_argument("unknown time zone '" + trimmed + "'");
    }
    write(m_name, trimmed);
    m_timezone = trimmed;
    m_location = *loaded;
}

void ConfigStore::write(const std::string& name, const std::string& zone) {
    json j;
    j["name"] = name;
    j["timezone"] = zone;
    std::string content;
    try {
        content = j.dump(2);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("encode config: ") + e.what());
    }
    m_persistence->saveText(m_configFile.string(), content);
}

std::string ConfigStore::DefaultDisplayName() {
    const char* user = std::getenv("USER");
    if (user && *user) {
        return user;
    }
    return kFallbackName;
}

std::string ConfigStore::DetectSystemTimezone() {
    const char* tz = std::getenv("TZ");
    if (tz && *tz) {
        std::string name = tz;
        if (name[0] == ':') {
            name.erase(0, 1);
        }
        if (domain::TimeZone::IsLoadable(name)) {
            return name;
        }
    }

    std::ifstream etcTimezone("/etc/timezone");
    std::string line;
    if (etcTimezone && std::getline(etcTimezone, line)) {
        line = domain::Trim(line);
        if (!line.empty() && domain::TimeZone::IsLoadable(line)) {
            return line;
        }
    }

    const std::string linked = ZoneFromLocaltimeLink();
    if (!linked.empty() && domain::TimeZone::IsLoadable(linked)) {
        return linked;
    }
    return kFallbackZone;
}

} // namespace crmterm::infrastructure
