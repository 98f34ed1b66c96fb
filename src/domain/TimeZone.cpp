/**
 * @file TimeZone.cpp
 * @brief Implementation of TimeZone and the RFC 3339 helpers.
 */

#include "domain/TimeZone.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace crmterm::domain {

namespace {

constexpr const char* kUtcName = "UTC";

std::filesystem::path ZoneInfoRoot() {
    const char* tzdir = std::getenv("TZDIR");
    if (tzdir && *tzdir) {
        return std::filesystem::path(tzdir);
    }
    return std::filesystem::path("/usr/share/zoneinfo");
}

/**
 * Points the C library at @p name. TZ stays set afterwards and is only
 * rewritten (and tzset() called) when the zone differs from the last one applied.
 */
void ApplyZone(const std::string& name) {
    static std::string applied;
    const char* current = std::getenv("TZ");
    if (current && applied == name && name == current) {
        return;
    }
    setenv("TZ", name.c_str(), 1);
    tzset();
    applied = name;
}

std::time_t ToTimeT(TimePoint t) {
    return static_cast<std::time_t>(
        std::chrono::floor<std::chrono::seconds>(t.time_since_epoch()).count());
}

} // namespace

TimeZone::TimeZone() : m_name(kUtcName) {}

TimeZone::TimeZone(std::string name) : m_name(std::move(name)) {}

TimeZone TimeZone::Utc() {
    return TimeZone();
}

std::optional<TimeZone> TimeZone::Load(const std::string& name) {
    if (!IsLoadable(name)) {
        return std::nullopt;
    }
    return TimeZone(name);
}

bool TimeZone::IsLoadable(const std::string& name) {
    if (name.empty()) return false;
    if (name == kUtcName) return true;
    if (name.front() == '/' || name.find("..") != std::string::npos || name.find('\\') != std::string::npos) {
        return false;
    }

    std::filesystem::path file = ZoneInfoRoot() / name;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
        return false;
    }
    std::ifstream in(file, std::ios::binary);
    char magic[4] = {};
    if (!in.read(magic, sizeof(magic))) {
        return false;
    }
    return magic[0] == 'T' && magic[1] == 'Z' && magic[2] == 'i' && magic[3] == 'f';
}

bool TimeZone::isUtc() const {
    return m_name == kUtcName;
}

std::tm TimeZone::toLocal(TimePoint t) const {
    std::time_t tt = ToTimeT(t);
    std::tm tm = {};
    if (isUtc()) {
        gmtime_r(&tt, &tm);
        return tm;
    }
    ApplyZone(m_name);
    localtime_r(&tt, &tm);
    return tm;
}

TimePoint TimeZone::fromLocal(const std::tm& fields) const {
    std::tm copy = fields;
    copy.tm_isdst = -1;
    std::time_t tt = 0;
    if (isUtc()) {
        tt = timegm(&copy);
    } else {
        ApplyZone(m_name);
        tt = std::mktime(&copy);
    }
    return Clock::from_time_t(tt);
}

TimePoint TimeZone::startOfDay(TimePoint t) const {
    std::tm local = toLocal(t);
    local.tm_hour = 0;
    local.tm_min = 0;
    local.tm_sec = 0;
    return fromLocal(local);
}

std::string TimeZone::format(TimePoint t, const char* pattern) const {
    std::tm local = toLocal(t);
    char buffer[128];
    std::size_t written = std::strftime(buffer, sizeof(buffer), pattern, &local);
    return std::string(buffer, written);
}

std::optional<TimePoint> TimeZone::parseLocal(const std::string& text, const char* pattern) const {
    std::tm fields = {};
    std::istringstream in(text);
    in >> std::get_time(&fields, pattern);
    if (in.fail()) {
        return std::nullopt;
    }
    if (in.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }

    TimePoint parsed = fromLocal(fields);

    // mktime normalizes 2024-02-30 into March; reject instead.
    std::tm back = toLocal(parsed);
    if (back.tm_year != fields.tm_year || back.tm_mon != fields.tm_mon || back.tm_mday != fields.tm_mday) {
        return std::nullopt;
    }
    return parsed;
}

std::string FormatRfc3339Utc(TimePoint t) {
    std::time_t tt = ToTimeT(t);
    std::tm tm = {};
    gmtime_r(&tt, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

std::string FormatRfc3339UtcNano(TimePoint t) {
    const auto sinceEpoch = std::chrono::duration_cast<std::chrono::nanoseconds>(t.time_since_epoch());
    const auto whole = std::chrono::floor<std::chrono::seconds>(sinceEpoch);
    const long long nanos = (sinceEpoch - whole).count();
    std::string text = FormatRfc3339Utc(t);
    if (nanos == 0) {
        return text;
    }
    char fraction[16];
    std::snprintf(fraction, sizeof(fraction), ".%09lld", nanos);
    std::string digits(fraction);
    while (digits.back() == '0') {
        digits.pop_back();
    }
    text.insert(text.size() - 1, digits);
    return text;
}

std::optional<TimePoint> ParseRfc3339(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    std::size_t pos = static_cast<std::size_t>(consumed);
    long long nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 9) {
                nanos = nanos * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (; digits < 9; ++digits) nanos *= 10;
    }

    long offsetSeconds = 0;
    if (pos >= text.size()) {
        return std::nullopt;
    }
    if (text[pos] == 'Z' || text[pos] == 'z') {
        ++pos;
    } else if (text[pos] == '+' || text[pos] == '-') {
        int offHour = 0, offMinute = 0;
        int offConsumed = 0;
        if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d%n", &offHour, &offMinute, &offConsumed) != 2) {
            return std::nullopt;
        }
        offsetSeconds = offHour * 3600L + offMinute * 60L;
        if (text[pos] == '-') offsetSeconds = -offsetSeconds;
        pos += 1 + static_cast<std::size_t>(offConsumed);
    } else {
        return std::nullopt;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    std::time_t tt = timegm(&tm) - offsetSeconds;
    return Clock::from_time_t(tt) + std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(nanos));
}

} // namespace crmterm::domain
