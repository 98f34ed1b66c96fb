#include <cassert>
#include <cstdlib>
#include <iostream>

#include "domain/TimeZone.hpp"
#include "TestDoubles.hpp"

using namespace crmterm::domain;
using crmterm::test::At;

namespace {

void TestAlternatingZones() {
    std::cout << "[Test] Alternating zones..." << std::endl;
    auto tokyo = TimeZone::Load("Asia/Tokyo");
    auto ny = TimeZone::Load("America/New_York");
    if (!tokyo || !ny) {
        std::cout << "[Test] Asia/Tokyo or America/New_York not installed, skipping." << std::endl;
        return;
    }
    const TimeZone utc = TimeZone::Utc();
    const TimePoint t = At(15, 12); // Mar 15 12:00 UTC, EDT in effect

    for (int round = 0; round < 3; ++round) {
        assert(tokyo->format(t, "%H:%M") == "21:00");
        assert(tokyo->format(t, "%H:%M") == "21:00");
        assert(ny->format(t, "%H:%M") == "08:00");
        assert(utc.format(t, "%H:%M") == "12:00");
        assert(tokyo->startOfDay(t) == At(14, 15));
        assert(ny->startOfDay(t) == At(15, 4));
        assert(ny->parseLocal("2024-03-15 08:00", "%Y-%m-%d %H:%M") == t);
        assert(tokyo->parseLocal("2024-03-15 21:00", "%Y-%m-%d %H:%M") == t);
    }

    // An outside change of TZ is picked up by the next conversion.
    assert(ny->format(t, "%H:%M") == "08:00");
    setenv("TZ", "UTC", 1);
    assert(ny->format(t, "%H:%M") == "08:00");
    assert(std::string(std::getenv("TZ")) == "America/New_York");
}

void TestRfc3339() {
    std::cout << "[Test] RFC 3339 formatting..." << std::endl;
    const TimePoint t = At(2, 9, 30);
    assert(FormatRfc3339Utc(t) == "2024-03-02T09:30:00Z");
    assert(FormatRfc3339UtcNano(t) == "2024-03-02T09:30:00Z");
    assert(FormatRfc3339Utc(t + std::chrono::milliseconds(750)) == "2024-03-02T09:30:00Z");
    assert(FormatRfc3339UtcNano(t + std::chrono::milliseconds(750)) == "2024-03-02T09:30:00.75Z");
    assert(FormatRfc3339UtcNano(t + std::chrono::nanoseconds(1)) == "2024-03-02T09:30:00.000000001Z");

    const TimePoint precise = t + std::chrono::nanoseconds(123456789);
    assert(ParseRfc3339(FormatRfc3339UtcNano(precise)) == precise);
    assert(ParseRfc3339("2024-03-02T10:30:00+01:00") == t);
    assert(!ParseRfc3339("2024-03-02 09:30:00Z"));
    assert(!ParseRfc3339("2024-03-02T09:30:00."));
}

} // namespace

int main() {
    std::cout << "[Test] Starting TimeZone Test..." << std::endl;
    TestAlternatingZones();
    TestRfc3339();
    std::cout << "[PASS] TimeZone Test Passed!" << std::endl;
    return 0;
}
