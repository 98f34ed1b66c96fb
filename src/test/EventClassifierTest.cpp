#include <cassert>
#include <iostream>

#include "domain/EventClassifier.hpp"
#include "TestDoubles.hpp"

using namespace crmterm::domain;
using crmterm::test::At;

namespace {

Event Make(std::int64_t id, TimePoint t) {
    Event e;
    e.id = id;
    e.title = "event " + std::to_string(id);
    e.eventTime = t;
    return e;
}

std::vector<std::int64_t> Ids(const std::vector<Event>& events) {
    std::vector<std::int64_t> ids;
    for (const auto& e : events) ids.push_back(e.id);
    return ids;
}

} // namespace

int main() {
    std::cout << "[Test] Starting EventClassifier Test..." << std::endl;
    const TimeZone utc = TimeZone::Utc();
    const TimePoint now = At(15, 12);       // Mar 15 12:00 UTC
    const TimePoint dayStart = At(15, 0);

    std::cout << "[Test] Day boundaries..." << std::endl;
    {
        std::vector<Event> events = {
            Make(1, dayStart),
            Make(2, dayStart - Clock::duration(1)),
            Make(3, dayStart + std::chrono::hours(24)),
            Make(4, dayStart + std::chrono::hours(24) - Clock::duration(1)),
        };
        auto buckets = SplitEvents(events, now, utc);
        assert((Ids(buckets.today) == std::vector<std::int64_t>{1, 4}));
        assert((Ids(buckets.past) == std::vector<std::int64_t>{2}));
        assert((Ids(buckets.upcoming) == std::vector<std::int64_t>{3}));
    }

    std::cout << "[Test] Earlier today is still today..." << std::endl;
    {
        auto buckets = SplitEvents({Make(1, At(15, 8)), Make(2, At(15, 18))}, now, utc);
        assert((Ids(buckets.today) == std::vector<std::int64_t>{1, 2}));
        assert(buckets.past.empty() && buckets.upcoming.empty());
    }

    std::cout << "[Test] Ordering..." << std::endl;
    {
        std::vector<Event> events = {
            Make(1, At(20, 9)), Make(2, At(17, 9)), Make(3, At(10, 9)),
            Make(4, At(12, 9)), Make(5, At(15, 14)), Make(6, At(15, 9)),
        };
        auto buckets = SplitEvents(events, now, utc);
        assert((Ids(buckets.upcoming) == std::vector<std::int64_t>{2, 1}));
        assert((Ids(buckets.past) == std::vector<std::int64_t>{4, 3}));
        assert((Ids(buckets.today) == std::vector<std::int64_t>{6, 5}));
    }

    std::cout << "[Test] Equal timestamps keep storage order..." << std::endl;
    {
        std::vector<Event> events = {
            Make(7, At(18, 10)), Make(3, At(18, 10)), Make(5, At(18, 10)),
            Make(9, At(2, 10)), Make(1, At(2, 10)),
        };
        auto buckets = SplitEvents(events, now, utc);
        assert((Ids(buckets.upcoming) == std::vector<std::int64_t>{7, 3, 5}));
        assert((Ids(buckets.past) == std::vector<std::int64_t>{9, 1}));
    }

    std::cout << "[Test] Day window follows the configured zone..." << std::endl;
    if (auto tokyo = TimeZone::Load("Asia/Tokyo")) {
        // 12:00 UTC is 21:00 in Tokyo; the Tokyo day started at Mar 14 15:00 UTC.
        auto buckets = SplitEvents({Make(1, At(14, 16)), Make(2, At(15, 16))}, now, *tokyo);
        assert((Ids(buckets.today) == std::vector<std::int64_t>{1}));
        assert((Ids(buckets.upcoming) == std::vector<std::int64_t>{2}));
    } else {
        std::cout << "[Test] Asia/Tokyo not installed, skipping." << std::endl;
    }

    std::cout << "[PASS] EventClassifier Test Passed!" << std::endl;
    return 0;
}
