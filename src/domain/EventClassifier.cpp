#include "domain/EventClassifier.hpp"

#include <algorithm>
#include <chrono>

namespace crmterm::domain {

EventBuckets SplitEvents(const std::vector<Event>& events, TimePoint now, const TimeZone& zone) {
    const TimePoint dayStart = zone.startOfDay(now);
    const TimePoint dayEnd = dayStart + std::chrono::hours(24);

    EventBuckets buckets;
    for (const auto& event : events) {
        const TimePoint t = event.eventTime;
        if (t >= dayStart && t < dayEnd) {
            buckets.today.push_back(event);
        } else if (t > now) {
            buckets.upcoming.push_back(event);
        } else {
            buckets.past.push_back(event);
        }
    }

    auto soonestFirst = [](const Event& a, const Event& b) { return a.eventTime < b.eventTime; };
    auto latestFirst = [](const Event& a, const Event& b) { return a.eventTime > b.eventTime; };
    std::stable_sort(buckets.today.begin(), buckets.today.end(), soonestFirst);
    std::stable_sort(buckets.upcoming.begin(), buckets.upcoming.end(), soonestFirst);
    std::stable_sort(buckets.past.begin(), buckets.past.end(), latestFirst);
    return buckets;
}

} // namespace crmterm::domain
