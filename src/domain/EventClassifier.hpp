/**
 * @file EventClassifier.hpp
 * @brief Partitions scheduled events into today / upcoming / past relative to "now".
 */

#pragma once

#include <vector>

#include "domain/Records.hpp"
#include "domain/TimeZone.hpp"

namespace crmterm::domain {

/**
 * @struct EventBuckets
 * @brief Result of SplitEvents.
 */
struct EventBuckets {
    std::vector<Event> today;    ///< Soonest first.
    std::vector<Event> upcoming; ///< Later days, soonest first.
    std::vector<Event> past;     ///< Most recent first.
};

/**
 * @brief Classifies events against the calendar day containing @p now in @p zone.
 *
 * today is [dayStart, dayStart + 24h), upcoming is after @p now outside that
 * window and everything else is past. Sorting is stable: events with equal
 * timestamps keep the order they had in @p events.
 */
EventBuckets SplitEvents(const std::vector<Event>& events, TimePoint now, const TimeZone& zone);

} // namespace crmterm::domain
