/**
 * @file ActivityFeed.hpp
 * @brief Builds the unified newest-first activity feed from heterogeneous records.
 */

#pragma once

#include <cstddef>
#include <vector>

#include "domain/Records.hpp"

namespace crmterm::domain {

/** @brief Limit applied when callers pass a non-positive one. */
constexpr int kDefaultActivityLimit = 20;

/** @brief Maximum characters kept from note content and event details. */
constexpr std::size_t kActivitySnippetChars = 80;

/** @brief Account creation entry: title = name, detail = phone. */
Activity ActivityFromAccount(const Account& account);

/** @brief Note entry: title = first 80 characters of the content, empty detail. */
Activity ActivityFromNote(const Note& note);

/** @brief Event entry: title = event title, detail = first 80 characters of the details. */
Activity ActivityFromEvent(const Event& event);

/**
 * @brief Orders entries newest first and keeps at most @p limit of them.
 *
 * Entries sharing a timestamp keep their input order.
 */
std::vector<Activity> MergeActivity(std::vector<Activity> entries, int limit);

} // namespace crmterm::domain
