/**
 * @file ViewCommon.hpp
 * @brief Formatting helpers shared by the screens.
 */

#pragma once

#include <string>
#include <vector>

#include "application/Session.hpp"
#include "application/views/StyledText.hpp"
#include "domain/Records.hpp"
#include "domain/TimeZone.hpp"

namespace crmterm::application {

inline constexpr const char* kStampLong = "%b %d %Y %H:%M";
inline constexpr const char* kStampShort = "%b %d %H:%M";
inline constexpr const char* kStampEvent = "%a %b %d %H:%M";

/** @brief Appends the session info (Success) and error (Danger) lines, if any. */
void AppendMessages(const Session& session, std::vector<StyledLine>& lines);

/** @brief Phone, email and decision maker joined on one line; empty if none is set. */
std::string AccountMetaLine(const domain::Account& account);

/** @brief "Created by <creator> on <stamp>". */
std::string CreatedByLine(const domain::Account& account, const domain::TimeZone& zone);

/** @brief "[Note] title - Jan 02 15:04" */
std::string ActivityLine(const domain::Activity& activity, const domain::TimeZone& zone);

/** @brief "Mon Jan 02 15:04 - title (account) · details · by creator" */
std::string EventLine(const domain::Event& event, const domain::TimeZone& zone);

} // namespace crmterm::application
