/**
 * @file AccountResolver.hpp
 * @brief Maps free text typed on the account list to a single account.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/Records.hpp"

namespace crmterm::application {

/**
 * @brief Resolves an account from the list screen input.
 *
 * Order of attempts:
 *  1. blank input selects the only filtered account, if there is exactly one;
 *  2. a leading "open ", "view ", "select " or "#" is stripped;
 *  3. a positive integer is a 1-based index into @p filtered;
 *  4. exact case-insensitive name, @p filtered before @p all;
 *  5. unique case-insensitive name prefix within @p filtered, then within @p all.
 *
 * @return std::nullopt when nothing (or more than one prefix candidate) matches.
 */
std::optional<domain::Account> ResolveAccountSelection(const std::string& input,
                                                       const std::vector<domain::Account>& filtered,
                                                       const std::vector<domain::Account>& all);

} // namespace crmterm::application
