/**
 * @file TextUtils.hpp
 * @brief Small string helpers shared by the resolvers, wizards and storage.
 */

#pragma once

#include <cstddef>
#include <string>

namespace crmterm::domain {

/** @brief Removes leading and trailing ASCII whitespace. */
std::string Trim(const std::string& text);

/** @brief ASCII lowercase copy. */
std::string ToLower(const std::string& text);

/** @brief Case-insensitive (ASCII) equality. */
bool EqualsIgnoreCase(const std::string& a, const std::string& b);

bool StartsWith(const std::string& text, const std::string& prefix);

/** @brief Number of UTF-8 code points in @p text. */
std::size_t Utf8Length(const std::string& text);

/** @brief True if @p text is well-formed UTF-8 (no overlongs, surrogates or stray bytes). */
bool IsValidUtf8(const std::string& text);

/**
 * @brief Keeps at most @p maxChars code points, never splitting a UTF-8 sequence.
 */
std::string TruncateUtf8(const std::string& text, std::size_t maxChars);

} // namespace crmterm::domain
