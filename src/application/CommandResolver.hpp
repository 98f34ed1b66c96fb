/**
 * @file CommandResolver.hpp
 * @brief Resolves typed text against a fixed table of menu options.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace crmterm::application {

/**
 * @struct MenuOption
 * @brief One selectable entry of a text menu.
 */
struct MenuOption {
    std::string id;
    std::vector<std::string> keywords; ///< Matched by prefix ("dash" -> "dashboard").
    std::vector<std::string> synonyms; ///< Matched by full-string equality ("1", "q").
};

namespace menu {
inline constexpr const char* kDashboard = "dashboard";
inline constexpr const char* kAccounts = "accounts";
inline constexpr const char* kAddAccount = "add-account";
inline constexpr const char* kCreate = "create";
inline constexpr const char* kSettings = "settings";
inline constexpr const char* kQuit = "quit";
} // namespace menu

namespace account_action {
inline constexpr const char* kActivity = "activity";
inline constexpr const char* kAddNote = "add-note";
inline constexpr const char* kAddEvent = "add-event";
inline constexpr const char* kEdit = "edit-account";
inline constexpr const char* kBack = "back";
} // namespace account_action

/** @brief Options of the main menu. */
const std::vector<MenuOption>& MainMenuOptions();

/** @brief Actions offered on the account detail screen. */
const std::vector<MenuOption>& AccountDetailOptions();

/**
 * @brief Resolves @p input against @p options.
 *
 * The input is trimmed and lowercased. Synonyms are checked first, so literal
 * shortcuts always win even when they are also a prefix of another option's
 * keyword. Otherwise the input must be a prefix of keywords belonging to
 * exactly one option.
 *
 * @return The option id, or std::nullopt for empty, unknown or ambiguous input.
 */
std::optional<std::string> ResolveCommand(const std::string& input, const std::vector<MenuOption>& options);

} // namespace crmterm::application
