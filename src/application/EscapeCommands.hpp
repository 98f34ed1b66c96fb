/**
 * @file EscapeCommands.hpp
 * @brief The two tokens every text-accepting screen honors before its own grammar.
 */

#pragma once

#include <string>

namespace crmterm::application {

/** @brief "exit." or "quit" (trimmed, case-insensitive): clear history, go to the main menu. */
bool IsExitCommand(const std::string& input);

/** @brief "/" or "back" (trimmed, case-insensitive): previous stage or previous screen. */
bool IsBackCommand(const std::string& input);

/**
 * @brief Exit spellings accepted by the command-style screens (dashboard, create, settings),
 *        which also take a bare "exit".
 */
bool IsMenuExitCommand(const std::string& input);

} // namespace crmterm::application
