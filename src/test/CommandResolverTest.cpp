#include <cassert>
#include <iostream>

#include "application/CommandResolver.hpp"
#include "application/EscapeCommands.hpp"

using namespace crmterm::application;

namespace {

bool Resolves(const std::string& input, const char* expected, const std::vector<MenuOption>& options) {
    auto id = ResolveCommand(input, options);
    return id && *id == expected;
}

} // namespace

int main() {
    std::cout << "[Test] Starting CommandResolver Test..." << std::endl;
    const auto& mainMenu = MainMenuOptions();
    const auto& detail = AccountDetailOptions();

    std::cout << "[Test] Synonyms..." << std::endl;
    assert(Resolves("1", menu::kDashboard, mainMenu));
    assert(Resolves("  D  ", menu::kDashboard, mainMenu));
    assert(Resolves("View Accounts", menu::kAccounts, mainMenu));
    assert(Resolves("new account", menu::kAddAccount, mainMenu));
    assert(Resolves("create event", menu::kCreate, mainMenu));
    assert(Resolves("help", menu::kSettings, mainMenu));
    assert(Resolves("q", menu::kQuit, mainMenu));
    assert(Resolves("exit.", menu::kQuit, mainMenu));

    std::cout << "[Test] Synonym beats a prefix of another keyword..." << std::endl;
    const std::vector<MenuOption> overlapping = {
        {"alpha", {"alpha"}, {"al"}},
        {"algebra", {"algebra"}, {}},
    };
    assert(Resolves("al", "alpha", overlapping));
    assert(Resolves("alg", "algebra", overlapping));
    assert(!ResolveCommand("a", overlapping));
    assert(Resolves("exit", account_action::kBack, detail));

    std::cout << "[Test] Unambiguous prefixes..." << std::endl;
    assert(Resolves("das", menu::kDashboard, mainMenu));
    assert(Resolves("acc", menu::kAccounts, mainMenu));
    assert(Resolves("sett", menu::kSettings, mainMenu));
    assert(Resolves("cre", menu::kCreate, mainMenu));
    assert(Resolves("timel", account_action::kActivity, detail));
    assert(Resolves("upd", account_action::kEdit, detail));

    std::cout << "[Test] Failures..." << std::endl;
    assert(!ResolveCommand("", mainMenu));
    assert(!ResolveCommand("   ", mainMenu));
    assert(!ResolveCommand("xyz", mainMenu));
    assert(!ResolveCommand("7", mainMenu));
    // "e" prefixes both "event" (create) and "exit" (quit).
    assert(!ResolveCommand("e", mainMenu));
    // "a" prefixes "accounts" and "add".
    assert(!ResolveCommand("a", mainMenu));

    std::cout << "[Test] Escape tokens..." << std::endl;
    assert(IsExitCommand("exit."));
    assert(IsExitCommand(" QUIT "));
    assert(!IsExitCommand("exit"));
    assert(IsBackCommand("/"));
    assert(IsBackCommand("Back"));
    assert(!IsBackCommand("b"));
    assert(IsMenuExitCommand("exit"));
    assert(IsMenuExitCommand("exit."));

    std::cout << "[PASS] CommandResolver Test Passed!" << std::endl;
    return 0;
}
