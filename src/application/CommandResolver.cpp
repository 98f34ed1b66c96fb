#include "application/CommandResolver.hpp"

#include <set>

#include "domain/TextUtils.hpp"

namespace crmterm::application {

const std::vector<MenuOption>& MainMenuOptions() {
    static const std::vector<MenuOption> options = {
        {menu::kDashboard, {"dashboard"}, {"1", "d", "dash", "dashboard"}},
        {menu::kAccounts, {"accounts"}, {"2", "accounts", "account", "view", "view accounts"}},
        {menu::kAddAccount, {"add", "new"}, {"3", "add", "add account", "new account"}},
        {menu::kCreate, {"create", "note", "event"}, {"4", "create", "note", "event", "create note", "create event"}},
        {menu::kSettings, {"settings", "help"}, {"5", "settings", "help", "settings & help"}},
        {menu::kQuit, {"quit", "exit"}, {"6", "quit", "exit", "exit.", "q"}},
    };
    return options;
}

const std::vector<MenuOption>& AccountDetailOptions() {
    static const std::vector<MenuOption> options = {
        {account_action::kActivity, {"activity", "timeline"}, {"1", "activity", "view", "timeline"}},
        {account_action::kAddNote, {"note"}, {"2", "note", "add note", "create note"}},
        {account_action::kAddEvent, {"event"}, {"3", "event", "add event", "create event"}},
        {account_action::kEdit, {"edit", "update"}, {"4", "edit", "update"}},
        {account_action::kBack, {"back", "close"}, {"5", "back", "exit", "exit.", "/"}},
    };
    return options;
}

std::optional<std::string> ResolveCommand(const std::string& input, const std::vector<MenuOption>& options) {
    const std::string value = domain::ToLower(domain::Trim(input));
    if (value.empty()) {
        return std::nullopt;
    }

    for (const auto& option : options) {
        for (const auto& synonym : option.synonyms) {
            if (value == synonym) {
                return option.id;
            }
        }
    }

    std::set<std::string> candidates;
    for (const auto& option : options) {
        for (const auto& keyword : option.keywords) {
            if (domain::StartsWith(keyword, value)) {
                candidates.insert(option.id);
                break;
            }
        }
    }
    if (candidates.size() == 1) {
        return *candidates.begin();
    }
    return std::nullopt;
}

} // namespace crmterm::application
