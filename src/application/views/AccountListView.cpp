#include "application/views/Views.hpp"

#include <cctype>
#include <fstream>

#include "application/AccountResolver.hpp"
#include "application/EscapeCommands.hpp"
#include "application/views/ViewCommon.hpp"
#include "domain/TextUtils.hpp"
#include "infrastructure/PathUtils.hpp"

namespace crmterm::application {

namespace {

bool IsAllDigits(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

// Text that addresses the displayed list instead of narrowing it: an index,
// "#3", "open ...", "view ...", "select ..." or an import command.
bool IsListCommand(const std::string& text) {
    const std::string lower = domain::ToLower(text);
    return IsAllDigits(lower) || domain::StartsWith(lower, "#") || domain::StartsWith(lower, "open ") ||
           domain::StartsWith(lower, "view ") || domain::StartsWith(lower, "select ") ||
           lower == "import" || domain::StartsWith(lower, "import ");
}

void ApplyFilter(Session& session, const std::string& filter) {
    auto& state = session.accountList;
    state.filter = filter;
    if (filter.empty()) {
        state.filtered = state.accounts;
        return;
    }
    try {
        state.filtered = session.records().searchAccounts(filter);
    } catch (const domain::StorageError& e) {
        session.setError(std::string("search accounts: ") + e.what());
    }
}

void ImportAccounts(Session& session, const std::string& rawPath) {
    const std::string path = domain::Trim(rawPath);
    if (path.empty()) {
        session.setError("Provide a CSV path");
        return;
    }
    const std::string resolved = infrastructure::PathUtils::ExpandUserPath(path).string();
    std::ifstream file(resolved);
    if (!file.is_open()) {
        session.setError("open file: cannot read " + resolved);
        return;
    }

    domain::ImportResult result;
    try {
        result = session.records().importAccountsCsv(file, session.preferences().displayName(), session.zone());
    } catch (const domain::StorageError& e) {
        session.setError(std::string("import csv: ") + e.what());
        return;
    }

    std::string message = "Imported " + std::to_string(result.created) + " account(s)";
    if (result.skipped > 0) {
        message += ", skipped " + std::to_string(result.skipped);
    }
    session.setInfo(message);

    std::string errors;
    for (const auto& error : result.errors) {
        if (!errors.empty()) {
            errors += "; ";
        }
        errors += error;
    }
    session.setError(errors);
}

} // namespace

void AccountListView::Reload(Session& session) {
    auto& state = session.accountList;
    try {
        state.accounts = session.records().listAccounts();
    } catch (const domain::StorageError& e) {
        session.setError(std::string("load accounts: ") + e.what());
        return;
    }
    ApplyFilter(session, state.filter);
}

void AccountListView::onEnter(Session& session) {
    session.accountList = AccountListState{};
    Reload(session);
}

void AccountListView::onResume(Session& session) {
    Reload(session);
}

void AccountListView::onEdit(Session& session, const std::string& text) {
    const std::string trimmed = domain::Trim(text);
    if (IsListCommand(trimmed)) {
        return;
    }
    ApplyFilter(session, trimmed);
}

Transition AccountListView::handleInput(Session& session, const std::string& input) {
    const std::string value = domain::Trim(input);
    if (IsExitCommand(value)) {
        return Transition::Root();
    }
    if (IsBackCommand(value)) {
        return Transition::Pop();
    }

    const std::string lower = domain::ToLower(value);
    if (lower == "import" || domain::StartsWith(lower, "import ")) {
        ImportAccounts(session, value.substr(std::string("import").size()));
        ApplyFilter(session, "");
        Reload(session);
        return Transition::Stay();
    }

    auto& state = session.accountList;
    if (auto account = ResolveAccountSelection(value, state.filtered, state.accounts)) {
        session.accountDetail = AccountDetailState{};
        session.accountDetail.account = *account;
        state.filter.clear();
        state.filtered = state.accounts;
        return Transition::Push(ViewId::AccountDetail);
    }

    if (!IsListCommand(value)) {
        ApplyFilter(session, value);
    }
    return Transition::Stay();
}

RenderedView AccountListView::render(const Session& session) const {
    RenderedView view;
    auto& lines = view.lines;
    const domain::TimeZone zone = session.zone();
    const auto& accounts = session.accountList.filtered;

    lines.emplace_back(Role::Title, "Accounts");
    lines.emplace_back(Role::Faint, "Type to search. Enter a number or name to manage, or 'import <path>' to load CSV. "
                                    "'/' to go back, 'exit.' home.");
    lines.emplace_back();
    if (accounts.empty()) {
        lines.emplace_back(Role::Warning, "No accounts found.");
    }
    for (std::size_t i = 0; i < accounts.size(); ++i) {
        const auto& account = accounts[i];
        lines.emplace_back(Role::Primary, std::to_string(i + 1) + ". " + account.name);
        const std::string meta = AccountMetaLine(account);
        if (!meta.empty()) {
            lines.emplace_back(Role::Secondary, "  " + meta);
        }
        if (!account.address.empty()) {
            lines.emplace_back(Role::Faint, "  " + account.address);
        }
        lines.emplace_back(Role::Faint, "  " + CreatedByLine(account, zone));
        lines.emplace_back();
    }
    lines.emplace_back(Role::Border, std::string(40, '-'));
    AppendMessages(session, lines);

    view.input.prompt = "find> ";
    view.input.placeholder = "Search accounts";
    view.input.charLimit = 96;
    view.input.initialText = session.accountList.filter;
    return view;
}

} // namespace crmterm::application
