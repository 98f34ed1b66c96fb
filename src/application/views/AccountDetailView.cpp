#include "application/views/Views.hpp"

#include "application/CommandResolver.hpp"
#include "application/EscapeCommands.hpp"
#include "application/views/ViewCommon.hpp"
#include "domain/TextUtils.hpp"

namespace crmterm::application {

namespace {

void LoadActivity(Session& session) {
    auto& state = session.accountDetail;
    try {
        state.activity = session.records().listAccountActivity(state.account.id, kScreenActivityLimit);
    } catch (const domain::StorageError& e) {
        session.setError(std::string("load activity: ") + e.what());
    }
}

} // namespace

void AccountDetailView::onEnter(Session& session) {
    session.accountDetail.showActivity = false;
    session.accountDetail.activity.clear();
}

void AccountDetailView::onResume(Session& session) {
    auto& state = session.accountDetail;
    try {
        if (auto fresh = session.records().findAccountById(state.account.id)) {
            state.account = *fresh;
        }
    } catch (const domain::StorageError& e) {
        session.setError(std::string("load account: ") + e.what());
        return;
    }
    if (state.showActivity) {
        LoadActivity(session);
    }
}

Transition AccountDetailView::handleInput(Session& session, const std::string& input) {
    const std::string choice = domain::Trim(input);
    // "exit." leaves for the main menu even though the action table lists it under "back".
    if (IsExitCommand(choice)) {
        return Transition::Root();
    }

    auto action = ResolveCommand(choice, AccountDetailOptions());
    if (!action) {
        if (!choice.empty()) {
            session.setError("Unknown choice");
        }
        return Transition::Stay();
    }

    auto& state = session.accountDetail;
    if (*action == account_action::kActivity) {
        state.showActivity = true;
        LoadActivity(session);
        return Transition::Stay();
    }
    state.showActivity = false;
    if (*action == account_action::kAddNote) {
        session.noteWizard.emplace(state.account);
        return Transition::Push(ViewId::NoteWizard);
    }
    if (*action == account_action::kAddEvent) {
        session.eventWizard.emplace(state.account, session.zone());
        return Transition::Push(ViewId::EventWizard);
    }
    if (*action == account_action::kEdit) {
        session.accountForm.emplace(state.account);
        return Transition::Push(ViewId::AccountForm);
    }
    return Transition::Pop();
}

RenderedView AccountDetailView::render(const Session& session) const {
    RenderedView view;
    auto& lines = view.lines;
    const domain::TimeZone zone = session.zone();
    const auto& state = session.accountDetail;
    const auto& account = state.account;

    lines.emplace_back(Role::Title, account.name);
    const std::string meta = AccountMetaLine(account);
    if (!meta.empty()) {
        lines.emplace_back(Role::Secondary, meta);
    }
    if (!account.address.empty()) {
        lines.emplace_back(Role::Faint, account.address);
    }
    lines.emplace_back(Role::Faint, CreatedByLine(account, zone));
    lines.emplace_back();

    if (state.showActivity) {
        lines.emplace_back(Role::Subtitle, "Recent Activity");
        if (state.activity.empty()) {
            lines.emplace_back(Role::Faint, "No activity yet.");
        }
        for (const auto& entry : state.activity) {
            lines.emplace_back(Role::Primary, ActivityLine(entry, zone));
        }
        lines.emplace_back();
    }

    lines.emplace_back(Role::Subtitle, "Actions");
    lines.emplace_back(Role::Secondary, "1. View activity");
    lines.emplace_back(Role::Secondary, "2. Add note (auto links)");
    lines.emplace_back(Role::Secondary, "3. Add event (auto links)");
    lines.emplace_back(Role::Secondary, "4. Edit account");
    lines.emplace_back(Role::Faint, "5. Back");
    AppendMessages(session, lines);

    view.input.placeholder = "1=Activity  2=Add note  3=Add event  4=Edit  5=Back";
    view.input.charLimit = 64;
    return view;
}

} // namespace crmterm::application
