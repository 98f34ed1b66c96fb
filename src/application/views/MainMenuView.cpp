#include "application/views/Views.hpp"

#include "application/CommandResolver.hpp"
#include "application/EscapeCommands.hpp"
#include "application/views/ViewCommon.hpp"
#include "domain/TextUtils.hpp"

namespace crmterm::application {

namespace {

const char* kSplashBanner[] = {
    "   __________  __  ___    ______                  ",
    "  / ____/ __ \\/  |/  /   /_  __/__  _________ ___ ",
    " / /   / /_/ / /|_/ /_____/ / / _ \\/ ___/ __ '__ \\",
    "/ /___/ _, _/ /  / /_____/ / /  __/ /  / / / / / /",
    "\\____/_/ |_/_/  /_/     /_/  \\___/_/  /_/ /_/ /_/ ",
};

} // namespace

Transition MainMenuView::handleInput(Session& session, const std::string& input) {
    session.dismissSplash();

    const std::string choice = domain::Trim(input);
    // The main menu is the root: "back" has nowhere to go.
    if (choice.empty() || choice == "0" || IsBackCommand(choice)) {
        return Transition::Stay();
    }

    auto option = ResolveCommand(choice, MainMenuOptions());
    if (!option) {
        session.setError("Unknown choice");
        return Transition::Stay();
    }

    if (*option == menu::kDashboard) {
        return Transition::Push(ViewId::Dashboard);
    }
    if (*option == menu::kAccounts) {
        return Transition::Push(ViewId::AccountList);
    }
    if (*option == menu::kAddAccount) {
        session.accountForm.emplace();
        return Transition::Push(ViewId::AccountForm);
    }
    if (*option == menu::kCreate) {
        return Transition::Push(ViewId::CreateChoice);
    }
    if (*option == menu::kSettings) {
        return Transition::Push(ViewId::Settings);
    }
    return Transition::Quit();
}

Transition MainMenuView::handleEscape(Session& session) {
    (void)session;
    return Transition::Stay();
}

RenderedView MainMenuView::render(const Session& session) const {
    RenderedView view;
    auto& lines = view.lines;
    if (session.splashVisible()) {
        for (const char* row : kSplashBanner) {
            lines.emplace_back(Role::Accent, row);
        }
        lines.emplace_back();
    }
    lines.emplace_back(Role::Title, "CRM-Term");
    lines.emplace_back(Role::Secondary, "A lightning-fast CRM");
    if (!session.info().empty()) {
        lines.emplace_back(Role::Success, session.info());
    }
    if (!session.error().empty()) {
        lines.emplace_back(Role::Danger, session.error());
    }
    lines.emplace_back();
    for (const char* item : {"1. Dashboard", "2. View accounts", "3. Add account",
                             "4. Create note/event", "5. Settings & Help", "6. Quit"}) {
        lines.emplace_back(Role::Primary, item);
    }

    view.input.placeholder = "Choose an option";
    view.input.charLimit = 32;
    return view;
}

} // namespace crmterm::application
