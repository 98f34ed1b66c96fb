#include "application/views/Views.hpp"

#include "application/EscapeCommands.hpp"
#include "application/views/ViewCommon.hpp"
#include "domain/TextUtils.hpp"

namespace crmterm::application {

Transition CreateChoiceView::handleInput(Session& session, const std::string& input) {
    const std::string choice = domain::ToLower(domain::Trim(input));

    // Replace, not Push: back from a wizard returns to where the choice was opened from.
    if (choice == "1" || choice == "note" || choice == "n") {
        session.noteWizard.emplace();
        return Transition::Replace(ViewId::NoteWizard);
    }
    if (choice == "2" || choice == "event" || choice == "e") {
        session.eventWizard.emplace(std::nullopt, session.zone());
        return Transition::Replace(ViewId::EventWizard);
    }
    if (choice == "3" || IsBackCommand(choice)) {
        return Transition::Pop();
    }
    if (IsMenuExitCommand(choice)) {
        return Transition::Root();
    }
    session.setError("Choose 1 for note or 2 for event");
    return Transition::Stay();
}

RenderedView CreateChoiceView::render(const Session& session) const {
    RenderedView view;
    auto& lines = view.lines;
    lines.emplace_back(Role::Title, "Create Note or Event");
    lines.emplace_back(Role::Secondary, "1. Note");
    lines.emplace_back(Role::Secondary, "2. Event");
    lines.emplace_back(Role::Faint, "3. Back");
    AppendMessages(session, lines);

    view.input.placeholder = "1=Note  2=Event  3=Back";
    view.input.charLimit = 32;
    return view;
}

} // namespace crmterm::application
