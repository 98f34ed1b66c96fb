#include "application/views/Views.hpp"

#include <iostream>

#include "application/views/ViewCommon.hpp"

namespace crmterm::application {

namespace {

Transition Save(Session& session, NoteWizardState& wizard) {
    std::optional<domain::Account> account = wizard.presetAccount;
    try {
        if (!account && wizard.engine.stage() == NoteStage::AssociateChoose) {
            const std::string name = wizard.engine.value(NoteStage::AssociateChoose);
            if (!name.empty()) {
                account = session.records().findAccountByName(name);
                if (!account) {
                    wizard.engine.setError("Account not found");
                    return Transition::Stay();
                }
            }
        }

        domain::Note note;
        note.content = wizard.engine.value(NoteStage::Content);
        note.creator = session.preferences().displayName();
        note.createdAt = session.now();
        if (account) {
            note.accountId = account->id;
        }
        session.records().createNote(note);
    } catch (const domain::StorageError& e) {
        std::cerr << "[NoteWizard] Save failed: " << e.what() << std::endl;
        wizard.engine.setError(e.what());
        return Transition::Stay();
    }

    session.setInfo(account && !account->name.empty() ? "Note saved for " + account->name : "Note saved");
    session.noteWizard.reset();
    return Transition::Pop();
}

} // namespace

void NoteWizardView::onEnter(Session& session) {
    if (!session.noteWizard) {
        session.noteWizard.emplace();
    }
}

Transition NoteWizardView::handleInput(Session& session, const std::string& input) {
    onEnter(session);
    NoteWizardState& wizard = *session.noteWizard;

    switch (wizard.engine.submit(input)) {
        case WizardSignal::Exit:
            return Transition::Root();
        case WizardSignal::Cancel:
            session.noteWizard.reset();
            return Transition::Pop();
        case WizardSignal::Complete:
            return Save(session, wizard);
        case WizardSignal::Stay:
        case WizardSignal::Moved:
        default:
            return Transition::Stay();
    }
}

Transition NoteWizardView::handleEscape(Session& session) {
    return handleInput(session, "/");
}

RenderedView NoteWizardView::render(const Session& session) const {
    RenderedView view;
    auto& lines = view.lines;
    if (!session.noteWizard) {
        return view;
    }
    const NoteWizardState& wizard = *session.noteWizard;
    const StageSpec& spec = wizard.engine.spec();

    lines.emplace_back(Role::Title, "New Note");
    if (wizard.engine.stage() == NoteStage::Content) {
        lines.emplace_back(Role::Faint, spec.prompt);
        if (wizard.presetAccount) {
            lines.emplace_back(Role::Faint, "Will link to " + wizard.presetAccount->name);
        }
    } else {
        lines.emplace_back(Role::Secondary, spec.prompt);
    }
    if (!wizard.engine.error().empty()) {
        lines.emplace_back();
        lines.emplace_back(Role::Danger, wizard.engine.error());
    }

    view.input.prompt = "";
    view.input.placeholder = spec.placeholder;
    view.input.charLimit = spec.charLimit;
    view.input.initialText = wizard.engine.buffer();
    return view;
}

} // namespace crmterm::application
