#include "application/views/Views.hpp"

#include <iostream>

#include "application/views/ViewCommon.hpp"

namespace crmterm::application {

namespace {

int FieldNumber(AccountField field) {
    switch (field) {
        case AccountField::Name: return 1;
        case AccountField::Phone: return 2;
        case AccountField::Address: return 3;
        case AccountField::Email: return 4;
        case AccountField::DecisionMaker: return 5;
        default: return 5;
    }
}

// Reverts unsaved edits so the next visit starts from the stored record.
Transition Leave(Session& session) {
    session.accountForm.reset();
    return Transition::Pop();
}

Transition Save(Session& session, AccountFormState& form) {
    domain::Account account = form.draft();
    try {
        if (form.editing) {
            session.records().updateAccount(account);
            session.setInfo("Account '" + account.name + "' updated");
            if (session.accountDetail.account.id == account.id) {
                session.accountDetail.account = account;
            }
        } else {
            account.creator = session.preferences().displayName();
            account.createdAt = session.now();
            session.records().createAccount(account);
            session.setInfo("Account '" + account.name + "' created");
        }
    } catch (const domain::AccountExistsError&) {
        form.engine.returnTo(AccountField::Name, account.name, kDuplicateAccountError);
        return Transition::Stay();
    } catch (const domain::StorageError& e) {
        std::cerr << "[AccountForm] Save failed: " << e.what() << std::endl;
        form.engine.setError(e.what());
        return Transition::Stay();
    }
    session.accountForm.reset();
    return Transition::Pop();
}

} // namespace

void AccountFormView::onEnter(Session& session) {
    if (!session.accountForm) {
        session.accountForm.emplace();
    }
}

Transition AccountFormView::handleInput(Session& session, const std::string& input) {
    onEnter(session);
    AccountFormState& form = *session.accountForm;

    switch (form.engine.submit(input)) {
        case WizardSignal::Exit:
            return Transition::Root();
        case WizardSignal::Cancel:
            return Leave(session);
        case WizardSignal::Complete:
            return Save(session, form);
        case WizardSignal::Stay:
        case WizardSignal::Moved:
        default:
            return Transition::Stay();
    }
}

Transition AccountFormView::handleEscape(Session& session) {
    return Leave(session);
}

RenderedView AccountFormView::render(const Session& session) const {
    RenderedView view;
    auto& lines = view.lines;
    if (!session.accountForm) {
        return view;
    }
    const AccountFormState& form = *session.accountForm;
    const AccountField field = form.engine.stage();

    lines.emplace_back(Role::Title, form.editing ? "Edit Account" : "Add Account");
    lines.emplace_back(Role::Faint, "Enter details. '/' to go back, 'exit.' to cancel.");
    lines.emplace_back();
    lines.emplace_back(Role::Secondary, std::to_string(FieldNumber(field)) + "/5");
    lines.emplace_back(Role::Primary, AccountFieldLabel(field) + ":");
    if (!form.engine.error().empty()) {
        lines.emplace_back();
        lines.emplace_back(Role::Danger, form.engine.error());
    }

    const StageSpec& spec = form.engine.spec();
    view.input.prompt = "";
    view.input.placeholder = spec.placeholder;
    view.input.charLimit = spec.charLimit;
    view.input.initialText = form.engine.buffer();
    return view;
}

} // namespace crmterm::application
