#include "application/views/Views.hpp"

#include <iostream>

#include "application/views/ViewCommon.hpp"

namespace crmterm::application {

namespace {

Transition Save(Session& session, EventWizardState& wizard) {
    std::optional<domain::Account> account = wizard.presetAccount;
    try {
        if (!account && wizard.engine.stage() == EventStage::AssociateChoose) {
            const std::string name = wizard.engine.value(EventStage::AssociateChoose);
            if (!name.empty()) {
                account = session.records().findAccountByName(name);
                if (!account) {
                    wizard.engine.setError("Account not found");
                    return Transition::Stay();
                }
            }
        }

        const domain::TimePoint now = session.now();
        domain::Event event;
        event.title = wizard.engine.value(EventStage::Title);
        event.details = wizard.engine.value(EventStage::Details);
        event.eventTime = now;
        const std::string schedule = wizard.engine.value(EventStage::Schedule);
        if (!schedule.empty()) {
            auto parsed = ParseSchedule(schedule, wizard.zone);
            if (!parsed) {
                wizard.engine.returnTo(EventStage::Schedule, schedule, kScheduleFormatError);
                return Transition::Stay();
            }
            event.eventTime = *parsed;
        }
        event.creator = session.preferences().displayName();
        event.createdAt = now;
        if (account) {
            event.accountId = account->id;
        }
        session.records().createEvent(event);
    } catch (const domain::StorageError& e) {
        std::cerr << "[EventWizard] Save failed: " << e.what() << std::endl;
        wizard.engine.setError(e.what());
        return Transition::Stay();
    }

    session.setInfo(account && !account->name.empty() ? "Event created for " + account->name : "Event created");
    session.eventWizard.reset();
    return Transition::Pop();
}

} // namespace

void EventWizardView::onEnter(Session& session) {
    if (!session.eventWizard) {
        session.eventWizard.emplace(std::nullopt, session.zone());
    }
}

Transition EventWizardView::handleInput(Session& session, const std::string& input) {
    onEnter(session);
    EventWizardState& wizard = *session.eventWizard;

    switch (wizard.engine.submit(input)) {
        case WizardSignal::Exit:
            return Transition::Root();
        case WizardSignal::Cancel:
            session.eventWizard.reset();
            return Transition::Pop();
        case WizardSignal::Complete:
            return Save(session, wizard);
        case WizardSignal::Stay:
        case WizardSignal::Moved:
        default:
            return Transition::Stay();
    }
}

Transition EventWizardView::handleEscape(Session& session) {
    return handleInput(session, "/");
}

RenderedView EventWizardView::render(const Session& session) const {
    RenderedView view;
    auto& lines = view.lines;
    if (!session.eventWizard) {
        return view;
    }
    const EventWizardState& wizard = *session.eventWizard;
    const StageSpec& spec = wizard.engine.spec();

    lines.emplace_back(Role::Title, "New Event");
    lines.emplace_back(Role::Secondary, spec.prompt);
    if (wizard.engine.stage() == EventStage::Title && wizard.presetAccount) {
        lines.emplace_back(Role::Faint, "Will link to " + wizard.presetAccount->name);
    }
    lines.emplace_back(Role::Faint, "'/' goes back, 'exit.' returns home.");
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
