#include "application/SessionController.hpp"

#include <iostream>
#include <stdexcept>

#include "application/views/Views.hpp"

namespace crmterm::application {

SessionController::SessionController(Session& session) : m_session(session) {
    registerHandler(std::make_unique<MainMenuView>());
    registerHandler(std::make_unique<DashboardView>());
    registerHandler(std::make_unique<AccountListView>());
    registerHandler(std::make_unique<AccountDetailView>());
    registerHandler(std::make_unique<AccountFormView>());
    registerHandler(std::make_unique<CreateChoiceView>());
    registerHandler(std::make_unique<NoteWizardView>());
    registerHandler(std::make_unique<EventWizardView>());
    registerHandler(std::make_unique<SettingsView>());
    registerHandler(std::make_unique<SettingsEditNameView>());
    registerHandler(std::make_unique<SettingsEditTimezoneView>());
}

void SessionController::registerHandler(std::unique_ptr<ViewHandler> handler) {
    const ViewId view = handler->id();
    m_handlers[view] = std::move(handler);
}

ViewHandler& SessionController::handlerFor(ViewId view) const {
    auto it = m_handlers.find(view);
    if (it == m_handlers.end()) {
        throw std::logic_error("SessionController: no handler for " + ViewIdToString(view));
    }
    return *it->second;
}

void SessionController::Submit(const std::string& line) {
    if (m_session.quitRequested()) {
        return;
    }
    m_session.clearMessages();
    apply(handlerFor(ActiveView()).handleInput(m_session, line));
}

void SessionController::Edit(const std::string& text) {
    handlerFor(ActiveView()).onEdit(m_session, text);
}

void SessionController::Escape() {
    if (m_session.quitRequested()) {
        return;
    }
    m_session.clearMessages();
    apply(handlerFor(ActiveView()).handleEscape(m_session));
}

void SessionController::Interrupt() {
    std::cout << "[SessionController] Interrupted." << std::endl;
    m_session.requestQuit();
}

RenderedView SessionController::Render() const {
    return handlerFor(ActiveView()).render(m_session);
}

void SessionController::apply(const Transition& transition) {
    NavigationStack& nav = m_session.navigation();
    switch (transition.kind) {
        case Transition::Kind::Stay:
            return;
        case Transition::Kind::Push:
            if (nav.active() == transition.target) {
                return;
            }
            nav.push(transition.target);
            handlerFor(nav.active()).onEnter(m_session);
            return;
        case Transition::Kind::Replace:
            nav.replace(transition.target);
            handlerFor(nav.active()).onEnter(m_session);
            return;
        case Transition::Kind::Pop:
            nav.pop();
            handlerFor(nav.active()).onResume(m_session);
            return;
        case Transition::Kind::Root:
            nav.resetToRoot();
            m_session.resetViewStates();
            handlerFor(nav.active()).onResume(m_session);
            return;
        case Transition::Kind::Quit:
            std::cout << "[SessionController] Quit requested from " << ViewIdToString(nav.active()) << std::endl;
            m_session.requestQuit();
            return;
    }
}

} // namespace crmterm::application
