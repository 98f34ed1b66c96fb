#include "application/Session.hpp"

#include <utility>

namespace crmterm::application {

Session::Session(domain::RecordRepository& records, domain::PreferencesStore& preferences, ClockFn clock)
    : m_records(records),
      m_preferences(preferences),
      m_clock(std::move(clock)),
      m_navigation(ViewId::MainMenu) {
    if (!m_clock) {
        m_clock = [] { return domain::Clock::now(); };
    }
}

domain::TimePoint Session::now() const {
    return m_clock();
}

domain::TimeZone Session::zone() const {
    return m_preferences.location();
}

void Session::setInfo(std::string message) {
    m_info = std::move(message);
}

void Session::setError(std::string message) {
    m_error = std::move(message);
}

void Session::clearMessages() {
    m_info.clear();
    m_error.clear();
}

void Session::resetViewStates() {
    dashboard = DashboardState{};
    accountList = AccountListState{};
    accountDetail = AccountDetailState{};
    accountForm.reset();
    noteWizard.reset();
    eventWizard.reset();
}

} // namespace crmterm::application
