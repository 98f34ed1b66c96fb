/**
 * @file Session.hpp
 * @brief All mutable state of one interactive session.
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "application/NavigationStack.hpp"
#include "application/wizard/AccountForm.hpp"
#include "application/wizard/EventWizard.hpp"
#include "application/wizard/NoteWizard.hpp"
#include "domain/PreferencesStore.hpp"
#include "domain/RecordRepository.hpp"
#include "domain/Records.hpp"
#include "domain/TimeZone.hpp"

namespace crmterm::application {

/** @brief Entries loaded for the activity feeds of the dashboard and account detail. */
constexpr int kScreenActivityLimit = 50;

struct DashboardState {
    bool showActivity = false;
    std::vector<domain::Event> events;
    std::vector<domain::Activity> activity;
};

struct AccountListState {
    std::string filter;
    std::vector<domain::Account> accounts; ///< Every account.
    std::vector<domain::Account> filtered; ///< Accounts matching the filter, as displayed.
};

struct AccountDetailState {
    domain::Account account;
    bool showActivity = false;
    std::vector<domain::Activity> activity;
};

/**
 * @class Session
 * @brief Owned by the caller and handed by reference to every view handler.
 *
 * Holds the collaborators, the navigation stack, the screen-level messages and
 * the per-screen states. Wizard states only exist while their screen is in use.
 */
class Session {
public:
    using ClockFn = std::function<domain::TimePoint()>;

    Session(domain::RecordRepository& records, domain::PreferencesStore& preferences, ClockFn clock = {});

    domain::RecordRepository& records() const { return m_records; }
    domain::PreferencesStore& preferences() const { return m_preferences; }

    domain::TimePoint now() const;
    domain::TimeZone zone() const;

    NavigationStack& navigation() { return m_navigation; }
    const NavigationStack& navigation() const { return m_navigation; }

    const std::string& info() const { return m_info; }
    const std::string& error() const { return m_error; }
    void setInfo(std::string message);
    void setError(std::string message);
    void clearMessages();

    bool splashVisible() const { return m_splash; }
    void dismissSplash() { m_splash = false; }

    bool quitRequested() const { return m_quit; }
    void requestQuit() { m_quit = true; }

    /** @brief Fresh defaults for every screen (used when returning to the main menu). */
    void resetViewStates();

    DashboardState dashboard;
    AccountListState accountList;
    AccountDetailState accountDetail;
    std::optional<AccountFormState> accountForm;
    std::optional<NoteWizardState> noteWizard;
    std::optional<EventWizardState> eventWizard;

private:
    domain::RecordRepository& m_records;
    domain::PreferencesStore& m_preferences;
    ClockFn m_clock;
    NavigationStack m_navigation;
    std::string m_info;
    std::string m_error;
    bool m_splash = true;
    bool m_quit = false;
};

} // namespace crmterm::application
