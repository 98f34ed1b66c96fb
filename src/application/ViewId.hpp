/**
 * @file ViewId.hpp
 * @brief Identifiers of the navigable screens.
 */

#pragma once

#include <string>

namespace crmterm::application {

enum class ViewId {
    MainMenu,             ///< Root screen. Never pushed onto the history.
    Dashboard,
    AccountList,
    AccountDetail,
    AccountForm,          ///< Create or edit an account.
    CreateChoice,         ///< Note or event?
    NoteWizard,
    EventWizard,
    Settings,
    SettingsEditName,
    SettingsEditTimezone
};

inline std::string ViewIdToString(ViewId view) {
    switch (view) {
        case ViewId::MainMenu: return "MainMenu";
        case ViewId::Dashboard: return "Dashboard";
        case ViewId::AccountList: return "AccountList";
        case ViewId::AccountDetail: return "AccountDetail";
        case ViewId::AccountForm: return "AccountForm";
        case ViewId::CreateChoice: return "CreateChoice";
        case ViewId::NoteWizard: return "NoteWizard";
        case ViewId::EventWizard: return "EventWizard";
        case ViewId::Settings: return "Settings";
        case ViewId::SettingsEditName: return "SettingsEditName";
        case ViewId::SettingsEditTimezone: return "SettingsEditTimezone";
        default: return "Unknown";
    }
}

} // namespace crmterm::application
