#pragma once

#include "application/views/ViewHandler.hpp"

namespace crmterm::application {

// Menus
class MainMenuView : public ViewHandler {
public:
    ViewId id() const override { return ViewId::MainMenu; }
    Transition handleInput(Session& session, const std::string& input) override;
    Transition handleEscape(Session& session) override;
    RenderedView render(const Session& session) const override;
};

class CreateChoiceView : public ViewHandler {
public:
    ViewId id() const override { return ViewId::CreateChoice; }
    Transition handleInput(Session& session, const std::string& input) override;
    RenderedView render(const Session& session) const override;
};

class DashboardView : public ViewHandler {
public:
    ViewId id() const override { return ViewId::Dashboard; }
    Transition handleInput(Session& session, const std::string& input) override;
    void onEnter(Session& session) override;
    void onResume(Session& session) override;
    RenderedView render(const Session& session) const override;

    /** @brief Reloads events and the global activity feed. */
    static void Reload(Session& session);
};

// Accounts
class AccountListView : public ViewHandler {
public:
    ViewId id() const override { return ViewId::AccountList; }
    Transition handleInput(Session& session, const std::string& input) override;
    void onEdit(Session& session, const std::string& text) override;
    void onEnter(Session& session) override;
    void onResume(Session& session) override;
    RenderedView render(const Session& session) const override;

    /** @brief Reloads every account and reapplies the current filter. */
    static void Reload(Session& session);
};

class AccountDetailView : public ViewHandler {
public:
    ViewId id() const override { return ViewId::AccountDetail; }
    Transition handleInput(Session& session, const std::string& input) override;
    void onEnter(Session& session) override;
    void onResume(Session& session) override;
    RenderedView render(const Session& session) const override;
};

class AccountFormView : public ViewHandler {
public:
    ViewId id() const override { return ViewId::AccountForm; }
    Transition handleInput(Session& session, const std::string& input) override;
    Transition handleEscape(Session& session) override;
    void onEnter(Session& session) override;
    RenderedView render(const Session& session) const override;
};

// Wizards
class NoteWizardView : public ViewHandler {
public:
    ViewId id() const override { return ViewId::NoteWizard; }
    Transition handleInput(Session& session, const std::string& input) override;
    Transition handleEscape(Session& session) override;
    void onEnter(Session& session) override;
    RenderedView render(const Session& session) const override;
};

class EventWizardView : public ViewHandler {
public:
    ViewId id() const override { return ViewId::EventWizard; }
    Transition handleInput(Session& session, const std::string& input) override;
    Transition handleEscape(Session& session) override;
    void onEnter(Session& session) override;
    RenderedView render(const Session& session) const override;
};

// Settings
class SettingsView : public ViewHandler {
public:
    ViewId id() const override { return ViewId::Settings; }
    Transition handleInput(Session& session, const std::string& input) override;
    RenderedView render(const Session& session) const override;
};

class SettingsEditNameView : public ViewHandler {
public:
    ViewId id() const override { return ViewId::SettingsEditName; }
    Transition handleInput(Session& session, const std::string& input) override;
    RenderedView render(const Session& session) const override;
};

class SettingsEditTimezoneView : public ViewHandler {
public:
    ViewId id() const override { return ViewId::SettingsEditTimezone; }
    Transition handleInput(Session& session, const std::string& input) override;
    RenderedView render(const Session& session) const override;
};

} // namespace crmterm::application
