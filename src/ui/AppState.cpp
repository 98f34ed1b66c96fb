/**
 * @file AppState.cpp
 * @brief Implementation of AppState.
 */

#include "ui/AppState.hpp"

#include "application/ViewId.hpp"

namespace crmterm::ui {

void AppState::InjectServices(std::unique_ptr<domain::RecordRepository> newRecords,
                              std::unique_ptr<domain::PreferencesStore> newPreferences) {
    controller.reset();
    session.reset();
    records = std::move(newRecords);
    preferences = std::move(newPreferences);
    session = std::make_unique<application::Session>(*records, *preferences);
    controller = std::make_unique<application::SessionController>(*session);
    ui.resetInput = true;
    AppendLog("[SYSTEM] Session started as " + preferences->displayName() + " (" + preferences->timezone() + ")\n");
}

void AppState::Submit(const std::string& line) {
    if (!controller) return;
    const application::ViewId before = controller->ActiveView();
    controller->Submit(line);
    const application::ViewId after = controller->ActiveView();
    if (before != after) {
        AppendLog("[UI] " + application::ViewIdToString(before) + " -> " + application::ViewIdToString(after) + "\n");
    }
    if (!session->error().empty()) {
        AppendLog("[UI] " + session->error() + "\n");
    }
    ui.resetInput = true;
    ui.focusInput = true;
    if (controller->ShouldQuit()) {
        ui.requestExit = true;
    }
}

void AppState::Escape() {
    if (!controller) return;
    controller->Escape();
    ui.resetInput = true;
    ui.focusInput = true;
}

void AppState::Interrupt() {
    if (controller) {
        controller->Interrupt();
    }
    ui.requestExit = true;
}

void AppState::AppendLog(const std::string& line) {
    ui.outputLog += line;
}

} // namespace crmterm::ui
