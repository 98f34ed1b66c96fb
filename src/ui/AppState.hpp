/**
 * @file AppState.hpp
 * @brief Window-level state: the session, its controller and the command line buffer.
 */

#pragma once

#include <memory>
#include <string>

#include "application/Session.hpp"
#include "application/SessionController.hpp"
#include "domain/PreferencesStore.hpp"
#include "domain/RecordRepository.hpp"

namespace crmterm::ui {

/**
 * @struct UiState
 * @brief Command line buffer and window flags.
 */
struct UiState {
    std::string inputBuffer;
    bool resetInput = true;   ///< Reload the buffer from the screen's initial text on the next frame.
    bool focusInput = true;
    bool showLog = false;
    bool requestExit = false;
    std::string outputLog;
};

/**
 * @struct AppState
 * @brief Owns the collaborators and the single session of the window.
 */
struct AppState {
    std::unique_ptr<domain::RecordRepository> records;
    std::unique_ptr<domain::PreferencesStore> preferences;
    std::unique_ptr<application::Session> session;
    std::unique_ptr<application::SessionController> controller;
    UiState ui;

    /** @brief Takes ownership of the storage collaborators and starts a session at the main menu. */
    void InjectServices(std::unique_ptr<domain::RecordRepository> newRecords,
                        std::unique_ptr<domain::PreferencesStore> newPreferences);

    void Submit(const std::string& line);
    void Escape();
    void Interrupt();

    void AppendLog(const std::string& line);
};

} // namespace crmterm::ui
