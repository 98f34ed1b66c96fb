/**
 * @file CrmTermApp.hpp
 * @brief Main application class for crmterm.
 */

#pragma once

#include <filesystem>

#include "ui/AppState.hpp"

struct SDL_Window;

namespace crmterm::app {

/**
 * @class CrmTermApp
 * @brief Orchestrates the application lifecycle, including initialization, the main loop, and shutdown.
 */
class CrmTermApp {
public:
    /**
     * @param dataFile Record store; empty selects the XDG default.
     * @param configFile Preferences file; empty selects the XDG default.
     */
    CrmTermApp(std::filesystem::path dataFile = {}, std::filesystem::path configFile = {});

    /**
     * @brief Starts the application main loop.
     * @return Exit code (0 for success).
     */
    int Run();

private:
    /** @brief Opens the stores, then initializes SDL, OpenGL and ImGui. */
    bool Init();

    /** @brief Builds the record store, the preferences and the session. */
    bool InitServices();

    /** @brief Cleans up all resources before exiting. */
    void Shutdown();

    std::filesystem::path m_dataFile;
    std::filesystem::path m_configFile;
    ui::AppState m_state; ///< Session, controller and command line state.
    SDL_Window* m_window = nullptr; ///< SDL window handle.
    void* m_glContext = nullptr; ///< OpenGL context.
    bool m_sdlInitialized = false;
    bool m_imguiInitialized = false;
};

} // namespace crmterm::app
