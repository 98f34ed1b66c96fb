/**
 * @file CrmTermApp.cpp
 * @brief Implementation of the CrmTermApp class.
 */
#include "app/CrmTermApp.hpp"

#include "ui/Theme.hpp"
#include "ui/UiRenderer.hpp"

#include "imgui.h"
#include "imgui_impl_opengl3.h"
#include "imgui_impl_sdl2.h"

#include <SDL2/SDL.h>
#include <SDL2/SDL_opengl.h>

#include <cstdio>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "infrastructure/ConfigStore.hpp"
#include "infrastructure/JsonRecordRepository.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace crmterm::app {

namespace {

std::string FindFontPath(const std::vector<const char*>& candidates) {
    for (const char* path : candidates) {
        if (std::filesystem::exists(path)) {
            return path;
        }
    }
    return {};
}

void LoadFonts(ImGuiIO& io) {
    const float baseFontSize = 17.0f;

#if defined(__APPLE__)
    const std::vector<const char*> candidates = {
        "/System/Library/Fonts/Menlo.ttc",
        "/System/Library/Fonts/Supplemental/Courier New.ttf",
    };
#else
    const std::vector<const char*> candidates = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf",
        "/usr/share/fonts/TTF/DejaVuSansMono.ttf",
        "/usr/share/fonts/dejavu-sans-mono-fonts/DejaVuSansMono.ttf",
        "/usr/share/fonts/truetype/noto/NotoSansMono-Regular.ttf",
    };
#endif

    static const ImWchar ranges[] = {
        0x0020, 0x00FF, // Basic Latin + Latin-1 Supplement (middle dot)
        0x2000, 0x206F, // General Punctuation
        0,
    };

    ImFont* font = nullptr;
    const std::string path = FindFontPath(candidates);
    if (!path.empty()) {
        font = io.Fonts->AddFontFromFileTTF(path.c_str(), baseFontSize, nullptr, ranges);
    }
    if (!font) {
        std::cerr << "[CrmTermApp] WARNING: No monospace font found, using the built-in font." << std::endl;
        font = io.Fonts->AddFontDefault();
    }
    io.FontDefault = font;
}

} // namespace

CrmTermApp::CrmTermApp(std::filesystem::path dataFile, std::filesystem::path configFile)
    : m_dataFile(std::move(dataFile)), m_configFile(std::move(configFile)) {
    if (m_dataFile.empty()) {
        m_dataFile = infrastructure::PathUtils::GetDefaultDataFile();
    }
    if (m_configFile.empty()) {
        m_configFile = infrastructure::PathUtils::GetDefaultConfigFile();
    }
}

bool CrmTermApp::InitServices() {
    // Composition Root
    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    try {
        auto preferences = std::make_unique<infrastructure::ConfigStore>(m_configFile, persistence);
        auto records = std::make_unique<infrastructure::JsonRecordRepository>(m_dataFile, persistence);
        m_state.InjectServices(std::move(records), std::move(preferences));
    } catch (const std::runtime_error& e) {
        std::fprintf(stderr, "Failed to open storage: %s\n", e.what());
        return false;
    }
    std::cout << "[CrmTermApp] Records: " << m_dataFile << std::endl;
    std::cout << "[CrmTermApp] Config: " << m_configFile << std::endl;
    return true;
}

bool CrmTermApp::Init() {
    if (!InitServices()) {
        return false;
    }

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        std::fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
        return false;
    }
    m_sdlInitialized = true;

    const char* glsl_version = "#version 130";
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_FLAGS, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);

    SDL_WindowFlags window_flags = (SDL_WindowFlags)(SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI);
    m_window = SDL_CreateWindow("crmterm", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, 1024, 720, window_flags);
    if (!m_window) {
        std::fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError());
        return false;
    }

    m_glContext = SDL_GL_CreateContext(m_window);
    if (!m_glContext) {
        std::fprintf(stderr, "SDL_GL_CreateContext failed: %s\n", SDL_GetError());
        return false;
    }
    SDL_GL_MakeCurrent(m_window, m_glContext);
    SDL_GL_SetSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.IniFilename = nullptr;
    LoadFonts(io);
    ui::ApplyTheme(ImGui::GetStyle());

    if (!ImGui_ImplSDL2_InitForOpenGL(m_window, m_glContext)) {
        std::fprintf(stderr, "ImGui_ImplSDL2_InitForOpenGL failed.\n");
        return false;
    }
    if (!ImGui_ImplOpenGL3_Init(glsl_version)) {
        std::fprintf(stderr, "ImGui_ImplOpenGL3_Init failed.\n");
        return false;
    }
    m_imguiInitialized = true;

    return true;
}

void CrmTermApp::Shutdown() {
    if (m_imguiInitialized) {
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        m_imguiInitialized = false;
    }

    if (m_glContext) {
        SDL_GL_DeleteContext(m_glContext);
        m_glContext = nullptr;
    }
    if (m_window) {
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
    }
    if (m_sdlInitialized) {
        SDL_Quit();
        m_sdlInitialized = false;
    }
}

int CrmTermApp::Run() {
    if (!Init()) {
        Shutdown();
        return 1;
    }

    bool done = false;
    while (!done) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL2_ProcessEvent(&event);
            if (event.type == SDL_QUIT) {
                m_state.Interrupt();
            }
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL2_NewFrame();
        ImGui::NewFrame();

        ui::DrawUI(m_state);
        if (m_state.ui.requestExit) {
            done = true;
        }

        ImGui::Render();
        ImGuiIO& io = ImGui::GetIO();
        glViewport(0, 0, static_cast<int>(io.DisplaySize.x), static_cast<int>(io.DisplaySize.y));
        glClearColor(0.08f, 0.08f, 0.10f, 1.00f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(m_window);
    }

    std::cout << "[CrmTermApp] Bye." << std::endl;
    Shutdown();
    return 0;
}

} // namespace crmterm::app
