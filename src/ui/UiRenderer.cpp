/**
 * @file UiRenderer.cpp
 * @brief Draws the active screen as colored text lines above a single command line.
 */
#include "ui/UiRenderer.hpp"

#include "imgui.h"
#include "ui/Theme.hpp"
#include "ui/UiUtils.hpp"

#include <cfloat>
#include <string>

namespace crmterm::ui {

namespace {

constexpr float LOG_HEIGHT = 140.0f;

void DrawLines(const application::RenderedView& view) {
    for (const auto& line : view.lines) {
        if (line.spans.empty()) {
            ImGui::NewLine();
            continue;
        }
        bool first = true;
        for (const auto& span : line.spans) {
            TextSpan(RoleColor(span.role), span.text, !first);
            first = false;
        }
    }
}

void HandleShortcuts(AppState& app) {
    ImGuiIO& io = ImGui::GetIO();
    if (io.KeyCtrl && (ImGui::IsKeyPressed(ImGuiKey_C, false) || ImGui::IsKeyPressed(ImGuiKey_Q, false))) {
        app.Interrupt();
        return;
    }
    if (ImGui::IsKeyPressed(ImGuiKey_Escape, false)) {
        app.Escape();
        return;
    }
    if (ImGui::IsKeyPressed(ImGuiKey_F12, false)) {
        app.ui.showLog = !app.ui.showLog;
    }
}

void DrawCommandLine(AppState& app, const application::InputSpec& input) {
    if (app.ui.resetInput) {
        app.ui.inputBuffer = input.initialText;
        app.ui.resetInput = false;
    }

    if (!input.prompt.empty()) {
        TextSpan(RoleColor(application::Role::Accent), input.prompt, false);
        ImGui::SameLine();
    }
    ImGui::SetNextItemWidth(-FLT_MIN);
    if (app.ui.focusInput) {
        ImGui::SetKeyboardFocusHere();
        app.ui.focusInput = false;
    }

    const bool submitted = InputLineString("##command", input.placeholder.c_str(), &app.ui.inputBuffer, input.charLimit);
    if (ImGui::IsItemEdited() && !submitted) {
        app.controller->Edit(app.ui.inputBuffer);
    }
    if (submitted) {
        const std::string line = app.ui.inputBuffer;
        app.Submit(line);
    }
}

} // namespace

void DrawUI(AppState& app) {
    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);
    ImGui::Begin("Main", NULL, ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize);

    if (!app.controller) {
        ImGui::TextDisabled("No session.");
        ImGui::End();
        return;
    }

    HandleShortcuts(app);
    if (app.ui.requestExit) {
        ImGui::End();
        return;
    }

    const application::RenderedView view = app.controller->Render();

    const float footer = ImGui::GetFrameHeightWithSpacing() + ImGui::GetStyle().ItemSpacing.y
                       + (app.ui.showLog ? LOG_HEIGHT : 0.0f);
    ImGui::BeginChild("Screen", ImVec2(0, -footer), false);
    DrawLines(view);
    ImGui::EndChild();

    ImGui::Separator();
    DrawCommandLine(app, view.input);

    if (app.ui.showLog) {
        ImGui::BeginChild("Log", ImVec2(0, 0), true);
        ImGui::TextUnformatted(app.ui.outputLog.c_str());
        if (ImGui::GetScrollY() >= ImGui::GetScrollMaxY())
            ImGui::SetScrollHereY(1.0f);
        ImGui::EndChild();
    }

    ImGui::End();
}

} // namespace crmterm::ui
