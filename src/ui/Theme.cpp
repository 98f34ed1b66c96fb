#include "ui/Theme.hpp"

namespace crmterm::ui {

using application::Role;

ImVec4 RoleColor(Role role) {
    switch (role) {
        case Role::Title:     return ImVec4(0.98f, 0.80f, 0.35f, 1.0f);
        case Role::Subtitle:  return ImVec4(0.62f, 0.70f, 0.85f, 1.0f);
        case Role::Accent:    return ImVec4(0.55f, 0.45f, 0.95f, 1.0f);
        case Role::Primary:   return ImVec4(0.93f, 0.93f, 0.93f, 1.0f);
        case Role::Secondary: return ImVec4(0.70f, 0.70f, 0.74f, 1.0f);
        case Role::Success:   return ImVec4(0.40f, 0.85f, 0.50f, 1.0f);
        case Role::Warning:   return ImVec4(0.95f, 0.75f, 0.30f, 1.0f);
        case Role::Danger:    return ImVec4(0.95f, 0.40f, 0.40f, 1.0f);
        case Role::Faint:     return ImVec4(0.45f, 0.45f, 0.50f, 1.0f);
        case Role::Highlight: return ImVec4(0.35f, 0.80f, 0.95f, 1.0f);
        case Role::Border:    return ImVec4(0.35f, 0.35f, 0.42f, 1.0f);
        case Role::HelpKey:   return ImVec4(0.60f, 0.60f, 0.68f, 1.0f);
        case Role::HelpValue: return ImVec4(0.42f, 0.42f, 0.48f, 1.0f);
        case Role::Plain:
        default:              return ImVec4(0.85f, 0.85f, 0.85f, 1.0f);
    }
}

void ApplyTheme(ImGuiStyle& style) {
    ImGui::StyleColorsDark(&style);
    style.WindowPadding = ImVec2(18.0f, 14.0f);
    style.FrameRounding = 3.0f;
    style.ItemSpacing = ImVec2(8.0f, 4.0f);
    style.Colors[ImGuiCol_WindowBg] = ImVec4(0.08f, 0.08f, 0.10f, 1.0f);
    style.Colors[ImGuiCol_FrameBg] = ImVec4(0.14f, 0.14f, 0.18f, 1.0f);
    style.Colors[ImGuiCol_Separator] = RoleColor(Role::Border);
    style.Colors[ImGuiCol_TextDisabled] = RoleColor(Role::Faint);
}

} // namespace crmterm::ui
