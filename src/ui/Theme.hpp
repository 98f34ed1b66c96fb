/**
 * @file Theme.hpp
 * @brief Maps semantic text roles to colors.
 */

#pragma once

#include "application/views/StyledText.hpp"
#include "imgui.h"

namespace crmterm::ui {

/** @brief Color of @p role on the dark background. */
ImVec4 RoleColor(application::Role role);

/** @brief Applies the window colors used by every screen. */
void ApplyTheme(ImGuiStyle& style);

} // namespace crmterm::ui
