#pragma once

#include "imgui.h"
#include <cstddef>
#include <string>

namespace crmterm::ui {

/**
 * @brief Single-line InputTextWithHint bound to a std::string.
 * @param charLimit Maximum number of UTF-8 code points (0 = unlimited).
 * @return True when Enter was pressed (ImGuiInputTextFlags_EnterReturnsTrue is always set).
 */
bool InputLineString(const char* label, const char* hint, std::string* str, std::size_t charLimit,
                     ImGuiInputTextFlags flags = 0);

/** @brief Draws colored spans on one line. */
void TextSpan(const ImVec4& color, const std::string& text, bool sameLine);

} // namespace crmterm::ui
