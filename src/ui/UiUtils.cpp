#include "ui/UiUtils.hpp"

#include "domain/TextUtils.hpp"

namespace crmterm::ui {

namespace {

struct LineCallbackData {
    std::string* str;
    std::size_t charLimit;
};

// Byte offset just past the first @p maxChars code points.
int Utf8Offset(const char* text, int length, std::size_t maxChars) {
    std::size_t chars = 0;
    for (int i = 0; i < length; ++i) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if ((c & 0xC0) != 0x80) {
            if (chars == maxChars) {
                return i;
            }
            ++chars;
        }
    }
    return length;
}

int LineEditCallback(ImGuiInputTextCallbackData* data) {
    auto* user = static_cast<LineCallbackData*>(data->UserData);
    if (data->EventFlag == ImGuiInputTextFlags_CallbackResize) {
        user->str->resize(data->BufTextLen);
        data->Buf = user->str->data();
    } else if (data->EventFlag == ImGuiInputTextFlags_CallbackEdit && user->charLimit > 0) {
        const int keep = Utf8Offset(data->Buf, data->BufTextLen, user->charLimit);
        if (keep < data->BufTextLen) {
            data->DeleteChars(keep, data->BufTextLen - keep);
        }
    }
    return 0;
}

} // namespace

bool InputLineString(const char* label, const char* hint, std::string* str, std::size_t charLimit,
                     ImGuiInputTextFlags flags) {
    flags |= ImGuiInputTextFlags_CallbackResize;
    flags |= ImGuiInputTextFlags_CallbackEdit;
    flags |= ImGuiInputTextFlags_EnterReturnsTrue;
    if (charLimit > 0 && domain::Utf8Length(*str) > charLimit) {
        *str = domain::TruncateUtf8(*str, charLimit);
    }
    if (str->capacity() == 0) {
        str->reserve(256);
    }
    LineCallbackData user{str, charLimit};
    return ImGui::InputTextWithHint(label, hint, str->data(), str->capacity() + 1, flags, LineEditCallback, &user);
}

void TextSpan(const ImVec4& color, const std::string& text, bool sameLine) {
    if (sameLine) {
        ImGui::SameLine(0.0f, 0.0f);
    }
    ImGui::PushStyleColor(ImGuiCol_Text, color);
    ImGui::TextUnformatted(text.c_str(), text.c_str() + text.size());
    ImGui::PopStyleColor();
}

} // namespace crmterm::ui
