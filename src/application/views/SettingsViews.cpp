#include "application/views/Views.hpp"

#include <stdexcept>

#include "application/EscapeCommands.hpp"
#include "application/views/ViewCommon.hpp"
#include "domain/TextUtils.hpp"

namespace crmterm::application {

namespace {

constexpr std::size_t kSettingsChars = 64;

void AppendHeader(const Session& session, std::vector<StyledLine>& lines) {
    const domain::PreferencesStore& prefs = session.preferences();
    lines.emplace_back(Role::Title, "Settings & Help");
    lines.emplace_back(Role::Faint, "'/' goes back, 'exit.' returns home.");
    lines.emplace_back();
    lines.emplace_back(Role::Secondary, "Name: " + prefs.displayName());
    lines.emplace_back(Role::Secondary, "Timezone: " + prefs.timezone());
    lines.emplace_back();
    lines.emplace_back(Role::Highlight, "Shortcuts");
    lines.push_back(StyledLine(Role::HelpKey, "/").append(Role::Plain, " -> ").append(Role::HelpValue, "Back"));
    lines.push_back(StyledLine(Role::HelpKey, "exit.").append(Role::Plain, " -> ").append(Role::HelpValue, "Main menu"));
    lines.push_back(StyledLine(Role::HelpKey, "Esc").append(Role::Plain, " -> ").append(Role::HelpValue, "Back"));
    lines.push_back(StyledLine(Role::HelpKey, "Ctrl+C").append(Role::Plain, " -> ").append(Role::HelpValue, "Quit"));
    lines.emplace_back();
}

} // namespace

Transition SettingsView::handleInput(Session& session, const std::string& input) {
    const std::string choice = domain::ToLower(domain::Trim(input));
    if (choice == "1" || choice == "name") {
        return Transition::Push(ViewId::SettingsEditName);
    }
    if (choice == "2" || choice == "timezone") {
        return Transition::Push(ViewId::SettingsEditTimezone);
    }
    if (choice == "3" || IsBackCommand(choice)) {
        return Transition::Pop();
    }
    if (IsMenuExitCommand(choice)) {
        return Transition::Root();
    }
    session.setError("Choose 1 or 2 to edit settings");
    return Transition::Stay();
}

RenderedView SettingsView::render(const Session& session) const {
    RenderedView view;
    auto& lines = view.lines;
    AppendHeader(session, lines);
    lines.emplace_back(Role::Secondary, "1. Update name");
    lines.emplace_back(Role::Secondary, "2. Update timezone");
    lines.emplace_back(Role::Faint, "3. Back");
    AppendMessages(session, lines);

    view.input.placeholder = "1=Name  2=Timezone  3=Back";
    view.input.charLimit = 40;
    return view;
}

Transition SettingsEditNameView::handleInput(Session& session, const std::string& input) {
    const std::string value = domain::TruncateUtf8(domain::Trim(input), kSettingsChars);
    if (IsExitCommand(value)) {
        return Transition::Root();
    }
    if (IsBackCommand(value)) {
        return Transition::Pop();
    }
    if (value.empty()) {
        session.setError("Name cannot be empty");
        return Transition::Stay();
    }
    try {
        session.preferences().saveDisplayName(value);
    } catch (const std::runtime_error& e) {
        session.setError(e.what());
        return Transition::Stay();
    }
    session.setInfo("Name updated");
    return Transition::Pop();
}

RenderedView SettingsEditNameView::render(const Session& session) const {
    RenderedView view;
    auto& lines = view.lines;
    AppendHeader(session, lines);
    lines.emplace_back(Role::Secondary, "Enter new name:");
    AppendMessages(session, lines);

    view.input.prompt = "";
    view.input.placeholder = "Your name";
    view.input.charLimit = kSettingsChars;
    view.input.initialText = session.preferences().displayName();
    return view;
}

Transition SettingsEditTimezoneView::handleInput(Session& session, const std::string& input) {
    const std::string value = domain::TruncateUtf8(domain::Trim(input), kSettingsChars);
    if (IsExitCommand(value)) {
        return Transition::Root();
    }
    if (IsBackCommand(value)) {
        return Transition::Pop();
    }
    if (value.empty()) {
        session.setError("Timezone cannot be empty");
        return Transition::Stay();
    }
    if (!domain::TimeZone::IsLoadable(value)) {
        session.setError("Invalid timezone");
        return Transition::Stay();
    }
    try {
        session.preferences().saveTimezone(value);
    } catch (const std::invalid_argument&) {
        session.setError("Invalid timezone");
        return Transition::Stay();
    } catch (const std::runtime_error& e) {
        session.setError(e.what());
        return Transition::Stay();
    }
    session.setInfo("Timezone updated");
    return Transition::Pop();
}

RenderedView SettingsEditTimezoneView::render(const Session& session) const {
    RenderedView view;
    auto& lines = view.lines;
    AppendHeader(session, lines);
    lines.emplace_back(Role::Secondary, "Enter timezone (e.g. America/New_York):");
    AppendMessages(session, lines);

    view.input.prompt = "";
    view.input.placeholder = "Area/City";
    view.input.charLimit = kSettingsChars;
    view.input.initialText = session.preferences().timezone();
    return view;
}

} // namespace crmterm::application
