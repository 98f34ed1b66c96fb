#include "application/views/Views.hpp"

#include <cstddef>

#include "application/EscapeCommands.hpp"
#include "application/views/ViewCommon.hpp"
#include "domain/EventClassifier.hpp"
#include "domain/TextUtils.hpp"

namespace crmterm::application {

namespace {

constexpr std::size_t kUpcomingShown = 5;
constexpr std::size_t kRecentShown = 3;

Role ActivityRole(domain::ActivityKind kind) {
    switch (kind) {
        case domain::ActivityKind::Account: return Role::Accent;
        case domain::ActivityKind::Note: return Role::Success;
        case domain::ActivityKind::Event: return Role::Warning;
        default: return Role::Primary;
    }
}

void AppendEvents(std::vector<StyledLine>& lines, const std::vector<domain::Event>& events, std::size_t limit,
                  Role role, const char* emptyText, const domain::TimeZone& zone) {
    if (events.empty()) {
        lines.emplace_back(Role::Faint, emptyText);
    }
    for (std::size_t i = 0; i < events.size() && i < limit; ++i) {
        lines.emplace_back(role, EventLine(events[i], zone));
    }
}

} // namespace

void DashboardView::Reload(Session& session) {
    try {
        session.dashboard.events = session.records().listEvents();
        session.dashboard.activity = session.records().listActivity(kScreenActivityLimit);
    } catch (const domain::StorageError& e) {
        session.setError(std::string("load dashboard: ") + e.what());
    }
}

void DashboardView::onEnter(Session& session) {
    Reload(session);
}

void DashboardView::onResume(Session& session) {
    Reload(session);
}

Transition DashboardView::handleInput(Session& session, const std::string& input) {
    const std::string command = domain::ToLower(domain::Trim(input));
    if (command.empty()) {
        return Transition::Stay();
    }
    if (command == "t" || command == "toggle") {
        session.dashboard.showActivity = !session.dashboard.showActivity;
        return Transition::Stay();
    }
    if (command == "r" || command == "refresh") {
        Reload(session);
        return Transition::Stay();
    }
    if (IsBackCommand(command)) {
        return Transition::Pop();
    }
    if (IsMenuExitCommand(command)) {
        return Transition::Root();
    }
    session.setError("Unknown dashboard command");
    return Transition::Stay();
}

RenderedView DashboardView::render(const Session& session) const {
    RenderedView view;
    auto& lines = view.lines;
    const domain::TimeZone zone = session.zone();

    lines.emplace_back(Role::Title, "Dashboard");
    lines.emplace_back(Role::Faint, "Press t to toggle events/activity, r to refresh, '/' to go back.");
    lines.emplace_back();

    if (!session.dashboard.showActivity) {
        const domain::EventBuckets buckets = domain::SplitEvents(session.dashboard.events, session.now(), zone);
        lines.emplace_back(Role::Subtitle, "Today's Events");
        AppendEvents(lines, buckets.today, buckets.today.size(), Role::Success, "Nothing scheduled today.", zone);
        lines.emplace_back();
        lines.emplace_back(Role::Subtitle, "Upcoming");
        AppendEvents(lines, buckets.upcoming, kUpcomingShown, Role::Warning, "No upcoming events.", zone);
        lines.emplace_back();
        lines.emplace_back(Role::Subtitle, "Recent");
        AppendEvents(lines, buckets.past, kRecentShown, Role::Danger, "No recent events.", zone);
    } else {
        lines.emplace_back(Role::Subtitle, "Recent CRM Activity");
        if (session.dashboard.activity.empty()) {
            lines.emplace_back(Role::Faint, "No activity yet.");
        }
        for (const auto& entry : session.dashboard.activity) {
            lines.emplace_back(ActivityRole(entry.kind), ActivityLine(entry, zone));
        }
    }
    AppendMessages(session, lines);

    view.input.placeholder = "Command (t=toggle, r=refresh, /, exit.)";
    view.input.charLimit = 48;
    return view;
}

} // namespace crmterm::application
