#include "domain/ActivityFeed.hpp"

#include <algorithm>

#include "domain/TextUtils.hpp"

namespace crmterm::domain {

Activity ActivityFromAccount(const Account& account) {
    Activity activity;
    activity.id = account.id;
    activity.kind = ActivityKind::Account;
    activity.title = account.name;
    activity.detail = account.phone;
    activity.createdAt = account.createdAt;
    return activity;
}

Activity ActivityFromNote(const Note& note) {
    Activity activity;
    activity.id = note.id;
    activity.kind = ActivityKind::Note;
    activity.title = TruncateUtf8(note.content, kActivitySnippetChars);
    activity.createdAt = note.createdAt;
    return activity;
}

Activity ActivityFromEvent(const Event& event) {
    Activity activity;
    activity.id = event.id;
    activity.kind = ActivityKind::Event;
    activity.title = event.title;
    activity.detail = TruncateUtf8(event.details, kActivitySnippetChars);
    activity.createdAt = event.createdAt;
    return activity;
}

std::vector<Activity> MergeActivity(std::vector<Activity> entries, int limit) {
    if (limit <= 0) {
        limit = kDefaultActivityLimit;
    }
    std::stable_sort(entries.begin(), entries.end(), [](const Activity& a, const Activity& b) {
        return a.createdAt > b.createdAt;
    });
    if (entries.size() > static_cast<std::size_t>(limit)) {
        entries.resize(static_cast<std::size_t>(limit));
    }
    return entries;
}

} // namespace crmterm::domain
