#include "application/views/ViewCommon.hpp"

#include <cctype>

namespace crmterm::application {

namespace {

const char* kSeparator = "  \xC2\xB7  ";

std::string Capitalized(std::string text) {
    if (!text.empty()) {
        text[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(text[0])));
    }
    return text;
}

} // namespace

void AppendMessages(const Session& session, std::vector<StyledLine>& lines) {
    if (!session.info().empty()) {
        lines.emplace_back();
        lines.emplace_back(Role::Success, session.info());
    }
    if (!session.error().empty()) {
        lines.emplace_back();
        lines.emplace_back(Role::Danger, session.error());
    }
}

std::string AccountMetaLine(const domain::Account& account) {
    std::vector<std::string> parts;
    if (!account.phone.empty()) {
        parts.push_back("Phone: " + account.phone);
    }
    if (!account.email.empty()) {
        parts.push_back("Email: " + account.email);
    }
    if (!account.decisionMaker.empty()) {
        parts.push_back("Decision Maker: " + account.decisionMaker);
    }
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += kSeparator;
        }
        out += parts[i];
    }
    return out;
}

std::string CreatedByLine(const domain::Account& account, const domain::TimeZone& zone) {
    return "Created by " + account.creator + " on " + zone.format(account.createdAt, kStampLong);
}

std::string ActivityLine(const domain::Activity& activity, const domain::TimeZone& zone) {
    return "[" + Capitalized(domain::ActivityKindToString(activity.kind)) + "] " + activity.title +
           " - " + zone.format(activity.createdAt, kStampShort);
}

std::string EventLine(const domain::Event& event, const domain::TimeZone& zone) {
    std::string line = zone.format(event.eventTime, kStampEvent) + " - " + event.title;
    if (event.accountName) {
        line += " (" + *event.accountName + ")";
    }
    if (!event.details.empty()) {
        line += kSeparator + event.details;
    }
    line += kSeparator;
    line += "by " + event.creator;
    return line;
}

} // namespace crmterm::application
