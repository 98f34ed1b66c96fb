#include "application/AccountResolver.hpp"

#include <algorithm>
#include <cctype>

#include "domain/TextUtils.hpp"

namespace crmterm::application {

namespace {

std::string StripVerb(const std::string& trimmed) {
    const std::string lower = domain::ToLower(trimmed);
    for (const char* verb : {"open ", "view ", "select "}) {
        const std::string prefix(verb);
        if (domain::StartsWith(lower, prefix)) {
            return domain::Trim(trimmed.substr(prefix.size()));
        }
    }
    if (domain::StartsWith(lower, "#")) {
        return domain::Trim(trimmed.substr(1));
    }
    return trimmed;
}

std::optional<std::size_t> ParseIndex(const std::string& query) {
    if (query.empty() || query.size() > 9) return std::nullopt;
    if (!std::all_of(query.begin(), query.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::stoul(query));
}

} // namespace

std::optional<domain::Account> ResolveAccountSelection(const std::string& input,
                                                       const std::vector<domain::Account>& filtered,
                                                       const std::vector<domain::Account>& all) {
    if (filtered.empty() && all.empty()) {
        return std::nullopt;
    }

    const std::string trimmed = domain::Trim(input);
    if (trimmed.empty()) {
        if (filtered.size() == 1) {
            return filtered.front();
        }
        return std::nullopt;
    }

    const std::string query = StripVerb(trimmed);
    if (query.empty()) {
        return std::nullopt;
    }

    if (auto index = ParseIndex(query)) {
        if (*index > 0 && *index <= filtered.size()) {
            return filtered[*index - 1];
        }
    }

    for (const auto* list : {&filtered, &all}) {
        for (const auto& account : *list) {
            if (domain::EqualsIgnoreCase(account.name, query)) {
                return account;
            }
        }
    }

    const std::string queryLower = domain::ToLower(query);
    for (const auto* list : {&filtered, &all}) {
        const domain::Account* match = nullptr;
        int count = 0;
        for (const auto& account : *list) {
            if (domain::StartsWith(domain::ToLower(account.name), queryLower)) {
                match = &account;
                ++count;
            }
        }
        if (count == 1) {
            return *match;
        }
    }
    return std::nullopt;
}

} // namespace crmterm::application
