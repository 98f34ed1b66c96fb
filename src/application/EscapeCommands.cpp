#include "application/EscapeCommands.hpp"

#include "domain/TextUtils.hpp"

namespace crmterm::application {

bool IsExitCommand(const std::string& input) {
    const std::string v = domain::ToLower(domain::Trim(input));
    return v == "exit." || v == "quit";
}

bool IsBackCommand(const std::string& input) {
    const std::string v = domain::ToLower(domain::Trim(input));
    return v == "/" || v == "back";
}

bool IsMenuExitCommand(const std::string& input) {
    return IsExitCommand(input) || domain::ToLower(domain::Trim(input)) == "exit";
}

} // namespace crmterm::application
