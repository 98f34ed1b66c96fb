#include "application/wizard/WizardStages.hpp"

#include "domain/TextUtils.hpp"

namespace crmterm::application {

StageVerdict RequireText(const std::string& value, const std::string& message, StageOutcome outcome) {
    if (value.empty()) {
        return StageVerdict::Reject(message);
    }
    return StageVerdict::Accept(outcome);
}

StageVerdict ParseYesNo(const std::string& value) {
    const std::string answer = domain::ToLower(value);
    if (answer == "y" || answer == "yes") {
        return StageVerdict::Accept(StageOutcome::Yes);
    }
    if (answer == "n" || answer == "no" || answer.empty()) {
        return StageVerdict::Accept(StageOutcome::No);
    }
    return StageVerdict::Reject(kYesNoError);
}

StageSpec AssociatePromptSpec() {
    StageSpec spec;
    spec.prompt = "Associate with an account? (y/n)";
    spec.placeholder = "Associate with account? (y/n)";
    spec.charLimit = 5;
    spec.validate = ParseYesNo;
    return spec;
}

StageSpec AssociateChooseSpec(const std::string& prompt) {
    StageSpec spec;
    spec.prompt = prompt;
    spec.placeholder = "Type account name";
    spec.charLimit = 96;
    spec.validate = [](const std::string&) { return StageVerdict::Accept(); };
    return spec;
}

} // namespace crmterm::application
