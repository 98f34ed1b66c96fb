#include "application/wizard/AccountForm.hpp"

#include "application/wizard/WizardStages.hpp"

namespace crmterm::application {

std::string AccountFieldToString(AccountField field) {
    switch (field) {
        case AccountField::Name: return "Name";
        case AccountField::Phone: return "Phone";
        case AccountField::Address: return "Address";
        case AccountField::Email: return "Email";
        case AccountField::DecisionMaker: return "DecisionMaker";
        case AccountField::Complete: return "Complete";
        case AccountField::Cancel: return "Cancel";
        default: return "Unknown";
    }
}

std::string AccountFieldLabel(AccountField field) {
    switch (field) {
        case AccountField::Name: return "Account name";
        case AccountField::Phone: return "Phone";
        case AccountField::Address: return "Address";
        case AccountField::Email: return "Email";
        case AccountField::DecisionMaker: return "Decision maker";
        default: return "";
    }
}

const StageMachine<AccountField>& AccountFormMachine() {
    static const StageMachine<AccountField> machine(AccountField::Name, {
        {AccountField::Name, StageOutcome::Accept, AccountField::Phone},
        {AccountField::Name, StageOutcome::Back, AccountField::Cancel},
        {AccountField::Phone, StageOutcome::Accept, AccountField::Address},
        {AccountField::Phone, StageOutcome::Back, AccountField::Name},
        {AccountField::Address, StageOutcome::Accept, AccountField::Email},
        {AccountField::Address, StageOutcome::Back, AccountField::Phone},
        {AccountField::Email, StageOutcome::Accept, AccountField::DecisionMaker},
        {AccountField::Email, StageOutcome::Back, AccountField::Address},
        {AccountField::DecisionMaker, StageOutcome::Accept, AccountField::Complete},
        {AccountField::DecisionMaker, StageOutcome::Back, AccountField::Email},
    });
    return machine;
}

namespace {

constexpr std::size_t kAccountFieldChars = 96;

StageSpec FieldSpec(AccountField field, bool required) {
    StageSpec spec;
    spec.prompt = AccountFieldLabel(field) + (required ? " (required):" : ":");
    spec.placeholder = AccountFieldLabel(field);
    spec.charLimit = kAccountFieldChars;
    if (required) {
        spec.validate = [](const std::string& value) { return RequireText(value, kRequiredFieldError); };
    } else {
        spec.validate = [](const std::string&) { return StageVerdict::Accept(); };
    }
    return spec;
}

std::map<AccountField, StageSpec> BuildSpecs() {
    std::map<AccountField, StageSpec> specs;
    specs.emplace(AccountField::Name, FieldSpec(AccountField::Name, true));
    specs.emplace(AccountField::Phone, FieldSpec(AccountField::Phone, false));
    specs.emplace(AccountField::Address, FieldSpec(AccountField::Address, false));
    specs.emplace(AccountField::Email, FieldSpec(AccountField::Email, false));
    specs.emplace(AccountField::DecisionMaker, FieldSpec(AccountField::DecisionMaker, false));
    return specs;
}

std::map<AccountField, std::string> SeedValues(const std::optional<domain::Account>& existing) {
    if (!existing) {
        return {};
    }
    return {
        {AccountField::Name, existing->name},
        {AccountField::Phone, existing->phone},
        {AccountField::Address, existing->address},
        {AccountField::Email, existing->email},
        {AccountField::DecisionMaker, existing->decisionMaker},
    };
}

} // namespace

AccountFormState::AccountFormState(std::optional<domain::Account> existing)
    : engine(AccountFormMachine(), BuildSpecs(), SeedValues(existing)),
      editing(existing.has_value()),
      original(existing.value_or(domain::Account{})) {}

domain::Account AccountFormState::draft() const {
    domain::Account account = original;
    account.name = engine.value(AccountField::Name);
    account.phone = engine.value(AccountField::Phone);
    account.address = engine.value(AccountField::Address);
    account.email = engine.value(AccountField::Email);
    account.decisionMaker = engine.value(AccountField::DecisionMaker);
    return account;
}

} // namespace crmterm::application
