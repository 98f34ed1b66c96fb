/**
 * @file AccountForm.hpp
 * @brief Five-field account form (create or edit) on top of the wizard engine.
 */

#pragma once

#include <optional>
#include <string>

#include "application/wizard/WizardEngine.hpp"
#include "domain/Records.hpp"

namespace crmterm::application {

enum class AccountField {
    Name,
    Phone,
    Address,
    Email,
    DecisionMaker,
    Complete,
    Cancel
};

std::string AccountFieldToString(AccountField field);

/** @brief Label shown above the input of @p field. */
std::string AccountFieldLabel(AccountField field);

/** @brief Name -> Phone -> Address -> Email -> DecisionMaker -> Complete, Back walks one field back. */
const StageMachine<AccountField>& AccountFormMachine();

inline constexpr const char* kRequiredFieldError = "This field is required";
inline constexpr const char* kDuplicateAccountError = "An account with that name already exists";

/**
 * @struct AccountFormState
 * @brief Create form (empty fields) or edit form (fields seeded from @p existing).
 */
struct AccountFormState {
    explicit AccountFormState(std::optional<domain::Account> existing = std::nullopt);

    /** @brief Record assembled from the captured fields, carrying id/creator/createdAt of the original. */
    domain::Account draft() const;

    WizardEngine<AccountField> engine;
    bool editing = false;
    domain::Account original;
};

} // namespace crmterm::application
