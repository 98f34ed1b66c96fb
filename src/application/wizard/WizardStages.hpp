/**
 * @file WizardStages.hpp
 * @brief Validators and stage specs shared by the note, event and account wizards.
 */

#pragma once

#include <string>

#include "application/wizard/WizardEngine.hpp"

namespace crmterm::application {

inline constexpr const char* kYesNoError = "Please answer y or n";

/** @brief Rejects empty input with @p message, otherwise yields @p outcome. */
StageVerdict RequireText(const std::string& value, const std::string& message, StageOutcome outcome = StageOutcome::Accept);

/** @brief y/yes -> Yes, n/no/blank -> No, anything else -> "Please answer y or n". */
StageVerdict ParseYesNo(const std::string& value);

/** @brief "Associate with an account? (y/n)" stage. */
StageSpec AssociatePromptSpec();

/** @brief Account name stage (blank = no association). Lookup happens at save time. */
StageSpec AssociateChooseSpec(const std::string& prompt);

} // namespace crmterm::application
