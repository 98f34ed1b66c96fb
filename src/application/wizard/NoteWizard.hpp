/**
 * @file NoteWizard.hpp
 * @brief Stage machine of the "new note" flow.
 */

#pragma once

#include <optional>
#include <string>

#include "application/wizard/WizardEngine.hpp"
#include "domain/Records.hpp"

namespace crmterm::application {

enum class NoteStage {
    Content,
    AssociatePrompt,
    AssociateChoose,
    Complete,
    Cancel
};

std::string NoteStageToString(NoteStage stage);

/**
 * Content --Accept--> AssociatePrompt --Yes--> AssociateChoose --Accept--> Complete
 * Content --AcceptPreset--> Complete, AssociatePrompt --No--> Complete,
 * Back walks one stage back (Cancel from Content).
 */
const StageMachine<NoteStage>& NoteStageMachine();

/**
 * @struct NoteWizardState
 * @brief One note wizard instance. A preset account skips the association questions.
 */
struct NoteWizardState {
    explicit NoteWizardState(std::optional<domain::Account> preset = std::nullopt);

    WizardEngine<NoteStage> engine;
    std::optional<domain::Account> presetAccount;
};

} // namespace crmterm::application
