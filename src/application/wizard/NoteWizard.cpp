#include "application/wizard/NoteWizard.hpp"

#include "application/wizard/WizardStages.hpp"

namespace crmterm::application {

std::string NoteStageToString(NoteStage stage) {
    switch (stage) {
        case NoteStage::Content: return "Content";
        case NoteStage::AssociatePrompt: return "AssociatePrompt";
        case NoteStage::AssociateChoose: return "AssociateChoose";
        case NoteStage::Complete: return "Complete";
        case NoteStage::Cancel: return "Cancel";
        default: return "Unknown";
    }
}

const StageMachine<NoteStage>& NoteStageMachine() {
    static const StageMachine<NoteStage> machine(NoteStage::Content, {
        {NoteStage::Content, StageOutcome::Accept, NoteStage::AssociatePrompt},
        {NoteStage::Content, StageOutcome::AcceptPreset, NoteStage::Complete},
        {NoteStage::Content, StageOutcome::Back, NoteStage::Cancel},
        {NoteStage::AssociatePrompt, StageOutcome::Yes, NoteStage::AssociateChoose},
        {NoteStage::AssociatePrompt, StageOutcome::No, NoteStage::Complete},
        {NoteStage::AssociatePrompt, StageOutcome::Back, NoteStage::Content},
        {NoteStage::AssociateChoose, StageOutcome::Accept, NoteStage::Complete},
        {NoteStage::AssociateChoose, StageOutcome::Back, NoteStage::AssociatePrompt},
    });
    return machine;
}

namespace {

std::map<NoteStage, StageSpec> BuildSpecs(bool hasPreset) {
    std::map<NoteStage, StageSpec> specs;

    StageSpec content;
    content.prompt = "Type note text and press enter. '/' to cancel.";
    content.placeholder = "Note details";
    content.charLimit = 256;
    const StageOutcome onAccept = hasPreset ? StageOutcome::AcceptPreset : StageOutcome::Accept;
    content.validate = [onAccept](const std::string& value) {
        return RequireText(value, "Note cannot be empty", onAccept);
    };
    specs.emplace(NoteStage::Content, std::move(content));

    specs.emplace(NoteStage::AssociatePrompt, AssociatePromptSpec());
    specs.emplace(NoteStage::AssociateChoose, AssociateChooseSpec("Enter account name (blank to skip)"));
    return specs;
}

} // namespace

NoteWizardState::NoteWizardState(std::optional<domain::Account> preset)
    : engine(NoteStageMachine(), BuildSpecs(preset.has_value())),
      presetAccount(std::move(preset)) {}

} // namespace crmterm::application
