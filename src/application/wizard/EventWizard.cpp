#include "application/wizard/EventWizard.hpp"

#include <cctype>

#include "application/wizard/WizardStages.hpp"

namespace crmterm::application {

std::string EventStageToString(EventStage stage) {
    switch (stage) {
        case EventStage::Title: return "Title";
        case EventStage::Details: return "Details";
        case EventStage::Schedule: return "Schedule";
        case EventStage::AssociatePrompt: return "AssociatePrompt";
        case EventStage::AssociateChoose: return "AssociateChoose";
        case EventStage::Complete: return "Complete";
        case EventStage::Cancel: return "Cancel";
        default: return "Unknown";
    }
}

const StageMachine<EventStage>& EventStageMachine() {
    static const StageMachine<EventStage> machine(EventStage::Title, {
        {EventStage::Title, StageOutcome::Accept, EventStage::Details},
        {EventStage::Title, StageOutcome::Back, EventStage::Cancel},
        {EventStage::Details, StageOutcome::Accept, EventStage::Schedule},
        {EventStage::Details, StageOutcome::Back, EventStage::Title},
        {EventStage::Schedule, StageOutcome::Accept, EventStage::AssociatePrompt},
        {EventStage::Schedule, StageOutcome::AcceptPreset, EventStage::Complete},
        {EventStage::Schedule, StageOutcome::Back, EventStage::Details},
        {EventStage::AssociatePrompt, StageOutcome::Yes, EventStage::AssociateChoose},
        {EventStage::AssociatePrompt, StageOutcome::No, EventStage::Complete},
        {EventStage::AssociatePrompt, StageOutcome::Back, EventStage::Schedule},
        {EventStage::AssociateChoose, StageOutcome::Accept, EventStage::Complete},
        {EventStage::AssociateChoose, StageOutcome::Back, EventStage::AssociatePrompt},
    });
    return machine;
}

std::optional<domain::TimePoint> ParseSchedule(const std::string& value, const domain::TimeZone& zone) {
    // Exactly "dddd-dd-dd dd:dd".
    static const char* shape = "0000-00-00 00:00";
    if (value.size() != 16) {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < value.size(); ++i) {
        const bool wantDigit = shape[i] == '0';
        const bool isDigit = std::isdigit(static_cast<unsigned char>(value[i])) != 0;
        if (wantDigit != isDigit || (!wantDigit && value[i] != shape[i])) {
            return std::nullopt;
        }
    }
    return zone.parseLocal(value, "%Y-%m-%d %H:%M");
}

namespace {

std::map<EventStage, StageSpec> BuildSpecs(bool hasPreset, const domain::TimeZone& zone) {
    std::map<EventStage, StageSpec> specs;

    StageSpec title;
    title.prompt = "Event title:";
    title.placeholder = "Event title";
    title.charLimit = 96;
    title.validate = [](const std::string& value) { return RequireText(value, "Title is required"); };
    specs.emplace(EventStage::Title, std::move(title));

    StageSpec details;
    details.prompt = "Details (optional):";
    details.placeholder = "Details (optional)";
    details.charLimit = 256;
    details.validate = [](const std::string&) { return StageVerdict::Accept(); };
    specs.emplace(EventStage::Details, std::move(details));

    StageSpec schedule;
    schedule.prompt = "Schedule time (YYYY-MM-DD HH:MM, blank = now):";
    schedule.placeholder = "YYYY-MM-DD HH:MM (blank = now)";
    schedule.charLimit = 32;
    const StageOutcome onAccept = hasPreset ? StageOutcome::AcceptPreset : StageOutcome::Accept;
    schedule.validate = [onAccept, zone](const std::string& value) {
        if (!value.empty() && !ParseSchedule(value, zone)) {
            return StageVerdict::Reject(kScheduleFormatError);
        }
        return StageVerdict::Accept(onAccept);
    };
    specs.emplace(EventStage::Schedule, std::move(schedule));

    specs.emplace(EventStage::AssociatePrompt, AssociatePromptSpec());
    specs.emplace(EventStage::AssociateChoose, AssociateChooseSpec("Enter account name (blank to skip):"));
    return specs;
}

} // namespace

EventWizardState::EventWizardState(std::optional<domain::Account> preset, domain::TimeZone zoneIn)
    : engine(EventStageMachine(), BuildSpecs(preset.has_value(), zoneIn)),
      presetAccount(std::move(preset)),
      zone(std::move(zoneIn)) {}

} // namespace crmterm::application
