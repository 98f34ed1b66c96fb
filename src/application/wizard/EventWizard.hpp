/**
 * @file EventWizard.hpp
 * @brief Stage machine of the "new event" flow.
 */

#pragma once

#include <optional>
#include <string>

#include "application/wizard/WizardEngine.hpp"
#include "domain/Records.hpp"
#include "domain/TimeZone.hpp"

namespace crmterm::application {

enum class EventStage {
    Title,
    Details,
    Schedule,
    AssociatePrompt,
    AssociateChoose,
    Complete,
    Cancel
};

std::string EventStageToString(EventStage stage);

const StageMachine<EventStage>& EventStageMachine();

inline constexpr const char* kScheduleFormatError = "Use format YYYY-MM-DD HH:MM";

/**
 * @brief Parses "YYYY-MM-DD HH:MM" as wall-clock time in @p zone.
 * @return std::nullopt for any other shape or an impossible date.
 */
std::optional<domain::TimePoint> ParseSchedule(const std::string& value, const domain::TimeZone& zone);

/**
 * @struct EventWizardState
 * @brief One event wizard instance. The schedule is validated in @p zone.
 */
struct EventWizardState {
    explicit EventWizardState(std::optional<domain::Account> preset = std::nullopt,
                              domain::TimeZone zone = domain::TimeZone::Utc());

    WizardEngine<EventStage> engine;
    std::optional<domain::Account> presetAccount;
    domain::TimeZone zone;
};

} // namespace crmterm::application
