/**
 * @file WizardEngine.hpp
 * @brief Generic multi-stage data-entry flow driven by an explicit transition table.
 *
 * A wizard is a set of stages (one text buffer each) and a table of
 * (stage, outcome) -> stage transitions. Every stage enum must declare the two
 * terminal pseudo-stages Complete (the caller saves) and Cancel (the caller
 * leaves the screen).
 */

#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "application/EscapeCommands.hpp"
#include "domain/TextUtils.hpp"

namespace crmterm::application {

/**
 * @enum StageOutcome
 * @brief What a validated submission means for the flow.
 */
enum class StageOutcome {
    Accept,       ///< Value stored, go to the next stage.
    AcceptPreset, ///< Value stored, association already known: skip the account questions.
    Yes,
    No,
    Back          ///< Back token typed on this stage.
};

inline std::string StageOutcomeToString(StageOutcome outcome) {
    switch (outcome) {
        case StageOutcome::Accept: return "Accept";
        case StageOutcome::AcceptPreset: return "AcceptPreset";
        case StageOutcome::Yes: return "Yes";
        case StageOutcome::No: return "No";
        case StageOutcome::Back: return "Back";
        default: return "Unknown";
    }
}

/**
 * @struct StageVerdict
 * @brief Validator result: either an outcome or a stage-local error message.
 */
struct StageVerdict {
    std::optional<StageOutcome> outcome;
    std::string error;

    static StageVerdict Accept(StageOutcome outcome = StageOutcome::Accept) {
        return StageVerdict{outcome, {}};
    }

    static StageVerdict Reject(std::string message) {
        return StageVerdict{std::nullopt, std::move(message)};
    }
};

/**
 * @enum WizardSignal
 * @brief What the owning screen must do after a submission.
 */
enum class WizardSignal {
    Stay,     ///< Validation failed; error() explains why.
    Moved,    ///< Now on another stage.
    Complete, ///< All input captured; the caller performs the save.
    Cancel,   ///< Back from the first stage; the caller pops the view.
    Exit      ///< Exit token; the caller returns to the main menu.
};

template <typename Stage>
struct StageTransition {
    Stage from;
    StageOutcome outcome;
    Stage to;
};

/**
 * @class StageMachine
 * @brief Immutable transition table of one wizard kind.
 */
template <typename Stage>
class StageMachine {
public:
    StageMachine(Stage initial, std::vector<StageTransition<Stage>> transitions)
        : m_initial(initial), m_transitions(std::move(transitions)) {
        for (const auto& t : m_transitions) {
            auto key = std::make_pair(t.from, t.outcome);
            if (m_index.count(key)) {
                throw std::logic_error("StageMachine: duplicate transition for " + StageOutcomeToString(t.outcome));
            }
            m_index.emplace(key, t.to);
        }
    }

    Stage initial() const { return m_initial; }

    std::optional<Stage> next(Stage from, StageOutcome outcome) const {
        auto it = m_index.find(std::make_pair(from, outcome));
        if (it == m_index.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    const std::vector<StageTransition<Stage>>& transitions() const { return m_transitions; }

private:
    Stage m_initial;
    std::vector<StageTransition<Stage>> m_transitions;
    std::map<std::pair<Stage, StageOutcome>, Stage> m_index;
};

/**
 * @struct StageSpec
 * @brief Presentation and validation of one stage.
 */
struct StageSpec {
    std::string prompt;      ///< Line shown above the input.
    std::string placeholder; ///< Hint shown in the empty input.
    std::size_t charLimit = 0; ///< 0 = unlimited.
    std::function<StageVerdict(const std::string&)> validate; ///< Receives trimmed input.
};

/**
 * @class WizardEngine
 * @brief Runs one wizard instance: current stage, per-stage buffers and the error line.
 */
template <typename Stage>
class WizardEngine {
public:
    WizardEngine(const StageMachine<Stage>& machine,
                 std::map<Stage, StageSpec> specs,
                 std::map<Stage, std::string> initialValues = {})
        : m_machine(&machine),
          m_specs(std::move(specs)),
          m_initialValues(std::move(initialValues)),
          m_values(m_initialValues),
          m_stage(machine.initial()) {}

    Stage stage() const { return m_stage; }

    const StageSpec& spec() const { return specFor(m_stage); }

    const StageSpec& specFor(Stage stage) const {
        auto it = m_specs.find(stage);
        if (it == m_specs.end()) {
            throw std::logic_error("WizardEngine: stage without spec");
        }
        return it->second;
    }

    /** @brief Last value entered on @p stage (empty if never visited). */
    std::string value(Stage stage) const {
        auto it = m_values.find(stage);
        return it == m_values.end() ? std::string() : it->second;
    }

    /** @brief Text to show in the input line for the current stage. */
    std::string buffer() const { return value(m_stage); }

    const std::string& error() const { return m_error; }

    void setError(std::string message) { m_error = std::move(message); }

    /**
     * @brief Processes one submitted line.
     *
     * Escape tokens are honored before the stage validator runs, so a blocked
     * stage can always be left.
     */
    WizardSignal submit(const std::string& input) {
        const std::string trimmed = domain::Trim(input);

        if (IsExitCommand(trimmed)) {
            reset();
            return WizardSignal::Exit;
        }
        if (IsBackCommand(trimmed)) {
            m_error.clear();
            auto target = m_machine->next(m_stage, StageOutcome::Back);
            if (!target || *target == Stage::Cancel) {
                reset();
                return WizardSignal::Cancel;
            }
            m_stage = *target;
            return WizardSignal::Moved;
        }

        const StageSpec& current = spec();
        std::string value = current.charLimit > 0 ? domain::TruncateUtf8(trimmed, current.charLimit) : trimmed;
        StageVerdict verdict = current.validate ? current.validate(value) : StageVerdict::Accept();
        m_values[m_stage] = value;

        if (!verdict.outcome) {
            m_error = verdict.error;
            return WizardSignal::Stay;
        }
        m_error.clear();

        auto target = m_machine->next(m_stage, *verdict.outcome);
        if (!target) {
            throw std::logic_error("WizardEngine: no transition for outcome " + StageOutcomeToString(*verdict.outcome));
        }
        if (*target == Stage::Complete) {
            return WizardSignal::Complete;
        }
        if (*target == Stage::Cancel) {
            reset();
            return WizardSignal::Cancel;
        }
        m_stage = *target;
        return WizardSignal::Moved;
    }

    /**
     * @brief Moves the cursor back to @p stage with @p value in its buffer and an error shown.
     * Used when a save is rejected after all input was captured.
     */
    void returnTo(Stage stage, std::string value, std::string error) {
        m_stage = stage;
        m_values[stage] = std::move(value);
        m_error = std::move(error);
    }

    /** @brief Back to the first stage with the construction-time values. */
    void reset() {
        m_stage = m_machine->initial();
        m_values = m_initialValues;
        m_error.clear();
    }

private:
    const StageMachine<Stage>* m_machine;
    std::map<Stage, StageSpec> m_specs;
    std::map<Stage, std::string> m_initialValues;
    std::map<Stage, std::string> m_values;
    Stage m_stage;
    std::string m_error;
};

} // namespace crmterm::application
