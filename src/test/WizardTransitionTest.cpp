#include <cassert>
#include <deque>
#include <functional>
#include <iostream>
#include <map>
#include <set>

#include "application/wizard/AccountForm.hpp"
#include "application/wizard/EventWizard.hpp"
#include "application/wizard/NoteWizard.hpp"
#include "application/wizard/WizardStages.hpp"
#include "TestDoubles.hpp"

using namespace crmterm;
using namespace crmterm::application;

namespace {

template <typename Stage>
using Step = std::pair<Stage, StageOutcome>;

// Shortest sequence of forward steps from the initial stage to @p target.
template <typename Stage>
std::vector<Step<Stage>> PathTo(const StageMachine<Stage>& machine, Stage target) {
    std::map<Stage, std::vector<Step<Stage>>> paths;
    std::deque<Stage> queue;
    paths[machine.initial()] = {};
    queue.push_back(machine.initial());
    while (!queue.empty()) {
        Stage current = queue.front();
        queue.pop_front();
        for (const auto& t : machine.transitions()) {
            if (t.from != current || t.outcome == StageOutcome::Back || t.outcome == StageOutcome::AcceptPreset) continue;
            if (t.to == Stage::Complete || t.to == Stage::Cancel || paths.count(t.to)) continue;
            auto path = paths[current];
            path.push_back({t.from, t.outcome});
            paths[t.to] = path;
            queue.push_back(t.to);
        }
    }
    assert(paths.count(target) && "Every stage must be reachable from the initial stage.");
    return paths[target];
}

/**
 * Replays every declared transition on a fresh engine and checks where it lands.
 */
template <typename Stage>
void CheckAllTransitions(const char* name,
                         const StageMachine<Stage>& machine,
                         std::function<WizardEngine<Stage>(bool preset)> make,
                         std::function<std::string(Stage, StageOutcome)> inputFor,
                         std::function<std::string(Stage)> stageName) {
    std::set<std::pair<Stage, StageOutcome>> seen;
    for (const auto& t : machine.transitions()) {
        seen.insert({t.from, t.outcome});
        WizardEngine<Stage> engine = make(t.outcome == StageOutcome::AcceptPreset);
        for (const auto& step : PathTo(machine, t.from)) {
            WizardSignal signal = engine.submit(inputFor(step.first, step.second));
            assert(signal == WizardSignal::Moved);
        }
        assert(engine.stage() == t.from);

        WizardSignal signal = engine.submit(inputFor(t.from, t.outcome));
        if (t.to == Stage::Complete) {
            assert(signal == WizardSignal::Complete);
        } else if (t.to == Stage::Cancel) {
            assert(signal == WizardSignal::Cancel);
            assert(engine.stage() == machine.initial());
        } else {
            assert(signal == WizardSignal::Moved);
            assert(engine.stage() == t.to);
        }
        std::cout << "[Test] " << name << ": " << stageName(t.from) << " --" << StageOutcomeToString(t.outcome)
                  << "--> " << stageName(t.to) << " OK" << std::endl;
    }
    assert(seen.size() == machine.transitions().size() && "Transition table must not repeat (stage, outcome).");
}

std::string NoteInput(NoteStage stage, StageOutcome outcome) {
    if (outcome == StageOutcome::Back) return "/";
    if (outcome == StageOutcome::Yes) return "y";
    if (outcome == StageOutcome::No) return "n";
    return stage == NoteStage::AssociateChoose ? "Acme" : "Follow up";
}

std::string EventInput(EventStage stage, StageOutcome outcome) {
    if (outcome == StageOutcome::Back) return "/";
    if (outcome == StageOutcome::Yes) return "yes";
    if (outcome == StageOutcome::No) return "";
    switch (stage) {
        case EventStage::Title: return "Demo";
        case EventStage::Details: return "";
        case EventStage::Schedule: return "2024-03-20 10:00";
        default: return "Acme";
    }
}

std::string AccountInput(AccountField field, StageOutcome outcome) {
    if (outcome == StageOutcome::Back) return "/";
    return field == AccountField::Name ? "Acme" : "";
}

domain::Account Preset() {
    domain::Account a;
    a.id = 7;
    a.name = "Acme";
    return a;
}

} // namespace

int main() {
    std::cout << "[Test] Starting WizardTransition Test..." << std::endl;

    CheckAllTransitions<NoteStage>("note", NoteStageMachine(),
        [](bool preset) { return NoteWizardState(preset ? std::optional<domain::Account>(Preset()) : std::nullopt).engine; },
        NoteInput, NoteStageToString);
    CheckAllTransitions<EventStage>("event", EventStageMachine(),
        [](bool preset) { return EventWizardState(preset ? std::optional<domain::Account>(Preset()) : std::nullopt).engine; },
        EventInput, EventStageToString);
    CheckAllTransitions<AccountField>("account", AccountFormMachine(),
        [](bool) { return AccountFormState().engine; },
        AccountInput, AccountFieldToString);

    std::cout << "[Test] Back keeps the previously entered value..." << std::endl;
    {
        EventWizardState wizard;
        auto& engine = wizard.engine;
        assert(engine.submit("Quarterly review") == WizardSignal::Moved);
        assert(engine.submit("Bring numbers") == WizardSignal::Moved);
        assert(engine.stage() == EventStage::Schedule);
        assert(engine.submit("back") == WizardSignal::Moved);
        assert(engine.stage() == EventStage::Details);
        assert(engine.buffer() == "Bring numbers");
        assert(engine.submit("/") == WizardSignal::Moved);
        assert(engine.buffer() == "Quarterly review");
        // Forward again reproduces the same state.
        assert(engine.submit(engine.buffer()) == WizardSignal::Moved);
        assert(engine.submit(engine.buffer()) == WizardSignal::Moved);
        assert(engine.stage() == EventStage::Schedule);
        assert(engine.value(EventStage::Title) == "Quarterly review");
        assert(engine.value(EventStage::Details) == "Bring numbers");
    }

    std::cout << "[Test] Validation errors stay on the stage..." << std::endl;
    {
        NoteWizardState note;
        assert(note.engine.submit("   ") == WizardSignal::Stay);
        assert(note.engine.error() == "Note cannot be empty");
        assert(note.engine.submit("Call back") == WizardSignal::Moved);
        assert(note.engine.error().empty());
        assert(note.engine.submit("maybe") == WizardSignal::Stay);
        assert(note.engine.error() == kYesNoError);
        assert(note.engine.stage() == NoteStage::AssociatePrompt);
        assert(note.engine.submit("N") == WizardSignal::Complete);

        EventWizardState event;
        assert(event.engine.submit("") == WizardSignal::Stay);
        assert(event.engine.error() == "Title is required");
        event.engine.submit("Demo");
        event.engine.submit("");
        assert(event.engine.submit("tomorrow at 3") == WizardSignal::Stay);
        assert(event.engine.error() == kScheduleFormatError);
        assert(event.engine.submit("2024-02-30 10:00") == WizardSignal::Stay);
        assert(event.engine.submit("2024-03-20 10:00") == WizardSignal::Moved);

        AccountFormState form;
        assert(form.engine.submit("") == WizardSignal::Stay);
        assert(form.engine.error() == kRequiredFieldError);
    }

    std::cout << "[Test] Exit token leaves from any stage..." << std::endl;
    {
        NoteWizardState note;
        note.engine.submit("Draft");
        assert(note.engine.submit("exit.") == WizardSignal::Exit);
        assert(note.engine.stage() == NoteStage::Content);
        assert(note.engine.buffer().empty());
        assert(note.engine.submit("QUIT") == WizardSignal::Exit);
    }

    std::cout << "[Test] A preset account skips the association questions..." << std::endl;
    {
        NoteWizardState note(Preset());
        assert(note.engine.submit("Linked") == WizardSignal::Complete);
        EventWizardState event(Preset());
        event.engine.submit("Visit");
        event.engine.submit("");
        assert(event.engine.submit("") == WizardSignal::Complete);
    }

    std::cout << "[Test] Schedule parsing..." << std::endl;
    {
        const domain::TimeZone utc = domain::TimeZone::Utc();
        auto parsed = ParseSchedule("2024-03-20 10:30", utc);
        assert(parsed && *parsed == test::At(20, 10, 30));
        assert(!ParseSchedule("2024-3-20 10:30", utc));
        assert(!ParseSchedule("2024-03-20T10:30", utc));
        assert(!ParseSchedule("2024-03-20 10:30:00", utc));
        assert(!ParseSchedule("2024-13-01 10:30", utc));
        if (auto ny = domain::TimeZone::Load("America/New_York")) {
            auto local = ParseSchedule("2024-03-20 10:30", *ny);
            assert(local && *local == test::At(20, 14, 30));
        }
    }

    std::cout << "[Test] Edit form is seeded from the record..." << std::endl;
    {
        domain::Account existing = Preset();
        existing.phone = "555-0100";
        existing.creator = "Alice";
        AccountFormState form(existing);
        assert(form.editing);
        assert(form.engine.buffer() == "Acme");
        form.engine.submit("Acme Inc");
        assert(form.engine.buffer() == "555-0100");
        form.engine.returnTo(AccountField::Name, "Acme Inc", kDuplicateAccountError);
        assert(form.engine.stage() == AccountField::Name);
        assert(form.engine.buffer() == "Acme Inc");
        domain::Account draft = form.draft();
        assert(draft.id == 7 && draft.name == "Acme Inc" && draft.phone == "555-0100" && draft.creator == "Alice");
        form.engine.reset();
        assert(form.engine.buffer() == "Acme");
    }

    std::cout << "[PASS] WizardTransition Test Passed!" << std::endl;
    return 0;
}
