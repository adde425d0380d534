// ============================================================================
// pmc/model.hpp - The steppable model consumed by exploration
// ============================================================================
//
// A model owns its current state.  Exploration serialises that state with
// save_state(), restores it with load_state(), and lets the model advance
// one step.  Every nondeterministic or probabilistic decision the model
// makes while stepping must go through the ChoiceResolver it is handed.
//
// Atomic propositions and rewards are evaluated by the model on its current
// state; they are addressed by index into proposition_names() and
// reward_names().
//
// ============================================================================

#ifndef PMC_MODEL_HPP
#define PMC_MODEL_HPP

#include "pmc/choice_resolver.hpp"
#include "pmc/continuation_graph.hpp"
#include "pmc/state_storage.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace pmc {

// ── SteppableModel ──────────────────────────────────────────────────────────

class SteppableModel {
public:
    virtual ~SteppableModel() = default;

    /// Independent copy for another exploration worker.
    virtual std::unique_ptr<SteppableModel> clone() const = 0;

    virtual std::string name() const = 0;

    /// Put the model into one of its initial states.  Choices resolved here
    /// form the initial distribution.
    virtual void initial_step(ChoiceResolver& resolver) = 0;

    virtual void load_state(const StateVector& state) = 0;
    virtual StateVector save_state() const = 0;

    /// Advance the current state by one step.
    virtual void step(ChoiceResolver& resolver) = 0;

    virtual std::vector<std::string> proposition_names() const = 0;
    virtual bool evaluate_proposition(std::size_t index) const = 0;

    virtual std::vector<std::string> reward_names() const { return {}; }
    virtual double evaluate_reward(std::size_t index) const;
};

// ── SerializedModel ─────────────────────────────────────────────────────────
// A model prepared for exploration: a prototype to clone workers from and
// the label/reward tables of the formulas that will be checked.  Bit i of a
// state's Labeling is state_formula_labels()[i].

class SerializedModel {
public:
    /// Throws std::invalid_argument for names the model does not know and
    /// CapacityError for more labels than a Labeling can hold.
    SerializedModel(std::unique_ptr<SteppableModel> prototype,
                    std::vector<std::string> state_formula_labels,
                    std::vector<std::string> reward_labels);

    /// Fresh worker model.
    std::unique_ptr<SteppableModel> load() const { return prototype_->clone(); }

    const SteppableModel& prototype() const noexcept { return *prototype_; }

    const std::vector<std::string>& state_formula_labels() const noexcept { return state_formula_labels_; }
    const std::vector<std::string>& reward_labels() const noexcept { return reward_labels_; }

    /// Labeling of the model's current state.
    Labeling evaluate_labeling(const SteppableModel& model) const;

    /// Reward values of the model's current state, by reward label.
    std::vector<double> evaluate_rewards(const SteppableModel& model) const;

private:
    std::unique_ptr<SteppableModel> prototype_;
    std::vector<std::string>        state_formula_labels_;
    std::vector<std::string>        reward_labels_;
    std::vector<std::size_t>        label_propositions_;   // label -> proposition index
    std::vector<std::size_t>        reward_indices_;       // label -> reward index
};

/// Capture `model` for exploration with the given atoms and reward names.
SerializedModel serialize_model(const SteppableModel& model,
                                const std::vector<std::string>& atoms,
                                const std::vector<std::string>& rewards);

}  // namespace pmc

#endif  // PMC_MODEL_HPP
