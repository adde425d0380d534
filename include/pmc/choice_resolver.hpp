// ============================================================================
// pmc/choice_resolver.hpp - Exhaustive replay of a state's decisions
// ============================================================================
//
// Design notes:
//
//   A model's step function asks the resolver for a value at every choice
//   point it reaches.  The resolver replays the step function once per
//   combination of values: the choice stack holds one (value count, chosen
//   value) pair per choice point of the current path and is advanced like
//   an odometer, the most recently introduced choice varying fastest.
//
//   Typical driver loop (one state):
//
//     resolver.prepare_next_state();
//     while (resolver.prepare_next_path()) {
//         model.load_state(source);
//         model.step(resolver);          // calls handle_choice() etc.
//         ...                            // record the reached target
//     }
//
//   Choice points must be reached in the same order on every replay of one
//   state; a replay that resolves a different number of choices raises
//   NondeterminismError.
//
// ============================================================================

#ifndef PMC_CHOICE_RESOLVER_HPP
#define PMC_CHOICE_RESOLVER_HPP

#include <vector>

namespace pmc {

// ── ChoiceResolver ──────────────────────────────────────────────────────────
// One instance per exploration worker; never shared between threads.

class ChoiceResolver {
public:
    explicit ChoiceResolver(bool use_forward_optimization = true);
    virtual ~ChoiceResolver() = default;

    ChoiceResolver(const ChoiceResolver&)            = delete;
    ChoiceResolver& operator=(const ChoiceResolver&) = delete;

    // ── Path enumeration ────────────────────────────────────────────────

    /// Start the enumeration of a new state.  The next call to
    /// prepare_next_path() yields the all-zero path.
    virtual void prepare_next_state();

    /// Advance to the next unexplored combination of choices.  Returns
    /// false once every combination of the current state has been produced.
    virtual bool prepare_next_path();

    // ── Choice points (called by the model) ─────────────────────────────

    /// Nondeterministic choice among `value_count` values.  Returns the
    /// value to take on the current path.
    virtual int handle_choice(int value_count);

    /// Probabilistic choice among `count` outcomes with the given weights.
    /// The base resolver only counts the outcomes.
    virtual int handle_probabilistic_choice(const double* probabilities, int count);

    int handle_probabilistic_choice(double p0, double p1);
    int handle_probabilistic_choice(double p0, double p1, double p2);
    int handle_probabilistic_choice(const std::vector<double>& probabilities);

    /// Make the choice at `choice_index` deterministic: its untaken values
    /// are never enumerated.  Only a choice currently at value 0 can be
    /// forwarded.  No effect when forward optimisation is disabled.
    virtual void forward_untaken_choices_at_index(int choice_index);

    // ── Replay of external paths ────────────────────────────────────────

    /// Pre-seed the stack with the given values.  The seeded choices are
    /// replayed but never advanced.
    void set_choices(const std::vector<int>& values);

    /// Drop all recorded choices.
    void clear();

    /// Chosen values of the current path, oldest first.
    std::vector<int> choices() const;

    /// Index of the last choice resolved on the current path (-1 if none).
    int last_choice_index() const noexcept { return choice_index_; }

    bool use_forward_optimization() const noexcept { return use_forward_optimization_; }

protected:
    /// Number of choices recorded on the stack.
    int recorded_choices() const noexcept {
        return static_cast<int>(chosen_values_.size());
    }

    std::vector<int> chosen_values_;
    std::vector<int> value_counts_;   // 0 = forwarded / seeded, never advanced
    int  choice_index_ = -1;
    bool first_path_   = false;

private:
    bool use_forward_optimization_;
};

}  // namespace pmc

#endif  // PMC_CHOICE_RESOLVER_HPP
