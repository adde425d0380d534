// ============================================================================
// pmc/nmdp.hpp - Nested Markov Decision Process (result model)
// ============================================================================
//
// Design notes:
//
//   The NMDP is the canonical result of state-space construction.  States
//   are dense ids 0..state_count()-1.  Each state owns a root location in a
//   continuation-graph arena whose leaves reference target states; the
//   initial distribution has a root of its own.
//
//   The arena has a fixed capacity chosen up front (ModelCapacity).  It is
//   append-only while LtmdpToNmdp fills it and read-only afterwards.
//   Locations are reserved in blocks and filled in any order; validate()
//   checks that every reserved location was filled.
//
//   NmdpEnumerator walks states -> distributions -> transitions.  A
//   distribution is one resolution of the nondeterministic nodes below the
//   state's root; the choices are enumerated with a ChoiceResolver.
//
// ============================================================================

#ifndef PMC_NMDP_HPP
#define PMC_NMDP_HPP

#include "pmc/choice_resolver.hpp"
#include "pmc/continuation_graph.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace pmc {

// ── ModelCapacity ───────────────────────────────────────────────────────────

struct ModelCapacity {
    std::int64_t states = 0;
    std::int64_t continuation_graph_size = 0;

    /// Estimate from the number of states and the average number of
    /// continuation-graph elements per state.
    static ModelCapacity by_model_size(std::int64_t states, double average_fanout);
};

// ── NestedMdp ───────────────────────────────────────────────────────────────

class NestedMdp {
public:
    NestedMdp(ModelCapacity capacity,
              std::vector<std::string> state_formula_labels,
              std::vector<std::string> reward_labels);

    // ── Construction ────────────────────────────────────────────────────

    /// Declare the number of states.  Throws CapacityError above capacity.
    void set_state_count(std::int64_t count);

    /// Reserve `count` consecutive locations and return the first one.
    Cid get_place_for_new_continuation_graph_elements(std::int64_t count);

    void add_continuation_graph_leaf(Cid location, std::int64_t target_state,
                                     double probability);

    /// Inner node (Probabilistic / Nondeterministic) or Forward node with
    /// the child range [from, to].
    void add_continuation_graph_inner_node(Cid location, ChoiceKind kind,
                                           Cid from, Cid to, double probability);

    void set_root_continuation_graph_location_of_state(std::int64_t state, Cid location);
    void set_root_continuation_graph_location_of_initial_state(Cid location);

    void set_state_labeling(std::int64_t state, Labeling labeling);
    void set_state_rewards(std::int64_t state, std::vector<double> rewards);

    /// Structural check of the finished model.  Throws std::logic_error
    /// describing the first problem found.
    void validate() const;

    // ── Accessors ───────────────────────────────────────────────────────

    std::int64_t state_count() const noexcept { return state_count_; }
    const ModelCapacity& capacity() const noexcept { return capacity_; }

    Cid  root_of_state(std::int64_t state) const;
    bool has_initial_state() const noexcept { return initial_root_ != kNoCid; }
    Cid  root_of_initial_state() const;

    const ContinuationGraphElement& continuation_graph_element(Cid location) const;
    /// Number of reserved locations.
    std::int64_t continuation_graph_size() const noexcept {
        return static_cast<std::int64_t>(elements_.size());
    }

    const Labeling& state_labeling(std::int64_t state) const;
    const std::vector<double>& state_rewards(std::int64_t state) const;

    const std::vector<std::string>& state_formula_labels() const noexcept { return state_formula_labels_; }
    const std::vector<std::string>& reward_labels() const noexcept { return reward_labels_; }

    /// Bit / column of a label, -1 if absent.
    int label_index(const std::string& label) const noexcept;
    int reward_index(const std::string& label) const noexcept;

    // ── Export ──────────────────────────────────────────────────────────
    std::string to_string() const;
    std::string to_dot()    const;
    std::string to_json()   const;

private:
    void check_state(std::int64_t state, const char* operation) const;
    ContinuationGraphElement& slot(Cid location, const char* operation);

    ModelCapacity                         capacity_;
    std::vector<std::string>              state_formula_labels_;
    std::vector<std::string>              reward_labels_;

    std::int64_t                          state_count_ = 0;
    std::vector<Cid>                      state_roots_;
    std::vector<Labeling>                 state_labelings_;
    std::vector<std::vector<double>>      state_rewards_;
    Cid                                   initial_root_ = kNoCid;

    std::vector<ContinuationGraphElement> elements_;
};

// ── NmdpEnumerator ──────────────────────────────────────────────────────────
// Lazy, restartable iteration:
//
//   NmdpEnumerator e(nmdp);
//   while (e.move_next_state())
//       while (e.move_next_distribution())
//           while (e.move_next_transition())
//               use(e.current_state(), e.current_transition());
//
// select_initial_state() positions the enumerator on the initial
// distribution(s); current_state() is then -1.

struct NmdpTransition {
    std::int64_t target_state = -1;
    double       probability  = 0.0;
};

class NmdpEnumerator {
public:
    explicit NmdpEnumerator(const NestedMdp& nmdp);

    bool move_next_state();
    bool select_initial_state();
    bool move_next_distribution();
    bool move_next_transition();

    std::int64_t current_state() const noexcept { return state_; }
    bool is_initial_state() const noexcept { return initial_; }
    const NmdpTransition& current_transition() const;

    /// Back to before the first state.
    void reset();

private:
    void begin_root(Cid root);
    void collect_transitions();

    const NestedMdp& nmdp_;
    ChoiceResolver   resolver_;

    std::int64_t state_   = -1;
    bool         initial_ = false;
    Cid          root_    = kNoCid;
    bool         has_root_ = false;

    std::vector<NmdpTransition> transitions_;
    std::int64_t transition_index_ = -1;
};

}  // namespace pmc

#endif  // PMC_NMDP_HPP
