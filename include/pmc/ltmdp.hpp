// ============================================================================
// pmc/ltmdp.hpp - Labeled Transition Markov Decision Process
// ============================================================================
//
// Design notes:
//
//   The LTMDP is the intermediate result of exploration.  It pairs the raw
//   transition targets reached by the workers with one continuation graph
//   per explored model state (plus one for the initial distribution).
//
//   All graphs share one arena.  Workers build a state's graph locally in
//   an LtmdpStepGraph and append it with add_state_graph(), which rebases
//   the local cids onto the arena and replaces leaf targets by global
//   transition-target ids.  Appends are serialised by one mutex; the
//   transition-target table is a StripedIndex.
//
//   Accessors are meant for the single-threaded consumer (LtmdpToNmdp) that
//   runs once exploration has finished.
//
// ============================================================================

#ifndef PMC_LTMDP_HPP
#define PMC_LTMDP_HPP

#include "pmc/continuation_graph.hpp"
#include "pmc/state_storage.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace pmc {

class LabeledTransitionMdp {
public:
    LabeledTransitionMdp(std::vector<std::string> state_formula_labels,
                         std::vector<std::string> reward_labels);

    LabeledTransitionMdp(const LabeledTransitionMdp&)            = delete;
    LabeledTransitionMdp& operator=(const LabeledTransitionMdp&) = delete;

    // ── Construction (thread safe) ──────────────────────────────────────

    /// Append the continuation graph of model state `storage_id`.  Leaf
    /// targets of `graph` index into `targets`.  Returns the root cid.
    Cid add_state_graph(std::int64_t storage_id, const LtmdpStepGraph& graph,
                        const std::vector<TransitionTarget>& targets,
                        std::vector<double> rewards);

    /// Append the continuation graph of the initial distribution.
    Cid set_initial_state_graph(const LtmdpStepGraph& graph,
                                const std::vector<TransitionTarget>& targets);

    /// Global id of a transition target (insert-if-absent).
    std::int64_t add_transition_target(const TransitionTarget& target);

    // ── Accessors ───────────────────────────────────────────────────────

    /// Number of model states with a recorded graph slot.
    std::int64_t state_count() const noexcept {
        return static_cast<std::int64_t>(states_.size());
    }

    bool has_state(std::int64_t storage_id) const noexcept;
    Cid  root_of_state(std::int64_t storage_id) const;
    std::int64_t continuation_graph_size_of_state(std::int64_t storage_id) const;
    const std::vector<double>& state_rewards(std::int64_t storage_id) const;

    bool has_initial_state() const noexcept { return initial_.root != kNoCid; }
    Cid  root_of_initial_state() const;
    std::int64_t continuation_graph_size_of_initial_state() const noexcept { return initial_.size; }

    const ContinuationGraphElement& continuation_graph_element(Cid cid) const;
    std::int64_t continuation_graph_size() const noexcept {
        return static_cast<std::int64_t>(elements_.size());
    }

    const TransitionTarget& transition_target(std::int64_t id) const;
    std::int64_t transition_target_count() const noexcept {
        return static_cast<std::int64_t>(targets_.size());
    }
    /// Transition targets in id order.
    const std::vector<TransitionTarget>& transition_targets() const noexcept { return targets_; }

    /// Number of leaves over all graphs (paths recorded during exploration).
    std::int64_t transition_count() const noexcept { return transitions_; }

    const std::vector<std::string>& state_formula_labels() const noexcept { return state_formula_labels_; }
    const std::vector<std::string>& reward_labels() const noexcept { return reward_labels_; }

private:
    struct GraphSlot {
        Cid          root = kNoCid;
        std::int64_t size = 0;
        std::vector<double> rewards;
    };

    GraphSlot append(const LtmdpStepGraph& graph,
                     const std::vector<TransitionTarget>& targets);
    bool has_state_locked(std::int64_t storage_id) const;

    std::vector<std::string> state_formula_labels_;
    std::vector<std::string> reward_labels_;

    StripedIndex<TransitionTarget, TransitionTargetHash> target_index_;

    mutable std::mutex                    append_mutex_;
    std::vector<ContinuationGraphElement> elements_;
    std::vector<GraphSlot>                states_;       // by storage id
    std::vector<TransitionTarget>         targets_;      // by target id
    GraphSlot                             initial_;
    std::int64_t                          transitions_ = 0;
};

}  // namespace pmc

#endif  // PMC_LTMDP_HPP
