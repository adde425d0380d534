// ============================================================================
// pmc/ltmdp_to_nmdp.hpp - Canonical NMDP from an explored LTMDP
// ============================================================================
//
// Design notes:
//
//   The MDP states of the result are exactly the distinct transition-target
//   keys (labeling, storage id) of the LTMDP, numbered densely in the order
//   in which they were first seen.  Each MDP state receives a copy of the
//   continuation graph of its model state, rebuilt in the NMDP arena.
//
//   Conversion of one graph with root r:
//     1. clear the cid buffer, offset at r (position = cid - r)
//     2. reserve the new root location and buffer (r -> root location)
//     3. expand with an explicit work stack, preorder:
//          Leaf    -> leaf referencing the canonical MDP state
//          Forward -> Forward node whose single-element child range is the
//                     buffered location of the target; never re-expanded
//          Split   -> reserve a contiguous block for the children, emit the
//                     node, buffer every child, expand the children in order
//
//   Every node of the graph is visited once, so conversion cost is bounded
//   by the LTMDP's size rather than by its number of paths.  Forwards may
//   only target nodes of the same graph that are already buffered; anything
//   else is an OrderingError.
//
//   The initial distribution is converted with the same routine before any
//   state graph.  The converter owns the LTMDP and releases it once the
//   NMDP is complete.
//
// ============================================================================

#ifndef PMC_LTMDP_TO_NMDP_HPP
#define PMC_LTMDP_TO_NMDP_HPP

#include "pmc/ltmdp.hpp"
#include "pmc/nmdp.hpp"
#include "pmc/utils.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace pmc {

class LtmdpToNmdp {
public:
    explicit LtmdpToNmdp(std::unique_ptr<LabeledTransitionMdp> ltmdp);

    void set_output(OutputSink sink) { output_ = std::move(sink); }

    /// Build the NMDP.  Can be called once; the LTMDP is released afterwards.
    std::unique_ptr<NestedMdp> convert();

    /// True once the source LTMDP has been released.
    bool ltmdp_retired() const noexcept { return !ltmdp_; }

    /// MDP state of every LTMDP transition target (valid after convert()).
    const std::vector<std::int64_t>& mdp_state_of_target() const noexcept { return target_states_; }


private:
    void create_states();
    void set_state_labels_and_rewards();
    void convert_initial_states();
    void convert_transitions();

    /// Convert the graph rooted at `root`; returns its location in the NMDP.
    Cid convert_graph(Cid root);

    void clear_cid_buffer(Cid offset);
    void buffer_cid(Cid cid, Cid location);
    Cid  buffered_location(Cid cid) const;

    std::unique_ptr<LabeledTransitionMdp> ltmdp_;
    std::unique_ptr<NestedMdp>            nmdp_;
    OutputSink                            output_;

    // Transition-target key -> MDP state, in first-seen order.
    std::unordered_map<TransitionTarget, std::int64_t, TransitionTargetHash> mapper_;
    std::vector<TransitionTarget> state_keys_;      // MDP state -> key
    std::vector<std::int64_t>     target_states_;   // LTMDP target id -> MDP state

    std::vector<Cid> cid_buffer_;
    Cid              cid_offset_ = 0;

    std::chrono::steady_clock::duration elapsed_{};
};

}  // namespace pmc

#endif  // PMC_LTMDP_TO_NMDP_HPP
