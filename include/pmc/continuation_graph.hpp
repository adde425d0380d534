// ============================================================================
// pmc/continuation_graph.hpp - Continuation-graph nodes and the step graph
// ============================================================================
//
// Design notes:
//
//   A continuation graph records the nested nondeterministic/probabilistic
//   branching discovered while exploring one state.  Nodes live in an
//   arena and are named by their index, the continuation id (cid).  All
//   children of one split occupy one contiguous cid block [from, to].
//
//   Node kinds:
//     - Leaf             : `to` is the reached target (a transition-target
//                          index in an LTMDP, an MDP state in an NMDP).
//                          A Leaf with to == -1 is a placeholder that no
//                          path has finished at yet.
//     - Forward          : from == to == the cid whose subtree is reused.
//     - Probabilistic    : children [from, to], weights sum to 1.
//     - Nondeterministic : children [from, to], each with probability 1.
//
//   Value of a node n:  n.probability * content(n), where content(Forward)
//   is the content of the forward target.  A forward therefore reuses the
//   target's subtree under its own edge probability.
//
// ============================================================================

#ifndef PMC_CONTINUATION_GRAPH_HPP
#define PMC_CONTINUATION_GRAPH_HPP

#include <bitset>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pmc {

// ── Basic types ─────────────────────────────────────────────────────────────

using Cid = std::int64_t;
inline constexpr Cid kNoCid = -1;

/// Probabilistic siblings must sum to 1 within this tolerance.
inline constexpr double kProbabilityTolerance = 1e-9;

inline constexpr std::size_t kMaxStateLabels = 64;

/// Bit i is set iff the i-th state-formula label holds.
using Labeling = std::bitset<kMaxStateLabels>;

enum class ChoiceKind : std::uint8_t {
    Leaf,
    Forward,
    Probabilistic,
    Nondeterministic
};

const char* choice_kind_name(ChoiceKind k) noexcept;

// ── ContinuationGraphElement ────────────────────────────────────────────────

struct ContinuationGraphElement {
    ChoiceKind kind = ChoiceKind::Leaf;
    Cid        from = kNoCid;
    Cid        to   = kNoCid;
    double     probability = 1.0;

    bool is_leaf() const noexcept { return kind == ChoiceKind::Leaf; }
    bool is_placeholder() const noexcept { return kind == ChoiceKind::Leaf && to == kNoCid; }
    bool is_split() const noexcept {
        return kind == ChoiceKind::Probabilistic || kind == ChoiceKind::Nondeterministic;
    }
};

// ── TransitionTarget ────────────────────────────────────────────────────────
// Identity key of an MDP state: the labeling together with the storage id
// of the reached model state.

struct TransitionTarget {
    Labeling     labeling;
    std::int64_t target_state = -1;

    bool operator==(const TransitionTarget& o) const noexcept {
        return target_state == o.target_state && labeling == o.labeling;
    }
};

struct TransitionTargetHash {
    std::size_t operator()(const TransitionTarget& t) const noexcept;
};

// ── LtmdpStepGraph ──────────────────────────────────────────────────────────
// Continuation graph of the state currently being explored by one worker.
// Local cids start at 0 (the root).  Merged into the shared LTMDP with
// LabeledTransitionMdp::add_state_graph().

class LtmdpStepGraph {
public:
    LtmdpStepGraph();

    /// Reset to a single root placeholder with probability 1.
    void clear();

    Cid root() const noexcept { return 0; }

    /// Split the placeholder `parent` into `count` children and return the
    /// cid of the first child.  A nondeterministic split gives every child
    /// probability 1; a probabilistic split uses `probabilities`, which must
    /// sum to 1.
    Cid split(Cid parent, ChoiceKind kind, int count, const double* probabilities);

    /// Turn the placeholder `cid` into a forward to `target`.
    void forward(Cid cid, Cid target);

    /// Turn the placeholder `cid` into a leaf referencing `target`.
    void set_target(Cid cid, std::int64_t target);

    const ContinuationGraphElement& element(Cid cid) const;
    const std::vector<ContinuationGraphElement>& elements() const noexcept { return elements_; }
    std::size_t size() const noexcept { return elements_.size(); }

    /// Number of leaves with a target (= number of paths recorded).
    std::size_t leaf_count() const noexcept;

    /// Multi-line dump, one node per line.
    std::string to_string() const;

private:
    ContinuationGraphElement& placeholder(Cid cid, const char* operation);

    std::vector<ContinuationGraphElement> elements_;
};

}  // namespace pmc

#endif  // PMC_CONTINUATION_GRAPH_HPP
