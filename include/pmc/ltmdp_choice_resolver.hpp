// ============================================================================
// pmc/ltmdp_choice_resolver.hpp - Resolver that records a continuation graph
// ============================================================================
//
// Every choice point seen for the first time on the current state splits the
// continuation node the path has reached so far.  Replayed choice points
// only move along the existing children, so shared prefixes of different
// paths are recorded once.  Choices with a single value create no node.
//
// At the end of a path, current_continuation() is the placeholder that the
// driver turns into a leaf for the reached transition target.
//
// ============================================================================

#ifndef PMC_LTMDP_CHOICE_RESOLVER_HPP
#define PMC_LTMDP_CHOICE_RESOLVER_HPP

#include "pmc/choice_resolver.hpp"
#include "pmc/continuation_graph.hpp"

#include <vector>

namespace pmc {

class LtmdpChoiceResolver : public ChoiceResolver {
public:
    /// `graph` must outlive the resolver.
    LtmdpChoiceResolver(LtmdpStepGraph& graph, bool use_forward_optimization = true);

    void prepare_next_state() override;
    bool prepare_next_path() override;

    int handle_choice(int value_count) override;
    int handle_probabilistic_choice(const double* probabilities, int count) override;
    using ChoiceResolver::handle_probabilistic_choice;

    void forward_untaken_choices_at_index(int choice_index) override;

    /// Continuation node reached by the current path.
    Cid current_continuation() const noexcept { return current_cid_; }

    LtmdpStepGraph& graph() noexcept { return graph_; }

private:
    int record(ChoiceKind kind, int value_count, const double* probabilities);

    LtmdpStepGraph& graph_;
    Cid current_cid_ = 0;

    // Per choice index: first child cid of the split (kNoCid when the
    // choice had a single value) and the number of children.
    std::vector<Cid> choice_from_;
    std::vector<int> choice_count_;
};

}  // namespace pmc

#endif  // PMC_LTMDP_CHOICE_RESOLVER_HPP
