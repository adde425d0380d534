// ============================================================================
// ltmdp_choice_resolver.cpp - Recording choices into the step graph
// ============================================================================

#include "pmc/ltmdp_choice_resolver.hpp"

namespace pmc {

LtmdpChoiceResolver::LtmdpChoiceResolver(LtmdpStepGraph& graph,
                                         bool use_forward_optimization)
    : ChoiceResolver(use_forward_optimization), graph_(graph) {}

void LtmdpChoiceResolver::prepare_next_state() {
    ChoiceResolver::prepare_next_state();
    graph_.clear();
    choice_from_.clear();
    choice_count_.clear();
    current_cid_ = graph_.root();
}

bool LtmdpChoiceResolver::prepare_next_path() {
    if (!ChoiceResolver::prepare_next_path()) return false;

    // Choices popped by the odometer are re-recorded when the path reaches
    // them again.  Their nodes stay in the graph and are only walked.
    const auto kept = static_cast<std::size_t>(recorded_choices());
    if (choice_from_.size() > kept) {
        choice_from_.resize(kept);
        choice_count_.resize(kept);
    }
    current_cid_ = graph_.root();
    return true;
}

int LtmdpChoiceResolver::handle_choice(int value_count) {
    return record(ChoiceKind::Nondeterministic, value_count, nullptr);
}

int LtmdpChoiceResolver::handle_probabilistic_choice(const double* probabilities,
                                                     int count) {
    return record(ChoiceKind::Probabilistic, count, probabilities);
}

int LtmdpChoiceResolver::record(ChoiceKind kind, int value_count,
                                const double* probabilities) {
    const bool fresh = choice_index_ + 1 >= recorded_choices();
    const int value = ChoiceResolver::handle_choice(value_count);
    const auto index = static_cast<std::size_t>(choice_index_);

    if (fresh || index >= choice_from_.size()) {
        // Choices seeded with set_choices() have no node yet either.
        Cid from = kNoCid;
        if (value_count > 1) {
            from = graph_.split(current_cid_, kind, value_count, probabilities);
        }
        choice_from_.push_back(from);
        choice_count_.push_back(value_count);
    }

    if (choice_from_[index] != kNoCid) {
        current_cid_ = choice_from_[index] + value;
    }
    return value;
}

void LtmdpChoiceResolver::forward_untaken_choices_at_index(int choice_index) {
    if (!use_forward_optimization()) return;

    // Replays reach the same forward again; the siblings are already done.
    const bool forwarded = choice_index >= 0 && choice_index < recorded_choices() &&
                           value_counts_[choice_index] == 0;
    ChoiceResolver::forward_untaken_choices_at_index(choice_index);

    const auto index = static_cast<std::size_t>(choice_index);
    if (forwarded || index >= choice_from_.size()) return;
    const Cid from = choice_from_[index];
    if (from == kNoCid) return;

    for (Cid c = from + 1; c < from + choice_count_[index]; ++c) {
        graph_.forward(c, from);
    }
}

}  // namespace pmc
