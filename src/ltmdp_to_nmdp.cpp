// ============================================================================
// ltmdp_to_nmdp.cpp - LTMDP to NMDP conversion
// ============================================================================

#include "pmc/ltmdp_to_nmdp.hpp"
#include "pmc/errors.hpp"

#include <limits>
#include <utility>

namespace pmc {

LtmdpToNmdp::LtmdpToNmdp(std::unique_ptr<LabeledTransitionMdp> ltmdp)
    : ltmdp_(std::move(ltmdp)) {}

std::unique_ptr<NestedMdp> LtmdpToNmdp::convert() {
    if (!ltmdp_) {
        throw OrderingError("no LTMDP to convert: exploration has not run or the "
                            "LTMDP was already converted");
    }
    if (!ltmdp_->has_initial_state()) {
        throw OrderingError("cannot convert an LTMDP without an initial distribution");
    }

    const auto t_start = std::chrono::steady_clock::now();
    emit(output_, "Creating nested Markov decision process");

    create_states();
    set_state_labels_and_rewards();
    convert_initial_states();
    convert_transitions();

    elapsed_ = std::chrono::steady_clock::now() - t_start;
    emit(output_, "Nested MDP has " + std::to_string(nmdp_->state_count()) + " states and " +
                  std::to_string(nmdp_->continuation_graph_size()) +
                  " continuation graph elements (" + format_seconds(elapsed_) + ")");

    // The LTMDP is no longer needed; release it to bound peak memory.
    ltmdp_.reset();
    return std::move(nmdp_);
}

// ── States ──────────────────────────────────────────────────────────────────

void LtmdpToNmdp::create_states() {
    const auto& targets = ltmdp_->transition_targets();
    target_states_.assign(targets.size(), -1);

    for (std::size_t i = 0; i < targets.size(); ++i) {
        auto [it, inserted] = mapper_.emplace(targets[i],
                                              static_cast<std::int64_t>(state_keys_.size()));
        if (inserted) state_keys_.push_back(targets[i]);
        target_states_[i] = it->second;
    }

    const auto state_count = static_cast<std::int64_t>(state_keys_.size());
    std::int64_t graph_size = ltmdp_->continuation_graph_size_of_initial_state();
    for (const auto& key : state_keys_) {
        graph_size += ltmdp_->continuation_graph_size_of_state(key.target_state);
    }

    // The initial distribution counts as one more graph.
    const ModelCapacity capacity = ModelCapacity::by_model_size(
        state_count, static_cast<double>(graph_size) / static_cast<double>(state_count + 1));

    nmdp_ = std::make_unique<NestedMdp>(capacity, ltmdp_->state_formula_labels(),
                                        ltmdp_->reward_labels());
    nmdp_->set_state_count(capacity.states);
    emit(output_, "  " + std::to_string(capacity.states) + " distinct states");
}

void LtmdpToNmdp::set_state_labels_and_rewards() {
    for (std::size_t s = 0; s < state_keys_.size(); ++s) {
        const auto state = static_cast<std::int64_t>(s);
        nmdp_->set_state_labeling(state, state_keys_[s].labeling);
        nmdp_->set_state_rewards(state, ltmdp_->state_rewards(state_keys_[s].target_state));
    }
}

// ── Continuation graphs ─────────────────────────────────────────────────────

void LtmdpToNmdp::convert_initial_states() {
    Cid root = convert_graph(ltmdp_->root_of_initial_state());
    nmdp_->set_root_continuation_graph_location_of_initial_state(root);
}

void LtmdpToNmdp::convert_transitions() {
    for (std::size_t s = 0; s < state_keys_.size(); ++s) {
        Cid root = convert_graph(ltmdp_->root_of_state(state_keys_[s].target_state));
        nmdp_->set_root_continuation_graph_location_of_state(static_cast<std::int64_t>(s), root);
    }
}

Cid LtmdpToNmdp::convert_graph(Cid root) {
    clear_cid_buffer(root);

    const Cid root_location = nmdp_->get_place_for_new_continuation_graph_elements(1);
    buffer_cid(root, root_location);

    struct Work {
        Cid cid;
        Cid location;
    };
    std::vector<Work> stack;
    stack.push_back({root, root_location});

    while (!stack.empty()) {
        const Work w = stack.back();
        stack.pop_back();

        const auto& e = ltmdp_->continuation_graph_element(w.cid);
        switch (e.kind) {
            case ChoiceKind::Leaf:
                nmdp_->add_continuation_graph_leaf(
                    w.location, target_states_.at(static_cast<std::size_t>(e.to)),
                    e.probability);
                break;

            case ChoiceKind::Forward: {
                const Cid target = buffered_location(e.from);
                nmdp_->add_continuation_graph_inner_node(w.location, ChoiceKind::Forward,
                                                         target, target, e.probability);
                break;
            }

            case ChoiceKind::Probabilistic:
            case ChoiceKind::Nondeterministic: {
                const Cid count = e.to - e.from + 1;
                const Cid block = nmdp_->get_place_for_new_continuation_graph_elements(count);
                nmdp_->add_continuation_graph_inner_node(w.location, e.kind, block,
                                                         block + count - 1, e.probability);
                for (Cid i = 0; i < count; ++i) buffer_cid(e.from + i, block + i);
                // Reverse push keeps the children in order.
                for (Cid i = count - 1; i >= 0; --i) stack.push_back({e.from + i, block + i});
                break;
            }
        }
    }
    return root_location;
}

// ── Cid buffer ──────────────────────────────────────────────────────────────

void LtmdpToNmdp::clear_cid_buffer(Cid offset) {
    cid_buffer_.clear();
    cid_offset_ = offset;
}

void LtmdpToNmdp::buffer_cid(Cid cid, Cid location) {
    const Cid position = cid - cid_offset_;
    if (position < 0) {
        throw OrderingError("cid " + std::to_string(cid) + " lies before the graph root " +
                            std::to_string(cid_offset_));
    }
    if (position > std::numeric_limits<std::int32_t>::max()) {
        throw CapacityError("continuation graph of one state exceeds " +
                            std::to_string(std::numeric_limits<std::int32_t>::max()) +
                            " elements");
    }
    const auto index = static_cast<std::size_t>(position);
    if (cid_buffer_.size() <= index) cid_buffer_.resize(index + 1, kNoCid);
    cid_buffer_[index] = location;
}

Cid LtmdpToNmdp::buffered_location(Cid cid) const {
    const Cid position = cid - cid_offset_;
    if (position < 0 || position >= static_cast<Cid>(cid_buffer_.size()) ||
        cid_buffer_[static_cast<std::size_t>(position)] == kNoCid) {
        throw OrderingError("forward to cid " + std::to_string(cid) +
                            ", which was not converted as part of the same state");
    }
    return cid_buffer_[static_cast<std::size_t>(position)];
}

}  // namespace pmc
