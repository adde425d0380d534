// ============================================================================
// ltmdp.cpp - Merging worker step graphs into the shared LTMDP
// ============================================================================

#include "pmc/ltmdp.hpp"
#include "pmc/errors.hpp"

#include <stdexcept>
#include <utility>

namespace pmc {

LabeledTransitionMdp::LabeledTransitionMdp(std::vector<std::string> state_formula_labels,
                                           std::vector<std::string> reward_labels)
    : state_formula_labels_(std::move(state_formula_labels)),
      reward_labels_(std::move(reward_labels)) {
    if (state_formula_labels_.size() > kMaxStateLabels) {
        throw CapacityError("at most " + std::to_string(kMaxStateLabels) +
                            " state formula labels are supported, got " +
                            std::to_string(state_formula_labels_.size()));
    }
}

// ── Construction ────────────────────────────────────────────────────────────

std::int64_t LabeledTransitionMdp::add_transition_target(const TransitionTarget& target) {
    auto [id, inserted] = target_index_.insert(target);
    if (inserted) {
        std::lock_guard<std::mutex> lk(append_mutex_);
        if (targets_.size() <= static_cast<std::size_t>(id)) {
            targets_.resize(static_cast<std::size_t>(id) + 1);
        }
        targets_[static_cast<std::size_t>(id)] = target;
    }
    return id;
}

LabeledTransitionMdp::GraphSlot
LabeledTransitionMdp::append(const LtmdpStepGraph& graph,
                             const std::vector<TransitionTarget>& targets) {
    for (const auto& local : graph.elements()) {
        if (local.is_placeholder()) {
            throw NondeterminismError("continuation graph has an unfinished path");
        }
    }

    // Resolve the global target ids before taking the append lock.
    std::vector<std::int64_t> global(targets.size());
    for (std::size_t i = 0; i < targets.size(); ++i) {
        global[i] = add_transition_target(targets[i]);
    }

    std::lock_guard<std::mutex> lk(append_mutex_);

    GraphSlot slot;
    slot.root = static_cast<Cid>(elements_.size());
    slot.size = static_cast<std::int64_t>(graph.size());

    for (const auto& local : graph.elements()) {
        ContinuationGraphElement e = local;
        if (e.is_leaf()) {
            e.to = global.at(static_cast<std::size_t>(e.to));
            ++transitions_;
        } else {
            e.from += slot.root;
            e.to   += slot.root;
        }
        elements_.push_back(e);
    }
    return slot;
}

Cid LabeledTransitionMdp::add_state_graph(std::int64_t storage_id,
                                          const LtmdpStepGraph& graph,
                                          const std::vector<TransitionTarget>& targets,
                                          std::vector<double> rewards) {
    if (storage_id < 0) {
        throw std::invalid_argument("add_state_graph: negative storage id");
    }
    if (has_state_locked(storage_id)) {
        throw std::logic_error("add_state_graph: state " + std::to_string(storage_id) +
                               " was explored twice");
    }
    GraphSlot slot = append(graph, targets);
    slot.rewards = std::move(rewards);

    std::lock_guard<std::mutex> lk(append_mutex_);
    const auto index = static_cast<std::size_t>(storage_id);
    if (states_.size() <= index) states_.resize(index + 1);
    if (states_[index].root != kNoCid) {
        throw std::logic_error("add_state_graph: state " + std::to_string(storage_id) +
                               " was explored twice");
    }
    states_[index] = std::move(slot);
    return states_[index].root;
}

Cid LabeledTransitionMdp::set_initial_state_graph(const LtmdpStepGraph& graph,
                                                  const std::vector<TransitionTarget>& targets) {
    GraphSlot slot = append(graph, targets);

    std::lock_guard<std::mutex> lk(append_mutex_);
    if (initial_.root != kNoCid) {
        throw std::logic_error("set_initial_state_graph: initial distribution already set");
    }
    initial_ = std::move(slot);
    return initial_.root;
}

bool LabeledTransitionMdp::has_state_locked(std::int64_t storage_id) const {
    std::lock_guard<std::mutex> lk(append_mutex_);
    return has_state(storage_id);
}

// ── Accessors ───────────────────────────────────────────────────────────────

bool LabeledTransitionMdp::has_state(std::int64_t storage_id) const noexcept {
    return storage_id >= 0 && storage_id < state_count() &&
           states_[static_cast<std::size_t>(storage_id)].root != kNoCid;
}

Cid LabeledTransitionMdp::root_of_state(std::int64_t storage_id) const {
    if (!has_state(storage_id)) {
        throw OrderingError("state " + std::to_string(storage_id) + " has not been explored");
    }
    return states_[static_cast<std::size_t>(storage_id)].root;
}

std::int64_t LabeledTransitionMdp::continuation_graph_size_of_state(std::int64_t storage_id) const {
    if (!has_state(storage_id)) {
        throw OrderingError("state " + std::to_string(storage_id) + " has not been explored");
    }
    return states_[static_cast<std::size_t>(storage_id)].size;
}

const std::vector<double>& LabeledTransitionMdp::state_rewards(std::int64_t storage_id) const {
    if (!has_state(storage_id)) {
        throw OrderingError("state " + std::to_string(storage_id) + " has not been explored");
    }
    return states_[static_cast<std::size_t>(storage_id)].rewards;
}

Cid LabeledTransitionMdp::root_of_initial_state() const {
    if (!has_initial_state()) {
        throw OrderingError("the initial distribution has not been explored");
    }
    return initial_.root;
}

const ContinuationGraphElement& LabeledTransitionMdp::continuation_graph_element(Cid cid) const {
    if (cid < 0 || cid >= continuation_graph_size()) {
        throw std::out_of_range("cid " + std::to_string(cid) + " out of range");
    }
    return elements_[static_cast<std::size_t>(cid)];
}

const TransitionTarget& LabeledTransitionMdp::transition_target(std::int64_t id) const {
    if (id < 0 || id >= transition_target_count()) {
        throw std::out_of_range("transition target " + std::to_string(id) + " out of range");
    }
    return targets_[static_cast<std::size_t>(id)];
}

}  // namespace pmc
