// ============================================================================
// model.cpp - Model serialisation for exploration
// ============================================================================

#include "pmc/model.hpp"
#include "pmc/errors.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace pmc {

double SteppableModel::evaluate_reward(std::size_t index) const {
    throw std::out_of_range("model '" + name() + "' has no reward " + std::to_string(index));
}

// ── SerializedModel ─────────────────────────────────────────────────────────

static std::size_t index_of(const std::vector<std::string>& names,
                            const std::string& name,
                            const std::string& what,
                            const std::string& model) {
    auto it = std::find(names.begin(), names.end(), name);
    if (it == names.end()) {
        throw std::invalid_argument("model '" + model + "' has no " + what +
                                    " named '" + name + "'");
    }
    return static_cast<std::size_t>(it - names.begin());
}

SerializedModel::SerializedModel(std::unique_ptr<SteppableModel> prototype,
                                 std::vector<std::string> state_formula_labels,
                                 std::vector<std::string> reward_labels)
    : prototype_(std::move(prototype)),
      state_formula_labels_(std::move(state_formula_labels)),
      reward_labels_(std::move(reward_labels)) {
    if (!prototype_) {
        throw std::invalid_argument("SerializedModel: no model");
    }
    if (state_formula_labels_.size() > kMaxStateLabels) {
        throw CapacityError("at most " + std::to_string(kMaxStateLabels) +
                            " atomic propositions can be checked at once, got " +
                            std::to_string(state_formula_labels_.size()));
    }

    const auto name = prototype_->name();
    const auto propositions = prototype_->proposition_names();
    for (const auto& label : state_formula_labels_) {
        label_propositions_.push_back(index_of(propositions, label, "proposition", name));
    }
    const auto rewards = prototype_->reward_names();
    for (const auto& label : reward_labels_) {
        reward_indices_.push_back(index_of(rewards, label, "reward", name));
    }
}

Labeling SerializedModel::evaluate_labeling(const SteppableModel& model) const {
    Labeling labeling;
    for (std::size_t i = 0; i < label_propositions_.size(); ++i) {
        if (model.evaluate_proposition(label_propositions_[i])) labeling.set(i);
    }
    return labeling;
}

std::vector<double> SerializedModel::evaluate_rewards(const SteppableModel& model) const {
    std::vector<double> values;
    values.reserve(reward_indices_.size());
    for (std::size_t index : reward_indices_) {
        values.push_back(model.evaluate_reward(index));
    }
    return values;
}

SerializedModel serialize_model(const SteppableModel& model,
                                const std::vector<std::string>& atoms,
                                const std::vector<std::string>& rewards) {
    // Labels are kept sorted so that the bit order does not depend on the
    // order in which formulas were registered.
    std::vector<std::string> labels = atoms;
    std::sort(labels.begin(), labels.end());
    labels.erase(std::unique(labels.begin(), labels.end()), labels.end());

    std::vector<std::string> reward_labels = rewards;
    std::sort(reward_labels.begin(), reward_labels.end());
    reward_labels.erase(std::unique(reward_labels.begin(), reward_labels.end()),
                        reward_labels.end());

    return SerializedModel(model.clone(), std::move(labels), std::move(reward_labels));
}

}  // namespace pmc
