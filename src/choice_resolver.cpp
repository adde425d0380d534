// ============================================================================
// choice_resolver.cpp - Odometer enumeration over the choice stack
// ============================================================================

#include "pmc/choice_resolver.hpp"
#include "pmc/errors.hpp"

#include <stdexcept>
#include <string>

namespace pmc {

ChoiceResolver::ChoiceResolver(bool use_forward_optimization)
    : use_forward_optimization_(use_forward_optimization) {}

// ── Path enumeration ────────────────────────────────────────────────────────

void ChoiceResolver::prepare_next_state() {
    first_path_ = true;
}

bool ChoiceResolver::prepare_next_path() {
    // The first path of a state may start from a seeded stack.
    if (!first_path_ && choice_index_ != static_cast<int>(value_counts_.size()) - 1) {
        throw NondeterminismError(
            "path resolved " + std::to_string(choice_index_ + 1) +
            " choices, previously recorded " + std::to_string(value_counts_.size()));
    }

    choice_index_ = -1;

    if (first_path_) {
        first_path_ = false;
        return true;
    }

    // Pop exhausted digits; increment the first one that has a next value.
    while (!chosen_values_.empty()) {
        int chosen = chosen_values_.back();
        chosen_values_.pop_back();

        if (value_counts_.back() > chosen + 1) {
            chosen_values_.push_back(chosen + 1);
            return true;
        }
        value_counts_.pop_back();
    }
    return false;
}

// ── Choice points ───────────────────────────────────────────────────────────

int ChoiceResolver::handle_choice(int value_count) {
    if (value_count < 1) {
        throw std::invalid_argument(
            "choice needs at least one value, got " + std::to_string(value_count));
    }

    ++choice_index_;

    if (choice_index_ < recorded_choices()) {
        int recorded = value_counts_[choice_index_];
        if (recorded != 0 && recorded != value_count) {
            throw NondeterminismError(
                "choice " + std::to_string(choice_index_) + " replayed with " +
                std::to_string(value_count) + " values, recorded " +
                std::to_string(recorded));
        }
        return chosen_values_[choice_index_];
    }

    value_counts_.push_back(value_count);
    chosen_values_.push_back(0);
    return 0;
}

int ChoiceResolver::handle_probabilistic_choice(const double* /*probabilities*/, int count) {
    return handle_choice(count);
}

int ChoiceResolver::handle_probabilistic_choice(double p0, double p1) {
    const double p[2] = {p0, p1};
    return handle_probabilistic_choice(p, 2);
}

int ChoiceResolver::handle_probabilistic_choice(double p0, double p1, double p2) {
    const double p[3] = {p0, p1, p2};
    return handle_probabilistic_choice(p, 3);
}

int ChoiceResolver::handle_probabilistic_choice(const std::vector<double>& probabilities) {
    return handle_probabilistic_choice(probabilities.data(),
                                       static_cast<int>(probabilities.size()));
}

void ChoiceResolver::forward_untaken_choices_at_index(int choice_index) {
    if (!use_forward_optimization_) return;

    if (choice_index < 0 || choice_index >= recorded_choices()) {
        throw std::out_of_range("no choice at index " + std::to_string(choice_index));
    }
    if (chosen_values_[choice_index] != 0) {
        throw NondeterminismError("only a choice at value 0 can be made deterministic");
    }
    value_counts_[choice_index] = 0;
}

// ── Replay of external paths ────────────────────────────────────────────────

void ChoiceResolver::set_choices(const std::vector<int>& values) {
    for (int v : values) {
        chosen_values_.push_back(v);
        value_counts_.push_back(0);
    }
}

void ChoiceResolver::clear() {
    chosen_values_.clear();
    value_counts_.clear();
    choice_index_ = -1;
}

std::vector<int> ChoiceResolver::choices() const {
    return chosen_values_;
}

}  // namespace pmc
