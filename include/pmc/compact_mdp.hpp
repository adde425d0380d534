// ============================================================================
// pmc/compact_mdp.hpp - Flat probability matrix derived from an NMDP
// ============================================================================
//
// Compressed-row layout:
//
//   state_row_[s] .. state_row_[s+1]-1   distributions of state s
//   dist_row_[d]  .. dist_row_[d+1]-1    entries of distribution d
//   columns_[k], values_[k]              target state, probability
//
// The initial distributions are stored as one extra pseudo-state with
// index state_count().  Columns are 32 bit; models with more states are
// rejected before anything is derived.
//
// ============================================================================

#ifndef PMC_COMPACT_MDP_HPP
#define PMC_COMPACT_MDP_HPP

#include "pmc/continuation_graph.hpp"
#include "pmc/nmdp.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace pmc {

class CompactMdp {
public:
    /// Flatten `nmdp`; equal targets within a distribution are merged.
    static CompactMdp derive(const NestedMdp& nmdp);

    std::int32_t state_count() const noexcept { return state_count_; }
    std::int32_t initial_state() const noexcept { return state_count_; }

    // Distribution indices of state s (s == initial_state() for the
    // initial distributions).
    std::int64_t distribution_begin(std::int32_t s) const { return state_row_.at(static_cast<std::size_t>(s)); }
    std::int64_t distribution_end(std::int32_t s) const { return state_row_.at(static_cast<std::size_t>(s) + 1); }

    std::int64_t entry_begin(std::int64_t d) const { return dist_row_.at(static_cast<std::size_t>(d)); }
    std::int64_t entry_end(std::int64_t d) const { return dist_row_.at(static_cast<std::size_t>(d) + 1); }

    std::int32_t column(std::int64_t k) const { return columns_[static_cast<std::size_t>(k)]; }
    double       value(std::int64_t k) const { return values_[static_cast<std::size_t>(k)]; }

    std::int64_t distribution_count() const noexcept {
        return static_cast<std::int64_t>(dist_row_.size()) - 1;
    }
    std::int64_t entry_count() const noexcept { return static_cast<std::int64_t>(columns_.size()); }

    const Labeling& labeling(std::int32_t s) const { return labelings_.at(static_cast<std::size_t>(s)); }
    double reward(std::int32_t s, int reward_index) const;

    const std::vector<std::string>& state_formula_labels() const noexcept { return state_formula_labels_; }
    const std::vector<std::string>& reward_labels() const noexcept { return reward_labels_; }
    int label_index(const std::string& label) const noexcept;
    int reward_index(const std::string& label) const noexcept;

    std::string to_string() const;

private:
    std::int32_t state_count_ = 0;
    std::vector<std::int64_t> state_row_;
    std::vector<std::int64_t> dist_row_;
    std::vector<std::int32_t> columns_;
    std::vector<double>       values_;

    std::vector<Labeling>            labelings_;
    std::vector<std::vector<double>> rewards_;
    std::vector<std::string>         state_formula_labels_;
    std::vector<std::string>         reward_labels_;
};

}  // namespace pmc

#endif  // PMC_COMPACT_MDP_HPP
