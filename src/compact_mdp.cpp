// ============================================================================
// compact_mdp.cpp - CSR derivation through the NMDP enumerator
// ============================================================================

#include "pmc/compact_mdp.hpp"
#include "pmc/errors.hpp"

#include <algorithm>
#include <limits>
#include <sstream>
#include <utility>

namespace pmc {

// Append the distributions the enumerator currently points at.
static void append_distributions(NmdpEnumerator& e,
                                 std::vector<std::int64_t>& dist_row,
                                 std::vector<std::int32_t>& columns,
                                 std::vector<double>& values) {
    std::vector<std::pair<std::int32_t, double>> entries;
    while (e.move_next_distribution()) {
        entries.clear();
        while (e.move_next_transition()) {
            const auto& t = e.current_transition();
            entries.emplace_back(static_cast<std::int32_t>(t.target_state), t.probability);
        }
        std::sort(entries.begin(), entries.end(),
                  [](const auto& a, const auto& b) { return a.first < b.first; });

        for (std::size_t i = 0; i < entries.size(); ++i) {
            // Same target as the previous entry of this distribution.
            if (static_cast<std::int64_t>(columns.size()) > dist_row.back() &&
                columns.back() == entries[i].first) {
                values.back() += entries[i].second;
                continue;
            }
            columns.push_back(entries[i].first);
            values.push_back(entries[i].second);
        }
        dist_row.push_back(static_cast<std::int64_t>(columns.size()));
    }
}

CompactMdp CompactMdp::derive(const NestedMdp& nmdp) {
    if (nmdp.state_count() >= std::numeric_limits<std::int32_t>::max()) {
        throw CapacityError("model has " + std::to_string(nmdp.state_count()) +
                            " states; the probability matrix addresses at most " +
                            std::to_string(std::numeric_limits<std::int32_t>::max() - 1));
    }

    CompactMdp m;
    m.state_count_          = static_cast<std::int32_t>(nmdp.state_count());
    m.state_formula_labels_ = nmdp.state_formula_labels();
    m.reward_labels_        = nmdp.reward_labels();

    m.dist_row_.push_back(0);
    m.state_row_.push_back(0);

    NmdpEnumerator e(nmdp);
    while (e.move_next_state()) {
        append_distributions(e, m.dist_row_, m.columns_, m.values_);
        m.state_row_.push_back(static_cast<std::int64_t>(m.dist_row_.size()) - 1);
        m.labelings_.push_back(nmdp.state_labeling(e.current_state()));
        m.rewards_.push_back(nmdp.state_rewards(e.current_state()));
    }

    if (e.select_initial_state()) {
        append_distributions(e, m.dist_row_, m.columns_, m.values_);
    }
    m.state_row_.push_back(static_cast<std::int64_t>(m.dist_row_.size()) - 1);
    return m;
}

double CompactMdp::reward(std::int32_t s, int reward_index) const {
    const auto& r = rewards_.at(static_cast<std::size_t>(s));
    return r.at(static_cast<std::size_t>(reward_index));
}

int CompactMdp::label_index(const std::string& label) const noexcept {
    auto it = std::find(state_formula_labels_.begin(), state_formula_labels_.end(), label);
    return it == state_formula_labels_.end()
               ? -1 : static_cast<int>(it - state_formula_labels_.begin());
}

int CompactMdp::reward_index(const std::string& label) const noexcept {
    auto it = std::find(reward_labels_.begin(), reward_labels_.end(), label);
    return it == reward_labels_.end() ? -1 : static_cast<int>(it - reward_labels_.begin());
}

std::string CompactMdp::to_string() const {
    std::ostringstream oss;
    oss << "Probability matrix with " << state_count_ << " state(s), "
        << distribution_count() << " distribution(s), " << entry_count() << " entries:\n";
    for (std::int32_t s = 0; s <= state_count_; ++s) {
        if (s == state_count_) oss << "  init:";
        else                   oss << "  s" << s << ":";
        for (auto d = distribution_begin(s); d < distribution_end(s); ++d) {
            oss << " {";
            for (auto k = entry_begin(d); k < entry_end(d); ++k) {
                if (k > entry_begin(d)) oss << ", ";
                oss << "s" << column(k) << ": " << value(k);
            }
            oss << "}";
        }
        oss << "\n";
    }
    return oss.str();
}

}  // namespace pmc
