// ============================================================================
// pmc/model_checker.hpp - Numeric checkers over the probability matrix
// ============================================================================
//
// Design notes:
//
//   A ProbabilisticModelChecker is bound to one ProbabilityChecker and reads
//   the finished probability matrix (CompactMdp) through it.  Calling any
//   calculate_*() before the matrix was created is an OrderingError raised
//   by the ProbabilityChecker.
//
//   ValueIterationChecker is the default.  It iterates the Bellman operator
//
//       x'(s) = opt_d  sum_t P(s, d, t) * x(t)
//
//   starting from the least element.  Unbounded operators stop once no
//   state changes by more than epsilon; bounded operators run exactly k
//   steps.  The result of a query is taken at the initial pseudo-state,
//   where the optimum over the initial distributions is applied.
//
//     X phi        one step on the indicator of phi
//     a U b        reachability of b through a
//     F phi        true U phi
//     G phi        1 - (true U !phi), with min and max swapped
//     P~t [psi]    Pmin for > and >=, Pmax for < and <=
//     psi          a bare path formula means Pmax
//     C<=k         x'(s) = r(s) + opt_d sum_t P(s, d, t) * x(t), k steps
//
// ============================================================================

#ifndef PMC_MODEL_CHECKER_HPP
#define PMC_MODEL_CHECKER_HPP

#include "pmc/ast.hpp"
#include "pmc/compact_mdp.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace pmc {

class ProbabilityChecker;

using Probability = double;

// ── RewardResult ────────────────────────────────────────────────────────────

struct RewardResult {
    double value   = 0.0;   // according to the query's optimum (R=? is Rmax)
    double minimum = 0.0;
    double maximum = 0.0;

    std::string to_string() const;
};

// ── ProbabilisticModelChecker ───────────────────────────────────────────────

class ProbabilisticModelChecker {
public:
    explicit ProbabilisticModelChecker(ProbabilityChecker& checker) : checker_(checker) {}
    virtual ~ProbabilisticModelChecker() = default;

    ProbabilisticModelChecker(const ProbabilisticModelChecker&) = delete;
    ProbabilisticModelChecker& operator=(const ProbabilisticModelChecker&) = delete;

    virtual Probability  calculate_probability(FormulaId formula) = 0;
    virtual bool         calculate_formula(FormulaId formula) = 0;
    virtual RewardResult calculate_reward(FormulaId formula) = 0;

    ProbabilityChecker& probability_checker() const noexcept { return checker_; }

protected:
    ProbabilityChecker& checker_;
};

// ── ValueIterationChecker ───────────────────────────────────────────────────

class ValueIterationChecker : public ProbabilisticModelChecker {
public:
    explicit ValueIterationChecker(ProbabilityChecker& checker);

    Probability  calculate_probability(FormulaId formula) override;
    bool         calculate_formula(FormulaId formula) override;
    RewardResult calculate_reward(FormulaId formula) override;

    /// Iterations performed by the most recently finished unbounded fixpoint.
    /// Queries may run concurrently; each one publishes its own count.
    std::int64_t last_iteration_count() const noexcept {
        return last_iterations_.load(std::memory_order_relaxed);
    }

private:
    using StateSet = std::vector<char>;
    using Values   = std::vector<double>;

    const CompactMdp&     matrix() const;
    const FormulaFactory& factory() const;

    StateSet satisfying_states(FormulaId state_formula);
    Values   path_probabilities(FormulaId path, bool maximise);
    Values   until(const StateSet& lhs, const StateSet& rhs, bool maximise, std::int64_t bound);
    Values   next(const StateSet& phi, bool maximise);

    /// opt_d sum_t P(s, d, t) * x(t) for one state.
    double bellman(std::int32_t s, const Values& x, bool maximise) const;

    /// Value at the initial pseudo-state.
    double initial_value(const Values& x, bool maximise) const;

    double cumulative_reward(int reward_index, std::int64_t bound, bool maximise) const;

    double       epsilon_;
    std::int64_t max_iterations_;
    std::atomic<std::int64_t> last_iterations_{0};
};

}  // namespace pmc

#endif  // PMC_MODEL_CHECKER_HPP
