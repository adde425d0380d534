// ============================================================================
// pmc/probability_checker.hpp - One-shot matrix build and query dispatch
// ============================================================================
//
// Design notes:
//
//   Usage follows a strict order:
//
//     1. register formulas with calculate_probability / calculate_formula /
//        calculate_reward; each returns a deferred calculator
//     2. create_probability_matrix() explores the model once, with labels
//        and rewards for exactly the registered formulas
//     3. invoke the calculators
//
//   Registering after step 2 has started, or invoking a calculator before
//   step 2 has finished, is an OrderingError.
//
//   create_probability_matrix() may be called from several threads; a
//   compare-and-swap on creation_started_ lets exactly one of them build.
//   The others return at once without waiting.  The finished matrix is
//   published with a release store followed by a full fence.
//
//   Once the matrix is published, calculators may be invoked from many
//   threads at once.  Each invocation holds its own reference to the
//   default checker, so set_default_checker() may replace it concurrently.
//
//   Calculators refer to the ProbabilityChecker that created them and must
//   not be invoked after it has been destroyed.
//
//   Registration shares the FormulaFactory; it is serialised on
//   pending_mutex_, so calls for the same checker may come from any thread.
//   The factory must not be modified concurrently by other code.
//
// ============================================================================

#ifndef PMC_PROBABILITY_CHECKER_HPP
#define PMC_PROBABILITY_CHECKER_HPP

#include "pmc/ast.hpp"
#include "pmc/compact_mdp.hpp"
#include "pmc/config.hpp"
#include "pmc/formula_visitor.hpp"
#include "pmc/ltmdp_generator.hpp"
#include "pmc/model.hpp"
#include "pmc/model_checker.hpp"
#include "pmc/nmdp.hpp"
#include "pmc/utils.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace pmc {

// ── Calculators ─────────────────────────────────────────────────────────────
// calculate() uses the checker's default numeric checker;
// calculate_with_checker() uses the given one, which must be bound to the
// same ProbabilityChecker.

template <typename Result>
struct Calculator {
    std::function<Result()>                           calculate;
    std::function<Result(ProbabilisticModelChecker&)> calculate_with_checker;
};

using ProbabilityCalculator = Calculator<Probability>;
using FormulaCalculator     = Calculator<bool>;
using RewardCalculator      = Calculator<RewardResult>;

// ── ProbabilityChecker ──────────────────────────────────────────────────────

class ProbabilityChecker {
public:
    ProbabilityChecker(const SteppableModel& model, FormulaFactory& factory,
                       AnalysisConfiguration config = AnalysisConfiguration::defaults());
    ~ProbabilityChecker();

    ProbabilityChecker(const ProbabilityChecker&) = delete;
    ProbabilityChecker& operator=(const ProbabilityChecker&) = delete;

    /// Progress and statistics go here (console by default).
    void set_output(OutputSink sink) { output_ = std::move(sink); }

    const AnalysisConfiguration& configuration() const noexcept { return config_; }
    const FormulaFactory& formula_factory() const noexcept { return factory_; }

    // ── Registration ────────────────────────────────────────────────────
    // Throw FormulaTypeError for a formula of the wrong kind,
    // std::invalid_argument for atoms or rewards the model does not
    // provide, and OrderingError once the build has started.

    ProbabilityCalculator calculate_probability(FormulaId formula);
    FormulaCalculator     calculate_formula(FormulaId formula);
    RewardCalculator      calculate_reward(FormulaId formula);

    // ── Build ───────────────────────────────────────────────────────────

    void create_probability_matrix();

    bool probability_matrix_was_created() const noexcept {
        return matrix_created_.load(std::memory_order_acquire);
    }
    void assert_probability_matrix_was_created() const;

    const CompactMdp&       compact_probability_matrix() const;
    const NestedMdp&        nested_mdp() const;
    const ExplorationStats& exploration_stats() const;

    /// Number of times the build path actually ran (0 or 1).
    std::int64_t build_count() const noexcept {
        return build_counter_.load(std::memory_order_acquire);
    }

    // ── Numeric checkers ────────────────────────────────────────────────

    void set_default_checker(std::unique_ptr<ProbabilisticModelChecker> checker);

    /// The default checker; a ValueIterationChecker unless one was set.
    std::shared_ptr<ProbabilisticModelChecker> default_checker();

private:
    FormulaId register_formula(FormulaId formula, FormulaType expected, const char* operation);
    void check_model_provides(FormulaId formula) const;
    void check_bound_checker(const ProbabilisticModelChecker& checker) const;
    void report_statistics(std::chrono::steady_clock::duration initialization,
                           std::chrono::steady_clock::duration creation) const;

    std::unique_ptr<SteppableModel> model_;
    FormulaFactory&                 factory_;
    AnalysisConfiguration           config_;
    OutputSink                      output_;

    std::mutex             pending_mutex_;
    std::vector<FormulaId> pending_;

    std::atomic<bool>         creation_started_{false};
    std::atomic<bool>         matrix_created_{false};
    std::atomic<std::int64_t> build_counter_{0};

    std::unique_ptr<NestedMdp>  nmdp_;
    std::unique_ptr<CompactMdp> matrix_;
    ExplorationStats            stats_;

    std::mutex                                 checker_mutex_;
    std::shared_ptr<ProbabilisticModelChecker> default_checker_;
};

}  // namespace pmc

#endif  // PMC_PROBABILITY_CHECKER_HPP
