// ============================================================================
// pmc/config.hpp - Analysis configuration
// ============================================================================

#ifndef PMC_CONFIG_HPP
#define PMC_CONFIG_HPP

#include <cstdint>

namespace pmc {

// ── AnalysisConfiguration ───────────────────────────────────────────────────
// Settings shared by exploration, conversion and the default numeric
// checker.  Value-semantic; every ProbabilityChecker owns its own copy.

struct AnalysisConfiguration {
    int           num_threads = 0;                // OpenMP threads (0 = default)
    bool          use_forward_optimization = true;
    std::int64_t  state_capacity = 1 << 24;       // max. distinct model states
    double        value_iteration_epsilon = 1e-9;
    std::int64_t  max_iterations = 1000000;
    bool          progress_reports = true;        // print build statistics

    static AnalysisConfiguration defaults() { return AnalysisConfiguration{}; }
};

}  // namespace pmc

#endif  // PMC_CONFIG_HPP
