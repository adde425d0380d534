// ============================================================================
// pmc/ltmdp_generator.hpp - Parallel exploration of a steppable model
// ============================================================================
//
// Design notes:
//
//   Exploration is breadth-first and level-synchronous.  The states found
//   on one level are expanded by an OpenMP `parallel for`; every thread owns
//   one Worker (model clone + LtmdpChoiceResolver + LtmdpStepGraph) and
//   merges its results into the shared StateStorage and LabeledTransitionMdp.
//   States discovered on a level form the next level.
//
//   Expanding one state:
//     1. prepare_next_state() on the worker's resolver
//     2. per path: load the source state, step, save the reached state,
//        insert it into the state storage, evaluate its labeling and turn
//        the reached continuation node into a leaf for the target
//     3. evaluate the source state's rewards
//     4. append the step graph to the LTMDP
//
//   An exception thrown inside the parallel region is captured and rethrown
//   on the calling thread once the region has ended.  Without OpenMP
//   (PMC_USE_OPENMP undefined) every level is expanded sequentially.
//
// ============================================================================

#ifndef PMC_LTMDP_GENERATOR_HPP
#define PMC_LTMDP_GENERATOR_HPP

#include "pmc/config.hpp"
#include "pmc/ltmdp.hpp"
#include "pmc/model.hpp"
#include "pmc/state_storage.hpp"
#include "pmc/utils.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace pmc {

// ── ExplorationStats ────────────────────────────────────────────────────────

struct ExplorationStats {
    std::int64_t states      = 0;   // distinct model states
    std::int64_t targets     = 0;   // distinct transition targets
    std::int64_t transitions = 0;   // recorded paths
    std::int64_t graph_size  = 0;   // continuation graph elements
    std::int64_t levels      = 0;   // breadth-first levels
    int          workers     = 0;
    std::chrono::steady_clock::duration elapsed{};

    std::string to_string() const;
};

// ── LtmdpGenerator ──────────────────────────────────────────────────────────

class LtmdpGenerator {
public:
    LtmdpGenerator(const SerializedModel& model, const AnalysisConfiguration& config);
    ~LtmdpGenerator();

    void set_output(OutputSink sink) { output_ = std::move(sink); }

    /// Explore the whole reachable state space.  Can be called once.
    std::unique_ptr<LabeledTransitionMdp> generate();

    const StateStorage& state_storage() const noexcept { return storage_; }
    const ExplorationStats& stats() const noexcept { return stats_; }

private:
    class Worker;

    int worker_count() const;

    const SerializedModel&  model_;
    AnalysisConfiguration   config_;
    StateStorage            storage_;
    OutputSink              output_;
    ExplorationStats        stats_;
    bool                    generated_ = false;
};

}  // namespace pmc

#endif  // PMC_LTMDP_GENERATOR_HPP
