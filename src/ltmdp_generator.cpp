// ============================================================================
// ltmdp_generator.cpp - Level-synchronous exploration with OpenMP workers
// ============================================================================

#include "pmc/ltmdp_generator.hpp"
#include "pmc/errors.hpp"
#include "pmc/ltmdp_choice_resolver.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <sstream>
#include <unordered_map>
#include <vector>

#ifdef PMC_USE_OPENMP
#include <omp.h>
#endif

namespace pmc {

std::string ExplorationStats::to_string() const {
    std::ostringstream oss;
    oss << "  States:                " << states << "\n"
        << "  Transition targets:    " << targets << "\n"
        << "  Transitions:           " << transitions << "\n"
        << "  Continuation graph:    " << graph_size << " elements\n"
        << "  Levels:                " << levels << "\n"
        << "  Workers:               " << workers << "\n"
        << "  Exploration time:      " << format_seconds(elapsed) << "\n";
    return oss.str();
}

// ============================================================================
// Worker - per-thread exploration state
// ============================================================================

class LtmdpGenerator::Worker {
public:
    Worker(const SerializedModel& model, bool use_forward_optimization)
        : serialized_(model),
          model_(model.load()),
          resolver_(graph_, use_forward_optimization) {}

    /// Explore the initial distribution; every reached state is discovered.
    void expand_initial(StateStorage& storage, LabeledTransitionMdp& ltmdp,
                        std::vector<std::int64_t>& discovered) {
        begin_state();
        while (resolver_.prepare_next_path()) {
            model_->initial_step(resolver_);
            record_target(storage, discovered);
        }
        ltmdp.set_initial_state_graph(graph_, targets_);
    }

    void expand(std::int64_t storage_id, StateStorage& storage,
                LabeledTransitionMdp& ltmdp, std::vector<std::int64_t>& discovered) {
        const StateVector source = storage.key(storage_id);

        begin_state();
        while (resolver_.prepare_next_path()) {
            model_->load_state(source);
            model_->step(resolver_);
            record_target(storage, discovered);
        }

        model_->load_state(source);
        ltmdp.add_state_graph(storage_id, graph_, targets_,
                              serialized_.evaluate_rewards(*model_));
    }

private:
    void begin_state() {
        resolver_.prepare_next_state();
        targets_.clear();
        local_targets_.clear();
    }

    void record_target(StateStorage& storage, std::vector<std::int64_t>& discovered) {
        auto [storage_id, inserted] = storage.insert(model_->save_state());
        if (inserted) discovered.push_back(storage_id);

        TransitionTarget target{serialized_.evaluate_labeling(*model_), storage_id};
        auto it = local_targets_.find(target);
        std::int64_t local;
        if (it != local_targets_.end()) {
            local = it->second;
        } else {
            local = static_cast<std::int64_t>(targets_.size());
            targets_.push_back(target);
            local_targets_.emplace(target, local);
        }
        graph_.set_target(resolver_.current_continuation(), local);
    }

    const SerializedModel&           serialized_;
    std::unique_ptr<SteppableModel>  model_;
    LtmdpStepGraph                   graph_;
    LtmdpChoiceResolver              resolver_;
    std::vector<TransitionTarget>    targets_;
    std::unordered_map<TransitionTarget, std::int64_t, TransitionTargetHash> local_targets_;
};

// ============================================================================
// LtmdpGenerator
// ============================================================================

LtmdpGenerator::LtmdpGenerator(const SerializedModel& model,
                               const AnalysisConfiguration& config)
    : model_(model), config_(config), storage_(config.state_capacity) {}

LtmdpGenerator::~LtmdpGenerator() = default;

int LtmdpGenerator::worker_count() const {
#ifdef PMC_USE_OPENMP
    return config_.num_threads > 0 ? config_.num_threads : omp_get_max_threads();
#else
    return 1;
#endif
}

std::unique_ptr<LabeledTransitionMdp> LtmdpGenerator::generate() {
    if (generated_) {
        throw OrderingError("LtmdpGenerator::generate() can only run once");
    }
    generated_ = true;

    const auto t_start = std::chrono::steady_clock::now();
    auto ltmdp = std::make_unique<LabeledTransitionMdp>(model_.state_formula_labels(),
                                                        model_.reward_labels());

    const int num_workers = std::max(1, worker_count());
    std::vector<std::unique_ptr<Worker>> workers;
    workers.reserve(static_cast<std::size_t>(num_workers));
    for (int i = 0; i < num_workers; ++i) {
        workers.push_back(std::make_unique<Worker>(model_, config_.use_forward_optimization));
    }

    std::vector<std::int64_t> frontier;
    workers[0]->expand_initial(storage_, *ltmdp, frontier);

    std::int64_t levels = 0;
    while (!frontier.empty()) {
        ++levels;
        std::vector<std::vector<std::int64_t>> discovered(static_cast<std::size_t>(num_workers));
        const auto n = static_cast<std::int64_t>(frontier.size());

#ifdef PMC_USE_OPENMP
        std::exception_ptr error;
        std::mutex error_mutex;

        #pragma omp parallel for schedule(dynamic, 16) num_threads(num_workers) if(num_workers != 1)
        for (std::int64_t i = 0; i < n; ++i) {
            const auto t = static_cast<std::size_t>(omp_get_thread_num());
            try {
                workers[t]->expand(frontier[static_cast<std::size_t>(i)], storage_,
                                   *ltmdp, discovered[t]);
            } catch (...) {
                std::lock_guard<std::mutex> lk(error_mutex);
                if (!error) error = std::current_exception();
            }
        }
        if (error) std::rethrow_exception(error);
#else
        for (std::int64_t i = 0; i < n; ++i) {
            workers[0]->expand(frontier[static_cast<std::size_t>(i)], storage_,
                               *ltmdp, discovered[0]);
        }
#endif

        frontier.clear();
        for (auto& d : discovered) frontier.insert(frontier.end(), d.begin(), d.end());
        std::sort(frontier.begin(), frontier.end());

        if (config_.progress_reports) {
            emit(output_, "Explored level " + std::to_string(levels) + ": " +
                          std::to_string(storage_.size()) + " states discovered");
        }
    }

    stats_.states      = storage_.size();
    stats_.targets     = ltmdp->transition_target_count();
    stats_.transitions = ltmdp->transition_count();
    stats_.graph_size  = ltmdp->continuation_graph_size();
    stats_.levels      = levels;
    stats_.workers     = num_workers;
    stats_.elapsed     = std::chrono::steady_clock::now() - t_start;
    return ltmdp;
}

}  // namespace pmc
