// ============================================================================
// probability_checker.cpp - Registration, one-shot build and dispatch
// ============================================================================

#include "pmc/probability_checker.hpp"
#include "pmc/errors.hpp"
#include "pmc/ltmdp_to_nmdp.hpp"
#include "pmc/normalization.hpp"

#include <algorithm>
#include <set>
#include <sstream>
#include <stdexcept>

namespace pmc {

ProbabilityChecker::ProbabilityChecker(const SteppableModel& model, FormulaFactory& factory,
                                       AnalysisConfiguration config)
    : model_(model.clone()), factory_(factory), config_(config), output_(console_output()) {}

ProbabilityChecker::~ProbabilityChecker() = default;

// ============================================================================
// Registration
// ============================================================================

FormulaId ProbabilityChecker::register_formula(FormulaId formula, FormulaType expected,
                                               const char* operation) {
    std::lock_guard<std::mutex> lk(pending_mutex_);

    const FormulaType actual = classify_formula(formula, factory_);
    if (actual != expected) {
        throw FormulaTypeError(std::string(operation) + " expects a " +
                               formula_type_name(expected) + " formula, but '" +
                               factory_.to_string(formula) + "' is " +
                               formula_type_name(actual));
    }
    check_model_provides(formula);

    if (creation_started_.load(std::memory_order_acquire)) {
        throw OrderingError(std::string(operation) +
                            " must be called before create_probability_matrix()");
    }

    const FormulaId normalized = normalize(formula, factory_);
    pending_.push_back(normalized);
    return normalized;
}

void ProbabilityChecker::check_model_provides(FormulaId formula) const {
    const auto propositions = model_->proposition_names();
    for (const auto& atom : collect_atoms(formula, factory_)) {
        if (std::find(propositions.begin(), propositions.end(), atom) == propositions.end()) {
            throw std::invalid_argument("model '" + model_->name() +
                                        "' has no proposition '" + atom + "'");
        }
    }
    const auto rewards = model_->reward_names();
    for (const auto& reward : collect_reward_names(formula, factory_)) {
        if (std::find(rewards.begin(), rewards.end(), reward) == rewards.end()) {
            throw std::invalid_argument("model '" + model_->name() +
                                        "' has no reward '" + reward + "'");
        }
    }
}

void ProbabilityChecker::check_bound_checker(const ProbabilisticModelChecker& checker) const {
    if (&checker.probability_checker() != this) {
        throw std::invalid_argument("the numeric checker is bound to a different "
                                    "ProbabilityChecker");
    }
}

ProbabilityCalculator ProbabilityChecker::calculate_probability(FormulaId formula) {
    const FormulaId id = register_formula(formula, FormulaType::Probability,
                                          "calculate_probability()");
    ProbabilityCalculator calc;
    calc.calculate = [this, id] { return default_checker()->calculate_probability(id); };
    calc.calculate_with_checker = [this, id](ProbabilisticModelChecker& checker) {
        check_bound_checker(checker);
        return checker.calculate_probability(id);
    };
    return calc;
}

FormulaCalculator ProbabilityChecker::calculate_formula(FormulaId formula) {
    const FormulaId id = register_formula(formula, FormulaType::Boolean,
                                          "calculate_formula()");
    FormulaCalculator calc;
    calc.calculate = [this, id] { return default_checker()->calculate_formula(id); };
    calc.calculate_with_checker = [this, id](ProbabilisticModelChecker& checker) {
        check_bound_checker(checker);
        return checker.calculate_formula(id);
    };
    return calc;
}

RewardCalculator ProbabilityChecker::calculate_reward(FormulaId formula) {
    const FormulaId id = register_formula(formula, FormulaType::Reward,
                                          "calculate_reward()");
    RewardCalculator calc;
    calc.calculate = [this, id] { return default_checker()->calculate_reward(id); };
    calc.calculate_with_checker = [this, id](ProbabilisticModelChecker& checker) {
        check_bound_checker(checker);
        return checker.calculate_reward(id);
    };
    return calc;
}

// ============================================================================
// Build
// ============================================================================

void ProbabilityChecker::create_probability_matrix() {
    if (sizeof(std::size_t) != 8) {
        throw CapacityError("model checking is only supported in 64-bit processes");
    }

    bool expected = false;
    if (!creation_started_.compare_exchange_strong(expected, true,
                                                   std::memory_order_acq_rel)) {
        return;
    }

    const auto t_start = std::chrono::steady_clock::now();

    std::vector<FormulaId> formulas;
    {
        std::lock_guard<std::mutex> lk(pending_mutex_);
        formulas = pending_;
    }

    std::set<std::string> atoms;
    std::set<std::string> rewards;
    for (FormulaId f : formulas) {
        for (auto& a : collect_atoms(f, factory_)) atoms.insert(std::move(a));
        for (auto& r : collect_reward_names(f, factory_)) rewards.insert(std::move(r));
    }

    const SerializedModel serialized =
        serialize_model(*model_, {atoms.begin(), atoms.end()}, {rewards.begin(), rewards.end()});
    OutputSink progress = config_.progress_reports ? output_ : OutputSink{};

    const auto t_initialized = std::chrono::steady_clock::now();

    LtmdpGenerator generator(serialized, config_);
    generator.set_output(progress);
    auto ltmdp = generator.generate();
    stats_ = generator.stats();

    LtmdpToNmdp converter(std::move(ltmdp));
    converter.set_output(progress);
    auto nmdp = converter.convert();
    nmdp->validate();

    auto matrix = std::make_unique<CompactMdp>(CompactMdp::derive(*nmdp));
    nmdp_   = std::move(nmdp);
    matrix_ = std::move(matrix);

    const auto t_created = std::chrono::steady_clock::now();

    build_counter_.fetch_add(1, std::memory_order_acq_rel);
    matrix_created_.store(true, std::memory_order_release);
    std::atomic_thread_fence(std::memory_order_seq_cst);

    if (config_.progress_reports) {
        report_statistics(t_initialized - t_start, t_created - t_initialized);
    }
}

void ProbabilityChecker::report_statistics(std::chrono::steady_clock::duration initialization,
                                           std::chrono::steady_clock::duration creation) const {
    const double seconds = std::max(std::chrono::duration<double>(creation).count(), 1e-9);
    const auto per_second = [seconds](std::int64_t n) {
        return std::to_string(static_cast<std::int64_t>(static_cast<double>(n) / seconds));
    };

    emit(output_, "");
    emit(output_, "===============================================");
    emit(output_, "Initialization time: " + format_seconds(initialization));
    emit(output_, "Probability matrix creation time: " + format_seconds(creation));
    emit(output_, "States: " + std::to_string(matrix_->state_count()));
    emit(output_, "Distributions: " + std::to_string(matrix_->distribution_count()));
    emit(output_, "Transitions: " + std::to_string(matrix_->entry_count()));
    emit(output_, per_second(matrix_->state_count()) + " states per second");
    emit(output_, per_second(matrix_->entry_count()) + " transitions per second");
    emit(output_, "===============================================");
    emit(output_, "");
}

void ProbabilityChecker::assert_probability_matrix_was_created() const {
    if (!matrix_created_.load(std::memory_order_acquire)) {
        throw OrderingError("create_probability_matrix() must be called before the "
                            "probability matrix is queried");
    }
}

const CompactMdp& ProbabilityChecker::compact_probability_matrix() const {
    assert_probability_matrix_was_created();
    return *matrix_;
}

const NestedMdp& ProbabilityChecker::nested_mdp() const {
    assert_probability_matrix_was_created();
    return *nmdp_;
}

const ExplorationStats& ProbabilityChecker::exploration_stats() const {
    assert_probability_matrix_was_created();
    return stats_;
}

// ============================================================================
// Numeric checkers
// ============================================================================

void ProbabilityChecker::set_default_checker(std::unique_ptr<ProbabilisticModelChecker> checker) {
    if (!checker) throw std::invalid_argument("default checker must not be null");
    check_bound_checker(*checker);
    std::lock_guard<std::mutex> lk(checker_mutex_);
    default_checker_ = std::move(checker);
}

std::shared_ptr<ProbabilisticModelChecker> ProbabilityChecker::default_checker() {
    std::lock_guard<std::mutex> lk(checker_mutex_);
    if (!default_checker_) {
        default_checker_ = std::make_shared<ValueIterationChecker>(*this);
    }
    return default_checker_;
}

}  // namespace pmc
