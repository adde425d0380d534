// ============================================================================
// model_checker.cpp - Value iteration on the probability matrix
// ============================================================================

#include "pmc/model_checker.hpp"
#include "pmc/errors.hpp"
#include "pmc/formula_visitor.hpp"
#include "pmc/probability_checker.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace pmc {

// Below this many states the Bellman sweeps stay on one thread.
static constexpr std::int32_t kParallelSweepThreshold = 4096;

std::string RewardResult::to_string() const {
    std::ostringstream oss;
    oss << value << " (min " << minimum << ", max " << maximum << ")";
    return oss.str();
}

ValueIterationChecker::ValueIterationChecker(ProbabilityChecker& checker)
    : ProbabilisticModelChecker(checker),
      epsilon_(checker.configuration().value_iteration_epsilon),
      max_iterations_(checker.configuration().max_iterations) {}

const CompactMdp& ValueIterationChecker::matrix() const {
    return checker_.compact_probability_matrix();
}

const FormulaFactory& ValueIterationChecker::factory() const {
    return checker_.formula_factory();
}

// ============================================================================
// Queries
// ============================================================================

Probability ValueIterationChecker::calculate_probability(FormulaId formula) {
    if (classify_formula(formula, factory()) != FormulaType::Probability) {
        throw FormulaTypeError("not a probability formula: " + factory().to_string(formula));
    }

    const FormulaNode n = factory().node(formula);
    FormulaId path = formula;
    bool maximise = true;
    if (n.kind == NodeKind::ProbabilityQuery) {
        path = n.children[0];
        maximise = n.optimum != Optimum::Minimum;
    }
    return initial_value(path_probabilities(path, maximise), maximise);
}

bool ValueIterationChecker::calculate_formula(FormulaId formula) {
    if (classify_formula(formula, factory()) != FormulaType::Boolean) {
        throw FormulaTypeError("not a boolean formula: " + factory().to_string(formula));
    }

    const StateSet sat = satisfying_states(formula);
    const CompactMdp& m = matrix();
    const std::int32_t init = m.initial_state();
    for (auto d = m.distribution_begin(init); d < m.distribution_end(init); ++d) {
        for (auto k = m.entry_begin(d); k < m.entry_end(d); ++k) {
            if (m.value(k) > 0.0 && !sat[static_cast<std::size_t>(m.column(k))]) return false;
        }
    }
    return true;
}

RewardResult ValueIterationChecker::calculate_reward(FormulaId formula) {
    if (classify_formula(formula, factory()) != FormulaType::Reward) {
        throw FormulaTypeError("not a reward formula: " + factory().to_string(formula));
    }

    const FormulaNode n = factory().node(formula);
    const int index = matrix().reward_index(n.atom_name);
    if (index < 0) {
        throw std::invalid_argument("reward '" + n.atom_name +
                                    "' is not part of the probability matrix");
    }

    RewardResult result;
    result.minimum = cumulative_reward(index, n.step_bound, false);
    result.maximum = cumulative_reward(index, n.step_bound, true);
    result.value   = n.optimum == Optimum::Minimum ? result.minimum : result.maximum;
    return result;
}

// ============================================================================
// State formulas
// ============================================================================

ValueIterationChecker::StateSet ValueIterationChecker::satisfying_states(FormulaId id) {
    const auto count = static_cast<std::size_t>(matrix().state_count());
    const FormulaNode n = factory().node(id);

    switch (n.kind) {
        case NodeKind::True:
            return StateSet(count, 1);
        case NodeKind::False:
            return StateSet(count, 0);

        case NodeKind::Atom: {
            const int bit = matrix().label_index(n.atom_name);
            if (bit < 0) {
                throw std::invalid_argument("atom '" + n.atom_name +
                                            "' is not part of the probability matrix");
            }
            StateSet sat(count);
            for (std::size_t s = 0; s < count; ++s) {
                sat[s] = matrix().labeling(static_cast<std::int32_t>(s)).test(
                             static_cast<std::size_t>(bit)) ? 1 : 0;
            }
            return sat;
        }

        case NodeKind::Not: {
            StateSet sat = satisfying_states(n.children[0]);
            for (auto& v : sat) v = !v;
            return sat;
        }

        case NodeKind::And:
        case NodeKind::Or:
        case NodeKind::Implies:
        case NodeKind::Iff: {
            const StateSet a = satisfying_states(n.children[0]);
            const StateSet b = satisfying_states(n.children[1]);
            StateSet sat(count);
            for (std::size_t s = 0; s < count; ++s) {
                switch (n.kind) {
                    case NodeKind::And:     sat[s] = a[s] && b[s]; break;
                    case NodeKind::Or:      sat[s] = a[s] || b[s]; break;
                    case NodeKind::Implies: sat[s] = !a[s] || b[s]; break;
                    default:                sat[s] = (a[s] != 0) == (b[s] != 0); break;
                }
            }
            return sat;
        }

        case NodeKind::ProbabilityBound: {
            // The bound has to hold under every scheduler.
            const bool lower = n.comparison == Comparison::Greater ||
                               n.comparison == Comparison::GreaterEq;
            const Values x = path_probabilities(n.children[0], !lower);
            StateSet sat(count);
            for (std::size_t s = 0; s < count; ++s) {
                switch (n.comparison) {
                    case Comparison::Less:      sat[s] = x[s] <  n.threshold; break;
                    case Comparison::LessEq:    sat[s] = x[s] <= n.threshold; break;
                    case Comparison::Greater:   sat[s] = x[s] >  n.threshold; break;
                    case Comparison::GreaterEq: sat[s] = x[s] >= n.threshold; break;
                }
            }
            return sat;
        }

        default:
            throw FormulaTypeError("not a state formula: " + factory().to_string(id));
    }
}

// ============================================================================
// Path formulas
// ============================================================================

ValueIterationChecker::Values ValueIterationChecker::path_probabilities(FormulaId path,
                                                                        bool maximise) {
    const auto count = static_cast<std::size_t>(matrix().state_count());
    const FormulaNode n = factory().node(path);
    const StateSet all(count, 1);

    switch (n.kind) {
        case NodeKind::Next:
            return next(satisfying_states(n.children[0]), maximise);
        case NodeKind::Finally:
            return until(all, satisfying_states(n.children[0]), maximise, -1);
        case NodeKind::BoundedFinally:
            return until(all, satisfying_states(n.children[0]), maximise, n.step_bound);
        case NodeKind::Until:
            return until(satisfying_states(n.children[0]), satisfying_states(n.children[1]),
                         maximise, -1);
        case NodeKind::BoundedUntil:
            return until(satisfying_states(n.children[0]), satisfying_states(n.children[1]),
                         maximise, n.step_bound);

        case NodeKind::Globally:
        case NodeKind::BoundedGlobally: {
            StateSet bad = satisfying_states(n.children[0]);
            for (auto& v : bad) v = !v;
            const std::int64_t bound = n.kind == NodeKind::Globally ? -1 : n.step_bound;
            Values x = until(all, bad, !maximise, bound);
            for (auto& v : x) v = 1.0 - v;
            return x;
        }

        default: {
            // A state formula holds on a path iff it holds in its first state.
            const StateSet sat = satisfying_states(path);
            Values x(count);
            for (std::size_t s = 0; s < count; ++s) x[s] = sat[s] ? 1.0 : 0.0;
            return x;
        }
    }
}

ValueIterationChecker::Values ValueIterationChecker::next(const StateSet& phi, bool maximise) {
    const std::int32_t count = matrix().state_count();
    Values indicator(static_cast<std::size_t>(count));
    for (std::size_t s = 0; s < indicator.size(); ++s) indicator[s] = phi[s] ? 1.0 : 0.0;

    Values x(static_cast<std::size_t>(count));
    for (std::int32_t s = 0; s < count; ++s) {
        x[static_cast<std::size_t>(s)] = bellman(s, indicator, maximise);
    }
    return x;
}

ValueIterationChecker::Values ValueIterationChecker::until(const StateSet& lhs,
                                                           const StateSet& rhs,
                                                           bool maximise,
                                                           std::int64_t bound) {
    const std::int32_t count = matrix().state_count();
    Values x(static_cast<std::size_t>(count));
    for (std::size_t s = 0; s < x.size(); ++s) x[s] = rhs[s] ? 1.0 : 0.0;
    Values y(x);

    const bool bounded = bound >= 0;
    std::int64_t iterations = 0;
    while (bounded ? iterations < bound : true) {
        if (!bounded && iterations >= max_iterations_) {
            throw std::runtime_error("value iteration did not converge within " +
                                     std::to_string(max_iterations_) + " iterations");
        }
        ++iterations;

        double delta = 0.0;
#ifdef PMC_USE_OPENMP
        #pragma omp parallel for schedule(static) reduction(max : delta) if(count > kParallelSweepThreshold)
#endif
        for (std::int32_t s = 0; s < count; ++s) {
            const auto i = static_cast<std::size_t>(s);
            if (rhs[i]) {
                y[i] = 1.0;
            } else if (!lhs[i]) {
                y[i] = 0.0;
            } else {
                y[i] = bellman(s, x, maximise);
            }
            delta = std::max(delta, std::fabs(y[i] - x[i]));
        }
        x.swap(y);
        if (!bounded && delta < epsilon_) break;
    }

    if (!bounded) last_iterations_.store(iterations, std::memory_order_relaxed);
    return x;
}

double ValueIterationChecker::bellman(std::int32_t s, const Values& x, bool maximise) const {
    const CompactMdp& m = matrix();
    double best = 0.0;
    bool first = true;
    for (auto d = m.distribution_begin(s); d < m.distribution_end(s); ++d) {
        double sum = 0.0;
        for (auto k = m.entry_begin(d); k < m.entry_end(d); ++k) {
            sum += m.value(k) * x[static_cast<std::size_t>(m.column(k))];
        }
        if (first || (maximise ? sum > best : sum < best)) {
            best = sum;
            first = false;
        }
    }
    return best;
}

double ValueIterationChecker::initial_value(const Values& x, bool maximise) const {
    return bellman(matrix().initial_state(), x, maximise);
}

// ============================================================================
// Rewards
// ============================================================================

double ValueIterationChecker::cumulative_reward(int reward_index, std::int64_t bound,
                                                bool maximise) const {
    const CompactMdp& m = matrix();
    const std::int32_t count = m.state_count();
    Values x(static_cast<std::size_t>(count), 0.0);
    Values y(x);

    for (std::int64_t i = 0; i < bound; ++i) {
#ifdef PMC_USE_OPENMP
        #pragma omp parallel for schedule(static) if(count > kParallelSweepThreshold)
#endif
        for (std::int32_t s = 0; s < count; ++s) {
            y[static_cast<std::size_t>(s)] = m.reward(s, reward_index) + bellman(s, x, maximise);
        }
        x.swap(y);
    }
    return initial_value(x, maximise);
}

}  // namespace pmc
