// ============================================================================
// continuation_graph.cpp - Step-graph construction
// ============================================================================

#include "pmc/continuation_graph.hpp"
#include "pmc/errors.hpp"

#include <cmath>
#include <functional>
#include <sstream>
#include <stdexcept>

namespace pmc {

const char* choice_kind_name(ChoiceKind k) noexcept {
    switch (k) {
        case ChoiceKind::Leaf:             return "Leaf";
        case ChoiceKind::Forward:          return "Forward";
        case ChoiceKind::Probabilistic:    return "Probabilistic";
        case ChoiceKind::Nondeterministic: return "Nondeterministic";
    }
    return "Unknown";
}

std::size_t TransitionTargetHash::operator()(const TransitionTarget& t) const noexcept {
    std::size_t h = std::hash<unsigned long long>{}(t.labeling.to_ullong());
    h ^= std::hash<std::int64_t>{}(t.target_state) + 0x9e3779b9 + (h << 6) + (h >> 2);
    return h;
}

// ── LtmdpStepGraph ──────────────────────────────────────────────────────────

LtmdpStepGraph::LtmdpStepGraph() {
    clear();
}

void LtmdpStepGraph::clear() {
    elements_.clear();
    elements_.push_back(ContinuationGraphElement{});
}

ContinuationGraphElement& LtmdpStepGraph::placeholder(Cid cid, const char* operation) {
    if (cid < 0 || cid >= static_cast<Cid>(elements_.size())) {
        throw std::out_of_range(std::string(operation) + ": cid " +
                                std::to_string(cid) + " out of range");
    }
    auto& e = elements_[cid];
    if (!e.is_placeholder()) {
        // The path reached a node that an earlier replay already resolved
        // differently.
        throw NondeterminismError(std::string(operation) + ": cid " +
                                  std::to_string(cid) + " is already a " +
                                  choice_kind_name(e.kind) + " node");
    }
    return e;
}

Cid LtmdpStepGraph::split(Cid parent, ChoiceKind kind, int count,
                          const double* probabilities) {
    if (kind != ChoiceKind::Probabilistic && kind != ChoiceKind::Nondeterministic) {
        throw std::invalid_argument("split: only probabilistic and nondeterministic "
                                    "nodes have children");
    }
    if (count < 1) {
        throw std::invalid_argument("split: empty sibling set");
    }
    if (kind == ChoiceKind::Probabilistic) {
        double sum = 0.0;
        for (int i = 0; i < count; ++i) {
            if (probabilities[i] < 0.0 || probabilities[i] > 1.0) {
                throw std::invalid_argument("split: probability " +
                                            std::to_string(probabilities[i]) +
                                            " outside [0, 1]");
            }
            sum += probabilities[i];
        }
        if (std::fabs(sum - 1.0) > kProbabilityTolerance) {
            throw std::invalid_argument("split: probabilities sum to " +
                                        std::to_string(sum) + ", not 1");
        }
    }

    placeholder(parent, "split");

    const Cid from = static_cast<Cid>(elements_.size());
    const Cid to   = from + count - 1;
    for (int i = 0; i < count; ++i) {
        ContinuationGraphElement child;
        child.probability = kind == ChoiceKind::Probabilistic ? probabilities[i] : 1.0;
        elements_.push_back(child);
    }

    // elements_ may have reallocated; index again.
    auto& p = elements_[parent];
    p.kind = kind;
    p.from = from;
    p.to   = to;
    return from;
}

void LtmdpStepGraph::forward(Cid cid, Cid target) {
    if (target < 0 || target >= static_cast<Cid>(elements_.size()) || target == cid) {
        throw std::out_of_range("forward: invalid target cid " + std::to_string(target));
    }
    auto& e = placeholder(cid, "forward");
    e.kind = ChoiceKind::Forward;
    e.from = target;
    e.to   = target;
}

void LtmdpStepGraph::set_target(Cid cid, std::int64_t target) {
    if (target < 0) {
        throw std::invalid_argument("set_target: negative target index");
    }
    auto& e = placeholder(cid, "set_target");
    e.to = target;
}

const ContinuationGraphElement& LtmdpStepGraph::element(Cid cid) const {
    return elements_.at(static_cast<std::size_t>(cid));
}

std::size_t LtmdpStepGraph::leaf_count() const noexcept {
    std::size_t n = 0;
    for (const auto& e : elements_) {
        if (e.is_leaf() && !e.is_placeholder()) ++n;
    }
    return n;
}

std::string LtmdpStepGraph::to_string() const {
    std::ostringstream oss;
    for (std::size_t i = 0; i < elements_.size(); ++i) {
        const auto& e = elements_[i];
        oss << i << ": " << choice_kind_name(e.kind);
        if (e.is_leaf()) {
            oss << " target=" << e.to;
        } else {
            oss << " [" << e.from << ", " << e.to << "]";
        }
        oss << " p=" << e.probability << "\n";
    }
    return oss.str();
}

}  // namespace pmc
