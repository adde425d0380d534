// ============================================================================
// formula_visitor.cpp - Visitor dispatch, classification and collectors
// ============================================================================

#include "pmc/formula_visitor.hpp"

#include <set>

namespace pmc {

// ── FormulaVisitor ──────────────────────────────────────────────────────────

void FormulaVisitor::visit(FormulaId id) {
    const FormulaNode& n = factory_.node(id);
    switch (n.kind) {
        case NodeKind::True:
        case NodeKind::False:
            visit_constant(id, n);
            break;
        case NodeKind::Atom:
            visit_atom(id, n);
            break;
        case NodeKind::Not:
        case NodeKind::And:
        case NodeKind::Or:
        case NodeKind::Implies:
        case NodeKind::Iff:
            visit_connective(id, n);
            break;
        case NodeKind::Next:
        case NodeKind::Finally:
        case NodeKind::Globally:
        case NodeKind::Until:
        case NodeKind::BoundedFinally:
        case NodeKind::BoundedGlobally:
        case NodeKind::BoundedUntil:
            visit_path(id, n);
            break;
        case NodeKind::ProbabilityQuery:
        case NodeKind::ProbabilityBound:
            visit_probability(id, n);
            break;
        case NodeKind::RewardQuery:
            visit_reward(id, n);
            break;
    }
}

void FormulaVisitor::visit_children(const FormulaNode& n) {
    // Copy: visiting may not grow the factory, but keep ids independent of n.
    const FormulaId c0 = n.children[0];
    const FormulaId c1 = n.children[1];
    if (c0 != kInvalidId) visit(c0);
    if (c1 != kInvalidId) visit(c1);
}

void FormulaVisitor::visit_constant(FormulaId, const FormulaNode&) {}
void FormulaVisitor::visit_atom(FormulaId, const FormulaNode&) {}
void FormulaVisitor::visit_connective(FormulaId, const FormulaNode& n) { visit_children(n); }
void FormulaVisitor::visit_path(FormulaId, const FormulaNode& n) { visit_children(n); }
void FormulaVisitor::visit_probability(FormulaId, const FormulaNode& n) { visit_children(n); }
void FormulaVisitor::visit_reward(FormulaId, const FormulaNode&) {}

// ============================================================================
// Classification
// ============================================================================

const char* formula_type_name(FormulaType t) noexcept {
    switch (t) {
        case FormulaType::Boolean:     return "boolean";
        case FormulaType::Probability: return "probability";
        case FormulaType::Reward:      return "reward";
        case FormulaType::Invalid:     return "invalid";
    }
    return "?";
}

namespace {

enum class Category { State, Path, ProbabilityQuery, RewardQuery, Invalid };

class ClassifyVisitor : public FormulaVisitor {
public:
    using FormulaVisitor::FormulaVisitor;

    Category classify(FormulaId id) {
        visit(id);
        return result_;
    }

protected:
    void visit_constant(FormulaId, const FormulaNode&) override { result_ = Category::State; }
    void visit_atom(FormulaId, const FormulaNode&) override { result_ = Category::State; }

    void visit_connective(FormulaId, const FormulaNode& n) override {
        result_ = operands_are_states(n) ? Category::State : Category::Invalid;
    }

    void visit_path(FormulaId, const FormulaNode& n) override {
        result_ = operands_are_states(n) ? Category::Path : Category::Invalid;
    }

    void visit_probability(FormulaId, const FormulaNode& n) override {
        Category inner = classify(n.children[0]);
        if (inner != Category::Path && inner != Category::State) {
            result_ = Category::Invalid;
        } else {
            result_ = n.kind == NodeKind::ProbabilityBound ? Category::State
                                                            : Category::ProbabilityQuery;
        }
    }

    void visit_reward(FormulaId, const FormulaNode&) override { result_ = Category::RewardQuery; }

private:
    bool operands_are_states(const FormulaNode& n) {
        const FormulaId c0 = n.children[0];
        const FormulaId c1 = n.children[1];
        if (c0 != kInvalidId && classify(c0) != Category::State) return false;
        if (c1 != kInvalidId && classify(c1) != Category::State) return false;
        return true;
    }

    Category result_ = Category::Invalid;
};

// ── Collectors ──────────────────────────────────────────────────────────────

class AtomCollector : public FormulaVisitor {
public:
    using FormulaVisitor::FormulaVisitor;
    std::set<std::string> names;

protected:
    void visit_atom(FormulaId, const FormulaNode& n) override { names.insert(n.atom_name); }
};

class RewardCollector : public FormulaVisitor {
public:
    using FormulaVisitor::FormulaVisitor;
    std::set<std::string> names;

protected:
    void visit_reward(FormulaId, const FormulaNode& n) override { names.insert(n.atom_name); }
};

}  // namespace

FormulaType classify_formula(FormulaId id, const FormulaFactory& factory) {
    ClassifyVisitor v(factory);
    switch (v.classify(id)) {
        case Category::State:            return FormulaType::Boolean;
        case Category::Path:             return FormulaType::Probability;
        case Category::ProbabilityQuery: return FormulaType::Probability;
        case Category::RewardQuery:      return FormulaType::Reward;
        case Category::Invalid:          return FormulaType::Invalid;
    }
    return FormulaType::Invalid;
}

bool is_path_formula(FormulaId id, const FormulaFactory& factory) {
    ClassifyVisitor v(factory);
    return v.classify(id) == Category::Path;
}

std::vector<std::string> collect_atoms(FormulaId id, const FormulaFactory& factory) {
    AtomCollector v(factory);
    v.visit(id);
    return {v.names.begin(), v.names.end()};
}

std::vector<std::string> collect_reward_names(FormulaId id, const FormulaFactory& factory) {
    RewardCollector v(factory);
    v.visit(id);
    return {v.names.begin(), v.names.end()};
}

}  // namespace pmc
