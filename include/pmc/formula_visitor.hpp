// ============================================================================
// pmc/formula_visitor.hpp - Formula traversal and semantic classification
// ============================================================================
//
// FormulaVisitor dispatches on the node kind to one virtual method per
// category.  The default implementations visit the children, so a derived
// visitor only overrides the categories it cares about.
//
// The semantic kind of a formula decides which query it can be used with:
//
//   Boolean      state formula (atoms, connectives, P~t[...])
//   Probability  P=? / Pmin=? / Pmax=? [...], or a bare path formula
//   Reward       R=? / Rmin=? / Rmax=? {name} [C<=k]
//   Invalid      anything else, e.g. a query below a connective
//
// Path operators take state formulas as operands.
//
// ============================================================================

#ifndef PMC_FORMULA_VISITOR_HPP
#define PMC_FORMULA_VISITOR_HPP

#include "pmc/ast.hpp"

#include <string>
#include <vector>

namespace pmc {

// ── FormulaVisitor ──────────────────────────────────────────────────────────

class FormulaVisitor {
public:
    explicit FormulaVisitor(const FormulaFactory& factory) : factory_(factory) {}
    virtual ~FormulaVisitor() = default;

    void visit(FormulaId id);

protected:
    virtual void visit_constant(FormulaId id, const FormulaNode& n);
    virtual void visit_atom(FormulaId id, const FormulaNode& n);
    virtual void visit_connective(FormulaId id, const FormulaNode& n);    // ! & | -> <->
    virtual void visit_path(FormulaId id, const FormulaNode& n);          // X F G U and bounded
    virtual void visit_probability(FormulaId id, const FormulaNode& n);   // P=? and P~t
    virtual void visit_reward(FormulaId id, const FormulaNode& n);

    void visit_children(const FormulaNode& n);

    const FormulaFactory& factory_;
};

// ── Semantic kind ───────────────────────────────────────────────────────────

enum class FormulaType {
    Boolean,
    Probability,
    Reward,
    Invalid
};

const char* formula_type_name(FormulaType t) noexcept;

FormulaType classify_formula(FormulaId id, const FormulaFactory& factory);

bool is_path_formula(FormulaId id, const FormulaFactory& factory);

/// Sorted, unique atom names used anywhere in the formula.
std::vector<std::string> collect_atoms(FormulaId id, const FormulaFactory& factory);

/// Sorted, unique reward names used anywhere in the formula.
std::vector<std::string> collect_reward_names(FormulaId id, const FormulaFactory& factory);

}  // namespace pmc

#endif  // PMC_FORMULA_VISITOR_HPP
