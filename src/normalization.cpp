// ============================================================================
// normalization.cpp - Implication elimination and negation cleanup
// ============================================================================
//
// Each phase is a recursive, bottom-up transformation over the interned
// formula DAG.
//
// IMPORTANT: child ids are copied *before* the recursive calls, because a
// call may grow the factory and invalidate references to FormulaNode.
//
// ============================================================================

#include "pmc/normalization.hpp"

#include <functional>

namespace pmc {

// ── rebuild ─────────────────────────────────────────────────────────────────
// Recreate node `id` of any kind with transformed children.  Leaves and
// reward queries have no formula children and are returned unchanged.

static FormulaId rebuild(FormulaId id, FormulaFactory& f,
                         const std::function<FormulaId(FormulaId)>& recurse) {
    const FormulaNode n = f.node(id);

    switch (n.kind) {
        case NodeKind::True:
        case NodeKind::False:
        case NodeKind::Atom:
        case NodeKind::RewardQuery:
            return id;

        case NodeKind::Not:
            return f.make_not(recurse(n.children[0]));
        case NodeKind::Next:
            return f.make_next(recurse(n.children[0]));
        case NodeKind::Finally:
            return f.make_finally(recurse(n.children[0]));
        case NodeKind::Globally:
            return f.make_globally(recurse(n.children[0]));
        case NodeKind::BoundedFinally:
            return f.make_bounded_finally(recurse(n.children[0]), n.step_bound);
        case NodeKind::BoundedGlobally:
            return f.make_bounded_globally(recurse(n.children[0]), n.step_bound);
        case NodeKind::ProbabilityQuery:
            return f.make_probability_query(recurse(n.children[0]), n.optimum);
        case NodeKind::ProbabilityBound:
            return f.make_probability_bound(recurse(n.children[0]), n.comparison, n.threshold);

        case NodeKind::And: {
            auto c0 = recurse(n.children[0]);
            auto c1 = recurse(n.children[1]);
            return f.make_and(c0, c1);
        }
        case NodeKind::Or: {
            auto c0 = recurse(n.children[0]);
            auto c1 = recurse(n.children[1]);
            return f.make_or(c0, c1);
        }
        case NodeKind::Implies: {
            auto c0 = recurse(n.children[0]);
            auto c1 = recurse(n.children[1]);
            return f.make_implies(c0, c1);
        }
        case NodeKind::Iff: {
            auto c0 = recurse(n.children[0]);
            auto c1 = recurse(n.children[1]);
            return f.make_iff(c0, c1);
        }
        case NodeKind::Until: {
            auto c0 = recurse(n.children[0]);
            auto c1 = recurse(n.children[1]);
            return f.make_until(c0, c1);
        }
        case NodeKind::BoundedUntil: {
            auto c0 = recurse(n.children[0]);
            auto c1 = recurse(n.children[1]);
            return f.make_bounded_until(c0, c1, n.step_bound);
        }
    }
    return id;
}

// ============================================================================
// Phase 1: Implication elimination
// ============================================================================

FormulaId eliminate_implications(FormulaId id, FormulaFactory& f) {
    auto recurse = [&f](FormulaId c) { return eliminate_implications(c, f); };

    NodeKind kind = f.node(id).kind;
    FormulaId child0 = f.node(id).children[0];
    FormulaId child1 = f.node(id).children[1];

    switch (kind) {
        case NodeKind::Implies: {
            auto a = recurse(child0);
            auto b = recurse(child1);
            return f.make_or(f.make_not(a), b);
        }
        case NodeKind::Iff: {
            auto a = recurse(child0);
            auto b = recurse(child1);
            auto ab = f.make_or(f.make_not(a), b);
            auto ba = f.make_or(a, f.make_not(b));
            return f.make_and(ab, ba);
        }
        default:
            return rebuild(id, f, recurse);
    }
}

// ============================================================================
// Phase 2: Negation simplification
// ============================================================================

FormulaId simplify_negations(FormulaId id, FormulaFactory& f) {
    auto recurse = [&f](FormulaId c) { return simplify_negations(c, f); };

    if (f.node(id).kind != NodeKind::Not) return rebuild(id, f, recurse);

    FormulaId inner = recurse(f.node(id).children[0]);
    switch (f.node(inner).kind) {
        case NodeKind::True:  return f.make_false();
        case NodeKind::False: return f.make_true();
        case NodeKind::Not:   return f.node(inner).children[0];
        default:              return f.make_not(inner);
    }
}

// ── Full pipeline ───────────────────────────────────────────────────────────

FormulaId normalize(FormulaId id, FormulaFactory& f) {
    FormulaId result = eliminate_implications(id, f);
    result = simplify_negations(result, f);
    return result;
}

}  // namespace pmc
