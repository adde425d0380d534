// ============================================================================
// pmc/normalization.hpp - Implication elimination and negation cleanup
// ============================================================================
//
// The checker evaluates only !, &, | over state formulas.  normalize()
// rewrites a parsed formula into that fragment:
//
//   1. Eliminate ->/<->
//        φ -> ψ     ==   !φ | ψ
//        φ <-> ψ    ==   (!φ | ψ) & (φ | !ψ)
//
//   2. Simplify negation
//        !!φ        ==   φ
//        !true      ==   false
//        !false     ==   true
//
// Both phases are pure functions: they take a FormulaId and a FormulaFactory
// and return a new (interned) FormulaId.  Path formulas below probability
// operators are rewritten as well; the operators themselves are kept.
//
// ============================================================================

#ifndef PMC_NORMALIZATION_HPP
#define PMC_NORMALIZATION_HPP

#include "pmc/ast.hpp"

namespace pmc {

FormulaId eliminate_implications(FormulaId id, FormulaFactory& f);

FormulaId simplify_negations(FormulaId id, FormulaFactory& f);

// ── Full pipeline ───────────────────────────────────────────────────────────
// Chains: eliminate_implications -> simplify_negations.

FormulaId normalize(FormulaId id, FormulaFactory& f);

}  // namespace pmc

#endif  // PMC_NORMALIZATION_HPP
