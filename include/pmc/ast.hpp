// ============================================================================
// pmc/ast.hpp - Abstract Syntax Tree for probabilistic formulas
// ============================================================================
//
// Design notes:
//
//   Every formula is represented as a node in an interned DAG.  Two
//   formulas that are structurally identical share the same FormulaId.
//   This allows O(1) equality checks and provides a canonical
//   representation.
//
//   Node types:
//     - Atom            : atomic proposition evaluated by the model
//     - True/False      : boolean constants
//     - Not             : negation, child[0]
//     - And / Or        : child[0] op child[1]
//     - Implies / Iff   : child[0] op child[1]   (removed by normalize)
//     - Next            : X child[0]
//     - Finally         : F child[0]
//     - Globally        : G child[0]
//     - Until           : child[0] U child[1]
//     - BoundedFinally  : F<=k child[0]
//     - BoundedGlobally : G<=k child[0]
//     - BoundedUntil    : child[0] U<=k child[1]
//     - ProbabilityQuery: P=? / Pmin=? / Pmax=? [child[0]]
//     - ProbabilityBound: P~t [child[0]], ~ in {<, <=, >, >=}
//     - RewardQuery     : R{name}=? / Rmin / Rmax [C<=k]
//
//   FormulaFactory owns all nodes and provides the interning mechanism
//   via structural hashing.  Clients receive FormulaId handles.
//
// ============================================================================

#ifndef PMC_AST_HPP
#define PMC_AST_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pmc {

// ── FormulaId ───────────────────────────────────────────────────────────────
// A lightweight handle into the formula interning table.  The special value
// kInvalidId signals "no formula".

using FormulaId = std::uint32_t;
inline constexpr FormulaId kInvalidId = static_cast<FormulaId>(-1);

// ── NodeKind ────────────────────────────────────────────────────────────────

enum class NodeKind : std::uint8_t {
    // Constants
    True,
    False,

    // Atoms
    Atom,

    // Boolean connectives
    Not,
    And,
    Or,
    Implies,   // only before normalisation
    Iff,       // only before normalisation

    // Path operators
    Next,
    Finally,
    Globally,
    Until,
    BoundedFinally,
    BoundedGlobally,
    BoundedUntil,

    // Queries
    ProbabilityQuery,
    ProbabilityBound,
    RewardQuery
};

/// Human-readable string for a NodeKind.
const char* node_kind_name(NodeKind k) noexcept;

// ── Optimum / Comparison ────────────────────────────────────────────────────

enum class Optimum : std::uint8_t {
    Default,   // P=? / R=?
    Minimum,   // Pmin / Rmin
    Maximum    // Pmax / Rmax
};

enum class Comparison : std::uint8_t {
    Less,
    LessEq,
    Greater,
    GreaterEq
};

const char* comparison_symbol(Comparison c) noexcept;

// ── FormulaNode ─────────────────────────────────────────────────────────────
// Immutable stored node.  All data is value-semantics; the FormulaFactory is
// the sole owner.

struct FormulaNode {
    NodeKind     kind{};
    std::string  atom_name;                    // Atom, or reward name of a RewardQuery
    std::int64_t step_bound{0};                // bounded operators, C<=k
    Optimum      optimum{Optimum::Default};    // queries
    Comparison   comparison{Comparison::GreaterEq};
    double       threshold{0.0};               // ProbabilityBound
    FormulaId    children[2]{kInvalidId, kInvalidId};

    // Structural-equality (used by the interning table).
    bool operator==(const FormulaNode& o) const noexcept;
};

struct FormulaNodeHash {
    std::size_t operator()(const FormulaNode& n) const noexcept;
};

// ── FormulaFactory ──────────────────────────────────────────────────────────
// Not thread safe.  Owns the node storage and the interning map.  Every
// make_*() method returns the canonical FormulaId for that structure.

class FormulaFactory {
public:
    FormulaFactory();

    // ── State formulas ──────────────────────────────────────────────────
    FormulaId make_true();
    FormulaId make_false();
    FormulaId make_atom(const std::string& name);
    FormulaId make_not(FormulaId child);
    FormulaId make_and(FormulaId lhs, FormulaId rhs);
    FormulaId make_or(FormulaId lhs, FormulaId rhs);
    FormulaId make_implies(FormulaId lhs, FormulaId rhs);
    FormulaId make_iff(FormulaId lhs, FormulaId rhs);

    // ── Path formulas ───────────────────────────────────────────────────
    FormulaId make_next(FormulaId child);
    FormulaId make_finally(FormulaId child);
    FormulaId make_globally(FormulaId child);
    FormulaId make_until(FormulaId lhs, FormulaId rhs);
    FormulaId make_bounded_finally(FormulaId child, std::int64_t bound);
    FormulaId make_bounded_globally(FormulaId child, std::int64_t bound);
    FormulaId make_bounded_until(FormulaId lhs, FormulaId rhs, std::int64_t bound);

    // ── Queries ─────────────────────────────────────────────────────────
    FormulaId make_probability_query(FormulaId path, Optimum optimum);
    FormulaId make_probability_bound(FormulaId path, Comparison comparison, double threshold);
    FormulaId make_reward_query(const std::string& reward, Optimum optimum, std::int64_t bound);

    // ── Accessors ───────────────────────────────────────────────────────
    const FormulaNode& node(FormulaId id) const;
    std::size_t        size() const noexcept;

    // ── Pretty-print ────────────────────────────────────────────────────
    // Returns a fully parenthesised string representation of a formula.
    std::string to_string(FormulaId id) const;

private:
    // Intern a node: return existing id when structurally equal, otherwise
    // allocate a new slot.
    FormulaId intern(FormulaNode node);

    FormulaId make_unary(NodeKind kind, FormulaId child, std::int64_t bound = 0);
    FormulaId make_binary(NodeKind kind, FormulaId lhs, FormulaId rhs, std::int64_t bound = 0);

    std::vector<FormulaNode>                                    nodes_;
    std::unordered_map<FormulaNode, FormulaId, FormulaNodeHash> intern_;
};

}  // namespace pmc

#endif  // PMC_AST_HPP
