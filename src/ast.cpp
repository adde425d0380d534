// ============================================================================
// ast.cpp - Formula interning and pretty-printing
// ============================================================================

#include "pmc/ast.hpp"

#include <sstream>
#include <stdexcept>

namespace pmc {

// ── node_kind_name ──────────────────────────────────────────────────────────

const char* node_kind_name(NodeKind k) noexcept {
    switch (k) {
        case NodeKind::True:             return "true";
        case NodeKind::False:            return "false";
        case NodeKind::Atom:             return "Atom";
        case NodeKind::Not:              return "!";
        case NodeKind::And:              return "&";
        case NodeKind::Or:               return "|";
        case NodeKind::Implies:          return "->";
        case NodeKind::Iff:              return "<->";
        case NodeKind::Next:             return "X";
        case NodeKind::Finally:          return "F";
        case NodeKind::Globally:         return "G";
        case NodeKind::Until:            return "U";
        case NodeKind::BoundedFinally:   return "F<=";
        case NodeKind::BoundedGlobally:  return "G<=";
        case NodeKind::BoundedUntil:     return "U<=";
        case NodeKind::ProbabilityQuery: return "P=?";
        case NodeKind::ProbabilityBound: return "P~";
        case NodeKind::RewardQuery:      return "R=?";
    }
    return "?";
}

const char* comparison_symbol(Comparison c) noexcept {
    switch (c) {
        case Comparison::Less:      return "<";
        case Comparison::LessEq:    return "<=";
        case Comparison::Greater:   return ">";
        case Comparison::GreaterEq: return ">=";
    }
    return "?";
}

// ── FormulaNode equality ────────────────────────────────────────────────────

bool FormulaNode::operator==(const FormulaNode& o) const noexcept {
    return kind == o.kind &&
           atom_name == o.atom_name &&
           step_bound == o.step_bound &&
           optimum == o.optimum &&
           comparison == o.comparison &&
           threshold == o.threshold &&
           children[0] == o.children[0] &&
           children[1] == o.children[1];
}

// ── FormulaNodeHash ─────────────────────────────────────────────────────────
// Combine all fields via FNV-like mixing.

std::size_t FormulaNodeHash::operator()(const FormulaNode& n) const noexcept {
    std::size_t h = static_cast<std::size_t>(n.kind);
    h ^= std::hash<std::string>{}(n.atom_name) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<std::int64_t>{}(n.step_bound) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= static_cast<std::size_t>(n.optimum) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= static_cast<std::size_t>(n.comparison) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<double>{}(n.threshold) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<FormulaId>{}(n.children[0]) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<FormulaId>{}(n.children[1]) + 0x9e3779b9 + (h << 6) + (h >> 2);
    return h;
}

// ── FormulaFactory ──────────────────────────────────────────────────────────

FormulaFactory::FormulaFactory() {
    // Slots 0 and 1 always hold true/false.
    make_true();
    make_false();
}

FormulaId FormulaFactory::intern(FormulaNode node) {
    auto it = intern_.find(node);
    if (it != intern_.end()) {
        return it->second;
    }
    FormulaId id = static_cast<FormulaId>(nodes_.size());
    nodes_.push_back(std::move(node));
    intern_[nodes_.back()] = id;
    return id;
}

FormulaId FormulaFactory::make_unary(NodeKind kind, FormulaId child, std::int64_t bound) {
    FormulaNode n;
    n.kind = kind;
    n.children[0] = child;
    n.step_bound = bound;
    return intern(std::move(n));
}

FormulaId FormulaFactory::make_binary(NodeKind kind, FormulaId lhs, FormulaId rhs,
                                      std::int64_t bound) {
    FormulaNode n;
    n.kind = kind;
    n.children[0] = lhs;
    n.children[1] = rhs;
    n.step_bound = bound;
    return intern(std::move(n));
}

// ── make_* helpers ──────────────────────────────────────────────────────────

FormulaId FormulaFactory::make_true() {
    FormulaNode n;
    n.kind = NodeKind::True;
    return intern(std::move(n));
}

FormulaId FormulaFactory::make_false() {
    FormulaNode n;
    n.kind = NodeKind::False;
    return intern(std::move(n));
}

FormulaId FormulaFactory::make_atom(const std::string& name) {
    FormulaNode n;
    n.kind = NodeKind::Atom;
    n.atom_name = name;
    return intern(std::move(n));
}

FormulaId FormulaFactory::make_not(FormulaId child) {
    return make_unary(NodeKind::Not, child);
}

FormulaId FormulaFactory::make_and(FormulaId lhs, FormulaId rhs) {
    return make_binary(NodeKind::And, lhs, rhs);
}

FormulaId FormulaFactory::make_or(FormulaId lhs, FormulaId rhs) {
    return make_binary(NodeKind::Or, lhs, rhs);
}

FormulaId FormulaFactory::make_implies(FormulaId lhs, FormulaId rhs) {
    return make_binary(NodeKind::Implies, lhs, rhs);
}

FormulaId FormulaFactory::make_iff(FormulaId lhs, FormulaId rhs) {
    return make_binary(NodeKind::Iff, lhs, rhs);
}

FormulaId FormulaFactory::make_next(FormulaId child) {
    return make_unary(NodeKind::Next, child);
}

FormulaId FormulaFactory::make_finally(FormulaId child) {
    return make_unary(NodeKind::Finally, child);
}

FormulaId FormulaFactory::make_globally(FormulaId child) {
    return make_unary(NodeKind::Globally, child);
}

FormulaId FormulaFactory::make_until(FormulaId lhs, FormulaId rhs) {
    return make_binary(NodeKind::Until, lhs, rhs);
}

FormulaId FormulaFactory::make_bounded_finally(FormulaId child, std::int64_t bound) {
    if (bound < 0) throw std::invalid_argument("negative step bound");
    return make_unary(NodeKind::BoundedFinally, child, bound);
}

FormulaId FormulaFactory::make_bounded_globally(FormulaId child, std::int64_t bound) {
    if (bound < 0) throw std::invalid_argument("negative step bound");
    return make_unary(NodeKind::BoundedGlobally, child, bound);
}

FormulaId FormulaFactory::make_bounded_until(FormulaId lhs, FormulaId rhs, std::int64_t bound) {
    if (bound < 0) throw std::invalid_argument("negative step bound");
    return make_binary(NodeKind::BoundedUntil, lhs, rhs, bound);
}

FormulaId FormulaFactory::make_probability_query(FormulaId path, Optimum optimum) {
    FormulaNode n;
    n.kind = NodeKind::ProbabilityQuery;
    n.optimum = optimum;
    n.children[0] = path;
    return intern(std::move(n));
}

FormulaId FormulaFactory::make_probability_bound(FormulaId path, Comparison comparison,
                                                 double threshold) {
    if (threshold < 0.0 || threshold > 1.0) {
        throw std::invalid_argument("probability threshold outside [0, 1]");
    }
    FormulaNode n;
    n.kind = NodeKind::ProbabilityBound;
    n.comparison = comparison;
    n.threshold = threshold;
    n.children[0] = path;
    return intern(std::move(n));
}

FormulaId FormulaFactory::make_reward_query(const std::string& reward, Optimum optimum,
                                            std::int64_t bound) {
    if (bound < 0) throw std::invalid_argument("negative step bound");
    FormulaNode n;
    n.kind = NodeKind::RewardQuery;
    n.atom_name = reward;
    n.optimum = optimum;
    n.step_bound = bound;
    return intern(std::move(n));
}

// ── Accessors ───────────────────────────────────────────────────────────────

const FormulaNode& FormulaFactory::node(FormulaId id) const {
    if (id >= nodes_.size()) {
        throw std::out_of_range("FormulaFactory::node: invalid id " + std::to_string(id));
    }
    return nodes_[id];
}

std::size_t FormulaFactory::size() const noexcept {
    return nodes_.size();
}

// ── Pretty-printing ─────────────────────────────────────────────────────────
// Produces a fully parenthesised string for unambiguity.

static const char* optimum_suffix(Optimum o) {
    switch (o) {
        case Optimum::Default: return "";
        case Optimum::Minimum: return "min";
        case Optimum::Maximum: return "max";
    }
    return "";
}

std::string FormulaFactory::to_string(FormulaId id) const {
    const FormulaNode& n = node(id);
    const std::string bound = std::to_string(n.step_bound);

    switch (n.kind) {
        case NodeKind::True:
            return "true";
        case NodeKind::False:
            return "false";
        case NodeKind::Atom:
            return n.atom_name;
        case NodeKind::Not:
            return "(!" + to_string(n.children[0]) + ")";
        case NodeKind::And:
            return "(" + to_string(n.children[0]) + " & " + to_string(n.children[1]) + ")";
        case NodeKind::Or:
            return "(" + to_string(n.children[0]) + " | " + to_string(n.children[1]) + ")";
        case NodeKind::Implies:
            return "(" + to_string(n.children[0]) + " -> " + to_string(n.children[1]) + ")";
        case NodeKind::Iff:
            return "(" + to_string(n.children[0]) + " <-> " + to_string(n.children[1]) + ")";
        case NodeKind::Next:
            return "X " + to_string(n.children[0]);
        case NodeKind::Finally:
            return "F " + to_string(n.children[0]);
        case NodeKind::Globally:
            return "G " + to_string(n.children[0]);
        case NodeKind::Until:
            return "(" + to_string(n.children[0]) + " U " + to_string(n.children[1]) + ")";
        case NodeKind::BoundedFinally:
            return "F<=" + bound + " " + to_string(n.children[0]);
        case NodeKind::BoundedGlobally:
            return "G<=" + bound + " " + to_string(n.children[0]);
        case NodeKind::BoundedUntil:
            return "(" + to_string(n.children[0]) + " U<=" + bound + " " +
                   to_string(n.children[1]) + ")";
        case NodeKind::ProbabilityQuery:
            return std::string("P") + optimum_suffix(n.optimum) + "=? [" +
                   to_string(n.children[0]) + "]";
        case NodeKind::ProbabilityBound: {
            std::ostringstream oss;
            oss << "P" << comparison_symbol(n.comparison) << n.threshold
                << " [" << to_string(n.children[0]) << "]";
            return oss.str();
        }
        case NodeKind::RewardQuery:
            return std::string("R") + optimum_suffix(n.optimum) + "{" + n.atom_name +
                   "}=? [C<=" + bound + "]";
    }
    return "<?>";
}

}  // namespace pmc
