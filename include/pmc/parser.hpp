// ============================================================================
// pmc/parser.hpp - Recursive-descent parser for probabilistic formulas
// ============================================================================
//
// Grammar (informal, with precedence already encoded):
//
//   formula     ::= iff_expr
//   iff_expr    ::= impl_expr  ( '<->' impl_expr )*       (left-assoc)
//   impl_expr   ::= or_expr    ( '->'  impl_expr )?       (right-assoc)
//   or_expr     ::= and_expr   ( '|'   and_expr )*        (left-assoc)
//   and_expr    ::= until_expr ( '&'   until_expr )*      (left-assoc)
//   until_expr  ::= unary ( 'U' bound? unary )?
//   unary       ::= '!' unary
//                  | 'X' unary
//                  | 'F' bound? unary
//                  | 'G' bound? unary
//                  | primary
//   bound       ::= '<=' INT
//   primary     ::= 'true' | 'false' | IDENTIFIER
//                  | '(' formula ')'
//                  | ('P' | 'Pmin' | 'Pmax') '=?' '[' formula ']'
//                  | 'P' cmp NUMBER '[' formula ']'
//                  | ('R' | 'Rmin' | 'Rmax') '{' IDENTIFIER '}' '=?'
//                    '[' 'C' '<=' INT ']'
//   cmp         ::= '<' | '<=' | '>' | '>='
//
// Precedence (highest -> lowest):
//   1. !, X, F, G                   (unary prefix)
//   2. U                            (non-assoc)
//   3. &                            (left-assoc)
//   4. |                            (left-assoc)
//   5. ->                           (right-assoc)
//   6. <->                          (left-assoc)
//
// ============================================================================

#ifndef PMC_PARSER_HPP
#define PMC_PARSER_HPP

#include "pmc/ast.hpp"
#include "pmc/lexer.hpp"

#include <cstdint>
#include <string>

namespace pmc {

// ── Parser ──────────────────────────────────────────────────────────────────
// Takes a Lexer and a FormulaFactory reference.  Parses exactly one formula
// and returns its FormulaId.  Throws std::runtime_error on syntax errors
// with the format: <line>: ERROR: <msg> at column <n>

class Parser {
public:
    Parser(Lexer& lexer, FormulaFactory& factory);

    /// Parse a complete formula (expects Eof after).
    FormulaId parse();

    /// Parse a formula without requiring Eof.
    FormulaId parse_formula();

private:
    // ── Recursive-descent methods, one per precedence level ─────────────
    FormulaId parse_iff();
    FormulaId parse_implies();
    FormulaId parse_or();
    FormulaId parse_and();
    FormulaId parse_until();
    FormulaId parse_unary();
    FormulaId parse_primary();

    // ── Queries ─────────────────────────────────────────────────────────
    FormulaId parse_probability(const Token& op);
    FormulaId parse_reward(const Token& op);
    FormulaId parse_bracketed_formula(const std::string& context);

    // ── Step bounds ─────────────────────────────────────────────────────
    bool has_step_bound();
    std::int64_t parse_step_bound();

    // ── Helpers ─────────────────────────────────────────────────────────
    Token expect(TokenKind kind, const std::string& context);
    std::int64_t parse_integer(const Token& tok);
    double       parse_real(const Token& tok);
    [[noreturn]] void error(const Token& tok, const std::string& msg);

    Lexer&          lex_;
    FormulaFactory& fac_;
};

// ── Convenience free function ───────────────────────────────────────────────
// Parse a single formula from a string.

FormulaId parse_formula(const std::string& input, FormulaFactory& factory,
                        std::uint32_t line = 1);

}  // namespace pmc

#endif  // PMC_PARSER_HPP
