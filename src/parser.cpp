// ============================================================================
// parser.cpp - Recursive-descent formula parser
// ============================================================================
//
// Implementation notes
// --------------------
//
// This parser consumes tokens from a Lexer and builds an AST via
// FormulaFactory.  The recursive-descent structure mirrors the grammar
// directly:
//
//   parse()           calls parse_iff()  and then expects Eof.
//   parse_iff()       handles  <->  (left-associative).
//   parse_implies()   handles  ->   (right-associative via recursion).
//   parse_or()        handles  |    (left-associative).
//   parse_and()       handles  &    (left-associative).
//   parse_until()     handles  U and U<=k between two unary operands.
//   parse_unary()     handles  !, X, F, G and their bounded forms.
//   parse_primary()   handles  atoms, true, false, parens and queries.
//
// All error messages follow the format:
//   <line>: ERROR: <message> at column <n>
//
// ============================================================================

#include "pmc/parser.hpp"

#include <stdexcept>

namespace pmc {

// ── Constructor ─────────────────────────────────────────────────────────────

Parser::Parser(Lexer& lexer, FormulaFactory& factory)
    : lex_(lexer), fac_(factory) {}

// ── Error helpers ───────────────────────────────────────────────────────────

void Parser::error(const Token& tok, const std::string& msg) {
    throw std::runtime_error(
        std::to_string(tok.pos.line) + ": ERROR: " + msg +
        " at column " + std::to_string(tok.pos.column));
}

Token Parser::expect(TokenKind kind, const std::string& context) {
    Token t = lex_.next();
    if (t.kind != kind) {
        error(t, "expected '" + std::string(token_kind_name(kind)) +
                 "' " + context + ", got '" + t.text + "'");
    }
    return t;
}

std::int64_t Parser::parse_integer(const Token& tok) {
    try {
        return std::stoll(tok.text);
    } catch (const std::out_of_range&) {
        error(tok, "integer '" + tok.text + "' out of range");
    }
}

double Parser::parse_real(const Token& tok) {
    try {
        return std::stod(tok.text);
    } catch (const std::out_of_range&) {
        error(tok, "number '" + tok.text + "' out of range");
    }
}

// ── parse ───────────────────────────────────────────────────────────────────

FormulaId Parser::parse() {
    FormulaId f = parse_formula();
    const Token& t = lex_.peek();
    if (t.kind != TokenKind::Eof) {
        error(t, "unexpected token '" + t.text + "' after formula");
    }
    return f;
}

FormulaId Parser::parse_formula() {
    return parse_iff();
}

// ── Binary operators ────────────────────────────────────────────────────────

FormulaId Parser::parse_iff() {
    FormulaId lhs = parse_implies();
    while (lex_.peek().kind == TokenKind::DoubleArrow) {
        lex_.next();  // consume '<->'
        FormulaId rhs = parse_implies();
        lhs = fac_.make_iff(lhs, rhs);
    }
    return lhs;
}

// Right-associative: a -> b -> c  =  a -> (b -> c)

FormulaId Parser::parse_implies() {
    FormulaId lhs = parse_or();
    if (lex_.peek().kind == TokenKind::Arrow) {
        lex_.next();  // consume '->'
        FormulaId rhs = parse_implies();
        return fac_.make_implies(lhs, rhs);
    }
    return lhs;
}

FormulaId Parser::parse_or() {
    FormulaId lhs = parse_and();
    while (lex_.peek().kind == TokenKind::Pipe) {
        lex_.next();  // consume '|'
        FormulaId rhs = parse_and();
        lhs = fac_.make_or(lhs, rhs);
    }
    return lhs;
}

FormulaId Parser::parse_and() {
    FormulaId lhs = parse_until();
    while (lex_.peek().kind == TokenKind::Amp) {
        lex_.next();  // consume '&'
        FormulaId rhs = parse_until();
        lhs = fac_.make_and(lhs, rhs);
    }
    return lhs;
}

// until_expr ::= unary ( 'U' bound? unary )?
// Nested untils need parentheses: (a U b) U c.

FormulaId Parser::parse_until() {
    FormulaId lhs = parse_unary();
    if (lex_.peek().kind != TokenKind::KwU) return lhs;

    lex_.next();  // consume 'U'
    if (has_step_bound()) {
        std::int64_t bound = parse_step_bound();
        return fac_.make_bounded_until(lhs, parse_unary(), bound);
    }
    FormulaId rhs = parse_unary();
    if (lex_.peek().kind == TokenKind::KwU) {
        error(lex_.peek(), "'U' is not associative; use parentheses");
    }
    return fac_.make_until(lhs, rhs);
}

// ── parse_unary ─────────────────────────────────────────────────────────────

FormulaId Parser::parse_unary() {
    const Token& t = lex_.peek();

    switch (t.kind) {
        case TokenKind::Bang: {
            lex_.next();
            return fac_.make_not(parse_unary());
        }
        case TokenKind::KwX: {
            lex_.next();
            return fac_.make_next(parse_unary());
        }
        case TokenKind::KwF: {
            lex_.next();
            if (has_step_bound()) {
                std::int64_t bound = parse_step_bound();
                return fac_.make_bounded_finally(parse_unary(), bound);
            }
            return fac_.make_finally(parse_unary());
        }
        case TokenKind::KwG: {
            lex_.next();
            if (has_step_bound()) {
                std::int64_t bound = parse_step_bound();
                return fac_.make_bounded_globally(parse_unary(), bound);
            }
            return fac_.make_globally(parse_unary());
        }
        default:
            return parse_primary();
    }
}

// ── Step bounds ─────────────────────────────────────────────────────────────

bool Parser::has_step_bound() {
    return lex_.peek().kind == TokenKind::LessEq;
}

std::int64_t Parser::parse_step_bound() {
    expect(TokenKind::LessEq, "in step bound");
    Token t = expect(TokenKind::IntLiteral, "as step bound");
    return parse_integer(t);
}

// ── parse_primary ───────────────────────────────────────────────────────────

FormulaId Parser::parse_primary() {
    Token t = lex_.next();

    switch (t.kind) {
        case TokenKind::KwTrue:
            return fac_.make_true();
        case TokenKind::KwFalse:
            return fac_.make_false();
        case TokenKind::Identifier:
            return fac_.make_atom(t.text);
        case TokenKind::LParen: {
            FormulaId inner = parse_formula();
            expect(TokenKind::RParen, "to close '('");
            return inner;
        }
        case TokenKind::KwP:
        case TokenKind::KwPmin:
        case TokenKind::KwPmax:
            return parse_probability(t);
        case TokenKind::KwR:
        case TokenKind::KwRmin:
        case TokenKind::KwRmax:
            return parse_reward(t);
        case TokenKind::Eof:
            error(t, "unexpected end of input");
        default:
            error(t, "unexpected token '" + t.text + "'");
    }
}

// ── Queries ─────────────────────────────────────────────────────────────────

FormulaId Parser::parse_bracketed_formula(const std::string& context) {
    expect(TokenKind::LBracket, "after " + context);
    FormulaId inner = parse_formula();
    expect(TokenKind::RBracket, "to close " + context);
    return inner;
}

// ('P' | 'Pmin' | 'Pmax') '=?' '[' formula ']'
// 'P' cmp NUMBER '[' formula ']'

FormulaId Parser::parse_probability(const Token& op) {
    Optimum optimum = Optimum::Default;
    if (op.kind == TokenKind::KwPmin) optimum = Optimum::Minimum;
    if (op.kind == TokenKind::KwPmax) optimum = Optimum::Maximum;

    const Token& next = lex_.peek();
    if (next.kind == TokenKind::Query) {
        lex_.next();
        return fac_.make_probability_query(parse_bracketed_formula("probability query"),
                                           optimum);
    }

    Comparison cmp;
    switch (next.kind) {
        case TokenKind::Less:      cmp = Comparison::Less;      break;
        case TokenKind::LessEq:    cmp = Comparison::LessEq;    break;
        case TokenKind::Greater:   cmp = Comparison::Greater;   break;
        case TokenKind::GreaterEq: cmp = Comparison::GreaterEq; break;
        default:
            error(next, "expected '=?' or a comparison after '" + op.text + "'");
    }
    if (optimum != Optimum::Default) {
        error(next, "'" + op.text + "' cannot be combined with a probability bound");
    }
    lex_.next();  // consume comparison

    Token number = lex_.next();
    if (number.kind != TokenKind::IntLiteral && number.kind != TokenKind::RealLiteral) {
        error(number, "expected probability threshold, got '" + number.text + "'");
    }
    const double threshold = parse_real(number);
    if (threshold > 1.0) {
        error(number, "probability threshold " + number.text + " is greater than 1");
    }

    return fac_.make_probability_bound(parse_bracketed_formula("probability bound"),
                                       cmp, threshold);
}

// ('R' | 'Rmin' | 'Rmax') '{' IDENTIFIER '}' '=?' '[' 'C' '<=' INT ']'

FormulaId Parser::parse_reward(const Token& op) {
    Optimum optimum = Optimum::Default;
    if (op.kind == TokenKind::KwRmin) optimum = Optimum::Minimum;
    if (op.kind == TokenKind::KwRmax) optimum = Optimum::Maximum;

    expect(TokenKind::LBrace, "after '" + op.text + "'");
    Token name = expect(TokenKind::Identifier, "as reward name");
    expect(TokenKind::RBrace, "after reward name");
    expect(TokenKind::Query, "in reward query");
    expect(TokenKind::LBracket, "in reward query");
    expect(TokenKind::KwC, "(only cumulative rewards are supported)");
    std::int64_t bound = parse_step_bound();
    expect(TokenKind::RBracket, "to close reward query");

    return fac_.make_reward_query(name.text, optimum, bound);
}

// ── Free function convenience ───────────────────────────────────────────────

FormulaId parse_formula(const std::string& input, FormulaFactory& factory,
                        std::uint32_t line) {
    Lexer lex(input, line);
    Parser parser(lex, factory);
    return parser.parse();
}

}  // namespace pmc
