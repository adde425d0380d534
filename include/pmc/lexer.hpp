// ============================================================================
// pmc/lexer.hpp - Tokeniser for the formula language
// ============================================================================
//
// The lexer converts a raw input string into a stream of tokens.  Every
// token carries its source position (line, column) so that error messages
// can point the user to the exact location of a problem.
//
// Recognised tokens:
//   Identifiers  [A-Za-z_][A-Za-z0-9_]*   (includes "true", "false", "X",
//                                            "F", "G", "U", "P", "Pmin",
//                                            "Pmax", "R", "Rmin", "Rmax",
//                                            "C" as keywords)
//   Numbers      digits ('.' digits)?
//   Symbols      !  &  |  (  )  [  ]  {  }  ->  <->  <  <=  >  >=  =?
//   EOF          end-of-input sentinel
//
// Whitespace is skipped.  Inline comments starting with '#' discard the
// rest of the line.
//
// ============================================================================

#ifndef PMC_LEXER_HPP
#define PMC_LEXER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pmc {

// ── SourcePos ───────────────────────────────────────────────────────────────
// 1-based line and column, used for error reporting.

struct SourcePos {
    std::uint32_t line   = 1;
    std::uint32_t column = 1;
};

// ── TokenKind ───────────────────────────────────────────────────────────────

enum class TokenKind : std::uint8_t {
    // Literals / identifiers
    Identifier,     // atom or reward name
    IntLiteral,     // 42
    RealLiteral,    // 0.25
    KwTrue,         // "true"
    KwFalse,        // "false"

    // Path operators
    KwX,            // "X"
    KwF,            // "F"
    KwG,            // "G"
    KwU,            // "U"

    // Query operators
    KwP,            // "P"
    KwPmin,         // "Pmin"
    KwPmax,         // "Pmax"
    KwR,            // "R"
    KwRmin,         // "Rmin"
    KwRmax,         // "Rmax"
    KwC,            // "C" (cumulative reward)

    // Boolean operators
    Bang,           // !
    Amp,            // &
    Pipe,           // |
    Arrow,          // ->
    DoubleArrow,    // <->

    // Comparison operators
    LessEq,         // <=
    Less,           // <
    GreaterEq,      // >=
    Greater,        // >
    Query,          // =?

    // Delimiters
    LParen,         // (
    RParen,         // )
    LBracket,       // [
    RBracket,       // ]
    LBrace,         // {
    RBrace,         // }

    // Sentinel
    Eof
};

/// Human-readable name for debugging.
const char* token_kind_name(TokenKind k) noexcept;

// ── Token ───────────────────────────────────────────────────────────────────

struct Token {
    TokenKind   kind = TokenKind::Eof;
    std::string text;
    SourcePos   pos;
};

// ── Lexer ───────────────────────────────────────────────────────────────────
// Stores the full input and lazily produces tokens via next().
// Errors are reported by throwing std::runtime_error with a formatted
// message that includes line and column.

class Lexer {
public:
    /// Construct a lexer over the given input.
    /// @param source  the full text to tokenise
    /// @param line    the starting line number (default 1)
    explicit Lexer(std::string_view source, std::uint32_t line = 1);

    /// Return the next token.  Repeated calls after EOF keep returning EOF.
    Token next();

    /// Peek at the next token without consuming it.
    const Token& peek();

    /// Current source position (of the next character to be read).
    SourcePos current_pos() const noexcept;

private:
    void skip_whitespace_and_comments();
    Token read_identifier_or_keyword();
    Token read_number();
    Token read_operator();

    bool at_digit() const noexcept;
    void advance(std::size_t count = 1) noexcept;

    [[noreturn]] void error(const std::string& msg) const;

    std::string_view src_;
    std::size_t      idx_ = 0;
    SourcePos        pos_;
    bool             has_peeked_ = false;
    Token            peeked_;
};

// ── tokenise ────────────────────────────────────────────────────────────────
// Convenience: tokenise a complete string and return a vector of tokens
// (including the trailing Eof).

std::vector<Token> tokenise(std::string_view source, std::uint32_t line = 1);

}  // namespace pmc

#endif  // PMC_LEXER_HPP
