// ============================================================================
// lexer.cpp - Formula tokeniser implementation
// ============================================================================

#include "pmc/lexer.hpp"

#include <cctype>
#include <stdexcept>

namespace pmc {

// ── token_kind_name ─────────────────────────────────────────────────────────

const char* token_kind_name(TokenKind k) noexcept {
    switch (k) {
        case TokenKind::Identifier:   return "identifier";
        case TokenKind::IntLiteral:   return "integer";
        case TokenKind::RealLiteral:  return "number";
        case TokenKind::KwTrue:       return "true";
        case TokenKind::KwFalse:      return "false";
        case TokenKind::KwX:          return "X";
        case TokenKind::KwF:          return "F";
        case TokenKind::KwG:          return "G";
        case TokenKind::KwU:          return "U";
        case TokenKind::KwP:          return "P";
        case TokenKind::KwPmin:       return "Pmin";
        case TokenKind::KwPmax:       return "Pmax";
        case TokenKind::KwR:          return "R";
        case TokenKind::KwRmin:       return "Rmin";
        case TokenKind::KwRmax:       return "Rmax";
        case TokenKind::KwC:          return "C";
        case TokenKind::Bang:         return "!";
        case TokenKind::Amp:          return "&";
        case TokenKind::Pipe:         return "|";
        case TokenKind::Arrow:        return "->";
        case TokenKind::DoubleArrow:  return "<->";
        case TokenKind::LessEq:       return "<=";
        case TokenKind::Less:         return "<";
        case TokenKind::GreaterEq:    return ">=";
        case TokenKind::Greater:      return ">";
        case TokenKind::Query:        return "=?";
        case TokenKind::LParen:       return "(";
        case TokenKind::RParen:       return ")";
        case TokenKind::LBracket:     return "[";
        case TokenKind::RBracket:     return "]";
        case TokenKind::LBrace:       return "{";
        case TokenKind::RBrace:       return "}";
        case TokenKind::Eof:          return "EOF";
    }
    return "?";
}

// ── Lexer ───────────────────────────────────────────────────────────────────

namespace {

struct Spelling {
    std::string_view text;
    TokenKind        kind;
};

// Longest spelling first wherever one operator is a prefix of another.
constexpr Spelling kOperators[] = {
    {"<->", TokenKind::DoubleArrow},
    {"<=",  TokenKind::LessEq},
    {"<",   TokenKind::Less},
    {">=",  TokenKind::GreaterEq},
    {">",   TokenKind::Greater},
    {"->",  TokenKind::Arrow},
    {"=?",  TokenKind::Query},
    {"!",   TokenKind::Bang},
    {"&",   TokenKind::Amp},
    {"|",   TokenKind::Pipe},
    {"(",   TokenKind::LParen},
    {")",   TokenKind::RParen},
    {"[",   TokenKind::LBracket},
    {"]",   TokenKind::RBracket},
    {"{",   TokenKind::LBrace},
    {"}",   TokenKind::RBrace},
};

constexpr Spelling kKeywords[] = {
    {"true",  TokenKind::KwTrue},
    {"false", TokenKind::KwFalse},
    {"X",     TokenKind::KwX},
    {"F",     TokenKind::KwF},
    {"G",     TokenKind::KwG},
    {"U",     TokenKind::KwU},
    {"P",     TokenKind::KwP},
    {"Pmin",  TokenKind::KwPmin},
    {"Pmax",  TokenKind::KwPmax},
    {"R",     TokenKind::KwR},
    {"Rmin",  TokenKind::KwRmin},
    {"Rmax",  TokenKind::KwRmax},
    {"C",     TokenKind::KwC},
};

bool is_identifier_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

}  // namespace

Lexer::Lexer(std::string_view source, std::uint32_t line)
    : src_(source), pos_{line, 1} {}

SourcePos Lexer::current_pos() const noexcept {
    return pos_;
}

void Lexer::error(const std::string& msg) const {
    // Format: <line>: ERROR: <message> at column <n>
    throw std::runtime_error(
        std::to_string(pos_.line) + ": ERROR: " + msg +
        " at column " + std::to_string(pos_.column));
}

bool Lexer::at_digit() const noexcept {
    return idx_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[idx_]));
}

// Only called on characters of one line; newlines go through
// skip_whitespace_and_comments().
void Lexer::advance(std::size_t count) noexcept {
    idx_ += count;
    pos_.column += static_cast<std::uint32_t>(count);
}

// ── skip_whitespace_and_comments ────────────────────────────────────────────

void Lexer::skip_whitespace_and_comments() {
    while (idx_ < src_.size()) {
        const char c = src_[idx_];
        if (c == '\n') {
            ++idx_;
            ++pos_.line;
            pos_.column = 1;
        } else if (c == '#') {
            const auto eol = src_.find('\n', idx_);
            advance((eol == std::string_view::npos ? src_.size() : eol) - idx_);
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            advance();
        } else {
            return;
        }
    }
}

// ── read_identifier_or_keyword ──────────────────────────────────────────────

Token Lexer::read_identifier_or_keyword() {
    const SourcePos start = pos_;
    const std::size_t begin = idx_;
    while (idx_ < src_.size() && is_identifier_char(src_[idx_])) advance();

    const std::string_view text = src_.substr(begin, idx_ - begin);
    for (const auto& kw : kKeywords) {
        if (kw.text == text) return Token{kw.kind, std::string(text), start};
    }
    return Token{TokenKind::Identifier, std::string(text), start};
}

// ── read_number ─────────────────────────────────────────────────────────────
// digits ('.' digits)?  An integer without fraction is an IntLiteral.

Token Lexer::read_number() {
    const SourcePos start = pos_;
    const std::size_t begin = idx_;
    while (at_digit()) advance();

    TokenKind kind = TokenKind::IntLiteral;
    if (idx_ < src_.size() && src_[idx_] == '.') {
        advance();
        if (!at_digit()) error("expected digits after '.'");
        while (at_digit()) advance();
        kind = TokenKind::RealLiteral;
    }
    return Token{kind, std::string(src_.substr(begin, idx_ - begin)), start};
}

// ── read_operator ───────────────────────────────────────────────────────────

Token Lexer::read_operator() {
    const SourcePos start = pos_;
    const std::string_view rest = src_.substr(idx_);
    for (const auto& op : kOperators) {
        if (rest.starts_with(op.text)) {
            advance(op.text.size());
            return Token{op.kind, std::string(op.text), start};
        }
    }
    error(std::string("unexpected character '") + src_[idx_] + "'");
}

// ── next ────────────────────────────────────────────────────────────────────

Token Lexer::next() {
    if (has_peeked_) {
        has_peeked_ = false;
        return std::move(peeked_);
    }

    skip_whitespace_and_comments();
    if (idx_ >= src_.size()) return Token{TokenKind::Eof, "", pos_};

    const char c = src_[idx_];
    if (std::isdigit(static_cast<unsigned char>(c))) return read_number();
    if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
        return read_identifier_or_keyword();
    }
    return read_operator();
}

// ── peek ────────────────────────────────────────────────────────────────────

const Token& Lexer::peek() {
    if (!has_peeked_) {
        peeked_ = next();
        has_peeked_ = true;
    }
    return peeked_;
}

// ── tokenise (convenience) ──────────────────────────────────────────────────

std::vector<Token> tokenise(std::string_view source, std::uint32_t line) {
    Lexer lex(source, line);
    std::vector<Token> toks;
    for (;;) {
        Token t = lex.next();
        toks.push_back(t);
        if (t.kind == TokenKind::Eof) break;
    }
    return toks;
}

}  // namespace pmc
