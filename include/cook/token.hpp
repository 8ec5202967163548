// Token kinds produced by the lexer and consumed by the block parsers
#pragma once
#include <cstdint>
#include <string_view>
#include "cook/span.hpp"

namespace cook {

enum class TokenKind : uint8_t {
    Word,
    Int,
    ZeroInt,
    Punctuation,
    Whitespace,
    Newline,
    LineComment,
    BlockComment,
    // grammar symbols
    At,         // @
    Hash,       // #
    Tilde,      // ~
    OpenBrace,  // {
    CloseBrace, // }
    OpenParen,  // (
    CloseParen, // )
    Percent,    // %
    Pipe,       // |
    Star,       // *
    Minus,      // -
    Slash,      // /
    Backslash,  // '\'
    Colon,      // :
    Equal,      // =
    Greater,    // >
    And,        // &
    Question,   // ?
    Plus,       // +
    Eof
};

struct Token {
    TokenKind kind = TokenKind::Eof;
    Span span;

    bool operator==(const Token& o) const { return kind == o.kind && span == o.span; }
};

inline bool is_trivia(TokenKind k) { return k == TokenKind::Whitespace || k == TokenKind::LineComment || k == TokenKind::BlockComment; }

const char* token_kind_name(TokenKind k);

// Non-owning view over a run of tokens. The lexer output must outlive it.
struct TokenSlice {
    const Token* ptr = nullptr;
    size_t count = 0;

    TokenSlice() = default;
    TokenSlice(const Token* p, size_t n) : ptr(p), count(n) {}
    template <typename Vec>
    explicit TokenSlice(const Vec& v) : ptr(v.data()), count(v.size()) {}

    const Token* begin() const { return ptr; }
    const Token* end() const { return ptr + count; }
    size_t size() const { return count; }
    bool empty() const { return count == 0; }
    const Token& operator[](size_t i) const { return ptr[i]; }
    const Token& front() const { return ptr[0]; }
    const Token& back() const { return ptr[count - 1]; }
    TokenSlice sub(size_t from, size_t n) const { return TokenSlice{ptr + from, n}; }
    TokenSlice from(size_t i) const { return TokenSlice{ptr + i, count - i}; }
    TokenSlice first(size_t n) const { return TokenSlice{ptr, n}; }
};

// Span from the first to the last token. Empty slices give an empty span at 0.
inline Span tokens_span(TokenSlice tokens)
{
    if (tokens.empty()) return Span{};
    return Span{tokens.front().span.start, tokens.back().span.end};
}

// Drop whitespace and comments from both ends.
inline TokenSlice trim_tokens(TokenSlice s)
{
    size_t from = 0, to = s.size();
    while (from < to && is_trivia(s[from].kind)) ++from;
    while (to > from && is_trivia(s[to - 1].kind)) --to;
    return s.sub(from, to - from);
}

} // namespace cook
