// Cursor over the tokens of one syntactic block
#pragma once
#include <optional>
#include <string_view>
#include <utility>
#include "cook/ast.hpp"
#include "cook/diagnostics.hpp"
#include "cook/extensions.hpp"
#include "cook/token.hpp"

namespace cook {

// Diagnostics go to the shared queue of the parse invocation; nothing here
// aborts the document. Sub-parses that fail are rolled back by with_recover.
class BlockParser {
public:
    BlockParser(TokenSlice tokens, std::string_view input, DiagnosticQueue& events, Extensions ext)
        : tokens_(tokens), input_(input), events_(&events), ext_(ext) {}

    // Isolated parser over `tokens`, sharing input, queue and extensions.
    BlockParser sub(TokenSlice tokens) const { return BlockParser(tokens, input_, *events_, ext_); }

    TokenKind peek() const { return current_ < tokens_.size() ? tokens_[current_].kind : TokenKind::Eof; }
    // Kind of the n-th token after the cursor.
    TokenKind peek_at(size_t n) const { return current_ + n < tokens_.size() ? tokens_[current_ + n].kind : TokenKind::Eof; }
    const Token* current_token() const { return current_ < tokens_.size() ? &tokens_[current_] : nullptr; }
    bool at_end() const { return current_ >= tokens_.size(); }

    // Throws std::logic_error at the end of the block.
    Token bump_any();
    // Throws std::logic_error when the current token is not `expected`.
    Token bump(TokenKind expected);
    std::optional<Token> consume(TokenKind k){ if(peek()==k) return bump_any(); return std::nullopt; }
    template <typename P>
    TokenSlice consume_while(P&& pred){
        size_t start = current_;
        while(current_ < tokens_.size() && pred(tokens_[current_].kind)) ++current_;
        return tokens_.sub(start, current_ - start);
    }
    TokenSlice consume_rest(){ return consume_while([](TokenKind){ return true; }); }
    TokenSlice ws_comments(){ return consume_while(is_trivia); }

    TokenSlice tokens() const { return tokens_; }
    TokenSlice parsed() const { return tokens_.first(current_); }
    TokenSlice rest() const { return tokens_.from(current_); }
    Span span() const { return tokens_span(tokens_); }
    // Start of the current token, or end of the block when everything was consumed.
    size_t current_offset() const;
    size_t position() const { return current_; }

    std::string_view input() const { return input_; }
    std::string_view token_str(const Token& t) const { return input_.substr(t.span.start, t.span.len()); }
    std::string_view slice_str(TokenSlice ts) const { auto s = tokens_span(ts); return input_.substr(s.start, s.len()); }
    // Text of `tokens` with comments dropped and escapes resolved. The span
    // starts at `offset` so empty slices still point somewhere useful.
    ast::Text text(size_t offset, TokenSlice tokens) const;

    bool extension(Extensions e) const { return has_extension(ext_, e); }
    Extensions extensions() const { return ext_; }
    DiagnosticQueue& events() const { return *events_; }
    void error(Diagnostic d) const;
    void warn(Diagnostic d) const;

    // Runs `f`; when it returns an empty optional the cursor and the
    // diagnostics it emitted are rolled back so another grammar can retry.
    template <typename F>
    auto with_recover(F&& f) -> decltype(f(*this)) {
        size_t old_current = current_;
        size_t old_events = events_->size();
        auto r = f(*this);
        if(!r){
            current_ = old_current;
            events_->erase(events_->begin() + static_cast<std::ptrdiff_t>(old_events), events_->end());
        }
        return r;
    }

private:
    TokenSlice tokens_;
    size_t current_ = 0;
    std::string_view input_;
    DiagnosticQueue* events_;
    Extensions ext_;
};

} // namespace cook
