#include "cook/block_parser.hpp"
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace cook {

std::string ast::Text::trimmed() const {
    size_t b = 0, e = value.size();
    while(b < e && std::isspace(static_cast<unsigned char>(value[b]))) ++b;
    while(e > b && std::isspace(static_cast<unsigned char>(value[e-1]))) --e;
    return value.substr(b, e - b);
}

Token BlockParser::bump_any(){
    if(current_ >= tokens_.size()) throw std::logic_error("bump past the end of the block");
    return tokens_[current_++];
}

Token BlockParser::bump(TokenKind expected){
    if(peek() != expected)
        throw std::logic_error(std::string("expected token ") + token_kind_name(expected) + ", found " + token_kind_name(peek()));
    return bump_any();
}

size_t BlockParser::current_offset() const {
    if(current_ < tokens_.size()) return tokens_[current_].span.start;
    if(!tokens_.empty()) return tokens_.back().span.end;
    return 0;
}

ast::Text BlockParser::text(size_t offset, TokenSlice tokens) const {
    ast::Text t;
    t.span = Span{offset, tokens.empty() ? offset : tokens.back().span.end};
    for(size_t i = 0; i < tokens.size(); ++i){
        const Token& tok = tokens[i];
        switch(tok.kind){
            case TokenKind::LineComment:
            case TokenKind::BlockComment:
                break;
            case TokenKind::Newline:
                t.value += ' ';
                break;
            case TokenKind::Backslash:
                // escaped token is copied as is; a trailing '\' stays literal
                if(i + 1 < tokens.size()) ++i;
                t.value += token_str(tokens[i]);
                break;
            default:
                t.value += token_str(tok);
                break;
        }
    }
    return t;
}

void BlockParser::error(Diagnostic d) const {
    d.severity = Severity::Error;
    if(debug_parse_enabled()) std::fprintf(stderr, "[dbg][parse] error %s at %zu: %s\n", d.code.c_str(), d.primary_span().start, d.message.c_str());
    events_->push_back(std::move(d));
}

void BlockParser::warn(Diagnostic d) const {
    d.severity = Severity::Warning;
    if(debug_parse_enabled()) std::fprintf(stderr, "[dbg][parse] warning %s at %zu: %s\n", d.code.c_str(), d.primary_span().start, d.message.c_str());
    events_->push_back(std::move(d));
}

} // namespace cook
