#include "cook/quantity_parser.hpp"
#include <cerrno>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <variant>

namespace cook {

namespace {

// A numeric form was recognised: either its value or the diagnostic that
// replaces it.
using Outcome = std::variant<Number, Diagnostic>;

bool not_ws_comment(const Token& t){ return !is_trivia(t.kind); }

std::variant<uint32_t, Diagnostic> parse_int(const Token& tok, const BlockParser& bp){
    std::string s(bp.token_str(tok));
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if(errno == ERANGE || end != s.c_str() + s.size() || v > 0xffffffffull)
        return make_error("E0105", "Error parsing integer number", tok.span, "does not fit in 32 bits");
    return static_cast<uint32_t>(v);
}

Outcome parse_float(TokenSlice tokens, const BlockParser& bp){
    std::string s(bp.slice_str(tokens));
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if(errno == ERANGE || end != s.c_str() + s.size())
        return make_error("E0106", "Error parsing decimal number", tokens_span(tokens));
    return Number(v);
}

Outcome frac(const Token& a, const Token& b, const BlockParser& bp){
    Span span{a.span.start, b.span.end};
    auto num = parse_int(a, bp);
    if(auto d = std::get_if<Diagnostic>(&num)) return *d;
    auto den = parse_int(b, bp);
    if(auto d = std::get_if<Diagnostic>(&den)) return *d;
    if(std::get<uint32_t>(den) == 0){
        return make_error("E0104", "Division by zero", span)
            .hint("Change this please, we don't want an infinite amount of anything");
    }
    return Number::fraction(0, std::get<uint32_t>(num), std::get<uint32_t>(den));
}

Outcome mixed_num(const Token& i, const Token& a, const Token& b, const BlockParser& bp){
    auto whole = parse_int(i, bp);
    if(auto d = std::get_if<Diagnostic>(&whole)) return *d;
    Outcome f = frac(a, b, bp);
    if(std::holds_alternative<Diagnostic>(f)) return f;
    const Fraction* fr = std::get<Number>(f).as_fraction();
    return Number::fraction(std::get<uint32_t>(whole), fr->num, fr->den);
}

bool is_dot(const Token& t, const BlockParser& bp){ return t.kind == TokenKind::Punctuation && bp.token_str(t) == "."; }
bool is_int_like(TokenKind k){ return k == TokenKind::Int || k == TokenKind::ZeroInt; }

std::optional<Outcome> numeric_value(TokenSlice tokens, const BlockParser& bp){
    TokenSlice t = trim_tokens(tokens);
    if(t.empty()) return std::nullopt;

    // bare ints are parsed as floats to allow large values
    if(t.size() == 1 && t[0].kind == TokenKind::Int) return parse_float(t, bp);
    if(t.size() == 3 && t[0].kind == TokenKind::Int && is_dot(t[1], bp) && is_int_like(t[2].kind)) return parse_float(t, bp);
    if(t.size() == 2 && is_dot(t[0], bp) && is_int_like(t[1].kind)) return parse_float(t, bp);

    // complex values are at most 4 tokens once spaces and comments are gone
    Token f[4];
    size_t n = 0;
    for(const Token& tok : t){
        if(!not_ws_comment(tok)) continue;
        if(n == 4) return std::nullopt;
        f[n++] = tok;
    }
    using K = TokenKind;
    if(n == 4 && f[0].kind == K::Int && f[1].kind == K::Int && f[2].kind == K::Slash && f[3].kind == K::Int)
        return mixed_num(f[0], f[1], f[3], bp);
    if(n == 3 && f[0].kind == K::Int && f[1].kind == K::Slash && f[2].kind == K::Int)
        return frac(f[0], f[2], bp);
    return std::nullopt;
}

std::optional<std::variant<Value, Diagnostic>> range_value(TokenSlice tokens, const BlockParser& bp){
    if(!bp.extension(Extensions::RangeValues)) return std::nullopt;
    size_t mid = tokens.size();
    for(size_t i = 0; i < tokens.size(); ++i) if(tokens[i].kind == TokenKind::Minus){ mid = i; break; }
    if(mid == tokens.size()) return std::nullopt;

    auto start = numeric_value(tokens.first(mid), bp);
    if(!start) return std::nullopt;
    if(auto d = std::get_if<Diagnostic>(&*start)) return *d;
    auto end = numeric_value(tokens.from(mid + 1), bp);
    if(!end) return std::nullopt;
    if(auto d = std::get_if<Diagnostic>(&*end)) return *d;
    return Value::range(std::get<Number>(*start), std::get<Number>(*end));
}

// Range, then number. nullopt when the tokens are not numeric at all.
std::optional<std::variant<Value, Diagnostic>> numeric_or_range(TokenSlice tokens, const BlockParser& bp){
    if(auto r = range_value(tokens, bp)) return r;
    if(auto n = numeric_value(tokens, bp)){
        if(auto d = std::get_if<Diagnostic>(&*n)) return *d;
        return Value(std::get<Number>(*n));
    }
    return std::nullopt;
}

Value take_value(std::variant<Value, Diagnostic> r, const BlockParser& bp){
    if(auto d = std::get_if<Diagnostic>(&r)){
        bp.error(std::move(*d));
        return Value::recover();
    }
    return std::get<Value>(std::move(r));
}

Value text_value(TokenSlice tokens, size_t offset, const BlockParser& bp){
    ast::Text text = bp.text(offset, tokens);
    if(text.is_text_empty()) bp.error(make_error("E0102", "Empty quantity value", text.span, "add value here"));
    return Value::text(text.trimmed());
}

Located<Value> parse_value(TokenSlice tokens, const BlockParser& bp){
    size_t start = tokens.empty() ? bp.current_offset() : tokens.front().span.start;
    Span span{start, bp.current_offset()};
    Value v;
    if(auto r = numeric_or_range(tokens, bp)) v = take_value(std::move(*r), bp);
    else v = text_value(tokens, start, bp);
    return Located<Value>{std::move(v), span};
}

bool is_value_end(TokenKind k){ return k == TokenKind::Pipe || k == TokenKind::Star || k == TokenKind::Percent; }

QuantityValue many_values(BlockParser& bp){
    std::vector<Located<Value>> values;
    std::optional<Span> auto_scale;
    for(;;){
        TokenSlice value_tokens = bp.consume_while([](TokenKind k){ return !is_value_end(k); });
        values.push_back(parse_value(value_tokens, bp));
        if(bp.peek() == TokenKind::Pipe){ bp.bump_any(); continue; }
        if(bp.peek() == TokenKind::Star) auto_scale = bp.bump_any().span;
        break;
    }
    if(values.size() == 1) return QuantityValue::single(std::move(values.front()), auto_scale);
    if(auto_scale){
        bp.error(make_error("E0103", "Invalid quantity value: auto scale is not compatible with multiple values", *auto_scale, "remove this")
            .hint("A quantity cannot have the auto scaling marker (*) and have many values at the same time"));
    }
    return QuantityValue::many(std::move(values));
}

ParsedQuantity parse_regular(BlockParser& bp){
    QuantityValue value = many_values(bp);
    std::optional<std::pair<Span, ast::Text>> unit;
    if(bp.peek() == TokenKind::Percent){
        Token sep = bp.bump_any();
        TokenSlice rest = bp.consume_rest();
        unit = std::make_pair(sep.span, bp.text(sep.span.end, rest));
    } else if(bp.peek() != TokenKind::Eof){
        // not a value list: the whole text up to '%' is one text value
        bp.consume_while([](TokenKind k){ return k != TokenKind::Percent; });
        ast::Text text = bp.text(bp.span().start, bp.parsed());
        value = QuantityValue::single(Located<Value>{Value::text(text.trimmed()), text.span});
        if(auto sep = bp.consume(TokenKind::Percent)){
            TokenSlice rest = bp.consume_rest();
            unit = std::make_pair(sep->span, bp.text(sep->span.end, rest));
        }
    }

    if(unit && unit->second.is_text_empty()){
        bp.error(make_error("E0101", "Empty quantity unit", unit->second.span, "add unit here")
            .label(unit->first, "or remove this"));
    }

    ParsedQuantity out;
    out.quantity = Located<ast::Quantity>{ast::Quantity{std::move(value), std::nullopt}, bp.span()};
    if(unit){
        out.unit_separator = unit->first;
        out.quantity.value.unit = std::move(unit->second);
    }
    return out;
}

std::optional<ParsedQuantity> parse_advanced(BlockParser& bp){
    for(const Token& t : bp.tokens()) if(is_value_end(t.kind)) return std::nullopt;

    bp.ws_comments();
    TokenSlice value_tokens = bp.consume_while([](TokenKind k){ return k != TokenKind::Word; });
    if(value_tokens.empty() || value_tokens.back().kind != TokenKind::Whitespace) return std::nullopt;
    size_t end = value_tokens.size();
    while(end > 0 && (value_tokens[end-1].kind == TokenKind::Whitespace || value_tokens[end-1].kind == TokenKind::BlockComment)) --end;
    if(end == 0) return std::nullopt;
    value_tokens = value_tokens.first(end);

    TokenSlice unit_tokens = bp.consume_rest();
    if(unit_tokens.empty()) return std::nullopt;

    auto r = numeric_or_range(value_tokens, bp);
    if(!r) return std::nullopt;
    Located<Value> value{take_value(std::move(*r), bp), tokens_span(value_tokens)};

    ParsedQuantity out;
    out.quantity = Located<ast::Quantity>{
        ast::Quantity{QuantityValue::single(std::move(value)), bp.text(unit_tokens.front().span.start, unit_tokens)},
        bp.span()};
    return out;
}

} // namespace

ParsedQuantity parse_quantity(const BlockParser& bp, TokenSlice tokens){
    if(tokens.empty()) throw std::invalid_argument("empty quantity tokens");
    BlockParser qp = bp.sub(tokens);
    if(qp.extension(Extensions::AdvancedUnits)){
        if(auto adv = qp.with_recover(parse_advanced)) return std::move(*adv);
    }
    return parse_regular(qp);
}

} // namespace cook
