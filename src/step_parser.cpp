#include "cook/parser.hpp"
#include "cook/quantity_parser.hpp"
#include <cstdio>
#include <cstdlib>
#include <string>

namespace cook {

namespace {

using Kind = ast::Component::Kind;

bool is_sigil(TokenKind k){ return k == TokenKind::At || k == TokenKind::Hash || k == TokenKind::Tilde; }
bool is_single_word(TokenKind k){ return k == TokenKind::Word || k == TokenKind::Int || k == TokenKind::ZeroInt; }

std::optional<Modifiers> modifier_of(TokenKind k){
    switch(k){
        case TokenKind::At: return Modifiers::Recipe;
        case TokenKind::And: return Modifiers::Ref;
        case TokenKind::Question: return Modifiers::Opt;
        case TokenKind::Minus: return Modifiers::Hidden;
        case TokenKind::Plus: return Modifiers::New;
        default: return std::nullopt;
    }
}

Modifiers parse_modifiers(BlockParser& bp, Kind kind, std::optional<Span>& span){
    Modifiers mods = Modifiers::None;
    TokenSlice toks = bp.consume_while([](TokenKind k){ return modifier_of(k).has_value(); });
    if(toks.empty()) return mods;
    span = tokens_span(toks);
    for(const Token& t : toks){
        Modifiers m = *modifier_of(t.kind);
        if(has_modifier(mods, m)){
            bp.error(make_error("E0201", "Duplicate modifier", t.span, "remove this"));
            continue;
        }
        if(m == Modifiers::Recipe && kind != Kind::Ingredient){
            bp.error(make_error("E0203", "Only ingredients can reference a recipe", t.span, "remove this"));
            continue;
        }
        mods |= m;
    }
    if(has_modifier(mods, Modifiers::Ref) && has_modifier(mods, Modifiers::New)){
        bp.error(make_error("E0202", "Conflicting modifiers: '&' and '+'", *span)
            .hint("'&' references an earlier definition and '+' forces a new one, use only one"));
    }
    return mods;
}

// "(N)", "(~N)" or "(=N)". Returns nullopt without consuming when there is no '('.
std::optional<ast::IntermediateRef> parse_intermediate(BlockParser& bp, bool& failed){
    if(bp.peek() != TokenKind::OpenParen) return std::nullopt;
    size_t start = bp.current_offset();
    bp.bump_any();
    TokenSlice inner = bp.consume_while([](TokenKind k){ return k != TokenKind::CloseParen && k != TokenKind::Newline; });
    if(!bp.consume(TokenKind::CloseParen)){ failed = true; return std::nullopt; }
    Span span{start, bp.current_offset()};

    TokenSlice t = trim_tokens(inner);
    ast::IntermediateRef ref;
    ref.span = span;
    size_t i = 0;
    if(!t.empty() && t[0].kind == TokenKind::Tilde){ ref.kind = ast::IntermediateRef::Kind::RelativeStep; ++i; }
    else if(!t.empty() && t[0].kind == TokenKind::Equal){ ref.kind = ast::IntermediateRef::Kind::Section; ++i; }
    if(i + 1 != t.size() || t[i].kind != TokenKind::Int){
        bp.error(make_error("E0206", "Invalid intermediate preparation reference", span)
            .hint("Use '(N)' for step N, '(~N)' for N steps back or '(=N)' for section N"));
        return std::nullopt;
    }
    ref.value = static_cast<uint32_t>(std::strtoul(std::string(bp.token_str(t[i])).c_str(), nullptr, 10));
    return ref;
}

// Splits "name|alias". Without the alias extension the '|' stays in the name.
void split_alias(BlockParser& bp, TokenSlice name_tokens, Kind kind, ast::Component& c){
    size_t pipe = name_tokens.size();
    if(bp.extension(Extensions::ComponentAlias) && kind != Kind::Timer){
        for(size_t i = 0; i < name_tokens.size(); ++i) if(name_tokens[i].kind == TokenKind::Pipe){ pipe = i; break; }
    }
    TokenSlice name = name_tokens.first(pipe);
    if(!name.empty()){
        ast::Text t = bp.text(name.front().span.start, name);
        c.name = ast::Text{t.trimmed(), tokens_span(name)};
    }
    if(pipe < name_tokens.size()){
        TokenSlice alias = name_tokens.from(pipe + 1);
        size_t at = name_tokens[pipe].span.end;
        ast::Text t = bp.text(at, alias);
        if(t.is_text_empty()){
            bp.error(make_error("E0204", "Empty component alias", name_tokens[pipe].span, "remove this"));
        } else {
            c.alias = ast::Text{t.trimmed(), t.span};
        }
    }
}

std::optional<ast::Component> parse_component(BlockParser& bp){
    ast::Component c;
    size_t start = bp.current_offset();
    Token sigil = bp.bump_any();
    c.kind = sigil.kind == TokenKind::At ? Kind::Ingredient : sigil.kind == TokenKind::Hash ? Kind::Cookware : Kind::Timer;

    if(c.kind != Kind::Timer && bp.extension(Extensions::ComponentModifiers))
        c.modifiers = parse_modifiers(bp, c.kind, c.modifiers_span);

    if(c.kind == Kind::Ingredient && has_modifier(c.modifiers, Modifiers::Ref) && bp.extension(Extensions::IntermediatePreparations)){
        bool failed = false;
        c.intermediate = parse_intermediate(bp, failed);
        if(failed) return std::nullopt;
    }

    // braced form: name up to '{' on the same line, no nested components
    TokenSlice rest = bp.rest();
    size_t open = rest.size();
    for(size_t i = 0; i < rest.size(); ++i){
        TokenKind k = rest[i].kind;
        if(k == TokenKind::OpenBrace){ open = i; break; }
        if(k == TokenKind::Newline || k == TokenKind::CloseBrace || is_sigil(k)) break;
    }
    size_t close = rest.size();
    for(size_t i = open + 1; open < rest.size() && i < rest.size(); ++i){
        TokenKind k = rest[i].kind;
        if(k == TokenKind::CloseBrace){ close = i; break; }
        if(k == TokenKind::Newline || k == TokenKind::OpenBrace) break;
    }

    if(open < rest.size() && close < rest.size() && (open == 0 || !is_trivia(rest[0].kind))){
        TokenSlice name_tokens = rest.first(open);
        TokenSlice q_tokens = rest.sub(open + 1, close - open - 1);
        for(size_t i = 0; i <= close; ++i) bp.bump_any();
        split_alias(bp, name_tokens, c.kind, c);
        if(!c.name && c.kind != Kind::Timer) return std::nullopt;
        TokenSlice trimmed = trim_tokens(q_tokens);
        if(!trimmed.empty()){
            ParsedQuantity pq = parse_quantity(bp, trimmed);
            c.quantity = std::move(pq.quantity);
            c.unit_separator = pq.unit_separator;
        }
    } else {
        size_t word_from = bp.position();
        if(bp.consume_while(is_single_word).empty()) return std::nullopt;
        if(bp.extension(Extensions::ComponentAlias) && c.kind != Kind::Timer
           && bp.peek() == TokenKind::Pipe && is_single_word(bp.peek_at(1))){
            bp.bump_any();
            bp.consume_while(is_single_word);
        }
        split_alias(bp, bp.tokens().sub(word_from, bp.position() - word_from), c.kind, c);
        if(!c.name) return std::nullopt;
    }

    if(c.kind != Kind::Timer && bp.extension(Extensions::ComponentNote) && bp.peek() == TokenKind::OpenParen){
        TokenSlice after = bp.rest();
        size_t end = 1;
        while(end < after.size() && after[end].kind != TokenKind::CloseParen && after[end].kind != TokenKind::Newline) ++end;
        if(end < after.size() && after[end].kind == TokenKind::CloseParen){
            TokenSlice note = after.sub(1, end - 1);
            for(size_t i = 0; i <= end; ++i) bp.bump_any();
            ast::Text t = bp.text(after[0].span.end, note);
            if(!t.is_text_empty()) c.note = ast::Text{t.trimmed(), t.span};
        }
    }

    c.span = Span{start, bp.current_offset()};
    if(debug_parse_enabled())
        std::fprintf(stderr, "[dbg][step] component kind=%d name='%s'\n", static_cast<int>(c.kind), c.name ? c.name->value.c_str() : "");
    return c;
}

} // namespace

std::vector<ast::StepItem> parse_step(BlockParser& bp){
    std::vector<ast::StepItem> items;
    std::optional<size_t> text_from;

    auto flush_text = [&](size_t to){
        if(!text_from) return;
        TokenSlice run = bp.tokens().sub(*text_from, to - *text_from);
        ast::Text t = bp.text(run.front().span.start, run);
        if(!t.value.empty()) items.emplace_back(std::move(t));
        text_from.reset();
    };

    while(!bp.at_end()){
        TokenKind k = bp.peek();
        if(is_sigil(k)){
            size_t pos = bp.position();
            if(auto c = bp.with_recover(parse_component)){
                flush_text(pos);
                items.emplace_back(std::move(*c));
                continue;
            }
        }
        if(!text_from) text_from = bp.position();
        // escaped token joins the text run
        if(k == TokenKind::Backslash && bp.peek_at(1) != TokenKind::Eof) bp.bump_any();
        bp.bump_any();
    }
    flush_text(bp.position());
    return items;
}

} // namespace cook
