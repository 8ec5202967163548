#include "cook/parser.hpp"
#include <cstdio>

namespace cook {

namespace {

enum class LineKind { Blank, Metadata, Section, Text, Step };

bool only_trivia(TokenSlice line){
    for(const Token& t : line) if(!is_trivia(t.kind)) return false;
    return true;
}

LineKind classify(TokenSlice line, Extensions ext){
    if(only_trivia(line)) return LineKind::Blank;
    TokenSlice t = trim_tokens(line);
    if(t.size() >= 2 && t[0].kind == TokenKind::Greater && t[1].kind == TokenKind::Greater) return LineKind::Metadata;
    if(t[0].kind == TokenKind::Greater && has_extension(ext, Extensions::TextSteps)) return LineKind::Text;
    if(t[0].kind == TokenKind::Equal && has_extension(ext, Extensions::Sections)) return LineKind::Section;
    return LineKind::Step;
}

// Everything after the leading '>' of a text line.
ast::Text text_line(BlockParser& bp){
    bp.ws_comments();
    bp.bump(TokenKind::Greater);
    TokenSlice rest = trim_tokens(bp.consume_rest());
    if(rest.empty()) return ast::Text{std::string{}, Span::pos(bp.current_offset())};
    return bp.text(rest.front().span.start, rest);
}

} // namespace

ast::MetadataBlock parse_metadata(BlockParser& bp){
    ast::MetadataBlock block;
    block.span = bp.span();
    bp.ws_comments();
    bp.bump(TokenKind::Greater);
    bp.bump(TokenKind::Greater);
    TokenSlice key_tokens = bp.consume_while([](TokenKind k){ return k != TokenKind::Colon; });
    ast::Text key = bp.text(key_tokens.empty() ? bp.current_offset() : key_tokens.front().span.start, key_tokens);
    block.key = ast::Text{key.trimmed(), key.span};

    if(!bp.consume(TokenKind::Colon)){
        bp.error(make_error("E0303", "Invalid metadata entry", block.span, "missing ':'")
            .hint("Metadata entries look like '>> key: value'"));
        block.key.value.clear();
        return block;
    }
    size_t value_start = bp.current_offset();
    TokenSlice value_tokens = bp.consume_rest();
    ast::Text value = bp.text(value_start, value_tokens);
    block.value = ast::Text{value.trimmed(), value.span};

    if(block.key.value.empty())
        bp.error(make_error("E0301", "Empty metadata key", block.key.span, "add a key here"));
    else if(block.value.value.empty())
        bp.warn(make_warning("W0301", "Empty metadata value", block.value.span, "add a value here"));
    return block;
}

ast::SectionBlock parse_section(BlockParser& bp){
    ast::SectionBlock block;
    block.span = bp.span();
    bp.ws_comments();
    bp.consume_while([](TokenKind k){ return k == TokenKind::Equal; });
    TokenSlice rest = bp.consume_rest();
    size_t end = rest.size();
    while(end > 0 && (is_trivia(rest[end-1].kind) || rest[end-1].kind == TokenKind::Equal)) --end;
    TokenSlice name_tokens = rest.first(end);
    if(!trim_tokens(name_tokens).empty()){
        ast::Text name = bp.text(name_tokens.front().span.start, name_tokens);
        block.name = ast::Text{name.trimmed(), tokens_span(trim_tokens(name_tokens))};
    }
    return block;
}

std::vector<ast::Block> parse_blocks(std::string_view input, const std::vector<Token>& tokens, DiagnosticQueue& events, Extensions ext){
    std::vector<ast::Block> blocks;
    TokenSlice all(tokens);
    if(!all.empty() && all.back().kind == TokenKind::Eof) all = all.first(all.size() - 1);

    // current step paragraph: [step_from, step_to) token indices
    std::optional<size_t> step_from;
    size_t step_to = 0;
    std::optional<ast::TextBlock> text_block;

    auto flush_step = [&]{
        if(!step_from) return;
        BlockParser bp(all.sub(*step_from, step_to - *step_from), input, events, ext);
        ast::StepBlock sb;
        sb.span = bp.span();
        sb.items = parse_step(bp);
        blocks.emplace_back(std::move(sb));
        step_from.reset();
    };
    auto flush_text = [&]{
        if(!text_block) return;
        blocks.emplace_back(std::move(*text_block));
        text_block.reset();
    };

    size_t line_start = 0;
    while(line_start < all.size()){
        size_t line_end = line_start;
        while(line_end < all.size() && all[line_end].kind != TokenKind::Newline) ++line_end;
        TokenSlice line = all.sub(line_start, line_end - line_start);
        LineKind kind = classify(line, ext);
        if(debug_parse_enabled()) std::fprintf(stderr, "[dbg][blocks] line at %zu kind=%d\n", line.empty() ? 0 : line.front().span.start, static_cast<int>(kind));

        if(kind != LineKind::Step) flush_step();
        if(kind != LineKind::Text) flush_text();

        BlockParser bp(line, input, events, ext);
        switch(kind){
            case LineKind::Blank: break;
            case LineKind::Metadata: blocks.emplace_back(parse_metadata(bp)); break;
            case LineKind::Section: blocks.emplace_back(parse_section(bp)); break;
            case LineKind::Text: {
                ast::Text t = text_line(bp);
                if(!text_block){
                    text_block = ast::TextBlock{t, bp.span()};
                } else {
                    if(!t.value.empty()){
                        if(!text_block->text.value.empty()) text_block->text.value += ' ';
                        text_block->text.value += t.value;
                    }
                    text_block->span = text_block->span.merge(bp.span());
                    text_block->text.span = text_block->text.span.merge(t.span);
                }
                break;
            }
            case LineKind::Step:
                if(!step_from) step_from = line_start;
                step_to = line_end;
                break;
        }
        line_start = line_end + 1;
    }
    flush_step();
    flush_text();
    if(debug_parse_enabled()) std::fprintf(stderr, "[dbg][blocks] %zu blocks\n", blocks.size());
    return blocks;
}

} // namespace cook
