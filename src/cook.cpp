#include "cook/cook.hpp"
#include <cstdio>
#include "cook/diagnostics_json.hpp"
#include "cook/lexer.hpp"
#include "cook/parser.hpp"

namespace cook {

RecipeParser RecipeParser::from_env(Converter conv){
    CookEnv env = detect_env();
    RecipeParser p(env.extensions, std::move(conv));
    p.opts_.suggest = env.suggest;
    p.diag_json_ = env.diag_json;
    return p;
}

ParseResult RecipeParser::parse(std::string_view src) const {
    bool dbg = debug_parse_enabled();
    std::vector<Token> tokens = tokenize(src);
    if(dbg) std::fprintf(stderr, "[dbg][parse] %zu tokens\n", tokens.size());

    DiagnosticQueue events;
    std::vector<ast::Block> blocks = parse_blocks(src, tokens, events, opts_.extensions);
    if(dbg) std::fprintf(stderr, "[dbg][parse] %zu blocks, %zu diagnostics\n", blocks.size(), events.size());

    ParseResult r;
    r.recipe = analyze(blocks, src, events, conv_, opts_);
    r.report = DiagnosticReport::from_queue(events);
    r.success = !r.report.has_errors();
    if(dbg) std::fprintf(stderr, "[dbg][parse] errors=%zu warnings=%zu\n", r.report.errors.size(), r.report.warnings.size());
    if(diag_json_) std::fprintf(stderr, "%s\n", diagnostics_to_json(r.report, src).c_str());
    else maybe_print_json(r.report, src);
    return r;
}

} // namespace cook
