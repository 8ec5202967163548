// Line oriented block splitting and per-block parsers
#pragma once
#include <string_view>
#include <vector>
#include "cook/ast.hpp"
#include "cook/block_parser.hpp"

namespace cook {

// Splits the token stream into metadata, section, text and step blocks and
// parses each one. Never fails; problems are pushed to `events`.
std::vector<ast::Block> parse_blocks(std::string_view input, const std::vector<Token>& tokens, DiagnosticQueue& events, Extensions ext);

// Block level entry points, exposed for tests.
std::vector<ast::StepItem> parse_step(BlockParser& bp);
ast::MetadataBlock parse_metadata(BlockParser& bp);
ast::SectionBlock parse_section(BlockParser& bp);

} // namespace cook
