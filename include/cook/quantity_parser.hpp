// Quantity sub-grammar: "value [| value ...] [*] [% unit]" and "value unit"
#pragma once
#include <optional>
#include "cook/ast.hpp"
#include "cook/block_parser.hpp"

namespace cook {

struct ParsedQuantity {
    Located<ast::Quantity> quantity;
    std::optional<Span> unit_separator; // the '%' when present
};

// `bp` only provides input, queue and extensions; no tokens of it are consumed.
// `tokens` is the content between '{' and '}' and must not be empty
// (std::invalid_argument otherwise).
ParsedQuantity parse_quantity(const BlockParser& bp, TokenSlice tokens);

} // namespace cook
