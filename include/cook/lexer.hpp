// PEGTL driven tokenizer for recipe source text
#pragma once
#include <string_view>
#include <vector>
#include "cook/token.hpp"

namespace cook {

// Every input byte lands in exactly one token; the result always ends with Eof.
std::vector<Token> tokenize(std::string_view src);

} // namespace cook
