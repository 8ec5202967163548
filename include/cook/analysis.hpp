// Builds the recipe model from parsed blocks and resolves component relations
#pragma once
#include <string_view>
#include <vector>
#include "cook/ast.hpp"
#include "cook/convert.hpp"
#include "cook/diagnostics.hpp"
#include "cook/extensions.hpp"
#include "cook/recipe.hpp"

namespace cook {

struct AnalysisOptions {
    Extensions extensions = Extensions::All;
    bool suggest = true; // "did you mean" notes on unknown references
};

ScalableRecipe analyze(const std::vector<ast::Block>& blocks, std::string_view input, DiagnosticQueue& events,
                       const Converter& conv, const AnalysisOptions& opts);

} // namespace cook
