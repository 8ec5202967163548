// Recipe parser entry point: tokens -> blocks -> model
#pragma once
#include <string_view>
#include "cook/analysis.hpp"
#include "cook/convert.hpp"
#include "cook/diagnostics.hpp"
#include "cook/extensions.hpp"
#include "cook/recipe.hpp"
#include "cook/scale.hpp"

namespace cook {

struct ParseResult {
    bool success = false;  // no errors (warnings allowed)
    ScalableRecipe recipe; // best effort even when success is false
    DiagnosticReport report;
};

class RecipeParser {
public:
    explicit RecipeParser(Extensions ext = Extensions::All, Converter conv = Converter::bundled())
        : conv_(std::move(conv)) { opts_.extensions = ext; }
    // Extensions and suggestion gating from COOK_* environment variables.
    static RecipeParser from_env(Converter conv = Converter::bundled());

    ParseResult parse(std::string_view src) const;

    const Converter& converter() const { return conv_; }
    Extensions extensions() const { return opts_.extensions; }

private:
    Converter conv_;
    AnalysisOptions opts_;
    bool diag_json_ = false;
};

} // namespace cook
