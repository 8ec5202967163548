// One way transform from a scalable recipe to a scaled one
#pragma once
#include <cstdint>
#include "cook/recipe.hpp"

namespace cook {

// Base is the first declared serving (1 if none declared); index is the
// position of `servings` among the declared ones.
ScaleTarget scale_target(const ScalableRecipe& recipe, uint32_t servings);

ScaledRecipe scale(ScalableRecipe recipe, const ScaleTarget& target);
ScaledRecipe scale_to_servings(ScalableRecipe recipe, uint32_t servings);
// First tier, factor 1.
ScaledRecipe default_scale(ScalableRecipe recipe);

// A recipe can only be scaled once.
ScaledRecipe scale(ScaledRecipe recipe, const ScaleTarget& target) = delete;
ScaledRecipe default_scale(ScaledRecipe recipe) = delete;

// Resolves one scalable value. `linear` tells whether the value may be multiplied.
Value scale_value(const ScalableValue& v, const ScaleTarget& target, bool linear, ScaleOutcome& outcome);

// Converts every ingredient, timer and inline quantity with a known unit to
// the best unit of `system`. Returns the failures; those quantities are left as they were.
std::vector<convert_error> convert_recipe(ScaledRecipe& recipe, System system, const Converter& conv);

} // namespace cook
