// JSON output of the recipe model (tagged unions carry a "type" field)
#pragma once
#include <string>
#include "cook/recipe.hpp"

namespace cook {

std::string number_to_json(const Number& n);
std::string value_to_json(const Value& v);
std::string recipe_to_json(const ScalableRecipe& r);
std::string recipe_to_json(const ScaledRecipe& r);

} // namespace cook
