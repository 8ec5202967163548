#include "cook/scale.hpp"
#include <cstdio>
#include "cook/extensions.hpp"

namespace cook {

ScaleTarget scale_target(const ScalableRecipe& recipe, uint32_t servings){
    ScaleTarget t;
    t.target = servings;
    if(auto declared = recipe.metadata.servings()){
        t.base = declared->front();
        for(size_t i = 0; i < declared->size(); ++i){
            if((*declared)[i] == servings){ t.index = i; break; }
        }
    }
    return t;
}

Value scale_value(const ScalableValue& v, const ScaleTarget& target, bool linear, ScaleOutcome& outcome){
    if(auto s = v.as_single()){
        const Value& value = s->value.value;
        if(!s->auto_scale || !linear){ outcome = ScaleOutcome::Fixed; return value; }
        if(value.is_text()){ outcome = ScaleOutcome::TextValue; return value; }
        outcome = ScaleOutcome::Scaled;
        return value.scale(target.factor());
    }
    const auto& values = v.as_many()->values;
    if(target.index && *target.index < values.size()){
        outcome = ScaleOutcome::Scaled;
        return values[*target.index].value;
    }
    outcome = ScaleOutcome::InvalidTarget;
    return values.front().value;
}

namespace {

std::optional<ScaledQuantity> scale_quantity(const std::optional<ScalableQuantity>& q, const ScaleTarget& target, bool linear, ScaleOutcome& outcome){
    if(!q){ outcome = ScaleOutcome::NoQuantity; return std::nullopt; }
    return ScaledQuantity{scale_value(q->value, target, linear, outcome), q->unit};
}

ScaledRecipe scale_impl(ScalableRecipe recipe, const ScaleTarget& target, Scaled::Kind kind){
    ScaledRecipe out;
    out.metadata = std::move(recipe.metadata);
    out.sections = std::move(recipe.sections);
    out.inline_quantities = std::move(recipe.inline_quantities);
    out.data.kind = kind;
    out.data.target = target;

    for(auto& ing : recipe.ingredients){
        Ingredient<Value> s;
        s.name = std::move(ing.name);
        s.alias = std::move(ing.alias);
        s.note = std::move(ing.note);
        s.relation = std::move(ing.relation);
        s.modifiers = ing.modifiers;
        ScaleOutcome o = ScaleOutcome::NoQuantity;
        s.quantity = scale_quantity(ing.quantity, target, true, o);
        out.data.ingredients.push_back(o);
        out.ingredients.push_back(std::move(s));
    }
    for(auto& cw : recipe.cookware){
        Cookware<Value> s;
        s.name = std::move(cw.name);
        s.alias = std::move(cw.alias);
        s.note = std::move(cw.note);
        s.relation = std::move(cw.relation);
        s.modifiers = cw.modifiers;
        ScaleOutcome o = ScaleOutcome::NoQuantity;
        if(cw.quantity) s.quantity = scale_value(*cw.quantity, target, true, o);
        out.data.cookware.push_back(o);
        out.cookware.push_back(std::move(s));
    }
    for(auto& tm : recipe.timers){
        Timer<Value> s;
        s.name = std::move(tm.name);
        ScaleOutcome o = ScaleOutcome::NoQuantity;
        // durations are picked by tier, never multiplied
        s.quantity = scale_quantity(tm.quantity, target, false, o);
        out.data.timers.push_back(o);
        out.timers.push_back(std::move(s));
    }

    if(debug_parse_enabled())
        std::fprintf(stderr, "[dbg][scale] base=%g target=%g factor=%g\n", target.base, target.target, target.factor());
    return out;
}

} // namespace

ScaledRecipe scale(ScalableRecipe recipe, const ScaleTarget& target){
    bool declared = recipe.metadata.servings().has_value();
    ScaledRecipe out = scale_impl(std::move(recipe), target, Scaled::Kind::Target);
    if(declared){
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%g", target.target);
        out.metadata.set("servings", buf);
    }
    return out;
}

ScaledRecipe scale_to_servings(ScalableRecipe recipe, uint32_t servings){
    ScaleTarget t = scale_target(recipe, servings);
    return scale(std::move(recipe), t);
}

ScaledRecipe default_scale(ScalableRecipe recipe){
    ScaleTarget t;
    if(auto declared = recipe.metadata.servings()) t.base = t.target = declared->front();
    t.index = 0;
    return scale_impl(std::move(recipe), t, Scaled::Kind::Default);
}

std::vector<convert_error> convert_recipe(ScaledRecipe& recipe, System system, const Converter& conv){
    std::vector<convert_error> errors;
    auto convert_one = [&](ScaledQuantity& q){
        if(!q.unit || !conv.find_unit(*q.unit)) return;
        try {
            conv.convert_to_system(q, system);
        } catch(const convert_error& e){
            errors.push_back(e);
        }
    };
    for(auto& ing : recipe.ingredients) if(ing.quantity) convert_one(*ing.quantity);
    for(auto& t : recipe.timers) if(t.quantity) convert_one(*t.quantity);
    for(auto& q : recipe.inline_quantities) convert_one(q);
    return errors;
}

} // namespace cook
