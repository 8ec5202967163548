#include "cook/recipe.hpp"
#include <cctype>
#include <cstdlib>

namespace cook {

void Metadata::set(std::string key, std::string value){
    for(auto& e : entries_){
        if(e.first == key){ e.second = std::move(value); return; }
    }
    entries_.emplace_back(std::move(key), std::move(value));
}

const std::string* Metadata::get(const std::string& key) const {
    for(const auto& e : entries_) if(e.first == key) return &e.second;
    return nullptr;
}

std::optional<std::vector<uint32_t>> Metadata::servings() const {
    const std::string* raw = get("servings");
    if(!raw) return std::nullopt;
    std::vector<uint32_t> out;
    size_t pos = 0;
    while(pos <= raw->size()){
        size_t bar = raw->find('|', pos);
        if(bar == std::string::npos) bar = raw->size();
        size_t b = pos, e = bar;
        while(b < e && std::isspace(static_cast<unsigned char>((*raw)[b]))) ++b;
        while(e > b && std::isspace(static_cast<unsigned char>((*raw)[e-1]))) --e;
        if(b == e) return std::nullopt;
        unsigned long v = 0;
        for(size_t i = b; i < e; ++i){
            char c = (*raw)[i];
            if(c < '0' || c > '9') return std::nullopt;
            v = v * 10 + static_cast<unsigned long>(c - '0');
            if(v > 0xffffffffull) return std::nullopt;
        }
        if(v == 0) return std::nullopt;
        out.push_back(static_cast<uint32_t>(v));
        pos = bar + 1;
    }
    return out;
}

const std::vector<size_t>& ComponentRelation::referenced_from() const {
    static const std::vector<size_t> none;
    auto d = std::get_if<Definition>(&data_);
    return d ? d->referenced_from : none;
}

std::optional<size_t> ComponentRelation::references_to() const {
    if(auto r = std::get_if<Reference>(&data_)) return r->references_to;
    return std::nullopt;
}

std::optional<bool> ComponentRelation::is_defined_in_step() const {
    if(auto d = std::get_if<Definition>(&data_)) return d->defined_in_step;
    return std::nullopt;
}

std::optional<std::pair<size_t, IngredientReferenceTarget>> IngredientRelation::references_to() const {
    auto idx = relation_.references_to();
    if(!idx || !target_) return std::nullopt;
    return std::make_pair(*idx, *target_);
}

const char* reference_target_name(IngredientReferenceTarget t){
    switch(t){
        case IngredientReferenceTarget::Ingredient: return "ingredient";
        case IngredientReferenceTarget::Step: return "step";
        case IngredientReferenceTarget::Section: return "section";
    }
    return "?";
}

const char* item_kind_name(Item::Kind k){
    switch(k){
        case Item::Kind::Text: return "text";
        case Item::Kind::Ingredient: return "ingredient";
        case Item::Kind::Cookware: return "cookware";
        case Item::Kind::Timer: return "timer";
        case Item::Kind::InlineQuantity: return "inlineQuantity";
    }
    return "?";
}

const char* scale_outcome_name(ScaleOutcome o){
    switch(o){
        case ScaleOutcome::Scaled: return "scaled";
        case ScaleOutcome::Fixed: return "fixed";
        case ScaleOutcome::NoQuantity: return "noQuantity";
        case ScaleOutcome::TextValue: return "textValue";
        case ScaleOutcome::InvalidTarget: return "invalidTarget";
    }
    return "?";
}

std::string display_name_of(const std::string& name, const std::optional<std::string>& alias, Modifiers modifiers){
    if(alias) return *alias;
    if(has_modifier(modifiers, Modifiers::Recipe)){
        // "./sauces/Pesto.cook" -> "Pesto"
        size_t slash = name.find_last_of("/\\");
        std::string stem = slash == std::string::npos ? name : name.substr(slash + 1);
        size_t dot = stem.rfind('.');
        if(dot != std::string::npos && dot > 0) stem.erase(dot);
        if(!stem.empty()) return stem;
    }
    return name;
}

std::vector<const ScaledQuantity*> all_quantities(const Ingredient<Value>& ing, const std::vector<Ingredient<Value>>& all){
    std::vector<const ScaledQuantity*> out;
    if(ing.quantity) out.push_back(&*ing.quantity);
    for(size_t idx : ing.relation.referenced_from()){
        const auto& r = all.at(idx);
        if(r.quantity) out.push_back(&*r.quantity);
    }
    return out;
}

std::optional<ScaledQuantity> total_quantity(const Ingredient<Value>& ing, const std::vector<Ingredient<Value>>& all, const Converter& conv){
    auto qs = all_quantities(ing, all);
    if(qs.empty()) return std::nullopt;
    ScaledQuantity total = *qs.front();
    for(size_t i = 1; i < qs.size(); ++i) total = try_add(total, *qs[i], conv);
    try {
        conv.fit(total);
    } catch(const convert_error& e){
        throw quantity_add_error(quantity_add_error::Kind::Convert, e.what());
    }
    return total;
}

GroupedQuantity group_quantities(const Ingredient<Value>& ing, const std::vector<Ingredient<Value>>& all, const Converter& conv){
    GroupedQuantity g;
    for(const ScaledQuantity* q : all_quantities(ing, all)) g.add(*q, conv);
    g.fit(conv);
    return g;
}

std::vector<const Value*> all_amounts(const Cookware<Value>& cw, const std::vector<Cookware<Value>>& all){
    std::vector<const Value*> out;
    if(cw.quantity) out.push_back(&*cw.quantity);
    for(size_t idx : cw.relation.referenced_from()){
        const auto& r = all.at(idx);
        if(r.quantity) out.push_back(&*r.quantity);
    }
    return out;
}

std::vector<Value> group_amounts(const Cookware<Value>& cw, const std::vector<Cookware<Value>>& all){
    std::optional<Value> sum;
    std::vector<Value> text;
    for(const Value* v : all_amounts(cw, all)){
        if(v->is_text()){ text.push_back(*v); continue; }
        sum = sum ? sum->try_add(*v) : *v;
    }
    std::vector<Value> out;
    if(sum) out.push_back(std::move(*sum));
    out.insert(out.end(), text.begin(), text.end());
    return out;
}

} // namespace cook
