#include "cook/recipe_json.hpp"
#include <cmath>
#include <cstdio>
#include <sstream>
#include "cook/diagnostics_json.hpp"

namespace cook {

namespace {

std::string num(double v){
    if(!std::isfinite(v)) return "null";
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%.10g", v);
    return buf;
}

std::string opt_str(const std::optional<std::string>& s){ return s ? json_escape(*s) : "null"; }

std::string value_json(const QuantityValue& v){
    if(auto s = v.as_single())
        return "{\"type\":\"single\",\"value\":" + value_to_json(s->value.value) + ",\"auto_scale\":" + (s->auto_scale ? "true" : "false") + "}";
    std::string out = "{\"type\":\"many\",\"value\":[";
    const auto& vs = v.as_many()->values;
    for(size_t i=0;i<vs.size();++i){ if(i) out += ","; out += value_to_json(vs[i].value); }
    return out + "]}";
}
std::string value_json(const Value& v){ return value_to_json(v); }

template <typename V>
std::string quantity_json(const std::optional<Quantity<V>>& q){
    if(!q) return "null";
    return "{\"value\":" + value_json(q->value) + ",\"unit\":" + opt_str(q->unit) + "}";
}

std::string indices_json(const std::vector<size_t>& xs){
    std::string out = "[";
    for(size_t i=0;i<xs.size();++i){ if(i) out += ","; out += std::to_string(xs[i]); }
    return out + "]";
}

std::string relation_json(const ComponentRelation& r, std::optional<IngredientReferenceTarget> target){
    if(auto to = r.references_to()){
        std::string out = "{\"type\":\"reference\",\"references_to\":" + std::to_string(*to);
        if(target) out += std::string(",\"reference_target\":\"") + reference_target_name(*target) + "\"";
        return out + "}";
    }
    return "{\"type\":\"definition\",\"referenced_from\":" + indices_json(r.referenced_from())
        + ",\"defined_in_step\":" + (r.is_defined_in_step().value_or(true) ? "true" : "false") + "}";
}

std::string modifiers_json(Modifiers m){
    std::string out = "[";
    const std::pair<Modifiers, const char*> names[] = {
        {Modifiers::Recipe, "recipe"}, {Modifiers::Ref, "ref"}, {Modifiers::Hidden, "hidden"}, {Modifiers::Opt, "opt"}, {Modifiers::New, "new"}};
    bool first = true;
    for(const auto& [flag, name] : names){
        if(!has_modifier(m, flag)) continue;
        if(!first) out += ",";
        out += std::string("\"") + name + "\"";
        first = false;
    }
    return out + "]";
}

template <typename D, typename V>
void common_json(std::ostringstream& os, const Recipe<D, V>& r){
    os << "\"metadata\":{";
    for(size_t i=0;i<r.metadata.entries().size();++i){
        const auto& [k, v] = r.metadata.entries()[i];
        if(i) os << ",";
        os << json_escape(k) << ":" << json_escape(v);
    }
    os << "},\"sections\":[";
    for(size_t i=0;i<r.sections.size();++i){
        const Section& s = r.sections[i];
        if(i) os << ",";
        os << "{\"name\":" << opt_str(s.name) << ",\"content\":[";
        for(size_t j=0;j<s.content.size();++j){
            const Content& c = s.content[j];
            if(j) os << ",";
            if(auto t = c.as_text()){ os << "{\"type\":\"text\",\"value\":" << json_escape(*t) << "}"; continue; }
            const Step& st = c.step();
            os << "{\"type\":\"step\",\"value\":{\"items\":[";
            for(size_t k=0;k<st.items.size();++k){
                const Item& it = st.items[k];
                if(k) os << ",";
                os << "{\"type\":\"" << item_kind_name(it.kind()) << "\",";
                if(auto txt = it.as_text()) os << "\"value\":" << json_escape(*txt) << "}";
                else os << "\"index\":" << *it.index() << "}";
            }
            os << "],\"number\":" << st.number << "}}";
        }
        os << "]}";
    }
    os << "],\"ingredients\":[";
    for(size_t i=0;i<r.ingredients.size();++i){
        const auto& ing = r.ingredients[i];
        if(i) os << ",";
        os << "{\"name\":" << json_escape(ing.name) << ",\"alias\":" << opt_str(ing.alias)
           << ",\"quantity\":" << quantity_json(ing.quantity) << ",\"note\":" << opt_str(ing.note)
           << ",\"modifiers\":" << modifiers_json(ing.modifiers)
           << ",\"relation\":" << relation_json(ing.relation.relation(), ing.relation.reference_target()) << "}";
    }
    os << "],\"cookware\":[";
    for(size_t i=0;i<r.cookware.size();++i){
        const auto& cw = r.cookware[i];
        if(i) os << ",";
        os << "{\"name\":" << json_escape(cw.name) << ",\"alias\":" << opt_str(cw.alias)
           << ",\"quantity\":" << (cw.quantity ? value_json(*cw.quantity) : std::string("null"))
           << ",\"note\":" << opt_str(cw.note) << ",\"modifiers\":" << modifiers_json(cw.modifiers)
           << ",\"relation\":" << relation_json(cw.relation, std::nullopt) << "}";
    }
    os << "],\"timers\":[";
    for(size_t i=0;i<r.timers.size();++i){
        if(i) os << ",";
        os << "{\"name\":" << opt_str(r.timers[i].name) << ",\"quantity\":" << quantity_json(r.timers[i].quantity) << "}";
    }
    os << "],\"inline_quantities\":[";
    for(size_t i=0;i<r.inline_quantities.size();++i){
        if(i) os << ",";
        os << "{\"value\":" << value_to_json(r.inline_quantities[i].value) << ",\"unit\":" << opt_str(r.inline_quantities[i].unit) << "}";
    }
    os << "]";
}

std::string outcomes_json(const std::vector<ScaleOutcome>& xs){
    std::string out = "[";
    for(size_t i=0;i<xs.size();++i){ if(i) out += ","; out += std::string("\"") + scale_outcome_name(xs[i]) + "\""; }
    return out + "]";
}

} // namespace

std::string number_to_json(const Number& n){
    if(auto r = n.as_regular()) return "{\"type\":\"regular\",\"value\":" + num(*r) + "}";
    const Fraction& f = *n.as_fraction();
    return "{\"type\":\"fraction\",\"value\":{\"whole\":" + std::to_string(f.whole) + ",\"num\":" + std::to_string(f.num)
        + ",\"den\":" + std::to_string(f.den) + ",\"err\":" + num(f.err) + "}}";
}

std::string value_to_json(const Value& v){
    if(auto n = v.as_number()) return "{\"type\":\"number\",\"value\":" + number_to_json(*n) + "}";
    if(auto r = v.as_range())
        return "{\"type\":\"range\",\"value\":{\"start\":" + number_to_json(r->start) + ",\"end\":" + number_to_json(r->end) + "}}";
    return "{\"type\":\"text\",\"value\":" + json_escape(*v.as_text()) + "}";
}

std::string recipe_to_json(const ScalableRecipe& r){
    std::ostringstream os;
    os << "{";
    common_json(os, r);
    os << "}";
    return os.str();
}

std::string recipe_to_json(const ScaledRecipe& r){
    std::ostringstream os;
    os << "{";
    common_json(os, r);
    const Scaled& d = r.data;
    os << ",\"scale\":{\"kind\":\"" << (d.kind == Scaled::Kind::Default ? "default" : "target") << "\""
       << ",\"base\":" << num(d.target.base) << ",\"target\":" << num(d.target.target)
       << ",\"index\":" << (d.target.index ? std::to_string(*d.target.index) : std::string("null"))
       << ",\"ingredients\":" << outcomes_json(d.ingredients)
       << ",\"cookware\":" << outcomes_json(d.cookware)
       << ",\"timers\":" << outcomes_json(d.timers) << "}";
    os << "}";
    return os.str();
}

} // namespace cook
