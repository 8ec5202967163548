#include "cook/analysis.hpp"
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace cook {

namespace {

bool same_name(const std::string& a, const std::string& b){
    if(a.size() != b.size()) return false;
    for(size_t i = 0; i < a.size(); ++i)
        if(std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
    return true;
}

bool is_unit_char(unsigned char c){ return std::isalpha(c) || c >= 0x80; }

Span quantity_value_span(const QuantityValue& v){
    if(auto s = v.as_single()) return s->value.span;
    const auto& vs = v.as_many()->values;
    return vs.front().span.merge(vs.back().span);
}

class RecipeCollector {
public:
    RecipeCollector(std::string_view input, DiagnosticQueue& events, const Converter& conv, const AnalysisOptions& opts)
        : input_(input), events_(events), conv_(conv), opts_(opts) {
        recipe_.sections.emplace_back();
    }

    void block(const ast::Block& b){
        std::visit([this](const auto& blk){ this->visit(blk); }, b);
    }

    ScalableRecipe finish(){
        check_servings();
        if(debug_parse_enabled())
            std::fprintf(stderr, "[dbg][analysis] sections=%zu ingredients=%zu cookware=%zu timers=%zu inline=%zu\n",
                recipe_.sections.size(), recipe_.ingredients.size(), recipe_.cookware.size(), recipe_.timers.size(), recipe_.inline_quantities.size());
        return std::move(recipe_);
    }

private:
    struct ManyValues { Span span; size_t count; };

    std::string_view input_;
    DiagnosticQueue& events_;
    const Converter& conv_;
    const AnalysisOptions& opts_;
    ScalableRecipe recipe_;
    uint32_t step_counter_ = 0;
    std::optional<Span> servings_span_;
    std::vector<ManyValues> many_values_;

    bool ext(Extensions e) const { return has_extension(opts_.extensions, e); }
    Section& section(){ return recipe_.sections.back(); }

    void error(Diagnostic d){
        d.severity = Severity::Error;
        if(debug_parse_enabled()) std::fprintf(stderr, "[dbg][analysis] error %s: %s\n", d.code.c_str(), d.message.c_str());
        events_.push_back(std::move(d));
    }
    void warn(Diagnostic d){
        d.severity = Severity::Warning;
        events_.push_back(std::move(d));
    }

    void visit(const ast::MetadataBlock& m){
        if(m.key.value.empty()) return;
        if(recipe_.metadata.get(m.key.value))
            warn(make_warning("W0302", "Duplicate metadata key '" + m.key.value + "'", m.key.span, "this value replaces the earlier one"));
        recipe_.metadata.set(m.key.value, m.value.value);
        if(m.key.value == "servings"){
            servings_span_ = m.value.span;
            if(!recipe_.metadata.servings())
                error(make_error("E0403", "Invalid servings", m.value.span, "expected positive integers separated by '|'")
                    .hint("For example '>> servings: 2|4'"));
        }
    }

    void visit(const ast::SectionBlock& s){
        std::optional<std::string> name;
        if(s.name) name = s.name->value;
        if(section().is_empty()) section().name = std::move(name);
        else recipe_.sections.push_back(Section{std::move(name), {}});
        step_counter_ = 0;
    }

    void visit(const ast::TextBlock& t){
        section().content.push_back(Content::text(t.text.value));
    }

    void visit(const ast::StepBlock& sb){
        Step step;
        step.number = ++step_counter_;
        for(const auto& item : sb.items){
            if(auto t = std::get_if<ast::Text>(&item)) text_items(*t, step.items);
            else component(std::get<ast::Component>(item), step);
        }
        section().content.push_back(Content::step(std::move(step)));
    }

    // Splits out "<number> <temperature unit>" runs when inline quantities are enabled.
    void text_items(const ast::Text& t, std::vector<Item>& out){
        if(!ext(Extensions::InlineQuantities)){ out.push_back(Item::text(t.value)); return; }
        const std::string& s = t.value;
        size_t emitted = 0, i = 0;
        while(i < s.size()){
            unsigned char c = static_cast<unsigned char>(s[i]);
            bool boundary = i == 0 || (!is_unit_char(static_cast<unsigned char>(s[i-1])) && !std::isdigit(static_cast<unsigned char>(s[i-1])) && s[i-1] != '.');
            if(!std::isdigit(c) || !boundary){ ++i; continue; }
            size_t num_end = i;
            while(num_end < s.size() && std::isdigit(static_cast<unsigned char>(s[num_end]))) ++num_end;
            if(num_end + 1 < s.size() && s[num_end] == '.' && std::isdigit(static_cast<unsigned char>(s[num_end+1]))){
                ++num_end;
                while(num_end < s.size() && std::isdigit(static_cast<unsigned char>(s[num_end]))) ++num_end;
            }
            size_t unit_start = num_end;
            while(unit_start < s.size() && s[unit_start] == ' ') ++unit_start;
            size_t unit_end = unit_start;
            while(unit_end < s.size() && is_unit_char(static_cast<unsigned char>(s[unit_end]))) ++unit_end;
            std::string unit = s.substr(unit_start, unit_end - unit_start);
            if(unit.empty() || conv_.quantity_of(unit) != PhysicalQuantity::Temperature){ i = num_end; continue; }

            if(i > emitted) out.push_back(Item::text(s.substr(emitted, i - emitted)));
            double v = std::strtod(s.substr(i, num_end - i).c_str(), nullptr);
            recipe_.inline_quantities.push_back(ScaledQuantity{Value(v), unit});
            out.push_back(Item::inline_quantity(recipe_.inline_quantities.size() - 1));
            emitted = i = unit_end;
        }
        if(emitted < s.size()) out.push_back(Item::text(s.substr(emitted)));
    }

    std::optional<ScalableQuantity> quantity(const ast::Component& c){
        if(!c.quantity) return std::nullopt;
        const ast::Quantity& q = c.quantity->value;
        ScalableQuantity out{q.value, std::nullopt};
        if(q.unit && !q.unit->is_text_empty()) out.unit = q.unit->trimmed();
        if(auto m = out.value.as_many()) many_values_.push_back(ManyValues{quantity_value_span(out.value), m->values.size()});
        return out;
    }

    template <typename C>
    std::optional<size_t> find_definition(const std::vector<C>& all, const std::string& name) const {
        for(size_t i = 0; i < all.size(); ++i)
            if(all[i].relation.is_definition() && same_name(all[i].name, name)) return i;
        return std::nullopt;
    }

    template <typename C>
    void not_found(const std::vector<C>& all, const ast::Component& c, const char* what){
        Diagnostic d = make_error("E0209", std::string("Reference not found: ") + what + " '" + c.name->value + "'", c.name->span, "no earlier definition")
            .hint("A new definition was created; remove the '&' to define it here");
        std::vector<std::string> pool;
        for(const auto& x : all) if(x.relation.is_definition()) pool.push_back(x.name);
        append_suggestions(d, fuzzy_candidates(c.name->value, pool), opts_.suggest);
        error(std::move(d));
    }

    std::optional<std::pair<size_t, IngredientReferenceTarget>> intermediate_target(const ast::IntermediateRef& ref, uint32_t current_step){
        using K = ast::IntermediateRef::Kind;
        if(ref.kind == K::Section){
            size_t current = recipe_.sections.size();
            if(ref.value >= 1 && ref.value < current) return std::make_pair(static_cast<size_t>(ref.value - 1), IngredientReferenceTarget::Section);
            error(make_error("E0208", "Intermediate preparation target not found", ref.span,
                "section " + std::to_string(ref.value) + " is not an earlier section"));
            return std::nullopt;
        }
        uint32_t number = ref.kind == K::Step ? ref.value : (ref.value <= current_step ? current_step - ref.value : 0);
        if(number >= 1 && number < current_step){
            const auto& content = section().content;
            for(size_t i = 0; i < content.size(); ++i){
                const Step* s = content[i].as_step();
                if(s && s->number == number) return std::make_pair(i, IngredientReferenceTarget::Step);
            }
        }
        error(make_error("E0208", "Intermediate preparation target not found", ref.span,
            "no earlier step with this number in the section"));
        return std::nullopt;
    }

    void component(const ast::Component& c, Step& step){
        switch(c.kind){
            case ast::Component::Kind::Ingredient: ingredient(c, step); break;
            case ast::Component::Kind::Cookware: cookware(c, step); break;
            case ast::Component::Kind::Timer: timer(c, step); break;
        }
    }

    void ingredient(const ast::Component& c, Step& step){
        Ingredient<ScalableValue> ing;
        ing.name = c.name->value;
        if(c.alias) ing.alias = c.alias->value;
        if(c.note) ing.note = c.note->value;
        ing.modifiers = c.modifiers;
        ing.quantity = quantity(c);
        size_t idx = recipe_.ingredients.size();

        if(c.intermediate){
            if(auto t = intermediate_target(*c.intermediate, step.number))
                ing.relation = IngredientRelation::reference(t->first, t->second);
        } else if(has_modifier(c.modifiers, Modifiers::Ref)){
            if(auto def = find_definition(recipe_.ingredients, ing.name)){
                ing.relation = IngredientRelation::reference(*def, IngredientReferenceTarget::Ingredient);
                recipe_.ingredients[*def].relation.referenced_from_mut()->push_back(idx);
            } else {
                not_found(recipe_.ingredients, c, "ingredient");
            }
        } else if(!has_modifier(c.modifiers, Modifiers::New)){
            if(auto def = find_definition(recipe_.ingredients, ing.name)){
                ing.relation = IngredientRelation::reference(*def, IngredientReferenceTarget::Ingredient);
                recipe_.ingredients[*def].relation.referenced_from_mut()->push_back(idx);
            }
        }
        recipe_.ingredients.push_back(std::move(ing));
        step.items.push_back(Item::ingredient(idx));
    }

    void cookware(const ast::Component& c, Step& step){
        Cookware<ScalableValue> cw;
        cw.name = c.name->value;
        if(c.alias) cw.alias = c.alias->value;
        if(c.note) cw.note = c.note->value;
        cw.modifiers = c.modifiers;
        if(auto q = quantity(c)){
            if(q->unit){
                Span at = c.quantity->value.unit ? c.quantity->value.unit->span : c.quantity->span;
                Diagnostic d = make_error("E0207", "Cookware quantity can not have a unit", at, "remove this unit");
                if(c.unit_separator) d.label(*c.unit_separator);
                error(std::move(d));
            }
            cw.quantity = std::move(q->value);
        }
        size_t idx = recipe_.cookware.size();

        bool is_ref = has_modifier(c.modifiers, Modifiers::Ref);
        if(is_ref || !has_modifier(c.modifiers, Modifiers::New)){
            if(auto def = find_definition(recipe_.cookware, cw.name)){
                cw.relation = ComponentRelation::reference(*def);
                recipe_.cookware[*def].relation.referenced_from_mut()->push_back(idx);
            } else if(is_ref){
                not_found(recipe_.cookware, c, "cookware");
            }
        }
        recipe_.cookware.push_back(std::move(cw));
        step.items.push_back(Item::cookware(idx));
    }

    void timer(const ast::Component& c, Step& step){
        Timer<ScalableValue> t;
        if(c.name) t.name = c.name->value;
        t.quantity = quantity(c);

        if(!t.name && !t.quantity){
            error(make_error("E0210", "Timer needs a name or a quantity", c.span, "empty timer"));
            step.items.push_back(Item::text(std::string(input_.substr(c.span.start, c.span.len()))));
            return;
        }
        if(!t.quantity){
            if(ext(Extensions::TimerRequiresTime))
                error(make_error("E0211", "Timer missing quantity", c.span, "add a duration here").hint("For example '~{10%minutes}'"));
        } else {
            if(ext(Extensions::AdvancedUnits) && conv_.unit_count() > 0){
                if(!t.quantity->unit){
                    error(make_error("E0212", "Timer missing unit", c.quantity->span, "add a time unit"));
                } else if(conv_.quantity_of(*t.quantity->unit) != PhysicalQuantity::Time){
                    error(make_error("E0213", "Timer unit is not a time unit", c.quantity->value.unit->span, "expected a time unit"));
                }
            }
            if(auto s = t.quantity->value.as_single(); s && s->auto_scale){
                error(make_error("E0214", "Timers can not be auto scaled", *s->auto_scale, "remove this")
                    .hint("Timer durations do not depend on the servings"));
                s->auto_scale.reset();
            }
        }
        recipe_.timers.push_back(std::move(t));
        step.items.push_back(Item::timer(recipe_.timers.size() - 1));
    }

    void check_servings(){
        if(many_values_.empty()) return;
        auto servings = recipe_.metadata.servings();
        for(const auto& m : many_values_){
            if(!servings){
                if(recipe_.metadata.get("servings")) continue; // already reported as invalid
                error(make_error("E0401", "Many values without servings", m.span, "one value per serving")
                    .hint("Declare the servings, e.g. '>> servings: 2|4'"));
            } else if(servings->size() != m.count){
                Diagnostic d = make_error("E0402", "Expected " + std::to_string(servings->size()) + " values, found " + std::to_string(m.count),
                    m.span, "one value per serving");
                if(servings_span_) d.label(*servings_span_, "servings declared here");
                error(std::move(d));
            }
        }
    }
};

} // namespace

ScalableRecipe analyze(const std::vector<ast::Block>& blocks, std::string_view input, DiagnosticQueue& events,
                       const Converter& conv, const AnalysisOptions& opts){
    RecipeCollector rc(input, events, conv, opts);
    for(const auto& b : blocks) rc.block(b);
    return rc.finish();
}

} // namespace cook
