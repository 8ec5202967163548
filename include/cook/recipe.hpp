// Recipe document model: flat component arenas addressed by index
#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "cook/quantity.hpp"
#include "cook/group.hpp"

namespace cook {

class Metadata {
public:
    // Later entries with the same key replace the value but keep the first position.
    void set(std::string key, std::string value);
    const std::string* get(const std::string& key) const;
    const std::vector<std::pair<std::string, std::string>>& entries() const { return entries_; }
    bool empty() const { return entries_.empty(); }
    // "servings: 2|4|6". nullopt if missing or not a '|' list of positive integers.
    std::optional<std::vector<uint32_t>> servings() const;

    bool operator==(const Metadata& o) const { return entries_ == o.entries_; }

private:
    std::vector<std::pair<std::string, std::string>> entries_;
};

enum class Modifiers : uint8_t {
    None = 0,
    Recipe = 1u << 0, // '@' the ingredient is another recipe
    Ref = 1u << 1,    // '&'
    Hidden = 1u << 2, // '-'
    Opt = 1u << 3,    // '?'
    New = 1u << 4     // '+'
};
inline Modifiers operator|(Modifiers a, Modifiers b) { return static_cast<Modifiers>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b)); }
inline Modifiers operator&(Modifiers a, Modifiers b) { return static_cast<Modifiers>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b)); }
inline Modifiers& operator|=(Modifiers& a, Modifiers b) { a = a | b; return a; }
inline bool has_modifier(Modifiers set, Modifiers m) { return (set & m) != Modifiers::None; }

class ComponentRelation {
public:
    struct Definition {
        std::vector<size_t> referenced_from; // indices of references, same collection
        bool defined_in_step = true;
        bool operator==(const Definition& o) const { return referenced_from == o.referenced_from && defined_in_step == o.defined_in_step; }
    };
    struct Reference {
        size_t references_to = 0;
        bool operator==(const Reference& o) const { return references_to == o.references_to; }
    };

    static ComponentRelation definition(std::vector<size_t> referenced_from = {}, bool defined_in_step = true){ return ComponentRelation{Definition{std::move(referenced_from), defined_in_step}}; }
    static ComponentRelation reference(size_t references_to){ return ComponentRelation{Reference{references_to}}; }

    // Empty for references.
    const std::vector<size_t>& referenced_from() const;
    std::vector<size_t>* referenced_from_mut(){ auto d = std::get_if<Definition>(&data_); return d ? &d->referenced_from : nullptr; }
    std::optional<size_t> references_to() const;
    bool is_reference() const { return std::holds_alternative<Reference>(data_); }
    bool is_definition() const { return std::holds_alternative<Definition>(data_); }
    // nullopt for references
    std::optional<bool> is_defined_in_step() const;
    const std::variant<Definition, Reference>& data() const { return data_; }

    bool operator==(const ComponentRelation& o) const { return data_ == o.data_; }

private:
    explicit ComponentRelation(std::variant<Definition, Reference> d) : data_(std::move(d)) {}
    std::variant<Definition, Reference> data_;
};

enum class IngredientReferenceTarget {
    Ingredient, // Recipe::ingredients
    Step,       // Section::content of the ingredient's own section; always a step
    Section     // Recipe::sections
};
const char* reference_target_name(IngredientReferenceTarget t);

// ComponentRelation that may also point at steps and sections. The target is
// set exactly when the relation is a reference.
class IngredientRelation {
public:
    static IngredientRelation definition(std::vector<size_t> referenced_from = {}, bool defined_in_step = true){
        return IngredientRelation{ComponentRelation::definition(std::move(referenced_from), defined_in_step), std::nullopt};
    }
    static IngredientRelation reference(size_t references_to, IngredientReferenceTarget target){
        return IngredientRelation{ComponentRelation::reference(references_to), target};
    }

    const ComponentRelation& relation() const { return relation_; }
    const std::vector<size_t>& referenced_from() const { return relation_.referenced_from(); }
    std::vector<size_t>* referenced_from_mut(){ return relation_.referenced_from_mut(); }
    std::optional<std::pair<size_t, IngredientReferenceTarget>> references_to() const;
    std::optional<IngredientReferenceTarget> reference_target() const { return target_; }
    bool is_regular_reference() const { return target_ == IngredientReferenceTarget::Ingredient; }
    bool is_intermediate_reference() const { return target_ && *target_ != IngredientReferenceTarget::Ingredient; }
    bool is_definition() const { return relation_.is_definition(); }
    std::optional<bool> is_defined_in_step() const { return relation_.is_defined_in_step(); }

    bool operator==(const IngredientRelation& o) const { return relation_ == o.relation_ && target_ == o.target_; }

private:
    IngredientRelation(ComponentRelation r, std::optional<IngredientReferenceTarget> t) : relation_(std::move(r)), target_(t) {}
    ComponentRelation relation_;
    std::optional<IngredientReferenceTarget> target_;
};

template <typename V>
struct Ingredient {
    std::string name; // may be a path when it references another recipe
    std::optional<std::string> alias;
    std::optional<Quantity<V>> quantity;
    std::optional<std::string> note;
    IngredientRelation relation = IngredientRelation::definition();
    Modifiers modifiers = Modifiers::None;

    // Alias, else the file stem for recipe references, else the name.
    std::string display_name() const;

    bool operator==(const Ingredient& o) const {
        return name == o.name && alias == o.alias && quantity == o.quantity && note == o.note && relation == o.relation && modifiers == o.modifiers;
    }
};

template <typename V>
struct Cookware {
    std::string name;
    std::optional<std::string> alias;
    std::optional<V> quantity; // amount only, never a unit
    std::optional<std::string> note;
    ComponentRelation relation = ComponentRelation::definition();
    Modifiers modifiers = Modifiers::None;

    const std::string& display_name() const { return alias ? *alias : name; }

    bool operator==(const Cookware& o) const {
        return name == o.name && alias == o.alias && quantity == o.quantity && note == o.note && relation == o.relation && modifiers == o.modifiers;
    }
};

// At least one of the fields is set when created by the parser.
template <typename V>
struct Timer {
    std::optional<std::string> name;
    std::optional<Quantity<V>> quantity;

    bool operator==(const Timer& o) const { return name == o.name && quantity == o.quantity; }
};

// Step item. Except for Text, the index addresses the matching vector in Recipe.
struct Item {
    enum class Kind { Text, Ingredient, Cookware, Timer, InlineQuantity };
    struct Text { std::string value; bool operator==(const Text& o) const { return value == o.value; } };
    struct Ref { Kind kind; size_t index; bool operator==(const Ref& o) const { return kind == o.kind && index == o.index; } };

    std::variant<Text, Ref> data;

    static Item text(std::string t){ return Item{Text{std::move(t)}}; }
    static Item ingredient(size_t i){ return Item{Ref{Kind::Ingredient, i}}; }
    static Item cookware(size_t i){ return Item{Ref{Kind::Cookware, i}}; }
    static Item timer(size_t i){ return Item{Ref{Kind::Timer, i}}; }
    static Item inline_quantity(size_t i){ return Item{Ref{Kind::InlineQuantity, i}}; }

    Kind kind() const { auto r = std::get_if<Ref>(&data); return r ? r->kind : Kind::Text; }
    const std::string* as_text() const { auto t = std::get_if<Text>(&data); return t ? &t->value : nullptr; }
    std::optional<size_t> index() const { auto r = std::get_if<Ref>(&data); return r ? std::optional<size_t>(r->index) : std::nullopt; }

    bool operator==(const Item& o) const { return data == o.data; }
};
const char* item_kind_name(Item::Kind k);

struct Step {
    std::vector<Item> items;
    // 1-based, counts only steps inside the section
    uint32_t number = 0;
    bool operator==(const Step& o) const { return items == o.items && number == o.number; }
};

class Content {
public:
    static Content step(Step s){ return Content{std::move(s)}; }
    static Content text(std::string t){ return Content{std::move(t)}; }

    bool is_step() const { return std::holds_alternative<Step>(data_); }
    bool is_text() const { return std::holds_alternative<std::string>(data_); }
    const Step* as_step() const { return std::get_if<Step>(&data_); }
    Step* as_step() { return std::get_if<Step>(&data_); }
    const std::string* as_text() const { return std::get_if<std::string>(&data_); }
    // Throwing accessors for callers that already checked the kind.
    const Step& step() const { if(auto s = as_step()) return *s; throw std::invalid_argument("content is text"); }
    const std::string& text() const { if(auto t = as_text()) return *t; throw std::invalid_argument("content is step"); }

    bool operator==(const Content& o) const { return data_ == o.data_; }

private:
    explicit Content(Step s) : data_(std::move(s)) {}
    explicit Content(std::string t) : data_(std::move(t)) {}
    std::variant<Step, std::string> data_;
};

struct Section {
    std::optional<std::string> name;
    std::vector<Content> content;

    // No name and no content.
    bool is_empty() const { return !name && content.empty(); }
    bool operator==(const Section& o) const { return name == o.name && content == o.content; }
};

// Scale state markers
struct Unscaled {
    bool operator==(const Unscaled&) const { return true; }
};

struct ScaleTarget {
    double base = 1.0;               // servings the recipe is written for
    double target = 1.0;             // requested servings
    std::optional<size_t> index;     // tier of `target` in the declared servings
    double factor() const { return base == 0.0 ? 1.0 : target / base; }
    bool operator==(const ScaleTarget& o) const { return base == o.base && target == o.target && index == o.index; }
};

enum class ScaleOutcome {
    Scaled,       // value was multiplied or chosen from the servings tiers
    Fixed,        // value does not scale
    NoQuantity,
    TextValue,    // auto scaled text value, left unscaled
    InvalidTarget // no value for the requested tier, first value used
};
const char* scale_outcome_name(ScaleOutcome o);

struct Scaled {
    enum class Kind { Default, Target };
    Kind kind = Kind::Default;
    ScaleTarget target;
    std::vector<ScaleOutcome> ingredients;
    std::vector<ScaleOutcome> cookware;
    std::vector<ScaleOutcome> timers;
    bool operator==(const Scaled& o) const {
        return kind == o.kind && target == o.target && ingredients == o.ingredients && cookware == o.cookware && timers == o.timers;
    }
};

template <typename D, typename V>
struct Recipe {
    Metadata metadata;
    // Always at least one section when produced by the parser
    std::vector<Section> sections;
    std::vector<Ingredient<V>> ingredients;
    std::vector<Cookware<V>> cookware;
    std::vector<Timer<V>> timers;
    std::vector<ScaledQuantity> inline_quantities;
    D data;

    bool operator==(const Recipe& o) const {
        return metadata == o.metadata && sections == o.sections && ingredients == o.ingredients && cookware == o.cookware
            && timers == o.timers && inline_quantities == o.inline_quantities && data == o.data;
    }
};

// Before scaling. Only this kind can be scaled.
using ScalableRecipe = Recipe<Unscaled, ScalableValue>;
// After scaling. Only this kind can be converted or grouped.
using ScaledRecipe = Recipe<Scaled, Value>;

std::string display_name_of(const std::string& name, const std::optional<std::string>& alias, Modifiers modifiers);

template <typename V>
std::string Ingredient<V>::display_name() const { return display_name_of(name, alias, modifiers); }

// Own quantity followed by the quantities of every reference to it.
std::vector<const ScaledQuantity*> all_quantities(const Ingredient<Value>& ing, const std::vector<Ingredient<Value>>& all);
// Everything added into one quantity and fitted. Throws quantity_add_error.
std::optional<ScaledQuantity> total_quantity(const Ingredient<Value>& ing, const std::vector<Ingredient<Value>>& all, const Converter& conv);
GroupedQuantity group_quantities(const Ingredient<Value>& ing, const std::vector<Ingredient<Value>>& all, const Converter& conv);

std::vector<const Value*> all_amounts(const Cookware<Value>& cw, const std::vector<Cookware<Value>>& all);
// Numeric sum first (if any), then the text amounts in order.
std::vector<Value> group_amounts(const Cookware<Value>& cw, const std::vector<Cookware<Value>>& all);

} // namespace cook
