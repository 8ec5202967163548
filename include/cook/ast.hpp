// Syntax tree of one recipe as produced by the block parsers
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "cook/quantity.hpp"
#include "cook/recipe.hpp"
#include "cook/span.hpp"

namespace cook::ast {

// Source text with comments removed and escapes resolved.
struct Text {
    std::string value;
    Span span;

    std::string trimmed() const;
    bool is_text_empty() const { return trimmed().empty(); }
    bool operator==(const Text& o) const { return value == o.value && span == o.span; }
};

struct Quantity {
    QuantityValue value;
    std::optional<Text> unit;
    bool operator==(const Quantity& o) const { return value == o.value && unit == o.unit; }
};

// "(N)", "(~N)" or "(=N)" after an ingredient's '&' modifier
struct IntermediateRef {
    enum class Kind { Step, RelativeStep, Section };
    Kind kind = Kind::Step;
    uint32_t value = 0;
    Span span;
};

struct Component {
    enum class Kind { Ingredient, Cookware, Timer };
    Kind kind = Kind::Ingredient;
    Modifiers modifiers = Modifiers::None;
    std::optional<Span> modifiers_span;
    std::optional<IntermediateRef> intermediate;
    std::optional<Text> name;
    std::optional<Text> alias;
    std::optional<Located<Quantity>> quantity;
    std::optional<Span> unit_separator;
    std::optional<Text> note;
    Span span;
};

using StepItem = std::variant<Text, Component>;

struct MetadataBlock { Text key; Text value; Span span; };
struct SectionBlock { std::optional<Text> name; Span span; };
struct StepBlock { std::vector<StepItem> items; Span span; };
struct TextBlock { Text text; Span span; };

using Block = std::variant<MetadataBlock, SectionBlock, StepBlock, TextBlock>;

} // namespace cook::ast
