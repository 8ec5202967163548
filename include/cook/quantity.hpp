// Parsed quantity values: exact fractions, floats, ranges and free text
#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#include "cook/span.hpp"

namespace cook {

class Converter;

struct Fraction {
    uint32_t whole = 0;
    uint32_t num = 0;
    uint32_t den = 1;
    // Signed difference between the exact value and whole + num/den. Only
    // arithmetic that has to approximate sets it; parsing leaves 0.
    double err = 0.0;

    bool operator==(const Fraction& o) const { return whole==o.whole && num==o.num && den==o.den && err==o.err; }
};

class Number {
public:
    Number() : data_(0.0) {}
    Number(double v) : data_(v) {} // NOLINT: regular numbers convert implicitly

    static Number regular(double v) { return Number(v); }
    // Throws std::invalid_argument for den == 0.
    static Number fraction(uint32_t whole, uint32_t num, uint32_t den, double err = 0.0);

    bool is_regular() const { return std::holds_alternative<double>(data_); }
    bool is_fraction() const { return std::holds_alternative<Fraction>(data_); }
    const double* as_regular() const { return std::get_if<double>(&data_); }
    const Fraction* as_fraction() const { return std::get_if<Fraction>(&data_); }
    const std::variant<double, Fraction>& data() const { return data_; }

    double value() const;
    Number add(const Number& o) const;
    Number scale(double factor) const;
    std::string to_string() const;

    bool operator==(const Number& o) const { return data_ == o.data_; }
    bool operator!=(const Number& o) const { return !(*this == o); }

private:
    std::variant<double, Fraction> data_;
};

// Closest fraction with a small denominator, or a regular number if none is within 5%.
Number approx_number(double v);

struct Range {
    Number start;
    Number end;
    bool operator==(const Range& o) const { return start == o.start && end == o.end; }
};

struct quantity_add_error : std::runtime_error {
    enum class Kind { IncompatibleUnits, TextValue, Convert };
    Kind kind;
    quantity_add_error(Kind k, const std::string& what) : std::runtime_error(what), kind(k) {}
};

class Value {
public:
    using Data = std::variant<Number, Range, std::string>;

    Value() : data_(Number{}) {}
    Value(Number n) : data_(std::move(n)) {}          // NOLINT
    Value(double v) : data_(Number(v)) {}             // NOLINT
    Value(Range r) : data_(std::move(r)) {}           // NOLINT
    Value(std::string text) : data_(std::move(text)) {} // NOLINT

    static Value text(std::string t) { return Value(std::move(t)); }
    static Value range(Number a, Number b) { return Value(Range{std::move(a), std::move(b)}); }

    bool is_number() const { return std::holds_alternative<Number>(data_); }
    bool is_range() const { return std::holds_alternative<Range>(data_); }
    bool is_text() const { return std::holds_alternative<std::string>(data_); }
    const Number* as_number() const { return std::get_if<Number>(&data_); }
    const Range* as_range() const { return std::get_if<Range>(&data_); }
    const std::string* as_text() const { return std::get_if<std::string>(&data_); }
    const Data& data() const { return data_; }

    // Numeric addition; throws quantity_add_error(TextValue) when either side is text.
    Value try_add(const Value& o) const;
    // Multiplies numbers and both range ends; text is returned unchanged.
    Value scale(double factor) const;
    // Applies f to every number (range ends included). Text passes through.
    template <typename F> Value map_numbers(F&& f) const;
    std::string to_string() const;

    // Value substituted where a malformed value was reported.
    static Value recover() { return Value(1.0); }

    bool operator==(const Value& o) const { return data_ == o.data_; }
    bool operator!=(const Value& o) const { return !(*this == o); }

private:
    Data data_;
};

template <typename F> Value Value::map_numbers(F&& f) const {
    if(auto n = as_number()) return Value(f(*n));
    if(auto r = as_range()) return Value(Range{f(r->start), f(r->end)});
    return *this;
}

// Value of a quantity before scaling: one value (optionally marked for
// linear scaling with '*') or one value per servings tier.
struct QuantityValue {
    struct Single {
        Located<Value> value;
        std::optional<Span> auto_scale;
        bool operator==(const Single& o) const { return value == o.value && auto_scale == o.auto_scale; }
    };
    struct Many {
        std::vector<Located<Value>> values;
        bool operator==(const Many& o) const { return values == o.values; }
    };

    std::variant<Single, Many> data;

    static QuantityValue single(Located<Value> v, std::optional<Span> auto_scale = std::nullopt){ return QuantityValue{Single{std::move(v), auto_scale}}; }
    static QuantityValue many(std::vector<Located<Value>> vs){ return QuantityValue{Many{std::move(vs)}}; }

    const Single* as_single() const { return std::get_if<Single>(&data); }
    Single* as_single() { return std::get_if<Single>(&data); }
    const Many* as_many() const { return std::get_if<Many>(&data); }
    bool has_auto_scale() const { auto s = as_single(); return s && s->auto_scale.has_value(); }
    // Text if any of the alternatives is text.
    bool is_text() const;
    size_t value_count() const { auto m = as_many(); return m ? m->values.size() : 1; }

    bool operator==(const QuantityValue& o) const { return data == o.data; }
};

using ScalableValue = QuantityValue;

template <typename V>
struct Quantity {
    V value;
    std::optional<std::string> unit;

    bool operator==(const Quantity& o) const { return value == o.value && unit == o.unit; }
    bool operator!=(const Quantity& o) const { return !(*this == o); }
};

using ScalableQuantity = Quantity<ScalableValue>;
using ScaledQuantity = Quantity<Value>;

// Unit aware addition. Units must match or be convertible with `conv`;
// the result keeps the unit of `a`. Throws quantity_add_error.
ScaledQuantity try_add(const ScaledQuantity& a, const ScaledQuantity& b, const Converter& conv);

std::string to_string(const ScaledQuantity& q);

} // namespace cook
