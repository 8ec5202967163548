#include "cook/quantity.hpp"
#include "cook/convert.hpp"
#include <cmath>
#include <cstdio>
#include <string>

namespace cook {

Number Number::fraction(uint32_t whole, uint32_t num, uint32_t den, double err){
    if(den == 0) throw std::invalid_argument("fraction with zero denominator");
    Number n;
    n.data_ = Fraction{whole, num, den, err};
    return n;
}

double Number::value() const {
    if(auto r = as_regular()) return *r;
    const Fraction& f = std::get<Fraction>(data_);
    return static_cast<double>(f.whole) + static_cast<double>(f.num) / static_cast<double>(f.den) + f.err;
}

Number approx_number(double v){
    static const uint32_t dens[] = {2, 3, 4, 8};
    if(!(v >= 0.0) || !std::isfinite(v) || v > 4294967295.0) return Number(v);
    double whole = std::floor(v);
    double rem = v - whole;
    bool found = false;
    uint32_t best_whole = 0, best_num = 0, best_den = 1;
    double best_diff = 0.0;
    for(uint32_t den : dens){
        double num = std::round(rem * den);
        double w = whole;
        if(num >= den){ num = 0; w += 1; }
        double diff = v - (w + num / den);
        if(!found || std::fabs(diff) < std::fabs(best_diff)){
            found = true; best_diff = diff;
            best_whole = static_cast<uint32_t>(w); best_num = static_cast<uint32_t>(num); best_den = den;
        }
    }
    if(v == 0.0 || std::fabs(best_diff) / v <= 0.05) return Number::fraction(best_whole, best_num, best_den, best_diff);
    return Number(v);
}

Number Number::add(const Number& o) const {
    auto a = as_fraction(); auto b = o.as_fraction();
    if(!a && !b) return Number(*as_regular() + *o.as_regular());
    if(a && b && a->den == b->den){
        uint64_t num = static_cast<uint64_t>(a->num) + b->num;
        uint64_t whole = static_cast<uint64_t>(a->whole) + b->whole + num / a->den;
        num %= a->den;
        if(whole <= 0xffffffffull)
            return Number::fraction(static_cast<uint32_t>(whole), static_cast<uint32_t>(num), a->den, a->err + b->err);
    }
    // Mixed or different denominators, or a whole part past u32: add as floats and re-approximate. The
    // operands' errors are already part of value() so they carry over.
    return approx_number(value() + o.value());
}

Number Number::scale(double factor) const {
    if(auto r = as_regular()) return Number(*r * factor);
    const Fraction& f = std::get<Fraction>(data_);
    double integral = 0.0;
    if(factor > 0.0 && std::modf(factor, &integral) == 0.0 && integral < 65536.0){
        uint64_t k = static_cast<uint64_t>(integral);
        uint64_t total = (static_cast<uint64_t>(f.whole) * f.den + f.num) * k;
        uint64_t whole = total / f.den;
        if(whole <= 0xffffffffull)
            return Number::fraction(static_cast<uint32_t>(whole), static_cast<uint32_t>(total % f.den), f.den, f.err * factor);
    }
    return Number(value() * factor);
}

static std::string format_float(double v){
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.3f", v);
    std::string s = buf;
    auto dot = s.find('.');
    if(dot != std::string::npos){
        while(!s.empty() && s.back() == '0') s.pop_back();
        if(!s.empty() && s.back() == '.') s.pop_back();
    }
    if(s == "-0") s = "0";
    return s;
}

std::string Number::to_string() const {
    if(auto r = as_regular()) return format_float(*r);
    const Fraction& f = std::get<Fraction>(data_);
    if(f.num == 0) return std::to_string(f.whole);
    std::string frac = std::to_string(f.num) + "/" + std::to_string(f.den);
    if(f.whole == 0) return frac;
    return std::to_string(f.whole) + " " + frac;
}

Value Value::try_add(const Value& o) const {
    if(is_text() || o.is_text()) throw quantity_add_error(quantity_add_error::Kind::TextValue, "text values can not be added");
    auto an = as_number(); auto bn = o.as_number();
    if(an && bn) return Value(an->add(*bn));
    auto ar = as_range(); auto br = o.as_range();
    if(ar && br) return Value(Range{ar->start.add(br->start), ar->end.add(br->end)});
    const Number& n = an ? *an : *bn;
    const Range& r = ar ? *ar : *br;
    return Value(Range{n.add(r.start), n.add(r.end)});
}

Value Value::scale(double factor) const {
    return map_numbers([factor](const Number& n){ return n.scale(factor); });
}

std::string Value::to_string() const {
    if(auto n = as_number()) return n->to_string();
    if(auto r = as_range()) return r->start.to_string() + "-" + r->end.to_string();
    return *as_text();
}

bool QuantityValue::is_text() const {
    if(auto s = as_single()) return s->value->is_text();
    for(const auto& v : std::get<Many>(data).values) if(v->is_text()) return true;
    return false;
}

ScaledQuantity try_add(const ScaledQuantity& a, const ScaledQuantity& b, const Converter& conv){
    using Kind = quantity_add_error::Kind;
    if(a.value.is_text() || b.value.is_text()) throw quantity_add_error(Kind::TextValue, "text values can not be added");
    if(!a.unit && !b.unit) return ScaledQuantity{a.value.try_add(b.value), std::nullopt};
    if(!a.unit || !b.unit) throw quantity_add_error(Kind::IncompatibleUnits, "can not add a quantity with unit to one without unit");
    if(*a.unit == *b.unit) return ScaledQuantity{a.value.try_add(b.value), a.unit};
    auto ua = conv.find_unit(*a.unit);
    auto ub = conv.find_unit(*b.unit);
    if(!ua || !ub) throw quantity_add_error(Kind::IncompatibleUnits, "unknown unit: '" + (ua ? *b.unit : *a.unit) + "'");
    if(conv.unit(*ua).quantity != conv.unit(*ub).quantity)
        throw quantity_add_error(Kind::IncompatibleUnits, "incompatible units: '" + *a.unit + "' and '" + *b.unit + "'");
    Value converted;
    try {
        converted = conv.convert_value(b.value, *ub, *ua);
    } catch(const convert_error& e){
        throw quantity_add_error(Kind::Convert, e.what());
    }
    return ScaledQuantity{a.value.try_add(converted), a.unit};
}

std::string to_string(const ScaledQuantity& q){
    std::string s = q.value.to_string();
    if(q.unit){ s += ' '; s += *q.unit; }
    return s;
}

} // namespace cook
