#include "cook/convert.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace cook {

const char* physical_quantity_name(PhysicalQuantity q){
    switch(q){
        case PhysicalQuantity::Volume: return "volume";
        case PhysicalQuantity::Mass: return "mass";
        case PhysicalQuantity::Length: return "length";
        case PhysicalQuantity::Temperature: return "temperature";
        case PhysicalQuantity::Time: return "time";
    }
    return "?";
}

const char* system_name(System s){ return s == System::Metric ? "metric" : "imperial"; }

std::optional<System> system_from_name(std::string_view name){
    if(name == "metric") return System::Metric;
    if(name == "imperial") return System::Imperial;
    return std::nullopt;
}

const std::string& Unit::symbol() const { return symbols.empty() ? names.front() : symbols.front(); }

static std::string lowercase(std::string_view s){
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return out;
}

UnitId Converter::add_unit(Unit u){
    if(u.names.empty() && u.symbols.empty()) throw std::invalid_argument("unit needs a name or a symbol");
    UnitId id = units_.size();
    for(const auto* list : {&u.names, &u.symbols, &u.aliases}){
        for(const auto& n : *list){
            if(!index_.emplace(n, id).second) throw std::invalid_argument("duplicate unit name '" + n + "'");
        }
    }
    units_.push_back(std::move(u));
    return id;
}

void Converter::set_best_units(PhysicalQuantity q, System s, const std::vector<std::string>& names){
    std::vector<UnitId> ids;
    for(const auto& n : names){
        auto id = find_unit(n);
        if(!id) throw std::invalid_argument("unknown unit '" + n + "' in best units");
        if(units_[*id].quantity != q) throw std::invalid_argument("unit '" + n + "' is not a " + physical_quantity_name(q) + " unit");
        ids.push_back(*id);
    }
    best_[{q, s}] = std::move(ids);
}

std::optional<UnitId> Converter::find_unit(std::string_view name) const {
    auto it = index_.find(std::string(name));
    if(it != index_.end()) return it->second;
    it = index_.find(lowercase(name));
    if(it != index_.end()) return it->second;
    return std::nullopt;
}

std::optional<PhysicalQuantity> Converter::quantity_of(std::string_view unit_name) const {
    auto id = find_unit(unit_name);
    if(!id) return std::nullopt;
    return units_[*id].quantity;
}

bool Converter::compatible(std::string_view a, std::string_view b) const {
    auto qa = quantity_of(a), qb = quantity_of(b);
    return qa && qb && *qa == *qb;
}

double Converter::convert(double v, UnitId from, UnitId to) const {
    const Unit& f = units_.at(from);
    const Unit& t = units_.at(to);
    if(f.quantity != t.quantity)
        throw convert_error(convert_error::Kind::MixedQuantities, "can not convert " + std::string(physical_quantity_name(f.quantity)) + " to " + physical_quantity_name(t.quantity));
    if(from == to) return v;
    double base = v * f.ratio + f.difference;
    return (base - t.difference) / t.ratio;
}

Value Converter::convert_value(const Value& v, UnitId from, UnitId to) const {
    if(v.is_text()) throw convert_error(convert_error::Kind::TextValue, "text value can not be converted");
    // fractions do not survive a ratio change; converted values are regular
    return v.map_numbers([&](const Number& n){ return Number(convert(n.value(), from, to)); });
}

const std::vector<UnitId>& Converter::best_units(PhysicalQuantity q, System s) const {
    static const std::vector<UnitId> none;
    auto it = best_.find({q, s});
    return it == best_.end() ? none : it->second;
}

std::optional<UnitId> Converter::best_unit(PhysicalQuantity q, System s, double base_value) const {
    const auto& list = best_units(q, s);
    if(list.empty()) return std::nullopt;
    UnitId best = list.front();
    for(UnitId id : list){
        const Unit& u = units_[id];
        double shown = (base_value - u.difference) / u.ratio;
        if(std::fabs(shown) >= 1.0 - 1e-9) best = id;
    }
    return best;
}

static double magnitude(const Value& v){
    if(auto n = v.as_number()) return n->value();
    return v.as_range()->start.value();
}

bool Converter::fit(ScaledQuantity& q) const {
    if(!q.unit || q.value.is_text()) return false;
    auto id = find_unit(*q.unit);
    if(!id) return false;
    const Unit& u = units_[*id];
    double base = magnitude(q.value) * u.ratio + u.difference;
    auto best = best_unit(u.quantity, u.system.value_or(System::Metric), base);
    if(!best || *best == *id) return false;
    q.value = convert_value(q.value, *id, *best);
    q.unit = units_[*best].symbol();
    return true;
}

UnitId Converter::require_unit(const ScaledQuantity& q) const {
    if(q.value.is_text()) throw convert_error(convert_error::Kind::TextValue, "text value can not be converted");
    if(!q.unit) throw convert_error(convert_error::Kind::NoUnit, "quantity has no unit");
    auto id = find_unit(*q.unit);
    if(!id) throw convert_error(convert_error::Kind::UnknownUnit, "unknown unit '" + *q.unit + "'");
    return *id;
}

void Converter::convert_to_system(ScaledQuantity& q, System s) const {
    UnitId id = require_unit(q);
    const Unit& u = units_[id];
    if(!u.system){ fit(q); return; } // time has no system, only refit
    double base = magnitude(q.value) * u.ratio + u.difference;
    auto best = best_unit(u.quantity, s, base);
    if(!best) throw convert_error(convert_error::Kind::UnknownUnit, std::string("no ") + system_name(s) + " unit for " + physical_quantity_name(u.quantity));
    q.value = convert_value(q.value, id, *best);
    q.unit = units_[*best].symbol();
}

void Converter::convert_to_unit(ScaledQuantity& q, std::string_view unit) const {
    UnitId from = require_unit(q);
    auto to = find_unit(unit);
    if(!to) throw convert_error(convert_error::Kind::UnknownUnit, "unknown unit '" + std::string(unit) + "'");
    q.value = convert_value(q.value, from, *to);
    q.unit = units_[*to].symbol();
}

Converter Converter::bundled(){
    using PQ = PhysicalQuantity;
    Converter c;
    auto add = [&c](std::vector<std::string> names, std::vector<std::string> symbols, std::vector<std::string> aliases,
                    double ratio, PQ q, std::optional<System> sys, double difference = 0.0){
        Unit u; u.names = std::move(names); u.symbols = std::move(symbols); u.aliases = std::move(aliases);
        u.ratio = ratio; u.difference = difference; u.quantity = q; u.system = sys;
        c.add_unit(std::move(u));
    };
    // mass, base gram
    add({"milligram", "milligrams"}, {"mg"}, {}, 0.001, PQ::Mass, System::Metric);
    add({"gram", "grams"}, {"g"}, {"gr"}, 1.0, PQ::Mass, System::Metric);
    add({"kilogram", "kilograms"}, {"kg"}, {}, 1000.0, PQ::Mass, System::Metric);
    add({"ounce", "ounces"}, {"oz"}, {}, 28.349523125, PQ::Mass, System::Imperial);
    add({"pound", "pounds"}, {"lb"}, {"lbs"}, 453.59237, PQ::Mass, System::Imperial);
    // volume, base millilitre
    add({"millilitre", "milliliter", "millilitres", "milliliters"}, {"ml"}, {"mL"}, 1.0, PQ::Volume, System::Metric);
    add({"decilitre", "deciliter", "decilitres", "deciliters"}, {"dl"}, {"dL"}, 100.0, PQ::Volume, System::Metric);
    add({"litre", "liter", "litres", "liters"}, {"l"}, {"L"}, 1000.0, PQ::Volume, System::Metric);
    add({"teaspoon", "teaspoons"}, {"tsp"}, {"tsps"}, 4.92892159375, PQ::Volume, System::Imperial);
    add({"tablespoon", "tablespoons"}, {"tbsp"}, {"tbsps", "tbs"}, 14.78676478125, PQ::Volume, System::Imperial);
    add({"fluid ounce", "fluid ounces"}, {"fl oz"}, {"floz"}, 29.5735295625, PQ::Volume, System::Imperial);
    add({"cup", "cups"}, {}, {"c"}, 236.5882365, PQ::Volume, System::Imperial);
    add({"pint", "pints"}, {"pt"}, {}, 473.176473, PQ::Volume, System::Imperial);
    add({"quart", "quarts"}, {"qt"}, {}, 946.352946, PQ::Volume, System::Imperial);
    add({"gallon", "gallons"}, {"gal"}, {}, 3785.411784, PQ::Volume, System::Imperial);
    // length, base millimetre
    add({"millimetre", "millimeter", "millimetres", "millimeters"}, {"mm"}, {}, 1.0, PQ::Length, System::Metric);
    add({"centimetre", "centimeter", "centimetres", "centimeters"}, {"cm"}, {}, 10.0, PQ::Length, System::Metric);
    add({"metre", "meter", "metres", "meters"}, {"m"}, {}, 1000.0, PQ::Length, System::Metric);
    add({"inch", "inches"}, {"in"}, {"\""}, 25.4, PQ::Length, System::Imperial);
    add({"foot", "feet"}, {"ft"}, {}, 304.8, PQ::Length, System::Imperial);
    // time, base second, no system
    add({"second", "seconds"}, {"s"}, {"sec", "secs"}, 1.0, PQ::Time, std::nullopt);
    add({"minute", "minutes"}, {"min"}, {"mins"}, 60.0, PQ::Time, std::nullopt);
    add({"hour", "hours"}, {"h"}, {"hr", "hrs"}, 3600.0, PQ::Time, std::nullopt);
    add({"day", "days"}, {"d"}, {}, 86400.0, PQ::Time, std::nullopt);
    // temperature, base celsius
    add({"celsius"}, {"C"}, {"°C", "ºC"}, 1.0, PQ::Temperature, System::Metric);
    add({"fahrenheit"}, {"F"}, {"°F", "ºF"}, 5.0 / 9.0, PQ::Temperature, System::Imperial, -160.0 / 9.0);
    add({"kelvin"}, {"K"}, {}, 1.0, PQ::Temperature, System::Metric, -273.15);

    c.set_best_units(PQ::Mass, System::Metric, {"mg", "g", "kg"});
    c.set_best_units(PQ::Mass, System::Imperial, {"oz", "lb"});
    c.set_best_units(PQ::Volume, System::Metric, {"ml", "l"});
    c.set_best_units(PQ::Volume, System::Imperial, {"tsp", "tbsp", "cup", "gal"});
    c.set_best_units(PQ::Length, System::Metric, {"mm", "cm", "m"});
    c.set_best_units(PQ::Length, System::Imperial, {"in", "ft"});
    c.set_best_units(PQ::Time, System::Metric, {"s", "min", "h", "d"});
    c.set_best_units(PQ::Time, System::Imperial, {"s", "min", "h", "d"});
    c.set_best_units(PQ::Temperature, System::Metric, {"C"});
    c.set_best_units(PQ::Temperature, System::Imperial, {"F"});
    return c;
}

} // namespace cook
