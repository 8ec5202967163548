// Unit table and conversions between compatible units
#pragma once
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>
#include "cook/quantity.hpp"

namespace cook {

enum class PhysicalQuantity { Volume, Mass, Length, Temperature, Time };
enum class System { Metric, Imperial };

const char* physical_quantity_name(PhysicalQuantity q);
const char* system_name(System s);
std::optional<System> system_from_name(std::string_view name);

struct Unit {
    std::vector<std::string> names;   // "gram", "grams"
    std::vector<std::string> symbols; // "g"
    std::vector<std::string> aliases; // alternative spellings
    // base = value * ratio + difference
    double ratio = 1.0;
    double difference = 0.0;
    PhysicalQuantity quantity = PhysicalQuantity::Mass;
    std::optional<System> system;

    // Preferred display form: first symbol, else first name.
    const std::string& symbol() const;
};

using UnitId = size_t;

struct convert_error : std::runtime_error {
    enum class Kind { UnknownUnit, MixedQuantities, TextValue, NoUnit };
    Kind kind;
    convert_error(Kind k, const std::string& what) : std::runtime_error(what), kind(k) {}
};

// Read-only after construction; shared by any number of concurrent users.
class Converter {
public:
    static Converter empty() { return Converter{}; }
    // Built-in metric/imperial table for mass, volume, length, time and temperature.
    static Converter bundled();

    // Throws std::invalid_argument when a name, symbol or alias is already taken.
    UnitId add_unit(Unit u);
    // Ordered smallest to largest. Throws std::invalid_argument for unknown names.
    void set_best_units(PhysicalQuantity q, System s, const std::vector<std::string>& names);

    std::optional<UnitId> find_unit(std::string_view name) const;
    const Unit& unit(UnitId id) const { return units_.at(id); }
    size_t unit_count() const { return units_.size(); }
    std::optional<PhysicalQuantity> quantity_of(std::string_view unit_name) const;
    bool compatible(std::string_view a, std::string_view b) const;

    // Throws convert_error(MixedQuantities) when the units measure different things.
    double convert(double v, UnitId from, UnitId to) const;
    Value convert_value(const Value& v, UnitId from, UnitId to) const;

    // Unit of `best_units(q, s)` that shows `base_value` with the smallest
    // magnitude >= 1, or the smallest unit if all are below 1.
    std::optional<UnitId> best_unit(PhysicalQuantity q, System s, double base_value) const;
    const std::vector<UnitId>& best_units(PhysicalQuantity q, System s) const;

    // Rewrites the quantity into the best unit of its own system. Returns true
    // if the unit changed. Unknown units, unit-less and text quantities are left alone.
    bool fit(ScaledQuantity& q) const;
    // Throws convert_error.
    void convert_to_system(ScaledQuantity& q, System s) const;
    void convert_to_unit(ScaledQuantity& q, std::string_view unit) const;

private:
    std::vector<Unit> units_;
    std::unordered_map<std::string, UnitId> index_;
    std::map<std::pair<PhysicalQuantity, System>, std::vector<UnitId>> best_;

    UnitId require_unit(const ScaledQuantity& q) const;
};

} // namespace cook
