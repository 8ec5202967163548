// Aggregation of a component's quantity with the quantities of its references
#pragma once
#include <string>
#include <vector>
#include "cook/convert.hpp"

namespace cook {

struct TotalQuantity {
    enum class Kind { None, Single, Many };
    Kind kind = Kind::None;
    std::vector<ScaledQuantity> quantities;

    bool operator==(const TotalQuantity& o) const { return kind == o.kind && quantities == o.quantities; }
};

// Sums quantities that can be added and keeps the rest apart: one bucket per
// physical quantity for known units, one per unit text for unknown units,
// one for unit-less numbers, and a list of text values.
class GroupedQuantity {
public:
    void add(const ScaledQuantity& q, const Converter& conv);
    // Fits every bucket with a known unit. Fit failures leave the bucket as is.
    void fit(const Converter& conv);
    TotalQuantity total() const;
    bool empty() const { return buckets_.empty() && text_.empty(); }

private:
    struct Key {
        enum class Kind { NoUnit, Known, Unknown } kind = Kind::NoUnit;
        PhysicalQuantity quantity = PhysicalQuantity::Mass;
        std::string unit;
        bool operator==(const Key& o) const;
    };
    static Key key_for(const ScaledQuantity& q, const Converter& conv);

    std::vector<std::pair<Key, ScaledQuantity>> buckets_; // insertion order
    std::vector<ScaledQuantity> text_;
};

} // namespace cook
