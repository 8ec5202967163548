#include "cook/group.hpp"
#include <cstdio>
#include "cook/extensions.hpp"

namespace cook {

bool GroupedQuantity::Key::operator==(const Key& o) const {
    if(kind != o.kind) return false;
    switch(kind){
        case Kind::NoUnit: return true;
        case Kind::Known: return quantity == o.quantity;
        case Kind::Unknown: return unit == o.unit;
    }
    return false;
}

GroupedQuantity::Key GroupedQuantity::key_for(const ScaledQuantity& q, const Converter& conv){
    Key k;
    if(!q.unit) return k;
    if(auto pq = conv.quantity_of(*q.unit)){
        k.kind = Key::Kind::Known;
        k.quantity = *pq;
    } else {
        k.kind = Key::Kind::Unknown;
        k.unit = *q.unit;
    }
    return k;
}

void GroupedQuantity::add(const ScaledQuantity& q, const Converter& conv){
    if(q.value.is_text()){ text_.push_back(q); return; }
    Key key = key_for(q, conv);
    for(auto& [k, total] : buckets_){
        if(!(k == key)) continue;
        try {
            total = try_add(total, q, conv);
            return;
        } catch(const quantity_add_error& e){
            if(debug_parse_enabled()) std::fprintf(stderr, "[dbg][group] new bucket: %s\n", e.what());
            break;
        }
    }
    buckets_.emplace_back(std::move(key), q);
}

void GroupedQuantity::fit(const Converter& conv){
    for(auto& [k, q] : buckets_){
        if(k.kind != Key::Kind::Known) continue;
        try {
            conv.fit(q);
        } catch(const convert_error& e){
            if(debug_parse_enabled()) std::fprintf(stderr, "[dbg][group] fit skipped: %s\n", e.what());
        }
    }
}

TotalQuantity GroupedQuantity::total() const {
    TotalQuantity t;
    for(const auto& b : buckets_) t.quantities.push_back(b.second);
    t.quantities.insert(t.quantities.end(), text_.begin(), text_.end());
    if(t.quantities.empty()) t.kind = TotalQuantity::Kind::None;
    else if(t.quantities.size() == 1) t.kind = TotalQuantity::Kind::Single;
    else t.kind = TotalQuantity::Kind::Many;
    return t;
}

} // namespace cook
