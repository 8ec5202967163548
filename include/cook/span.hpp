// Byte spans into the recipe source and values tagged with them
#pragma once
#include <cstddef>
#include <utility>

namespace cook {

struct Span {
    size_t start = 0;
    size_t end = 0;

    Span() = default;
    Span(size_t s, size_t e) : start(s), end(e) {}
    static Span pos(size_t p) { return Span{p, p}; }

    size_t len() const { return end - start; }
    bool empty() const { return start == end; }
    // Smallest span covering both.
    Span merge(const Span& o) const { return Span{start < o.start ? start : o.start, end > o.end ? end : o.end}; }

    bool operator==(const Span& o) const { return start == o.start && end == o.end; }
    bool operator!=(const Span& o) const { return !(*this == o); }
};

template <typename T>
struct Located {
    T value;
    Span span;

    Located() = default;
    Located(T v, Span s) : value(std::move(v)), span(s) {}

    const T& operator*() const { return value; }
    T& operator*() { return value; }
    const T* operator->() const { return &value; }
    T* operator->() { return &value; }

    bool operator==(const Located& o) const { return value == o.value && span == o.span; }
    bool operator!=(const Located& o) const { return !(*this == o); }
};

} // namespace cook
