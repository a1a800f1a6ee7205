// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_UTIL_CONTAINERS_H
#define LUMEN_UTIL_CONTAINERS_H

#include <lumen/lumen.h>

#include <lumen/util/check.h>
#include <lumen/util/vecmath.h>

#include <type_traits>
#include <vector>

namespace lumen {

// TypePack Definition
template <typename... Ts>
struct TypePack {
    static constexpr size_t count = sizeof...(Ts);
};

namespace detail {

template <typename T, typename... Ts>
constexpr int FindType() {
    constexpr bool matches[] = {std::is_same_v<T, Ts>...};
    for (int i = 0; i < int(sizeof...(Ts)); ++i)
        if (matches[i])
            return i;
    return -1;
}

}  // namespace detail

// IndexOf gives the position of _T_ in a TypePack
template <typename T, typename Pack>
struct IndexOf;

template <typename T, typename... Ts>
struct IndexOf<T, TypePack<Ts...>> {
    static constexpr int count = detail::FindType<T, Ts...>();
    static_assert(count >= 0, "Type not present in TypePack");
};

// Array2D Definition
// Values for each point of a Bounds2i, stored row by row starting at pMin.
template <typename T>
class Array2D {
  public:
    // Array2D Public Methods
    Array2D() = default;
    explicit Array2D(const Bounds2i &extent) : extent(extent), values(extent.Area()) {}

    T &operator[](Point2i p) { return values[Offset(p)]; }
    const T &operator[](Point2i p) const { return values[Offset(p)]; }

    const Bounds2i &Extent() const { return extent; }
    size_t size() const { return values.size(); }

    auto begin() { return values.begin(); }
    auto end() { return values.end(); }
    auto begin() const { return values.begin(); }
    auto end() const { return values.end(); }

  private:
    size_t Offset(Point2i p) const {
        DCHECK(InsideExclusive(p, extent));
        Vector2i d = p - extent.pMin;
        return size_t(d.y) * size_t(extent.pMax.x - extent.pMin.x) + d.x;
    }

    // Array2D Private Members
    Bounds2i extent;
    std::vector<T> values;
};

}  // namespace lumen

#endif  // LUMEN_UTIL_CONTAINERS_H
