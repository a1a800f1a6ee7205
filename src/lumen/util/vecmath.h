// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_UTIL_VECMATH_H
#define LUMEN_UTIL_VECMATH_H

#include <lumen/lumen.h>

#include <lumen/util/check.h>
#include <lumen/util/float.h>
#include <lumen/util/math.h>
#include <lumen/util/print.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <iterator>
#include <limits>
#include <string>
#include <utility>

namespace lumen {

namespace internal {

template <typename T>
std::string ToString2(T x, T y);
template <typename T>
std::string ToString3(T x, T y, T z);

}  // namespace internal

extern template std::string internal::ToString2(float, float);
extern template std::string internal::ToString2(double, double);
extern template std::string internal::ToString2(int, int);
extern template std::string internal::ToString3(float, float, float);
extern template std::string internal::ToString3(double, double, double);
extern template std::string internal::ToString3(int, int, int);

namespace {

// TupleLength Definition
template <typename T>
struct TupleLength {
    using type = Float;
};

template <>
struct TupleLength<double> {
    using type = double;
};

}  // anonymous namespace

// Tuple2 Definition
template <template <typename> class Child, typename T>
class Tuple2 {
  public:
    // Tuple2 Public Methods
    static const int nDimensions = 2;

    Tuple2() = default;
    Tuple2(T x, T y) : x(x), y(y) { DCHECK(!HasNaN()); }

    bool HasNaN() const { return IsNaN(x) || IsNaN(y); }

    template <typename U>
    auto operator+(const Child<U> &c) const -> Child<decltype(T{} + U{})> {
        DCHECK(!c.HasNaN());
        return {x + c.x, y + c.y};
    }
    template <typename U>
    Child<T> &operator+=(const Child<U> &c) {
        DCHECK(!c.HasNaN());
        x += c.x;
        y += c.y;
        return static_cast<Child<T> &>(*this);
    }

    template <typename U>
    auto operator-(const Child<U> &c) const -> Child<decltype(T{} - U{})> {
        DCHECK(!c.HasNaN());
        return {x - c.x, y - c.y};
    }
    template <typename U>
    Child<T> &operator-=(const Child<U> &c) {
        DCHECK(!c.HasNaN());
        x -= c.x;
        y -= c.y;
        return static_cast<Child<T> &>(*this);
    }

    bool operator==(const Child<T> &c) const { return x == c.x && y == c.y; }
    bool operator!=(const Child<T> &c) const { return x != c.x || y != c.y; }

    template <typename U>
    auto operator*(U s) const -> Child<decltype(T{} * U{})> {
        return {s * x, s * y};
    }
    template <typename U>
    Child<T> &operator*=(U s) {
        DCHECK(!IsNaN(s));
        x *= s;
        y *= s;
        return static_cast<Child<T> &>(*this);
    }

    template <typename U>
    auto operator/(U d) const -> Child<decltype(T{} / U{})> {
        DCHECK(d != 0 && !IsNaN(d));
        return {x / d, y / d};
    }
    template <typename U>
    Child<T> &operator/=(U d) {
        DCHECK_NE(d, 0);
        DCHECK(!IsNaN(d));
        x /= d;
        y /= d;
        return static_cast<Child<T> &>(*this);
    }

    Child<T> operator-() const { return {-x, -y}; }

    T operator[](int i) const {
        DCHECK(i >= 0 && i <= 1);
        return (i == 0) ? x : y;
    }
    T &operator[](int i) {
        DCHECK(i >= 0 && i <= 1);
        return (i == 0) ? x : y;
    }

    std::string ToString() const { return internal::ToString2(x, y); }

    // Tuple2 Public Members
    T x{}, y{};
};

// Tuple2 Inline Functions
template <template <class> class C, typename T, typename U>
inline auto operator*(U s, const Tuple2<C, T> &t) -> C<decltype(T{} * U{})> {
    DCHECK(!t.HasNaN());
    return t * s;
}

template <template <class> class C, typename T>
inline C<T> Abs(const Tuple2<C, T> &t) {
    using std::abs;
    return {abs(t.x), abs(t.y)};
}

template <template <class> class C, typename T>
inline C<T> Lerp(Float t, const Tuple2<C, T> &t0, const Tuple2<C, T> &t1) {
    return (1 - t) * t0 + t * t1;
}

template <template <class> class C, typename T>
inline C<T> Min(const Tuple2<C, T> &t0, const Tuple2<C, T> &t1) {
    using std::min;
    return {min(t0.x, t1.x), min(t0.y, t1.y)};
}

template <template <class> class C, typename T>
inline C<T> Max(const Tuple2<C, T> &t0, const Tuple2<C, T> &t1) {
    using std::max;
    return {max(t0.x, t1.x), max(t0.y, t1.y)};
}

template <template <class> class C, typename T>
inline T MinComponentValue(const Tuple2<C, T> &t) {
    using std::min;
    return min({t.x, t.y});
}

template <template <class> class C, typename T>
inline T MaxComponentValue(const Tuple2<C, T> &t) {
    using std::max;
    return max({t.x, t.y});
}

template <template <class> class C, typename T>
inline int MaxComponentIndex(const Tuple2<C, T> &t) {
    return (t.x > t.y) ? 0 : 1;
}

// Tuple3 Definition
template <template <typename> class Child, typename T>
class Tuple3 {
  public:
    // Tuple3 Public Methods
    static const int nDimensions = 3;

    Tuple3() = default;
    Tuple3(T x, T y, T z) : x(x), y(y), z(z) { DCHECK(!HasNaN()); }

    bool HasNaN() const { return IsNaN(x) || IsNaN(y) || IsNaN(z); }

    T operator[](int i) const {
        DCHECK(i >= 0 && i <= 2);
        if (i == 0)
            return x;
        if (i == 1)
            return y;
        return z;
    }
    T &operator[](int i) {
        DCHECK(i >= 0 && i <= 2);
        if (i == 0)
            return x;
        if (i == 1)
            return y;
        return z;
    }

    template <typename U>
    auto operator+(const Child<U> &c) const -> Child<decltype(T{} + U{})> {
        DCHECK(!c.HasNaN());
        return {x + c.x, y + c.y, z + c.z};
    }
    template <typename U>
    Child<T> &operator+=(const Child<U> &c) {
        DCHECK(!c.HasNaN());
        x += c.x;
        y += c.y;
        z += c.z;
        return static_cast<Child<T> &>(*this);
    }

    template <typename U>
    auto operator-(const Child<U> &c) const -> Child<decltype(T{} - U{})> {
        DCHECK(!c.HasNaN());
        return {x - c.x, y - c.y, z - c.z};
    }
    template <typename U>
    Child<T> &operator-=(const Child<U> &c) {
        DCHECK(!c.HasNaN());
        x -= c.x;
        y -= c.y;
        z -= c.z;
        return static_cast<Child<T> &>(*this);
    }

    bool operator==(const Child<T> &c) const { return x == c.x && y == c.y && z == c.z; }
    bool operator!=(const Child<T> &c) const { return x != c.x || y != c.y || z != c.z; }

    template <typename U>
    auto operator*(U s) const -> Child<decltype(T{} * U{})> {
        return {s * x, s * y, s * z};
    }
    template <typename U>
    Child<T> &operator*=(U s) {
        DCHECK(!IsNaN(s));
        x *= s;
        y *= s;
        z *= s;
        return static_cast<Child<T> &>(*this);
    }

    template <typename U>
    auto operator/(U d) const -> Child<decltype(T{} / U{})> {
        DCHECK_NE(d, 0);
        return {x / d, y / d, z / d};
    }
    template <typename U>
    Child<T> &operator/=(U d) {
        DCHECK_NE(d, 0);
        x /= d;
        y /= d;
        z /= d;
        return static_cast<Child<T> &>(*this);
    }

    Child<T> operator-() const { return {-x, -y, -z}; }

    std::string ToString() const { return internal::ToString3(x, y, z); }

    // Tuple3 Public Members
    T x{}, y{}, z{};
};

// Tuple3 Inline Functions
template <template <class> class C, typename T, typename U>
inline auto operator*(U s, const Tuple3<C, T> &t) -> C<decltype(T{} * U{})> {
    return t * s;
}

template <template <class> class C, typename T>
inline C<T> Abs(const Tuple3<C, T> &t) {
    using std::abs;
    return {abs(t.x), abs(t.y), abs(t.z)};
}

template <template <class> class C, typename T>
inline C<T> Lerp(Float t, const Tuple3<C, T> &t0, const Tuple3<C, T> &t1) {
    return (1 - t) * t0 + t * t1;
}

template <template <class> class C, typename T>
inline C<T> FMA(Float a, const Tuple3<C, T> &b, const Tuple3<C, T> &c) {
    return {FMA(a, b.x, c.x), FMA(a, b.y, c.y), FMA(a, b.z, c.z)};
}

template <template <class> class C, typename T>
inline C<T> Min(const Tuple3<C, T> &t1, const Tuple3<C, T> &t2) {
    using std::min;
    return {min(t1.x, t2.x), min(t1.y, t2.y), min(t1.z, t2.z)};
}

template <template <class> class C, typename T>
inline C<T> Max(const Tuple3<C, T> &t1, const Tuple3<C, T> &t2) {
    using std::max;
    return {max(t1.x, t2.x), max(t1.y, t2.y), max(t1.z, t2.z)};
}

template <template <class> class C, typename T>
inline T MinComponentValue(const Tuple3<C, T> &t) {
    using std::min;
    return min({t.x, t.y, t.z});
}

template <template <class> class C, typename T>
inline T MaxComponentValue(const Tuple3<C, T> &t) {
    using std::max;
    return max({t.x, t.y, t.z});
}

template <template <class> class C, typename T>
inline int MaxComponentIndex(const Tuple3<C, T> &t) {
    return (t.x > t.y) ? ((t.x > t.z) ? 0 : 2) : ((t.y > t.z) ? 1 : 2);
}

template <template <class> class C, typename T>
inline C<T> Permute(const Tuple3<C, T> &t, std::array<int, 3> p) {
    return {t[p[0]], t[p[1]], t[p[2]]};
}

// Vector2 Definition
template <typename T>
class Vector2 : public Tuple2<Vector2, T> {
  public:
    // Vector2 Public Methods
    using Tuple2<Vector2, T>::x;
    using Tuple2<Vector2, T>::y;

    Vector2() = default;
    Vector2(T x, T y) : Tuple2<lumen::Vector2, T>(x, y) {}
    template <typename U>
    explicit Vector2(const Point2<U> &p);
    template <typename U>
    explicit Vector2(const Vector2<U> &v) : Tuple2<lumen::Vector2, T>(T(v.x), T(v.y)) {}
};

// Vector3 Definition
template <typename T>
class Vector3 : public Tuple3<Vector3, T> {
  public:
    // Vector3 Public Methods
    using Tuple3<Vector3, T>::x;
    using Tuple3<Vector3, T>::y;
    using Tuple3<Vector3, T>::z;

    Vector3() = default;
    Vector3(T x, T y, T z) : Tuple3<lumen::Vector3, T>(x, y, z) {}

    template <typename U>
    explicit Vector3(const Vector3<U> &v)
        : Tuple3<lumen::Vector3, T>(T(v.x), T(v.y), T(v.z)) {}
    template <typename U>
    explicit Vector3(const Point3<U> &p);
    template <typename U>
    explicit Vector3(const Normal3<U> &n);
};

// Vector2* Definitions
using Vector2f = Vector2<Float>;
using Vector2i = Vector2<int>;

// Vector3* Definitions
using Vector3f = Vector3<Float>;
using Vector3i = Vector3<int>;

// Point2 Definition
template <typename T>
class Point2 : public Tuple2<Point2, T> {
  public:
    // Point2 Public Methods
    using Tuple2<Point2, T>::x;
    using Tuple2<Point2, T>::y;
    using Tuple2<Point2, T>::HasNaN;
    using Tuple2<Point2, T>::operator+;
    using Tuple2<Point2, T>::operator+=;
    using Tuple2<Point2, T>::operator*;
    using Tuple2<Point2, T>::operator*=;

    Point2() { x = y = 0; }
    Point2(T x, T y) : Tuple2<lumen::Point2, T>(x, y) {}
    template <typename U>
    explicit Point2(const Point2<U> &v) : Tuple2<lumen::Point2, T>(T(v.x), T(v.y)) {}
    template <typename U>
    explicit Point2(const Vector2<U> &v) : Tuple2<lumen::Point2, T>(T(v.x), T(v.y)) {}

    template <typename U>
    auto operator+(const Vector2<U> &v) const -> Point2<decltype(T{} + U{})> {
        DCHECK(!v.HasNaN());
        return {x + v.x, y + v.y};
    }
    template <typename U>
    Point2<T> &operator+=(const Vector2<U> &v) {
        DCHECK(!v.HasNaN());
        x += v.x;
        y += v.y;
        return *this;
    }

    Point2<T> operator-() const { return {-x, -y}; }

    template <typename U>
    auto operator-(const Point2<U> &p) const -> Vector2<decltype(T{} - U{})> {
        DCHECK(!p.HasNaN());
        return {x - p.x, y - p.y};
    }
    template <typename U>
    auto operator-(const Vector2<U> &v) const -> Point2<decltype(T{} - U{})> {
        DCHECK(!v.HasNaN());
        return {x - v.x, y - v.y};
    }
    template <typename U>
    Point2<T> &operator-=(const Vector2<U> &v) {
        DCHECK(!v.HasNaN());
        x -= v.x;
        y -= v.y;
        return *this;
    }
};

// Point3 Definition
template <typename T>
class Point3 : public Tuple3<Point3, T> {
  public:
    // Point3 Public Methods
    using Tuple3<Point3, T>::x;
    using Tuple3<Point3, T>::y;
    using Tuple3<Point3, T>::z;
    using Tuple3<Point3, T>::HasNaN;
    using Tuple3<Point3, T>::operator+;
    using Tuple3<Point3, T>::operator+=;
    using Tuple3<Point3, T>::operator*;
    using Tuple3<Point3, T>::operator*=;

    Point3() = default;
    Point3(T x, T y, T z) : Tuple3<lumen::Point3, T>(x, y, z) {}
    template <typename U>
    explicit Point3(const Point3<U> &p)
        : Tuple3<lumen::Point3, T>(T(p.x), T(p.y), T(p.z)) {}
    template <typename U>
    explicit Point3(const Vector3<U> &v)
        : Tuple3<lumen::Point3, T>(T(v.x), T(v.y), T(v.z)) {}

    template <typename U>
    auto operator+(const Vector3<U> &v) const -> Point3<decltype(T{} + U{})> {
        DCHECK(!v.HasNaN());
        return {x + v.x, y + v.y, z + v.z};
    }
    template <typename U>
    Point3<T> &operator+=(const Vector3<U> &v) {
        DCHECK(!v.HasNaN());
        x += v.x;
        y += v.y;
        z += v.z;
        return *this;
    }

    Point3<T> operator-() const { return {-x, -y, -z}; }

    template <typename U>
    auto operator-(const Vector3<U> &v) const -> Point3<decltype(T{} - U{})> {
        DCHECK(!v.HasNaN());
        return {x - v.x, y - v.y, z - v.z};
    }
    template <typename U>
    Point3<T> &operator-=(const Vector3<U> &v) {
        DCHECK(!v.HasNaN());
        x -= v.x;
        y -= v.y;
        z -= v.z;
        return *this;
    }

    template <typename U>
    auto operator-(const Point3<U> &p) const -> Vector3<decltype(T{} - U{})> {
        DCHECK(!p.HasNaN());
        return {x - p.x, y - p.y, z - p.z};
    }
};

// Point2* Definitions
using Point2f = Point2<Float>;
using Point2i = Point2<int>;

// Point3* Definitions
using Point3f = Point3<Float>;
using Point3i = Point3<int>;

// Normal3 Definition
template <typename T>
class Normal3 : public Tuple3<Normal3, T> {
  public:
    // Normal3 Public Methods
    using Tuple3<Normal3, T>::x;
    using Tuple3<Normal3, T>::y;
    using Tuple3<Normal3, T>::z;
    using Tuple3<Normal3, T>::HasNaN;
    using Tuple3<Normal3, T>::operator+;
    using Tuple3<Normal3, T>::operator*;
    using Tuple3<Normal3, T>::operator*=;

    Normal3() = default;
    Normal3(T x, T y, T z) : Tuple3<lumen::Normal3, T>(x, y, z) {}
    template <typename U>
    explicit Normal3(const Normal3<U> &v)
        : Tuple3<lumen::Normal3, T>(T(v.x), T(v.y), T(v.z)) {}

    template <typename U>
    explicit Normal3(const Vector3<U> &v)
        : Tuple3<lumen::Normal3, T>(T(v.x), T(v.y), T(v.z)) {}
};

using Normal3f = Normal3<Float>;

// Vector2 Inline Functions
template <typename T>
template <typename U>
Vector2<T>::Vector2(const Point2<U> &p) : Tuple2<lumen::Vector2, T>(T(p.x), T(p.y)) {}

template <typename T>
inline auto Dot(const Vector2<T> &v1, const Vector2<T> &v2) ->
    typename TupleLength<T>::type {
    DCHECK(!v1.HasNaN() && !v2.HasNaN());
    return SumOfProducts(v1.x, v2.x, v1.y, v2.y);
}

template <typename T>
inline auto LengthSquared(const Vector2<T> &v) -> typename TupleLength<T>::type {
    return Sqr(v.x) + Sqr(v.y);
}

template <typename T>
inline auto Length(const Vector2<T> &v) -> typename TupleLength<T>::type {
    using std::sqrt;
    return sqrt(LengthSquared(v));
}

template <typename T>
inline auto Normalize(const Vector2<T> &v) {
    return v / Length(v);
}

template <typename T>
inline auto Distance(const Point2<T> &p1, const Point2<T> &p2) ->
    typename TupleLength<T>::type {
    return Length(p1 - p2);
}

template <typename T>
inline auto DistanceSquared(const Point2<T> &p1, const Point2<T> &p2) ->
    typename TupleLength<T>::type {
    return LengthSquared(p1 - p2);
}

// Vector3 Inline Functions
template <typename T>
template <typename U>
Vector3<T>::Vector3(const Point3<U> &p)
    : Tuple3<lumen::Vector3, T>(T(p.x), T(p.y), T(p.z)) {}

template <typename T>
template <typename U>
Vector3<T>::Vector3(const Normal3<U> &n)
    : Tuple3<lumen::Vector3, T>(T(n.x), T(n.y), T(n.z)) {}

template <typename T>
inline Vector3<T> Cross(const Vector3<T> &v1, const Normal3<T> &v2) {
    DCHECK(!v1.HasNaN() && !v2.HasNaN());
    return {DifferenceOfProducts(v1.y, v2.z, v1.z, v2.y),
            DifferenceOfProducts(v1.z, v2.x, v1.x, v2.z),
            DifferenceOfProducts(v1.x, v2.y, v1.y, v2.x)};
}

template <typename T>
inline Vector3<T> Cross(const Normal3<T> &v1, const Vector3<T> &v2) {
    DCHECK(!v1.HasNaN() && !v2.HasNaN());
    return {DifferenceOfProducts(v1.y, v2.z, v1.z, v2.y),
            DifferenceOfProducts(v1.z, v2.x, v1.x, v2.z),
            DifferenceOfProducts(v1.x, v2.y, v1.y, v2.x)};
}

template <typename T>
inline Vector3<T> Cross(const Vector3<T> &v1, const Vector3<T> &v2) {
    DCHECK(!v1.HasNaN() && !v2.HasNaN());
    return {DifferenceOfProducts(v1.y, v2.z, v1.z, v2.y),
            DifferenceOfProducts(v1.z, v2.x, v1.x, v2.z),
            DifferenceOfProducts(v1.x, v2.y, v1.y, v2.x)};
}

template <typename T>
inline T LengthSquared(const Vector3<T> &v) {
    return Sqr(v.x) + Sqr(v.y) + Sqr(v.z);
}

template <typename T>
inline auto Length(const Vector3<T> &v) -> typename TupleLength<T>::type {
    using std::sqrt;
    return sqrt(LengthSquared(v));
}

template <typename T>
inline auto Normalize(const Vector3<T> &v) {
    return v / Length(v);
}

template <typename T>
inline T Dot(const Vector3<T> &v, const Vector3<T> &w) {
    DCHECK(!v.HasNaN() && !w.HasNaN());
    return FMA(v.x, w.x, SumOfProducts(v.y, w.y, v.z, w.z));
}

template <typename T>
inline T AbsDot(const Vector3<T> &v1, const Vector3<T> &v2) {
    DCHECK(!v1.HasNaN() && !v2.HasNaN());
    return std::abs(Dot(v1, v2));
}

// Angle between two unit vectors, computed without the precision loss of acos near 1
template <typename T>
inline Vector3<T> GramSchmidt(const Vector3<T> &v, const Vector3<T> &w) {
    return v - Dot(v, w) * w;
}

template <typename T>
inline void CoordinateSystem(const Vector3<T> &v1, Vector3<T> *v2, Vector3<T> *v3) {
    Float sign = std::copysign(Float(1), v1.z);
    Float a = -1 / (sign + v1.z);
    Float b = v1.x * v1.y * a;
    *v2 = Vector3<T>(1 + sign * Sqr(v1.x) * a, sign * b, -sign * v1.x);
    *v3 = Vector3<T>(b, sign + Sqr(v1.y) * a, -v1.y);
}

template <typename T>
inline void CoordinateSystem(const Normal3<T> &v1, Vector3<T> *v2, Vector3<T> *v3) {
    CoordinateSystem(Vector3<T>(v1), v2, v3);
}

// Point3 Inline Functions
template <typename T>
inline auto Distance(const Point3<T> &p1, const Point3<T> &p2) {
    return Length(p1 - p2);
}

template <typename T>
inline auto DistanceSquared(const Point3<T> &p1, const Point3<T> &p2) {
    return LengthSquared(p1 - p2);
}

// Normal3 Inline Functions
template <typename T>
inline auto LengthSquared(const Normal3<T> &n) -> typename TupleLength<T>::type {
    return Sqr(n.x) + Sqr(n.y) + Sqr(n.z);
}

template <typename T>
inline auto Length(const Normal3<T> &n) -> typename TupleLength<T>::type {
    using std::sqrt;
    return sqrt(LengthSquared(n));
}

template <typename T>
inline auto Normalize(const Normal3<T> &n) -> Normal3<typename TupleLength<T>::type> {
    return n / Length(n);
}

template <typename T>
inline auto Dot(const Normal3<T> &n, const Vector3<T> &v) ->
    typename TupleLength<T>::type {
    DCHECK(!n.HasNaN() && !v.HasNaN());
    return FMA(n.x, v.x, SumOfProducts(n.y, v.y, n.z, v.z));
}

template <typename T>
inline auto Dot(const Vector3<T> &v, const Normal3<T> &n) ->
    typename TupleLength<T>::type {
    DCHECK(!v.HasNaN() && !n.HasNaN());
    return FMA(n.x, v.x, SumOfProducts(n.y, v.y, n.z, v.z));
}

template <typename T>
inline auto Dot(const Normal3<T> &n1, const Normal3<T> &n2) ->
    typename TupleLength<T>::type {
    DCHECK(!n1.HasNaN() && !n2.HasNaN());
    return FMA(n1.x, n2.x, SumOfProducts(n1.y, n2.y, n1.z, n2.z));
}

template <typename T>
inline auto AbsDot(const Normal3<T> &n, const Vector3<T> &v) ->
    typename TupleLength<T>::type {
    return std::abs(Dot(n, v));
}

template <typename T>
inline auto AbsDot(const Vector3<T> &v, const Normal3<T> &n) ->
    typename TupleLength<T>::type {
    return std::abs(Dot(v, n));
}

template <typename T>
inline auto AbsDot(const Normal3<T> &n1, const Normal3<T> &n2) ->
    typename TupleLength<T>::type {
    return std::abs(Dot(n1, n2));
}

template <typename T>
inline Normal3<T> FaceForward(const Normal3<T> &n, const Vector3<T> &v) {
    return (Dot(n, v) < 0.f) ? -n : n;
}

template <typename T>
inline Normal3<T> FaceForward(const Normal3<T> &n, const Normal3<T> &n2) {
    return (Dot(n, n2) < 0.f) ? -n : n;
}

template <typename T>
inline Vector3<T> FaceForward(const Vector3<T> &v, const Vector3<T> &v2) {
    return (Dot(v, v2) < 0.f) ? -v : v;
}

template <typename T>
inline Vector3<T> FaceForward(const Vector3<T> &v, const Normal3<T> &n2) {
    return (Dot(v, n2) < 0.f) ? -v : v;
}

// Bounds2 Definition
template <typename T>
class Bounds2 {
  public:
    // Bounds2 Public Methods
    Bounds2() {
        T minNum = std::numeric_limits<T>::lowest();
        T maxNum = std::numeric_limits<T>::max();
        pMin = Point2<T>(maxNum, maxNum);
        pMax = Point2<T>(minNum, minNum);
    }
    explicit Bounds2(const Point2<T> &p) : pMin(p), pMax(p) {}
    Bounds2(const Point2<T> &p1, const Point2<T> &p2)
        : pMin(Min(p1, p2)), pMax(Max(p1, p2)) {}
    template <typename U>
    explicit Bounds2(const Bounds2<U> &b) {
        if (b.IsEmpty())
            // Keep float->int conversions of an empty box from overflowing
            *this = Bounds2<T>();
        else {
            pMin = Point2<T>(b.pMin);
            pMax = Point2<T>(b.pMax);
        }
    }

    Vector2<T> Diagonal() const { return pMax - pMin; }

    T Area() const {
        Vector2<T> d = pMax - pMin;
        return d.x * d.y;
    }

    bool IsEmpty() const { return pMin.x >= pMax.x || pMin.y >= pMax.y; }

    bool operator==(const Bounds2<T> &b) const {
        return b.pMin == pMin && b.pMax == pMax;
    }
    bool operator!=(const Bounds2<T> &b) const {
        return b.pMin != pMin || b.pMax != pMax;
    }

    std::string ToString() const { return StringPrintf("[ %s - %s ]", pMin, pMax); }

    // Bounds2 Public Members
    Point2<T> pMin, pMax;
};

// Bounds3 Definition
template <typename T>
class Bounds3 {
  public:
    // Bounds3 Public Methods
    Bounds3() {
        T minNum = std::numeric_limits<T>::lowest();
        T maxNum = std::numeric_limits<T>::max();
        pMin = Point3<T>(maxNum, maxNum, maxNum);
        pMax = Point3<T>(minNum, minNum, minNum);
    }
    explicit Bounds3(const Point3<T> &p) : pMin(p), pMax(p) {}
    Bounds3(const Point3<T> &p1, const Point3<T> &p2)
        : pMin(Min(p1, p2)), pMax(Max(p1, p2)) {}

    const Point3<T> &operator[](int i) const {
        DCHECK(i == 0 || i == 1);
        return (i == 0) ? pMin : pMax;
    }
    Point3<T> &operator[](int i) {
        DCHECK(i == 0 || i == 1);
        return (i == 0) ? pMin : pMax;
    }

    Point3<T> Corner(int corner) const {
        DCHECK(corner >= 0 && corner < 8);
        return Point3<T>((*this)[(corner & 1)].x, (*this)[(corner & 2) ? 1 : 0].y,
                         (*this)[(corner & 4) ? 1 : 0].z);
    }

    Vector3<T> Diagonal() const { return pMax - pMin; }

    T SurfaceArea() const {
        Vector3<T> d = Diagonal();
        return 2 * (d.x * d.y + d.x * d.z + d.y * d.z);
    }

    int MaxDimension() const {
        Vector3<T> d = Diagonal();
        if (d.x > d.y && d.x > d.z)
            return 0;
        else if (d.y > d.z)
            return 1;
        else
            return 2;
    }

    Vector3<T> Offset(const Point3<T> &p) const {
        Vector3<T> o = p - pMin;
        if (pMax.x > pMin.x)
            o.x /= pMax.x - pMin.x;
        if (pMax.y > pMin.y)
            o.y /= pMax.y - pMin.y;
        if (pMax.z > pMin.z)
            o.z /= pMax.z - pMin.z;
        return o;
    }

    void BoundingSphere(Point3<T> *center, Float *radius) const;

    bool IsEmpty() const {
        return pMin.x >= pMax.x || pMin.y >= pMax.y || pMin.z >= pMax.z;
    }
    bool IsDegenerate() const {
        return pMin.x > pMax.x || pMin.y > pMax.y || pMin.z > pMax.z;
    }

    bool operator==(const Bounds3<T> &b) const {
        return b.pMin == pMin && b.pMax == pMax;
    }
    bool operator!=(const Bounds3<T> &b) const {
        return b.pMin != pMin || b.pMax != pMax;
    }

    bool IntersectP(const Point3f &o, const Vector3f &d, Float tMax = Infinity,
                    Float *hitt0 = nullptr, Float *hitt1 = nullptr) const;
    bool IntersectP(const Point3f &o, const Vector3f &d, Float tMax,
                    const Vector3f &invDir, const int dirIsNeg[3]) const;

    std::string ToString() const { return StringPrintf("[ %s - %s ]", pMin, pMax); }

    // Bounds3 Public Members
    Point3<T> pMin, pMax;
};

// Bounds[23][fi] Definitions
using Bounds2f = Bounds2<Float>;
using Bounds2i = Bounds2<int>;
using Bounds3f = Bounds3<Float>;

// Bounds2iIterator Definition
class Bounds2iIterator {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = Point2i;
    using difference_type = std::ptrdiff_t;
    using pointer = const Point2i *;
    using reference = Point2i;

    Bounds2iIterator(const Bounds2i &b, const Point2i &pt) : p(pt), bounds(&b) {}

    Bounds2iIterator operator++() {
        advance();
        return *this;
    }
    Bounds2iIterator operator++(int) {
        Bounds2iIterator old = *this;
        advance();
        return old;
    }

    bool operator==(const Bounds2iIterator &bi) const {
        return p == bi.p && bounds == bi.bounds;
    }
    bool operator!=(const Bounds2iIterator &bi) const {
        return p != bi.p || bounds != bi.bounds;
    }

    Point2i operator*() const { return p; }

  private:
    void advance() {
        ++p.x;
        if (p.x == bounds->pMax.x) {
            p.x = bounds->pMin.x;
            ++p.y;
        }
    }

    Point2i p;
    const Bounds2i *bounds;
};

// Bounds2 Inline Functions
template <typename T>
inline Bounds2<T> Union(const Bounds2<T> &b1, const Bounds2<T> &b2) {
    // Assign directly; the two-point constructor would reorder an empty box
    Bounds2<T> ret;
    ret.pMin = Min(b1.pMin, b2.pMin);
    ret.pMax = Max(b1.pMax, b2.pMax);
    return ret;
}

template <typename T>
inline Bounds2<T> Intersect(const Bounds2<T> &b1, const Bounds2<T> &b2) {
    Bounds2<T> b;
    b.pMin = Max(b1.pMin, b2.pMin);
    b.pMax = Min(b1.pMax, b2.pMax);
    return b;
}

template <typename T>
inline bool InsideExclusive(const Point2<T> &pt, const Bounds2<T> &b) {
    return (pt.x >= b.pMin.x && pt.x < b.pMax.x && pt.y >= b.pMin.y && pt.y < b.pMax.y);
}

inline Bounds2iIterator begin(const Bounds2i &b) {
    return Bounds2iIterator(b, b.pMin);
}

inline Bounds2iIterator end(const Bounds2i &b) {
    // One past the last row; an empty box ends where it begins
    Point2i pEnd(b.pMin.x, b.pMax.y);
    if (b.pMin.x >= b.pMax.x || b.pMin.y >= b.pMax.y)
        pEnd = b.pMin;
    return Bounds2iIterator(b, pEnd);
}

// Bounds3 Inline Functions
template <typename T>
inline Bounds3<T> Union(const Bounds3<T> &b, const Point3<T> &p) {
    Bounds3<T> ret;
    ret.pMin = Min(b.pMin, p);
    ret.pMax = Max(b.pMax, p);
    return ret;
}

template <typename T>
inline Bounds3<T> Union(const Bounds3<T> &b1, const Bounds3<T> &b2) {
    Bounds3<T> ret;
    ret.pMin = Min(b1.pMin, b2.pMin);
    ret.pMax = Max(b1.pMax, b2.pMax);
    return ret;
}

template <typename T>
inline Bounds3<T> Intersect(const Bounds3<T> &b1, const Bounds3<T> &b2) {
    Bounds3<T> b;
    b.pMin = Max(b1.pMin, b2.pMin);
    b.pMax = Min(b1.pMax, b2.pMax);
    return b;
}

template <typename T>
inline bool Inside(const Point3<T> &p, const Bounds3<T> &b) {
    return (p.x >= b.pMin.x && p.x <= b.pMax.x && p.y >= b.pMin.y && p.y <= b.pMax.y &&
            p.z >= b.pMin.z && p.z <= b.pMax.z);
}

template <typename T>
inline void Bounds3<T>::BoundingSphere(Point3<T> *center, Float *radius) const {
    *center = (pMin + pMax) / 2;
    *radius = Inside(*center, *this) ? Distance(*center, pMax) : 0;
}

template <typename T>
inline bool Bounds3<T>::IntersectP(const Point3f &o, const Vector3f &d, Float tMax,
                                   Float *hitt0, Float *hitt1) const {
    Float t0 = 0, t1 = tMax;
    for (int i = 0; i < 3; ++i) {
        // Clip the parametric range against the _i_th slab
        Float invRayDir = 1 / d[i];
        Float tNear = (pMin[i] - o[i]) * invRayDir;
        Float tFar = (pMax[i] - o[i]) * invRayDir;
        if (tNear > tFar)
            std::swap(tNear, tFar);
        // Conservative rounding so grazing rays are never culled
        tFar *= 1 + 2 * gamma(3);

        t0 = tNear > t0 ? tNear : t0;
        t1 = tFar < t1 ? tFar : t1;
        if (t0 > t1)
            return false;
    }
    if (hitt0)
        *hitt0 = t0;
    if (hitt1)
        *hitt1 = t1;
    return true;
}

template <typename T>
inline bool Bounds3<T>::IntersectP(const Point3f &o, const Vector3f &d, Float raytMax,
                                   const Vector3f &invDir, const int dirIsNeg[3]) const {
    const Bounds3f &bounds = *this;
    // x and y slabs
    Float tMin = (bounds[dirIsNeg[0]].x - o.x) * invDir.x;
    Float tMax = (bounds[1 - dirIsNeg[0]].x - o.x) * invDir.x;
    Float tyMin = (bounds[dirIsNeg[1]].y - o.y) * invDir.y;
    Float tyMax = (bounds[1 - dirIsNeg[1]].y - o.y) * invDir.y;
    tMax *= 1 + 2 * gamma(3);
    tyMax *= 1 + 2 * gamma(3);

    if (tMin > tyMax || tyMin > tMax)
        return false;
    if (tyMin > tMin)
        tMin = tyMin;
    if (tyMax < tMax)
        tMax = tyMax;

    // z slab
    Float tzMin = (bounds[dirIsNeg[2]].z - o.z) * invDir.z;
    Float tzMax = (bounds[1 - dirIsNeg[2]].z - o.z) * invDir.z;
    tzMax *= 1 + 2 * gamma(3);

    if (tMin > tzMax || tzMin > tMax)
        return false;
    if (tzMin > tMin)
        tMin = tzMin;
    if (tzMax < tMax)
        tMax = tzMax;

    return (tMin < raytMax) && (tMax > 0);
}

// Spherical Geometry Inline Functions
inline Vector3f SphericalDirection(Float sinTheta, Float cosTheta, Float phi) {
    DCHECK(sinTheta >= -1.0001 && sinTheta <= 1.0001);
    DCHECK(cosTheta >= -1.0001 && cosTheta <= 1.0001);
    return Vector3f(Clamp(sinTheta, -1, 1) * std::cos(phi),
                    Clamp(sinTheta, -1, 1) * std::sin(phi), Clamp(cosTheta, -1, 1));
}

inline Float CosTheta(const Vector3f &w) {
    return w.z;
}
inline Float Cos2Theta(const Vector3f &w) {
    return Sqr(w.z);
}
inline Float AbsCosTheta(const Vector3f &w) {
    return std::abs(w.z);
}

inline Float Sin2Theta(const Vector3f &w) {
    return std::max<Float>(0, 1 - Cos2Theta(w));
}
inline Float SinTheta(const Vector3f &w) {
    return std::sqrt(Sin2Theta(w));
}

inline Float Tan2Theta(const Vector3f &w) {
    return Sin2Theta(w) / Cos2Theta(w);
}

inline Float CosPhi(const Vector3f &w) {
    Float sinTheta = SinTheta(w);
    return (sinTheta == 0) ? 1 : Clamp(w.x / sinTheta, -1, 1);
}
inline Float SinPhi(const Vector3f &w) {
    Float sinTheta = SinTheta(w);
    return (sinTheta == 0) ? 0 : Clamp(w.y / sinTheta, -1, 1);
}

inline bool SameHemisphere(const Vector3f &w, const Vector3f &wp) {
    return w.z * wp.z > 0;
}

// Frame Definition
class Frame {
  public:
    // Frame Public Methods
    Frame() : x(1, 0, 0), y(0, 1, 0), z(0, 0, 1) {}
    Frame(const Vector3f &x, const Vector3f &y, const Vector3f &z) : x(x), y(y), z(z) {
        DCHECK_LT(std::abs(LengthSquared(x) - 1), 1e-4);
        DCHECK_LT(std::abs(LengthSquared(y) - 1), 1e-4);
        DCHECK_LT(std::abs(LengthSquared(z) - 1), 1e-4);
        DCHECK_LT(std::abs(Dot(x, y)), 1e-4);
        DCHECK_LT(std::abs(Dot(y, z)), 1e-4);
        DCHECK_LT(std::abs(Dot(z, x)), 1e-4);
    }

    static Frame FromXZ(const Vector3f &x, const Vector3f &z) {
        return Frame(x, Cross(z, x), z);
    }

    static Frame FromZ(const Vector3f &z) {
        Vector3f x, y;
        CoordinateSystem(z, &x, &y);
        return Frame(x, y, z);
    }
    static Frame FromZ(const Normal3f &z) { return FromZ(Vector3f(z)); }

    Vector3f ToLocal(const Vector3f &v) const {
        return Vector3f(Dot(v, x), Dot(v, y), Dot(v, z));
    }
    Vector3f FromLocal(const Vector3f &v) const { return v.x * x + v.y * y + v.z * z; }

    std::string ToString() const {
        return StringPrintf("[ Frame x: %s y: %s z: %s ]", x, y, z);
    }

    // Frame Public Members
    Vector3f x, y, z;
};

}  // namespace lumen

#endif  // LUMEN_UTIL_VECMATH_H
