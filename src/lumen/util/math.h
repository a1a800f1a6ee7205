// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_UTIL_MATH_H
#define LUMEN_UTIL_MATH_H

#include <lumen/lumen.h>

#include <lumen/util/check.h>
#include <lumen/util/float.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace lumen {

// Mathematical Constants
constexpr Float ShadowEpsilon = 0.0001f;

constexpr Float Pi = 3.14159265358979323846;
constexpr Float InvPi = 0.31830988618379067154;
constexpr Float Inv2Pi = 0.15915494309189533577;
constexpr Float Inv4Pi = 0.07957747154594766788;
constexpr Float PiOver2 = 1.57079632679489661923;
constexpr Float PiOver4 = 0.78539816339744830961;

// Math Inline Functions
inline Float Lerp(Float x, Float a, Float b) {
    return (1 - x) * a + x * b;
}

template <typename T, typename U, typename V>
inline constexpr T Clamp(T val, U low, V high) {
    if (val < low)
        return T(low);
    else if (val > high)
        return T(high);
    else
        return val;
}

inline Float Radians(Float deg) {
    return (Pi / 180) * deg;
}
inline Float Degrees(Float rad) {
    return (180 / Pi) * rad;
}

inline float SafeSqrt(float x) {
    DCHECK_GE(x, -1e-3f);  // not too negative
    return std::sqrt(std::max(0.f, x));
}

inline double SafeSqrt(double x) {
    DCHECK_GE(x, -1e-3);  // not too negative
    return std::sqrt(std::max(0., x));
}

template <typename T>
inline constexpr T Sqr(T v) {
    return v * v;
}

inline float SafeACos(float x) {
    DCHECK(x >= -1.0001 && x <= 1.0001);
    return std::acos(Clamp(x, -1, 1));
}

inline double SafeACos(double x) {
    DCHECK(x >= -1.0001 && x <= 1.0001);
    return std::acos(Clamp(x, -1, 1));
}

template <typename Ta, typename Tb, typename Tc, typename Td>
inline auto DifferenceOfProducts(Ta a, Tb b, Tc c, Td d) {
    auto cd = c * d;
    auto differenceOfProducts = FMA(a, b, -cd);
    auto error = FMA(-c, d, cd);
    return differenceOfProducts + error;
}

template <typename Ta, typename Tb, typename Tc, typename Td>
inline auto SumOfProducts(Ta a, Tb b, Tc c, Td d) {
    auto cd = c * d;
    auto sumOfProducts = FMA(a, b, cd);
    auto error = FMA(c, d, -cd);
    return sumOfProducts + error;
}

// Returns the _i_th element of a pseudo-random permutation of [0, l),
// determined by the seed _p_.
inline int PermutationElement(uint32_t i, uint32_t l, uint32_t p) {
    uint32_t w = l - 1;
    w |= w >> 1;
    w |= w >> 2;
    w |= w >> 4;
    w |= w >> 8;
    w |= w >> 16;
    do {
        i ^= p;
        i *= 0xe170893d;
        i ^= p >> 16;
        i ^= (i & w) >> 4;
        i ^= p >> 8;
        i *= 0x0929eb3f;
        i ^= p >> 23;
        i ^= (i & w) >> 1;
        i *= 1 | p >> 27;
        i *= 0x6935fa69;
        i ^= (i & w) >> 11;
        i *= 0x74dcb303;
        i ^= (i & w) >> 2;
        i *= 0x9e501cc3;
        i ^= (i & w) >> 2;
        i *= 0xc860a3df;
        i &= w;
        i ^= i >> 5;
    } while (i >= l);
    return (i + p) % l;
}

// SquareMatrix Definition
// Row-major _N_x_N_ matrix; default-constructed matrices are the identity.
template <int N>
class SquareMatrix {
  public:
    // SquareMatrix Public Methods
    SquareMatrix() {
        for (int i = 0; i < N * N; ++i)
            m[i / N][i % N] = (i / N == i % N) ? 1 : 0;
    }
    SquareMatrix(const Float mat[N][N]) {
        std::copy(&mat[0][0], &mat[0][0] + N * N, &m[0][0]);
    }
    // Takes all N*N entries in row-major order
    template <typename... Args>
    SquareMatrix(Float v, Args... args) {
        static_assert(1 + sizeof...(Args) == N * N,
                      "SquareMatrix needs exactly N*N values");
        const Float values[] = {v, Float(args)...};
        std::copy(values, values + N * N, &m[0][0]);
    }

    bool operator==(const SquareMatrix<N> &m2) const {
        return std::equal(&m[0][0], &m[0][0] + N * N, &m2.m[0][0]);
    }
    bool operator!=(const SquareMatrix<N> &m2) const { return !(*this == m2); }

    bool IsIdentity() const { return *this == SquareMatrix<N>(); }

    std::string ToString() const;

    const Float *operator[](int i) const { return m[i]; }
    Float *operator[](int i) { return m[i]; }

  private:
    Float m[N][N];
};

// Returns an unset optional when _m_ is singular
template <int N>
std::optional<SquareMatrix<N>> Inverse(const SquareMatrix<N> &m);

template <int N>
inline SquareMatrix<N> operator*(const SquareMatrix<N> &a, const SquareMatrix<N> &b) {
    SquareMatrix<N> r;
    for (int row = 0; row < N; ++row)
        for (int col = 0; col < N; ++col) {
            Float sum = 0;
            for (int k = 0; k < N; ++k)
                sum = FMA(a[row][k], b[k][col], sum);
            r[row][col] = sum;
        }
    return r;
}

}  // namespace lumen

#endif  // LUMEN_UTIL_MATH_H
