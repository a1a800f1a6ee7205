// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_UTIL_FLOAT_H
#define LUMEN_UTIL_FLOAT_H

#include <lumen/lumen.h>

#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <type_traits>

namespace lumen {

// Floating-point Constants
static constexpr Float Infinity = std::numeric_limits<Float>::infinity();

static constexpr Float MachineEpsilon = std::numeric_limits<Float>::epsilon() * 0.5;

static constexpr double DoubleOneMinusEpsilon = 0x1.fffffffffffffp-1;
static constexpr float FloatOneMinusEpsilon = 0x1.fffffep-1;
#ifdef LUMEN_FLOAT_AS_DOUBLE
static constexpr double OneMinusEpsilon = DoubleOneMinusEpsilon;
#else
static constexpr float OneMinusEpsilon = FloatOneMinusEpsilon;
#endif

namespace detail {

template <class To, class From>
inline To BitCast(const From &src) noexcept {
    static_assert(sizeof(To) == sizeof(From), "BitCast requires same-sized types");
    To dst;
    std::memcpy(&dst, &src, sizeof(To));
    return dst;
}

}  // namespace detail

// Floating-point Inline Functions
template <typename T>
inline typename std::enable_if_t<std::is_floating_point<T>::value, bool> IsNaN(T v) {
    return std::isnan(v);
}

template <typename T>
inline typename std::enable_if_t<std::is_integral<T>::value, bool> IsNaN(T v) {
    return false;
}

template <typename T>
inline typename std::enable_if_t<std::is_floating_point<T>::value, bool> IsInf(T v) {
    return std::isinf(v);
}

template <typename T>
inline typename std::enable_if_t<std::is_integral<T>::value, bool> IsInf(T v) {
    return false;
}

template <typename T>
inline typename std::enable_if_t<std::is_floating_point<T>::value, bool> IsFinite(T v) {
    return std::isfinite(v);
}

inline float FMA(float a, float b, float c) {
    return std::fma(a, b, c);
}

inline double FMA(double a, double b, double c) {
    return std::fma(a, b, c);
}

inline uint32_t FloatToBits(float f) {
    return detail::BitCast<uint32_t>(f);
}

inline float BitsToFloat(uint32_t ui) {
    return detail::BitCast<float>(ui);
}

inline uint64_t FloatToBits(double f) {
    return detail::BitCast<uint64_t>(f);
}

inline double BitsToFloat(uint64_t ui) {
    return detail::BitCast<double>(ui);
}

inline float NextFloatUp(float v) {
    // Handle infinity and negative zero for _NextFloatUp()_
    if (IsInf(v) && v > 0.f)
        return v;
    if (v == -0.f)
        v = 0.f;

    // Advance _v_ to next higher float
    uint32_t ui = FloatToBits(v);
    if (v >= 0)
        ++ui;
    else
        --ui;
    return BitsToFloat(ui);
}

inline float NextFloatDown(float v) {
    // Handle infinity and positive zero for _NextFloatDown()_
    if (IsInf(v) && v < 0.)
        return v;
    if (v == 0.f)
        v = -0.f;
    uint32_t ui = FloatToBits(v);
    if (v > 0)
        --ui;
    else
        ++ui;
    return BitsToFloat(ui);
}

inline double NextFloatUp(double v) {
    if (IsInf(v) && v > 0.)
        return v;
    if (v == -0.)
        v = 0.;
    uint64_t ui = FloatToBits(v);
    if (v >= 0.)
        ++ui;
    else
        --ui;
    return BitsToFloat(ui);
}

inline double NextFloatDown(double v) {
    if (IsInf(v) && v < 0.)
        return v;
    if (v == 0.)
        v = -0.;
    uint64_t ui = FloatToBits(v);
    if (v > 0.)
        --ui;
    else
        ++ui;
    return BitsToFloat(ui);
}

// Conservative bound on the relative error of _n_ floating-point operations
inline constexpr Float gamma(int n) {
    return (n * MachineEpsilon) / (1 - n * MachineEpsilon);
}

}  // namespace lumen

#endif  // LUMEN_UTIL_FLOAT_H
