// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_UTIL_COLOR_H
#define LUMEN_UTIL_COLOR_H

#include <lumen/lumen.h>

#include <lumen/util/check.h>
#include <lumen/util/float.h>
#include <lumen/util/math.h>

#include <algorithm>
#include <cmath>
#include <string>

namespace lumen {

// RGB Definition
// Linear Rec.709 triple; used for reflectances, radiance and path throughput alike.
class RGB {
  public:
    // RGB Public Methods
    RGB() = default;
    RGB(Float r, Float g, Float b) : r(r), g(g), b(b) {}
    explicit RGB(Float c) : r(c), g(c), b(c) {}

    RGB &operator+=(const RGB &s) {
        r += s.r;
        g += s.g;
        b += s.b;
        return *this;
    }
    RGB operator+(const RGB &s) const {
        RGB ret = *this;
        return ret += s;
    }

    RGB &operator-=(const RGB &s) {
        r -= s.r;
        g -= s.g;
        b -= s.b;
        return *this;
    }
    RGB operator-(const RGB &s) const {
        RGB ret = *this;
        return ret -= s;
    }
    friend RGB operator-(Float a, const RGB &s) { return {a - s.r, a - s.g, a - s.b}; }

    RGB &operator*=(const RGB &s) {
        r *= s.r;
        g *= s.g;
        b *= s.b;
        return *this;
    }
    RGB operator*(const RGB &s) const {
        RGB ret = *this;
        return ret *= s;
    }
    RGB operator*(Float a) const {
        DCHECK(!IsNaN(a));
        return {a * r, a * g, a * b};
    }
    RGB &operator*=(Float a) {
        DCHECK(!IsNaN(a));
        r *= a;
        g *= a;
        b *= a;
        return *this;
    }
    friend RGB operator*(Float a, const RGB &s) { return s * a; }

    RGB &operator/=(const RGB &s) {
        r /= s.r;
        g /= s.g;
        b /= s.b;
        return *this;
    }
    RGB operator/(const RGB &s) const {
        RGB ret = *this;
        return ret /= s;
    }
    RGB &operator/=(Float a) {
        DCHECK(!IsNaN(a));
        DCHECK_NE(a, 0);
        r /= a;
        g /= a;
        b /= a;
        return *this;
    }
    RGB operator/(Float a) const {
        RGB ret = *this;
        return ret /= a;
    }

    RGB operator-() const { return {-r, -g, -b}; }

    bool operator==(const RGB &s) const { return r == s.r && g == s.g && b == s.b; }
    bool operator!=(const RGB &s) const { return r != s.r || g != s.g || b != s.b; }

    // True if any channel is nonzero
    explicit operator bool() const { return r != 0 || g != 0 || b != 0; }

    Float operator[](int c) const {
        DCHECK(c >= 0 && c < 3);
        if (c == 0)
            return r;
        else if (c == 1)
            return g;
        return b;
    }
    Float &operator[](int c) {
        DCHECK(c >= 0 && c < 3);
        if (c == 0)
            return r;
        else if (c == 1)
            return g;
        return b;
    }

    Float Average() const { return (r + g + b) / 3; }
    Float MaxComponentValue() const { return std::max({r, g, b}); }
    Float MinComponentValue() const { return std::min({r, g, b}); }
    Float Luminance() const { return 0.2126f * r + 0.7152f * g + 0.0722f * b; }

    bool HasNaN() const { return IsNaN(r) || IsNaN(g) || IsNaN(b); }
    bool IsFinite() const {
        return lumen::IsFinite(r) && lumen::IsFinite(g) && lumen::IsFinite(b);
    }

    std::string ToString() const;

    // RGB Public Members
    Float r = 0, g = 0, b = 0;
};

// RGB Inline Functions
inline RGB Lerp(Float t, const RGB &a, const RGB &b) {
    return (1 - t) * a + t * b;
}

inline RGB Sqrt(const RGB &rgb) {
    return RGB(SafeSqrt(rgb.r), SafeSqrt(rgb.g), SafeSqrt(rgb.b));
}

template <typename U, typename V>
inline RGB Clamp(const RGB &rgb, U min, V max) {
    return RGB(lumen::Clamp(rgb.r, min, max), lumen::Clamp(rgb.g, min, max),
               lumen::Clamp(rgb.b, min, max));
}

}  // namespace lumen

#endif  // LUMEN_UTIL_COLOR_H
