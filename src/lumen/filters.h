// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_FILTERS_H
#define LUMEN_FILTERS_H

#include <lumen/lumen.h>

#include <lumen/base/filter.h>
#include <lumen/util/math.h>
#include <lumen/util/sampling.h>
#include <lumen/util/vecmath.h>

#include <cmath>
#include <string>

namespace lumen {

// FilterSample Definition
struct FilterSample {
    Point2f p;
    Float weight;
};

// BoxFilter Definition
class BoxFilter {
  public:
    // BoxFilter Public Methods
    BoxFilter(const Vector2f &radius = Vector2f(0.5, 0.5)) : radius(radius) {}

    Vector2f Radius() const { return radius; }

    std::string ToString() const;

    Float Evaluate(Point2f p) const {
        return (std::abs(p.x) <= radius.x && std::abs(p.y) <= radius.y) ? 1 : 0;
    }

    FilterSample Sample(Point2f u) const {
        Point2f p(Lerp(u[0], -radius.x, radius.x), Lerp(u[1], -radius.y, radius.y));
        return {p, Float(1)};
    }

    Float Integral() const { return 2 * radius.x * 2 * radius.y; }

  private:
    Vector2f radius;
};

// TriangleFilter Definition
class TriangleFilter {
  public:
    // TriangleFilter Public Methods
    TriangleFilter(const Vector2f &radius = Vector2f(1, 1)) : radius(radius) {}

    Vector2f Radius() const { return radius; }

    std::string ToString() const;

    Float Evaluate(Point2f p) const {
        return std::max<Float>(0, radius.x - std::abs(p.x)) *
               std::max<Float>(0, radius.y - std::abs(p.y));
    }

    // The tent is sampled exactly, so every sample carries unit weight.
    FilterSample Sample(Point2f u) const {
        return {Point2f(SampleTent(u[0], radius.x), SampleTent(u[1], radius.y)),
                Float(1)};
    }

    Float Integral() const { return Sqr(radius.x) * Sqr(radius.y); }

  private:
    Vector2f radius;
};

inline Float Filter::Evaluate(Point2f p) const {
    auto eval = [&](auto ptr) { return ptr->Evaluate(p); };
    return Dispatch(eval);
}

inline FilterSample Filter::Sample(Point2f u) const {
    auto sample = [&](auto ptr) { return ptr->Sample(u); };
    return Dispatch(sample);
}

inline Vector2f Filter::Radius() const {
    auto radius = [&](auto ptr) { return ptr->Radius(); };
    return Dispatch(radius);
}

inline Float Filter::Integral() const {
    auto integral = [&](auto ptr) { return ptr->Integral(); };
    return Dispatch(integral);
}

}  // namespace lumen

#endif  // LUMEN_FILTERS_H
