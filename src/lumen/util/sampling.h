// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_UTIL_SAMPLING_H
#define LUMEN_UTIL_SAMPLING_H

#include <lumen/lumen.h>

#include <lumen/util/check.h>
#include <lumen/util/math.h>
#include <lumen/util/vecmath.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <string>
#include <vector>

namespace lumen {

// Sampling Inline Functions
inline Vector3f SampleUniformHemisphere(Point2f u) {
    Float z = u[0];
    Float r = SafeSqrt(1 - z * z);
    Float phi = 2 * Pi * u[1];
    return {r * std::cos(phi), r * std::sin(phi), z};
}

inline Float UniformHemispherePDF() {
    return Inv2Pi;
}

inline Vector3f SampleUniformSphere(Point2f u) {
    Float z = 1 - 2 * u[0];
    Float r = SafeSqrt(1 - z * z);
    Float phi = 2 * Pi * u[1];
    return {r * std::cos(phi), r * std::sin(phi), z};
}

inline Float UniformSpherePDF() {
    return Inv4Pi;
}

inline Point2f SampleUniformDiskConcentric(Point2f u) {
    // Map _u_ to $[-1,1]^2$; the origin maps to itself
    Point2f uOffset(2 * u.x - 1, 2 * u.y - 1);
    if (uOffset.x == 0 && uOffset.y == 0)
        return {0, 0};

    Float theta, r;
    if (std::abs(uOffset.x) > std::abs(uOffset.y)) {
        r = uOffset.x;
        theta = PiOver4 * (uOffset.y / uOffset.x);
    } else {
        r = uOffset.y;
        theta = PiOver2 - PiOver4 * (uOffset.x / uOffset.y);
    }
    return r * Point2f(std::cos(theta), std::sin(theta));
}

inline Point2f SampleUniformDiskPolar(Point2f u) {
    Float r = std::sqrt(u[0]);
    Float theta = 2 * Pi * u[1];
    return {r * std::cos(theta), r * std::sin(theta)};
}

// Malley's method: project a uniform disk sample up onto the hemisphere
inline Vector3f SampleCosineHemisphere(Point2f u) {
    Point2f d = SampleUniformDiskConcentric(u);
    Float z = SafeSqrt(1 - d.x * d.x - d.y * d.y);
    return Vector3f(d.x, d.y, z);
}

inline Float CosineHemispherePDF(Float cosTheta) {
    return cosTheta * InvPi;
}

// Returns barycentrics (b0, b1, b2) uniformly distributed over a triangle
inline std::array<Float, 3> SampleUniformTriangle(Point2f u) {
    Float b0, b1;
    if (u[0] < u[1]) {
        b0 = u[0] / 2;
        b1 = u[1] - b0;
    } else {
        b1 = u[1] / 2;
        b0 = u[0] - b1;
    }
    return {b0, b1, 1 - b0 - b1};
}

// Samples the tent of radius _r_ by picking a side with _u_ and inverting
// the quadratic CDF of that side.
inline Float SampleTent(Float u, Float r) {
    if (u < 0.5f)
        return -r + r * std::sqrt(2 * u);
    return r - r * std::sqrt(2 - 2 * u);
}

inline Float TentPDF(Float x, Float r) {
    if (std::abs(x) >= r)
        return 0;
    return 1 / r - std::abs(x) / Sqr(r);
}

inline Float PowerHeuristic(int nf, Float fPdf, int ng, Float gPdf) {
    Float f = nf * fPdf, g = ng * gPdf;
    if (IsInf(Sqr(f)))
        return 1;
    return (f * f) / (f * f + g * g);
}

// AliasTable Definition
// Samples from a discrete distribution in constant time: every bin holds
// probability 1/n, split between its own outcome and at most one alias.
class AliasTable {
  public:
    // AliasTable Public Methods
    AliasTable() = default;
    AliasTable(const std::vector<Float> &weights, Allocator alloc = {});

    int Sample(Float u, Float *pmf = nullptr) const;

    size_t size() const { return bins.size(); }
    Float PMF(int index) const { return bins[index].p; }

    std::string ToString() const;

  private:
    // AliasTable Private Members
    struct Bin {
        // _q_ is the chance of keeping this bin's own outcome, _p_ its PMF
        Float q = 1, p = 0;
        int alias = -1;
    };
    std::pmr::vector<Bin> bins;
};

}  // namespace lumen

#endif  // LUMEN_UTIL_SAMPLING_H
