// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_RAY_H
#define LUMEN_RAY_H

#include <lumen/lumen.h>

#include <lumen/util/vecmath.h>

#include <string>

namespace lumen {

// Ray Definition
class Ray {
  public:
    // Ray Public Methods
    bool HasNaN() const { return (o.HasNaN() || d.HasNaN()); }

    std::string ToString() const;

    Ray() = default;
    Ray(Point3f o, Vector3f d) : o(o), d(d) {}

    Point3f operator()(Float t) const { return o + d * t; }

    // Ray Public Members
    Point3f o;
    Vector3f d;
};

// Ray Inline Functions
// Moves _p_ along _n_ past the box of its conservative rounding error _pError_, on
// the side _w_ points to, so the spawned ray cannot re-hit the surface it leaves.
inline Point3f OffsetRayOrigin(Point3f p, Vector3f pError, Normal3f n, Vector3f w) {
    Float d = Dot(Abs(n), pError);
    Vector3f offset = d * Vector3f(n);
    if (Dot(w, n) < 0)
        offset = -offset;
    Point3f po = p + offset;
    // Round offset point _po_ away from _p_
    for (int i = 0; i < 3; ++i) {
        if (offset[i] > 0)
            po[i] = NextFloatUp(po[i]);
        else if (offset[i] < 0)
            po[i] = NextFloatDown(po[i]);
    }
    return po;
}

inline Ray SpawnRay(Point3f p, Vector3f pError, Normal3f n, Vector3f d) {
    return Ray(OffsetRayOrigin(p, pError, n, d), d);
}

// The returned ray reaches _pTo_ at t = 1; occlusion tests use a tMax just below it
inline Ray SpawnRayTo(Point3f pFrom, Vector3f pError, Normal3f n, Point3f pTo) {
    Vector3f d = pTo - pFrom;
    return SpawnRay(pFrom, pError, n, d);
}

inline Ray SpawnRayTo(Point3f pFrom, Vector3f errFrom, Normal3f nFrom, Point3f pTo,
                      Vector3f errTo, Normal3f nTo) {
    Point3f pf = OffsetRayOrigin(pFrom, errFrom, nFrom, pTo - pFrom);
    Point3f pt = OffsetRayOrigin(pTo, errTo, nTo, pf - pTo);
    return Ray(pf, pt - pf);
}

}  // namespace lumen

#endif  // LUMEN_RAY_H
