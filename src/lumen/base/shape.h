// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_BASE_SHAPE_H
#define LUMEN_BASE_SHAPE_H

#include <lumen/lumen.h>

#include <lumen/util/float.h>
#include <lumen/util/taggedptr.h>
#include <lumen/util/vecmath.h>

#include <optional>
#include <string>

namespace lumen {

// Shape Declarations
class Triangle;
class Sphere;

struct ShapeSample;
struct ShapeIntersection;
struct ShapeSampleContext;

// Shape Definition
class Shape : public TaggedPointer<Sphere, Triangle> {
  public:
    // Shape Interface
    using TaggedPointer::TaggedPointer;

    Bounds3f Bounds() const;

    std::optional<ShapeIntersection> Intersect(const Ray &ray,
                                               Float tMax = Infinity) const;
    bool IntersectP(const Ray &ray, Float tMax = Infinity) const;

    Float Area() const;

    // Uniform sampling by area; the returned pdf is with respect to area
    std::optional<ShapeSample> Sample(Point2f u) const;
    Float PDF(const Interaction &) const;

    // Sampling as seen from a reference point; pdfs are with respect to solid angle
    std::optional<ShapeSample> Sample(const ShapeSampleContext &ctx, Point2f u) const;
    Float PDF(const ShapeSampleContext &ctx, Vector3f wi) const;

    std::string ToString() const;
};

}  // namespace lumen

#endif  // LUMEN_BASE_SHAPE_H
