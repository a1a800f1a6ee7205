// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_CPU_PRIMITIVE_H
#define LUMEN_CPU_PRIMITIVE_H

#include <lumen/lumen.h>

#include <lumen/base/light.h>
#include <lumen/base/material.h>
#include <lumen/base/shape.h>
#include <lumen/util/taggedptr.h>
#include <lumen/util/vecmath.h>

#include <optional>
#include <string>

namespace lumen {

class GeometricPrimitive;
class BVHAggregate;

// Primitive Definition
class Primitive : public TaggedPointer<GeometricPrimitive, BVHAggregate> {
  public:
    // Primitive Interface
    using TaggedPointer::TaggedPointer;

    Bounds3f Bounds() const;

    std::optional<ShapeIntersection> Intersect(const Ray &r,
                                               Float tMax = Infinity) const;
    bool IntersectP(const Ray &r, Float tMax = Infinity) const;
};

// GeometricPrimitive Definition
// Binds a shape to the material that shades it and, for emitters, the area
// light that it carries.
class GeometricPrimitive {
  public:
    // GeometricPrimitive Public Methods
    GeometricPrimitive(Shape shape, Material material, Light areaLight);
    Bounds3f Bounds() const;
    std::optional<ShapeIntersection> Intersect(const Ray &r, Float tMax) const;
    bool IntersectP(const Ray &r, Float tMax) const;

    Shape GetShape() const { return shape; }
    Material GetMaterial() const { return material; }
    Light GetAreaLight() const { return areaLight; }

    std::string ToString() const;

  private:
    // GeometricPrimitive Private Members
    Shape shape;
    Material material;
    Light areaLight;
};

}  // namespace lumen

#endif  // LUMEN_CPU_PRIMITIVE_H
