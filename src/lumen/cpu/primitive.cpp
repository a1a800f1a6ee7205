// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/cpu/primitive.h>

#include <lumen/cpu/aggregates.h>
#include <lumen/interaction.h>
#include <lumen/lights.h>
#include <lumen/materials.h>
#include <lumen/shapes.h>
#include <lumen/util/check.h>
#include <lumen/util/print.h>
#include <lumen/util/taggedptr.h>
#include <lumen/util/vecmath.h>

namespace lumen {

Bounds3f Primitive::Bounds() const {
    auto bounds = [&](auto ptr) { return ptr->Bounds(); };
    return Dispatch(bounds);
}

std::optional<ShapeIntersection> Primitive::Intersect(const Ray &r, Float tMax) const {
    auto isect = [&](auto ptr) { return ptr->Intersect(r, tMax); };
    return Dispatch(isect);
}

bool Primitive::IntersectP(const Ray &r, Float tMax) const {
    auto isectp = [&](auto ptr) { return ptr->IntersectP(r, tMax); };
    return Dispatch(isectp);
}

// GeometricPrimitive Method Definitions
GeometricPrimitive::GeometricPrimitive(Shape shape, Material material, Light areaLight)
    : shape(shape), material(material), areaLight(areaLight) {
    CHECK(shape);
}

Bounds3f GeometricPrimitive::Bounds() const {
    return shape.Bounds();
}

std::optional<ShapeIntersection> GeometricPrimitive::Intersect(const Ray &r,
                                                               Float tMax) const {
    std::optional<ShapeIntersection> si = shape.Intersect(r, tMax);
    if (!si)
        return {};
    CHECK_LT(si->tHit, 1.001 * tMax);

    // Initialize _SurfaceInteraction_ after _Shape_ intersection
    si->intr.SetIntersectionProperties(material, areaLight);
    return si;
}

bool GeometricPrimitive::IntersectP(const Ray &r, Float tMax) const {
    return shape.IntersectP(r, tMax);
}

std::string GeometricPrimitive::ToString() const {
    return StringPrintf("[ GeometricPrimitive shape: %s material: %s areaLight: %s ]",
                        shape, material, areaLight);
}

}  // namespace lumen
