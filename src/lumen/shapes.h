// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_SHAPES_H
#define LUMEN_SHAPES_H

#include <lumen/lumen.h>

#include <lumen/base/shape.h>
#include <lumen/interaction.h>
#include <lumen/ray.h>
#include <lumen/util/float.h>
#include <lumen/util/math.h>
#include <lumen/util/mesh.h>
#include <lumen/util/sampling.h>
#include <lumen/util/vecmath.h>

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace lumen {

// ShapeSample Definition
struct ShapeSample {
    Interaction intr;
    Float pdf;
    std::string ToString() const;
};

// ShapeSampleContext Definition
struct ShapeSampleContext {
    // ShapeSampleContext Public Methods
    ShapeSampleContext() = default;
    ShapeSampleContext(Point3f p, Vector3f pError, Normal3f n, Normal3f ns)
        : p(p), pError(pError), n(n), ns(ns) {}
    ShapeSampleContext(const SurfaceInteraction &si)
        : p(si.p), pError(si.pError), n(si.n), ns(si.shading.n) {}

    Point3f OffsetRayOrigin(Vector3f w) const {
        return lumen::OffsetRayOrigin(p, pError, n, w);
    }
    Point3f OffsetRayOrigin(Point3f pt) const { return OffsetRayOrigin(pt - p); }
    Ray SpawnRay(Vector3f w) const { return Ray(OffsetRayOrigin(w), w); }

    std::string ToString() const;

    Point3f p;
    Vector3f pError;
    // Zero for points that are not on a surface
    Normal3f n, ns;
};

// ShapeIntersection Definition
struct ShapeIntersection {
    SurfaceInteraction intr;
    Float tHit;
    std::string ToString() const;
};

// Shapes sampled uniformly by area convert the density to solid angle at the
// reference point; these work for any shape with Sample(u), Area() and Intersect()
template <typename S>
std::optional<ShapeSample> SampleAreaAsSolidAngle(const S &shape,
                                                  const ShapeSampleContext &ctx,
                                                  Point2f u) {
    std::optional<ShapeSample> ss = shape.Sample(u);
    if (!ss)
        return {};
    Vector3f wi = ss->intr.p - ctx.p;
    if (LengthSquared(wi) == 0)
        return {};
    wi = Normalize(wi);
    ss->pdf *= DistanceSquared(ctx.p, ss->intr.p) / AbsDot(ss->intr.n, wi);
    if (IsInf(ss->pdf))
        return {};
    return ss;
}

template <typename S>
Float AreaPDFAsSolidAngle(const S &shape, const ShapeSampleContext &ctx, Vector3f wi) {
    std::optional<ShapeIntersection> isect = shape.Intersect(ctx.SpawnRay(wi));
    if (!isect)
        return 0;
    Float pdf = DistanceSquared(ctx.p, isect->intr.p) /
                (AbsDot(isect->intr.n, wi) * shape.Area());
    return IsInf(pdf) ? 0 : pdf;
}

// Sphere Definition
// A full sphere given directly in render space.
class Sphere {
  public:
    // Sphere Public Methods
    Sphere(Point3f center, Float radius, bool reverseOrientation = false)
        : center(center), radius(radius), reverseOrientation(reverseOrientation) {}

    std::string ToString() const;

    Bounds3f Bounds() const {
        return Bounds3f(center - Vector3f(radius, radius, radius),
                        center + Vector3f(radius, radius, radius));
    }

    std::optional<ShapeIntersection> Intersect(const Ray &ray, Float tMax = Infinity) const;
    bool IntersectP(const Ray &ray, Float tMax = Infinity) const {
        return BasicIntersect(ray, tMax).has_value();
    }

    Float Area() const { return 4 * Pi * Sqr(radius); }

    std::optional<ShapeSample> Sample(Point2f u) const;
    Float PDF(const Interaction &) const { return 1 / Area(); }

    std::optional<ShapeSample> Sample(const ShapeSampleContext &ctx, Point2f u) const;
    Float PDF(const ShapeSampleContext &ctx, Vector3f wi) const;

    Point3f Center() const { return center; }
    Float Radius() const { return radius; }

  private:
    // Sphere Private Methods
    struct QuadricIntersection {
        Float tHit;
        // Hit point relative to the center
        Vector3f pObj;
    };
    std::optional<QuadricIntersection> BasicIntersect(const Ray &r, Float tMax) const;
    SurfaceInteraction InteractionFromIntersection(const QuadricIntersection &isect,
                                                   Vector3f wo) const;
    Point2f UV(Vector3f pObj) const;

    // Sphere Private Members
    Point3f center;
    Float radius;
    bool reverseOrientation;
};

// TriangleIntersection Definition
struct TriangleIntersection {
    Float b0, b1, b2;
    Float t;
    std::string ToString() const;
};

// Triangle Function Declarations
std::optional<TriangleIntersection> IntersectTriangle(const Ray &ray, Float tMax,
                                                      Point3f p0, Point3f p1, Point3f p2);

// Triangle Definition
class Triangle {
  public:
    // Triangle Public Methods
    // Allocates one _Triangle_ per face of _mesh_ from _alloc_
    static std::vector<Shape> CreateTriangles(const TriangleMesh *mesh, Allocator alloc);

    Triangle() = default;
    Triangle(const TriangleMesh *mesh, int triIndex) : mesh(mesh), triIndex(triIndex) {}

    Bounds3f Bounds() const;

    std::optional<ShapeIntersection> Intersect(const Ray &ray, Float tMax = Infinity) const;
    bool IntersectP(const Ray &ray, Float tMax = Infinity) const;

    Float Area() const {
        std::array<Point3f, 3> p = Vertices();
        return 0.5f * Length(Cross(p[1] - p[0], p[2] - p[0]));
    }

    std::string ToString() const;

    std::optional<ShapeSample> Sample(Point2f u) const;
    Float PDF(const Interaction &) const { return 1 / Area(); }

    std::optional<ShapeSample> Sample(const ShapeSampleContext &ctx, Point2f u) const {
        return SampleAreaAsSolidAngle(*this, ctx, u);
    }
    Float PDF(const ShapeSampleContext &ctx, Vector3f wi) const {
        return AreaPDFAsSolidAngle(*this, ctx, wi);
    }

  private:
    // Triangle Private Methods
    const int *Indices() const { return &mesh->vertexIndices[3 * triIndex]; }
    std::array<Point3f, 3> Vertices() const {
        const int *v = Indices();
        return {mesh->p[v[0]], mesh->p[v[1]], mesh->p[v[2]]};
    }
    std::array<Point2f, 3> UVs() const {
        if (mesh->uv.empty())
            return {Point2f(0, 0), Point2f(1, 0), Point2f(1, 1)};
        const int *v = Indices();
        return {mesh->uv[v[0]], mesh->uv[v[1]], mesh->uv[v[2]]};
    }
    SurfaceInteraction InteractionFromIntersection(const TriangleIntersection &ti,
                                                   Vector3f wo) const;

    // Triangle Private Members
    const TriangleMesh *mesh = nullptr;
    int triIndex = -1;
};

// Shape Inline Method Definitions
inline Bounds3f Shape::Bounds() const {
    auto bounds = [&](auto ptr) { return ptr->Bounds(); };
    return Dispatch(bounds);
}

inline std::optional<ShapeIntersection> Shape::Intersect(const Ray &ray, Float tMax) const {
    auto intr = [&](auto ptr) { return ptr->Intersect(ray, tMax); };
    return Dispatch(intr);
}

inline bool Shape::IntersectP(const Ray &ray, Float tMax) const {
    auto intr = [&](auto ptr) { return ptr->IntersectP(ray, tMax); };
    return Dispatch(intr);
}

inline Float Shape::Area() const {
    auto area = [&](auto ptr) { return ptr->Area(); };
    return Dispatch(area);
}

inline std::optional<ShapeSample> Shape::Sample(Point2f u) const {
    auto sample = [&](auto ptr) { return ptr->Sample(u); };
    return Dispatch(sample);
}

inline Float Shape::PDF(const Interaction &in) const {
    auto pdf = [&](auto ptr) { return ptr->PDF(in); };
    return Dispatch(pdf);
}

inline std::optional<ShapeSample> Shape::Sample(const ShapeSampleContext &ctx,
                                                Point2f u) const {
    auto sample = [&](auto ptr) { return ptr->Sample(ctx, u); };
    return Dispatch(sample);
}

inline Float Shape::PDF(const ShapeSampleContext &ctx, Vector3f wi) const {
    auto pdf = [&](auto ptr) { return ptr->PDF(ctx, wi); };
    return Dispatch(pdf);
}

}  // namespace lumen

#endif  // LUMEN_SHAPES_H
