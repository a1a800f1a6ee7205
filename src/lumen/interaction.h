// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_INTERACTION_H
#define LUMEN_INTERACTION_H

#include <lumen/lumen.h>

#include <lumen/base/light.h>
#include <lumen/base/material.h>
#include <lumen/base/sampler.h>
#include <lumen/ray.h>
#include <lumen/util/check.h>
#include <lumen/util/color.h>
#include <lumen/util/vecmath.h>

#include <string>

namespace lumen {

// Interaction Definition
class Interaction {
  public:
    // Interaction Public Methods
    Interaction() = default;

    Interaction(Point3f p, Vector3f pError, Normal3f n, Point2f uv, Vector3f wo)
        : p(p), pError(pError), wo(Normalize(wo)), n(n), uv(uv) {}
    Interaction(Point3f p, Vector3f pError, Normal3f n, Point2f uv = {})
        : p(p), pError(pError), n(n), uv(uv) {}
    Interaction(Point3f p, Normal3f n) : p(p), n(n) {}

    bool IsSurfaceInteraction() const { return n != Normal3f(0, 0, 0); }

    std::string ToString() const;

    Point3f OffsetRayOrigin(Vector3f w) const {
        return lumen::OffsetRayOrigin(p, pError, n, w);
    }

    Point3f OffsetRayOrigin(Point3f pt) const { return OffsetRayOrigin(pt - p); }

    Ray SpawnRay(Vector3f d) const { return Ray(OffsetRayOrigin(d), d); }

    // These rays reach their target at t = 1
    Ray SpawnRayTo(Point3f p2) const { return lumen::SpawnRayTo(p, pError, n, p2); }

    Ray SpawnRayTo(const Interaction &it) const {
        return lumen::SpawnRayTo(p, pError, n, it.p, it.pError, it.n);
    }

    // Interaction Public Members
    Point3f p;
    // Conservative bound on the floating-point error in _p_
    Vector3f pError;
    Vector3f wo;
    Normal3f n;
    Point2f uv;
};

// MaterialEvalContext Definition
struct MaterialEvalContext {
    MaterialEvalContext() = default;
    MaterialEvalContext(const SurfaceInteraction &si);

    std::string ToString() const;

    Point3f p;
    Normal3f n, ns;
    Vector3f dpdus;
    Vector3f wo;
    Point2f uv;
};

// SurfaceInteraction Definition
class SurfaceInteraction : public Interaction {
  public:
    // SurfaceInteraction Public Methods
    SurfaceInteraction() = default;

    SurfaceInteraction(Point3f p, Vector3f pError, Point2f uv, Vector3f wo, Vector3f dpdu,
                       Vector3f dpdv, bool flipNormal)
        : Interaction(p, pError, Normal3f(Normalize(Cross(dpdu, dpdv))), uv, wo),
          dpdu(dpdu),
          dpdv(dpdv) {
        // Initialize shading geometry from true geometry
        shading.n = n;
        shading.dpdu = dpdu;
        shading.dpdv = dpdv;

        // Adjust normal based on orientation and handedness
        if (flipNormal) {
            n *= -1;
            shading.n *= -1;
        }
    }

    void SetShadingGeometry(Normal3f ns, Vector3f dpdus, Vector3f dpdvs,
                            bool orientationIsAuthoritative) {
        shading.n = ns;
        DCHECK_NE(shading.n, Normal3f(0, 0, 0));
        if (orientationIsAuthoritative)
            n = FaceForward(n, shading.n);
        else
            shading.n = FaceForward(shading.n, n);

        shading.dpdu = dpdus;
        shading.dpdv = dpdvs;
        while (LengthSquared(shading.dpdu) > 1e16f || LengthSquared(shading.dpdv) > 1e16f) {
            shading.dpdu /= 1e8f;
            shading.dpdv /= 1e8f;
        }
    }

    void SetIntersectionProperties(Material mtl, Light area) {
        material = mtl;
        areaLight = area;
        CHECK_GE(Dot(n, shading.n), 0.);
    }

    // Returns an unset BSDF for surfaces without a material
    BSDF GetBSDF(ScratchBuffer &scratchBuffer, Sampler sampler) const;

    // Radiance emitted toward _w_ if the surface is part of an area light
    RGB Le(Vector3f w) const;

    std::string ToString() const;

    // SurfaceInteraction Public Members
    Vector3f dpdu, dpdv;
    struct {
        Normal3f n;
        Vector3f dpdu, dpdv;
    } shading;
    Material material;
    Light areaLight;
};

}  // namespace lumen

#endif  // LUMEN_INTERACTION_H
