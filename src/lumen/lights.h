// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_LIGHTS_H
#define LUMEN_LIGHTS_H

#include <lumen/lumen.h>

#include <lumen/base/light.h>
#include <lumen/base/shape.h>
#include <lumen/interaction.h>
#include <lumen/ray.h>
#include <lumen/shapes.h>
#include <lumen/util/check.h>
#include <lumen/util/color.h>
#include <lumen/util/sampling.h>
#include <lumen/util/vecmath.h>

#include <optional>
#include <string>

namespace lumen {

// LightLiSample Definition
struct LightLiSample {
    // LightLiSample Public Methods
    LightLiSample() = default;
    LightLiSample(const RGB &L, Vector3f wi, Float pdf, const Interaction &pLight)
        : L(L), wi(wi), pdf(pdf), pLight(pLight) {}
    std::string ToString() const;

    RGB L;
    Vector3f wi;
    Float pdf;
    Interaction pLight;
};

// LightSampleContext Definition
class LightSampleContext {
  public:
    // LightSampleContext Public Methods
    LightSampleContext() = default;
    LightSampleContext(const SurfaceInteraction &si)
        : p(si.p), pError(si.pError), n(si.n), ns(si.shading.n) {}
    LightSampleContext(const Interaction &intr) : p(intr.p), pError(intr.pError) {}
    LightSampleContext(Point3f p, Vector3f pError, Normal3f n, Normal3f ns)
        : p(p), pError(pError), n(n), ns(ns) {}

    std::string ToString() const;

    // LightSampleContext Public Members
    Point3f p;
    Vector3f pError;
    Normal3f n, ns;
};

// LightBase Definition
class LightBase {
  public:
    // LightBase Public Methods
    LightBase(LightType type) : type(type) {}

    LightType Type() const { return type; }

    RGB L(Point3f p, Normal3f n, Point2f uv, Vector3f w) const { return RGB(0.f); }

    RGB Le(const Ray &) const { return RGB(0.f); }

  protected:
    // LightBase Protected Members
    LightType type;
};

// DistantLight Definition
// Radiance arriving from a single direction; _w_ points toward the light.
class DistantLight : public LightBase {
  public:
    // DistantLight Public Methods
    DistantLight(Vector3f w, const RGB &Lemit, Float scale)
        : LightBase(LightType::DeltaDirection),
          w(Normalize(w)),
          Lemit(Lemit),
          scale(scale) {}

    RGB Phi() const;

    Float PDF_Li(LightSampleContext, Vector3f) const { return 0; }

    std::string ToString() const;

    void Preprocess(const Bounds3f &sceneBounds) {
        sceneBounds.BoundingSphere(&sceneCenter, &sceneRadius);
    }

    std::optional<LightLiSample> SampleLi(LightSampleContext ctx, Point2f u) const {
        Point3f pOutside = ctx.p + w * (2 * sceneRadius);
        return LightLiSample(scale * Lemit, w, 1, Interaction(pOutside, Normal3f()));
    }

  private:
    // DistantLight Private Members
    Vector3f w;
    RGB Lemit;
    Float scale;
    Point3f sceneCenter;
    Float sceneRadius = 0;
};

// DiffuseAreaLight Definition
// Uniform emission from the surface of a shape. One-sided lights emit only on
// the side the surface normal faces.
class DiffuseAreaLight : public LightBase {
  public:
    // DiffuseAreaLight Public Methods
    DiffuseAreaLight(Shape shape, const RGB &Lemit, Float scale, bool twoSided);

    void Preprocess(const Bounds3f &sceneBounds) {}

    RGB Phi() const;

    std::string ToString() const;

    RGB L(Point3f p, Normal3f n, Point2f uv, Vector3f w) const {
        // Check for zero emitted radiance from point on area light
        if (!twoSided && Dot(n, w) < 0)
            return RGB(0.f);
        return scale * Lemit;
    }

    std::optional<LightLiSample> SampleLi(LightSampleContext ctx, Point2f u) const;

    Float PDF_Li(LightSampleContext ctx, Vector3f wi) const;

  private:
    // DiffuseAreaLight Private Members
    Shape shape;
    Float area;
    bool twoSided;
    RGB Lemit;
    Float scale;
};

// UniformInfiniteLight Definition
// Constant radiance arriving from every direction.
class UniformInfiniteLight : public LightBase {
  public:
    // UniformInfiniteLight Public Methods
    UniformInfiniteLight(const RGB &Lemit, Float scale)
        : LightBase(LightType::Infinite), Lemit(Lemit), scale(scale) {}

    void Preprocess(const Bounds3f &sceneBounds) {
        sceneBounds.BoundingSphere(&sceneCenter, &sceneRadius);
    }

    RGB Phi() const;

    std::string ToString() const;

    RGB Le(const Ray &ray) const { return scale * Lemit; }

    std::optional<LightLiSample> SampleLi(LightSampleContext ctx, Point2f u) const {
        // Return uniform spherical sample for uniform infinite light
        Vector3f wi = SampleUniformSphere(u);
        Float pdf = UniformSpherePDF();
        return LightLiSample(scale * Lemit, wi, pdf,
                             Interaction(ctx.p + wi * (2 * sceneRadius), Normal3f()));
    }

    Float PDF_Li(LightSampleContext ctx, Vector3f w) const { return UniformSpherePDF(); }

  private:
    // UniformInfiniteLight Private Members
    RGB Lemit;
    Float scale;
    Point3f sceneCenter;
    Float sceneRadius = 0;
};

// Light Inline Methods
inline std::optional<LightLiSample> Light::SampleLi(LightSampleContext ctx,
                                                    Point2f u) const {
    auto sample = [&](auto ptr) { return ptr->SampleLi(ctx, u); };
    return Dispatch(sample);
}

inline Float Light::PDF_Li(LightSampleContext ctx, Vector3f wi) const {
    auto pdf = [&](auto ptr) { return ptr->PDF_Li(ctx, wi); };
    return Dispatch(pdf);
}

inline RGB Light::L(Point3f p, Normal3f n, Point2f uv, Vector3f w) const {
    CHECK(Type() == LightType::Area);
    auto l = [&](auto ptr) { return ptr->L(p, n, uv, w); };
    return Dispatch(l);
}

inline RGB Light::Le(const Ray &ray) const {
    auto le = [&](auto ptr) { return ptr->Le(ray); };
    return Dispatch(le);
}

inline LightType Light::Type() const {
    auto t = [&](auto ptr) { return ptr->Type(); };
    return Dispatch(t);
}

}  // namespace lumen

#endif  // LUMEN_LIGHTS_H
