// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/lights.h>

#include <lumen/util/check.h>
#include <lumen/util/error.h>
#include <lumen/util/log.h>
#include <lumen/util/print.h>

namespace lumen {

std::string ToString(LightType lf) {
    switch (lf) {
    case LightType::DeltaDirection:
        return "DeltaDirection";
    case LightType::Area:
        return "Area";
    case LightType::Infinite:
        return "Infinite";
    default:
        LOG_FATAL("Unhandled type");
        return "";
    }
}

std::string LightLiSample::ToString() const {
    return StringPrintf("[ LightLiSample L: %s wi: %s pdf: %f pLight: %s ]", L, wi, pdf,
                        pLight);
}

std::string LightSampleContext::ToString() const {
    return StringPrintf("[ LightSampleContext p: %s pError: %s n: %s ns: %s ]", p, pError,
                        n, ns);
}

// DistantLight Method Definitions
RGB DistantLight::Phi() const {
    return scale * Lemit * Pi * Sqr(sceneRadius);
}

std::string DistantLight::ToString() const {
    return StringPrintf("[ DistantLight w: %s Lemit: %s scale: %f ]", w, Lemit, scale);
}

// DiffuseAreaLight Method Definitions
DiffuseAreaLight::DiffuseAreaLight(Shape shape, const RGB &Lemit, Float scale,
                                   bool twoSided)
    : LightBase(LightType::Area),
      shape(shape),
      area(shape.Area()),
      twoSided(twoSided),
      Lemit(Lemit),
      scale(scale) {
    CHECK(shape);
    if (Lemit.r < 0 || Lemit.g < 0 || Lemit.b < 0)
        ErrorExit("%s: negative emitted radiance for area light.", Lemit);
    if (area == 0)
        Warning("Area light attached to a shape with zero area will never be sampled.");
}

std::optional<LightLiSample> DiffuseAreaLight::SampleLi(LightSampleContext ctx,
                                                        Point2f u) const {
    // Sample point on shape for _DiffuseAreaLight_
    ShapeSampleContext shapeCtx(ctx.p, ctx.pError, ctx.n, ctx.ns);
    std::optional<ShapeSample> ss = shape.Sample(shapeCtx, u);
    if (!ss || ss->pdf == 0 || LengthSquared(ss->intr.p - ctx.p) == 0)
        return {};
    DCHECK(!IsNaN(ss->pdf));

    // Return _LightLiSample_ for sampled point on shape
    Vector3f wi = Normalize(ss->intr.p - ctx.p);
    RGB Le = L(ss->intr.p, ss->intr.n, ss->intr.uv, -wi);
    if (!Le)
        return {};
    return LightLiSample(Le, wi, ss->pdf, ss->intr);
}

Float DiffuseAreaLight::PDF_Li(LightSampleContext ctx, Vector3f wi) const {
    ShapeSampleContext shapeCtx(ctx.p, ctx.pError, ctx.n, ctx.ns);
    if (!twoSided) {
        // _SampleLi()_ never returns points seen from the back of the light
        std::optional<ShapeIntersection> isect = shape.Intersect(shapeCtx.SpawnRay(wi));
        if (!isect || Dot(isect->intr.n, -wi) < 0)
            return 0;
    }
    return shape.PDF(shapeCtx, wi);
}

RGB DiffuseAreaLight::Phi() const {
    return Lemit * (twoSided ? 2 : 1) * scale * area * Pi;
}

std::string DiffuseAreaLight::ToString() const {
    return StringPrintf("[ DiffuseAreaLight area: %f twoSided: %s Lemit: %s scale: %f "
                        "shape: %s ]",
                        area, twoSided, Lemit, scale, shape);
}

// UniformInfiniteLight Method Definitions
RGB UniformInfiniteLight::Phi() const {
    return 4 * Pi * Pi * Sqr(sceneRadius) * scale * Lemit;
}

std::string UniformInfiniteLight::ToString() const {
    return StringPrintf("[ UniformInfiniteLight Lemit: %s scale: %f ]", Lemit, scale);
}

// Light Method Definitions
RGB Light::Phi() const {
    auto phi = [&](auto ptr) { return ptr->Phi(); };
    return Dispatch(phi);
}

void Light::Preprocess(const Bounds3f &sceneBounds) {
    auto preprocess = [&](auto ptr) { return ptr->Preprocess(sceneBounds); };
    return Dispatch(preprocess);
}

std::string Light::ToString() const {
    if (!ptr())
        return "(nullptr)";

    auto ts = [&](auto ptr) { return ptr->ToString(); };
    return Dispatch(ts);
}

}  // namespace lumen
