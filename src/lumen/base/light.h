// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_BASE_LIGHT_H
#define LUMEN_BASE_LIGHT_H

#include <lumen/lumen.h>

#include <lumen/util/color.h>
#include <lumen/util/taggedptr.h>
#include <lumen/util/vecmath.h>

#include <optional>
#include <string>

namespace lumen {

// LightType Definition
enum class LightType { DeltaDirection, Area, Infinite };

std::string ToString(LightType type);

class DistantLight;
class DiffuseAreaLight;
class UniformInfiniteLight;

class LightSampleContext;
struct LightLiSample;

// Light Definition
class Light : public TaggedPointer<DistantLight, DiffuseAreaLight, UniformInfiniteLight> {
  public:
    // Light Interface
    using TaggedPointer::TaggedPointer;

    // Total emitted power
    RGB Phi() const;

    LightType Type() const;

    // Incident illumination at the reference point; pdf is with respect to solid
    // angle and does not include the probability of choosing this light
    std::optional<LightLiSample> SampleLi(LightSampleContext ctx, Point2f u) const;
    Float PDF_Li(LightSampleContext ctx, Vector3f wi) const;

    std::string ToString() const;

    // AreaLights only
    RGB L(Point3f p, Normal3f n, Point2f uv, Vector3f w) const;

    // InfiniteLights only
    RGB Le(const Ray &ray) const;

    void Preprocess(const Bounds3f &sceneBounds);
};

// Light Inline Functions
inline bool IsDeltaLight(LightType type) {
    return type == LightType::DeltaDirection;
}

}  // namespace lumen

#endif  // LUMEN_BASE_LIGHT_H
