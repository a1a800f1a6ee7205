// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_BASE_LIGHTSAMPLER_H
#define LUMEN_BASE_LIGHTSAMPLER_H

#include <lumen/base/light.h>
#include <lumen/util/taggedptr.h>
#include <lumen/util/vecmath.h>

#include <optional>
#include <string>
#include <vector>

namespace lumen {

// SampledLight Definition
struct SampledLight {
    Light light;
    Float p = 0;
    std::string ToString() const;
};

class UniformLightSampler;
class PowerLightSampler;

// LightSampler Definition
class LightSampler : public TaggedPointer<UniformLightSampler, PowerLightSampler> {
  public:
    // LightSampler Interface
    using TaggedPointer::TaggedPointer;

    static LightSampler Create(const std::string &name, const std::vector<Light> &lights,
                               Allocator alloc);

    std::string ToString() const;

    std::optional<SampledLight> Sample(const LightSampleContext &ctx, Float u) const;
    Float PMF(const LightSampleContext &ctx, Light light) const;

    std::optional<SampledLight> Sample(Float u) const;
    Float PMF(Light light) const;
};

}  // namespace lumen

#endif  // LUMEN_BASE_LIGHTSAMPLER_H
