// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_LIGHTSAMPLERS_H
#define LUMEN_LIGHTSAMPLERS_H

#include <lumen/lumen.h>

#include <lumen/base/light.h>
#include <lumen/base/lightsampler.h>
#include <lumen/lights.h>
#include <lumen/util/hash.h>
#include <lumen/util/sampling.h>
#include <lumen/util/vecmath.h>

#include <algorithm>
#include <memory_resource>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lumen {

// LightHash Definition
struct LightHash {
    size_t operator()(Light light) const { return Hash(light.ptr()); }
};

// UniformLightSampler Definition
class UniformLightSampler {
  public:
    // UniformLightSampler Public Methods
    UniformLightSampler(const std::vector<Light> &lights, Allocator alloc)
        : lights(lights.begin(), lights.end(), alloc) {}

    std::optional<SampledLight> Sample(Float u) const {
        if (lights.empty())
            return {};
        int lightIndex = std::min<int>(u * lights.size(), lights.size() - 1);
        return SampledLight{lights[lightIndex], 1.f / lights.size()};
    }

    Float PMF(Light light) const {
        if (lights.empty())
            return 0;
        return 1.f / lights.size();
    }

    std::optional<SampledLight> Sample(const LightSampleContext &ctx, Float u) const {
        return Sample(u);
    }

    Float PMF(const LightSampleContext &ctx, Light light) const { return PMF(light); }

    std::string ToString() const { return "UniformLightSampler"; }

  private:
    // UniformLightSampler Private Members
    std::pmr::vector<Light> lights;
};

// PowerLightSampler Definition
// Chooses lights in proportion to their emitted power; if no light emits,
// every light is equally likely.
class PowerLightSampler {
  public:
    // PowerLightSampler Public Methods
    PowerLightSampler(const std::vector<Light> &lights, Allocator alloc);

    std::optional<SampledLight> Sample(Float u) const {
        if (!aliasTable.size())
            return {};
        Float pmf;
        int lightIndex = aliasTable.Sample(u, &pmf);
        return SampledLight{lights[lightIndex], pmf};
    }

    Float PMF(Light light) const {
        if (!aliasTable.size())
            return 0;
        auto iter = lightToIndex.find(light);
        if (iter == lightToIndex.end())
            return 0;
        return aliasTable.PMF(iter->second);
    }

    std::optional<SampledLight> Sample(const LightSampleContext &ctx, Float u) const {
        return Sample(u);
    }

    Float PMF(const LightSampleContext &ctx, Light light) const { return PMF(light); }

    std::string ToString() const;

  private:
    // PowerLightSampler Private Members
    std::pmr::vector<Light> lights;
    std::pmr::unordered_map<Light, size_t, LightHash> lightToIndex;
    AliasTable aliasTable;
};

// LightSampler Inline Methods
inline std::optional<SampledLight> LightSampler::Sample(const LightSampleContext &ctx,
                                                        Float u) const {
    auto s = [&](auto ptr) { return ptr->Sample(ctx, u); };
    return Dispatch(s);
}

inline Float LightSampler::PMF(const LightSampleContext &ctx, Light light) const {
    auto pmf = [&](auto ptr) { return ptr->PMF(ctx, light); };
    return Dispatch(pmf);
}

inline std::optional<SampledLight> LightSampler::Sample(Float u) const {
    auto sample = [&](auto ptr) { return ptr->Sample(u); };
    return Dispatch(sample);
}

inline Float LightSampler::PMF(Light light) const {
    auto pmf = [&](auto ptr) { return ptr->PMF(light); };
    return Dispatch(pmf);
}

}  // namespace lumen

#endif  // LUMEN_LIGHTSAMPLERS_H
