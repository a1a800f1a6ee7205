// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/lightsamplers.h>

#include <lumen/lights.h>
#include <lumen/util/check.h>
#include <lumen/util/error.h>
#include <lumen/util/memory.h>
#include <lumen/util/print.h>

#include <numeric>

namespace lumen {

std::string SampledLight::ToString() const {
    return StringPrintf("[ SampledLight light: %s p: %f ]", light, p);
}

LightSampler LightSampler::Create(const std::string &name,
                                  const std::vector<Light> &lights, Allocator alloc) {
    if (name == "uniform")
        return NewObject<UniformLightSampler>(alloc, lights, alloc);
    else if (name == "power")
        return NewObject<PowerLightSampler>(alloc, lights, alloc);
    else {
        Error(R"(Light sample distribution type "%s" unknown. Using "power".)", name);
        return NewObject<PowerLightSampler>(alloc, lights, alloc);
    }
}

std::string LightSampler::ToString() const {
    if (!ptr())
        return "(nullptr)";

    auto ts = [&](auto ptr) { return ptr->ToString(); };
    return Dispatch(ts);
}

// PowerLightSampler Method Definitions
PowerLightSampler::PowerLightSampler(const std::vector<Light> &lights, Allocator alloc)
    : lights(lights.begin(), lights.end(), alloc), lightToIndex(alloc) {
    if (lights.empty())
        return;
    // Initialize _lightToIndex_ hash table
    for (size_t i = 0; i < lights.size(); ++i)
        lightToIndex[lights[i]] = i;

    // Compute lights' power and initialize alias table
    std::vector<Float> lightPower;
    for (const auto &light : lights) {
        RGB phi = light.Phi();
        lightPower.push_back(phi.IsFinite() ? std::max<Float>(0, phi.Average()) : 0);
    }
    if (std::accumulate(lightPower.begin(), lightPower.end(), 0.f) == 0.f)
        std::fill(lightPower.begin(), lightPower.end(), 1.f);
    aliasTable = AliasTable(lightPower, alloc);
}

std::string PowerLightSampler::ToString() const {
    return StringPrintf("[ PowerLightSampler aliasTable: %s ]", aliasTable);
}

}  // namespace lumen
