// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/samplers.h>

#include <lumen/util/check.h>
#include <lumen/util/error.h>
#include <lumen/util/log.h>
#include <lumen/util/memory.h>
#include <lumen/util/print.h>

#include <cmath>
#include <type_traits>

namespace lumen {

std::string CameraSample::ToString() const {
    return StringPrintf("[ CameraSample pFilm: %s pLens: %s filterWeight: %f ]", pFilm,
                        pLens, filterWeight);
}

Sampler Sampler::Clone(Allocator alloc) {
    auto clone = [&](auto ptr) -> Sampler {
        using SamplerType = std::remove_reference_t<decltype(*ptr)>;
        return NewObject<SamplerType>(alloc, *ptr);
    };
    return Dispatch(clone);
}

std::string Sampler::ToString() const {
    if (!ptr())
        return "(nullptr)";

    auto ts = [&](auto ptr) { return ptr->ToString(); };
    return Dispatch(ts);
}

// IndependentSampler Method Definitions
std::string IndependentSampler::ToString() const {
    return StringPrintf("[ IndependentSampler samplesPerPixel: %d seed: %d ]",
                        samplesPerPixel, seed);
}

// StratifiedSampler Method Definitions
std::string StratifiedSampler::ToString() const {
    return StringPrintf("[ StratifiedSampler xPixelSamples: %d yPixelSamples: %d "
                        "jitter: %s seed: %d ]",
                        xPixelSamples, yPixelSamples, jitter, seed);
}

Sampler Sampler::Create(const std::string &name, int samplesPerPixel, int seed,
                        bool jitter, Allocator alloc) {
    if (samplesPerPixel < 1)
        ErrorExit("%d: sample count must be positive.", samplesPerPixel);

    Sampler sampler = nullptr;
    if (name == "independent")
        sampler = NewObject<IndependentSampler>(alloc, samplesPerPixel, seed);
    else if (name == "stratified") {
        // Factor the sample count into as square a grid as possible
        int div = std::sqrt(samplesPerPixel);
        while (samplesPerPixel % div) {
            CHECK_GT(div, 0);
            --div;
        }
        int xSamples = samplesPerPixel / div;
        int ySamples = samplesPerPixel / xSamples;
        CHECK_EQ(samplesPerPixel, xSamples * ySamples);
        LOG_VERBOSE("xSamples %d ySamples %d", xSamples, ySamples);
        sampler = NewObject<StratifiedSampler>(alloc, xSamples, ySamples, jitter, seed);
    } else
        ErrorExit("%s: sampler type unknown.", name);

    return sampler;
}

}  // namespace lumen
