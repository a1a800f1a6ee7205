// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_BASE_SAMPLER_H
#define LUMEN_BASE_SAMPLER_H

#include <lumen/lumen.h>

#include <lumen/util/taggedptr.h>
#include <lumen/util/vecmath.h>

#include <string>
#include <vector>

namespace lumen {

// CameraSample Definition
struct CameraSample {
    Point2f pFilm;
    Point2f pLens;
    Float filterWeight = 1;
    std::string ToString() const;
};

// Sampler Declarations
class IndependentSampler;
class StratifiedSampler;

// Sampler Definition
// Every sample value is a pure function of (pixel, sample index, dimension) and
// the seed, so the order in which pixel samples are taken does not matter.
class Sampler : public TaggedPointer<IndependentSampler, StratifiedSampler> {
  public:
    // Sampler Interface
    using TaggedPointer::TaggedPointer;

    static Sampler Create(const std::string &name, int samplesPerPixel, int seed,
                          bool jitter, Allocator alloc);

    int SamplesPerPixel() const;

    void StartPixelSample(Point2i p, int sampleIndex, int dimension = 0);

    Float Get1D();
    Point2f Get2D();
    Point2f GetPixel2D();

    Sampler Clone(Allocator alloc = {});

    std::string ToString() const;
};

}  // namespace lumen

#endif  // LUMEN_BASE_SAMPLER_H
