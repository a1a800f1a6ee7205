// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_SAMPLERS_H
#define LUMEN_SAMPLERS_H

#include <lumen/lumen.h>

#include <lumen/base/sampler.h>
#include <lumen/filters.h>
#include <lumen/options.h>
#include <lumen/util/hash.h>
#include <lumen/util/math.h>
#include <lumen/util/rng.h>
#include <lumen/util/vecmath.h>

#include <algorithm>
#include <cstdint>
#include <string>

namespace lumen {

// Every pixel gets its own RNG stream; each pixel sample starts 2^16
// values further along it, offset by the dimension it resumes at
inline void StartPixelStream(RNG &rng, Point2i p, int sampleIndex, int dimension,
                             int seed) {
    rng.SetSequence(Hash(p, seed));
    rng.Advance(sampleIndex * 65536ull + dimension);
}

// IndependentSampler Definition
class IndependentSampler {
  public:
    // IndependentSampler Public Methods
    IndependentSampler(int samplesPerPixel, int seed = 0)
        : samplesPerPixel(samplesPerPixel), seed(seed) {}

    static constexpr const char *Name() { return "IndependentSampler"; }

    int SamplesPerPixel() const { return samplesPerPixel; }

    void StartPixelSample(Point2i p, int sampleIndex, int dimension) {
        StartPixelStream(rng, p, sampleIndex, dimension, seed);
    }

    Float Get1D() { return rng.Uniform<Float>(); }
    Point2f Get2D() {
        Float u0 = rng.Uniform<Float>();
        return {u0, rng.Uniform<Float>()};
    }
    Point2f GetPixel2D() { return Get2D(); }

    std::string ToString() const;

  private:
    // IndependentSampler Private Members
    int samplesPerPixel, seed;
    RNG rng;
};

// StratifiedSampler Definition
// Jittered samples over an _xPixelSamples_ by _yPixelSamples_ grid; the strata
// are assigned to sample indices by a per-pixel, per-dimension permutation.
class StratifiedSampler {
  public:
    // StratifiedSampler Public Methods
    StratifiedSampler(int xPixelSamples, int yPixelSamples, bool jitter, int seed = 0)
        : xPixelSamples(xPixelSamples),
          yPixelSamples(yPixelSamples),
          seed(seed),
          jitter(jitter) {}

    static constexpr const char *Name() { return "StratifiedSampler"; }

    int SamplesPerPixel() const { return xPixelSamples * yPixelSamples; }

    void StartPixelSample(Point2i p, int index, int dim) {
        pixel = p;
        sampleIndex = index;
        dimension = dim;
        StartPixelStream(rng, p, index, dim, seed);
    }

    Float Get1D() {
        int stratum = NextStratum(1);
        return std::min<Float>((stratum + Offset()) / SamplesPerPixel(), OneMinusEpsilon);
    }

    Point2f Get2D() {
        int stratum = NextStratum(2);
        int x = stratum % xPixelSamples, y = stratum / xPixelSamples;
        Float dx = Offset(), dy = Offset();
        return {std::min<Float>((x + dx) / xPixelSamples, OneMinusEpsilon),
                std::min<Float>((y + dy) / yPixelSamples, OneMinusEpsilon)};
    }

    Point2f GetPixel2D() { return Get2D(); }

    std::string ToString() const;

  private:
    // StratifiedSampler Private Methods
    // The stratum this sample index maps to in the current dimension, which
    // then advances by _nDimensions_
    int NextStratum(int nDimensions) {
        uint64_t hash = MixBits((uint64_t(pixel.x) << 48) ^ (uint64_t(pixel.y) << 32) ^
                                (uint64_t(dimension) << 16) ^ uint64_t(seed));
        dimension += nDimensions;
        return PermutationElement(sampleIndex, SamplesPerPixel(), hash);
    }
    // Position within a stratum
    Float Offset() { return jitter ? rng.Uniform<Float>() : 0.5f; }

    // StratifiedSampler Private Members
    int xPixelSamples, yPixelSamples, seed;
    bool jitter;
    RNG rng;
    Point2i pixel;
    int sampleIndex = 0, dimension = 0;
};

// Sampler Inline Methods
inline int Sampler::SamplesPerPixel() const {
    auto spp = [&](auto ptr) { return ptr->SamplesPerPixel(); };
    return Dispatch(spp);
}

inline void Sampler::StartPixelSample(Point2i p, int sampleIndex, int dimension) {
    auto start = [&](auto ptr) { return ptr->StartPixelSample(p, sampleIndex, dimension); };
    return Dispatch(start);
}

inline Float Sampler::Get1D() {
    auto get = [&](auto ptr) { return ptr->Get1D(); };
    return Dispatch(get);
}

inline Point2f Sampler::Get2D() {
    auto get = [&](auto ptr) { return ptr->Get2D(); };
    return Dispatch(get);
}

inline Point2f Sampler::GetPixel2D() {
    auto get = [&](auto ptr) { return ptr->GetPixel2D(); };
    return Dispatch(get);
}

// Sampler Inline Functions
inline CameraSample GetCameraSample(Sampler sampler, Point2i pPixel, Filter filter) {
    FilterSample fs = filter.Sample(sampler.GetPixel2D());
    if (GetOptions().disablePixelJitter) {
        fs.p = Point2f(0, 0);
        fs.weight = 1;
    }

    CameraSample cs;
    cs.pFilm = pPixel + fs.p + Vector2f(0.5, 0.5);
    cs.pLens = sampler.Get2D();
    cs.filterWeight = fs.weight;
    return cs;
}

}  // namespace lumen

#endif  // LUMEN_SAMPLERS_H
