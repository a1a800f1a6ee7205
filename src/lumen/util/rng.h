// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_UTIL_RNG_H
#define LUMEN_UTIL_RNG_H

#include <lumen/lumen.h>

#include <lumen/util/check.h>
#include <lumen/util/float.h>
#include <lumen/util/hash.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>

namespace lumen {

// RNG Definition
// PCG32 (O'Neill 2014): a 64-bit LCG whose state is permuted down to 32-bit
// outputs. Each sequence index selects an independent stream, and Advance()
// jumps ahead in O(log n) steps.
class RNG {
  public:
    // RNG Public Methods
    RNG() : state(DefaultState), inc(DefaultStream) {}
    RNG(uint64_t seqIndex, uint64_t seed) { SetSequence(seqIndex, seed); }
    RNG(uint64_t seqIndex) { SetSequence(seqIndex); }

    void SetSequence(uint64_t sequenceIndex, uint64_t seed) {
        state = 0u;
        inc = (sequenceIndex << 1u) | 1u;
        Step();
        state += seed;
        Step();
    }
    void SetSequence(uint64_t sequenceIndex) {
        SetSequence(sequenceIndex, MixBits(sequenceIndex));
    }

    template <typename T>
    T Uniform();

    // Uniform integer in _[0, b)_, rejecting the biased low values
    template <typename T>
    typename std::enable_if_t<std::is_integral_v<T>, T> Uniform(T b) {
        T threshold = (~b + 1u) % b;
        for (T r = Uniform<T>();; r = Uniform<T>())
            if (r >= threshold)
                return r % b;
    }

    void Advance(int64_t delta);

    std::string ToString() const;

  private:
    static constexpr uint64_t DefaultState = 0x853c49e6748fea9bULL;
    static constexpr uint64_t DefaultStream = 0xda3e39cb94b95bdbULL;
    static constexpr uint64_t Multiplier = 0x5851f42d4c957f2dULL;

    // Advances the LCG and returns the previous state
    uint64_t Step() {
        uint64_t old = state;
        state = old * Multiplier + inc;
        return old;
    }

    // RNG Private Members
    uint64_t state, inc;
};

// RNG Inline Method Definitions
template <>
inline uint32_t RNG::Uniform<uint32_t>() {
    uint64_t s = Step();
    // XSH RR output permutation
    uint32_t xorshifted = uint32_t(((s >> 18u) ^ s) >> 27u);
    uint32_t rot = uint32_t(s >> 59u);
    return (xorshifted >> rot) | (xorshifted << ((~rot + 1u) & 31));
}

template <>
inline uint64_t RNG::Uniform<uint64_t>() {
    uint64_t hi = Uniform<uint32_t>();
    return (hi << 32) | Uniform<uint32_t>();
}

template <>
inline float RNG::Uniform<float>() {
    return std::min<float>(FloatOneMinusEpsilon, Uniform<uint32_t>() * 0x1p-32f);
}

template <>
inline double RNG::Uniform<double>() {
    return std::min<double>(DoubleOneMinusEpsilon, Uniform<uint64_t>() * 0x1p-64);
}

inline void RNG::Advance(int64_t delta) {
    // Compose the affine map s -> m s + c with itself by repeated squaring
    // (Brown, "Random Number Generation with Arbitrary Strides", 1994)
    uint64_t m = Multiplier, c = inc;
    uint64_t accMult = 1u, accPlus = 0u;
    for (uint64_t n = uint64_t(delta); n > 0; n >>= 1) {
        if (n & 1) {
            accMult *= m;
            accPlus = accPlus * m + c;
        }
        c *= m + 1;
        m *= m;
    }
    state = accMult * state + accPlus;
}

}  // namespace lumen

#endif  // LUMEN_UTIL_RNG_H
