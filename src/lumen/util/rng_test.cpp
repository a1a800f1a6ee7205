// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <gtest/gtest.h>

#include <lumen/lumen.h>
#include <lumen/util/rng.h>

#include <vector>

using namespace lumen;

TEST(RNG, Reseed) {
    RNG rng(1234);
    std::vector<uint32_t> values;
    for (int i = 0; i < 100; ++i)
        values.push_back(rng.Uniform<uint32_t>());

    rng.SetSequence(1234);
    for (int i = 0; i < values.size(); ++i)
        EXPECT_EQ(values[i], rng.Uniform<uint32_t>());
}

TEST(RNG, Advance) {
    // Must use float: a double consumes two 32-bit values from the stream.
    RNG rng;
    rng.SetSequence(1234, 6502);
    std::vector<float> v;
    for (int i = 0; i < 1000; ++i)
        v.push_back(rng.Uniform<float>());

    rng.SetSequence(1234, 6502);
    rng.Advance(16);
    EXPECT_EQ(rng.Uniform<float>(), v[16]);

    for (int i = v.size() - 1; i >= 0; --i) {
        rng.SetSequence(1234, 6502);
        rng.Advance(i);
        EXPECT_EQ(rng.Uniform<float>(), v[i]);
    }

    // Switch to another sequence
    rng.SetSequence(32);
    rng.Uniform<float>();

    // Go back and check one last time
    for (int i : {5, 998, 552, 37, 16}) {
        rng.SetSequence(1234, 6502);
        rng.Advance(i);
        EXPECT_EQ(rng.Uniform<float>(), v[i]);
    }
}

TEST(RNG, AdvanceBackwards) {
    // Negative steps wrap around the 2^64 period
    RNG ra(1337);
    std::vector<uint32_t> v;
    for (int i = 0; i < 50; ++i)
        v.push_back(ra.Uniform<uint32_t>());
    ra.Advance(-20);
    EXPECT_EQ(v[30], ra.Uniform<uint32_t>());
    ra.Advance(-31);
    EXPECT_EQ(v[0], ra.Uniform<uint32_t>());
}

TEST(RNG, UniformFloatRange) {
    RNG rng(7);
    double sum = 0;
    int n = 100000;
    for (int i = 0; i < n; ++i) {
        float u = rng.Uniform<float>();
        ASSERT_GE(u, 0.f);
        ASSERT_LT(u, 1.f);
        sum += u;
    }
    EXPECT_NEAR(0.5, sum / n, 0.01);
}

TEST(RNG, DistinctSequences) {
    RNG a(1), b(2);
    int nEqual = 0;
    for (int i = 0; i < 100; ++i)
        nEqual += (a.Uniform<uint32_t>() == b.Uniform<uint32_t>());
    EXPECT_LT(nEqual, 2);
}
