// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <gtest/gtest.h>

#include <lumen/lumen.h>

#include <lumen/samplers.h>

#include <vector>

using namespace lumen;

static std::vector<Sampler> AllSamplers(int rootSpp) {
    int spp = rootSpp * rootSpp;
    return {new IndependentSampler(spp), new IndependentSampler(spp, 7),
            new StratifiedSampler(rootSpp, rootSpp, true),
            new StratifiedSampler(rootSpp, rootSpp, false, 3)};
}

// Make sure all samplers give the same sample values if we go back to the
// same pixel / sample index.
TEST(Sampler, ConsistentValues) {
    constexpr int rootSpp = 4;
    constexpr int spp = rootSpp * rootSpp;

    for (auto &sampler : AllSamplers(rootSpp)) {
        std::vector<Float> s1d[spp];
        std::vector<Point2f> s2d[spp];

        for (int s = 0; s < spp; ++s) {
            sampler.StartPixelSample({1, 5}, s);
            for (int i = 0; i < 10; ++i) {
                s2d[s].push_back(sampler.Get2D());
                s1d[s].push_back(sampler.Get1D());
            }
        }

        // Go somewhere else and generate some samples, just to make sure
        // things are shaken up.
        sampler.StartPixelSample({0, 6}, 10);
        sampler.Get2D();
        sampler.Get2D();
        sampler.Get1D();

        // Now go back and generate samples again, but enumerate them in a
        // different order to make sure the sampler is doing the right
        // thing.
        for (int s = spp - 1; s >= 0; --s) {
            sampler.StartPixelSample({1, 5}, s);
            for (size_t i = 0; i < s2d[s].size(); ++i) {
                EXPECT_EQ(s2d[s][i], sampler.Get2D());
                EXPECT_EQ(s1d[s][i], sampler.Get1D());
            }
        }
    }
}

TEST(Sampler, CloneIsIndependent) {
    for (auto &sampler : AllSamplers(2)) {
        Sampler clone = sampler.Clone();
        sampler.StartPixelSample({3, 4}, 1);
        clone.StartPixelSample({3, 4}, 1);
        Point2f u = sampler.Get2D();
        // Advancing the original leaves the clone where it was
        sampler.Get1D();
        EXPECT_EQ(u, clone.Get2D());
        EXPECT_EQ(sampler.SamplesPerPixel(), clone.SamplesPerPixel());
    }
}

TEST(Sampler, Decorrelated) {
    // Neighboring pixels, sample indices and dimensions produce different values
    for (auto &sampler : AllSamplers(4)) {
        sampler.StartPixelSample({10, 10}, 0);
        Float a = sampler.Get1D();
        Float a2 = sampler.Get1D();
        sampler.StartPixelSample({11, 10}, 0);
        Float b = sampler.Get1D();
        sampler.StartPixelSample({10, 10}, 1);
        Float c = sampler.Get1D();
        EXPECT_NE(a, b);
        EXPECT_NE(a, c);
        EXPECT_NE(a, a2);
    }

    // The seed changes the sequence
    IndependentSampler s0(16, 0), s1(16, 1);
    s0.StartPixelSample({0, 0}, 0, 0);
    s1.StartPixelSample({0, 0}, 0, 0);
    EXPECT_NE(s0.Get1D(), s1.Get1D());
}

TEST(Sampler, Range) {
    for (auto &sampler : AllSamplers(3)) {
        for (int s = 0; s < sampler.SamplesPerPixel(); ++s) {
            sampler.StartPixelSample({7, 2}, s);
            for (int i = 0; i < 20; ++i) {
                Float u = sampler.Get1D();
                EXPECT_GE(u, 0);
                EXPECT_LT(u, 1);
                Point2f u2 = sampler.GetPixel2D();
                EXPECT_GE(u2.x, 0);
                EXPECT_LT(u2.x, 1);
                EXPECT_GE(u2.y, 0);
                EXPECT_LT(u2.y, 1);
            }
        }
    }
}

TEST(StratifiedSampler, EachStratumOnce) {
    constexpr int rootSpp = 4, spp = rootSpp * rootSpp;
    StratifiedSampler sampler(rootSpp, rootSpp, true, 5);
    for (int dim = 0; dim < 6; dim += 2) {
        std::vector<int> count1d(spp, 0), count2d(spp, 0);
        for (int s = 0; s < spp; ++s) {
            sampler.StartPixelSample({2, 9}, s, dim);
            Point2f u = sampler.Get2D();
            int x = u.x * rootSpp, y = u.y * rootSpp;
            ++count2d[y * rootSpp + x];

            sampler.StartPixelSample({2, 9}, s, dim);
            ++count1d[int(sampler.Get1D() * spp)];
        }
        for (int i = 0; i < spp; ++i) {
            EXPECT_EQ(1, count1d[i]) << "dim " << dim << " stratum " << i;
            EXPECT_EQ(1, count2d[i]) << "dim " << dim << " stratum " << i;
        }
    }
}

TEST(StratifiedSampler, DistantPixelsDecorrelated) {
    // With a single stratum every value is pure jitter, so pixels that share
    // a random sequence would return identical values.
    StratifiedSampler sampler(1, 1, true);
    std::vector<Point2i> pixels = {{0, 1}, {65536, 0}, {7, 40000}, {7, 40001}};
    std::vector<Float> values;
    for (Point2i p : pixels) {
        sampler.StartPixelSample(p, 0, 0);
        Float u = sampler.Get1D();
        EXPECT_GE(u, 0);
        EXPECT_LT(u, 1);
        values.push_back(u);
    }
    for (size_t i = 0; i < values.size(); ++i)
        for (size_t j = i + 1; j < values.size(); ++j)
            EXPECT_NE(values[i], values[j]) << pixels[i] << " " << pixels[j];
}

TEST(Sampler, Create) {
    Sampler s = Sampler::Create("stratified", 12, 0, true, Allocator());
    EXPECT_EQ(12, s.SamplesPerPixel());
    EXPECT_TRUE(s.Is<StratifiedSampler>());
    s = Sampler::Create("independent", 5, 0, true, Allocator());
    EXPECT_EQ(5, s.SamplesPerPixel());
    EXPECT_TRUE(s.Is<IndependentSampler>());
}
