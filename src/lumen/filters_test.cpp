// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <gtest/gtest.h>

#include <lumen/filters.h>
#include <lumen/lumen.h>
#include <lumen/util/math.h>
#include <lumen/util/sampling.h>

#include <algorithm>
#include <memory_resource>
#include <vector>

using namespace lumen;

static std::vector<Filter> MakeFilters(const Vector2f &radius) {
    return {new BoxFilter(radius), new TriangleFilter(radius)};
}

TEST(Filter, ZeroPastRadius) {
    for (Vector2f r : {Vector2f(1, 1), Vector2f(1.5, .25), Vector2f(.33, 5.2),
                       Vector2f(.1, .1), Vector2f(3, 3)}) {
        for (Filter f : MakeFilters(r)) {
            EXPECT_EQ(0, f.Evaluate(Point2f(0, r.y + 1e-3)));
            EXPECT_EQ(0, f.Evaluate(Point2f(r.x, r.y + 1e-3)));
            EXPECT_EQ(0, f.Evaluate(Point2f(-r.x, -r.y - 1e-3)));
            EXPECT_EQ(0, f.Evaluate(Point2f(r.x + 1e-3, 0)));
            EXPECT_EQ(0, f.Evaluate(Point2f(-r.x - 1e-3, r.y)));
        }
    }
}

static Float IntegrateFilter(Filter f) {
    Float sum = 0;
    int sqrtSamples = 256;
    int nSamples = sqrtSamples * sqrtSamples;
    Float area = 2 * f.Radius().x * 2 * f.Radius().y;
    for (int y = 0; y < sqrtSamples; ++y)
        for (int x = 0; x < sqrtSamples; ++x) {
            Point2f u((x + 0.5f) / sqrtSamples, (y + 0.5f) / sqrtSamples);
            Point2f p(Lerp(u.x, -f.Radius().x, f.Radius().x),
                      Lerp(u.y, -f.Radius().y, f.Radius().y));
            sum += f.Evaluate(p);
        }
    return sum / nSamples * area;
}

TEST(Filter, Integral) {
    auto approxEqual = [](Float a, Float b) {
        return 2 * std::abs(a - b) / std::abs(a + b) < 1e-2;
    };

    for (Vector2f r :
         {Vector2f(1, 1), Vector2f(2.5, 1), Vector2f(1, 2.5), Vector2f(3.4, 2.5)})
        for (Filter f : MakeFilters(r))
            EXPECT_TRUE(approxEqual(f.Integral(), IntegrateFilter(f))) << f.ToString();
}

TEST(Filter, SamplesStayInsideRadius) {
    for (Filter f : MakeFilters(Vector2f(1.5, .5))) {
        Vector2f r = f.Radius();
        for (int y = 0; y < 32; ++y)
            for (int x = 0; x < 32; ++x) {
                Point2f u(x / 32.f, y / 32.f);
                FilterSample fs = f.Sample(u);
                EXPECT_LE(std::abs(fs.p.x), r.x);
                EXPECT_LE(std::abs(fs.p.y), r.y);
                EXPECT_EQ(1, fs.weight);
            }
    }
}

// Histogram tent samples and compare against the analytic density.
TEST(Filter, TentSamplingMatchesPDF) {
    const Float r = 2;
    const int nBuckets = 16, nSamples = 1 << 18;
    std::vector<int> counts(nBuckets, 0);
    for (int i = 0; i < nSamples; ++i) {
        Float x = SampleTent((i + 0.5f) / nSamples, r);
        ASSERT_TRUE(x >= -r && x <= r) << x;
        int b = Clamp(int((x + r) / (2 * r) * nBuckets), 0, nBuckets - 1);
        ++counts[b];
    }

    for (int b = 0; b < nBuckets; ++b) {
        Float x0 = -r + 2 * r * b / nBuckets, x1 = -r + 2 * r * (b + 1) / nBuckets;
        Float xm = (x0 + x1) / 2;
        Float expected = TentPDF(xm, r) * (x1 - x0);
        Float actual = Float(counts[b]) / nSamples;
        EXPECT_NEAR(expected, actual, 2e-3) << "bucket " << b;
    }
}

TEST(Filter, Create) {
    std::pmr::monotonic_buffer_resource resource;
    Allocator alloc(&resource);

    Filter box = Filter::Create("box", Vector2f(0.5, 0.5), alloc);
    EXPECT_TRUE(box.Is<BoxFilter>());
    EXPECT_EQ(1, box.Integral());

    Filter tent = Filter::Create("triangle", Vector2f(1, 2), alloc);
    EXPECT_TRUE(tent.Is<TriangleFilter>());
    EXPECT_EQ(4, tent.Integral());
    EXPECT_EQ(2, tent.Evaluate(Point2f(0, 0)));
}
