// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <cstdint>

#include <lumen/lumen.h>
#include <lumen/util/float.h>
#include <lumen/util/hash.h>
#include <lumen/util/math.h>
#include <lumen/util/print.h>
#include <lumen/util/rng.h>

#include <vector>

using namespace lumen;

TEST(Math, Clamp) {
    EXPECT_EQ(1, Clamp(5, 0, 1));
    EXPECT_EQ(0, Clamp(-5, 0, 1));
    EXPECT_EQ(0.25f, Clamp(0.25f, 0, 1));
    EXPECT_EQ(0.f, SafeSqrt(-1e-6f));
}

TEST(Math, DifferenceOfProducts) {
    for (int i = 0; i < 100000; ++i) {
        RNG rng(i);
        auto r = [&rng]() {
            Float logu = Lerp(rng.Uniform<Float>(), -8, 8);
            return std::pow(10, logu);
        };
        Float a = r(), b = r(), c = r(), d = r();
        Float sign = rng.Uniform<Float>() < 0.5 ? -1 : 1;
        b *= sign;
        c *= sign;
        Float dp = DifferenceOfProducts(a, b, c, d);
        Float dp2 = FMA(double(a), double(b), -double(c) * double(d));
        Float err = std::abs(dp - dp2);
        Float ulp = NextFloatUp(std::abs(dp2)) - std::abs(dp2);
        EXPECT_LT(err, 2 * ulp);
    }
}

template <int N>
static SquareMatrix<N> randomMatrix(RNG &rng) {
    SquareMatrix<N> m;
    for (int i = 0; i < N; ++i)
        for (int j = 0; j < N; ++j)
            m[i][j] = -10 + 20 * rng.Uniform<Float>();
    return m;
}

TEST(SquareMatrix, Inverse) {
    auto equal = [](Float a, Float b, Float tol = 1e-4) {
        if (std::abs(a) < 1e-5 || std::abs(b) < 1e-5)
            return std::abs(a) - std::abs(b) < tol;
        return (std::abs(a) - std::abs(b)) / ((std::abs(a) + std::abs(b)) / 2) < tol;
    };

    int nFail = 0;
    int nIters = 1000;
    for (int i = 0; i < nIters; ++i) {
        RNG rng(i);
        SquareMatrix<4> m = randomMatrix<4>(rng);
        std::optional<SquareMatrix<4>> inv = Inverse(m);
        if (!inv) {
            ++nFail;
            continue;
        }
        SquareMatrix<4> id = m * *inv;

        for (int j = 0; j < 4; ++j)
            for (int k = 0; k < 4; ++k) {
                if (j == k)
                    EXPECT_TRUE(equal(id[j][k], 1))
                        << m << ", inv " << *inv << " prod " << id;
                else
                    EXPECT_LT(std::abs(id[j][k]), 1e-4)
                        << m << ", inv " << *inv << " prod " << id;
            }
    }
    EXPECT_LT(nFail, 3);
}

TEST(SquareMatrix, Singular) {
    SquareMatrix<4> m(1, 2, 3, 4, 2, 4, 6, 8, 0, 1, 0, 1, 5, 0, 0, 1);
    EXPECT_FALSE(Inverse(m).has_value());
    EXPECT_TRUE(SquareMatrix<4>().IsIdentity());
    EXPECT_FALSE(m.IsIdentity());
}

TEST(SquareMatrix, RowMajorConstruction) {
    SquareMatrix<4> m(1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16);
    EXPECT_EQ(2, m[0][1]);
    EXPECT_EQ(5, m[1][0]);
    EXPECT_EQ(16, m[3][3]);
    EXPECT_EQ(m, SquareMatrix<4>() * m);
    EXPECT_EQ("[ [ 1, 2, 3, 4 ], [ 5, 6, 7, 8 ], [ 9, 10, 11, 12 ], [ 13, 14, 15, 16 ] ]",
              m.ToString());
}

TEST(SquareMatrix, InverseNeedsPivoting) {
    // The leading entry is zero, so elimination must swap rows first
    SquareMatrix<4> m(0, 1, 0, 0, 1, 0, 0, 0, 0, 0, 2, 0, 0, 0, 0, 4);
    std::optional<SquareMatrix<4>> inv = Inverse(m);
    ASSERT_TRUE(inv.has_value());
    EXPECT_EQ(SquareMatrix<4>(0, 1, 0, 0, 1, 0, 0, 0, 0, 0, 0.5, 0, 0, 0, 0, 0.25), *inv);
    EXPECT_TRUE((m * *inv).IsIdentity());
}

TEST(PermutationElement, Valid) {
    for (int len = 2; len < 1024; ++len) {
        for (int iter = 0; iter < 10; ++iter) {
            std::vector<bool> seen(len, false);

            for (int i = 0; i < len; ++i) {
                int offset = PermutationElement(i, len, MixBits(1 + iter));
                ASSERT_TRUE(offset >= 0 && offset < seen.size()) << offset;
                EXPECT_FALSE(seen[offset]) << StringPrintf("len %d index %d", len, i);
                seen[offset] = true;
            }
        }
    }
}

TEST(PermutationElement, Uniform) {
    for (int n : {2, 3, 4, 5, 9, 16}) {
        std::vector<int> count(n * n);

        int numIters = 60000 * n;
        for (int seed = 0; seed < numIters; ++seed) {
            for (int i = 0; i < n; ++i) {
                int ip = PermutationElement(i, n, MixBits(seed));
                int offset = ip * n + i;
                ++count[offset];
            }
        }

        for (int i = 0; i < n; ++i) {
            for (int j = 0; j < n; ++j) {
                Float tol = 0.03f;
                int offset = j * n + i;
                EXPECT_TRUE(count[offset] >= (1 - tol) * numIters / n &&
                            count[offset] <= (1 + tol) * numIters / n)
                    << StringPrintf("Got count %d for %d -> %d (perm size %d). "
                                    "Expected +/- %d.\n",
                                    count[offset], i, j, n, numIters / n);
            }
        }
    }
}

TEST(Hash, Deterministic) {
    EXPECT_EQ(Hash(1, 2.5f, uint64_t(7)), Hash(1, 2.5f, uint64_t(7)));
    EXPECT_NE(Hash(1, 2), Hash(2, 1));
    EXPECT_NE(MixBits(1), MixBits(2));
}
