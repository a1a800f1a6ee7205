// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <gtest/gtest.h>

#include <lumen/lumen.h>
#include <lumen/util/color.h>
#include <lumen/util/print.h>
#include <lumen/util/vecmath.h>

#include <cstdint>
#include <optional>
#include <vector>

using namespace lumen;

TEST(StringPrintf, Basics) {
    EXPECT_EQ("Hello, world", StringPrintf("Hello, world"));
    EXPECT_EQ("x = 5", StringPrintf("x = %d", 5));
    EXPECT_EQ("1, 1.5, -8.125", StringPrintf("%f, %f, %f", 1., 1.5f, -8.125));
    EXPECT_EQ("100% done", StringPrintf("%d%% done", 100));
    EXPECT_EQ("50%", StringPrintf("50%%"));
    EXPECT_EQ("true false", StringPrintf("%s %s", true, false));
    EXPECT_EQ("name: box", StringPrintf("name: %s", "box"));
    EXPECT_EQ("[box]", StringPrintf("[%s]", std::string("box")));
}

TEST(StringPrintf, Integers) {
    // Every integer width prints with %d
    EXPECT_EQ("-3 7 4294967296 18446744073709551615",
              StringPrintf("%d %d %d %d", int8_t(-3), size_t(7), int64_t(1) << 32,
                           ~uint64_t(0)));
    EXPECT_EQ("  42|42  ", StringPrintf("%4d|%-4d", 42, 42));
    EXPECT_EQ("ff", StringPrintf("%x", 255));
    // Length modifiers are accepted and ignored
    EXPECT_EQ("7 -2", StringPrintf("%lu %lld", 7ul, -2ll));
}

TEST(StringPrintf, Precision) {
    EXPECT_EQ("0.33", StringPrintf("%.2f", 1. / 3.));
    EXPECT_EQ("1.0s", StringPrintf("%.1fs", 1.f));
    // Plain %f is the shortest string that reads back to the same float
    EXPECT_EQ("0.1", StringPrintf("%f", 0.1f));
    EXPECT_EQ("1e-07", StringPrintf("%f", 1e-7));
}

TEST(StringPrintf, ToString) {
    EXPECT_EQ("[ 1, 2, 3 ]", StringPrintf("%s", Point3i(1, 2, 3)));
    EXPECT_EQ(RGB(0.5f, 1, 2).ToString(), StringPrintf("%s", RGB(0.5f, 1, 2)));
    EXPECT_EQ("[ 1, 2 ]", StringPrintf("%s", std::vector<int>{1, 2}));
    EXPECT_EQ("(unset)", StringPrintf("%s", std::optional<int>()));
    EXPECT_EQ("4", StringPrintf("%s", std::optional<int>(4)));
}

TEST(StringPrintf, Mismatch) {
    EXPECT_DEATH(StringPrintf("not enough %s"), "fewer values");
    EXPECT_DEATH(StringPrintf("too many", 1), "more values");
}
