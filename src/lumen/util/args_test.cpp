// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <gtest/gtest.h>

#include <lumen/lumen.h>
#include <lumen/util/args.h>
#include <lumen/util/string.h>

#include <array>
#include <optional>
#include <string>
#include <vector>

using namespace lumen;

TEST(Args, Simple) {
    auto expectNoError = [](const std::string &s) { ADD_FAILURE() << s; };

    {
        int spp = 0;
        std::vector<std::string> args = SplitStringsFromWhitespace("--spp 16");
        auto iter = args.begin();
        EXPECT_TRUE(ParseArg(&iter, args.end(), "spp", &spp, expectNoError));
        EXPECT_EQ(16, spp);
        EXPECT_TRUE(++iter == args.end());
    }
    {
        int spp = 0;
        std::vector<std::string> args = SplitStringsFromWhitespace("--spp=16");
        auto iter = args.begin();
        EXPECT_TRUE(ParseArg(&iter, args.end(), "spp", &spp, expectNoError));
        EXPECT_EQ(16, spp);
        EXPECT_TRUE(++iter == args.end());
    }
}

TEST(Args, NormalizedNames) {
    auto expectNoError = [](const std::string &s) { ADD_FAILURE() << s; };

    std::optional<int> maxDepth;
    std::vector<std::string> args = SplitStringsFromWhitespace("--max_depth=3");
    auto iter = args.begin();
    EXPECT_TRUE(ParseArg(&iter, args.end(), "maxdepth", &maxDepth, expectNoError));
    ASSERT_TRUE(maxDepth.has_value());
    EXPECT_EQ(3, *maxDepth);
}

TEST(Args, Multiple) {
    auto expectNoError = [](const std::string &s) { ADD_FAILURE() << s; };

    int nthreads = 0;
    bool quiet = false;
    std::vector<std::string> args = SplitStringsFromWhitespace("--quiet --nthreads 4 out.pfm");
    auto iter = args.begin();
    EXPECT_TRUE(ParseArg(&iter, args.end(), "quiet", &quiet, expectNoError));
    ++iter;
    EXPECT_FALSE(ParseArg(&iter, args.end(), "quiet", &quiet, expectNoError));
    EXPECT_TRUE(ParseArg(&iter, args.end(), "nthreads", &nthreads, expectNoError));
    EXPECT_EQ(4, nthreads);
    EXPECT_TRUE(quiet);
    ++iter;
    ASSERT_FALSE(iter == args.end());
    EXPECT_EQ("out.pfm", *iter);
}

TEST(Args, Bool) {
    auto expectNoError = [](const std::string &s) { ADD_FAILURE() << s; };

    bool quiet = true, jitter = false;
    std::vector<std::string> args = SplitStringsFromWhitespace("--quiet=false --jitter");
    auto iter = args.begin();
    EXPECT_TRUE(ParseArg(&iter, args.end(), "quiet", &quiet, expectNoError));
    EXPECT_FALSE(quiet);
    ++iter;
    EXPECT_TRUE(ParseArg(&iter, args.end(), "jitter", &jitter, expectNoError));
    EXPECT_TRUE(jitter);
}

TEST(Args, Array) {
    auto expectNoError = [](const std::string &s) { ADD_FAILURE() << s; };

    std::array<int, 4> bounds = {0, 0, 0, 0};
    std::vector<std::string> args =
        SplitStringsFromWhitespace("--pixelbounds 0,16,8,24");
    auto iter = args.begin();
    EXPECT_TRUE(ParseArg(&iter, args.end(), "pixelbounds", &bounds, expectNoError));
    EXPECT_EQ(0, bounds[0]);
    EXPECT_EQ(16, bounds[1]);
    EXPECT_EQ(8, bounds[2]);
    EXPECT_EQ(24, bounds[3]);
}

TEST(Args, Errors) {
    std::string err;
    auto onError = [&err](const std::string &s) { err = s; };

    {
        int spp = 0;
        std::vector<std::string> args = SplitStringsFromWhitespace("--spp");
        auto iter = args.begin();
        EXPECT_FALSE(ParseArg(&iter, args.end(), "spp", &spp, onError));
        EXPECT_EQ("missing value after --spp argument", err);
    }
    {
        int spp = 0;
        std::vector<std::string> args = SplitStringsFromWhitespace("--spp=many");
        auto iter = args.begin();
        EXPECT_FALSE(ParseArg(&iter, args.end(), "spp", &spp, onError));
        EXPECT_EQ("invalid value \"many\" for --spp argument", err);
    }
    {
        std::array<int, 4> bounds;
        std::vector<std::string> args = SplitStringsFromWhitespace("--pixelbounds=1,2,3");
        auto iter = args.begin();
        EXPECT_FALSE(ParseArg(&iter, args.end(), "pixelbounds", &bounds, onError));
    }
}

TEST(String, Split) {
    std::vector<std::string> s = SplitStringsFromWhitespace("  a bb\tccc\n");
    ASSERT_EQ(3, s.size());
    EXPECT_EQ("bb", s[1]);
    EXPECT_TRUE(SplitStringsFromWhitespace("   ").empty());

    EXPECT_EQ((std::vector<int>{1, -2, 3}), SplitStringToInts("1,-2,3", ','));
    EXPECT_TRUE(SplitStringToInts("1,x", ',').empty());
    EXPECT_TRUE(SplitStringToInts("1,,2", ',').empty());
    EXPECT_EQ((std::vector<Float>{0.5f, -2}), SplitStringToFloats("0.5,-2", ','));
}

TEST(String, NumbersMustBeComplete) {
    int i = 0;
    EXPECT_TRUE(Atoi("-42", &i));
    EXPECT_EQ(-42, i);
    EXPECT_FALSE(Atoi("16x", &i));
    EXPECT_FALSE(Atoi(" 16", &i));
    EXPECT_FALSE(Atoi("", &i));
    EXPECT_FALSE(Atoi("99999999999", &i));
    EXPECT_EQ(-42, i);

    float f = 0;
    EXPECT_TRUE(Atof("2.5e-1", &f));
    EXPECT_EQ(0.25f, f);
    EXPECT_FALSE(Atof("0.5.", &f));
    EXPECT_FALSE(Atof("1e99", &f));
}
