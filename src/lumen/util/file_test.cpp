// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <gtest/gtest.h>

#include <lumen/lumen.h>
#include <lumen/util/file.h>

using namespace lumen;

TEST(File, HasExtension) {
    EXPECT_TRUE(HasExtension("render.pfm", "pfm"));
    EXPECT_TRUE(HasExtension("render.Pfm", ".pfm"));
    EXPECT_TRUE(HasExtension("out/render.PFM", "pfm"));
    EXPECT_FALSE(HasExtension("render.fm", "pfm"));
    EXPECT_FALSE(HasExtension("/out/pfm", "pfm"));
    EXPECT_FALSE(HasExtension("render", "pfm"));
}

TEST(File, HasExtensionNonASCII) {
    // UTF-8 bytes are negative as plain char and must compare without faulting
    EXPECT_TRUE(HasExtension("r\xc3\xa9sultat.pfm", "pfm"));
    EXPECT_TRUE(HasExtension("image.\xc3\xa9xr", "\xc3\xa9xr"));
    EXPECT_FALSE(HasExtension("image.\xc3\xa9xr", "exr"));
    EXPECT_FALSE(HasExtension("render.pf\xe9", "pfm"));
}
