// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <gtest/gtest.h>

#include <lumen/lumen.h>

#include <lumen/film.h>
#include <lumen/filters.h>
#include <lumen/util/parallel.h>

#include <cstdio>
#include <limits>
#include <memory_resource>
#include <string>

using namespace lumen;

class FilmTest : public testing::Test {
  protected:
    FilmTest() : alloc(&resource) {
        filter = Filter::Create("box", Vector2f(0.5, 0.5), alloc);
    }

    RGBFilm *MakeFilm(Point2i res) {
        return RGBFilm::Create(res, {}, filter, "", Infinity, alloc);
    }

    std::pmr::monotonic_buffer_resource resource;
    Allocator alloc;
    Filter filter;
};

TEST_F(FilmTest, MeanOfSamples) {
    RGBFilm *film = MakeFilm(Point2i(4, 3));
    EXPECT_EQ(RGB(0.f), film->GetPixelRGB(Point2i(1, 1)));
    EXPECT_EQ(0, film->SampleCount(Point2i(1, 1)));

    film->AddSample(Point2i(1, 1), RGB(1, 2, 3), 1);
    film->AddSample(Point2i(1, 1), RGB(3, 2, 1), 1);
    film->AddSample(Point2i(2, 0), RGB(4, 4, 4), 1);

    RGB rgb = film->GetPixelRGB(Point2i(1, 1));
    EXPECT_FLOAT_EQ(2, rgb.r);
    EXPECT_FLOAT_EQ(2, rgb.g);
    EXPECT_FLOAT_EQ(2, rgb.b);
    EXPECT_EQ(2, film->SampleCount(Point2i(1, 1)));
    EXPECT_EQ(3, film->TotalSampleCount());

    Image image = film->GetImage();
    EXPECT_EQ(Point2i(4, 3), image.Resolution());
    EXPECT_FLOAT_EQ(4, image.GetChannel(Point2i(2, 0), 1));
    EXPECT_FLOAT_EQ(2, image.GetChannel(Point2i(1, 1), 0));
    EXPECT_EQ(0, image.GetChannel(Point2i(3, 2), 2));
}

TEST_F(FilmTest, NonFiniteSamplesAreZeroed) {
    RGBFilm *film = MakeFilm(Point2i(2, 2));
    Float nan = std::numeric_limits<Float>::quiet_NaN();

    film->AddSample(Point2i(0, 0), RGB(1, 1, 1), 1);
    film->AddSample(Point2i(0, 0), RGB(nan, 0, 0), 1);
    film->AddSample(Point2i(0, 0), RGB(0, Infinity, 0), 1);

    // The bad samples count as black, so the mean is diluted but finite
    RGB rgb = film->GetPixelRGB(Point2i(0, 0));
    EXPECT_TRUE(rgb.IsFinite());
    EXPECT_FLOAT_EQ(1.f / 3.f, rgb.r);
    EXPECT_FLOAT_EQ(1.f / 3.f, rgb.g);
    EXPECT_EQ(3, film->SampleCount(Point2i(0, 0)));
    EXPECT_FALSE(film->GetImage().HasAnyNaNPixels());
}

TEST_F(FilmTest, MaxComponentValueClamps) {
    RGBFilm *film = RGBFilm::Create(Point2i(1, 1), {}, filter, "", 10, alloc);
    film->AddSample(Point2i(0, 0), RGB(40, 20, 0), 1);
    RGB rgb = film->GetPixelRGB(Point2i(0, 0));
    EXPECT_FLOAT_EQ(10, rgb.r);
    EXPECT_FLOAT_EQ(5, rgb.g);
}

TEST_F(FilmTest, PixelBounds) {
    RGBFilm *film = RGBFilm::Create(Point2i(8, 8), Bounds2i(Point2i(2, 3), Point2i(5, 20)),
                                    filter, "", Infinity, alloc);
    EXPECT_EQ(Bounds2i(Point2i(2, 3), Point2i(5, 8)), film->PixelBounds());

    film->AddSample(Point2i(2, 3), RGB(1, 1, 1), 1);
    Image image = film->GetImage();
    EXPECT_EQ(Point2i(3, 5), image.Resolution());
    EXPECT_EQ(1, image.GetChannel(Point2i(0, 0), 0));

    film->ResetPixel(Point2i(2, 3));
    EXPECT_EQ(0, film->SampleCount(Point2i(2, 3)));
    EXPECT_EQ(RGB(0.f), film->GetPixelRGB(Point2i(2, 3)));
}

TEST_F(FilmTest, ConcurrentSamePixel) {
    RGBFilm *film = MakeFilm(Point2i(1, 1));
    const int n = 100000;
    ParallelFor(0, n, [&](int64_t i) { film->AddSample(Point2i(0, 0), RGB(1, 2, 3), 1); });

    EXPECT_EQ(n, film->SampleCount(Point2i(0, 0)));
    RGB rgb = film->GetPixelRGB(Point2i(0, 0));
    EXPECT_FLOAT_EQ(1, rgb.r);
    EXPECT_FLOAT_EQ(2, rgb.g);
    EXPECT_FLOAT_EQ(3, rgb.b);
}

TEST_F(FilmTest, WritePFM) {
    std::string filename = testing::TempDir() + "lumen_film_test.pfm";
    RGBFilm *film = RGBFilm::Create(Point2i(2, 2), {}, filter, filename, Infinity, alloc);
    film->AddSample(Point2i(0, 0), RGB(1, 2, 3), 1);
    film->AddSample(Point2i(1, 1), RGB(0.5f, 0.25f, 0.125f), 1);
    EXPECT_EQ(RGB(1, 2, 3), film->GetImage().GetPixel(Point2i(0, 0)));
    ASSERT_TRUE(film->WriteImage());

    FILE *fp = fopen(filename.c_str(), "rb");
    ASSERT_TRUE(fp != nullptr);
    char magic[3] = {};
    int xRes = 0, yRes = 0;
    float scale = 0;
    ASSERT_EQ(4, fscanf(fp, "%2s %d %d %f", magic, &xRes, &yRes, &scale));
    fgetc(fp);
    EXPECT_EQ(std::string("PF"), magic);
    EXPECT_EQ(2, xRes);
    EXPECT_EQ(2, yRes);
    EXPECT_NE(0, scale);

    // Bottom scanline first.
    float values[12];
    ASSERT_EQ(size_t(12), fread(values, sizeof(float), 12, fp));
    fclose(fp);
    std::remove(filename.c_str());
    EXPECT_EQ(0, values[0]);
    EXPECT_EQ(0.5f, values[3]);
    EXPECT_EQ(0.125f, values[5]);
    EXPECT_EQ(1, values[6]);
    EXPECT_EQ(3, values[8]);
}

TEST_F(FilmTest, WriteWithoutFilename) {
    RGBFilm *film = MakeFilm(Point2i(2, 2));
    EXPECT_FALSE(film->WriteImage());
}

TEST_F(FilmTest, InvalidConfigurationExits) {
    EXPECT_DEATH(MakeFilm(Point2i(0, 4)), "film resolution must be positive");
    EXPECT_DEATH(MakeFilm(Point2i(4, -1)), "film resolution must be positive");
    // Zero-width bounds, and bounds entirely outside the image
    EXPECT_DEATH(RGBFilm::Create(Point2i(4, 4), Bounds2i(Point2i(1, 1), Point2i(1, 3)),
                                 filter, "", Infinity, alloc),
                 "pixel bounds do not overlap the image");
    EXPECT_DEATH(RGBFilm::Create(Point2i(4, 4), Bounds2i(Point2i(5, 5), Point2i(8, 8)),
                                 filter, "", Infinity, alloc),
                 "pixel bounds do not overlap the image");
    EXPECT_DEATH(RGBFilm::Create(Point2i(4, 4), {}, filter, "", 0, alloc),
                 "maximum component value must be positive");
}
