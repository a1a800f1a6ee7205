// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <gtest/gtest.h>

#include <lumen/lumen.h>

#include <lumen/cameras.h>
#include <lumen/film.h>
#include <lumen/filters.h>
#include <lumen/util/math.h>
#include <lumen/util/transform.h>

#include <cmath>
#include <memory_resource>

using namespace lumen;

class CameraTest : public testing::Test {
  protected:
    CameraTest() : alloc(&resource) {
        Filter filter = Filter::Create("box", Vector2f(0.5, 0.5), alloc);
        film = RGBFilm::Create(Point2i(100, 50), {}, filter, "", Infinity, alloc);
    }

    Camera MakeCamera(const std::string &name, const Transform &worldFromCamera,
                      CameraParameters params = {}) {
        return Camera::Create(name, CameraBaseParameters(worldFromCamera, film), params,
                              alloc);
    }

    static CameraSample Sample(Point2f pFilm, Point2f pLens = Point2f(0.5, 0.5)) {
        CameraSample cs;
        cs.pFilm = pFilm;
        cs.pLens = pLens;
        return cs;
    }

    std::pmr::monotonic_buffer_resource resource;
    Allocator alloc;
    RGBFilm *film;
};

static void ExpectVectorNear(Vector3f expected, Vector3f v, Float tol = 1e-4) {
    EXPECT_NEAR(expected.x, v.x, tol);
    EXPECT_NEAR(expected.y, v.y, tol);
    EXPECT_NEAR(expected.z, v.z, tol);
}

TEST_F(CameraTest, PerspectivePinhole) {
    Camera camera = MakeCamera("perspective", Transform());
    EXPECT_TRUE(camera.Is<PerspectiveCamera>());
    EXPECT_EQ(film, camera.GetFilm());

    std::optional<CameraRay> cr = camera.GenerateRay(Sample(Point2f(50, 25)));
    ASSERT_TRUE(cr.has_value());
    ExpectVectorNear(Vector3f(0, 0, 0), Vector3f(cr->ray.o));
    ExpectVectorNear(Vector3f(0, 0, 1), cr->ray.d);
    EXPECT_EQ(RGB(1.f), cr->weight);

    // Raster (0,0) is the upper-left corner of a 2:1 screen window; 90 degrees
    // spans the vertical axis.
    cr = camera.GenerateRay(Sample(Point2f(0, 0)));
    ASSERT_TRUE(cr.has_value());
    ExpectVectorNear(Normalize(Vector3f(-2, 1, 1)), cr->ray.d);

    cr = camera.GenerateRay(Sample(Point2f(100, 50)));
    ASSERT_TRUE(cr.has_value());
    ExpectVectorNear(Normalize(Vector3f(2, -1, 1)), cr->ray.d);
}

TEST_F(CameraTest, LookAt) {
    Transform worldFromCamera =
        Inverse(LookAt(Point3f(0, 0, -5), Point3f(0, 0, 0), Vector3f(0, 1, 0)));
    Camera camera = MakeCamera("perspective", worldFromCamera);

    std::optional<CameraRay> cr = camera.GenerateRay(Sample(Point2f(50, 25)));
    ASSERT_TRUE(cr.has_value());
    ExpectVectorNear(Vector3f(0, 0, -5), Vector3f(cr->ray.o));
    ExpectVectorNear(Vector3f(0, 0, 1), cr->ray.d);

    // Upper half of the image looks up
    cr = camera.GenerateRay(Sample(Point2f(50, 5)));
    ASSERT_TRUE(cr.has_value());
    EXPECT_GT(cr->ray.d.y, 0);
}

TEST_F(CameraTest, ThinLensFocus) {
    CameraParameters params;
    params.fov = 60;
    params.lensRadius = 0.5;
    params.focalDistance = 10;
    Camera camera = MakeCamera("perspective", Transform(), params);

    for (Point2f pFilm : {Point2f(50, 25), Point2f(10, 40), Point2f(90, 3)}) {
        // Where the pinhole ray through the lens center meets the plane of focus
        std::optional<CameraRay> center = camera.GenerateRay(Sample(pFilm));
        ASSERT_TRUE(center.has_value());
        Point3f pFocus = center->ray(10 / center->ray.d.z);

        for (Point2f u : {Point2f(0.1, 0.2), Point2f(0.9, 0.5), Point2f(0.3, 0.95)}) {
            std::optional<CameraRay> cr = camera.GenerateRay(Sample(pFilm, u));
            ASSERT_TRUE(cr.has_value());
            EXPECT_EQ(0, cr->ray.o.z);
            EXPECT_LE(Length(Vector3f(cr->ray.o)), 0.5f + 1e-5f);
            EXPECT_NEAR(1, Length(cr->ray.d), 1e-5);

            Point3f p = cr->ray((10 - cr->ray.o.z) / cr->ray.d.z);
            EXPECT_NEAR(pFocus.x, p.x, 1e-3);
            EXPECT_NEAR(pFocus.y, p.y, 1e-3);
        }
    }
}

TEST_F(CameraTest, Orthographic) {
    Camera camera = MakeCamera("orthographic", Transform());
    EXPECT_TRUE(camera.Is<OrthographicCamera>());

    std::optional<CameraRay> cr = camera.GenerateRay(Sample(Point2f(50, 25)));
    ASSERT_TRUE(cr.has_value());
    ExpectVectorNear(Vector3f(0, 0, 0), Vector3f(cr->ray.o));
    ExpectVectorNear(Vector3f(0, 0, 1), cr->ray.d);

    cr = camera.GenerateRay(Sample(Point2f(0, 0)));
    ASSERT_TRUE(cr.has_value());
    ExpectVectorNear(Vector3f(-2, 1, 0), Vector3f(cr->ray.o));
    ExpectVectorNear(Vector3f(0, 0, 1), cr->ray.d);
}

TEST(CameraParameters, FromFilmBack) {
    CameraParameters params = CameraParameters::FromFilmBack(5, 2.2, 1.6, 8);
    EXPECT_NEAR(Degrees(2 * std::atan(1.6 / 10)), params.fov, 1e-4);
    EXPECT_FLOAT_EQ(0.3125, params.lensRadius);
    EXPECT_FLOAT_EQ(5, params.focalDistance);
    ASSERT_TRUE(params.screenWindow.has_value());
    EXPECT_FLOAT_EQ(2.2 / 1.6, params.screenWindow->pMax.x);
    EXPECT_FLOAT_EQ(1, params.screenWindow->pMax.y);
}
