// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <gtest/gtest.h>

#include <lumen/lumen.h>

#include <lumen/lights.h>
#include <lumen/materials.h>
#include <lumen/options.h>
#include <lumen/scene.h>
#include <lumen/shapes.h>

#include <memory>
#include <optional>

using namespace lumen;

TEST(Scene, Counts) {
    Scene scene;
    Material white = scene.Create<DiffuseMaterial>(RGB(0.8f));
    // The second triangle repeats a vertex and has no area.
    int kept = scene.AddTriangleMesh(
        Transform(), false, {0, 1, 2, 0, 0, 3},
        {Point3f(0, 0, 0), Point3f(1, 0, 0), Point3f(1, 1, 0), Point3f(0, 1, 0)}, {}, {},
        white);
    EXPECT_EQ(1, kept);
    EXPECT_EQ(1, scene.DegenerateTriangleCount());

    scene.AddSphere(Point3f(0, 0, 2), 0.5f, nullptr, AreaLightParameters{RGB(5.f)});
    scene.AddSphere(Point3f(0, 0, 2), 0, white);
    scene.AddLight(scene.Create<DistantLight>(Vector3f(0, 0, -1), RGB(1.f), 1));

    EXPECT_EQ(2, scene.Primitives().size());
    ASSERT_EQ(2, scene.Lights().size());
    EXPECT_TRUE(scene.Lights()[0].Is<DiffuseAreaLight>());
    EXPECT_TRUE(scene.Lights()[1].Is<DistantLight>());
    EXPECT_FALSE(scene.ToString().empty());
}

TEST(Scene, EmissiveTrianglesGetOneLightEach) {
    Scene scene;
    scene.AddTriangleMesh(
        Translate(Vector3f(0, 0, 1)), false, {0, 1, 2, 0, 2, 3},
        {Point3f(0, 0, 0), Point3f(1, 0, 0), Point3f(1, 1, 0), Point3f(0, 1, 0)}, {}, {},
        nullptr, AreaLightParameters{RGB(2.f), 0.5f, true});
    EXPECT_EQ(2, scene.Primitives().size());
    ASSERT_EQ(2, scene.Lights().size());
    for (Light light : scene.Lights())
        // Area 0.5, two-sided, radiance 1.
        EXPECT_FLOAT_EQ(2 * Pi * 0.5f, light.Phi().g);
}

TEST(Scene, OptionsOverrideSettings) {
    Scene scene;
    scene.AddSphere(Point3f(0, 0, 5), 1, scene.Create<DiffuseMaterial>(RGB(0.5f)));
    scene.SetFilm(Point2i(8, 6), "");
    scene.SetSampler("independent", 16);
    scene.SetIntegrator("preview", IntegratorParameters());

    std::optional<int> savedSamples = Options->pixelSamples;
    std::optional<Bounds2i> savedBounds = Options->pixelBounds;
    Options->pixelSamples = 2;
    Options->pixelBounds = Bounds2i(Point2i(2, 1), Point2i(6, 4));
    std::unique_ptr<Integrator> integrator = scene.CreateIntegrator();
    Options->pixelSamples = savedSamples;
    Options->pixelBounds = savedBounds;

    auto preview = dynamic_cast<PreviewIntegrator *>(integrator.get());
    ASSERT_TRUE(preview != nullptr);
    RGBFilm *film = preview->GetCamera().GetFilm();
    EXPECT_EQ(Point2i(8, 6), film->FullResolution());
    EXPECT_EQ(Bounds2i(Point2i(2, 1), Point2i(6, 4)), film->PixelBounds());

    preview->Render();
    EXPECT_EQ(4 * 3 * 2, film->TotalSampleCount());
    EXPECT_EQ(0, film->SampleCount(Point2i(0, 0)));
    EXPECT_EQ(2, film->SampleCount(Point2i(3, 2)));
}

TEST(Scene, Defaults) {
    Scene scene;
    std::unique_ptr<Integrator> integrator = scene.CreateIntegrator();
    auto path = dynamic_cast<PathIntegrator *>(integrator.get());
    ASSERT_TRUE(path != nullptr);
    EXPECT_FALSE(path->aggregate);
    EXPECT_TRUE(path->lights.empty());
    RGBFilm *film = path->GetCamera().GetFilm();
    EXPECT_EQ(Point2i(1280, 720), film->FullResolution());
    EXPECT_TRUE(path->GetCamera().Is<PerspectiveCamera>());
}

TEST(Scene, InvalidSettingsExit) {
    {
        Scene scene;
        scene.SetFilm(Point2i(0, 0), "");
        EXPECT_DEATH(scene.CreateIntegrator(), "film resolution must be positive");
    }
    {
        Scene scene;
        scene.SetFilm(Point2i(8, 8), "", "box", Vector2f(0.5f, 0.5f),
                      Bounds2i(Point2i(3, 3), Point2i(3, 6)));
        EXPECT_DEATH(scene.CreateIntegrator(), "pixel bounds do not overlap the image");
    }
    {
        Scene scene;
        scene.SetSampler("stratified", 0);
        EXPECT_DEATH(scene.CreateIntegrator(), "sample count must be positive");
    }
    {
        Scene scene;
        scene.SetSampler("halton", 4);
        EXPECT_DEATH(scene.CreateIntegrator(), "sampler type unknown");
    }
    {
        Scene scene;
        scene.SetIntegrator("bdpt", IntegratorParameters());
        EXPECT_DEATH(scene.CreateIntegrator(), "integrator type unknown");
    }
    {
        Scene scene;
        IntegratorParameters params;
        params.maxDepth = -1;
        scene.SetIntegrator("path", params);
        EXPECT_DEATH(scene.CreateIntegrator(), "maximum depth must not be negative");
    }
    {
        Scene scene;
        Sphere *sphere = scene.Create<Sphere>(Point3f(0, 0, 0), 1.f);
        EXPECT_DEATH(scene.AddLight(scene.Create<DiffuseAreaLight>(sphere, RGB(1.f), 1.f,
                                                                   false)),
                     "Area lights must be attached to a shape");
    }
}
