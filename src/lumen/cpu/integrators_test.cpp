// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <gtest/gtest.h>

#include <lumen/lumen.h>

#include <lumen/cpu/integrators.h>
#include <lumen/film.h>
#include <lumen/lights.h>
#include <lumen/materials.h>
#include <lumen/options.h>
#include <lumen/samplers.h>
#include <lumen/scene.h>
#include <lumen/util/math.h>
#include <lumen/util/parallel.h>
#include <lumen/util/rng.h>
#include <lumen/util/sampling.h>

#include <cmath>
#include <memory>
#include <vector>

using namespace lumen;

// A 4x4 quad in the z=0 plane, centered at the origin.
static void AddFloor(Scene &scene, Material material, Float halfWidth = 2) {
    Float w = halfWidth;
    scene.AddTriangleMesh(Transform(), false, {0, 1, 2, 0, 2, 3},
                          {Point3f(-w, -w, 0), Point3f(w, -w, 0), Point3f(w, w, 0),
                           Point3f(-w, w, 0)},
                          {}, {}, material);
}

// Orthographic camera at z=3 looking straight down at the [-1,1]^2 square.
static void LookDown(Scene &scene, Point2i resolution) {
    CameraParameters params;
    params.screenWindow = Bounds2f(Point2f(-1, -1), Point2f(1, 1));
    scene.SetCamera("orthographic",
                    Inverse(LookAt(Point3f(0, 0, 3), Point3f(0, 0, 0), Vector3f(0, 1, 0))),
                    params);
    scene.SetFilm(resolution, "");
}

static RGB FilmAverage(const RGBFilm *film) {
    RGB sum(0.f);
    Bounds2i bounds = film->PixelBounds();
    for (Point2i p : bounds)
        sum += film->GetPixelRGB(p);
    return sum / Float(bounds.Area());
}

TEST(Integrators, MISWeightsSumToOne) {
    RNG rng;
    for (int i = 0; i < 100; ++i) {
        Float a = 10 * rng.Uniform<Float>(), b = 10 * rng.Uniform<Float>();
        EXPECT_NEAR(1, PowerHeuristic(1, a, 1, b) + PowerHeuristic(1, b, 1, a), 1e-5);
    }
    // A delta strategy gets the full weight.
    EXPECT_EQ(1, PowerHeuristic(1, Infinity, 1, 0.5f));
}

TEST(Integrators, MISStrategyPDFs) {
    // The light and BSDF densities that feed the MIS weights are both
    // positive for directions toward the light, so the two weights at a
    // shading point always sum to one.
    Scene scene;
    Material floor = scene.Create<DiffuseMaterial>(RGB(0.5f));
    AddFloor(scene, floor);
    scene.AddSphere(Point3f(0, 0, 1), 0.25f, nullptr, AreaLightParameters{RGB(4.f)});
    LookDown(scene, Point2i(4, 4));
    std::unique_ptr<Integrator> integrator = scene.CreateIntegrator();
    PathIntegrator *path = dynamic_cast<PathIntegrator *>(integrator.get());
    ASSERT_TRUE(path != nullptr);

    std::optional<ShapeIntersection> si =
        integrator->Intersect(Ray(Point3f(0.3f, 0.2f, 3), Vector3f(0, 0, -1)));
    ASSERT_TRUE(si.has_value());
    SurfaceInteraction &intr = si->intr;
    EXPECT_NEAR(0, intr.p.z, 1e-4);

    ScratchBuffer scratch;
    Sampler sampler = Sampler::Create("independent", 1, 0, true, Allocator());
    sampler.StartPixelSample(Point2i(0, 0), 0);
    BSDF bsdf = intr.GetBSDF(scratch, sampler);
    ASSERT_TRUE(bool(bsdf));

    LightSampleContext ctx(intr);
    Light light = integrator->lights[0];
    EXPECT_EQ(1, path->GetLightSampler().PMF(ctx, light));

    RNG rng(7);
    for (int i = 0; i < 64; ++i) {
        Point2f u(rng.Uniform<Float>(), rng.Uniform<Float>());
        std::optional<LightLiSample> ls = light.SampleLi(ctx, u);
        ASSERT_TRUE(ls.has_value());
        Float lightPDF = ls->pdf;
        Float bsdfPDF = bsdf.PDF(intr.wo, ls->wi);
        EXPECT_GT(lightPDF, 0);
        EXPECT_GT(bsdfPDF, 0);
        EXPECT_NEAR(lightPDF, light.PDF_Li(ctx, ls->wi), 1e-3 * lightPDF);
        Float wLight = PowerHeuristic(1, lightPDF, 1, bsdfPDF);
        Float wBSDF = PowerHeuristic(1, bsdfPDF, 1, lightPDF);
        EXPECT_NEAR(1, wLight + wBSDF, 1e-5);
    }
}

// Builds a closed, two-sided emissive diffuse sphere with the camera at its
// center. The radiance everywhere inside is Le / (1 - albedo).
static void MakeFurnace(Scene &scene, Float albedo, bool russianRoulette) {
    Material interior = scene.Create<DiffuseMaterial>(RGB(albedo));
    scene.AddSphere(Point3f(0, 0, 0), 1, interior,
                    AreaLightParameters{RGB(1.f), 1, true}, true);
    scene.SetCamera("perspective", Transform());
    scene.SetFilm(Point2i(4, 4), "");
    scene.SetSampler("stratified", 256);
    IntegratorParameters params;
    params.maxDepth = 64;
    params.russianRoulette = russianRoulette;
    scene.SetIntegrator("path", params);
}

TEST(Integrators, RussianRouletteIsUnbiased) {
    Float albedo = 0.5f;
    Float expected = 1 / (1 - albedo);

    RGB withRR, withoutRR;
    {
        Scene scene;
        MakeFurnace(scene, albedo, true);
        std::unique_ptr<Integrator> integrator = scene.CreateIntegrator();
        integrator->Render();
        auto tile = dynamic_cast<ImageTileIntegrator *>(integrator.get());
        ASSERT_TRUE(tile != nullptr);
        withRR = FilmAverage(tile->GetCamera().GetFilm());
    }
    {
        Scene scene;
        MakeFurnace(scene, albedo, false);
        std::unique_ptr<Integrator> integrator = scene.CreateIntegrator();
        integrator->Render();
        auto tile = dynamic_cast<ImageTileIntegrator *>(integrator.get());
        ASSERT_TRUE(tile != nullptr);
        withoutRR = FilmAverage(tile->GetCamera().GetFilm());
    }

    for (int c = 0; c < 3; ++c) {
        EXPECT_NEAR(expected, withoutRR[c], 0.05f * expected);
        EXPECT_NEAR(expected, withRR[c], 0.05f * expected);
        EXPECT_NEAR(withoutRR[c], withRR[c], 0.06f * expected);
    }
}

TEST(Integrators, DirectLightingMatchesAnalytic) {
    // A small spherical emitter above a Lambertian plane; the reflected
    // radiance at a point whose distance to the emitter's center is d is
    // albedo * Le * (r / d)^2 * cos(theta).
    Float albedo = 0.5f, Le = 100, radius = 0.05f, height = 1;
    Scene scene;
    AddFloor(scene, scene.Create<DiffuseMaterial>(RGB(albedo)));
    scene.AddSphere(Point3f(0, 0, height), radius, nullptr, AreaLightParameters{RGB(Le)});
    Point2i res(8, 8);
    LookDown(scene, res);
    scene.SetSampler("stratified", 256);
    IntegratorParameters params;
    params.maxDepth = 1;
    scene.SetIntegrator("path", params);

    bool savedJitter = Options->disablePixelJitter;
    Options->disablePixelJitter = true;
    std::unique_ptr<Integrator> integrator = scene.CreateIntegrator();
    integrator->Render();
    Options->disablePixelJitter = savedJitter;

    RGBFilm *film = dynamic_cast<ImageTileIntegrator *>(integrator.get())
                        ->GetCamera()
                        .GetFilm();
    for (Point2i p : film->PixelBounds()) {
        Float x = -1 + 2 * (p.x + 0.5f) / res.x;
        Float y = -1 + 2 * (p.y + 0.5f) / res.y;
        Float d2 = Sqr(x) + Sqr(y) + Sqr(height);
        Float cosTheta = height / std::sqrt(d2);
        Float expected = albedo * Le * Sqr(radius) / d2 * cosTheta;
        RGB L = film->GetPixelRGB(p);
        for (int c = 0; c < 3; ++c)
            EXPECT_NEAR(expected, L[c], 0.02f * expected) << p;
    }
}

static std::unique_ptr<Integrator> MakeBoxScene(Scene &scene) {
    DisneyParameters red;
    red.baseColor = RGB(0.7f, 0.1f, 0.1f);
    red.roughness = 0.3f;
    DisneyParameters metal;
    metal.baseColor = RGB(0.9f, 0.8f, 0.5f);
    metal.metallic = 1;
    metal.roughness = 0.2f;
    AddFloor(scene, scene.Create<DisneyMaterial>(red));
    scene.AddSphere(Point3f(0.5f, 0, 0.4f), 0.4f, scene.Create<DisneyMaterial>(metal));
    scene.AddSphere(Point3f(-0.5f, 0.3f, 1.2f), 0.2f, nullptr,
                    AreaLightParameters{RGB(10.f)});
    scene.AddLight(scene.Create<UniformInfiniteLight>(RGB(0.1f, 0.2f, 0.4f), 1));
    scene.SetCamera("perspective",
                    Inverse(LookAt(Point3f(0, -3, 2), Point3f(0, 0, 0.3f),
                                   Vector3f(0, 0, 1))));
    scene.SetFilm(Point2i(16, 12), "");
    scene.SetSampler("stratified", 8);
    return scene.CreateIntegrator();
}

TEST(Integrators, ReproducibleAcrossThreadCounts) {
    std::vector<RGB> single, multi;
    for (int nThreads : {1, 4}) {
        ParallelCleanup();
        ParallelInit(nThreads);
        Scene scene;
        std::unique_ptr<Integrator> integrator = MakeBoxScene(scene);
        integrator->Render();
        RGBFilm *film = dynamic_cast<ImageTileIntegrator *>(integrator.get())
                            ->GetCamera()
                            .GetFilm();
        std::vector<RGB> &pixels = nThreads == 1 ? single : multi;
        for (Point2i p : film->PixelBounds())
            pixels.push_back(film->GetPixelRGB(p));
    }
    ParallelCleanup();
    ParallelInit(Options->nThreads);

    ASSERT_EQ(single.size(), multi.size());
    Float total = 0;
    for (size_t i = 0; i < single.size(); ++i) {
        for (int c = 0; c < 3; ++c)
            EXPECT_EQ(single[i][c], multi[i][c]) << i;
        total += single[i].Average();
    }
    EXPECT_GT(total, 0);
}

TEST(Integrators, OccludedLightContributesNothing) {
    for (bool occluded : {false, true}) {
        Scene scene;
        Material diffuse = scene.Create<DiffuseMaterial>(RGB(0.5f));
        AddFloor(scene, diffuse);
        scene.AddSphere(Point3f(0, 0, 2), 0.05f, nullptr, AreaLightParameters{RGB(50.f)});
        if (occluded)
            scene.AddTriangleMesh(Transform(), false, {0, 1, 2, 0, 2, 3},
                                  {Point3f(-0.3f, -0.3f, 1), Point3f(0.3f, -0.3f, 1),
                                   Point3f(0.3f, 0.3f, 1), Point3f(-0.3f, 0.3f, 1)},
                                  {}, {}, diffuse);
        LookDown(scene, Point2i(4, 4));
        IntegratorParameters params;
        params.maxDepth = 1;
        scene.SetIntegrator("path", params);
        std::unique_ptr<Integrator> integrator = scene.CreateIntegrator();
        auto path = dynamic_cast<PathIntegrator *>(integrator.get());
        ASSERT_TRUE(path != nullptr);

        // Rays start between the occluder and the floor.
        Sampler sampler = Sampler::Create("independent", 64, 0, true, Allocator());
        ScratchBuffer scratch;
        RGB sum(0.f);
        for (int i = 0; i < 64; ++i) {
            sampler.StartPixelSample(Point2i(0, 0), i);
            sum += path->Li(Ray(Point3f(0.05f, 0.05f, 0.5f), Vector3f(0, 0, -1)), sampler,
                            scratch);
            scratch.Reset();
        }
        if (occluded)
            EXPECT_EQ(RGB(0.f), sum);
        else
            EXPECT_GT(sum.Average(), 0);
    }
}

TEST(Integrators, SurfaceWithoutMaterialBlocksLight) {
    // A diffuse floor under a uniform sky; with nothing overhead the reflected
    // radiance is the albedo. A shell with no material around the shading
    // point must block the sky for both BSDF-sampled and light-sampled paths.
    for (bool enclosed : {false, true}) {
        Scene scene;
        AddFloor(scene, scene.Create<DiffuseMaterial>(RGB(0.5f)), 1);
        scene.AddLight(scene.Create<UniformInfiniteLight>(RGB(1.f), 1));
        if (enclosed)
            scene.AddSphere(Point3f(0, 0, 0), 1.5f, nullptr);
        LookDown(scene, Point2i(4, 4));
        IntegratorParameters params;
        params.maxDepth = 1;
        scene.SetIntegrator("path", params);
        std::unique_ptr<Integrator> integrator = scene.CreateIntegrator();
        auto path = dynamic_cast<PathIntegrator *>(integrator.get());
        ASSERT_TRUE(path != nullptr);

        int nSamples = 4096;
        Sampler sampler = Sampler::Create("independent", nSamples, 0, true, Allocator());
        ScratchBuffer scratch;
        RGB sum(0.f);
        for (int i = 0; i < nSamples; ++i) {
            sampler.StartPixelSample(Point2i(0, 0), i);
            sum += path->Li(Ray(Point3f(0, 0, 0.5f), Vector3f(0, 0, -1)), sampler, scratch);
            scratch.Reset();
        }
        if (enclosed)
            EXPECT_EQ(RGB(0.f), sum);
        else
            EXPECT_NEAR(0.5f, sum.g / nSamples, 0.025f);
    }
}

TEST(Integrators, MaxDepthZeroIsEmissionOnly) {
    Scene scene;
    AddFloor(scene, scene.Create<DiffuseMaterial>(RGB(0.5f)));
    scene.AddSphere(Point3f(0, 0, 1), 0.5f, nullptr, AreaLightParameters{RGB(3.f)});
    LookDown(scene, Point2i(4, 4));
    IntegratorParameters params;
    params.maxDepth = 0;
    scene.SetIntegrator("path", params);
    std::unique_ptr<Integrator> integrator = scene.CreateIntegrator();
    auto path = dynamic_cast<PathIntegrator *>(integrator.get());
    ASSERT_TRUE(path != nullptr);

    Sampler sampler = Sampler::Create("independent", 1, 0, true, Allocator());
    sampler.StartPixelSample(Point2i(0, 0), 0);
    ScratchBuffer scratch;
    // Straight at the emitter.
    EXPECT_EQ(RGB(3.f),
              path->Li(Ray(Point3f(0, 0, 3), Vector3f(0, 0, -1)), sampler, scratch));
    // At the lit floor, which only reflects.
    EXPECT_EQ(RGB(0.f),
              path->Li(Ray(Point3f(1.5f, 1.5f, 3), Vector3f(0, 0, -1)), sampler, scratch));
}

TEST(Integrators, EmptyScene) {
    {
        Scene scene;
        LookDown(scene, Point2i(4, 4));
        scene.SetSampler("independent", 4);
        std::unique_ptr<Integrator> integrator = scene.CreateIntegrator();
        EXPECT_FALSE(integrator->aggregate);
        integrator->Render();
        RGBFilm *film = dynamic_cast<ImageTileIntegrator *>(integrator.get())
                            ->GetCamera()
                            .GetFilm();
        EXPECT_EQ(16 * 4, film->TotalSampleCount());
        for (Point2i p : film->PixelBounds())
            EXPECT_EQ(RGB(0.f), film->GetPixelRGB(p));
    }
    {
        // Only the background contributes.
        Scene scene;
        scene.AddLight(scene.Create<UniformInfiniteLight>(RGB(0.25f, 0.5f, 1.f), 1));
        LookDown(scene, Point2i(4, 4));
        scene.SetSampler("independent", 4);
        std::unique_ptr<Integrator> integrator = scene.CreateIntegrator();
        integrator->Render();
        RGBFilm *film = dynamic_cast<ImageTileIntegrator *>(integrator.get())
                            ->GetCamera()
                            .GetFilm();
        for (Point2i p : film->PixelBounds()) {
            RGB L = film->GetPixelRGB(p);
            EXPECT_FLOAT_EQ(0.25f, L.r);
            EXPECT_FLOAT_EQ(0.5f, L.g);
            EXPECT_FLOAT_EQ(1.f, L.b);
        }
    }
}

TEST(Integrators, StopBeforeRender) {
    Scene scene;
    std::unique_ptr<Integrator> integrator = MakeBoxScene(scene);
    auto tile = dynamic_cast<ImageTileIntegrator *>(integrator.get());
    ASSERT_TRUE(tile != nullptr);

    tile->RequestStop();
    EXPECT_TRUE(tile->StopRequested());
    tile->Render();
    EXPECT_EQ(0, tile->GetCamera().GetFilm()->TotalSampleCount());

    tile->ClearStop();
    tile->Render();
    EXPECT_EQ(16 * 12 * 8, tile->GetCamera().GetFilm()->TotalSampleCount());
}

TEST(Integrators, Preview) {
    Scene scene;
    AddFloor(scene, scene.Create<DiffuseMaterial>(RGB(0.25f, 0.5f, 0.75f)));
    scene.AddSphere(Point3f(0, 0, 1), 0.1f, nullptr, AreaLightParameters{RGB(2.f)});
    LookDown(scene, Point2i(4, 4));
    scene.SetIntegrator("preview", IntegratorParameters());
    std::unique_ptr<Integrator> integrator = scene.CreateIntegrator();
    auto preview = dynamic_cast<PreviewIntegrator *>(integrator.get());
    ASSERT_TRUE(preview != nullptr);

    Sampler sampler = Sampler::Create("independent", 1, 0, true, Allocator());
    sampler.StartPixelSample(Point2i(0, 0), 0);
    ScratchBuffer scratch;
    // Head-on, so the cosine factor is one.
    RGB floor =
        preview->Li(Ray(Point3f(0.5f, 0.5f, 3), Vector3f(0, 0, -1)), sampler, scratch);
    EXPECT_FLOAT_EQ(0.25f, floor.r);
    EXPECT_FLOAT_EQ(0.5f, floor.g);
    EXPECT_FLOAT_EQ(0.75f, floor.b);
    EXPECT_EQ(RGB(2.f),
              preview->Li(Ray(Point3f(0, 0, 3), Vector3f(0, 0, -1)), sampler, scratch));
    EXPECT_EQ(RGB(0.f),
              preview->Li(Ray(Point3f(0, 0, -1), Vector3f(0, 0, -1)), sampler, scratch));
}
