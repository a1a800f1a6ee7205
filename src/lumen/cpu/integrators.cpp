// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/cpu/integrators.h>

#include <lumen/bsdf.h>
#include <lumen/cameras.h>
#include <lumen/cpu/aggregates.h>
#include <lumen/film.h>
#include <lumen/filters.h>
#include <lumen/interaction.h>
#include <lumen/lights.h>
#include <lumen/materials.h>
#include <lumen/options.h>
#include <lumen/samplers.h>
#include <lumen/shapes.h>
#include <lumen/util/check.h>
#include <lumen/util/color.h>
#include <lumen/util/error.h>
#include <lumen/util/log.h>
#include <lumen/util/math.h>
#include <lumen/util/memory.h>
#include <lumen/util/parallel.h>
#include <lumen/util/progressreporter.h>
#include <lumen/util/sampling.h>

#include <algorithm>
#include <memory_resource>

namespace lumen {

std::string IntegratorParameters::ToString() const {
    return StringPrintf("[ IntegratorParameters maxDepth: %d lightSampler: %s "
                        "regularize: %s russianRoulette: %s rrDepth: %d ]",
                        maxDepth, lightSampler, regularize, russianRoulette, rrDepth);
}

// Integrator Method Definitions
Integrator::~Integrator() {}

Integrator::Integrator(Primitive aggregate, std::vector<Light> lights)
    : aggregate(aggregate), lights(lights) {
    // Integrator constructor implementation
    Bounds3f sceneBounds = aggregate ? aggregate.Bounds() : Bounds3f();
    if (sceneBounds.IsDegenerate())
        // Lights still need a finite extent to place themselves around
        sceneBounds = Bounds3f(Point3f(0, 0, 0));
    for (auto &light : this->lights) {
        light.Preprocess(sceneBounds);
        if (light.Type() == LightType::Infinite)
            infiniteLights.push_back(light);
    }
}

std::optional<ShapeIntersection> Integrator::Intersect(const Ray &ray, Float tMax) const {
    DCHECK_NE(ray.d, Vector3f(0, 0, 0));
    if (aggregate)
        return aggregate.Intersect(ray, tMax);
    else
        return {};
}

bool Integrator::IntersectP(const Ray &ray, Float tMax) const {
    DCHECK_NE(ray.d, Vector3f(0, 0, 0));
    if (aggregate)
        return aggregate.IntersectP(ray, tMax);
    else
        return false;
}

std::unique_ptr<Integrator> Integrator::Create(const std::string &name,
                                               const IntegratorParameters &parameters,
                                               Camera camera, Sampler sampler,
                                               Primitive aggregate,
                                               std::vector<Light> lights) {
    if (!camera)
        ErrorExit("%s: integrator requires a camera.", name);
    if (!sampler)
        ErrorExit("%s: integrator requires a sampler.", name);

    std::unique_ptr<Integrator> integrator;
    if (name == "path")
        integrator = PathIntegrator::Create(parameters, camera, sampler, aggregate, lights);
    else if (name == "preview")
        integrator =
            PreviewIntegrator::Create(parameters, camera, sampler, aggregate, lights);
    else
        ErrorExit("%s: integrator type unknown.", name);

    if (!integrator)
        ErrorExit("%s: unable to create integrator.", name);

    return integrator;
}

// ImageTileIntegrator Method Definitions
void ImageTileIntegrator::Render() {
    // Check the scene before any rendering work starts
    RGBFilm *film = camera.GetFilm();
    CHECK(film);
    Bounds2i pixelBounds = film->PixelBounds();
    if (pixelBounds.IsEmpty())
        ErrorExit("%s: film has no pixels to render.", pixelBounds);
    if (!aggregate && lights.empty())
        Warning("Scene has no primitives and no lights; the image will be black.");
    else if (!aggregate)
        Warning("Scene has no primitives.");

    thread_local Point2i threadPixel;
    thread_local int threadSampleIndex;
    CheckCallbackScope _([&]() {
        return StringPrintf("Rendering failed at pixel (%d, %d) sample %d.\n",
                            threadPixel.x, threadPixel.y, threadSampleIndex);
    });

    // Declare common variables for rendering image in tiles
    std::pmr::monotonic_buffer_resource samplerResource;
    ThreadLocal<ScratchBuffer> scratchBuffers([]() { return ScratchBuffer(65536); });
    ThreadLocal<Sampler> samplers([this, &samplerResource]() {
        return samplerPrototype.Clone(Allocator(&samplerResource));
    });

    int spp = samplerPrototype.SamplesPerPixel();
    ProgressReporter progress(int64_t(spp) * pixelBounds.Area(), "Rendering",
                              Options->quiet);

    int waveStart = 0, waveEnd = 1, nextWaveSize = 1;

    // Render image in waves
    while (waveStart < spp && !StopRequested()) {
        // Render current wave's image tiles in parallel
        ParallelFor2D(pixelBounds, [&](Bounds2i tileBounds) {
            // Render image tile given by _tileBounds_
            ScratchBuffer &scratchBuffer = scratchBuffers.Get();
            Sampler &sampler = samplers.Get();
            int64_t nEvaluated = 0;
            for (Point2i pPixel : tileBounds) {
                threadPixel = pPixel;
                // Render samples in pixel _pPixel_
                for (int sampleIndex = waveStart; sampleIndex < waveEnd; ++sampleIndex) {
                    if (StopRequested())
                        break;
                    threadSampleIndex = sampleIndex;
                    sampler.StartPixelSample(pPixel, sampleIndex);
                    EvaluatePixelSample(pPixel, sampleIndex, sampler, scratchBuffer);
                    scratchBuffer.Reset();
                    ++nEvaluated;
                }
            }
            progress.Update(nEvaluated);
        });

        // Update start and end wave
        waveStart = waveEnd;
        waveEnd = std::min(spp, waveEnd + nextWaveSize);
        nextWaveSize = std::min(2 * nextWaveSize, 64);

        // Optionally write current image to disk
        if (Options->writePartialImages && !film->GetFilename().empty()) {
            LOG_VERBOSE("Writing image with spp = %d", waveStart);
            if (!film->WriteImage())
                Warning("%s: unable to write partial image.", film->GetFilename());
        }
    }

    progress.Done();
    if (StopRequested())
        LOG_VERBOSE("Rendering stopped after %d samples", film->TotalSampleCount());
    else
        LOG_VERBOSE("Rendering finished");
}

// RayIntegrator Method Definitions
void RayIntegrator::EvaluatePixelSample(Point2i pPixel, int sampleIndex, Sampler sampler,
                                        ScratchBuffer &scratchBuffer) {
    // Initialize _CameraSample_ for current sample
    RGBFilm *film = camera.GetFilm();
    CameraSample cameraSample = GetCameraSample(sampler, pPixel, film->GetFilter());

    // Generate camera ray for current sample
    std::optional<CameraRay> cameraRay = camera.GenerateRay(cameraSample);

    RGB L(0.f);
    // Trace _cameraRay_ if valid
    if (cameraRay) {
        // Double check that the ray's direction is normalized.
        DCHECK_GT(Length(cameraRay->ray.d), .999f);
        DCHECK_LT(Length(cameraRay->ray.d), 1.001f);

        // Evaluate radiance along camera ray
        L = cameraRay->weight * Li(cameraRay->ray, sampler, scratchBuffer);

        // Issue warning if unexpected radiance value is returned
        if (!L.IsFinite()) {
            LOG_ERROR("Non-finite radiance value returned for pixel (%d, %d), "
                      "sample %d. Setting to black.",
                      pPixel.x, pPixel.y, sampleIndex);
            L = RGB(0.f);
        }
    }

    // Add camera ray's contribution to image
    film->AddSample(pPixel, L, cameraSample.filterWeight);
}

// PreviewIntegrator Method Definitions
RGB PreviewIntegrator::Li(Ray ray, Sampler sampler, ScratchBuffer &scratchBuffer) const {
    std::optional<ShapeIntersection> si = Intersect(ray);
    if (!si) {
        RGB L(0.f);
        for (const auto &light : infiniteLights)
            L += light.Le(ray);
        return L;
    }

    const SurfaceInteraction &isect = si->intr;
    if (isect.areaLight)
        return isect.Le(-ray.d);
    if (!isect.material)
        return RGB(0.f);
    // Shade with the base color, darkened toward grazing angles
    return isect.material.BaseColor() * AbsDot(ray.d, isect.shading.n);
}

std::unique_ptr<PreviewIntegrator> PreviewIntegrator::Create(
    const IntegratorParameters &parameters, Camera camera, Sampler sampler,
    Primitive aggregate, std::vector<Light> lights) {
    return std::make_unique<PreviewIntegrator>(camera, sampler, aggregate, lights);
}

std::string PreviewIntegrator::ToString() const { return "[ PreviewIntegrator ]"; }

// PathIntegrator Method Definitions
PathIntegrator::PathIntegrator(int maxDepth, Camera camera, Sampler sampler,
                               Primitive aggregate, std::vector<Light> lights,
                               const std::string &lightSampleStrategy, bool regularize,
                               bool russianRoulette, int rrDepth)
    : RayIntegrator(camera, sampler, aggregate, lights),
      maxDepth(maxDepth),
      lightSampler(LightSampler::Create(lightSampleStrategy, this->lights,
                                        Allocator(&lightSamplerResource))),
      regularize(regularize),
      russianRoulette(russianRoulette),
      rrDepth(rrDepth) {}

RGB PathIntegrator::Li(Ray ray, Sampler sampler, ScratchBuffer &scratchBuffer) const {
    // Declare local variables for _PathIntegrator::Li()_
    RGB L(0.f), beta(1.f);
    int depth = 0;

    Float bsdfPDF = 0;
    bool specularBounce = false, anyNonSpecularBounces = false;
    LightSampleContext prevIntrCtx;

    while (true) {
        // Find next path vertex and accumulate contribution
        std::optional<ShapeIntersection> si = Intersect(ray);
        // Add emitted light at path vertex or from the environment
        if (!si) {
            // Incorporate emission from infinite lights for escaped ray
            for (const auto &light : infiniteLights) {
                RGB Le = light.Le(ray);
                if (depth == 0 || specularBounce)
                    L += beta * Le;
                else {
                    // Compute MIS weight for infinite light
                    Float lightPDF = lightSampler.PMF(prevIntrCtx, light) *
                                     light.PDF_Li(prevIntrCtx, ray.d);
                    Float weight = PowerHeuristic(1, bsdfPDF, 1, lightPDF);

                    L += beta * weight * Le;
                }
            }

            break;
        }
        // Incorporate emission from emissive surface hit by ray
        RGB Le = si->intr.Le(-ray.d);
        if (Le) {
            if (depth == 0 || specularBounce)
                L += beta * Le;
            else {
                // Compute MIS weight for area light
                Light areaLight(si->intr.areaLight);
                Float lightPDF = lightSampler.PMF(prevIntrCtx, areaLight) *
                                 areaLight.PDF_Li(prevIntrCtx, ray.d);
                Float weight = PowerHeuristic(1, bsdfPDF, 1, lightPDF);

                L += beta * weight * Le;
            }
        }

        SurfaceInteraction &isect = si->intr;
        // Surfaces without a material absorb, as they do for shadow rays
        BSDF bsdf = isect.GetBSDF(scratchBuffer, sampler);
        if (!bsdf)
            break;

        // End path if maximum depth reached
        if (depth++ == maxDepth)
            break;

        // Draw this bounce's sample values; every bounce uses the same dimensions
        Float uLightChoice = sampler.Get1D();
        Point2f uLight = sampler.Get2D();
        Float uLobe = sampler.Get1D();
        Point2f uBSDF = sampler.Get2D();
        Float uRR = sampler.Get1D();

        // Possibly regularize the BSDF
        if (regularize && anyNonSpecularBounces)
            bsdf.Regularize();

        // Sample direct illumination from the light sources
        if (IsNonSpecular(bsdf.Flags())) {
            RGB Ld = SampleLd(isect, &bsdf, uLightChoice, uLight);
            L += beta * Ld;
        }

        // Sample BSDF to get new path direction
        Vector3f wo = -ray.d;
        std::optional<BSDFSample> bs = bsdf.Sample_f(wo, uLobe, uBSDF);
        if (!bs)
            break;
        // Update path state variables for after surface scattering
        beta *= bs->f * AbsDot(bs->wi, isect.shading.n) / bs->pdf;
        if (!beta.IsFinite() || std::min({beta.r, beta.g, beta.b}) < 0) {
            LOG_VERBOSE("Discarding path with throughput %s after %s", beta, *bs);
            break;
        }
        bsdfPDF = bs->pdf;
        specularBounce = bs->IsSpecular();
        anyNonSpecularBounces |= !bs->IsSpecular();
        prevIntrCtx = LightSampleContext(isect);

        ray = isect.SpawnRay(bs->wi);

        // Possibly terminate the path with Russian roulette
        if (russianRoulette && depth > rrDepth) {
            Float maxBeta = beta.MaxComponentValue();
            if (maxBeta < 1) {
                Float q = std::max<Float>(0, 1 - maxBeta);
                if (uRR < q)
                    break;
                beta /= 1 - q;
            }
        }
    }
    return L;
}

RGB PathIntegrator::SampleLd(const SurfaceInteraction &intr, const BSDF *bsdf,
                             Float uLightChoice, Point2f uLight) const {
    // Initialize _LightSampleContext_ for light sampling
    LightSampleContext ctx(intr);
    // Try to nudge the light sampling position to correct side of the surface
    BxDFFlags flags = bsdf->Flags();
    if (IsReflective(flags) && !IsTransmissive(flags))
        ctx.p = intr.OffsetRayOrigin(intr.wo);
    else if (IsTransmissive(flags) && !IsReflective(flags))
        ctx.p = intr.OffsetRayOrigin(-intr.wo);

    // Choose a light source for the direct lighting calculation
    std::optional<SampledLight> sampledLight = lightSampler.Sample(ctx, uLightChoice);
    if (!sampledLight)
        return RGB(0.f);

    // Sample a point on the light source for direct lighting
    Light light = sampledLight->light;
    DCHECK(light && sampledLight->p > 0);
    std::optional<LightLiSample> ls = light.SampleLi(ctx, uLight);
    if (!ls || !ls->L || ls->pdf == 0)
        return RGB(0.f);

    // Evaluate BSDF for light sample and check light visibility
    Vector3f wo = intr.wo, wi = ls->wi;
    RGB f = bsdf->f(wo, wi) * AbsDot(wi, intr.shading.n);
    if (!f || !Unoccluded(intr, ls->pLight))
        return RGB(0.f);

    // Return light's contribution to reflected radiance
    Float lightPDF = sampledLight->p * ls->pdf;
    if (IsDeltaLight(light.Type()))
        return f * ls->L / lightPDF;
    else {
        Float bsdfPDF = bsdf->PDF(wo, wi);
        Float weight = PowerHeuristic(1, lightPDF, 1, bsdfPDF);
        return f * ls->L * weight / lightPDF;
    }
}

std::string PathIntegrator::ToString() const {
    return StringPrintf("[ PathIntegrator maxDepth: %d lightSampler: %s regularize: %s "
                        "russianRoulette: %s rrDepth: %d ]",
                        maxDepth, lightSampler, regularize, russianRoulette, rrDepth);
}

std::unique_ptr<PathIntegrator> PathIntegrator::Create(
    const IntegratorParameters &parameters, Camera camera, Sampler sampler,
    Primitive aggregate, std::vector<Light> lights) {
    int maxDepth = parameters.maxDepth;
    if (Options->maxDepth)
        maxDepth = *Options->maxDepth;
    if (maxDepth < 0)
        ErrorExit("%d: maximum depth must not be negative.", maxDepth);
    if (parameters.rrDepth < 0)
        ErrorExit("%d: Russian roulette depth must not be negative.", parameters.rrDepth);
    return std::make_unique<PathIntegrator>(maxDepth, camera, sampler, aggregate, lights,
                                            parameters.lightSampler,
                                            parameters.regularize,
                                            parameters.russianRoulette,
                                            parameters.rrDepth);
}

}  // namespace lumen
