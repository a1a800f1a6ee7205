// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_CPU_INTEGRATORS_H
#define LUMEN_CPU_INTEGRATORS_H

#include <lumen/lumen.h>

#include <lumen/base/camera.h>
#include <lumen/base/light.h>
#include <lumen/base/lightsampler.h>
#include <lumen/base/sampler.h>
#include <lumen/bsdf.h>
#include <lumen/cameras.h>
#include <lumen/cpu/primitive.h>
#include <lumen/film.h>
#include <lumen/interaction.h>
#include <lumen/lights.h>
#include <lumen/lightsamplers.h>
#include <lumen/util/color.h>
#include <lumen/util/memory.h>
#include <lumen/util/print.h>

#include <atomic>
#include <memory_resource>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lumen {

// IntegratorParameters Definition
struct IntegratorParameters {
    // Bounces past this depth are truncated, which biases the estimate
    int maxDepth = 5;
    std::string lightSampler = "power";
    bool regularize = false;
    // Russian roulette is applied once a path has more than _rrDepth_ bounces
    bool russianRoulette = true;
    int rrDepth = 1;

    std::string ToString() const;
};

// Integrator Definition
class Integrator {
  public:
    // Integrator Public Methods
    virtual ~Integrator();

    static std::unique_ptr<Integrator> Create(const std::string &name,
                                              const IntegratorParameters &parameters,
                                              Camera camera, Sampler sampler,
                                              Primitive aggregate,
                                              std::vector<Light> lights);

    virtual std::string ToString() const = 0;

    virtual void Render() = 0;

    std::optional<ShapeIntersection> Intersect(const Ray &ray,
                                               Float tMax = Infinity) const;
    bool IntersectP(const Ray &ray, Float tMax = Infinity) const;

    bool Unoccluded(const Interaction &p0, const Interaction &p1) const {
        return !IntersectP(p0.SpawnRayTo(p1), 1 - ShadowEpsilon);
    }

    // Integrator Public Members
    Primitive aggregate;
    std::vector<Light> lights;
    std::vector<Light> infiniteLights;

  protected:
    // Integrator Protected Methods
    Integrator(Primitive aggregate, std::vector<Light> lights);
};

// ImageTileIntegrator Definition
// Renders the film's pixel bounds in waves of increasing sample counts; every
// pixel of a tile is owned by one thread for the duration of a wave.
class ImageTileIntegrator : public Integrator {
  public:
    // ImageTileIntegrator Public Methods
    ImageTileIntegrator(Camera camera, Sampler sampler, Primitive aggregate,
                        std::vector<Light> lights)
        : Integrator(aggregate, lights), camera(camera), samplerPrototype(sampler) {}

    void Render();

    // Asks Render() to return once the pixel samples under way finish. The
    // request stays in effect until ClearStop() is called.
    void RequestStop() { stopRequested.store(true, std::memory_order_relaxed); }
    void ClearStop() { stopRequested.store(false, std::memory_order_relaxed); }
    bool StopRequested() const { return stopRequested.load(std::memory_order_relaxed); }

    virtual void EvaluatePixelSample(Point2i pPixel, int sampleIndex, Sampler sampler,
                                     ScratchBuffer &scratchBuffer) = 0;

    Camera GetCamera() const { return camera; }

  protected:
    // ImageTileIntegrator Protected Members
    Camera camera;
    Sampler samplerPrototype;
    std::atomic<bool> stopRequested{false};
};

// RayIntegrator Definition
class RayIntegrator : public ImageTileIntegrator {
  public:
    // RayIntegrator Public Methods
    RayIntegrator(Camera camera, Sampler sampler, Primitive aggregate,
                  std::vector<Light> lights)
        : ImageTileIntegrator(camera, sampler, aggregate, lights) {}

    void EvaluatePixelSample(Point2i pPixel, int sampleIndex, Sampler sampler,
                             ScratchBuffer &scratchBuffer) final;

    virtual RGB Li(Ray ray, Sampler sampler, ScratchBuffer &scratchBuffer) const = 0;
};

// PreviewIntegrator Definition
// Returns the base color of the first surface hit, for quick scene layout checks.
class PreviewIntegrator : public RayIntegrator {
  public:
    // PreviewIntegrator Public Methods
    PreviewIntegrator(Camera camera, Sampler sampler, Primitive aggregate,
                      std::vector<Light> lights)
        : RayIntegrator(camera, sampler, aggregate, lights) {}

    RGB Li(Ray ray, Sampler sampler, ScratchBuffer &scratchBuffer) const;

    static std::unique_ptr<PreviewIntegrator> Create(
        const IntegratorParameters &parameters, Camera camera, Sampler sampler,
        Primitive aggregate, std::vector<Light> lights);

    std::string ToString() const;
};

// PathIntegrator Definition
class PathIntegrator : public RayIntegrator {
  public:
    // PathIntegrator Public Methods
    PathIntegrator(int maxDepth, Camera camera, Sampler sampler, Primitive aggregate,
                   std::vector<Light> lights,
                   const std::string &lightSampleStrategy = "power",
                   bool regularize = false, bool russianRoulette = true,
                   int rrDepth = 1);

    RGB Li(Ray ray, Sampler sampler, ScratchBuffer &scratchBuffer) const;

    static std::unique_ptr<PathIntegrator> Create(const IntegratorParameters &parameters,
                                                  Camera camera, Sampler sampler,
                                                  Primitive aggregate,
                                                  std::vector<Light> lights);

    LightSampler GetLightSampler() const { return lightSampler; }

    std::string ToString() const;

  private:
    // PathIntegrator Private Methods
    RGB SampleLd(const SurfaceInteraction &intr, const BSDF *bsdf, Float uLightChoice,
                 Point2f uLight) const;

    // PathIntegrator Private Members
    int maxDepth;
    // Holds the light sampler and its tables for the integrator's lifetime
    std::pmr::monotonic_buffer_resource lightSamplerResource;
    LightSampler lightSampler;
    bool regularize;
    bool russianRoulette;
    int rrDepth;
};

}  // namespace lumen

#endif  // LUMEN_CPU_INTEGRATORS_H
