// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/scene.h>

#include <lumen/cpu/aggregates.h>
#include <lumen/film.h>
#include <lumen/filters.h>
#include <lumen/lights.h>
#include <lumen/materials.h>
#include <lumen/options.h>
#include <lumen/samplers.h>
#include <lumen/shapes.h>
#include <lumen/util/check.h>
#include <lumen/util/error.h>
#include <lumen/util/log.h>
#include <lumen/util/mesh.h>
#include <lumen/util/print.h>

namespace lumen {

// Scene Method Definitions
void Scene::AddShape(Shape shape, Material material,
                     std::optional<AreaLightParameters> areaLight) {
    CHECK(shape);
    if (!material && !areaLight)
        Warning("%s: shape has neither a material nor emission; it will only occlude.",
                shape);

    Light light = nullptr;
    if (areaLight) {
        light = Create<DiffuseAreaLight>(shape, areaLight->L, areaLight->scale,
                                         areaLight->twoSided);
        lights.push_back(light);
    }
    primitives.push_back(Create<GeometricPrimitive>(shape, material, light));
}

int Scene::AddTriangleMesh(const Transform &worldFromObject, bool reverseOrientation,
                           std::vector<int> vertexIndices, std::vector<Point3f> p,
                           std::vector<Normal3f> n, std::vector<Point2f> uv,
                           Material material,
                           std::optional<AreaLightParameters> areaLight) {
    const TriangleMesh *mesh = Create<TriangleMesh>(
        worldFromObject, reverseOrientation, std::move(vertexIndices), std::move(p),
        std::move(n), std::move(uv), Alloc());
    nDegenerateTriangles += mesh->nDegenerateTriangles;

    std::vector<Shape> triangles = Triangle::CreateTriangles(mesh, Alloc());
    for (Shape tri : triangles)
        AddShape(tri, material, areaLight);
    return int(triangles.size());
}

void Scene::AddSphere(Point3f center, Float radius, Material material,
                      std::optional<AreaLightParameters> areaLight,
                      bool reverseOrientation) {
    if (!(radius > 0)) {
        Warning("%f: ignoring sphere with non-positive radius.", radius);
        return;
    }
    AddShape(Create<Sphere>(center, radius, reverseOrientation), material, areaLight);
}

void Scene::AddLight(Light light) {
    CHECK(light);
    if (light.Is<DiffuseAreaLight>())
        ErrorExit("Area lights must be attached to a shape with AddShape().");
    lights.push_back(light);
}

void Scene::SetCamera(const std::string &name, const Transform &worldFromCamera,
                      const CameraParameters &parameters) {
    cameraName = name;
    this->worldFromCamera = worldFromCamera;
    cameraParameters = parameters;
}

void Scene::SetFilm(Point2i resolution, const std::string &filename,
                    const std::string &filterName, Vector2f filterRadius,
                    std::optional<Bounds2i> pixelBounds, Float maxComponentValue) {
    this->resolution = resolution;
    this->filename = filename;
    this->filterName = filterName;
    this->filterRadius = filterRadius;
    this->pixelBounds = pixelBounds;
    this->maxComponentValue = maxComponentValue;
}

void Scene::SetSampler(const std::string &name, int samplesPerPixel, bool jitter) {
    samplerName = name;
    this->samplesPerPixel = samplesPerPixel;
    this->jitter = jitter;
}

void Scene::SetAccelerator(const std::string &splitMethod, int maxPrimsInNode) {
    this->splitMethod = splitMethod;
    this->maxPrimsInNode = maxPrimsInNode;
}

void Scene::SetIntegrator(const std::string &name,
                          const IntegratorParameters &parameters) {
    integratorName = name;
    integratorParameters = parameters;
}

Primitive Scene::CreateAggregate() {
    if (primitives.empty())
        return nullptr;
    return BVHAggregate::Create(primitives, splitMethod, maxPrimsInNode, Alloc());
}

std::unique_ptr<Integrator> Scene::CreateIntegrator() {
    // Command-line options take precedence over the scene's settings
    std::string imageFile = Options->imageFile.empty() ? filename : Options->imageFile;
    std::optional<Bounds2i> bounds = Options->pixelBounds ? Options->pixelBounds : pixelBounds;
    int spp = Options->pixelSamples ? *Options->pixelSamples : samplesPerPixel;

    Filter filter = Filter::Create(filterName, filterRadius, Alloc());
    RGBFilm *film =
        RGBFilm::Create(resolution, bounds, filter, imageFile, maxComponentValue, Alloc());
    Camera camera = Camera::Create(
        cameraName, CameraBaseParameters(worldFromCamera, film), cameraParameters, Alloc());
    Sampler sampler = Sampler::Create(samplerName, spp, Options->seed, jitter, Alloc());

    Primitive aggregate = CreateAggregate();
    LOG_VERBOSE("Scene has %d primitives and %d lights", primitives.size(), lights.size());

    return Integrator::Create(integratorName, integratorParameters, camera, sampler,
                              aggregate, lights);
}

std::string Scene::ToString() const {
    return StringPrintf("[ Scene primitives: %d lights: %d degenerateTriangles: %d "
                        "camera: %s film: %s %s sampler: %s spp: %d integrator: %s %s ]",
                        primitives.size(), lights.size(), nDegenerateTriangles,
                        cameraName, resolution, filename, samplerName, samplesPerPixel,
                        integratorName, integratorParameters);
}

}  // namespace lumen
