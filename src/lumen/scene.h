// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_SCENE_H
#define LUMEN_SCENE_H

#include <lumen/lumen.h>

#include <lumen/base/camera.h>
#include <lumen/base/light.h>
#include <lumen/base/material.h>
#include <lumen/base/shape.h>
#include <lumen/cameras.h>
#include <lumen/cpu/integrators.h>
#include <lumen/cpu/primitive.h>
#include <lumen/util/color.h>
#include <lumen/util/memory.h>
#include <lumen/util/transform.h>
#include <lumen/util/vecmath.h>

#include <memory>
#include <memory_resource>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lumen {

// AreaLightParameters Definition
struct AreaLightParameters {
    RGB L = RGB(1.f);
    Float scale = 1;
    bool twoSided = false;
};

// Scene Definition
// In-memory scene description. Every object it creates lives in the scene's
// arena, so the scene must outlive the integrator returned by
// CreateIntegrator().
class Scene {
  public:
    // Scene Public Methods
    Scene() = default;
    Scene(const Scene &) = delete;
    Scene &operator=(const Scene &) = delete;

    Allocator Alloc() { return Allocator(&resource); }

    template <typename T, typename... Args>
    T *Create(Args &&...args) {
        return NewObject<T>(Alloc(), std::forward<Args>(args)...);
    }

    void AddShape(Shape shape, Material material,
                  std::optional<AreaLightParameters> areaLight = {});
    // Returns the number of triangles kept after dropping degenerate ones.
    int AddTriangleMesh(const Transform &worldFromObject, bool reverseOrientation,
                        std::vector<int> vertexIndices, std::vector<Point3f> p,
                        std::vector<Normal3f> n, std::vector<Point2f> uv,
                        Material material,
                        std::optional<AreaLightParameters> areaLight = {});
    void AddSphere(Point3f center, Float radius, Material material,
                   std::optional<AreaLightParameters> areaLight = {},
                   bool reverseOrientation = false);
    void AddLight(Light light);

    void SetCamera(const std::string &name, const Transform &worldFromCamera,
                   const CameraParameters &parameters = {});
    void SetFilm(Point2i resolution, const std::string &filename,
                 const std::string &filterName = "box",
                 Vector2f filterRadius = Vector2f(0.5f, 0.5f),
                 std::optional<Bounds2i> pixelBounds = {},
                 Float maxComponentValue = Infinity);
    void SetSampler(const std::string &name, int samplesPerPixel, bool jitter = true);
    void SetAccelerator(const std::string &splitMethod, int maxPrimsInNode);
    void SetIntegrator(const std::string &name, const IntegratorParameters &parameters);

    // Creates the film, camera, sampler and BVH and returns the integrator that
    // renders them.
    std::unique_ptr<Integrator> CreateIntegrator();

    const std::vector<Primitive> &Primitives() const { return primitives; }
    const std::vector<Light> &Lights() const { return lights; }
    int DegenerateTriangleCount() const { return nDegenerateTriangles; }

    std::string ToString() const;

  private:
    // Scene Private Methods
    Primitive CreateAggregate();

    // Scene Private Members
    std::pmr::monotonic_buffer_resource resource;
    std::vector<Primitive> primitives;
    std::vector<Light> lights;
    int nDegenerateTriangles = 0;

    std::string cameraName = "perspective";
    Transform worldFromCamera;
    CameraParameters cameraParameters;

    Point2i resolution = Point2i(1280, 720);
    std::string filename = "lumen.pfm";
    std::string filterName = "box";
    Vector2f filterRadius = Vector2f(0.5f, 0.5f);
    std::optional<Bounds2i> pixelBounds;
    Float maxComponentValue = Infinity;

    std::string samplerName = "stratified";
    int samplesPerPixel = 16;
    bool jitter = true;

    std::string splitMethod = "sah";
    int maxPrimsInNode = 4;

    std::string integratorName = "path";
    IntegratorParameters integratorParameters;
};

}  // namespace lumen

#endif  // LUMEN_SCENE_H
