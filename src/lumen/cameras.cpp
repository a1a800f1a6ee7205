// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/cameras.h>

#include <lumen/util/error.h>
#include <lumen/util/math.h>
#include <lumen/util/memory.h>
#include <lumen/util/print.h>
#include <lumen/util/sampling.h>

#include <algorithm>
#include <cmath>

namespace lumen {

// CameraParameters Method Definitions
CameraParameters CameraParameters::FromFilmBack(Float focalLength,
                                                Float horizontalAperture,
                                                Float verticalAperture, Float fStop) {
    if (focalLength <= 0 || horizontalAperture <= 0 || verticalAperture <= 0)
        ErrorExit("Focal length %f and apertures %f x %f must be positive.",
                  focalLength, horizontalAperture, verticalAperture);
    if (fStop <= 0)
        ErrorExit("%f: f-stop must be positive.", fStop);

    CameraParameters params;
    Float shortAperture = std::min(horizontalAperture, verticalAperture);
    params.fov = Degrees(2 * std::atan(shortAperture / (2 * focalLength)));
    params.lensRadius = 0.5f * focalLength / fStop;
    params.focalDistance = focalLength;

    // The screen window follows the film back rather than the image resolution
    Float aspect = horizontalAperture / verticalAperture;
    if (aspect > 1)
        params.screenWindow = Bounds2f(Point2f(-aspect, -1), Point2f(aspect, 1));
    else
        params.screenWindow =
            Bounds2f(Point2f(-1, -1 / aspect), Point2f(1, 1 / aspect));
    return params;
}

std::string CameraParameters::ToString() const {
    return StringPrintf("[ CameraParameters fov: %f lensRadius: %f focalDistance: %f "
                        "screenWindow: %s ]",
                        fov, lensRadius, focalDistance,
                        screenWindow ? screenWindow->ToString() : std::string("(auto)"));
}

// CameraBase Method Definitions
CameraBase::CameraBase(CameraBaseParameters p)
    : worldFromCamera(p.worldFromCamera), film(p.film) {
    CHECK(film);
    if (worldFromCamera.SwapsHandedness())
        Warning("Scene's \"camera\" transformation has handedness-swapping scale. "
                "Rendering may be unexpectedly mirrored.");
}

std::string CameraBase::ToString() const {
    return StringPrintf("worldFromCamera: %s film: %s", worldFromCamera, *film);
}

std::string ProjectiveCamera::BaseToString() const {
    return CameraBase::ToString() +
           StringPrintf("screenFromCamera: %s cameraFromRaster: %s "
                        "rasterFromScreen: %s screenFromRaster: %s "
                        "lensRadius: %f focalDistance: %f",
                        screenFromCamera, cameraFromRaster, rasterFromScreen,
                        screenFromRaster, lensRadius, focalDistance);
}

static Bounds2f ScreenWindow(const CameraParameters &parameters, Point2i resolution) {
    if (parameters.screenWindow)
        return *parameters.screenWindow;

    Float frame = Float(resolution.x) / resolution.y;
    if (frame > 1.f)
        return Bounds2f(Point2f(-frame, -1), Point2f(frame, 1));
    else
        return Bounds2f(Point2f(-1, -1 / frame), Point2f(1, 1 / frame));
}

static void CheckLens(const CameraParameters &parameters) {
    if (parameters.lensRadius < 0)
        ErrorExit("%f: lens radius must not be negative.", parameters.lensRadius);
    if (parameters.lensRadius > 0 && parameters.focalDistance <= 0)
        ErrorExit("%f: focal distance must be positive.", parameters.focalDistance);
    if (parameters.screenWindow && parameters.screenWindow->IsEmpty())
        ErrorExit("%s: screen window is degenerate.", *parameters.screenWindow);
}

Camera Camera::Create(const std::string &name, const CameraBaseParameters &baseParameters,
                      const CameraParameters &parameters, Allocator alloc) {
    if (!baseParameters.film)
        ErrorExit("%s: camera requires a film.", name);

    Camera camera = nullptr;
    if (name == "perspective")
        camera = PerspectiveCamera::Create(baseParameters, parameters, alloc);
    else if (name == "orthographic")
        camera = OrthographicCamera::Create(baseParameters, parameters, alloc);
    else
        ErrorExit("%s: camera type unknown.", name);

    return camera;
}

std::string Camera::ToString() const {
    if (!ptr())
        return "(nullptr)";

    auto ts = [&](auto ptr) { return ptr->ToString(); };
    return Dispatch(ts);
}

// PerspectiveCamera Method Definitions
std::optional<CameraRay> PerspectiveCamera::GenerateRay(CameraSample sample) const {
    // Compute raster and camera sample positions
    Point3f pCamera = CameraFromRaster(sample.pFilm);

    Ray ray(Point3f(0, 0, 0), Normalize(Vector3f(pCamera)));
    // Modify ray for depth of field
    if (lensRadius > 0) {
        // Sample point on lens
        Point2f pLens = lensRadius * SampleUniformDiskConcentric(sample.pLens);

        // Compute point on plane of focus
        Float ft = focalDistance / ray.d.z;
        Point3f pFocus = ray(ft);

        // Update ray for effect of lens
        ray.o = Point3f(pLens.x, pLens.y, 0);
        ray.d = Normalize(pFocus - ray.o);
    }

    return CameraRay{WorldFromCamera(ray)};
}

PerspectiveCamera *PerspectiveCamera::Create(const CameraBaseParameters &baseParameters,
                                             const CameraParameters &parameters,
                                             Allocator alloc) {
    CheckLens(parameters);
    if (!(parameters.fov > 0 && parameters.fov < 180))
        ErrorExit("%f: field of view must be between 0 and 180 degrees.",
                  parameters.fov);

    Bounds2f screen = ScreenWindow(parameters, baseParameters.film->FullResolution());
    return NewObject<PerspectiveCamera>(alloc, baseParameters, parameters.fov, screen,
                                        parameters.lensRadius, parameters.focalDistance);
}

std::string PerspectiveCamera::ToString() const {
    return StringPrintf("[ PerspectiveCamera %s fov: %f ]", BaseToString(), fov);
}

// OrthographicCamera Method Definitions
std::optional<CameraRay> OrthographicCamera::GenerateRay(CameraSample sample) const {
    // Compute raster and camera sample positions
    Point3f pCamera = CameraFromRaster(sample.pFilm);

    Ray ray(pCamera, Vector3f(0, 0, 1));
    // Modify ray for depth of field
    if (lensRadius > 0) {
        // Sample point on lens
        Point2f pLens = lensRadius * SampleUniformDiskConcentric(sample.pLens);

        // Compute point on plane of focus
        Float ft = focalDistance / ray.d.z;
        Point3f pFocus = ray(ft);

        // Update ray for effect of lens
        ray.o = Point3f(pCamera.x + pLens.x, pCamera.y + pLens.y, 0);
        ray.d = Normalize(pFocus - ray.o);
    }

    return CameraRay{WorldFromCamera(ray)};
}

OrthographicCamera *OrthographicCamera::Create(const CameraBaseParameters &baseParameters,
                                               const CameraParameters &parameters,
                                               Allocator alloc) {
    CheckLens(parameters);
    Bounds2f screen = ScreenWindow(parameters, baseParameters.film->FullResolution());
    return NewObject<OrthographicCamera>(alloc, baseParameters, screen,
                                         parameters.lensRadius, parameters.focalDistance);
}

std::string OrthographicCamera::ToString() const {
    return StringPrintf("[ OrthographicCamera %s ]", BaseToString());
}

}  // namespace lumen
