// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_CAMERAS_H
#define LUMEN_CAMERAS_H

#include <lumen/lumen.h>

#include <lumen/base/camera.h>
#include <lumen/base/sampler.h>
#include <lumen/film.h>
#include <lumen/ray.h>
#include <lumen/util/color.h>
#include <lumen/util/transform.h>
#include <lumen/util/vecmath.h>

#include <optional>
#include <string>

namespace lumen {

// CameraRay Definition
struct CameraRay {
    Ray ray;
    RGB weight = RGB(1);
};

// CameraBaseParameters Definition
struct CameraBaseParameters {
    CameraBaseParameters() = default;
    CameraBaseParameters(const Transform &worldFromCamera, RGBFilm *film)
        : worldFromCamera(worldFromCamera), film(film) {}

    Transform worldFromCamera;
    RGBFilm *film = nullptr;
};

// CameraParameters Definition
// Projection and lens settings shared by the camera models. _fov_ spans the
// shorter image axis; _screenWindow_ is derived from the film's aspect ratio
// unless given explicitly.
struct CameraParameters {
    Float fov = 90;
    Float lensRadius = 0;
    Float focalDistance = 1e6f;
    std::optional<Bounds2f> screenWindow;

    // Thin-lens settings for a physical film back: _focalLength_ and the
    // apertures in scene units, with the pupil radius set by the f-number.
    static CameraParameters FromFilmBack(Float focalLength, Float horizontalAperture,
                                         Float verticalAperture, Float fStop);

    std::string ToString() const;
};

// CameraBase Definition
class CameraBase {
  public:
    // CameraBase Public Methods
    RGBFilm *GetFilm() const { return film; }
    const Transform &WorldFromCamera() const { return worldFromCamera; }

    std::string ToString() const;

  protected:
    // CameraBase Protected Members
    Transform worldFromCamera;
    RGBFilm *film;

    // CameraBase Protected Methods
    CameraBase(CameraBaseParameters p);

    Ray WorldFromCamera(const Ray &r) const {
        Ray ray = worldFromCamera(r);
        ray.d = Normalize(ray.d);
        return ray;
    }
};

// ProjectiveCamera Definition
class ProjectiveCamera : public CameraBase {
  public:
    // ProjectiveCamera Public Methods
    std::string BaseToString() const;

    ProjectiveCamera(CameraBaseParameters baseParameters,
                     const Transform &screenFromCamera, const Bounds2f &screenWindow,
                     Float lensRadius, Float focalDistance)
        : CameraBase(baseParameters),
          screenFromCamera(screenFromCamera),
          lensRadius(lensRadius),
          focalDistance(focalDistance) {
        // Compute projective camera screen transformations
        Transform NDCFromScreen =
            Scale(1 / (screenWindow.pMax.x - screenWindow.pMin.x),
                  1 / (screenWindow.pMax.y - screenWindow.pMin.y), 1) *
            Translate(Vector3f(-screenWindow.pMin.x, -screenWindow.pMax.y, 0));
        Transform rasterFromNDC =
            Scale(film->FullResolution().x, -film->FullResolution().y, 1);
        rasterFromScreen = rasterFromNDC * NDCFromScreen;
        screenFromRaster = Inverse(rasterFromScreen);

        cameraFromRaster = Inverse(screenFromCamera) * screenFromRaster;
    }

    // Maps a raster-space film position to the point on the camera's
    // canonical image plane.
    Point3f CameraFromRaster(Point2f pFilm) const {
        return cameraFromRaster(Point3f(pFilm.x, pFilm.y, 0));
    }

  protected:
    // ProjectiveCamera Protected Members
    Transform screenFromCamera, cameraFromRaster;
    Transform rasterFromScreen, screenFromRaster;
    Float lensRadius, focalDistance;
};

// PerspectiveCamera Definition
class PerspectiveCamera : public ProjectiveCamera {
  public:
    // PerspectiveCamera Public Methods
    PerspectiveCamera(CameraBaseParameters baseParameters, Float fov,
                      const Bounds2f &screenWindow, Float lensRadius, Float focalDistance)
        : ProjectiveCamera(baseParameters, Perspective(fov, 1e-2f, 1000.f), screenWindow,
                           lensRadius, focalDistance),
          fov(fov) {}

    static PerspectiveCamera *Create(const CameraBaseParameters &baseParameters,
                                     const CameraParameters &parameters,
                                     Allocator alloc = {});

    std::optional<CameraRay> GenerateRay(CameraSample sample) const;

    std::string ToString() const;

  private:
    Float fov;
};

// OrthographicCamera Definition
class OrthographicCamera : public ProjectiveCamera {
  public:
    // OrthographicCamera Public Methods
    OrthographicCamera(CameraBaseParameters baseParameters, const Bounds2f &screenWindow,
                       Float lensRadius, Float focalDistance)
        : ProjectiveCamera(baseParameters, Orthographic(0, 1), screenWindow, lensRadius,
                           focalDistance) {}

    static OrthographicCamera *Create(const CameraBaseParameters &baseParameters,
                                      const CameraParameters &parameters,
                                      Allocator alloc = {});

    std::optional<CameraRay> GenerateRay(CameraSample sample) const;

    std::string ToString() const;
};

inline std::optional<CameraRay> Camera::GenerateRay(CameraSample sample) const {
    auto generate = [&](auto ptr) { return ptr->GenerateRay(sample); };
    return Dispatch(generate);
}

inline RGBFilm *Camera::GetFilm() const {
    auto getfilm = [&](auto ptr) { return ptr->GetFilm(); };
    return Dispatch(getfilm);
}

}  // namespace lumen

#endif  // LUMEN_CAMERAS_H
