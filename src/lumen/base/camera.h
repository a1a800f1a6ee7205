// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_BASE_CAMERA_H
#define LUMEN_BASE_CAMERA_H

#include <lumen/lumen.h>

#include <lumen/util/taggedptr.h>

#include <optional>
#include <string>

namespace lumen {

// Camera Declarations
struct CameraRay;
struct CameraSample;
struct CameraBaseParameters;
struct CameraParameters;

class RGBFilm;
class PerspectiveCamera;
class OrthographicCamera;

// Camera Definition
class Camera : public TaggedPointer<PerspectiveCamera, OrthographicCamera> {
  public:
    // Camera Interface
    using TaggedPointer::TaggedPointer;

    static Camera Create(const std::string &name,
                         const CameraBaseParameters &baseParameters,
                         const CameraParameters &parameters, Allocator alloc);

    std::optional<CameraRay> GenerateRay(CameraSample sample) const;

    RGBFilm *GetFilm() const;

    std::string ToString() const;
};

}  // namespace lumen

#endif  // LUMEN_BASE_CAMERA_H
