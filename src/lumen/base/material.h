// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_BASE_MATERIAL_H
#define LUMEN_BASE_MATERIAL_H

#include <lumen/lumen.h>

#include <lumen/util/taggedptr.h>

#include <string>

namespace lumen {

// Material Declarations
struct MaterialEvalContext;

class DiffuseMaterial;
class ConductorMaterial;
class DisneyMaterial;

// Material Definition
class Material
    : public TaggedPointer<DiffuseMaterial, ConductorMaterial, DisneyMaterial> {
  public:
    // Material Interface
    using TaggedPointer::TaggedPointer;

    // Returns a BSDF whose BxDF lives in _scratchBuffer_ until its next Reset()
    BSDF GetBSDF(const MaterialEvalContext &ctx, ScratchBuffer &scratchBuffer) const;

    // Reflectance shown by the preview integrator
    RGB BaseColor() const;

    std::string ToString() const;
};

}  // namespace lumen

#endif  // LUMEN_BASE_MATERIAL_H
