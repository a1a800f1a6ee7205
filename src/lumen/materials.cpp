// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/materials.h>

#include <lumen/util/print.h>

#include <cmath>

namespace lumen {

std::string DiffuseMaterial::ToString() const {
    return StringPrintf("[ DiffuseMaterial reflectance: %s ]", reflectance);
}

// ConductorMaterial Method Definitions
ConductorMaterial::ConductorMaterial(RGB reflectance, Float uRoughness, Float vRoughness,
                                     bool remapRoughness)
    : eta(1.f),
      uRoughness(uRoughness),
      vRoughness(vRoughness),
      remapRoughness(remapRoughness) {
    // Avoid r==0 NaN case...
    RGB r = Clamp(reflectance, 0, .9999);
    for (int c = 0; c < 3; ++c)
        k[c] = 2 * std::sqrt(r[c]) / std::sqrt(std::max<Float>(0, 1 - r[c]));
}

std::string ConductorMaterial::ToString() const {
    return StringPrintf("[ ConductorMaterial eta: %s k: %s uRoughness: %f vRoughness: %f "
                        "remapRoughness: %s ]",
                        eta, k, uRoughness, vRoughness, remapRoughness);
}

std::string DisneyParameters::ToString() const {
    return StringPrintf("[ DisneyParameters baseColor: %s metallic: %f roughness: %f "
                        "specular: %f specularTint: %f anisotropic: %f sheen: %f "
                        "sheenTint: %f clearcoat: %f clearcoatGloss: %f subsurface: %f "
                        "specTrans: %f eta: %f ]",
                        baseColor, metallic, roughness, specular, specularTint,
                        anisotropic, sheen, sheenTint, clearcoat, clearcoatGloss,
                        subsurface, specTrans, eta);
}

std::string DisneyMaterial::ToString() const {
    return StringPrintf("[ DisneyMaterial params: %s ]", params);
}

std::string Material::ToString() const {
    if (!ptr())
        return "(nullptr)";
    auto toStr = [](auto ptr) { return ptr->ToString(); };
    return Dispatch(toStr);
}

}  // namespace lumen
