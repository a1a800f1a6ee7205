// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_MATERIALS_H
#define LUMEN_MATERIALS_H

#include <lumen/lumen.h>

#include <lumen/base/material.h>
#include <lumen/bsdf.h>
#include <lumen/bxdfs.h>
#include <lumen/interaction.h>
#include <lumen/util/color.h>
#include <lumen/util/memory.h>
#include <lumen/util/scattering.h>

#include <string>

namespace lumen {

// DiffuseMaterial Definition
class DiffuseMaterial {
  public:
    using BxDF = DiffuseBxDF;

    // DiffuseMaterial Public Methods
    DiffuseMaterial(RGB reflectance) : reflectance(Clamp(reflectance, 0, 1)) {}

    static const char *Name() { return "DiffuseMaterial"; }

    DiffuseBxDF GetBxDF(const MaterialEvalContext &ctx) const {
        return DiffuseBxDF(reflectance);
    }

    RGB BaseColor() const { return reflectance; }

    std::string ToString() const;

  private:
    RGB reflectance;
};

// ConductorMaterial Definition
class ConductorMaterial {
  public:
    using BxDF = ConductorBxDF;

    // ConductorMaterial Public Methods
    ConductorMaterial(RGB eta, RGB k, Float uRoughness, Float vRoughness,
                      bool remapRoughness)
        : eta(eta),
          k(k),
          uRoughness(uRoughness),
          vRoughness(vRoughness),
          remapRoughness(remapRoughness) {}
    // Conductor whose normal-incidence reflectance is _reflectance_
    ConductorMaterial(RGB reflectance, Float uRoughness, Float vRoughness,
                      bool remapRoughness);

    static const char *Name() { return "ConductorMaterial"; }

    ConductorBxDF GetBxDF(const MaterialEvalContext &ctx) const {
        Float uRough = uRoughness, vRough = vRoughness;
        if (remapRoughness) {
            uRough = TrowbridgeReitzDistribution::RoughnessToAlpha(uRough);
            vRough = TrowbridgeReitzDistribution::RoughnessToAlpha(vRough);
        }
        return ConductorBxDF(TrowbridgeReitzDistribution(uRough, vRough), eta, k);
    }

    RGB BaseColor() const { return FrComplex(1, eta, k); }

    std::string ToString() const;

  private:
    // ConductorMaterial Private Members
    RGB eta, k;
    Float uRoughness, vRoughness;
    bool remapRoughness;
};

// DisneyParameters Definition
struct DisneyParameters {
    std::string ToString() const;

    RGB baseColor = RGB(0.8f);
    Float metallic = 0;
    Float roughness = 0.5f;
    Float specular = 0.5f;
    Float specularTint = 0;
    Float anisotropic = 0;
    Float sheen = 0;
    Float sheenTint = 0.5f;
    Float clearcoat = 0;
    Float clearcoatGloss = 1;
    Float subsurface = 0;
    Float specTrans = 0;
    Float eta = 1.5f;
};

// DisneyMaterial Definition
class DisneyMaterial {
  public:
    using BxDF = DisneyBxDF;

    // DisneyMaterial Public Methods
    DisneyMaterial(const DisneyParameters &params) : params(params) {}

    static const char *Name() { return "DisneyMaterial"; }

    DisneyBxDF GetBxDF(const MaterialEvalContext &ctx) const {
        return DisneyBxDF(params.baseColor, params.metallic, params.roughness,
                          params.specular, params.specularTint, params.anisotropic,
                          params.sheen, params.sheenTint, params.clearcoat,
                          params.clearcoatGloss, params.subsurface, params.specTrans,
                          params.eta);
    }

    RGB BaseColor() const { return params.baseColor; }

    const DisneyParameters &Parameters() const { return params; }

    std::string ToString() const;

  private:
    DisneyParameters params;
};

// Material Inline Method Definitions
inline BSDF Material::GetBSDF(const MaterialEvalContext &ctx,
                              ScratchBuffer &scratchBuffer) const {
    auto getBSDF = [&](auto mtl) -> BSDF {
        using ConcreteMtl = typename std::remove_reference_t<decltype(*mtl)>;
        using ConcreteBxDF = typename ConcreteMtl::BxDF;
        // Allocate the material's BxDF and wrap it in a _BSDF_
        ConcreteBxDF *bxdf = scratchBuffer.Alloc<ConcreteBxDF>(mtl->GetBxDF(ctx));
        return BSDF(ctx.n, ctx.ns, ctx.dpdus, bxdf);
    };
    return Dispatch(getBSDF);
}

inline RGB Material::BaseColor() const {
    auto base = [&](auto ptr) { return ptr->BaseColor(); };
    return Dispatch(base);
}

}  // namespace lumen

#endif  // LUMEN_MATERIALS_H
