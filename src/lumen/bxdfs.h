// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_BXDFS_H
#define LUMEN_BXDFS_H

#include <lumen/lumen.h>

#include <lumen/base/bxdf.h>
#include <lumen/util/color.h>
#include <lumen/util/math.h>
#include <lumen/util/sampling.h>
#include <lumen/util/scattering.h>
#include <lumen/util/taggedptr.h>
#include <lumen/util/vecmath.h>

#include <optional>
#include <string>

namespace lumen {

// DiffuseBxDF Definition
class DiffuseBxDF {
  public:
    // DiffuseBxDF Public Methods
    DiffuseBxDF() = default;
    DiffuseBxDF(RGB R) : R(R) {}

    RGB f(Vector3f wo, Vector3f wi) const {
        if (!SameHemisphere(wo, wi))
            return RGB(0.f);
        return R * InvPi;
    }

    std::optional<BSDFSample> Sample_f(Vector3f wo, Float uc, Point2f u) const {
        // Sample cosine-weighted hemisphere to compute _wi_ and _pdf_
        Vector3f wi = SampleCosineHemisphere(u);
        if (wo.z < 0)
            wi.z *= -1;
        Float pdf = CosineHemispherePDF(AbsCosTheta(wi));
        return BSDFSample(R * InvPi, wi, pdf, BxDFFlags::DiffuseReflection);
    }

    Float PDF(Vector3f wo, Vector3f wi) const {
        if (!SameHemisphere(wo, wi))
            return 0;
        return CosineHemispherePDF(AbsCosTheta(wi));
    }

    static constexpr const char *Name() { return "DiffuseBxDF"; }

    std::string ToString() const;

    void Regularize() {}

    BxDFFlags Flags() const {
        return R ? BxDFFlags::DiffuseReflection : BxDFFlags::Unset;
    }

  private:
    RGB R;
};

// ConductorBxDF Definition
// Torrance-Sparrow microfacet reflection with the complex Fresnel equations,
// evaluated independently for each RGB channel.
class ConductorBxDF {
  public:
    // ConductorBxDF Public Methods
    ConductorBxDF() = default;
    ConductorBxDF(const TrowbridgeReitzDistribution &mfDistrib, RGB eta, RGB k)
        : mfDistrib(mfDistrib), eta(eta), k(k) {}

    BxDFFlags Flags() const {
        return mfDistrib.EffectivelySmooth() ? BxDFFlags::SpecularReflection
                                             : BxDFFlags::GlossyReflection;
    }

    std::optional<BSDFSample> Sample_f(Vector3f wo, Float uc, Point2f u) const {
        if (mfDistrib.EffectivelySmooth()) {
            // Sample perfect specular conductor BRDF
            Vector3f wi(-wo.x, -wo.y, wo.z);
            RGB f = FrComplex(AbsCosTheta(wi), eta, k) / AbsCosTheta(wi);
            return BSDFSample(f, wi, 1, BxDFFlags::SpecularReflection);
        }
        // Sample rough conductor BRDF
        // Sample microfacet normal $\wm$ and reflected direction $\wi$
        if (wo.z == 0)
            return {};
        Vector3f wm = mfDistrib.Sample_wm(wo, u);
        Vector3f wi = Reflect(wo, wm);
        if (!SameHemisphere(wo, wi))
            return {};

        // Compute PDF of _wi_ for microfacet reflection
        Float pdf = mfDistrib.PDF(wo, wm) / (4 * AbsDot(wo, wm));

        Float cosTheta_o = AbsCosTheta(wo), cosTheta_i = AbsCosTheta(wi);
        if (cosTheta_i == 0 || cosTheta_o == 0)
            return {};
        // Evaluate Fresnel factor _F_ for conductor BRDF
        RGB F = FrComplex(AbsDot(wo, wm), eta, k);

        RGB f = mfDistrib.D(wm) * F * mfDistrib.G(wo, wi) / (4 * cosTheta_i * cosTheta_o);
        return BSDFSample(f, wi, pdf, BxDFFlags::GlossyReflection);
    }

    RGB f(Vector3f wo, Vector3f wi) const {
        if (!SameHemisphere(wo, wi))
            return {};
        if (mfDistrib.EffectivelySmooth())
            return {};
        // Evaluate rough conductor BRDF
        // Compute cosines and $\wm$ for conductor BRDF
        Float cosTheta_o = AbsCosTheta(wo), cosTheta_i = AbsCosTheta(wi);
        if (cosTheta_i == 0 || cosTheta_o == 0)
            return {};
        Vector3f wm = wi + wo;
        if (LengthSquared(wm) == 0)
            return {};
        wm = Normalize(wm);

        // Evaluate Fresnel factor _F_ for conductor BRDF
        RGB F = FrComplex(AbsDot(wo, wm), eta, k);

        return mfDistrib.D(wm) * F * mfDistrib.G(wo, wi) / (4 * cosTheta_i * cosTheta_o);
    }

    Float PDF(Vector3f wo, Vector3f wi) const {
        if (!SameHemisphere(wo, wi))
            return 0;
        if (mfDistrib.EffectivelySmooth())
            return 0;
        // Evaluate sampling PDF of rough conductor BRDF
        Vector3f wm = wo + wi;
        if (LengthSquared(wm) == 0)
            return 0;
        wm = FaceForward(Normalize(wm), Vector3f(0, 0, 1));
        return mfDistrib.PDF(wo, wm) / (4 * AbsDot(wo, wm));
    }

    static constexpr const char *Name() { return "ConductorBxDF"; }

    std::string ToString() const;

    void Regularize() { mfDistrib.Regularize(); }

  private:
    // ConductorBxDF Private Members
    TrowbridgeReitzDistribution mfDistrib;
    RGB eta, k;
};

// DisneyBxDF Definition
// Burley's principled BSDF: a diffuse base with retro-reflection, sheen and an
// optional subsurface flattening term, an anisotropic Trowbridge-Reitz specular
// lobe whose tint moves from dielectric to conductor with _metallic_, and a GTR1
// clearcoat layer that attenuates everything below it. Reflection is two-sided.
// _specTrans_ moves the dielectric part from the diffuse base to a rough
// refraction lobe with relative index _eta_ (inside over outside, the side the
// normal points away from). Roughness is squared before use as the microfacet
// alpha.
class DisneyBxDF {
  public:
    // DisneyBxDF Public Methods
    DisneyBxDF() = default;
    DisneyBxDF(RGB baseColor, Float metallic, Float roughness, Float specular,
               Float specularTint, Float anisotropic, Float sheen, Float sheenTint,
               Float clearcoat, Float clearcoatGloss, Float subsurface,
               Float specTrans = 0, Float eta = 1.5f);

    BxDFFlags Flags() const {
        BxDFFlags flags = BxDFFlags::GlossyReflection;
        if (pDiffuse > 0)
            flags |= BxDFFlags::DiffuseReflection;
        if (pTransmission > 0)
            flags |= BxDFFlags::GlossyTransmission;
        return flags;
    }

    RGB f(Vector3f wo, Vector3f wi) const;

    std::optional<BSDFSample> Sample_f(Vector3f wo, Float uc, Point2f u) const;

    Float PDF(Vector3f wo, Vector3f wi) const;

    static constexpr const char *Name() { return "DisneyBxDF"; }

    std::string ToString() const;

    void Regularize() { mfDistrib.Regularize(); }

  private:
    // DisneyBxDF Private Methods
    Float ClearcoatFresnel(Float cosTheta) const {
        return 0.25f * clearcoat * FrSchlick(Float(0.04), cosTheta);
    }

    RGB fTransmission(Vector3f wo, Vector3f wi) const;
    Float PDFTransmission(Vector3f wo, Vector3f wi) const;

    // DisneyBxDF Private Members
    RGB baseColor, Cspec0, Csheen, Ctrans;
    Float metallic, roughness, sheen, clearcoat, subsurface, specTrans, eta;
    Float clearcoatAlpha;
    TrowbridgeReitzDistribution mfDistrib;
    Float pDiffuse, pSpecular, pClearcoat, pTransmission;
};

// GTR1 distribution for the clearcoat lobe
inline Float GTR1(Float cosTheta_h, Float alpha) {
    if (alpha >= 1)
        return InvPi;
    Float alpha2 = Sqr(alpha);
    Float t = 1 + (alpha2 - 1) * Sqr(cosTheta_h);
    return (alpha2 - 1) / (Pi * std::log(alpha2) * t);
}

// Separable Smith masking term for a GGX lobe of roughness _alpha_
inline Float SmithG1GGX(Float cosTheta, Float alpha) {
    Float alpha2 = Sqr(alpha), cos2Theta = Sqr(cosTheta);
    return 2 * cosTheta / (cosTheta + std::sqrt(alpha2 + cos2Theta - alpha2 * cos2Theta));
}

// BxDF Inline Method Definitions
inline RGB BxDF::f(Vector3f wo, Vector3f wi) const {
    auto f = [&](auto ptr) -> RGB { return ptr->f(wo, wi); };
    return Dispatch(f);
}

inline std::optional<BSDFSample> BxDF::Sample_f(Vector3f wo, Float uc, Point2f u) const {
    auto sample_f = [&](auto ptr) -> std::optional<BSDFSample> {
        return ptr->Sample_f(wo, uc, u);
    };
    return Dispatch(sample_f);
}

inline Float BxDF::PDF(Vector3f wo, Vector3f wi) const {
    auto pdf = [&](auto ptr) { return ptr->PDF(wo, wi); };
    return Dispatch(pdf);
}

inline BxDFFlags BxDF::Flags() const {
    auto flags = [&](auto ptr) { return ptr->Flags(); };
    return Dispatch(flags);
}

inline void BxDF::Regularize() {
    auto regularize = [&](auto ptr) { ptr->Regularize(); };
    return Dispatch(regularize);
}

}  // namespace lumen

#endif  // LUMEN_BXDFS_H
