// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/bxdfs.h>

#include <lumen/util/check.h>
#include <lumen/util/print.h>
#include <lumen/util/scattering.h>

#include <cmath>

namespace lumen {

std::string ToString(BxDFFlags flags) {
    if (flags == BxDFFlags::Unset)
        return "Unset";
    std::string s;
    if (flags & BxDFFlags::Reflection)
        s += "Reflection,";
    if (flags & BxDFFlags::Transmission)
        s += "Transmission,";
    if (flags & BxDFFlags::Diffuse)
        s += "Diffuse,";
    if (flags & BxDFFlags::Glossy)
        s += "Glossy,";
    if (flags & BxDFFlags::Specular)
        s += "Specular,";
    return s;
}

// BxDF Method Definitions
std::string DiffuseBxDF::ToString() const {
    return StringPrintf("[ DiffuseBxDF R: %s ]", R);
}

std::string ConductorBxDF::ToString() const {
    return StringPrintf("[ ConductorBxDF mfDistrib: %s eta: %s k: %s ]", mfDistrib, eta,
                        k);
}

// DisneyBxDF Method Definitions
DisneyBxDF::DisneyBxDF(RGB baseColor, Float metallic, Float roughness, Float specular,
                       Float specularTint, Float anisotropic, Float sheen, Float sheenTint,
                       Float clearcoat, Float clearcoatGloss, Float subsurface,
                       Float specTrans, Float eta)
    : baseColor(baseColor),
      metallic(Clamp(metallic, 0, 1)),
      roughness(Clamp(roughness, 0, 1)),
      sheen(sheen),
      clearcoat(Clamp(clearcoat, 0, 1)),
      subsurface(Clamp(subsurface, 0, 1)),
      specTrans(Clamp(specTrans, 0, 1)),
      eta(eta) {
    // An index-matched interface would refract without bending
    if (eta == 1)
        this->specTrans = 0;

    // Compute tint colors from the hue and saturation of _baseColor_
    Float lum = baseColor.Luminance();
    RGB Ctint = lum > 0 ? baseColor / lum : RGB(1.f);
    Cspec0 = Lerp(this->metallic, specular * 0.08f * Lerp(specularTint, RGB(1.f), Ctint),
                  baseColor);
    Csheen = Lerp(sheenTint, RGB(1.f), Ctint);

    // Remap roughness and anisotropy to Trowbridge-Reitz $\alpha$ values
    Float alpha = Sqr(this->roughness);
    Float aspect = SafeSqrt(1 - 0.9f * Clamp(anisotropic, 0, 1));
    mfDistrib = TrowbridgeReitzDistribution(std::max<Float>(1e-3f, alpha / aspect),
                                            std::max<Float>(1e-3f, alpha * aspect));
    clearcoatAlpha = Lerp(Clamp(clearcoatGloss, 0, 1), 0.1f, 0.001f);

    // Transmitted light keeps the base color after entering and leaving
    Float wTransmission = (1 - this->metallic) * this->specTrans;
    Ctrans = wTransmission * Sqrt(baseColor);

    // Compute lobe selection probabilities
    Float wDiffuse = (1 - this->metallic) * (1 - this->specTrans), wSpecular = 1;
    Float wClearcoat = 0.25f * this->clearcoat;
    Float wSum = wDiffuse + wSpecular + wClearcoat + wTransmission;
    pDiffuse = wDiffuse / wSum;
    pSpecular = wSpecular / wSum;
    pClearcoat = wClearcoat / wSum;
    pTransmission = wTransmission / wSum;
}

RGB DisneyBxDF::f(Vector3f wo, Vector3f wi) const {
    if (!SameHemisphere(wo, wi))
        return fTransmission(wo, wi);
    if (wo.z < 0) {
        wo = -wo;
        wi = -wi;
    }
    Float cosTheta_o = CosTheta(wo), cosTheta_i = CosTheta(wi);
    if (cosTheta_o == 0 || cosTheta_i == 0)
        return {};
    Vector3f wh = wi + wo;
    if (LengthSquared(wh) == 0)
        return {};
    wh = Normalize(wh);
    Float cosTheta_d = Dot(wi, wh);
    Float Fo = SchlickWeight(cosTheta_o), Fi = SchlickWeight(cosTheta_i);
    Float Fh = SchlickWeight(cosTheta_d);

    // Evaluate diffuse, retro-reflection and subsurface flattening
    RGB fBase(0.f);
    Float diffuseWeight = (1 - metallic) * (1 - specTrans);
    if (diffuseWeight > 0) {
        // Burley diffuse, renormalized so that its albedo does not exceed one
        Float energyBias = Lerp(roughness, 0, 0.5f);
        Float energyFactor = Lerp(roughness, 1, 1 / 1.51f);
        Float Fd90 = energyBias + 2 * Sqr(cosTheta_d) * roughness;
        Float Fd = Lerp(Fo, 1, Fd90) * Lerp(Fi, 1, Fd90) * energyFactor;

        if (subsurface > 0) {
            // Hanrahan-Krueger inspired flattening
            Float Fss90 = Sqr(cosTheta_d) * roughness;
            Float Fss = Lerp(Fo, 1, Fss90) * Lerp(Fi, 1, Fss90);
            Float ss = 1.25f * (Fss * (1 / (cosTheta_o + cosTheta_i) - 0.5f) + 0.5f);
            Fd = Lerp(subsurface, Fd, ss);
        }
        Fd *= (1 - 0.5f * Fo) * (1 - 0.5f * Fi);

        fBase = diffuseWeight * (InvPi * Fd * baseColor + Fh * sheen * Csheen);
    }

    // Add anisotropic specular reflection
    RGB Fs = FrSchlick(Cspec0, cosTheta_d);
    fBase += mfDistrib.D(wh) * mfDistrib.G(wo, wi) * Fs / (4 * cosTheta_i * cosTheta_o);

    if (clearcoat == 0)
        return fBase;
    // Attenuate by the clearcoat layer and add its reflection
    Float Dr = GTR1(CosTheta(wh), clearcoatAlpha);
    Float Gr = SmithG1GGX(cosTheta_o, 0.25f) * SmithG1GGX(cosTheta_i, 0.25f);
    Float fClearcoat = ClearcoatFresnel(cosTheta_d) * Dr * Gr / (4 * cosTheta_i * cosTheta_o);
    return fBase * (1 - ClearcoatFresnel(cosTheta_o)) * (1 - ClearcoatFresnel(cosTheta_i)) +
           RGB(fClearcoat);
}

RGB DisneyBxDF::fTransmission(Vector3f wo, Vector3f wi) const {
    if (pTransmission == 0)
        return {};
    // Compute generalized half vector _wm_ for refraction
    Float cosTheta_o = CosTheta(wo), cosTheta_i = CosTheta(wi);
    Float etap = cosTheta_o > 0 ? eta : (1 / eta);
    Vector3f wm = wi * etap + wo;
    if (cosTheta_i == 0 || cosTheta_o == 0 || LengthSquared(wm) == 0)
        return {};
    wm = FaceForward(Normalize(wm), Vector3f(0, 0, 1));
    // Discard backfacing microfacets
    if (Dot(wm, wi) * cosTheta_i < 0 || Dot(wm, wo) * cosTheta_o < 0)
        return {};

    Float F = FrDielectric(Dot(wo, wm), eta);
    Float denom = Sqr(Dot(wi, wm) + Dot(wo, wm) / etap) * cosTheta_i * cosTheta_o;
    Float ft = mfDistrib.D(wm) * (1 - F) * mfDistrib.G(wo, wi) *
               std::abs(Dot(wi, wm) * Dot(wo, wm) / denom);
    // Radiance is compressed into the smaller solid angle of the denser side
    ft /= Sqr(etap);

    // The clearcoat sits on the outside of the interface
    Float cosTheta_out = cosTheta_o > 0 ? cosTheta_o : cosTheta_i;
    return Ctrans * ft * (1 - ClearcoatFresnel(std::abs(cosTheta_out)));
}

Float DisneyBxDF::PDFTransmission(Vector3f wo, Vector3f wi) const {
    if (pTransmission == 0)
        return 0;
    Float cosTheta_o = CosTheta(wo), cosTheta_i = CosTheta(wi);
    Float etap = cosTheta_o > 0 ? eta : (1 / eta);
    Vector3f wm = wi * etap + wo;
    if (cosTheta_i == 0 || cosTheta_o == 0 || LengthSquared(wm) == 0)
        return 0;
    wm = FaceForward(Normalize(wm), Vector3f(0, 0, 1));
    if (Dot(wm, wi) * cosTheta_i < 0 || Dot(wm, wo) * cosTheta_o < 0)
        return 0;

    // Change of variables from the microfacet normal to the refracted direction
    Float dwm_dwi = AbsDot(wi, wm) / Sqr(Dot(wi, wm) + Dot(wo, wm) / etap);
    return pTransmission * mfDistrib.PDF(wo, wm) * dwm_dwi;
}

Float DisneyBxDF::PDF(Vector3f wo, Vector3f wi) const {
    if (!SameHemisphere(wo, wi))
        return PDFTransmission(wo, wi);
    if (wo.z < 0) {
        wo = -wo;
        wi = -wi;
    }
    Vector3f wh = wi + wo;
    if (LengthSquared(wh) == 0)
        return 0;
    wh = Normalize(wh);
    Float cosTheta_oh = Dot(wo, wh);
    if (cosTheta_oh <= 0)
        return 0;

    // Compute mixture density over the three lobes
    Float pdf = pDiffuse * CosineHemispherePDF(AbsCosTheta(wi)) +
                pSpecular * mfDistrib.PDF(wo, wh) / (4 * cosTheta_oh);
    if (pClearcoat > 0)
        pdf += pClearcoat * GTR1(CosTheta(wh), clearcoatAlpha) * CosTheta(wh) /
               (4 * cosTheta_oh);
    return pdf;
}

std::optional<BSDFSample> DisneyBxDF::Sample_f(Vector3f wo, Float uc, Point2f u) const {
    if (wo.z == 0)
        return {};
    if (uc >= pDiffuse + pSpecular + pClearcoat && pTransmission > 0) {
        // Refract through a sampled visible microfacet normal
        Vector3f wm = mfDistrib.Sample_wm(wo, u);
        Vector3f wi;
        Float etap;
        if (!Refract(wo, Normal3f(wm), eta, &etap, &wi) || SameHemisphere(wo, wi) ||
            wi.z == 0)
            return {};
        Float pdf = PDF(wo, wi);
        if (pdf == 0)
            return {};
        return BSDFSample(f(wo, wi), wi, pdf, BxDFFlags::GlossyTransmission);
    }

    bool flip = wo.z < 0;
    Vector3f w = flip ? -wo : wo;

    // Choose a lobe with _uc_ and sample an incident direction from it
    Vector3f wi;
    BxDFFlags flags;
    if (uc < pDiffuse) {
        wi = SampleCosineHemisphere(u);
        flags = BxDFFlags::DiffuseReflection;
    } else if (uc < pDiffuse + pSpecular) {
        Vector3f wm = mfDistrib.Sample_wm(w, u);
        wi = Reflect(w, wm);
        flags = BxDFFlags::GlossyReflection;
    } else {
        // Sample the GTR1 clearcoat distribution of half vectors
        Float alpha2 = Sqr(clearcoatAlpha);
        Float cosTheta = SafeSqrt((1 - std::pow(alpha2, 1 - u[0])) / (1 - alpha2));
        Float sinTheta = SafeSqrt(1 - Sqr(cosTheta));
        Vector3f wm = SphericalDirection(sinTheta, cosTheta, 2 * Pi * u[1]);
        wi = Reflect(w, wm);
        flags = BxDFFlags::GlossyReflection;
    }
    if (wi.z <= 0)
        return {};
    if (flip)
        wi = -wi;

    Float pdf = PDF(wo, wi);
    if (pdf == 0)
        return {};
    return BSDFSample(f(wo, wi), wi, pdf, flags);
}

std::string DisneyBxDF::ToString() const {
    return StringPrintf("[ DisneyBxDF baseColor: %s Cspec0: %s Csheen: %s metallic: %f "
                        "roughness: %f sheen: %f clearcoat: %f subsurface: %f "
                        "specTrans: %f eta: %f Ctrans: %s clearcoatAlpha: %f mfDistrib: %s "
                        "pDiffuse: %f pSpecular: %f pClearcoat: %f pTransmission: %f ]",
                        baseColor, Cspec0, Csheen, metallic, roughness, sheen, clearcoat,
                        subsurface, specTrans, eta, Ctrans, clearcoatAlpha, mfDistrib,
                        pDiffuse, pSpecular, pClearcoat, pTransmission);
}

// BxDF Method Definitions
RGB BxDF::rho(Vector3f wo, const std::vector<Float> &uc,
              const std::vector<Point2f> &u2) const {
    if (wo.z == 0)
        return {};
    RGB r(0.f);
    DCHECK_EQ(uc.size(), u2.size());
    for (size_t i = 0; i < uc.size(); ++i) {
        // Compute estimate of $\rho_\roman{hd}$
        std::optional<BSDFSample> bs = Sample_f(wo, uc[i], u2[i]);
        if (bs && bs->pdf > 0)
            r += bs->f * AbsCosTheta(bs->wi) / bs->pdf;
    }
    return r / uc.size();
}

std::string BxDF::ToString() const {
    auto toStr = [](auto ptr) { return ptr->ToString(); };
    return Dispatch(toStr);
}

}  // namespace lumen
