// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_BASE_BXDF_H
#define LUMEN_BASE_BXDF_H

#include <lumen/lumen.h>

#include <lumen/util/color.h>
#include <lumen/util/taggedptr.h>
#include <lumen/util/vecmath.h>

#include <optional>
#include <string>
#include <vector>

namespace lumen {

// BxDFFlags Definition
enum BxDFFlags {
    Unset = 0,
    Reflection = 1 << 0,
    Transmission = 1 << 1,
    Diffuse = 1 << 2,
    Glossy = 1 << 3,
    Specular = 1 << 4,
    // Composite _BxDFFlags_ definitions
    DiffuseReflection = Diffuse | Reflection,
    GlossyReflection = Glossy | Reflection,
    SpecularReflection = Specular | Reflection,
    GlossyTransmission = Glossy | Transmission,
    All = Diffuse | Glossy | Specular | Reflection | Transmission
};

inline BxDFFlags operator|(BxDFFlags a, BxDFFlags b) {
    return BxDFFlags((int)a | (int)b);
}

inline int operator&(BxDFFlags a, BxDFFlags b) {
    return ((int)a & (int)b);
}

inline BxDFFlags &operator|=(BxDFFlags &a, BxDFFlags b) {
    (int &)a |= int(b);
    return a;
}

// BxDFFlags Inline Functions
inline bool IsReflective(BxDFFlags f) {
    return f & BxDFFlags::Reflection;
}
inline bool IsTransmissive(BxDFFlags f) {
    return f & BxDFFlags::Transmission;
}
inline bool IsDiffuse(BxDFFlags f) {
    return f & BxDFFlags::Diffuse;
}
inline bool IsGlossy(BxDFFlags f) {
    return f & BxDFFlags::Glossy;
}
inline bool IsSpecular(BxDFFlags f) {
    return f & BxDFFlags::Specular;
}
inline bool IsNonSpecular(BxDFFlags f) {
    return f & (BxDFFlags::Diffuse | BxDFFlags::Glossy);
}

std::string ToString(BxDFFlags flags);

// BSDFSample Definition
struct BSDFSample {
    // BSDFSample Public Methods
    BSDFSample() = default;
    BSDFSample(RGB f, Vector3f wi, Float pdf, BxDFFlags flags)
        : f(f), wi(wi), pdf(pdf), flags(flags) {}

    bool IsReflection() const { return lumen::IsReflective(flags); }
    bool IsTransmission() const { return lumen::IsTransmissive(flags); }
    bool IsDiffuse() const { return lumen::IsDiffuse(flags); }
    bool IsGlossy() const { return lumen::IsGlossy(flags); }
    bool IsSpecular() const { return lumen::IsSpecular(flags); }

    std::string ToString() const;
    RGB f;
    Vector3f wi;
    Float pdf = 0;
    BxDFFlags flags = BxDFFlags::Unset;
};

class DiffuseBxDF;
class ConductorBxDF;
class DisneyBxDF;

// BxDF Definition
// Scattering in the local shading frame, where the normal is +z. f() does not
// include the cosine factor; callers apply |cos(theta_i)|.
class BxDF : public TaggedPointer<DiffuseBxDF, ConductorBxDF, DisneyBxDF> {
  public:
    // BxDF Interface
    using TaggedPointer::TaggedPointer;

    std::string ToString() const;

    BxDFFlags Flags() const;

    RGB f(Vector3f wo, Vector3f wi) const;

    std::optional<BSDFSample> Sample_f(Vector3f wo, Float uc, Point2f u) const;

    Float PDF(Vector3f wo, Vector3f wi) const;

    // Monte Carlo estimate of the hemispherical-directional reflectance
    RGB rho(Vector3f wo, const std::vector<Float> &uc,
            const std::vector<Point2f> &u2) const;

    void Regularize();
};

}  // namespace lumen

#endif  // LUMEN_BASE_BXDF_H
