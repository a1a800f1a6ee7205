// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_UTIL_SCATTERING_H
#define LUMEN_UTIL_SCATTERING_H

#include <lumen/lumen.h>

#include <lumen/util/color.h>
#include <lumen/util/math.h>
#include <lumen/util/sampling.h>
#include <lumen/util/vecmath.h>

#include <algorithm>
#include <cmath>
#include <complex>
#include <string>

namespace lumen {

// Scattering Inline Functions
inline Vector3f Reflect(Vector3f wo, Vector3f n) {
    return -wo + 2 * Dot(wo, n) * n;
}

// Refracts _wi_ through the interface with normal _n_, where _eta_ is the index
// of refraction on the side _n_ points away from relative to the side it points
// toward. Returns false on total internal reflection.
inline bool Refract(Vector3f wi, Normal3f n, Float eta, Float *etap, Vector3f *wt) {
    Float cosTheta_i = Dot(n, wi);
    // Potentially flip interface orientation for Snell's law
    if (cosTheta_i < 0) {
        eta = 1 / eta;
        cosTheta_i = -cosTheta_i;
        n = -n;
    }

    Float sin2Theta_t = std::max<Float>(0, 1 - Sqr(cosTheta_i)) / Sqr(eta);
    if (sin2Theta_t >= 1)
        return false;
    Float cosTheta_t = std::sqrt(1 - sin2Theta_t);

    *wt = -wi / eta + (cosTheta_i / eta - cosTheta_t) * Vector3f(n);
    if (etap)
        *etap = eta;
    return true;
}

// Fresnel Inline Functions
inline Float FrDielectric(Float cosTheta_i, Float eta) {
    cosTheta_i = Clamp(cosTheta_i, -1, 1);
    // Light arriving from inside sees the inverted interface
    if (cosTheta_i < 0) {
        eta = 1 / eta;
        cosTheta_i = -cosTheta_i;
    }

    Float sin2Theta_t = (1 - Sqr(cosTheta_i)) / Sqr(eta);
    if (sin2Theta_t >= 1)
        return 1.f;
    Float cosTheta_t = SafeSqrt(1 - sin2Theta_t);

    Float r_parl = (eta * cosTheta_i - cosTheta_t) / (eta * cosTheta_i + cosTheta_t);
    Float r_perp = (cosTheta_i - eta * cosTheta_t) / (cosTheta_i + eta * cosTheta_t);
    return (Sqr(r_parl) + Sqr(r_perp)) / 2;
}

inline Float SchlickWeight(Float cosTheta) {
    Float m = Clamp(1 - cosTheta, 0, 1);
    return (m * m) * (m * m) * m;
}

inline RGB FrSchlick(const RGB &R0, Float cosTheta) {
    return Lerp(SchlickWeight(cosTheta), R0, RGB(1.f));
}

inline Float FrSchlick(Float R0, Float cosTheta) {
    return Lerp(SchlickWeight(cosTheta), R0, Float(1));
}

inline Float FrComplex(Float cosTheta_i, std::complex<Float> eta) {
    using Complex = std::complex<Float>;
    cosTheta_i = Clamp(cosTheta_i, 0, 1);
    // Compute complex $\cos\,\theta_\roman{t}$ for Fresnel equations using Snell's law
    Float sin2Theta_i = 1 - Sqr(cosTheta_i);
    Complex sin2Theta_t = sin2Theta_i / (eta * eta);
    Complex cosTheta_t = std::sqrt(Float(1) - sin2Theta_t);

    Complex r_parl = (eta * cosTheta_i - cosTheta_t) / (eta * cosTheta_i + cosTheta_t);
    Complex r_perp = (cosTheta_i - eta * cosTheta_t) / (cosTheta_i + eta * cosTheta_t);
    return (std::norm(r_parl) + std::norm(r_perp)) / 2;
}

inline RGB FrComplex(Float cosTheta_i, const RGB &eta, const RGB &k) {
    RGB result;
    for (int c = 0; c < 3; ++c)
        result[c] = FrComplex(cosTheta_i, std::complex<Float>(eta[c], k[c]));
    return result;
}

// TrowbridgeReitzDistribution Definition
class TrowbridgeReitzDistribution {
  public:
    // TrowbridgeReitzDistribution Public Methods
    TrowbridgeReitzDistribution() = default;
    TrowbridgeReitzDistribution(Float ax, Float ay) : alpha_x(ax), alpha_y(ay) {
        if (!EffectivelySmooth()) {
            // If one direction has some roughness, then the other can't
            // have zero (or very low) roughness; the computation of |e| in
            // D() blows up in that case.
            alpha_x = std::max<Float>(alpha_x, 1e-4f);
            alpha_y = std::max<Float>(alpha_y, 1e-4f);
        }
    }

    inline Float D(Vector3f wm) const {
        Float tan2Theta = Tan2Theta(wm);
        if (IsInf(tan2Theta))
            return 0;
        Float cos4Theta = Sqr(Cos2Theta(wm));
        if (cos4Theta < 1e-16f)
            return 0;
        Float e = tan2Theta * (Sqr(CosPhi(wm) / alpha_x) + Sqr(SinPhi(wm) / alpha_y));
        return 1 / (Pi * alpha_x * alpha_y * cos4Theta * Sqr(1 + e));
    }

    bool EffectivelySmooth() const { return std::max(alpha_x, alpha_y) < 1e-3f; }

    Float G1(Vector3f w) const { return 1 / (1 + Lambda(w)); }

    Float Lambda(Vector3f w) const {
        Float tan2Theta = Tan2Theta(w);
        if (IsInf(tan2Theta))
            return 0;
        Float alpha2 = Sqr(CosPhi(w) * alpha_x) + Sqr(SinPhi(w) * alpha_y);
        return (std::sqrt(1 + alpha2 * tan2Theta) - 1) / 2;
    }

    // Height-correlated masking-shadowing
    Float G(Vector3f wo, Vector3f wi) const { return 1 / (1 + Lambda(wo) + Lambda(wi)); }

    // Distribution of normals visible from _w_
    Float D(Vector3f w, Vector3f wm) const {
        return G1(w) / AbsCosTheta(w) * D(wm) * AbsDot(w, wm);
    }

    Float PDF(Vector3f w, Vector3f wm) const { return D(w, wm); }

    Vector3f Sample_wm(Vector3f w, Point2f u) const {
        // Transform _w_ to hemispherical configuration
        Vector3f wh = Normalize(Vector3f(alpha_x * w.x, alpha_y * w.y, w.z));
        if (wh.z < 0)
            wh = -wh;

        // Find orthonormal basis for visible normal sampling
        Vector3f T1 = (wh.z < 0.99999f) ? Normalize(Cross(Vector3f(0, 0, 1), wh))
                                        : Vector3f(1, 0, 0);
        Vector3f T2 = Cross(wh, T1);

        // Generate uniformly distributed points on the unit disk
        Point2f p = SampleUniformDiskPolar(u);

        // Warp hemispherical projection for visible normal sampling
        Float h = std::sqrt(1 - Sqr(p.x));
        p.y = Lerp((1 + wh.z) / 2, h, p.y);

        // Reproject to hemisphere and transform normal to ellipsoid configuration
        Float pz = std::sqrt(std::max<Float>(0, 1 - LengthSquared(Vector2f(p))));
        Vector3f nh = p.x * T1 + p.y * T2 + pz * wh;
        return Normalize(
            Vector3f(alpha_x * nh.x, alpha_y * nh.y, std::max<Float>(1e-6f, nh.z)));
    }

    std::string ToString() const;

    static Float RoughnessToAlpha(Float roughness) { return std::sqrt(roughness); }

    void Regularize() {
        if (alpha_x < 0.3f)
            alpha_x = Clamp(2 * alpha_x, 0.1f, 0.3f);
        if (alpha_y < 0.3f)
            alpha_y = Clamp(2 * alpha_y, 0.1f, 0.3f);
    }

  private:
    // TrowbridgeReitzDistribution Private Members
    Float alpha_x = 0, alpha_y = 0;
};

}  // namespace lumen

#endif  // LUMEN_UTIL_SCATTERING_H
