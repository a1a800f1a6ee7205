// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_BSDF_H
#define LUMEN_BSDF_H

#include <lumen/lumen.h>

#include <lumen/base/bxdf.h>
#include <lumen/bxdfs.h>
#include <lumen/util/color.h>
#include <lumen/util/vecmath.h>

#include <optional>
#include <string>
#include <vector>

namespace lumen {

// BSDF Definition
// Wraps a BxDF with the local shading frame of a surface point. Directions
// passed in and returned are in render space.
class BSDF {
  public:
    // BSDF Public Methods
    BSDF() = default;
    BSDF(Normal3f ng, Normal3f ns, Vector3f dpdus, BxDF bxdf)
        : bxdf(bxdf), ng(ng), shadingFrame(MakeShadingFrame(ns, dpdus)) {}

    operator bool() const { return (bool)bxdf; }
    BxDFFlags Flags() const { return bxdf.Flags(); }

    Vector3f RenderToLocal(Vector3f v) const { return shadingFrame.ToLocal(v); }
    Vector3f LocalToRender(Vector3f v) const { return shadingFrame.FromLocal(v); }

    RGB f(Vector3f woRender, Vector3f wiRender) const {
        Vector3f wi = RenderToLocal(wiRender), wo = RenderToLocal(woRender);
        if (wo.z == 0)
            return {};
        // Shading normals must not let light leak through a reflector
        if (!IsTransmissive(bxdf.Flags()) &&
            Dot(wiRender, ng) * Dot(woRender, ng) <= 0)
            return {};
        return bxdf.f(wo, wi);
    }

    std::optional<BSDFSample> Sample_f(Vector3f woRender, Float u, Point2f u2) const {
        Vector3f wo = RenderToLocal(woRender);
        if (wo.z == 0 || !bxdf.Flags())
            return {};
        // Sample BxDF and return _BSDFSample_
        std::optional<BSDFSample> bs = bxdf.Sample_f(wo, u, u2);
        if (bs)
            DCHECK_GE(bs->pdf, 0);
        if (!bs || !bs->f || bs->pdf == 0 || bs->wi.z == 0)
            return {};
        bs->wi = LocalToRender(bs->wi);
        if (!IsTransmissive(bxdf.Flags()) && Dot(bs->wi, ng) * Dot(woRender, ng) <= 0)
            return {};
        return bs;
    }

    Float PDF(Vector3f woRender, Vector3f wiRender) const {
        Vector3f wo = RenderToLocal(woRender), wi = RenderToLocal(wiRender);
        if (wo.z == 0)
            return 0;
        return bxdf.PDF(wo, wi);
    }

    RGB rho(Vector3f woRender, const std::vector<Float> &uc,
            const std::vector<Point2f> &u2) const {
        Vector3f wo = RenderToLocal(woRender);
        return bxdf.rho(wo, uc, u2);
    }

    std::string ToString() const;

    void Regularize() { bxdf.Regularize(); }

  private:
    // Shading tangents are not always exactly perpendicular to the shading
    // normal; re-orthogonalize before building the frame.
    static Frame MakeShadingFrame(Normal3f ns, Vector3f dpdus) {
        Vector3f z(Normalize(ns));
        Vector3f x = GramSchmidt(dpdus, z);
        if (LengthSquared(x) == 0) {
            Vector3f y;
            CoordinateSystem(z, &x, &y);
            return Frame(x, y, z);
        }
        return Frame::FromXZ(Normalize(x), z);
    }

    // BSDF Private Members
    BxDF bxdf;
    Normal3f ng;
    Frame shadingFrame;
};

}  // namespace lumen

#endif  // LUMEN_BSDF_H
