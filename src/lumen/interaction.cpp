// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/interaction.h>

#include <lumen/bsdf.h>
#include <lumen/bxdfs.h>
#include <lumen/lights.h>
#include <lumen/materials.h>
#include <lumen/options.h>
#include <lumen/samplers.h>
#include <lumen/util/memory.h>
#include <lumen/util/print.h>

namespace lumen {

std::string Interaction::ToString() const {
    return StringPrintf("[ Interaction p: %s pError: %s n: %s uv: %s wo: %s ]", p, pError,
                        n, uv, wo);
}

MaterialEvalContext::MaterialEvalContext(const SurfaceInteraction &si)
    : p(si.p), n(si.n), ns(si.shading.n), dpdus(si.shading.dpdu), wo(si.wo), uv(si.uv) {}

std::string MaterialEvalContext::ToString() const {
    return StringPrintf("[ MaterialEvalContext p: %s n: %s ns: %s dpdus: %s wo: %s uv: %s ]",
                        p, n, ns, dpdus, wo, uv);
}

BSDF SurfaceInteraction::GetBSDF(ScratchBuffer &scratchBuffer, Sampler sampler) const {
    if (!material)
        return {};

    BSDF bsdf = material.GetBSDF(MaterialEvalContext(*this), scratchBuffer);
    if (bsdf && GetOptions().forceDiffuse) {
        // Replace the BSDF with a Lambertian one of the same albedo
        RGB r = bsdf.rho(wo, {sampler.Get1D()}, {sampler.Get2D()});
        bsdf = BSDF(n, shading.n, shading.dpdu, scratchBuffer.Alloc<DiffuseBxDF>(r));
    }
    return bsdf;
}

RGB SurfaceInteraction::Le(Vector3f w) const {
    return areaLight ? areaLight.L(p, n, uv, w) : RGB(0.f);
}

std::string SurfaceInteraction::ToString() const {
    return StringPrintf("[ SurfaceInteraction p: %s pError: %s n: %s uv: %s wo: %s "
                        "dpdu: %s dpdv: %s shading.n: %s shading.dpdu: %s "
                        "shading.dpdv: %s material: %s areaLight: %s ]",
                        p, pError, n, uv, wo, dpdu, dpdv, shading.n, shading.dpdu,
                        shading.dpdv, material ? material.ToString().c_str() : "(nullptr)",
                        areaLight ? areaLight.ToString().c_str() : "(nullptr)");
}

}  // namespace lumen
