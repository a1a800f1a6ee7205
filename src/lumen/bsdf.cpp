// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/bsdf.h>

#include <lumen/util/print.h>

namespace lumen {

std::string BSDFSample::ToString() const {
    return StringPrintf("[ BSDFSample f: %s wi: %s pdf: %s flags: %s ]", f, wi, pdf,
                        flags);
}

// BSDF Method Definitions
std::string BSDF::ToString() const {
    return StringPrintf("[ BSDF bxdf: %s shadingFrame: %s ng: %s ]", bxdf, shadingFrame,
                        ng);
}

}  // namespace lumen
