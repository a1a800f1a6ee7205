// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/util/rng.h>

#include <lumen/util/print.h>


namespace lumen {

std::string RNG::ToString() const {
    return StringPrintf("[ RNG state: %d inc: %d ]", state, inc);
}

}  // namespace lumen
