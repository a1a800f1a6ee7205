// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/ray.h>

#include <lumen/util/print.h>

namespace lumen {

std::string Ray::ToString() const {
    return StringPrintf("[ o: %s d: %s ]", o, d);
}

}  // namespace lumen
