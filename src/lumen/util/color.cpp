// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/util/color.h>

#include <lumen/util/print.h>

namespace lumen {

std::string RGB::ToString() const {
    return StringPrintf("[ %f %f %f ]", r, g, b);
}

}  // namespace lumen
