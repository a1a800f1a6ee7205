// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/options.h>

#include <lumen/util/print.h>

namespace lumen {

LumenOptions *Options;

std::string LumenOptions::ToString() const {
    return StringPrintf(
        "[ LumenOptions seed: %s quiet: %s disablePixelJitter: %s forceDiffuse: %s "
        "nThreads: %s logLevel: %s logFile: %s writePartialImages: %s "
        "pixelSamples: %s maxDepth: %s imageFile: %s pixelBounds: %s ]",
        seed, quiet, disablePixelJitter, forceDiffuse, nThreads, logLevel, logFile,
        writePartialImages, pixelSamples, maxDepth, imageFile, pixelBounds);
}

}  // namespace lumen
