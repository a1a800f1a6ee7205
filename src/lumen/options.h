// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_OPTIONS_H
#define LUMEN_OPTIONS_H

#include <lumen/lumen.h>
#include <lumen/util/log.h>
#include <lumen/util/vecmath.h>

#include <optional>
#include <string>

namespace lumen {

// BasicLumenOptions Definition
struct BasicLumenOptions {
    int seed = 0;
    bool quiet = false;
    bool disablePixelJitter = false;
    bool forceDiffuse = false;
};

// LumenOptions Definition
struct LumenOptions : BasicLumenOptions {
    int nThreads = 0;
    LogLevel logLevel = LogLevel::Error;
    std::string logFile;
    bool writePartialImages = false;
    std::optional<int> pixelSamples;
    std::optional<int> maxDepth;
    std::string imageFile;
    std::optional<Bounds2i> pixelBounds;

    std::string ToString() const;
};

// Options Global Variable Declaration
extern LumenOptions *Options;

// Options Inline Functions
inline const BasicLumenOptions &GetOptions() {
    return *Options;
}

}  // namespace lumen

#endif  // LUMEN_OPTIONS_H
