// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_UTIL_FILE_H
#define LUMEN_UTIL_FILE_H

#include <lumen/lumen.h>

#include <string>

namespace lumen {

// File and Filename Function Declarations
bool HasExtension(std::string filename, std::string ext);

}  // namespace lumen

#endif  // LUMEN_UTIL_FILE_H
