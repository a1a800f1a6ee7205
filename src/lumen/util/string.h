// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_UTIL_STRING_H
#define LUMEN_UTIL_STRING_H

#include <lumen/lumen.h>

#include <string>
#include <string_view>
#include <vector>

namespace lumen {

bool Atoi(std::string_view str, int *);
bool Atof(std::string_view str, float *);
bool Atof(std::string_view str, double *);

std::vector<std::string> SplitStringsFromWhitespace(std::string_view str);
std::vector<std::string> SplitString(std::string_view str, char ch);

// These return an empty vector if any of the pieces fails to convert
std::vector<int> SplitStringToInts(std::string_view str, char ch);
std::vector<Float> SplitStringToFloats(std::string_view str, char ch);

}  // namespace lumen

#endif  // LUMEN_UTIL_STRING_H
