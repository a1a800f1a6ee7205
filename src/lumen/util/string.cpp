// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/util/string.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>

namespace lumen {

// Runs a strto*() conversion and accepts the result only if it consumed the
// whole string without overflowing
template <typename T, typename F>
static bool ParseNumber(std::string_view str, T *ptr, F convert) {
    std::string s(str);
    if (s.empty() || std::isspace((unsigned char)s[0]))
        return false;
    char *end = nullptr;
    errno = 0;
    auto value = convert(s.c_str(), &end);
    if (errno == ERANGE || end != s.c_str() + s.size())
        return false;
    *ptr = T(value);
    return true;
}

bool Atoi(std::string_view str, int *ptr) {
    long v;
    if (!ParseNumber(str, &v, [](const char *s, char **end) { return strtol(s, end, 10); }))
        return false;
    if (v < std::numeric_limits<int>::lowest() || v > std::numeric_limits<int>::max())
        return false;
    *ptr = int(v);
    return true;
}

bool Atof(std::string_view str, float *ptr) {
    return ParseNumber(str, ptr, [](const char *s, char **end) { return strtof(s, end); });
}

bool Atof(std::string_view str, double *ptr) {
    return ParseNumber(str, ptr, [](const char *s, char **end) { return strtod(s, end); });
}

std::vector<std::string> SplitStringsFromWhitespace(std::string_view str) {
    std::vector<std::string> ret;
    size_t pos = 0;
    while (pos < str.size()) {
        if (std::isspace((unsigned char)str[pos])) {
            ++pos;
            continue;
        }
        size_t end = pos;
        while (end < str.size() && !std::isspace((unsigned char)str[end]))
            ++end;
        ret.emplace_back(str.substr(pos, end - pos));
        pos = end;
    }
    return ret;
}

std::vector<std::string> SplitString(std::string_view str, char ch) {
    std::vector<std::string> pieces;
    if (str.empty())
        return pieces;
    // n separators always give n + 1 pieces, empty ones included
    for (size_t start = 0;;) {
        size_t end = str.find(ch, start);
        size_t length = (end == std::string_view::npos) ? end : end - start;
        pieces.emplace_back(str.substr(start, length));
        if (end == std::string_view::npos)
            return pieces;
        start = end + 1;
    }
}

template <typename T>
static std::vector<T> SplitStringToNumbers(std::string_view str, char ch,
                                           bool (*parse)(std::string_view, T *)) {
    std::vector<std::string> pieces = SplitString(str, ch);
    std::vector<T> values(pieces.size());
    for (size_t i = 0; i < pieces.size(); ++i)
        if (!parse(pieces[i], &values[i]))
            return {};
    return values;
}

std::vector<int> SplitStringToInts(std::string_view str, char ch) {
    return SplitStringToNumbers<int>(str, ch, Atoi);
}

std::vector<Float> SplitStringToFloats(std::string_view str, char ch) {
    return SplitStringToNumbers<Float>(str, ch, Atof);
}

}  // namespace lumen
