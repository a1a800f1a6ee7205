// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_UTIL_ARGS_H
#define LUMEN_UTIL_ARGS_H

#include <lumen/lumen.h>
#include <lumen/util/print.h>
#include <lumen/util/string.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace lumen {
namespace detail {

// Flag names compare equal ignoring case, '-' and '_', so --pixel-samples,
// --pixelsamples and --PixelSamples are all the same flag.
inline std::string NormalizeArgName(const std::string &str) {
    std::string ret;
    for (unsigned char c : str)
        if (c != '_' && c != '-')
            ret += char(std::tolower(c));
    return ret;
}

inline bool ParseArgValue(const std::string &str, int *ptr) {
    return Atoi(str, ptr);
}

inline bool ParseArgValue(const std::string &str, std::string *ptr) {
    if (str.empty())
        return false;
    *ptr = str;
    return true;
}

inline bool ParseArgValue(const std::string &str, bool *ptr) {
    std::string value = NormalizeArgName(str);
    if (value != "true" && value != "false")
        return false;
    *ptr = value == "true";
    return true;
}

// Comma-separated, with exactly _N_ values
template <size_t N>
bool ParseArgValue(const std::string &str, std::array<int, N> *out) {
    std::vector<int> v = SplitStringToInts(str, ',');
    if (v.size() != N)
        return false;
    std::copy(v.begin(), v.end(), out->begin());
    return true;
}

template <typename T>
bool ParseArgValue(const std::string &str, std::optional<T> *ptr) {
    T value;
    if (!ParseArgValue(str, &value))
        return false;
    *ptr = value;
    return true;
}

// Only bool flags may be given without a value
template <typename T>
bool SetWithoutValue(T *) {
    return false;
}

inline bool SetWithoutValue(bool *ptr) {
    *ptr = true;
    return true;
}

}  // namespace detail

// Tries to consume the argument at *iter as -name or --name; returns false if
// it is some other argument. Values may follow as --name=value or as the next
// argument. On success *iter is left at the last consumed entry; on a bad or
// missing value _onError_ is called and false is returned.
template <typename Iter, typename T>
bool ParseArg(Iter *iter, Iter end, const std::string &name, T *out,
              std::function<void(std::string)> onError) {
    const std::string &arg = **iter;
    size_t start = arg.find_first_not_of('-');
    if (start == 0 || start > 2 || start == std::string::npos)
        return false;
    size_t equals = arg.find('=', start);
    std::string argName =
        arg.substr(start, equals == std::string::npos ? equals : equals - start);
    if (detail::NormalizeArgName(argName) != detail::NormalizeArgName(name))
        return false;

    std::string value;
    if (equals != std::string::npos)
        value = arg.substr(equals + 1);
    else if (detail::SetWithoutValue(out))
        return true;
    else if (++*iter == end) {
        onError(StringPrintf("missing value after --%s argument", name));
        return false;
    } else
        value = **iter;

    if (!detail::ParseArgValue(value, out)) {
        onError(StringPrintf("invalid value \"%s\" for --%s argument", value, name));
        return false;
    }
    return true;
}

std::vector<std::string> GetCommandLineArguments(char *argv[]);

}  // namespace lumen

#endif  // LUMEN_UTIL_ARGS_H
