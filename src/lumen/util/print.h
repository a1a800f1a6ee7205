// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_UTIL_PRINT_H
#define LUMEN_UTIL_PRINT_H

#include <lumen/lumen.h>

#include <string>

// util/log.h and util/print.h include each other
namespace lumen {
template <typename... Args>
inline std::string StringPrintf(const char *fmt, Args &&...args);
}

#include <lumen/util/log.h>

#include <stdio.h>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <type_traits>
#include <typeinfo>
#include <vector>

namespace lumen {

// Anything with a ToString() method or a ToString() overload can be printed
template <typename T>
static auto operator<<(std::ostream &os, const T &v) -> decltype(v.ToString(), os) {
    return os << v.ToString();
}
template <typename T>
static auto operator<<(std::ostream &os, const T &v) -> decltype(ToString(v), os) {
    return os << ToString(v);
}

template <typename T>
inline std::ostream &operator<<(std::ostream &os, const std::unique_ptr<T> &p) {
    if (p)
        return os << p->ToString();
    return os << "(nullptr)";
}

template <typename T>
inline std::ostream &operator<<(std::ostream &os, const std::optional<T> &opt) {
    if (opt)
        return os << *opt;
    return os << "(unset)";
}

template <typename T>
inline std::ostream &operator<<(std::ostream &os, const std::vector<T> &v) {
    os << "[ ";
    for (size_t i = 0; i < v.size(); ++i)
        os << (i > 0 ? ", " : "") << v[i];
    return os << " ]";
}

namespace detail {

// Shortest strings that read back to the same value
std::string FloatToString(float v);
std::string DoubleToString(double v);

// Runs snprintf() for a single conversion and returns the result
std::string FormatDirective(const char *directive, ...);

// Moves the literal text before the next directive from _*fmt_ to _*s_,
// advances _*fmt_ past the directive, and returns the directive. The result
// is empty once the format string is exhausted.
std::string NextDirective(const char **fmt, std::string *s);

// Appends what remains of _fmt_; it must not contain directives
void FinishFormat(const char *fmt, std::string *s);

template <typename T>
inline void FormatValue(std::string *s, std::string directive, const T &v) {
    char conversion = directive.back();
    if constexpr (std::is_same_v<T, bool>) {
        if (conversion == 's') {
            *s += v ? "true" : "false";
            return;
        }
    }
    if constexpr (std::is_floating_point_v<T>) {
        // Plain %f and %s print the shortest exact form
        if (directive == "%f" || directive == "%s") {
            if constexpr (std::is_same_v<T, float>)
                *s += FloatToString(v);
            else
                *s += DoubleToString(v);
            return;
        }
    }
    if constexpr (std::is_integral_v<T>) {
        if (conversion == 'd' || conversion == 'u') {
            // Widen every integer type so one length modifier covers them all
            directive.pop_back();
            while (std::string("hljzt").find(directive.back()) != std::string::npos)
                directive.pop_back();
            if constexpr (std::is_signed_v<T>)
                *s += FormatDirective((directive + "lld").c_str(), (long long)v);
            else
                *s += FormatDirective((directive + "llu").c_str(), (unsigned long long)v);
            return;
        }
    }
    if (conversion == 's') {
        std::ostringstream ss;
        ss << v;
        *s += FormatDirective(directive.c_str(), ss.str().c_str());
        return;
    }
    if constexpr (std::is_arithmetic_v<T> || std::is_pointer_v<T>)
        *s += FormatDirective(directive.c_str(), v);
    else
        LOG_FATAL("Printf: %s cannot be printed with \"%s\"", typeid(v).name(), directive);
}

inline void StringPrintfRecursive(std::string *s, const char *fmt) {
    FinishFormat(fmt, s);
}

template <typename T, typename... Args>
inline void StringPrintfRecursive(std::string *s, const char *fmt, T &&v,
                                  Args &&...args) {
    std::string directive = NextDirective(&fmt, s);
    if (directive.empty())
        LOG_FATAL("Printf: more values than directives in format string");
    FormatValue(s, directive, v);
    StringPrintfRecursive(s, fmt, std::forward<Args>(args)...);
}

}  // namespace detail

// Printing Function Definitions
// Printf-style formatting where %s accepts anything printable with operator<<
// and plain %f prints the shortest representation of the value.
template <typename... Args>
inline std::string StringPrintf(const char *fmt, Args &&...args) {
    std::string ret;
    detail::StringPrintfRecursive(&ret, fmt, std::forward<Args>(args)...);
    return ret;
}

template <typename... Args>
void Printf(const char *fmt, Args &&...args) {
    std::string s = StringPrintf(fmt, std::forward<Args>(args)...);
    fputs(s.c_str(), stdout);
}

// Bold red, for terminals that understand ANSI escapes
inline std::string Red(const std::string &s) {
    return "\033[1m\033[31m" + s + "\033[0m";
}

}  // namespace lumen

#endif  // LUMEN_UTIL_PRINT_H
