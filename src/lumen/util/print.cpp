// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/util/print.h>

#include <lumen/util/check.h>

#include <double-conversion/double-conversion.h>

#include <algorithm>
#include <cstdarg>
#include <cstring>

namespace lumen {

namespace detail {

// Shortest round-trip representation; switches to exponential notation
// outside of [1e-6, 1e9).
static const double_conversion::DoubleToStringConverter &Converter() {
    static const double_conversion::DoubleToStringConverter converter(
        double_conversion::DoubleToStringConverter::NO_FLAGS, "Inf", "NaN", 'e',
        -6 /* decimal_in_shortest_low */, 9 /* decimal_in_shortest_high */,
        5 /* max_leading_padding_zeroes_in_precision_mode */,
        5 /*  max_trailing_padding_zeroes_in_precision_mode */);
    return converter;
}

std::string FloatToString(float v) {
    char buf[64];
    double_conversion::StringBuilder builder(buf, sizeof(buf));
    Converter().ToShortestSingle(v, &builder);
    return std::string(buf, builder.position());
}

std::string DoubleToString(double v) {
    char buf[64];
    double_conversion::StringBuilder builder(buf, sizeof(buf));
    Converter().ToShortest(v, &builder);
    return std::string(buf, builder.position());
}

std::string FormatDirective(const char *directive, ...) {
    va_list args, argsCopy;
    va_start(args, directive);
    va_copy(argsCopy, args);
    int size = vsnprintf(nullptr, 0, directive, args);
    va_end(args);
    std::string str(std::max(size, 0) + 1, '\0');
    vsnprintf(&str[0], str.size(), directive, argsCopy);
    va_end(argsCopy);
    str.pop_back();
    return str;
}

std::string NextDirective(const char **fmt, std::string *s) {
    const char *&c = *fmt;
    for (; *c; ++c) {
        if (*c != '%')
            *s += *c;
        else if (c[1] == '%')
            *s += *c++;
        else
            break;
    }
    if (!*c)
        return {};

    // Flags, width, precision and length modifiers run up to the conversion
    const char *start = c++;
    while (*c && !strchr("diouxXeEfFgGaAcsp", *c))
        ++c;
    if (!*c)
        LOG_FATAL("Printf: unterminated directive in \"%s\"", start);
    ++c;
    return std::string(start, c);
}

void FinishFormat(const char *fmt, std::string *s) {
    if (!NextDirective(&fmt, s).empty())
        LOG_FATAL("Printf: fewer values than directives in format string");
}

}  // namespace detail

}  // namespace lumen
