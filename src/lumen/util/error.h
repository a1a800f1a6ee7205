// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_UTIL_ERROR_H
#define LUMEN_UTIL_ERROR_H

#include <lumen/lumen.h>

#include <lumen/util/print.h>

#include <string>
#include <utility>

namespace lumen {

void SuppressErrorMessages();

// Error Reporting Function Declarations
void Warning(const std::string &message);
void Error(const std::string &message);
[[noreturn]] void ErrorExit(const std::string &message);

// Error Reporting Inline Functions
template <typename... Args>
inline void Warning(const char *fmt, Args &&...args) {
    Warning(StringPrintf(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
inline void Error(const char *fmt, Args &&...args) {
    Error(StringPrintf(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
[[noreturn]] inline void ErrorExit(const char *fmt, Args &&...args) {
    ErrorExit(StringPrintf(fmt, std::forward<Args>(args)...));
}

int LastError();
std::string ErrorString(int errorId = LastError());

}  // namespace lumen

#endif  // LUMEN_UTIL_ERROR_H
