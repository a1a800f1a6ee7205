// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_UTIL_LOG_H
#define LUMEN_UTIL_LOG_H

#include <lumen/lumen.h>

#include <stdio.h>
#include <string>

namespace lumen {

// LogLevel Definition
enum class LogLevel { Verbose, Error, Fatal, Invalid };

std::string ToString(LogLevel level);
LogLevel LogLevelFromString(const std::string &s);

void ShutdownLogging();
void InitLogging(LogLevel level, std::string logFile);

// LogLevel Global Variable Declaration
namespace logging {
extern LogLevel logLevel;
extern FILE *logFile;
}  // namespace logging

// Logging Function Declarations
void Log(LogLevel level, const char *file, int line, const char *s);
[[noreturn]] void LogFatal(LogLevel level, const char *file, int line, const char *s);

template <typename... Args>
inline void Log(LogLevel level, const char *file, int line, const char *fmt,
                Args &&...args);

template <typename... Args>
[[noreturn]] inline void LogFatal(LogLevel level, const char *file, int line,
                                  const char *fmt, Args &&...args);

#define TO_STRING(x) TO_STRING2(x)
#define TO_STRING2(x) #x

// Logging Macros
#define LOG_VERBOSE(...)                                      \
    (lumen::LogLevel::Verbose >= lumen::logging::logLevel && \
     (lumen::Log(lumen::LogLevel::Verbose, __FILE__, __LINE__, __VA_ARGS__), true))

#define LOG_ERROR(...)                                      \
    (lumen::LogLevel::Error >= lumen::logging::logLevel && \
     (lumen::Log(lumen::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__), true))

#define LOG_FATAL(...) \
    lumen::LogFatal(lumen::LogLevel::Fatal, __FILE__, __LINE__, __VA_ARGS__)

}  // namespace lumen

#include <lumen/util/print.h>

namespace lumen {

template <typename... Args>
inline void Log(LogLevel level, const char *file, int line, const char *fmt,
                Args &&...args) {
    std::string s = StringPrintf(fmt, std::forward<Args>(args)...);
    Log(level, file, line, s.c_str());
}

template <typename... Args>
inline void LogFatal(LogLevel level, const char *file, int line, const char *fmt,
                     Args &&...args) {
    std::string s = StringPrintf(fmt, std::forward<Args>(args)...);
    LogFatal(level, file, line, s.c_str());
}

}  // namespace lumen

#endif  // LUMEN_UTIL_LOG_H
