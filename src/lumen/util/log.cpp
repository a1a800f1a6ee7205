// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/util/log.h>

#include <lumen/util/check.h>
#include <lumen/util/error.h>

#include <stdio.h>
#include <string.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <mutex>

#ifdef LUMEN_IS_LINUX
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#else
#include <functional>
#include <thread>
#endif

namespace lumen {

namespace {

// Seconds since the first message was logged
double ElapsedSeconds() {
    using clock = std::chrono::steady_clock;
    static const clock::time_point start = clock::now();
    return std::chrono::duration<double>(clock::now() - start).count();
}

unsigned int ThreadId() {
#ifdef LUMEN_IS_LINUX
    return (unsigned int)syscall(SYS_gettid);
#else
    return (unsigned int)std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

// "[ tid 12345 @     0.125s integrators.cpp:120 ] ", with the path trimmed
// back to the source tree
std::string LinePrefix(const char *file, int line) {
    const char *tail = strstr(file, "lumen/");
    char buf[256];
    snprintf(buf, sizeof(buf), "[ tid %03u @ %9.3fs %s:%d ] ", ThreadId(),
             ElapsedSeconds(), tail ? tail + 6 : file, line);
    return buf;
}

}  // namespace

namespace logging {

LogLevel logLevel = LogLevel::Error;
FILE *logFile;

}  // namespace logging

void InitLogging(LogLevel level, std::string logFile) {
    if (level == LogLevel::Invalid)
        ErrorExit("Invalid --log-level specified.");
    logging::logLevel = level;
    if (logFile.empty())
        return;

    logging::logFile = fopen(logFile.c_str(), "w");
    if (!logging::logFile)
        ErrorExit("%s: %s", logFile, ErrorString());
    // A log file records everything
    logging::logLevel = LogLevel::Verbose;
}

void ShutdownLogging() {
    if (logging::logFile)
        fclose(logging::logFile);
    logging::logFile = nullptr;
    logging::logLevel = LogLevel::Error;
}

LogLevel LogLevelFromString(const std::string &s) {
    for (LogLevel level : {LogLevel::Verbose, LogLevel::Error, LogLevel::Fatal}) {
        std::string name = ToString(level);
        std::transform(name.begin(), name.end(), name.begin(), ::tolower);
        if (s == name)
            return level;
    }
    return LogLevel::Invalid;
}

std::string ToString(LogLevel level) {
    switch (level) {
    case LogLevel::Verbose:
        return "VERBOSE";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    default:
        return "UNKNOWN";
    }
}

void Log(LogLevel level, const char *file, int line, const char *s) {
    if (!*s)
        return;
    std::string message = LinePrefix(file, line);
    if (level != LogLevel::Verbose)
        message += ToString(level) + " ";
    message += s;

    FILE *f = logging::logFile ? logging::logFile : stderr;
    fprintf(f, "%s\n", message.c_str());
    fflush(f);
}

void LogFatal(LogLevel level, const char *file, int line, const char *s) {
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);

    std::string message = LinePrefix(file, line) + ToString(level) + " " + s;
    fprintf(stderr, "%s\n", message.c_str());
    if (logging::logFile) {
        fprintf(logging::logFile, "%s\n", message.c_str());
        fflush(logging::logFile);
    }

    CheckCallbackScope::Fail();
    abort();
}

}  // namespace lumen
