// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/util/error.h>

#include <lumen/util/check.h>
#include <lumen/util/print.h>

#include <errno.h>
#include <string.h>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <string>

namespace lumen {

static bool quiet = false;

void SuppressErrorMessages() {
    quiet = true;
}

static void processError(const char *errorType, const std::string &message) {
    // Build up the entire message first so that output from concurrent
    // threads isn't interleaved.
    std::string errorString = Red(errorType) + ": " + message;

    // Print the error message (but not more than one time).
    static std::string lastError;
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    if (errorString != lastError) {
        fprintf(stderr, "%s\n", errorString.c_str());
        LOG_VERBOSE("%s", errorString);
        lastError = errorString;
    }
}

void Warning(const std::string &message) {
    if (quiet)
        return;
    processError("Warning", message);
}

void Error(const std::string &message) {
    if (quiet)
        return;
    processError("Error", message);
}

void ErrorExit(const std::string &message) {
    processError("Error", message);
    std::quick_exit(1);
}

int LastError() {
    return errno;
}

std::string ErrorString(int errorId) {
    return StringPrintf("%s (%d)", strerror(errorId), errorId);
}

}  // namespace lumen
