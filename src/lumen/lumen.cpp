// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/lumen.h>

#include <lumen/options.h>
#include <lumen/util/check.h>
#include <lumen/util/error.h>
#include <lumen/util/parallel.h>
#include <lumen/util/print.h>

#include <stdlib.h>

namespace lumen {

// API Function Definitions
void InitLumen(const LumenOptions &opt) {
    Options = new LumenOptions(opt);
    // API Initialization

    if (Options->quiet)
        SuppressErrorMessages();

    InitLogging(opt.logLevel, opt.logFile);

    // General lumen Initialization
    int nThreads = Options->nThreads != 0 ? Options->nThreads : AvailableCores();
    ParallelInit(nThreads);

    LOG_VERBOSE("Initialized with %s", Options->ToString());
}

void CleanupLumen() {
    // API Cleanup
    ParallelCleanup();

    ShutdownLogging();

    delete Options;
    Options = nullptr;
}

}  // namespace lumen
