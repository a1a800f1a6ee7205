// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <gtest/gtest.h>
#include <lumen/lumen.h>

#include <lumen/options.h>
#include <lumen/util/args.h>
#include <lumen/util/error.h>
#include <lumen/util/log.h>
#include <lumen/util/print.h>

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

using namespace lumen;

void usage(const std::string &msg = "") {
    if (!msg.empty())
        fprintf(stderr, "lumen_test: %s\n\n", msg.c_str());

    fprintf(stderr, R"(lumen_test arguments:
  --list-tests                List all tests.
  --log-level <level>         Log messages at or above this level, where <level>
                              is "verbose", "error", or "fatal". Default: "error".
  --nthreads <num>            Use specified number of threads for rendering.
  --test-filter <regexp>      Regular expression of test names to run.
)");

    exit(msg.empty() ? 0 : 1);
}

int main(int argc, char **argv) {
    LumenOptions opt;
    opt.quiet = true;
    std::string logLevel = "error";
    std::string testFilter;
    bool listTests = false;

    std::vector<std::string> args = GetCommandLineArguments(argv);

    // Process command-line arguments
    for (auto iter = args.begin(); iter != args.end(); ++iter) {
        auto onError = [](const std::string &err) {
            usage(err);
            exit(1);
        };

        if (ParseArg(&iter, args.end(), "list-tests", &listTests, onError) ||
            ParseArg(&iter, args.end(), "log-level", &logLevel, onError) ||
            ParseArg(&iter, args.end(), "nthreads", &opt.nThreads, onError) ||
            ParseArg(&iter, args.end(), "gtest-filter", &testFilter, onError) ||
            ParseArg(&iter, args.end(), "test-filter", &testFilter, onError)) {
            // success
        } else if (*iter == "--help" || *iter == "-help" || *iter == "-h") {
            usage();
            return 0;
        } else if (iter->compare(0, 8, "--gtest_") == 0) {
            // Let gtest_discover_tests pass its own flags through
            continue;
        } else {
            usage(StringPrintf("argument \"%s\" unknown", *iter));
            return 1;
        }
    }

    opt.logLevel = LogLevelFromString(logLevel);

    InitLumen(opt);

    testing::InitGoogleTest(&argc, argv);
    // The thread pool is already running, so death tests must re-execute
    testing::GTEST_FLAG(death_test_style) = "threadsafe";

    if (!testFilter.empty())
        testing::GTEST_FLAG(filter) = testFilter;
    if (listTests)
        testing::GTEST_FLAG(list_tests) = true;

    int ret = RUN_ALL_TESTS();

    CleanupLumen();

    return ret;
}
