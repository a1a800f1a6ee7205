// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/util/args.h>

namespace lumen {

std::vector<std::string> GetCommandLineArguments(char *argv[]) {
    std::vector<std::string> argStrings;
    ++argv;  // skip executable name
    while (*argv) {
        argStrings.push_back(*argv);
        ++argv;
    }
    return argStrings;
}

}  // namespace lumen
