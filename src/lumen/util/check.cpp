// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/util/check.h>

#include <cstdio>
#include <cstdlib>

#ifdef LUMEN_IS_LINUX
#include <cxxabi.h>
#include <execinfo.h>
#endif

namespace lumen {

#ifdef LUMEN_IS_LINUX
// glibc reports frames as "module(symbol+offset) [address]"; the symbol is
// demangled when that succeeds and printed as-is otherwise.
static std::string DescribeFrame(const std::string &frame) {
    size_t open = frame.find('(');
    size_t plus = frame.find('+', open), close = frame.find(')', open);
    if (open == std::string::npos || plus == std::string::npos ||
        close == std::string::npos || plus > close)
        return frame;

    std::string module = frame.substr(0, open);
    std::string symbol = frame.substr(open + 1, plus - open - 1);
    std::string offset = frame.substr(plus + 1, close - plus - 1);
    if (symbol.empty())
        symbol = "(unknown)";
    else {
        int status = 0;
        char *demangled = abi::__cxa_demangle(symbol.c_str(), nullptr, nullptr, &status);
        if (status == 0)
            symbol = demangled;
        free(demangled);
    }
    return module + ": " + symbol + " + " + offset;
}
#endif

void PrintStackTrace() {
#ifdef LUMEN_IS_LINUX
    void *callstack[32];
    int frames = backtrace(callstack, LUMEN_ARRAYSIZE(callstack));
    char **symbols = backtrace_symbols(callstack, frames);
    if (!symbols)
        return;
    for (int i = 0; i < frames; ++i)
        fprintf(stderr, "  #%-2d %s\n", i, DescribeFrame(symbols[i]).c_str());
    free(symbols);
#else
    fprintf(stderr, "(stack trace unavailable on this platform)\n");
#endif
}

// CheckCallbackScope Method Definitions
thread_local std::vector<std::function<std::string(void)>> CheckCallbackScope::callbacks;

CheckCallbackScope::CheckCallbackScope(std::function<std::string(void)> callback) {
    callbacks.push_back(std::move(callback));
}

CheckCallbackScope::~CheckCallbackScope() {
    CHECK(!callbacks.empty());
    callbacks.pop_back();
}

void CheckCallbackScope::Fail() {
    PrintStackTrace();
    // Innermost scope first
    for (size_t i = callbacks.size(); i > 0; --i)
        fprintf(stderr, "%s\n", callbacks[i - 1]().c_str());
    fprintf(stderr, "\n");
    abort();
}

}  // namespace lumen
