// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/util/progressreporter.h>

#include <lumen/util/check.h>
#include <lumen/util/error.h>
#include <lumen/util/print.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdio>

#include <sys/ioctl.h>
#include <unistd.h>

namespace lumen {

static int TerminalWidth();

std::string Timer::ToString() const {
    return StringPrintf(
        "[ Timer start(ns): %d ]",
        std::chrono::duration_cast<std::chrono::nanoseconds>(start.time_since_epoch())
            .count());
}

// ProgressReporter Method Definitions
ProgressReporter::ProgressReporter(int64_t totalWork, const std::string &title,
                                   bool quiet)
    : totalWork(std::max<int64_t>(1, totalWork)), title(title), quiet(quiet) {
    if (!quiet)
        updateThread = std::thread([this]() { printBar(); });
}

ProgressReporter::~ProgressReporter() {
    Done();
}

void ProgressReporter::printBar() {
    int barWidth = std::max<int>(2, TerminalWidth() - 28 - int(title.size()));
    std::chrono::milliseconds interval(250);
    std::unique_lock<std::mutex> lock(mutex);
    for (int tick = 1;; ++tick) {
        Float fraction = std::min<Float>(1, Float(workDone) / Float(totalWork));
        int filled = int(std::round(barWidth * fraction));
        std::string bar(filled, '+');
        bar.append(barWidth - filled, ' ');
        printf("\r%s: [%s] ", title.c_str(), bar.c_str());

        Float elapsed = timer.ElapsedSeconds();
        if (fraction == 1)
            printf("(%.1fs)       ", elapsed);
        else if (fraction > 0)
            printf("(%.1fs|%.1fs)  ", elapsed, std::max<Float>(0, elapsed / fraction - elapsed));
        else
            printf("(%.1fs|?s)  ", elapsed);
        fflush(stdout);

        // The final state is drawn once after Done() wakes us
        if (exitThread)
            return;
        exitCondition.wait_for(lock, interval, [this]() { return exitThread; });

        // Redraw less often as the render goes on
        if (tick == 10 || tick == 70)
            interval *= 2;
        else if (tick == 520)
            interval *= 5;
    }
}

void ProgressReporter::Done() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (exitThread)
            return;
        exitThread = true;
        if (!quiet)
            workDone = totalWork;
    }
    exitCondition.notify_all();
    if (updateThread.joinable()) {
        updateThread.join();
        printf("\n");
    }
    finishTime = timer.ElapsedSeconds();
}

std::string ProgressReporter::ToString() const {
    std::lock_guard<std::mutex> lock(mutex);
    return StringPrintf("[ ProgressReporter totalWork: %d title: %s "
                        "timer: %s workDone: %d exitThread: %s ]",
                        totalWork, title, timer, workDone.load(), exitThread);
}

static int TerminalWidth() {
    struct winsize w;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0)
        return w.ws_col > 0 ? w.ws_col : 80;
    // ENOTTY just means stdout is not a terminal
    if (errno != ENOTTY)
        Warning("Unable to query terminal width: %s", ErrorString());
    return 80;
}

}  // namespace lumen
