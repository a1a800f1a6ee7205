// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_UTIL_PROGRESSREPORTER_H
#define LUMEN_UTIL_PROGRESSREPORTER_H

#include <lumen/lumen.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace lumen {

// Timer Definition
class Timer {
  public:
    Timer() { start = clock::now(); }
    double ElapsedSeconds() const {
        clock::time_point now = clock::now();
        int64_t elapseduS =
            std::chrono::duration_cast<std::chrono::microseconds>(now - start).count();
        return elapseduS / 1000000.;
    }

    std::string ToString() const;

  private:
    using clock = std::chrono::steady_clock;
    clock::time_point start;
};

// ProgressReporter Definition
// Prints a text progress bar from a background thread; Update() is safe to call
// from any number of rendering threads.
class ProgressReporter {
  public:
    // ProgressReporter Public Methods
    ProgressReporter() : quiet(true) {}
    ProgressReporter(int64_t totalWork, const std::string &title, bool quiet);

    ~ProgressReporter();

    void Update(int64_t num = 1);
    void Done();
    double ElapsedSeconds() const;
    int64_t WorkDone() const { return workDone; }

    std::string ToString() const;

  private:
    // ProgressReporter Private Methods
    void printBar();

    // ProgressReporter Private Members
    int64_t totalWork = 0;
    std::string title;
    bool quiet;
    Timer timer;
    std::atomic<int64_t> workDone{0};
    mutable std::mutex mutex;
    std::condition_variable exitCondition;
    bool exitThread = false;
    std::thread updateThread;
    std::optional<float> finishTime;
};

// ProgressReporter Inline Method Definitions
inline double ProgressReporter::ElapsedSeconds() const {
    return finishTime ? *finishTime : timer.ElapsedSeconds();
}

inline void ProgressReporter::Update(int64_t num) {
    if (num == 0)
        return;
    workDone += num;
}

}  // namespace lumen

#endif  // LUMEN_UTIL_PROGRESSREPORTER_H
