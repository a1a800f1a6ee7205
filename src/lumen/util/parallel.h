// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_UTIL_PARALLEL_H
#define LUMEN_UTIL_PARALLEL_H

#include <lumen/lumen.h>

#include <lumen/util/check.h>
#include <lumen/util/float.h>
#include <lumen/util/vecmath.h>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace lumen {

// Parallel Function Declarations
void ParallelInit(int nThreads = -1);
void ParallelCleanup();

int AvailableCores();
int RunningThreads();

// ThreadLocal Definition
// Lazily creates one value per thread that calls Get(). Values are created
// under the writer lock, so the creation callback need not be thread-safe.
template <typename T>
class ThreadLocal {
  public:
    // ThreadLocal Public Methods
    ThreadLocal() : create([]() { return T(); }) {}
    ThreadLocal(std::function<T(void)> &&c) : create(std::move(c)) {}

    T &Get() {
        std::thread::id tid = std::this_thread::get_id();
        {
            std::shared_lock<std::shared_mutex> lock(mutex);
            auto iter = values.find(tid);
            if (iter != values.end())
                return *iter->second;
        }
        std::lock_guard<std::shared_mutex> lock(mutex);
        std::unique_ptr<T> &value = values[tid];
        if (!value)
            value = std::make_unique<T>(create());
        return *value;
    }

    template <typename F>
    void ForAll(F &&func) {
        std::lock_guard<std::shared_mutex> lock(mutex);
        for (auto &entry : values)
            func(*entry.second);
    }

  private:
    // ThreadLocal Private Members
    std::shared_mutex mutex;
    // Values are held by pointer so references survive rehashing
    std::unordered_map<std::thread::id, std::unique_ptr<T>> values;
    std::function<T(void)> create;
};

// AtomicDouble Definition
class AtomicDouble {
  public:
    // AtomicDouble Public Methods
    explicit AtomicDouble(double v = 0) : bits(FloatToBits(v)) {}

    operator double() const { return BitsToFloat(bits.load()); }

    double operator=(double v) {
        bits = FloatToBits(v);
        return v;
    }

    void Add(double v) {
        uint64_t oldBits = bits.load();
        while (!bits.compare_exchange_weak(oldBits, FloatToBits(BitsToFloat(oldBits) + v)))
            ;
    }

    std::string ToString() const;

  private:
    std::atomic<uint64_t> bits;
};

// Runs _func_ over chunks of _[start, end)_; the calling thread takes part
void ParallelFor(int64_t start, int64_t end, std::function<void(int64_t, int64_t)> func);
// Runs _func_ over square tiles that cover _extent_ exactly once
void ParallelFor2D(const Bounds2i &extent, std::function<void(Bounds2i)> func);

// Parallel Inline Functions
inline void ParallelFor(int64_t start, int64_t end, std::function<void(int64_t)> func) {
    ParallelFor(start, end, [&func](int64_t start, int64_t end) {
        for (int64_t i = start; i < end; ++i)
            func(i);
    });
}

inline void ParallelFor2D(const Bounds2i &extent, std::function<void(Point2i)> func) {
    ParallelFor2D(extent, [&func](Bounds2i b) {
        for (Point2i p : b)
            func(p);
    });
}

// ParallelJob Definition
// A loop over _[nextIndex, endIndex)_ handed out in chunks. Jobs live on the
// stack of the thread that issued them; the pool only refers to them while
// they still have unclaimed chunks or running workers.
struct ParallelJob {
    ParallelJob(int64_t start, int64_t end, int64_t chunkSize,
                std::function<void(int64_t, int64_t)> func)
        : func(std::move(func)), nextIndex(start), endIndex(end), chunkSize(chunkSize) {}

    bool HaveWork() const { return nextIndex < endIndex; }
    bool Finished() const { return !HaveWork() && activeWorkers == 0; }

    std::string ToString() const;

    std::function<void(int64_t, int64_t)> func;
    int64_t nextIndex, endIndex, chunkSize;
    int activeWorkers = 0;
};

// ThreadPool Definition
class ThreadPool {
  public:
    // ThreadPool Public Methods
    explicit ThreadPool(int nThreads);
    ~ThreadPool();

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;

    size_t size() const { return workers.size(); }

    // Enqueues _job_ and helps run it until every chunk has completed
    void Run(ParallelJob *job);

    std::string ToString() const;

  private:
    // ThreadPool Private Methods
    void Worker();
    // Claims one chunk of the first job with work left; called with _lock_
    // held and returns with it held
    bool RunChunk(std::unique_lock<std::mutex> &lock);

    // ThreadPool Private Members
    std::vector<std::thread> workers;
    mutable std::mutex mutex;
    std::condition_variable workAvailable, chunkDone;
    std::vector<ParallelJob *> jobs;
    bool shutdown = false;
};

}  // namespace lumen

#endif  // LUMEN_UTIL_PARALLEL_H
