// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/util/parallel.h>

#include <lumen/util/check.h>
#include <lumen/util/math.h>
#include <lumen/util/print.h>

#include <algorithm>
#include <cmath>

namespace lumen {

static ThreadPool *threadPool;

std::string AtomicDouble::ToString() const {
    return StringPrintf("%f", double(*this));
}

std::string ParallelJob::ToString() const {
    return StringPrintf("[ ParallelJob nextIndex: %d endIndex: %d chunkSize: %d "
                        "activeWorkers: %d ]",
                        nextIndex, endIndex, chunkSize, activeWorkers);
}

// ThreadPool Method Definitions
ThreadPool::ThreadPool(int nThreads) {
    // The thread that issues a loop always works on it too
    for (int i = 0; i < nThreads - 1; ++i)
        workers.push_back(std::thread(&ThreadPool::Worker, this));
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        CHECK(jobs.empty());
        shutdown = true;
    }
    workAvailable.notify_all();
    for (std::thread &thread : workers)
        thread.join();
}

void ThreadPool::Worker() {
    LOG_VERBOSE("Started execution in worker thread");
    std::unique_lock<std::mutex> lock(mutex);
    while (!shutdown)
        if (!RunChunk(lock))
            workAvailable.wait(lock);
    LOG_VERBOSE("Exiting worker thread");
}

bool ThreadPool::RunChunk(std::unique_lock<std::mutex> &lock) {
    DCHECK(lock.owns_lock());
    auto iter = std::find_if(jobs.begin(), jobs.end(),
                             [](const ParallelJob *job) { return job->HaveWork(); });
    if (iter == jobs.end())
        return false;

    // Claim the next chunk; a job leaves the list once all of it is claimed
    ParallelJob *job = *iter;
    int64_t start = job->nextIndex;
    int64_t end = std::min(start + job->chunkSize, job->endIndex);
    job->nextIndex = end;
    ++job->activeWorkers;
    if (!job->HaveWork())
        jobs.erase(iter);

    lock.unlock();
    job->func(start, end);
    lock.lock();

    if (--job->activeWorkers == 0 && !job->HaveWork())
        chunkDone.notify_all();
    return true;
}

void ThreadPool::Run(ParallelJob *job) {
    std::unique_lock<std::mutex> lock(mutex);
    jobs.push_back(job);
    workAvailable.notify_all();

    while (!job->Finished())
        if (!RunChunk(lock))
            chunkDone.wait(lock);
}

std::string ThreadPool::ToString() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::string s = StringPrintf("[ ThreadPool workers: %d shutdown: %s jobs: [ ",
                                 workers.size(), shutdown);
    for (const ParallelJob *job : jobs)
        s += job->ToString() + " ";
    return s + "] ]";
}

// Parallel Function Definitions
void ParallelFor(int64_t start, int64_t end, std::function<void(int64_t, int64_t)> func) {
    CHECK(threadPool);
    if (start >= end)
        return;
    // Aim for about eight chunks per thread so uneven iterations balance out
    int64_t chunkSize = std::max<int64_t>(1, (end - start) / (8 * RunningThreads()));
    ParallelJob job(start, end, chunkSize, std::move(func));
    threadPool->Run(&job);
}

void ParallelFor2D(const Bounds2i &extent, std::function<void(Bounds2i)> func) {
    CHECK(threadPool);
    if (extent.IsEmpty())
        return;

    // Square tiles between 1 and 32 pixels on a side, about eight per thread
    Vector2i diag = extent.Diagonal();
    int tileSize =
        Clamp(int(std::sqrt(Float(diag.x) * diag.y / (8 * RunningThreads()))), 1, 32);
    int nTilesX = (diag.x + tileSize - 1) / tileSize;
    int nTilesY = (diag.y + tileSize - 1) / tileSize;

    ParallelJob job(0, int64_t(nTilesX) * nTilesY, 1, [&](int64_t start, int64_t end) {
        for (int64_t t = start; t < end; ++t) {
            Vector2i tile(int(t % nTilesX), int(t / nTilesX));
            Point2i pMin = extent.pMin + tileSize * tile;
            func(Intersect(Bounds2i(pMin, pMin + Vector2i(tileSize, tileSize)), extent));
        }
    });
    threadPool->Run(&job);
}

int AvailableCores() {
    return std::max<int>(1, std::thread::hardware_concurrency());
}

int RunningThreads() {
    return threadPool ? (1 + threadPool->size()) : 1;
}

void ParallelInit(int nThreads) {
    CHECK(!threadPool);
    if (nThreads <= 0)
        nThreads = AvailableCores();
    threadPool = new ThreadPool(nThreads);
}

void ParallelCleanup() {
    delete threadPool;
    threadPool = nullptr;
}

}  // namespace lumen
