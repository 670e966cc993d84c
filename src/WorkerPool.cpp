/**
 * @file WorkerPool.cpp
 * @brief Worker lifecycle, job queue, fenced batch submission and per-worker scratch management.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "WorkerPool.h"
#include "Logger.h"

#include <algorithm>
#include <string>

std::pair<size_t, size_t> chunkRange(size_t n, size_t idx, size_t numChunks) {
    if (numChunks == 0) numChunks = 1;
    if (idx >= numChunks) return {n, n};
    size_t base = n / numChunks;
    size_t rem = n % numChunks;
    size_t start = idx * base + std::min(idx, rem);
    size_t end = start + base + (idx < rem ? 1 : 0);
    return {start, end};
}

WorkerPool::WorkerPool(int requestedWorkers) {
    int count = resolveWorkerCount(requestedWorkers);
    if (requestedWorkers < 0) {
        Logger::warn("worker pool: requested " + std::to_string(requestedWorkers) +
                     " workers, using " + std::to_string(count));
    }
    std::lock_guard<std::mutex> life(lifecycleMtx);
    start(count);
}

WorkerPool::~WorkerPool() {
    shutdown();
}

int WorkerPool::resolveWorkerCount(int requested) {
    if (requested > 0) return requested;
    unsigned hc = std::thread::hardware_concurrency();
    if (hc == 0) hc = 1;
    return (int)hc;
}

void WorkerPool::start(int count) {
    {
        std::lock_guard<std::mutex> lock(queueMtx);
        stopWorkers = false;
        firstError = nullptr;
    }
    scratchBuffers.assign((size_t)count, std::vector<Vector3D>());
    workers.reserve((size_t)count);
    try {
        for (int t = 0; t < count; ++t) workers.emplace_back(&WorkerPool::workerLoop, this, t);
    } catch (...) {
        // Join whatever did start before reporting the failure.
        stopAndJoin();
        throw;
    }
    numWorkers.store(count);
    Logger::info("worker pool started: workers=" + std::to_string(count));
}

void WorkerPool::stopAndJoin() {
    {
        std::lock_guard<std::mutex> lock(queueMtx);
        stopWorkers = true;
    }
    queueCv.notify_all();
    for (auto& w : workers) {
        if (w.joinable()) w.join();
    }
    workers.clear();
    scratchBuffers.clear();
    scratchBuffers.shrink_to_fit();
    numWorkers.store(0);
}

void WorkerPool::workerLoop(int index) {
    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(queueMtx);
            queueCv.wait(lock, [this]{ return stopWorkers || !queue.empty(); });
            // Queued work is drained before honoring a stop request.
            if (queue.empty()) return;
            job = std::move(queue.front());
            queue.pop_front();
        }
        try {
            job();
        } catch (const std::exception& e) {
            Logger::logException("worker " + std::to_string(index), e);
            std::lock_guard<std::mutex> lock(queueMtx);
            if (!firstError) firstError = std::current_exception();
        } catch (...) {
            Logger::logUnknownException("worker " + std::to_string(index));
            std::lock_guard<std::mutex> lock(queueMtx);
            if (!firstError) firstError = std::current_exception();
        }
        batchFence.done();
    }
}

void WorkerPool::setWorkerCount(int requested) {
    if (!accepting.load()) return;
    std::lock_guard<std::mutex> life(lifecycleMtx);
    if (!accepting.load()) return;
    int count = resolveWorkerCount(requested);
    if (count == numWorkers.load()) return;
    int old = numWorkers.load();
    stopAndJoin();
    start(count);
    Logger::info("worker pool resized: " + std::to_string(old) + " -> " + std::to_string(count));
}

void WorkerPool::shutdown() {
    // Latch first so no batch can slip in while the workers are being torn down.
    bool wasAccepting = accepting.exchange(false);
    std::lock_guard<std::mutex> life(lifecycleMtx);
    if (workers.empty()) return;
    stopAndJoin();
    if (wasAccepting) Logger::info("worker pool shut down");
}

void WorkerPool::runLocked(std::vector<Job>& jobs) {
    if (jobs.empty()) return;
    batchFence.add(jobs.size());
    {
        std::lock_guard<std::mutex> lock(queueMtx);
        for (auto& j : jobs) queue.push_back(std::move(j));
    }
    queueCv.notify_all();
    batchFence.wait();
    batches.fetch_add(1);

    std::exception_ptr err;
    {
        std::lock_guard<std::mutex> lock(queueMtx);
        std::swap(err, firstError);
    }
    if (err) std::rethrow_exception(err);
}

bool WorkerPool::runBatch(std::vector<Job> jobs) {
    if (!accepting.load()) return false;
    std::lock_guard<std::mutex> life(lifecycleMtx);
    if (!accepting.load() || workers.empty()) return false;
    runLocked(jobs);
    return true;
}

bool WorkerPool::parallelFor(size_t n, const std::function<void(size_t, size_t, int)>& fn) {
    if (!accepting.load()) return false;
    std::lock_guard<std::mutex> life(lifecycleMtx);
    if (!accepting.load() || workers.empty()) return false;
    const size_t count = workers.size();
    std::vector<Job> jobs;
    jobs.reserve(count);
    for (size_t t = 0; t < count; ++t) {
        auto range = chunkRange(n, t, count);
        if (range.first == range.second) continue;
        size_t begin = range.first, end = range.second;
        int worker = (int)t;
        jobs.emplace_back([&fn, begin, end, worker]{ fn(begin, end, worker); });
    }
    runLocked(jobs);
    return true;
}

bool WorkerPool::parallelAccumulate(size_t n, const AccumulateFn& fn, std::vector<Vector3D>& out) {
    if (!accepting.load()) return false;
    std::lock_guard<std::mutex> life(lifecycleMtx);
    if (!accepting.load() || workers.empty()) return false;
    const size_t count = workers.size();
    std::vector<Job> jobs;
    jobs.reserve(count);
    for (size_t t = 0; t < count; ++t) {
        std::vector<Vector3D>* partial = &scratchBuffers[t];
        partial->assign(n, Vector3D{});
        auto range = chunkRange(n, t, count);
        if (range.first == range.second) continue;
        size_t begin = range.first, end = range.second;
        jobs.emplace_back([&fn, begin, end, partial]{ fn(begin, end, *partial); });
    }
    runLocked(jobs);

    out.assign(n, Vector3D{});
    for (const auto& part : scratchBuffers) {
        for (size_t i = 0; i < n; ++i) out[i] += part[i];
    }
    return true;
}
