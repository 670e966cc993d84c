/**
 * @file WorkerPool.h
 * @brief Fixed-size pool of worker threads running fenced batches of independent jobs.
 *
 * The pool is an owned object, not a process-wide singleton, so several simulations (or tests) can each run
 * their own. A batch is submitted by a single producer thread and runBatch() does not return until every job
 * of the batch has finished; jobs are expected to write only to memory they own exclusively (their index
 * chunk, their worker's scratch buffer). The pool also owns one acceleration scratch buffer per worker.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Vector3D.h"
#include "WaitGroup.h"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

/**
 * @brief Half-open range [start, end) of chunk @p idx when @p n items are split into @p numChunks parts.
 *
 * The first n % numChunks chunks receive ceil(n/numChunks) items and the rest floor(n/numChunks), so the
 * chunks are contiguous, gapless and differ in size by at most one. Chunks may be empty when n < numChunks.
 */
std::pair<size_t, size_t> chunkRange(size_t n, size_t idx, size_t numChunks);

class WorkerPool {
public:
    using Job = std::function<void()>;

    /** @brief Start the pool; @p requestedWorkers <= 0 selects the logical core count. */
    explicit WorkerPool(int requestedWorkers = 0);
    /** @brief Runs shutdown(). */
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /** @brief Map a requested worker count to a usable one: <= 0 means logical cores, minimum 1. */
    static int resolveWorkerCount(int requested);

    /** @brief Current number of worker threads (0 after shutdown). */
    int workerCount() const { return numWorkers.load(); }

    /**
     * @brief Drain, join and rebuild the pool with a new worker count.
     *
     * Waits for an in-flight batch, stops and joins every worker, releases the scratch buffers, then starts
     * the new workers. No-op after shutdown or when the resolved count is unchanged.
     */
    void setWorkerCount(int requested);

    /**
     * @brief Stop accepting batches, let the in-flight batch finish, then join all workers and free scratch.
     *
     * The latch is set before waiting. Batch submission, partitioning and reduction all run under the same
     * lifecycle lock as shutdown and resize, so a submission racing with either is fully run on one
     * consistent set of workers or dropped. Safe to call more than once.
     */
    void shutdown();
    bool isShutdown() const { return !accepting.load(); }

    /**
     * @brief Run @p jobs on the workers and block until all of them are done.
     *
     * Returns false without running anything once shutdown has been requested. If a job throws, the
     * remaining jobs still run and the first exception is rethrown here after the fence clears.
     * Must not be called from inside a job.
     */
    bool runBatch(std::vector<Job> jobs);

    /**
     * @brief Split [0, n) with chunkRange over the worker count and run fn(begin, end, worker) per non-empty chunk.
     *
     * Same blocking and shutdown semantics as runBatch().
     */
    bool parallelFor(size_t n, const std::function<void(size_t, size_t, int)>& fn);

    using AccumulateFn = std::function<void(size_t, size_t, std::vector<Vector3D>&)>;

    /**
     * @brief Chunk [0, n) over the workers and run fn(begin, end, partial) per non-empty chunk, then sum.
     *
     * Each worker's @p partial is its own scratch buffer, zeroed and sized to @p n, so a chunk may write any
     * index. After the fence the partials are added into @p out (resized to @p n) in worker order. The whole
     * call holds the lifecycle lock. Returns false, leaving @p out untouched, once shutdown has been requested.
     */
    bool parallelAccumulate(size_t n, const AccumulateFn& fn, std::vector<Vector3D>& out);

    /** @brief Number of batches that ran to completion. */
    uint64_t batchesRun() const { return batches.load(); }

private:
    void start(int count);
    void stopAndJoin();
    // Caller holds lifecycleMtx and has checked that workers are running.
    void runLocked(std::vector<Job>& jobs);
    void workerLoop(int index);

    std::mutex lifecycleMtx; // held for a whole batch, resize or shutdown
    std::atomic<bool> accepting{true};
    std::atomic<int> numWorkers{0};
    std::atomic<uint64_t> batches{0};

    std::mutex queueMtx;
    std::condition_variable queueCv;
    std::deque<Job> queue;
    bool stopWorkers{false};
    std::exception_ptr firstError;

    std::vector<std::thread> workers;
    std::vector<std::vector<Vector3D>> scratchBuffers;
    WaitGroup batchFence;
};
