/**
 * @file WaitGroup.h
 * @brief Completion-counting fence: add expected jobs, each job calls done(), wait() blocks until zero.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

class WaitGroup {
public:
    WaitGroup() = default;
    WaitGroup(const WaitGroup&) = delete;
    WaitGroup& operator=(const WaitGroup&) = delete;

    /** @brief Register @p n more outstanding units of work. */
    void add(size_t n);
    /** @brief Mark one unit complete; wakes waiters when the count reaches zero. */
    void done();
    /** @brief Block until every registered unit has called done(). */
    void wait();
    /** @brief Outstanding units (racy snapshot, for diagnostics). */
    size_t pending() const;

private:
    mutable std::mutex mtx;
    std::condition_variable cv;
    size_t count{0};
};
