/**
 * @file WaitGroup.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "WaitGroup.h"

void WaitGroup::add(size_t n) {
    std::lock_guard<std::mutex> lock(mtx);
    count += n;
}

void WaitGroup::done() {
    std::lock_guard<std::mutex> lock(mtx);
    if (count == 0) return;
    if (--count == 0) cv.notify_all();
}

void WaitGroup::wait() {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait(lock, [this]{ return count == 0; });
}

size_t WaitGroup::pending() const {
    std::lock_guard<std::mutex> lock(mtx);
    return count;
}
