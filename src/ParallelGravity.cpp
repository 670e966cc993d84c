/**
 * @file ParallelGravity.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "ParallelGravity.h"

namespace {
inline bool useSerial(const WorkerPool& pool) {
    return pool.isShutdown() || pool.workerCount() <= 1;
}
}

void computeAccelerationsParallel(WorkerPool& pool, const std::vector<Body>& bodies,
                                  std::vector<Vector3D>& outAcc, const GravityParams& params) {
    if (useSerial(pool)) {
        computeAccelerations(bodies, outAcc, params);
        return;
    }
    // Pairs (i, j) with j > i write both acc[i] and acc[j], so each worker gets a private full-length buffer.
    bool ran = pool.parallelAccumulate(bodies.size(), [&](size_t begin, size_t end, std::vector<Vector3D>& partial){
        accumulatePairForces(bodies, begin, end, partial, params);
    }, outAcc);
    if (!ran) computeAccelerations(bodies, outAcc, params);
}

void stepVelocityVerletParallel(WorkerPool& pool, std::vector<Body>& bodies, std::vector<Vector3D>& acc,
                                double dt, const GravityParams& params) {
    if (useSerial(pool)) {
        stepVelocityVerlet(bodies, acc, dt, params);
        return;
    }
    const size_t n = bodies.size();
    if (n == 0) return;
    if (acc.size() != n) computeAccelerationsParallel(pool, bodies, acc, params);

    // Stage 1: half kick with the old accelerations, then drift.
    bool ran = pool.parallelFor(n, [&](size_t begin, size_t end, int){
        kickDrift(bodies, acc, begin, end, dt);
    });
    if (!ran) {
        // Pool went away between the check and the batch; finish the step serially.
        kickDrift(bodies, acc, 0, n, dt);
    }
    // Stage 2: accelerations at the new positions.
    computeAccelerationsParallel(pool, bodies, acc, params);
    // Stage 3: half kick with the new accelerations.
    ran = pool.parallelFor(n, [&](size_t begin, size_t end, int){
        kick(bodies, acc, begin, end, dt);
    });
    if (!ran) kick(bodies, acc, 0, n, dt);
}
