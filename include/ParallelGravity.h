/**
 * @file ParallelGravity.h
 * @brief Worker-pool versions of the force kernel and the Velocity-Verlet step.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Body.h"
#include "Gravity.h"
#include "Vector3D.h"
#include "WorkerPool.h"

#include <vector>

/**
 * @brief Same result as computeAccelerations() up to summation order, computed on @p pool.
 *
 * The outer pair index i is chunked across workers; each worker still pairs its i with every j > i and writes
 * both ends of the pair into its own scratch buffer. After the fence the buffers are summed into @p outAcc
 * serially, worker 0 first. Falls back to the serial kernel when the pool has one worker or was shut down.
 */
void computeAccelerationsParallel(WorkerPool& pool, const std::vector<Body>& bodies,
                                  std::vector<Vector3D>& outAcc, const GravityParams& params);

/**
 * @brief stepVelocityVerlet() with each of the three stages run as a fenced batch on @p pool.
 *
 * With a single worker (or a shut-down pool) this is exactly the serial stepVelocityVerlet().
 */
void stepVelocityVerletParallel(WorkerPool& pool, std::vector<Body>& bodies, std::vector<Vector3D>& acc,
                                double dt, const GravityParams& params);
