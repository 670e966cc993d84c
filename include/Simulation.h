/**
 * @file Simulation.h
 * @brief Owned simulation context: bodies, accelerations, worker pool, clock and fixed-step scheduler.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Body.h"
#include "FixedStepScheduler.h"
#include "Gravity.h"
#include "SimClock.h"
#include "SimConfig.h"
#include "Vector3D.h"
#include "WorkerPool.h"

#include <cstddef>
#include <vector>

/**
 * @class Simulation
 * @brief Drives the N-body system from wall-clock frame deltas.
 *
 * Per frame: the clock scales the wall delta; the scaled delta is cut into chunks no longer than the substep
 * ceiling; each chunk is fed to the fixed-step scheduler, whose per-frame step cap spans all chunks; every
 * scheduled step runs one parallel Velocity-Verlet step on the pool. Only the calling thread mutates the
 * bodies, and it never reads them while a batch is in flight.
 */
class Simulation {
public:
    explicit Simulation(const SimConfig& cfg);
    ~Simulation();

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    /** @brief Replace the body set, prime accelerations and reset clock and scheduler. */
    void reset(std::vector<Body> initial);

    /** @brief Advance by @p realDt wall seconds; returns the number of integrator steps taken. */
    int frame(double realDt);

    /** @brief Run exactly one integrator step of @p dt simulation seconds, bypassing clock and scheduler. */
    void step(double dt);

    void setTimeScale(double s) { clock.setTimeScale(s); }
    void setWorkerCount(int n);
    /** @brief Stop the worker pool; later frames fall back to the serial integrator. */
    void shutdown();

    const std::vector<Body>& bodies() const { return bodyList; }
    size_t bodyCount() const { return bodyList.size(); }
    const std::vector<Vector3D>& accelerations() const { return acc; }
    const SimClock& simClock() const { return clock; }
    const FixedStepScheduler& scheduler() const { return sched; }
    const WorkerPool& workerPool() const { return pool; }
    const GravityParams& gravity() const { return params; }
    double maxSubstep() const { return substepCeiling; }

    double energy() const { return totalEnergy(bodyList, params); }
    Vector3D momentum() const { return totalMomentum(bodyList); }

private:
    GravityParams params;
    double substepCeiling;
    WorkerPool pool;
    SimClock clock;
    FixedStepScheduler sched;
    std::vector<Body> bodyList;
    std::vector<Vector3D> acc;
};
