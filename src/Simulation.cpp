/**
 * @file Simulation.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Simulation.h"
#include "Logger.h"
#include "ParallelGravity.h"

#include <algorithm>
#include <string>
#include <utility>

Simulation::Simulation(const SimConfig& cfg)
    : params(cfg.gravity()),
      substepCeiling(cfg.maxSubstep > 0.0 ? cfg.maxSubstep : cfg.stepSize),
      pool(cfg.workers),
      clock(cfg.timeScale),
      sched(cfg.stepSize, cfg.maxStepsPerFrame) {
    if (substepCeiling < sched.stepSize()) substepCeiling = sched.stepSize();
    Logger::info("simulation: h=" + std::to_string(sched.stepSize()) +
                 " s, maxSteps=" + std::to_string(sched.maxStepsPerFrame()) +
                 ", substep=" + std::to_string(substepCeiling) +
                 " s, timeScale=" + std::to_string(clock.timeScale()) +
                 ", workers=" + std::to_string(pool.workerCount()));
}

Simulation::~Simulation() {
    shutdown();
}

void Simulation::reset(std::vector<Body> initial) {
    bodyList = std::move(initial);
    computeAccelerationsParallel(pool, bodyList, acc, params);
    clock.reset();
    sched.reset();
}

void Simulation::step(double dt) {
    stepVelocityVerletParallel(pool, bodyList, acc, dt, params);
}

int Simulation::frame(double realDt) {
    double remaining = clock.tick(realDt);
    sched.beginFrame();
    auto stepFn = [this](double h){ step(h); };
    int taken = 0;
    // Every chunk but the last is at least one step long (h <= substep ceiling), so this loop runs at most
    // maxStepsPerFrame + 1 times before the budget is spent.
    while (remaining > 0.0 && !sched.capHitThisFrame()) {
        double chunk = std::min(remaining, substepCeiling);
        remaining -= chunk;
        taken += sched.advance(chunk, stepFn);
    }
    if (remaining > 0.0) sched.discard(remaining);
    return taken;
}

void Simulation::setWorkerCount(int n) {
    pool.setWorkerCount(n);
}

void Simulation::shutdown() {
    pool.shutdown();
}
