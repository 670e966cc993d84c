/**
 * @file FixedStepScheduler.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "FixedStepScheduler.h"
#include "Logger.h"

#include <cmath>
#include <string>

namespace {
constexpr double kDefaultStep = 60.0;
constexpr int kDefaultMaxSteps = 2000;
}

FixedStepScheduler::FixedStepScheduler(double stepSize, int maxStepsPerFrame)
    : h(kDefaultStep), maxSteps(kDefaultMaxSteps) {
    setStepSize(stepSize);
    setMaxStepsPerFrame(maxStepsPerFrame);
}

void FixedStepScheduler::setStepSize(double s) {
    if (!(s > 0.0) || !std::isfinite(s)) s = kDefaultStep;
    h = s;
}

void FixedStepScheduler::setMaxStepsPerFrame(int m) {
    if (m < 1) m = 1;
    maxSteps = m;
}

void FixedStepScheduler::beginFrame() {
    frameSteps = 0;
    capHit = false;
}

int FixedStepScheduler::advance(double simSeconds, const StepFn& step) {
    if (simSeconds > 0.0 && std::isfinite(simSeconds)) acc += simSeconds;
    int ran = 0;
    while (acc >= h && frameSteps < maxSteps) {
        step(h);
        acc -= h;
        ++frameSteps;
        ++ran;
        ++steps;
    }
    if (acc >= h) {
        // Out of budget: keep only the sub-step remainder.
        double keep = std::fmod(acc, h);
        double lost = acc - keep;
        dropped += lost;
        acc = keep;
        if (!capHit && Logger::enabled(Logger::Level::Warn)) {
            Logger::warn("step budget exhausted (" + std::to_string(maxSteps) + " steps); dropped " +
                         std::to_string(lost) + " s of simulation time");
        }
        capHit = true;
    }
    return ran;
}

void FixedStepScheduler::discard(double simSeconds) {
    if (simSeconds > 0.0) dropped += simSeconds;
}

void FixedStepScheduler::reset() {
    acc = 0.0;
    frameSteps = 0;
    capHit = false;
    dropped = 0.0;
    steps = 0;
}
