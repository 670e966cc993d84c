/**
 * @file FixedStepScheduler.h
 * @brief Accumulates scaled simulation time and drains it in fixed steps, capped per frame.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstdint>
#include <functional>

/**
 * @class FixedStepScheduler
 * @brief Fixed-step accumulator with a per-frame step budget.
 *
 * A frame starts with beginFrame(); one or more advance() calls then add simulation seconds and run whole
 * steps of size stepSize() until the accumulator drops below one step or the frame has used maxStepsPerFrame()
 * steps. Whole-step debt left when the budget runs out is discarded (and counted), not carried into the next
 * frame, so a stall never turns into a catch-up spiral.
 */
class FixedStepScheduler {
public:
    using StepFn = std::function<void(double)>;

    FixedStepScheduler(double stepSize, int maxStepsPerFrame);

    /** @brief Reset the per-frame step budget. */
    void beginFrame();
    /** @brief Add @p simSeconds and run as many steps as the budget allows; returns steps run by this call. */
    int advance(double simSeconds, const StepFn& step);
    /** @brief Count @p simSeconds that the frame never fed to advance() as dropped. */
    void discard(double simSeconds);

    void setStepSize(double h);
    void setMaxStepsPerFrame(int m);

    double stepSize() const { return h; }
    int maxStepsPerFrame() const { return maxSteps; }
    double accumulated() const { return acc; }
    int stepsThisFrame() const { return frameSteps; }
    /** @brief True when the budget ran out during the current frame. */
    bool capHitThisFrame() const { return capHit; }
    /** @brief Total simulation seconds discarded by the per-frame cap. */
    double droppedSeconds() const { return dropped; }
    uint64_t totalSteps() const { return steps; }

    /** @brief Clear the accumulator and statistics. */
    void reset();

private:
    double h;
    int maxSteps;
    double acc{0.0};
    int frameSteps{0};
    bool capHit{false};
    double dropped{0.0};
    uint64_t steps{0};
};
