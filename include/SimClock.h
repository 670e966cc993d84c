/**
 * @file SimClock.h
 * @brief Converts wall-clock frame deltas into scaled simulation time.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

/**
 * @class SimClock
 * @brief Per-frame wall to simulation time scaling.
 *
 * simDt = min(realDt, kMaxRealDt) * timeScale, and simTime accumulates simDt. A time scale of 0 pauses.
 */
class SimClock {
public:
    /** @brief Longest wall delta accepted per frame, in seconds; longer hitches are clamped. */
    static constexpr double kMaxRealDt = 0.1;

    explicit SimClock(double timeScale = 1.0);

    /** @brief Advance by @p realDt wall seconds; returns the scaled simulation delta for this frame. */
    double tick(double realDt);

    /** @brief Set the wall-to-simulation multiplier; negative values clamp to 0 (paused). */
    void setTimeScale(double s);
    double timeScale() const { return scale; }
    bool isPaused() const { return scale == 0.0; }

    double realDt() const { return lastRealDt; }
    double simDt() const { return lastSimDt; }
    double simTime() const { return elapsed; }

    /** @brief Zero simTime and the last-frame deltas; keeps the time scale. */
    void reset();

private:
    double scale;
    double lastRealDt{0.0};
    double lastSimDt{0.0};
    double elapsed{0.0};
};
