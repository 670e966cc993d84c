/**
 * @file SimConfig.h
 * @brief Runtime tunables: defaults, environment overrides, command-line overrides, validation.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Gravity.h"

struct SimConfig {
    int workers{0};              // <= 0: logical core count
    double stepSize{60.0};       // fixed integrator step h, simulation seconds
    int maxStepsPerFrame{2000};
    double timeScale{86400.0};   // simulation seconds per wall second
    double softening{1.0e4};     // softening length in meters; epsilon^2 = softening^2
    double maxSubstep{3600.0};   // ceiling on one chunk of a frame's simulation delta
    int headlessFrames{0};       // > 0: run this many frames without the terminal view
    double gravitationalConstant{kGravitationalConstant};

    GravityParams gravity() const {
        GravityParams p;
        p.G = gravitationalConstant;
        p.softening2 = softening * softening;
        return p;
    }
};

/** @brief Apply ORRERY_* environment variables; unparsable values are ignored. */
void applyEnv(SimConfig& cfg);
/** @brief Apply --key value / --key=value arguments from argv[1..argc). Unknown arguments are logged and skipped. */
void applyArgs(SimConfig& cfg, int argc, const char* const* argv);
/** @brief Replace out-of-range values with defaults (logged as warnings) and clamp stepSize to maxSubstep. */
void validate(SimConfig& cfg);
/** @brief Defaults, then environment, then arguments, then validation. */
SimConfig loadConfig(int argc, const char* const* argv);
