/**
 * @file SimClock.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "SimClock.h"

#include <algorithm>
#include <cmath>

SimClock::SimClock(double timeScale) : scale(0.0) {
    setTimeScale(timeScale);
}

double SimClock::tick(double realDt) {
    if (!(realDt > 0.0)) realDt = 0.0; // also catches NaN
    lastRealDt = std::min(realDt, kMaxRealDt);
    lastSimDt = lastRealDt * scale;
    elapsed += lastSimDt;
    return lastSimDt;
}

void SimClock::setTimeScale(double s) {
    if (!(s > 0.0) || !std::isfinite(s)) s = 0.0;
    scale = s;
}

void SimClock::reset() {
    lastRealDt = 0.0;
    lastSimDt = 0.0;
    elapsed = 0.0;
}
