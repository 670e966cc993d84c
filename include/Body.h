/**
 * @file Body.h
 * @brief Simulated celestial body: static definition plus mutable world position and velocity.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Vector3D.h"
#include "WorldPos.h"

#include <string>

struct BodyDefinition {
    std::string name;
    double massKg{0.0};
    double density{0.0};  // kg/m^3
    double radiusM{0.0};
};

struct Body {
    BodyDefinition definition;
    WorldPos world;
    Vector3D velocity;    // m/s
    short colorPair{8};   // terminal color pair used by the view
};

/** @brief Mean density of a sphere of mass @p massKg and radius @p radiusM (0 when the radius is not positive). */
inline double densityFromMassRadius(double massKg, double radiusM) {
    if (!(radiusM > 0.0)) return 0.0;
    const double PI = 3.14159265358979323846;
    return massKg / ((4.0 / 3.0) * PI * radiusM * radiusM * radiusM);
}
