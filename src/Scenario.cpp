/**
 * @file Scenario.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Scenario.h"
#include "Logger.h"

#include <string>

namespace {
// Terminal color pairs, see init_colors_orrery() in cmd/orrery/main.cpp.
constexpr short kPairYellow = 4;
constexpr short kPairBlue = 5;
constexpr short kPairWhite = 8;

Body makeBody(const char* name, double massKg, double radiusM, const Vector3D& positionM, short colorPair) {
    Body b;
    b.definition.name = name;
    b.definition.massKg = massKg;
    b.definition.radiusM = radiusM;
    b.definition.density = densityFromMassRadius(massKg, radiusM);
    b.world = fromMeters(positionM);
    b.colorPair = colorPair;
    return b;
}
}

std::vector<Body> makeSolarScenario(const GravityParams& params) {
    const double earthOrbit = 1.496e11;
    const double moonOrbit = 3.844e8;

    std::vector<Body> bodies;
    bodies.reserve(3);
    bodies.push_back(makeBody("Sun", 1.98847e30, 6.955e8, {0.0, 0.0, 0.0}, kPairYellow));
    bodies.push_back(makeBody("Earth", 5.9722e24, 6.371e6, {earthOrbit, 0.0, 0.0}, kPairBlue));
    bodies.push_back(makeBody("Moon", 7.3477e22, 1.737e6, {earthOrbit + moonOrbit, 0.0, 0.0}, kPairWhite));

    initCircularPair(bodies, 0, 1, kOrbitNormal, +1.0, params);
    bodies[2].velocity = bodies[1].velocity;
    initCircularPair(bodies, 1, 2, kOrbitNormal, +1.0, params);

    Logger::info("scenario: solar, bodies=" + std::to_string(bodies.size()));
    return bodies;
}
