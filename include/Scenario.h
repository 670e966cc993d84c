/**
 * @file Scenario.h
 * @brief Initial body sets.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Body.h"
#include "Gravity.h"

#include <vector>

/** @brief Orbital plane normal used by the built-in scenarios (+y, orbits in the x/z plane). */
const Vector3D kOrbitNormal{0.0, 1.0, 0.0};

/**
 * @brief Sun, Earth and Moon on circular orbits in the x/z plane.
 *
 * Index 0 is the Sun at the origin, 1 the Earth 1.496e11 m along +x, 2 the Moon 3.844e8 m beyond the Earth.
 * Earth is put on its orbit first; the Moon then starts from the Earth's velocity and gets its own orbital
 * contribution on top.
 */
std::vector<Body> makeSolarScenario(const GravityParams& params);
