/**
 * @file Gravity.h
 * @brief Pairwise Newtonian gravity with Plummer softening and single-threaded Velocity-Verlet stepping.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Body.h"
#include "Vector3D.h"

#include <cstddef>
#include <vector>

/** @brief Newtonian constant of gravitation, m^3 kg^-1 s^-2. */
constexpr double kGravitationalConstant = 6.67430e-11;

struct GravityParams {
    double G{kGravitationalConstant};
    double softening2{1.0e8}; // epsilon^2 in m^2, added to every squared separation
};

/**
 * @brief Accelerations of every body due to every other body.
 *
 * @p outAcc is resized to bodies.size() and zeroed, then each unordered pair (i<j) is visited once:
 * acc[i] += G m_j r / (|r|^2+eps^2)^(3/2) and acc[j] -= G m_i r / (...), with r = delta(i, j).
 */
void computeAccelerations(const std::vector<Body>& bodies, std::vector<Vector3D>& outAcc,
                          const GravityParams& params);

/**
 * @brief Accumulate the pair contributions for outer indices [begin, end) into @p acc without zeroing it.
 *
 * Shared by the serial path and the per-worker parallel kernel.
 */
void accumulatePairForces(const std::vector<Body>& bodies, size_t begin, size_t end,
                          std::vector<Vector3D>& acc, const GravityParams& params);

/** @brief Half kick then drift for bodies [begin, end): v += a dt/2, world += v dt. */
void kickDrift(std::vector<Body>& bodies, const std::vector<Vector3D>& acc, size_t begin, size_t end, double dt);
/** @brief Half kick for bodies [begin, end): v += a dt/2. */
void kick(std::vector<Body>& bodies, const std::vector<Vector3D>& acc, size_t begin, size_t end, double dt);

/**
 * @brief One kick-drift-kick step of size @p dt.
 *
 * On entry @p acc must hold the accelerations at the current positions; on return it holds the
 * accelerations at the new positions, ready for the next step.
 */
void stepVelocityVerlet(std::vector<Body>& bodies, std::vector<Vector3D>& acc, double dt,
                        const GravityParams& params);

/**
 * @brief Put @p satellite on a circular orbit around @p primary, preserving the pair's momentum.
 *
 * Adds the orbital contribution on top of the velocities the two bodies already have, so chains
 * (moon around planet around star) are built parent first with the satellite starting from the parent's
 * velocity. Returns false and changes nothing for zero separation, zero combined mass, or a plane normal
 * parallel to the separation.
 */
bool initCircularPair(std::vector<Body>& bodies, size_t primary, size_t satellite,
                      const Vector3D& planeNormal, double directionSign, const GravityParams& params);

/** @brief Kinetic plus softened pairwise potential energy, in joules. */
double totalEnergy(const std::vector<Body>& bodies, const GravityParams& params);
/** @brief Sum of m v over all bodies. */
Vector3D totalMomentum(const std::vector<Body>& bodies);
