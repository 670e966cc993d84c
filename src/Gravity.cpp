/**
 * @file Gravity.cpp
 * @brief Serial force kernel, kick/drift kernels, Velocity-Verlet and circular-orbit setup.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Gravity.h"
#include "Logger.h"

#include <algorithm>
#include <cmath>
#include <string>

void accumulatePairForces(const std::vector<Body>& bodies, size_t begin, size_t end,
                          std::vector<Vector3D>& acc, const GravityParams& params) {
    const size_t n = bodies.size();
    end = std::min(end, n);
    for (size_t i = begin; i < end; ++i) {
        const Body& bi = bodies[i];
        for (size_t j = i + 1; j < n; ++j) {
            const Body& bj = bodies[j];
            Vector3D r = delta(bi.world, bj.world);
            double r2 = r.lengthSquared() + params.softening2;
            if (r2 <= 0.0) continue;
            double invr = 1.0 / std::sqrt(r2);
            double f = params.G * invr * invr * invr;
            acc[i] += r * (f * bj.definition.massKg);
            acc[j] -= r * (f * bi.definition.massKg);
        }
    }
}

void computeAccelerations(const std::vector<Body>& bodies, std::vector<Vector3D>& outAcc,
                          const GravityParams& params) {
    outAcc.assign(bodies.size(), Vector3D{});
    accumulatePairForces(bodies, 0, bodies.size(), outAcc, params);
}

void kickDrift(std::vector<Body>& bodies, const std::vector<Vector3D>& acc, size_t begin, size_t end, double dt) {
    const double half = 0.5 * dt;
    for (size_t i = begin; i < end; ++i) {
        Body& b = bodies[i];
        b.velocity += acc[i] * half;
        addLocal(b.world, b.velocity * dt);
    }
}

void kick(std::vector<Body>& bodies, const std::vector<Vector3D>& acc, size_t begin, size_t end, double dt) {
    const double half = 0.5 * dt;
    for (size_t i = begin; i < end; ++i) bodies[i].velocity += acc[i] * half;
}

void stepVelocityVerlet(std::vector<Body>& bodies, std::vector<Vector3D>& acc, double dt,
                        const GravityParams& params) {
    const size_t n = bodies.size();
    if (n == 0) return;
    if (acc.size() != n) computeAccelerations(bodies, acc, params);
    kickDrift(bodies, acc, 0, n, dt);
    computeAccelerations(bodies, acc, params);
    kick(bodies, acc, 0, n, dt);
}

bool initCircularPair(std::vector<Body>& bodies, size_t primary, size_t satellite,
                      const Vector3D& planeNormal, double directionSign, const GravityParams& params) {
    if (primary >= bodies.size() || satellite >= bodies.size() || primary == satellite) return false;
    Body& p = bodies[primary];
    Body& s = bodies[satellite];
    const double m1 = p.definition.massKg;
    const double m2 = s.definition.massKg;
    const double mt = m1 + m2;
    Vector3D r = delta(p.world, s.world);
    const double dist = r.length();
    if (!(mt > 0.0) || !(dist > 0.0)) {
        Logger::debug("initCircularPair: degenerate pair " + p.definition.name + "/" + s.definition.name);
        return false;
    }
    Vector3D dir = planeNormal.cross(r / dist).normalized();
    if (dir.lengthSquared() == 0.0) {
        Logger::debug("initCircularPair: plane normal parallel to separation for " + s.definition.name);
        return false;
    }
    dir *= (directionSign < 0.0 ? -1.0 : 1.0);
    const double v = std::sqrt(params.G * mt / dist);
    p.velocity -= dir * (v * m2 / mt);
    s.velocity += dir * (v * m1 / mt);
    Logger::info("circular orbit " + s.definition.name + " around " + p.definition.name +
                 ": v=" + std::to_string(v) + " m/s r=" + std::to_string(dist) + " m");
    return true;
}

double totalEnergy(const std::vector<Body>& bodies, const GravityParams& params) {
    double kinetic = 0.0;
    double potential = 0.0;
    const size_t n = bodies.size();
    for (size_t i = 0; i < n; ++i) {
        kinetic += 0.5 * bodies[i].definition.massKg * bodies[i].velocity.lengthSquared();
        for (size_t j = i + 1; j < n; ++j) {
            double r2 = delta(bodies[i].world, bodies[j].world).lengthSquared() + params.softening2;
            if (r2 <= 0.0) continue;
            potential -= params.G * bodies[i].definition.massKg * bodies[j].definition.massKg / std::sqrt(r2);
        }
    }
    return kinetic + potential;
}

Vector3D totalMomentum(const std::vector<Body>& bodies) {
    Vector3D p;
    for (const auto& b : bodies) p += b.velocity * b.definition.massKg;
    return p;
}
