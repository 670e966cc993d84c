#include <gtest/gtest.h>
#include "Gravity.h"
#include "ParallelGravity.h"
#include "Scenario.h"
#include "WorkerPool.h"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <random>
#include <thread>
#include <vector>

static Body makeBody(double mass, const Vector3D& posM, const Vector3D& vel = Vector3D()) {
  Body b;
  b.definition.name = "b";
  b.definition.massKg = mass;
  b.world = fromMeters(posM);
  b.velocity = vel;
  return b;
}

static std::vector<Body> randomCluster(size_t n, uint32_t seed) {
  std::mt19937 rng(seed);
  std::uniform_real_distribution<double> pos(-5e11, 5e11);
  std::uniform_real_distribution<double> mass(1e20, 1e28);
  std::vector<Body> bodies;
  for (size_t i = 0; i < n; ++i) bodies.push_back(makeBody(mass(rng), {pos(rng), pos(rng), pos(rng)}));
  return bodies;
}

static double maxNorm(const std::vector<Vector3D>& v) {
  double m = 0.0;
  for (const auto& a : v) m = std::max(m, a.length());
  return m;
}

TEST(Gravity, TwoBodyAccelerationMatchesNewton) {
  GravityParams params;
  params.softening2 = 0.0;
  const double d = 3.0e9;
  std::vector<Body> bodies = {makeBody(5.0e24, {0, 0, 0}), makeBody(7.0e22, {d, 0, 0})};
  std::vector<Vector3D> acc;
  computeAccelerations(bodies, acc, params);
  ASSERT_EQ(acc.size(), 2u);
  EXPECT_NEAR(acc[0].x, params.G * 7.0e22 / (d * d), 1e-15);
  EXPECT_NEAR(acc[1].x, -params.G * 5.0e24 / (d * d), 1e-13);
  EXPECT_EQ(acc[0].y, 0.0);
  EXPECT_EQ(acc[1].z, 0.0);
}

TEST(Gravity, SofteningBoundsCloseEncounters) {
  GravityParams params;
  params.softening2 = 1.0e8;
  std::vector<Body> bodies = {makeBody(1e24, {0, 0, 0}), makeBody(1e24, {1.0, 0, 0})};
  std::vector<Vector3D> acc;
  computeAccelerations(bodies, acc, params);
  double bound = params.G * 1e24 * 1.0 / std::pow(1.0 + params.softening2, 1.5);
  EXPECT_NEAR(acc[0].x, bound, bound * 1e-12);
  EXPECT_TRUE(std::isfinite(acc[1].x));
}

TEST(Gravity, CoincidentAndMasslessBodiesGiveZero) {
  GravityParams noSoft;
  noSoft.softening2 = 0.0;
  std::vector<Body> same = {makeBody(1e24, {5, 5, 5}), makeBody(1e24, {5, 5, 5})};
  std::vector<Vector3D> acc;
  computeAccelerations(same, acc, noSoft);
  EXPECT_EQ(acc[0], Vector3D());
  EXPECT_EQ(acc[1], Vector3D());

  std::vector<Body> massless = {makeBody(0.0, {0, 0, 0}), makeBody(0.0, {1e9, 0, 0})};
  computeAccelerations(massless, acc, GravityParams());
  EXPECT_EQ(acc[0], Vector3D());
  EXPECT_EQ(acc[1], Vector3D());
}

TEST(Gravity, ForcesAreEqualAndOpposite) {
  GravityParams params;
  auto bodies = randomCluster(12, 5);
  std::vector<Vector3D> acc;
  computeAccelerations(bodies, acc, params);
  Vector3D net;
  double scale = 0.0;
  for (size_t i = 0; i < bodies.size(); ++i) {
    Vector3D f = acc[i] * bodies[i].definition.massKg;
    net += f;
    scale = std::max(scale, f.length());
  }
  EXPECT_LT(net.length(), scale * 1e-12);
}

TEST(Gravity, ResultIndependentOfAbsoluteOrigin) {
  GravityParams params;
  std::vector<Body> nearOrigin = {makeBody(6e24, {0, 0, 0}), makeBody(7e22, {3.844e8, 1.0e7, 0})};
  std::vector<Body> farAway = nearOrigin;
  for (auto& b : farAway) {
    b.world.sector.x += 40000000;
    b.world.sector.z -= 25000000;
  }
  std::vector<Vector3D> a, b;
  computeAccelerations(nearOrigin, a, params);
  computeAccelerations(farAway, b, params);
  for (size_t i = 0; i < a.size(); ++i) {
    EXPECT_DOUBLE_EQ(a[i].x, b[i].x);
    EXPECT_DOUBLE_EQ(a[i].y, b[i].y);
  }
}

TEST(ParallelGravity, MatchesSerialForAnyWorkerCount) {
  GravityParams params;
  std::vector<std::vector<Body>> sets = {makeSolarScenario(params), randomCluster(37, 11), randomCluster(2, 3)};
  for (const auto& bodies : sets) {
    std::vector<Vector3D> serial;
    computeAccelerations(bodies, serial, params);
    const double tol = maxNorm(serial) * 1e-12;
    for (int workers = 1; workers <= 8; ++workers) {
      WorkerPool pool(workers);
      std::vector<Vector3D> parallel;
      computeAccelerationsParallel(pool, bodies, parallel, params);
      ASSERT_EQ(parallel.size(), serial.size());
      for (size_t i = 0; i < serial.size(); ++i) {
        EXPECT_NEAR(parallel[i].x, serial[i].x, tol) << "workers=" << workers << " i=" << i;
        EXPECT_NEAR(parallel[i].y, serial[i].y, tol) << "workers=" << workers << " i=" << i;
        EXPECT_NEAR(parallel[i].z, serial[i].z, tol) << "workers=" << workers << " i=" << i;
      }
    }
  }
}

TEST(ParallelGravity, StepTracksSerialStep) {
  GravityParams params;
  auto serialBodies = makeSolarScenario(params);
  auto parallelBodies = serialBodies;
  std::vector<Vector3D> serialAcc, parallelAcc;
  WorkerPool pool(3);
  for (int s = 0; s < 500; ++s) {
    stepVelocityVerlet(serialBodies, serialAcc, 600.0, params);
    stepVelocityVerletParallel(pool, parallelBodies, parallelAcc, 600.0, params);
  }
  for (size_t i = 0; i < serialBodies.size(); ++i) {
    Vector3D gap = delta(serialBodies[i].world, parallelBodies[i].world);
    EXPECT_LT(gap.length(), 1.0) << serialBodies[i].definition.name;
    EXPECT_NEAR(serialBodies[i].velocity.x, parallelBodies[i].velocity.x, 1e-6);
    EXPECT_NEAR(serialBodies[i].velocity.z, parallelBodies[i].velocity.z, 1e-6);
  }
}

TEST(ParallelGravity, ShutDownPoolFallsBackToSerial) {
  GravityParams params;
  auto bodies = randomCluster(9, 21);
  WorkerPool pool(4);
  pool.shutdown();
  std::vector<Vector3D> serial, parallel;
  computeAccelerations(bodies, serial, params);
  computeAccelerationsParallel(pool, bodies, parallel, params);
  for (size_t i = 0; i < bodies.size(); ++i) EXPECT_EQ(serial[i], parallel[i]);
}

TEST(ParallelGravity, AccelerationsStayCorrectWhilePoolIsResizedAndShutDown) {
  GravityParams params;
  auto bodies = randomCluster(29, 5);
  std::vector<Vector3D> serial;
  computeAccelerations(bodies, serial, params);
  const double tol = maxNorm(serial) * 1e-12;
  WorkerPool pool(4);
  std::atomic<bool> stop{false};
  std::thread resizer([&]{
    int count = 2;
    while (!stop.load()) {
      pool.setWorkerCount(count);
      count = count % 5 + 2;
      std::this_thread::yield();
    }
    pool.shutdown();
  });
  double worst = 0.0;
  for (int round = 0; round < 200; ++round) {
    if (round == 120) stop.store(true);
    std::vector<Vector3D> acc;
    computeAccelerationsParallel(pool, bodies, acc, params);
    if (acc.size() != serial.size()) { worst = HUGE_VAL; continue; }
    for (size_t i = 0; i < serial.size(); ++i) worst = std::max(worst, (acc[i] - serial[i]).length());
  }
  resizer.join();
  EXPECT_LE(worst, tol * 2.0);
  EXPECT_TRUE(pool.isShutdown());
}

TEST(InitCircularPair, SetsCircularSpeedAndKeepsMomentum) {
  GravityParams params;
  std::vector<Body> bodies = {makeBody(2e30, {0, 0, 0}, {10, 0, 5}), makeBody(6e24, {1.5e11, 0, 0}, {10, 0, 5})};
  Vector3D before = totalMomentum(bodies);
  ASSERT_TRUE(initCircularPair(bodies, 0, 1, kOrbitNormal, +1.0, params));
  Vector3D after = totalMomentum(bodies);
  EXPECT_LT((after - before).length(), before.length() * 1e-12 + 1e10);

  Vector3D rel = bodies[1].velocity - bodies[0].velocity;
  double expected = std::sqrt(params.G * (2e30 + 6e24) / 1.5e11);
  EXPECT_NEAR(rel.length(), expected, expected * 1e-12);
  EXPECT_NEAR(rel.x, 0.0, 1e-9);
  // Tangential: +y normal crossed with +x gives -z.
  EXPECT_LT(rel.z, 0.0);
}

TEST(InitCircularPair, DirectionSignReversesOrbit) {
  GravityParams params;
  std::vector<Body> bodies = {makeBody(2e30, {0, 0, 0}), makeBody(6e24, {1.5e11, 0, 0})};
  ASSERT_TRUE(initCircularPair(bodies, 0, 1, kOrbitNormal, -1.0, params));
  EXPECT_GT(bodies[1].velocity.z, 0.0);
  EXPECT_LT(bodies[0].velocity.z, 0.0);
}

TEST(InitCircularPair, DegenerateInputsAreNoOps) {
  GravityParams params;
  std::vector<Body> same = {makeBody(1e24, {1, 2, 3}), makeBody(1e22, {1, 2, 3}, {4, 5, 6})};
  EXPECT_FALSE(initCircularPair(same, 0, 1, kOrbitNormal, 1.0, params));
  EXPECT_EQ(same[1].velocity, Vector3D(4, 5, 6));

  std::vector<Body> massless = {makeBody(0.0, {0, 0, 0}), makeBody(0.0, {1e9, 0, 0})};
  EXPECT_FALSE(initCircularPair(massless, 0, 1, kOrbitNormal, 1.0, params));
  EXPECT_EQ(massless[1].velocity, Vector3D());

  std::vector<Body> alongNormal = {makeBody(1e24, {0, 0, 0}), makeBody(1e22, {0, 1e9, 0})};
  EXPECT_FALSE(initCircularPair(alongNormal, 0, 1, kOrbitNormal, 1.0, params));
  EXPECT_EQ(alongNormal[1].velocity, Vector3D());

  EXPECT_FALSE(initCircularPair(alongNormal, 0, 5, kOrbitNormal, 1.0, params));
  EXPECT_FALSE(initCircularPair(alongNormal, 1, 1, kOrbitNormal, 1.0, params));
}

static void expectOrbitCloses(bool parallel) {
  GravityParams params;
  const double m1 = 1.98847e30, m2 = 5.9722e24, r = 1.496e11;
  std::vector<Body> bodies = {makeBody(m1, {0, 0, 0}), makeBody(m2, {r, 0, 0})};
  ASSERT_TRUE(initCircularPair(bodies, 0, 1, kOrbitNormal, +1.0, params));
  const Vector3D start = delta(bodies[0].world, bodies[1].world);
  const double pi = 3.14159265358979323846;
  const double period = 2.0 * pi * std::sqrt(r * r * r / (params.G * (m1 + m2)));
  const int steps = 10000;
  const double dt = period / steps;

  WorkerPool pool(2);
  std::vector<Vector3D> acc;
  double minSep = r, maxSep = r;
  for (int s = 0; s < steps; ++s) {
    if (parallel) stepVelocityVerletParallel(pool, bodies, acc, dt, params);
    else stepVelocityVerlet(bodies, acc, dt, params);
    double sep = delta(bodies[0].world, bodies[1].world).length();
    minSep = std::min(minSep, sep);
    maxSep = std::max(maxSep, sep);
  }
  const Vector3D end = delta(bodies[0].world, bodies[1].world);
  EXPECT_LT((end - start).length(), 0.01 * r);
  // Circular: the separation never wanders.
  EXPECT_GT(minSep, 0.999 * r);
  EXPECT_LT(maxSep, 1.001 * r);
}

TEST(VelocityVerlet, CircularOrbitReturnsAfterOnePeriod) {
  expectOrbitCloses(false);
}

TEST(VelocityVerlet, CircularOrbitReturnsAfterOnePeriodOnPool) {
  expectOrbitCloses(true);
}

TEST(VelocityVerlet, ConservesEnergyAndMomentumOverAYear) {
  GravityParams params;
  auto bodies = makeSolarScenario(params);
  const double e0 = totalEnergy(bodies, params);
  const Vector3D p0 = totalMomentum(bodies);
  const double earthMomentum = bodies[1].definition.massKg * bodies[1].velocity.length();
  WorkerPool pool(3);
  std::vector<Vector3D> acc;
  const double year = 365.25 * 86400.0;
  const double dt = 600.0;
  for (double t = 0.0; t < year; t += dt) stepVelocityVerletParallel(pool, bodies, acc, dt, params);
  const double e1 = totalEnergy(bodies, params);
  EXPECT_LT(std::fabs((e1 - e0) / e0), 1e-6);
  EXPECT_LT((totalMomentum(bodies) - p0).length(), earthMomentum * 1e-9);
}

TEST(VelocityVerlet, EmptyBodySetIsANoOp) {
  std::vector<Body> none;
  std::vector<Vector3D> acc;
  stepVelocityVerlet(none, acc, 10.0, GravityParams());
  WorkerPool pool(2);
  stepVelocityVerletParallel(pool, none, acc, 10.0, GravityParams());
  EXPECT_TRUE(acc.empty());
}
