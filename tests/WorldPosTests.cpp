#include <gtest/gtest.h>
#include "WorldPos.h"

#include <cmath>
#include <cstring>
#include <random>
#include <vector>

static bool bitwiseEqual(const WorldPos& a, const WorldPos& b) {
  return a.sector == b.sector &&
         std::memcmp(&a.local.x, &b.local.x, sizeof(double)) == 0 &&
         std::memcmp(&a.local.y, &b.local.y, sizeof(double)) == 0 &&
         std::memcmp(&a.local.z, &b.local.z, sizeof(double)) == 0;
}

static bool inRange(double v) { return v >= -kHalfSector && v < kHalfSector; }

static std::vector<double> interestingValues() {
  std::vector<double> v = {
    0.0, -0.0, 1.0, -1.0,
    kHalfSector, -kHalfSector,
    std::nextafter(kHalfSector, 0.0), std::nextafter(kHalfSector, 1e30),
    std::nextafter(-kHalfSector, 0.0), std::nextafter(-kHalfSector, -1e30),
    kSectorSize, -kSectorSize, 1.5 * kSectorSize, -1.5 * kSectorSize,
    1.496e11, -1.496e11, 3.844e8, 1e15 + 0.25, -7.3e14, 4.5e12
  };
  std::mt19937 rng(1234);
  std::uniform_real_distribution<double> wide(-1e13, 1e13);
  std::uniform_real_distribution<double> narrow(-3e9, 3e9);
  for (int i = 0; i < 200; ++i) { v.push_back(wide(rng)); v.push_back(narrow(rng)); }
  return v;
}

TEST(WorldPos, NormalizeKeepsLocalInHalfOpenRange) {
  auto vals = interestingValues();
  for (size_t i = 0; i < vals.size(); ++i) {
    WorldPos p;
    p.local = {vals[i], vals[(i + 7) % vals.size()], vals[(i + 13) % vals.size()]};
    normalize(p);
    EXPECT_TRUE(inRange(p.local.x)) << p.local.x;
    EXPECT_TRUE(inRange(p.local.y)) << p.local.y;
    EXPECT_TRUE(inRange(p.local.z)) << p.local.z;
  }
}

TEST(WorldPos, NormalizeIsIdempotentBitForBit) {
  auto vals = interestingValues();
  for (size_t i = 0; i < vals.size(); ++i) {
    WorldPos p;
    p.sector = {(int64_t)i - 50, 3, -9};
    p.local = {vals[i], vals[(i + 3) % vals.size()], vals[(i + 11) % vals.size()]};
    WorldPos once = normalized(p);
    WorldPos twice = normalized(once);
    EXPECT_TRUE(bitwiseEqual(once, twice)) << "value " << vals[i];
  }
}

TEST(WorldPos, NormalizePreservesAbsolutePosition) {
  WorldPos p;
  p.local = {1.496e11, -2.5e9, 7.0};
  WorldPos origin;
  Vector3D before = delta(origin, p);
  normalize(p);
  Vector3D after = delta(origin, p);
  EXPECT_DOUBLE_EQ(before.x, after.x);
  EXPECT_DOUBLE_EQ(before.y, after.y);
  EXPECT_DOUBLE_EQ(before.z, after.z);
  EXPECT_EQ(p.sector.x, 150);
  EXPECT_EQ(p.sector.y, -2);
  EXPECT_EQ(p.sector.z, 0);
}

TEST(WorldPos, BoundaryValues) {
  WorldPos lower;
  lower.local = {-kHalfSector, 0.0, 0.0};
  normalize(lower);
  EXPECT_EQ(lower.sector.x, 0);
  EXPECT_EQ(lower.local.x, -kHalfSector);

  WorldPos upper;
  upper.local = {kHalfSector, 0.0, 0.0};
  normalize(upper);
  EXPECT_EQ(upper.sector.x, 1);
  EXPECT_EQ(upper.local.x, -kHalfSector);

  WorldPos below;
  below.local = {std::nextafter(-kHalfSector, -1e30), 0.0, 0.0};
  normalize(below);
  EXPECT_EQ(below.sector.x, -1);
  EXPECT_TRUE(inRange(below.local.x));
  EXPECT_GT(below.local.x, 0.0);
}

TEST(WorldPos, LargeOffsetMovesWholeSectors) {
  WorldPos p;
  p.local = {1e15 + 0.25, 0.0, 0.0};
  normalize(p);
  EXPECT_EQ(p.sector.x, 1000000);
  EXPECT_EQ(p.local.x, 0.25);
}

TEST(WorldPos, AddLocalRenormalizes) {
  WorldPos p = fromMeters({4.9e8, 0.0, 0.0});
  EXPECT_EQ(p.sector.x, 0);
  addLocal(p, {2.0e7, -6.0e8, 0.0});
  EXPECT_EQ(p.sector.x, 1);
  EXPECT_EQ(p.sector.y, -1);
  EXPECT_TRUE(inRange(p.local.x));
  EXPECT_TRUE(inRange(p.local.y));
  Vector3D abs = delta(WorldPos{}, p);
  EXPECT_DOUBLE_EQ(abs.x, 5.1e8);
  EXPECT_DOUBLE_EQ(abs.y, -6.0e8);
}

TEST(WorldPos, DeltaIsAdditive) {
  std::mt19937 rng(99);
  std::uniform_int_distribution<int64_t> sec(-100000, 100000);
  std::uniform_real_distribution<double> loc(-kHalfSector, kHalfSector);
  auto randomPos = [&]{
    WorldPos p;
    p.sector = {sec(rng), sec(rng), sec(rng)};
    p.local = {loc(rng), loc(rng), loc(rng)};
    normalize(p);
    return p;
  };
  for (int i = 0; i < 500; ++i) {
    WorldPos a = randomPos(), b = randomPos(), c = randomPos();
    Vector3D lhs = delta(a, b) + delta(b, c);
    Vector3D rhs = delta(a, c);
    double scale = std::max(1.0, rhs.length());
    EXPECT_LT((lhs - rhs).length() / scale, 1e-6);
  }
}

TEST(WorldPos, DeltaIsExactFarFromOrigin) {
  // Two points a meter apart, 1e17 m from the global origin.
  WorldPos a;
  a.sector = {100000000, -100000000, 42};
  a.local = {0.125, 0.0, -3.0};
  WorldPos b = a;
  addLocal(b, {1.0, 0.0, 0.0});
  Vector3D d = delta(a, b);
  EXPECT_EQ(d.x, 1.0);
  EXPECT_EQ(d.y, 0.0);
  EXPECT_EQ(d.z, 0.0);
}

TEST(WorldPos, DeltaAcrossSectorBoundary) {
  WorldPos a = fromMeters({kHalfSector - 0.5, 0.0, 0.0});
  WorldPos b = fromMeters({kHalfSector + 0.5, 0.0, 0.0});
  EXPECT_NE(a.sector, b.sector);
  EXPECT_DOUBLE_EQ(delta(a, b).x, 1.0);
  EXPECT_DOUBLE_EQ(delta(b, a).x, -1.0);
}

TEST(WorldPos, WorldToRenderIsCameraRelative) {
  WorldPos camera;
  camera.sector = {5000, 0, -5000};
  camera.local = {10.0, 20.0, 30.0};
  WorldPos obj = camera;
  addLocal(obj, {2.0e6, 0.0, -3.0e6});
  Vector3F r = worldToRender(obj, camera);
  EXPECT_FLOAT_EQ(r.x, 2.0f);
  EXPECT_FLOAT_EQ(r.y, 0.0f);
  EXPECT_FLOAT_EQ(r.z, -3.0f);
  EXPECT_FLOAT_EQ(metersToUnits(1.0e6), 1.0f);
}
