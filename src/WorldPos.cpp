/**
 * @file WorldPos.cpp
 * @brief Sector/local renormalization and floating-origin deltas.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "WorldPos.h"

#include <cmath>
#include <limits>

namespace {
// Largest double strictly below +S/2.
const double kLocalMax = std::nextafter(kHalfSector, 0.0);

/** @brief Renormalize one axis; in-range values are left untouched so repeated calls are bit-identical. */
inline void normalizeAxis(double& local, int64_t& sector) {
    if (local >= -kHalfSector && local < kHalfSector) return;
    if (!std::isfinite(local)) return;
    double s = std::floor((local + kHalfSector) / kSectorSize);
    local -= s * kSectorSize;
    sector += static_cast<int64_t>(s);
    // Rounding in the subtraction can land on the open end of the range.
    if (local >= kHalfSector) local = kLocalMax;
    else if (local < -kHalfSector) local = -kHalfSector;
}

inline double axisDelta(int64_t sa, double la, int64_t sb, double lb) {
    return static_cast<double>(sb - sa) * kSectorSize + (lb - la);
}
}

void normalize(WorldPos& pos) {
    normalizeAxis(pos.local.x, pos.sector.x);
    normalizeAxis(pos.local.y, pos.sector.y);
    normalizeAxis(pos.local.z, pos.sector.z);
}

WorldPos normalized(WorldPos pos) {
    normalize(pos);
    return pos;
}

void addLocal(WorldPos& pos, const Vector3D& deltaMeters) {
    pos.local += deltaMeters;
    normalize(pos);
}

WorldPos fromMeters(const Vector3D& meters) {
    WorldPos p;
    p.local = meters;
    normalize(p);
    return p;
}

Vector3D delta(const WorldPos& a, const WorldPos& b) {
    return {axisDelta(a.sector.x, a.local.x, b.sector.x, b.local.x),
            axisDelta(a.sector.y, a.local.y, b.sector.y, b.local.y),
            axisDelta(a.sector.z, a.local.z, b.sector.z, b.local.z)};
}

float metersToUnits(double meters) {
    return static_cast<float>(meters * kUnitsPerMeter);
}

Vector3F worldToRender(const WorldPos& object, const WorldPos& camera) {
    Vector3D d = delta(camera, object) * kUnitsPerMeter;
    return {static_cast<float>(d.x), static_cast<float>(d.y), static_cast<float>(d.z)};
}
