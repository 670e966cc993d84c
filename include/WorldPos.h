/**
 * @file WorldPos.h
 * @brief Floating-origin world coordinates: an integer sector plus a bounded double-precision local offset.
 *
 * Absolute distances at planetary scale exceed what a double can hold with sub-meter precision. A WorldPos
 * splits a position into a coarse integer cell (Sector3, edge kSectorSize meters) and a local offset that is
 * kept inside [-kSectorSize/2, +kSectorSize/2) on every axis. Differences between positions are formed in the
 * integer domain first, so only the small local difference is subject to rounding.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Vector3D.h"

#include <cstdint>

/** @brief Edge length of one sector in meters. */
constexpr double kSectorSize = 1.0e9;
/** @brief Half a sector; local coordinates live in [-kHalfSector, +kHalfSector). */
constexpr double kHalfSector = kSectorSize * 0.5;
/** @brief Render units per meter (1 unit = 1000 km). */
constexpr double kUnitsPerMeter = 1.0e-6;

struct Sector3 {
    int64_t x{0};
    int64_t y{0};
    int64_t z{0};

    bool operator==(const Sector3& o) const { return x == o.x && y == o.y && z == o.z; }
    bool operator!=(const Sector3& o) const { return !(*this == o); }
};

struct WorldPos {
    Sector3 sector;
    Vector3D local; // meters, bounded per axis

    bool operator==(const WorldPos& o) const { return sector == o.sector && local == o.local; }
    bool operator!=(const WorldPos& o) const { return !(*this == o); }
};

/** @brief Single-precision vector handed to renderers. */
struct Vector3F {
    float x{0.0f};
    float y{0.0f};
    float z{0.0f};
};

/** @brief Move whole sectors out of @p pos.local until every axis lies in [-S/2, S/2). Idempotent. */
void normalize(WorldPos& pos);
/** @brief Return a normalized copy of @p pos. */
WorldPos normalized(WorldPos pos);
/** @brief Translate @p pos by @p deltaMeters and renormalize. The only sanctioned way to move a WorldPos. */
void addLocal(WorldPos& pos, const Vector3D& deltaMeters);
/** @brief Build a normalized WorldPos from an absolute position in meters. */
WorldPos fromMeters(const Vector3D& meters);
/** @brief Vector from @p a to @p b in meters; sector difference is taken in int64 before scaling. */
Vector3D delta(const WorldPos& a, const WorldPos& b);
/** @brief Scale meters to render units, narrowing to float. */
float metersToUnits(double meters);
/** @brief Position of @p object relative to @p camera in render units (float only at this boundary). */
Vector3F worldToRender(const WorldPos& object, const WorldPos& camera);
