#pragma once

/// @file types.hpp
/// @brief Precision aliases, vector types and routing constants shared by every module.

#include <glm/glm.hpp>

#include <array>
#include <cstddef>
#include <cstdint>

namespace starlane
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u8  = uint8_t;
    using u16 = uint16_t;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // Vector types (double precision; coordinates are light-years)
    using Vec3d = glm::dvec3;
    using Vec3f = glm::vec3;

    /// @brief Stable identity of a star system within a point-set.
    using PointId = i64;

    /// @brief Raw SHA-256 digest.
    using Sha256Digest = std::array<u8, 32>;

    /// @brief Euclidean distance between two positions.
    [[nodiscard]] inline f64 distance_between(const Vec3d& a, const Vec3d& b)
    {
        return glm::distance(a, b);
    }

    /// @brief Squared Euclidean distance (no sqrt; used by the spatial index).
    [[nodiscard]] inline f64 distance_squared(const Vec3d& a, const Vec3d& b)
    {
        const Vec3d d = a - b;
        return glm::dot(d, d);
    }

    // Routing constants
    namespace routing_constants
    {
        constexpr std::size_t kDefaultSpatialNeighbours = 12;   // max gate fan-out in the dataset
        constexpr f64 kDefaultHeatCalibration           = 1e-7;
        constexpr f64 kHeatNominal                      = 30.0;  // K
        constexpr f64 kHeatOverheated                   = 90.0;  // K
        constexpr f64 kHeatCritical                     = 150.0; // K
        constexpr f64 kFuelMassPerUnitKg                = 1.0;
        constexpr f64 kFuelMassDistanceConversion       = 100000.0;
        constexpr f64 kDefaultFuelQuality               = 10.0;
    }
}
