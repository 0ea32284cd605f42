#pragma once

/// @file point.hpp
/// @brief A star system as seen by the routing engine.

#include "core/types.hpp"

#include <optional>
#include <string>

namespace starlane::starmap
{
    /// @brief Optional scalar metadata carried by a point.
    struct PointMetadata
    {
        std::optional<i64> region_id;
        std::optional<std::string> region_name;
        std::optional<i64> constellation_id;
        std::optional<std::string> constellation_name;
        std::optional<f64> temperature;   ///< Ambient temperature in Kelvin, precomputed upstream
    };

    /// @brief A node of the routing graph.
    struct Point
    {
        PointId id = 0;
        std::string name;
        std::optional<Vec3d> position;   ///< Light-years; absent for systems without coordinates
        PointMetadata metadata;
    };

} // namespace starlane::starmap
