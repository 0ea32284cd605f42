#pragma once

/// @file route_projection.hpp
/// @brief Per-hop fuel and heat projection along a planned route.

#include "ship/ship.hpp"

#include "core/config.hpp"
#include "core/error.hpp"
#include "core/types.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace starlane::ship
{
    /// @brief One hop as the projection sees it.
    struct ProjectionLeg
    {
        bool spatial = false;                       ///< Gate hops burn no fuel and make no heat
        std::optional<f64> distance;                ///< Light-years
        std::optional<f64> ambient_temperature;     ///< Destination temperature, K
    };

    struct HopProjection
    {
        f64 fuel_cost = 0.0;
        f64 cumulative_fuel = 0.0;
        f64 remaining_fuel = 0.0;
        std::optional<std::string> fuel_warning;    ///< "REFUEL" when the tank would run dry

        std::optional<f64> heat_delta;              ///< Spatial hops only
        std::optional<f64> temperature;             ///< Ambient + delta after the jump
        std::optional<std::string> heat_warning;    ///< "OVERHEATED" or "CRITICAL"
    };

    struct RouteProjection
    {
        std::string ship_name;
        std::vector<HopProjection> hops;
        f64 total_fuel = 0.0;
        f64 final_remaining_fuel = 0.0;
        f64 peak_temperature = 0.0;
        std::vector<std::string> warnings;          ///< Human-readable, one per flagged hop
    };

    struct ProjectionOptions
    {
        bool dynamic_mass = false;   ///< Mass drops as fuel burns
    };

    /// @brief Project fuel use and jump heating hop by hop.
    ///
    /// When a hop costs more than the remaining fuel the tank is refilled to
    /// capacity before the hop and the hop carries a REFUEL warning.
    [[nodiscard]] Result<RouteProjection> project_route(const ShipAttributes& ship,
                                                        const ShipLoadout& loadout,
                                                        std::span<const ProjectionLeg> legs,
                                                        const core::EngineConfig& config,
                                                        const ProjectionOptions& options = {});

} // namespace starlane::ship
