/// @file route_projection.cpp
/// @brief Fuel and heat projection along a route.

#include "ship/route_projection.hpp"

#include "core/logger.hpp"

#include <algorithm>

namespace starlane::ship
{

Result<RouteProjection> project_route(const ShipAttributes& ship,
                                      const ShipLoadout& loadout,
                                      std::span<const ProjectionLeg> legs,
                                      const core::EngineConfig& config,
                                      const ProjectionOptions& options)
{
    if (auto valid = ship.validate(); !valid)
    {
        return valid.error();
    }
    if (auto checked = ShipLoadout::create(ship, loadout.fuel_load, loadout.cargo_mass_kg); !checked)
    {
        return checked.error();
    }

    RouteProjection projection;
    projection.ship_name = ship.name;
    projection.hops.reserve(legs.size());

    f64 fuel = loadout.fuel_load;
    f64 cumulative = 0.0;

    for (std::size_t i = 0; i < legs.size(); ++i)
    {
        const auto& leg = legs[i];
        HopProjection hop;

        if (!leg.spatial)
        {
            hop.cumulative_fuel = cumulative;
            hop.remaining_fuel = fuel;
            projection.hops.push_back(std::move(hop));
            continue;
        }

        if (!leg.distance)
        {
            return Error::ship_data("spatial hop " + std::to_string(i + 1) + " has no distance");
        }

        const f64 fuel_for_mass = options.dynamic_mass ? fuel : loadout.fuel_load;
        const f64 mass = ship.base_mass_kg + loadout.cargo_mass_kg +
                         fuel_for_mass * routing_constants::kFuelMassPerUnitKg;

        // ---- Fuel ----
        const auto cost = calculate_jump_fuel_cost(mass, *leg.distance, config.fuel_quality);
        if (!cost)
        {
            return cost.error();
        }
        hop.fuel_cost = *cost;
        cumulative += *cost;
        hop.cumulative_fuel = cumulative;

        if (*cost > fuel)
        {
            hop.fuel_warning = "REFUEL";
            projection.warnings.push_back("hop " + std::to_string(i + 1) +
                                          ": REFUEL before jumping");
            fuel = ship.fuel_capacity;
        }
        fuel = std::max(fuel - *cost, 0.0);
        hop.remaining_fuel = fuel;

        // ---- Heat ----
        const auto energy = calculate_jump_heat(mass, *leg.distance, ship.base_mass_kg,
                                                config.heat_calibration_constant);
        if (!energy)
        {
            return energy.error();
        }
        const f64 delta = *energy / (mass * ship.specific_heat);
        const f64 temperature = leg.ambient_temperature.value_or(0.0) + delta;
        hop.heat_delta = delta;
        hop.temperature = temperature;
        projection.peak_temperature = std::max(projection.peak_temperature, temperature);

        if (temperature >= config.heat_critical_threshold)
        {
            hop.heat_warning = "CRITICAL";
        }
        else if (temperature >= config.heat_overheated_threshold)
        {
            hop.heat_warning = "OVERHEATED";
        }
        if (hop.heat_warning)
        {
            projection.warnings.push_back("hop " + std::to_string(i + 1) + ": " + *hop.heat_warning +
                                          " (" + std::to_string(temperature) + " K)");
        }

        projection.hops.push_back(std::move(hop));
    }

    projection.total_fuel = cumulative;
    projection.final_remaining_fuel = fuel;

    SL_CORE_DEBUG("RouteProjection: {} hops, {:.3f} fuel, peak {:.1f} K, {} warnings",
                  projection.hops.size(), projection.total_fuel, projection.peak_temperature,
                  projection.warnings.size());
    return projection;
}

} // namespace starlane::ship
