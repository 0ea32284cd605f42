/// @file ship.cpp
/// @brief Ship validation and the jump heat/fuel formulas.

#include "ship/ship.hpp"

#include <cmath>
#include <string>

namespace starlane::ship
{

namespace
{

bool positive_finite(f64 v)
{
    return std::isfinite(v) && v > 0.0;
}

bool non_negative_finite(f64 v)
{
    return std::isfinite(v) && v >= 0.0;
}

} // namespace

// -----------------------------------------------------------------
// ShipAttributes / ShipLoadout
// -----------------------------------------------------------------

Result<void> ShipAttributes::validate() const
{
    if (name.find_first_not_of(" \t\r\n") == std::string::npos)
    {
        return Error::ship_data("ship name must not be empty");
    }

    const std::pair<f64, const char*> fields[] = {
        {base_mass_kg, "base_mass_kg"},
        {specific_heat, "specific_heat"},
        {fuel_capacity, "fuel_capacity"},
        {cargo_capacity, "cargo_capacity"},
    };
    for (const auto& [value, field] : fields)
    {
        if (!positive_finite(value))
        {
            return Error::ship_data(std::string(field) + " must be a finite positive number");
        }
    }
    return {};
}

Result<ShipLoadout> ShipLoadout::create(const ShipAttributes& ship, f64 fuel_load, f64 cargo_mass_kg)
{
    if (!non_negative_finite(fuel_load))
    {
        return Error::ship_data("fuel_load must be finite and non-negative");
    }
    if (fuel_load > ship.fuel_capacity)
    {
        return Error::ship_data("fuel_load exceeds ship fuel_capacity");
    }
    if (!non_negative_finite(cargo_mass_kg))
    {
        return Error::ship_data("cargo_mass_kg must be finite and non-negative");
    }
    return ShipLoadout{.fuel_load = fuel_load, .cargo_mass_kg = cargo_mass_kg};
}

ShipLoadout ShipLoadout::full_fuel(const ShipAttributes& ship)
{
    return ShipLoadout{.fuel_load = ship.fuel_capacity, .cargo_mass_kg = 0.0};
}

f64 ShipLoadout::total_mass_kg(const ShipAttributes& ship) const
{
    return ship.base_mass_kg + fuel_load * routing_constants::kFuelMassPerUnitKg + cargo_mass_kg;
}

// -----------------------------------------------------------------
// Heat
// -----------------------------------------------------------------

Result<f64> calculate_jump_heat(f64 total_mass_kg, f64 distance_ly,
                                f64 hull_mass_kg, f64 calibration_constant)
{
    if (!non_negative_finite(distance_ly))
    {
        return Error::heat_calculation("distance must be finite and non-negative, got " +
                                       std::to_string(distance_ly));
    }
    if (!positive_finite(total_mass_kg))
    {
        return Error::heat_calculation("total_mass_kg must be finite and positive, got " +
                                       std::to_string(total_mass_kg));
    }
    if (!positive_finite(hull_mass_kg))
    {
        return Error::heat_calculation("hull_mass_kg must be finite and positive, got " +
                                       std::to_string(hull_mass_kg));
    }
    if (!positive_finite(calibration_constant))
    {
        return Error::heat_calculation("calibration_constant must be finite and positive, got " +
                                       std::to_string(calibration_constant));
    }

    if (distance_ly == 0.0)
    {
        return 0.0;
    }

    const f64 heat = (3.0 * total_mass_kg * distance_ly) / (calibration_constant * hull_mass_kg);
    if (!non_negative_finite(heat))
    {
        return Error::heat_calculation("calculated heat must be finite and non-negative");
    }
    return heat;
}

Result<LoadoutHeatModel> LoadoutHeatModel::create(const ShipAttributes& ship,
                                                  const ShipLoadout& loadout,
                                                  const core::EngineConfig& config)
{
    if (auto valid = ship.validate(); !valid)
    {
        return valid.error();
    }
    if (auto checked = ShipLoadout::create(ship, loadout.fuel_load, loadout.cargo_mass_kg); !checked)
    {
        return checked.error();
    }
    return LoadoutHeatModel(ship, loadout, config.heat_calibration_constant,
                            config.heat_critical_threshold);
}

Result<f64> LoadoutHeatModel::heat_delta(f64 current_mass, f64 hull_mass,
                                         f64 distance_ly, f64 calibration) const
{
    const auto energy = calculate_jump_heat(current_mass, distance_ly, hull_mass, calibration);
    if (!energy)
    {
        return energy.error();
    }

    const f64 delta = *energy / (current_mass * m_ship.specific_heat);
    if (!non_negative_finite(delta))
    {
        return Error::heat_calculation("temperature rise must be finite and non-negative");
    }
    return delta;
}

// -----------------------------------------------------------------
// Fuel
// -----------------------------------------------------------------

Result<f64> calculate_jump_fuel_cost(f64 total_mass_kg, f64 distance_ly, f64 fuel_quality)
{
    if (!positive_finite(distance_ly))
    {
        return Error::ship_data("distance must be finite and positive, got " +
                                std::to_string(distance_ly));
    }
    if (!positive_finite(total_mass_kg))
    {
        return Error::ship_data("total_mass_kg must be finite and positive, got " +
                                std::to_string(total_mass_kg));
    }
    if (!std::isfinite(fuel_quality) || fuel_quality < 1.0 || fuel_quality > 100.0)
    {
        return Error::ship_data("fuel_quality must be between 1 and 100, got " +
                                std::to_string(fuel_quality));
    }

    const f64 mass_factor = total_mass_kg / routing_constants::kFuelMassDistanceConversion;
    const f64 quality_factor = fuel_quality / 100.0;
    return mass_factor * quality_factor * distance_ly;
}

} // namespace starlane::ship
