#pragma once

/// @file ship.hpp
/// @brief Ship attributes, loadouts, and the jump heat/fuel models.

#include "core/config.hpp"
#include "core/error.hpp"
#include "core/types.hpp"

#include <string>
#include <utility>

namespace starlane::ship
{
    /// @brief Static properties of a hull.
    struct ShipAttributes
    {
        std::string name;
        f64 base_mass_kg = 0.0;
        f64 specific_heat = 0.0;    ///< J/(kg*K)
        f64 fuel_capacity = 0.0;    ///< Fuel units
        f64 cargo_capacity = 0.0;

        /// @brief Reject empty names and non-positive or non-finite quantities.
        [[nodiscard]] Result<void> validate() const;
    };

    /// @brief Mutable payload carried by a ship.
    struct ShipLoadout
    {
        f64 fuel_load = 0.0;
        f64 cargo_mass_kg = 0.0;

        /// @brief Validated loadout: fuel within [0, capacity], cargo non-negative.
        [[nodiscard]] static Result<ShipLoadout> create(const ShipAttributes& ship,
                                                        f64 fuel_load, f64 cargo_mass_kg);

        /// @brief Full tank, no cargo.
        [[nodiscard]] static ShipLoadout full_fuel(const ShipAttributes& ship);

        /// @brief Hull + fuel + cargo mass.
        [[nodiscard]] f64 total_mass_kg(const ShipAttributes& ship) const;
    };

    /// @brief Thermal energy of one jump: 3 * mass * distance / (calibration * hull_mass).
    ///
    /// A zero distance yields zero. Non-finite or out-of-range inputs fail with
    /// ErrorKind::HeatCalculation.
    [[nodiscard]] Result<f64> calculate_jump_heat(f64 total_mass_kg, f64 distance_ly,
                                                  f64 hull_mass_kg, f64 calibration_constant);

    /// @brief Fuel burned by one jump: (mass / 100000) * (quality / 100) * distance.
    [[nodiscard]] Result<f64> calculate_jump_fuel_cost(f64 total_mass_kg, f64 distance_ly,
                                                       f64 fuel_quality);

    /// @brief Ship-side collaborator consulted by the critical-heat rule.
    class HeatModel
    {
    public:
        virtual ~HeatModel() = default;

        [[nodiscard]] virtual f64 current_mass_kg() const = 0;
        [[nodiscard]] virtual f64 hull_mass_kg() const = 0;
        [[nodiscard]] virtual f64 calibration_constant() const = 0;

        /// @brief Temperature (K) at or above which a jump is refused.
        [[nodiscard]] virtual f64 critical_threshold() const = 0;

        /// @brief Temperature rise (K) caused by a jump of `distance_ly`.
        [[nodiscard]] virtual Result<f64> heat_delta(f64 current_mass, f64 hull_mass,
                                                     f64 distance_ly, f64 calibration) const = 0;
    };

    /// @brief HeatModel backed by ship attributes, a loadout, and engine thresholds.
    class LoadoutHeatModel final : public HeatModel
    {
    public:
        [[nodiscard]] static Result<LoadoutHeatModel> create(const ShipAttributes& ship,
                                                             const ShipLoadout& loadout,
                                                             const core::EngineConfig& config);

        [[nodiscard]] f64 current_mass_kg() const override { return m_loadout.total_mass_kg(m_ship); }
        [[nodiscard]] f64 hull_mass_kg() const override { return m_ship.base_mass_kg; }
        [[nodiscard]] f64 calibration_constant() const override { return m_calibration; }
        [[nodiscard]] f64 critical_threshold() const override { return m_critical; }

        /// @brief delta-T = energy / (mass * specific_heat).
        [[nodiscard]] Result<f64> heat_delta(f64 current_mass, f64 hull_mass,
                                             f64 distance_ly, f64 calibration) const override;

        [[nodiscard]] const ShipAttributes& ship() const { return m_ship; }
        [[nodiscard]] const ShipLoadout& loadout() const { return m_loadout; }

    private:
        LoadoutHeatModel(ShipAttributes ship, ShipLoadout loadout, f64 calibration, f64 critical)
            : m_ship(std::move(ship)), m_loadout(loadout), m_calibration(calibration), m_critical(critical) {}

        ShipAttributes m_ship;
        ShipLoadout m_loadout;
        f64 m_calibration;
        f64 m_critical;
    };

} // namespace starlane::ship
