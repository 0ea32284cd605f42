/// @file test_ship.cpp
/// @brief Unit tests for ship attributes, loadouts and the jump heat/fuel formulas.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "ship/ship.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"

#include <cmath>
#include <limits>
#include <string>

using namespace starlane;
using namespace starlane::ship;

int main(int argc, char** argv)
{
    starlane::core::Logger::init();
    const int result = doctest::Context(argc, argv).run();
    starlane::core::Logger::shutdown();
    return result;
}

namespace
{

ShipAttributes make_ship()
{
    return ShipAttributes{
        .name           = "Reflex",
        .base_mass_kg   = 1.0e7,
        .specific_heat  = 1.0,
        .fuel_capacity  = 3000.0,
        .cargo_capacity = 1000.0,
    };
}

} // namespace

// =================================================================
// Attributes and loadouts
// =================================================================

TEST_CASE("Valid ship attributes pass validation")
{
    CHECK(make_ship().validate().has_value());
}

TEST_CASE("Invalid ship attributes are ShipData errors")
{
    ShipAttributes ship = make_ship();

    SUBCASE("blank name")
    {
        ship.name = "   ";
    }
    SUBCASE("zero mass")
    {
        ship.base_mass_kg = 0.0;
    }
    SUBCASE("negative specific heat")
    {
        ship.specific_heat = -1.0;
    }
    SUBCASE("infinite fuel capacity")
    {
        ship.fuel_capacity = std::numeric_limits<f64>::infinity();
    }
    SUBCASE("NaN cargo capacity")
    {
        ship.cargo_capacity = std::nan("");
    }

    const auto valid = ship.validate();
    REQUIRE_FALSE(valid.has_value());
    CHECK(valid.error().kind == ErrorKind::ShipData);
}

TEST_CASE("Loadouts are bounded by the ship")
{
    const ShipAttributes ship = make_ship();

    const auto ok = ShipLoadout::create(ship, 1500.0, 200.0);
    REQUIRE(ok.has_value());
    CHECK(ok->total_mass_kg(ship) == doctest::Approx(1.0e7 + 1500.0 + 200.0));

    CHECK_FALSE(ShipLoadout::create(ship, 3000.1, 0.0).has_value());
    CHECK_FALSE(ShipLoadout::create(ship, -1.0, 0.0).has_value());
    CHECK_FALSE(ShipLoadout::create(ship, 10.0, -5.0).has_value());
    CHECK(ShipLoadout::create(ship, 3000.0, 0.0).has_value());

    const ShipLoadout full = ShipLoadout::full_fuel(ship);
    CHECK(full.fuel_load == doctest::Approx(3000.0));
    CHECK(full.cargo_mass_kg == doctest::Approx(0.0));
}

// =================================================================
// Heat
// =================================================================

TEST_CASE("Jump heat follows 3 * mass * distance / (calibration * hull)")
{
    const auto heat = calculate_jump_heat(2.0e7, 10.0, 1.0e7, 1.0e-7);
    REQUIRE(heat.has_value());
    CHECK(*heat == doctest::Approx(3.0 * 2.0e7 * 10.0 / (1.0e-7 * 1.0e7)));

    const auto zero = calculate_jump_heat(2.0e7, 0.0, 1.0e7, 1.0e-7);
    REQUIRE(zero.has_value());
    CHECK(*zero == doctest::Approx(0.0));
}

TEST_CASE("Jump heat rejects bad inputs")
{
    const auto check_rejected = [](f64 mass, f64 distance, f64 hull, f64 calibration)
    {
        const auto heat = calculate_jump_heat(mass, distance, hull, calibration);
        REQUIRE_FALSE(heat.has_value());
        CHECK(heat.error().kind == ErrorKind::HeatCalculation);
    };

    check_rejected(1.0e7, -1.0, 1.0e7, 1.0e-7);
    check_rejected(1.0e7, std::nan(""), 1.0e7, 1.0e-7);
    check_rejected(0.0, 10.0, 1.0e7, 1.0e-7);
    check_rejected(1.0e7, 10.0, 0.0, 1.0e-7);
    check_rejected(1.0e7, 10.0, 1.0e7, 0.0);
}

TEST_CASE("LoadoutHeatModel reports the loaded mass and temperature rise")
{
    const ShipAttributes ship = make_ship();
    const core::EngineConfig config;
    const auto model = LoadoutHeatModel::create(ship, ShipLoadout::full_fuel(ship), config);
    REQUIRE(model.has_value());

    CHECK(model->current_mass_kg() == doctest::Approx(1.0e7 + 3000.0));
    CHECK(model->hull_mass_kg() == doctest::Approx(1.0e7));
    CHECK(model->calibration_constant() == doctest::Approx(config.heat_calibration_constant));
    CHECK(model->critical_threshold() == doctest::Approx(config.heat_critical_threshold));

    // delta = 3 * d / (calibration * hull * specific_heat) = 3 K per ly here.
    const auto delta = model->heat_delta(model->current_mass_kg(), model->hull_mass_kg(), 10.0,
                                         model->calibration_constant());
    REQUIRE(delta.has_value());
    CHECK(*delta == doctest::Approx(30.0));
}

TEST_CASE("LoadoutHeatModel refuses invalid ships and loadouts")
{
    ShipAttributes ship = make_ship();
    const core::EngineConfig config;

    CHECK_FALSE(LoadoutHeatModel::create(ship, ShipLoadout{.fuel_load = 5000.0}, config).has_value());

    ship.specific_heat = 0.0;
    const auto model = LoadoutHeatModel::create(ship, ShipLoadout{}, config);
    REQUIRE_FALSE(model.has_value());
    CHECK(model.error().kind == ErrorKind::ShipData);
}

// =================================================================
// Fuel
// =================================================================

TEST_CASE("Jump fuel cost scales with mass, quality and distance")
{
    const auto cost = calculate_jump_fuel_cost(1.0e7, 10.0, 10.0);
    REQUIRE(cost.has_value());
    CHECK(*cost == doctest::Approx((1.0e7 / 1.0e5) * 0.10 * 10.0));

    const auto doubled = calculate_jump_fuel_cost(1.0e7, 20.0, 10.0);
    REQUIRE(doubled.has_value());
    CHECK(*doubled == doctest::Approx(2.0 * *cost));
}

TEST_CASE("Jump fuel cost rejects bad inputs")
{
    CHECK(calculate_jump_fuel_cost(1.0e7, 0.0, 10.0).error().kind == ErrorKind::ShipData);
    CHECK(calculate_jump_fuel_cost(1.0e7, -3.0, 10.0).error().kind == ErrorKind::ShipData);
    CHECK(calculate_jump_fuel_cost(0.0, 10.0, 10.0).error().kind == ErrorKind::ShipData);
    CHECK(calculate_jump_fuel_cost(1.0e7, 10.0, 0.5).error().kind == ErrorKind::ShipData);
    CHECK(calculate_jump_fuel_cost(1.0e7, 10.0, 101.0).error().kind == ErrorKind::ShipData);
    CHECK(calculate_jump_fuel_cost(1.0e7, 10.0, 1.0).has_value());
    CHECK(calculate_jump_fuel_cost(1.0e7, 10.0, 100.0).has_value());
}
