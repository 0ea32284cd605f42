/// @file test_constraints.cpp
/// @brief Unit tests for the per-edge routing rules and their composition.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "routing/constraints.hpp"
#include "graph/graph.hpp"
#include "ship/ship.hpp"
#include "starmap/point.hpp"
#include "core/logger.hpp"

#include <cmath>
#include <string>

using namespace starlane;
using namespace starlane::routing;
using starlane::graph::Edge;
using starlane::graph::EdgeKind;
using starlane::starmap::Point;

int main(int argc, char** argv)
{
    starlane::core::Logger::init();
    const int result = doctest::Context(argc, argv).run();
    starlane::core::Logger::shutdown();
    return result;
}

// =================================================================
// Fixtures
// =================================================================

namespace
{

/// Heats the hull by `per_ly` Kelvin per light-year, or fails on demand.
class LinearHeatModel final : public ship::HeatModel
{
public:
    explicit LinearHeatModel(f64 per_ly, f64 critical = 150.0, bool fail = false)
        : m_per_ly(per_ly), m_critical(critical), m_fail(fail) {}

    [[nodiscard]] f64 current_mass_kg() const override { return 1.0e7; }
    [[nodiscard]] f64 hull_mass_kg() const override { return 1.0e7; }
    [[nodiscard]] f64 calibration_constant() const override { return 1.0e-7; }
    [[nodiscard]] f64 critical_threshold() const override { return m_critical; }

    [[nodiscard]] Result<f64> heat_delta(f64, f64, f64 distance_ly, f64) const override
    {
        if (m_fail)
        {
            return Error::heat_calculation("model unavailable");
        }
        return m_per_ly * distance_ly;
    }

private:
    f64 m_per_ly;
    f64 m_critical;
    bool m_fail;
};

Point make_target(PointId id, std::optional<f64> temperature)
{
    Point p{.id = id, .name = "T" + std::to_string(id), .position = Vec3d(0.0), .metadata = {}};
    p.metadata.temperature = temperature;
    return p;
}

Edge spatial_edge(PointId target, f64 distance)
{
    return Edge{.target = target, .kind = EdgeKind::Spatial, .distance = distance};
}

Edge gate_edge(PointId target, std::optional<f64> distance = std::nullopt)
{
    return Edge{.target = target, .kind = EdgeKind::Gate, .distance = distance};
}

} // namespace

// =================================================================
// Individual rules
// =================================================================

TEST_CASE("max_jump rejects longer edges and ignores undefined distances")
{
    ConstraintSet c;
    c.max_jump = 10.0;
    const Point target = make_target(2, std::nullopt);

    const Edge short_jump = spatial_edge(2, 9.5);
    const Edge exact_jump = spatial_edge(2, 10.0);
    const Edge long_jump = spatial_edge(2, 10.5);
    const Edge long_gate = gate_edge(2, 25.0);
    const Edge unknown_gate = gate_edge(2);

    const TraversalState s;
    CHECK(passes_max_jump(c, {1, &short_jump, &target}, s));
    CHECK(passes_max_jump(c, {1, &exact_jump, &target}, s));
    CHECK_FALSE(passes_max_jump(c, {1, &long_jump, &target}, s));
    CHECK_FALSE(passes_max_jump(c, {1, &long_gate, &target}, s));
    CHECK(passes_max_jump(c, {1, &unknown_gate, &target}, s));

    c.max_jump.reset();
    CHECK(passes_max_jump(c, {1, &long_jump, &target}, s));
}

TEST_CASE("avoid rejects edges into avoided points")
{
    ConstraintSet c;
    c.avoided = {7};
    const Edge into = gate_edge(7);
    const Edge elsewhere = gate_edge(8);

    CHECK_FALSE(passes_avoid(c, {1, &into, nullptr}, {}));
    CHECK(passes_avoid(c, {1, &elsewhere, nullptr}, {}));
}

TEST_CASE("avoid_gates rejects only gate edges")
{
    ConstraintSet c;
    c.avoid_gates = true;
    const Edge gate = gate_edge(2, 5.0);
    const Edge jump = spatial_edge(2, 5.0);

    CHECK_FALSE(passes_avoid_gates(c, {1, &gate, nullptr}, {}));
    CHECK(passes_avoid_gates(c, {1, &jump, nullptr}, {}));
}

TEST_CASE("max_temperature filters spatial edges and fails open on unknown temperature")
{
    ConstraintSet c;
    c.max_temperature = 300.0;

    const Point hot = make_target(2, 500.0);
    const Point mild = make_target(3, 300.0);
    const Point unknown = make_target(4, std::nullopt);
    const Edge to_hot = spatial_edge(2, 5.0);
    const Edge to_mild = spatial_edge(3, 5.0);
    const Edge to_unknown = spatial_edge(4, 5.0);
    const Edge gate_to_hot = gate_edge(2, 5.0);

    CHECK_FALSE(passes_max_temperature(c, {1, &to_hot, &hot}, {}));
    CHECK(passes_max_temperature(c, {1, &to_mild, &mild}, {}));
    CHECK(passes_max_temperature(c, {1, &to_unknown, &unknown}, {}));
    CHECK(passes_max_temperature(c, {1, &to_hot, nullptr}, {}));
    CHECK(passes_max_temperature(c, {1, &gate_to_hot, &hot}, {}));
}

TEST_CASE("critical heat rejects jumps that would reach the threshold")
{
    const LinearHeatModel model(3.0);
    ConstraintSet c;
    c.avoid_critical_heat = true;
    c.heat_model = &model;

    const Point cool = make_target(2, 20.0);
    const Point warm = make_target(3, 130.0);
    const Edge jump_to_cool = spatial_edge(2, 10.0);   // 20 + 30 = 50
    const Edge jump_to_warm = spatial_edge(3, 10.0);   // 130 + 30 = 160
    const Edge gate_to_warm = gate_edge(3, 10.0);

    CHECK(passes_critical_heat(c, {1, &jump_to_cool, &cool}, {}));
    CHECK_FALSE(passes_critical_heat(c, {1, &jump_to_warm, &warm}, {}));
    CHECK(passes_critical_heat(c, {1, &gate_to_warm, &warm}, {}));

    // Unknown ambient counts as zero.
    const Edge long_jump = spatial_edge(4, 49.0);      // 147
    CHECK(passes_critical_heat(c, {1, &long_jump, nullptr}, {}));
}

TEST_CASE("critical heat fails closed when the heat cannot be evaluated")
{
    ConstraintSet c;
    c.avoid_critical_heat = true;
    const Point cool = make_target(2, 20.0);
    const Edge jump = spatial_edge(2, 1.0);

    SUBCASE("no heat model")
    {
        CHECK_FALSE(passes_critical_heat(c, {1, &jump, &cool}, {}));
    }

    SUBCASE("model error")
    {
        const LinearHeatModel failing(3.0, 150.0, true);
        c.heat_model = &failing;
        CHECK_FALSE(passes_critical_heat(c, {1, &jump, &cool}, {}));
    }

    SUBCASE("jump without distance")
    {
        const LinearHeatModel model(3.0);
        c.heat_model = &model;
        const Edge undefined{.target = 2, .kind = EdgeKind::Spatial, .distance = std::nullopt};
        CHECK_FALSE(passes_critical_heat(c, {1, &undefined, &cool}, {}));
    }
}

TEST_CASE("critical heat works with the loadout-backed model")
{
    const ship::ShipAttributes ship{
        .name           = "Reflex",
        .base_mass_kg   = 1.0e7,
        .specific_heat  = 1.0,
        .fuel_capacity  = 3000.0,
        .cargo_capacity = 1000.0,
    };
    const auto model = ship::LoadoutHeatModel::create(ship, ship::ShipLoadout::full_fuel(ship),
                                                      core::EngineConfig{});
    REQUIRE(model.has_value());

    ConstraintSet c;
    c.avoid_critical_heat = true;
    c.heat_model = &*model;

    const Point target = make_target(2, 0.0);
    const Edge fine = spatial_edge(2, 40.0);       // ~120 K
    const Edge too_far = spatial_edge(2, 60.0);    // ~180 K
    CHECK(passes_critical_heat(c, {1, &fine, &target}, {}));
    CHECK_FALSE(passes_critical_heat(c, {1, &too_far, &target}, {}));
}

// =================================================================
// Composition
// =================================================================

TEST_CASE("evaluate() reports the first failing rule in order")
{
    ConstraintSet c;
    c.max_jump = 5.0;
    c.avoided = {2};
    c.avoid_gates = true;

    const Point target = make_target(2, std::nullopt);
    const Edge long_gate_into_avoided = gate_edge(2, 8.0);
    const Edge short_gate_into_avoided = gate_edge(2, 3.0);
    const Edge short_gate = gate_edge(3, 3.0);
    const Edge short_jump = spatial_edge(3, 3.0);

    auto verdict = evaluate(c, {1, &long_gate_into_avoided, &target});
    CHECK_FALSE(verdict.allowed);
    CHECK(verdict.rejected_by == ConstraintRule::MaxJump);

    verdict = evaluate(c, {1, &short_gate_into_avoided, &target});
    CHECK(verdict.rejected_by == ConstraintRule::Avoid);

    verdict = evaluate(c, {1, &short_gate, nullptr});
    CHECK(verdict.rejected_by == ConstraintRule::AvoidGates);

    verdict = evaluate(c, {1, &short_jump, nullptr});
    CHECK(verdict.allowed);
    CHECK_FALSE(verdict.rejected_by.has_value());
}

TEST_CASE("An empty constraint set allows everything")
{
    const ConstraintSet c;
    const Edge gate = gate_edge(2);
    const Edge jump = spatial_edge(2, 1000.0);

    CHECK(evaluate(c, {1, &gate, nullptr}).allowed);
    CHECK(evaluate(c, {1, &jump, nullptr}).allowed);
    for (const auto rule : {ConstraintRule::MaxJump, ConstraintRule::Avoid, ConstraintRule::AvoidGates,
                            ConstraintRule::MaxTemperature, ConstraintRule::CriticalHeat})
    {
        CHECK_FALSE(c.is_active(rule));
    }
}

// =================================================================
// Validation
// =================================================================

TEST_CASE("validate() rejects unsearchable configurations")
{
    ConstraintSet c;
    CHECK(c.validate(1, 2).has_value());

    SUBCASE("avoiding the start")
    {
        c.avoided = {1};
    }
    SUBCASE("avoiding the goal")
    {
        c.avoided = {2};
    }
    SUBCASE("negative max_jump")
    {
        c.max_jump = -1.0;
    }
    SUBCASE("NaN max_temperature")
    {
        c.max_temperature = std::nan("");
    }
    SUBCASE("critical heat without a model")
    {
        c.avoid_critical_heat = true;
    }

    const auto valid = c.validate(1, 2);
    REQUIRE_FALSE(valid.has_value());
    CHECK(valid.error().kind == ErrorKind::InvalidConstraint);
}

TEST_CASE("A zero max_jump is allowed")
{
    ConstraintSet c;
    c.max_jump = 0.0;
    CHECK(c.validate(1, 2).has_value());
}

TEST_CASE("describe() includes the rule parameter")
{
    ConstraintSet c;
    c.max_jump = 12.5;
    c.max_temperature = 300.0;
    c.avoided = {4, 5};

    CHECK(c.describe(ConstraintRule::MaxJump) == "max_jump (12.5)");
    CHECK(c.describe(ConstraintRule::MaxTemperature) == "max_temperature (300)");
    CHECK(c.describe(ConstraintRule::Avoid) == "avoid (2 points)");
    CHECK(c.describe(ConstraintRule::AvoidGates) == "avoid_gates");
}

// =================================================================
// Tally
// =================================================================

TEST_CASE("RejectionTally finds the most restrictive rule")
{
    RejectionTally tally;
    CHECK_FALSE(tally.most_restrictive().has_value());
    CHECK(tally.total() == 0);

    tally.record(ConstraintRule::Avoid);
    tally.record(ConstraintRule::MaxTemperature);
    tally.record(ConstraintRule::MaxTemperature);
    CHECK(tally.count(ConstraintRule::MaxTemperature) == 2);
    CHECK(tally.total() == 3);
    CHECK(tally.most_restrictive() == ConstraintRule::MaxTemperature);

    tally.record(ConstraintRule::Avoid);
    CHECK(tally.most_restrictive() == ConstraintRule::Avoid);
}
