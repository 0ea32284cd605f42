/// @file test_planner.cpp
/// @brief Unit tests for planner selection and variant dispatch.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "routing/planner.hpp"
#include "graph/graph.hpp"
#include "starmap/point_set.hpp"
#include "core/logger.hpp"

#include <string>
#include <vector>

using namespace starlane;
using namespace starlane::routing;
using starlane::starmap::Point;
using starlane::starmap::PointSet;

int main(int argc, char** argv)
{
    starlane::core::Logger::init();
    const int result = doctest::Context(argc, argv).run();
    starlane::core::Logger::shutdown();
    return result;
}

// =================================================================
// Names
// =================================================================

TEST_CASE("parse_algorithm accepts the documented spellings")
{
    CHECK(parse_algorithm("bfs") == RouteAlgorithm::Bfs);
    CHECK(parse_algorithm("BFS") == RouteAlgorithm::Bfs);
    CHECK(parse_algorithm("dijkstra") == RouteAlgorithm::Dijkstra);
    CHECK(parse_algorithm("Dijkstra") == RouteAlgorithm::Dijkstra);
    CHECK(parse_algorithm("a-star") == RouteAlgorithm::AStar);
    CHECK(parse_algorithm("astar") == RouteAlgorithm::AStar);
    CHECK(parse_algorithm("A-Star") == RouteAlgorithm::AStar);

    CHECK_FALSE(parse_algorithm("").has_value());
    CHECK_FALSE(parse_algorithm("a*").has_value());
    CHECK_FALSE(parse_algorithm("dfs").has_value());
}

TEST_CASE("to_string round-trips through parse_algorithm")
{
    for (const auto algorithm : {RouteAlgorithm::Bfs, RouteAlgorithm::Dijkstra, RouteAlgorithm::AStar})
    {
        CHECK(parse_algorithm(to_string(algorithm)) == algorithm);
    }
    CHECK(std::string(to_string(RouteAlgorithm::AStar)) == "a-star");
}

// =================================================================
// Selection
// =================================================================

TEST_CASE("select_planner picks the matching variant")
{
    CHECK(std::holds_alternative<BfsPlanner>(select_planner(RouteAlgorithm::Bfs)));
    CHECK(std::holds_alternative<DijkstraPlanner>(select_planner(RouteAlgorithm::Dijkstra)));
    CHECK(std::holds_alternative<AStarPlanner>(select_planner(RouteAlgorithm::AStar)));

    for (const auto algorithm : {RouteAlgorithm::Bfs, RouteAlgorithm::Dijkstra, RouteAlgorithm::AStar})
    {
        CHECK(planner_algorithm(select_planner(algorithm)) == algorithm);
    }
}

TEST_CASE("Planner capabilities")
{
    const Planner bfs = select_planner(RouteAlgorithm::Bfs);
    const Planner dijkstra = select_planner(RouteAlgorithm::Dijkstra);
    const Planner a_star = select_planner(RouteAlgorithm::AStar);

    CHECK_FALSE(requires_spatial_index(bfs));
    CHECK(requires_spatial_index(dijkstra));
    CHECK(requires_spatial_index(a_star));

    CHECK(preferred_graph_mode(bfs) == graph::GraphMode::Gate);
    CHECK(preferred_graph_mode(dijkstra) == graph::GraphMode::Hybrid);
    CHECK(preferred_graph_mode(a_star) == graph::GraphMode::Hybrid);
}

// =================================================================
// Dispatch
// =================================================================

TEST_CASE("find_path dispatches to the selected search")
{
    // A-B-C gate chain plus positions that make the A-C jump shorter than A-B-C.
    PointSet::Builder builder;
    builder.add_point(Point{.id = 1, .name = "A", .position = Vec3d(0.0, 0.0, 0.0), .metadata = {}});
    builder.add_point(Point{.id = 2, .name = "B", .position = Vec3d(7.5, 6.614378277661476, 0.0), .metadata = {}});
    builder.add_point(Point{.id = 3, .name = "C", .position = Vec3d(15.0, 0.0, 0.0), .metadata = {}});
    builder.add_gate(1, 2);
    builder.add_gate(2, 3);
    const auto set = builder.build();

    const graph::Graph gates = graph::build_gate_graph(*set);
    const graph::Graph hybrid = graph::build_hybrid_graph(*set);
    const ConstraintSet constraints;

    const SearchInput gate_input{.graph = gates, .points = *set, .constraints = constraints};
    const SearchInput hybrid_input{.graph = hybrid, .points = *set, .constraints = constraints};

    SUBCASE("bfs on the gate graph")
    {
        SearchStats stats;
        const auto path = find_path(select_planner(RouteAlgorithm::Bfs), gate_input, 1, 3, &stats);
        REQUIRE(path.has_value());
        CHECK((*path == std::vector<PointId>{1, 2, 3}));
        CHECK(stats.reached);
    }

    SUBCASE("dijkstra on the hybrid graph")
    {
        const auto path = find_path(select_planner(RouteAlgorithm::Dijkstra), hybrid_input, 1, 3);
        REQUIRE(path.has_value());
        CHECK((*path == std::vector<PointId>{1, 3}));
    }

    SUBCASE("a-star on the hybrid graph")
    {
        const auto path = find_path(select_planner(RouteAlgorithm::AStar), hybrid_input, 1, 3);
        REQUIRE(path.has_value());
        CHECK((*path == std::vector<PointId>{1, 3}));
    }

    SUBCASE("bfs on the hybrid graph takes the single hop")
    {
        const auto path = find_path(select_planner(RouteAlgorithm::Bfs), hybrid_input, 1, 3);
        REQUIRE(path.has_value());
        CHECK(path->size() == 2);
    }
}
