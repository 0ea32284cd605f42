#pragma once

/// @file planner.hpp
/// @brief Closed set of route planners and their selection.

#include "routing/path_search.hpp"

#include "graph/graph.hpp"

#include "core/types.hpp"

#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace starlane::routing
{
    enum class RouteAlgorithm : u8
    {
        Bfs,
        Dijkstra,
        AStar,
    };

    [[nodiscard]] const char* to_string(RouteAlgorithm algorithm);

    /// @brief Accepts "bfs", "dijkstra", "a-star" or "astar" (case-insensitive).
    [[nodiscard]] std::optional<RouteAlgorithm> parse_algorithm(std::string_view name);

    struct BfsPlanner
    {
        static constexpr RouteAlgorithm kAlgorithm = RouteAlgorithm::Bfs;
        static constexpr bool kRequiresSpatialIndex = false;
        static constexpr graph::GraphMode kPreferredGraph = graph::GraphMode::Gate;

        [[nodiscard]] std::optional<std::vector<PointId>>
            find_path(const SearchInput& input, PointId start, PointId goal, SearchStats* stats) const
        {
            return find_route_bfs(input, start, goal, stats);
        }
    };

    struct DijkstraPlanner
    {
        static constexpr RouteAlgorithm kAlgorithm = RouteAlgorithm::Dijkstra;
        static constexpr bool kRequiresSpatialIndex = true;
        static constexpr graph::GraphMode kPreferredGraph = graph::GraphMode::Hybrid;

        [[nodiscard]] std::optional<std::vector<PointId>>
            find_path(const SearchInput& input, PointId start, PointId goal, SearchStats* stats) const
        {
            return find_route_dijkstra(input, start, goal, stats);
        }
    };

    struct AStarPlanner
    {
        static constexpr RouteAlgorithm kAlgorithm = RouteAlgorithm::AStar;
        static constexpr bool kRequiresSpatialIndex = true;
        static constexpr graph::GraphMode kPreferredGraph = graph::GraphMode::Hybrid;

        [[nodiscard]] std::optional<std::vector<PointId>>
            find_path(const SearchInput& input, PointId start, PointId goal, SearchStats* stats) const
        {
            return find_route_a_star(input, start, goal, stats);
        }
    };

    using Planner = std::variant<BfsPlanner, DijkstraPlanner, AStarPlanner>;

    [[nodiscard]] Planner select_planner(RouteAlgorithm algorithm);
    [[nodiscard]] RouteAlgorithm planner_algorithm(const Planner& planner);
    [[nodiscard]] bool requires_spatial_index(const Planner& planner);
    [[nodiscard]] graph::GraphMode preferred_graph_mode(const Planner& planner);

    [[nodiscard]] std::optional<std::vector<PointId>>
        find_path(const Planner& planner, const SearchInput& input, PointId start, PointId goal,
                  SearchStats* stats = nullptr);

} // namespace starlane::routing
