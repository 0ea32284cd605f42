#pragma once

/// @file path_search.hpp
/// @brief Breadth-first, Dijkstra and A* searches over a traversal graph.

#include "routing/constraints.hpp"

#include "graph/graph.hpp"
#include "starmap/point_set.hpp"

#include "core/types.hpp"

#include <optional>
#include <vector>

namespace starlane::routing
{
    /// @brief Diagnostics from one search.
    struct SearchStats
    {
        std::size_t expansions = 0;   ///< Nodes popped and expanded
        std::size_t visited = 0;      ///< Nodes discovered
        bool reached = false;
        RejectionTally tally;         ///< Edges refused by each rule
    };

    /// @brief Everything a planner reads; all references must outlive the call.
    struct SearchInput
    {
        const graph::Graph& graph;
        const starmap::PointSet& points;
        const ConstraintSet& constraints;
    };

    /// @brief Fewest hops. Every allowed edge costs 1; missing distances are fine.
    [[nodiscard]] std::optional<std::vector<PointId>>
        find_route_bfs(const SearchInput& input, PointId start, PointId goal,
                       SearchStats* stats = nullptr);

    /// @brief Minimum total distance. Edges without a distance are skipped.
    [[nodiscard]] std::optional<std::vector<PointId>>
        find_route_dijkstra(const SearchInput& input, PointId start, PointId goal,
                            SearchStats* stats = nullptr);

    /// @brief Minimum total distance guided by straight-line distance to the goal.
    ///
    /// The heuristic is the straight-line distance between point-set
    /// positions; it is 0 for a node (or goal) without coordinates, which
    /// reduces the search to Dijkstra there.
    [[nodiscard]] std::optional<std::vector<PointId>>
        find_route_a_star(const SearchInput& input, PointId start, PointId goal,
                          SearchStats* stats = nullptr);

} // namespace starlane::routing
