/// @file planner.cpp
/// @brief Planner selection and variant dispatch.

#include "routing/planner.hpp"

#include "starmap/point_set.hpp"

#include <string>
#include <type_traits>

namespace starlane::routing
{

const char* to_string(RouteAlgorithm algorithm)
{
    switch (algorithm)
    {
        case RouteAlgorithm::Bfs:      return "bfs";
        case RouteAlgorithm::Dijkstra: return "dijkstra";
        case RouteAlgorithm::AStar:    return "a-star";
    }
    return "unknown";
}

std::optional<RouteAlgorithm> parse_algorithm(std::string_view name)
{
    const std::string lower = starmap::to_lower_ascii(name);
    if (lower == "bfs")
    {
        return RouteAlgorithm::Bfs;
    }
    if (lower == "dijkstra")
    {
        return RouteAlgorithm::Dijkstra;
    }
    if (lower == "a-star" || lower == "astar")
    {
        return RouteAlgorithm::AStar;
    }
    return std::nullopt;
}

Planner select_planner(RouteAlgorithm algorithm)
{
    switch (algorithm)
    {
        case RouteAlgorithm::Bfs:      return BfsPlanner{};
        case RouteAlgorithm::Dijkstra: return DijkstraPlanner{};
        case RouteAlgorithm::AStar:    return AStarPlanner{};
    }
    return AStarPlanner{};
}

RouteAlgorithm planner_algorithm(const Planner& planner)
{
    return std::visit([](const auto& p) { return std::decay_t<decltype(p)>::kAlgorithm; }, planner);
}

bool requires_spatial_index(const Planner& planner)
{
    return std::visit([](const auto& p) { return std::decay_t<decltype(p)>::kRequiresSpatialIndex; },
                      planner);
}

graph::GraphMode preferred_graph_mode(const Planner& planner)
{
    return std::visit([](const auto& p) { return std::decay_t<decltype(p)>::kPreferredGraph; }, planner);
}

std::optional<std::vector<PointId>> find_path(const Planner& planner, const SearchInput& input,
                                              PointId start, PointId goal, SearchStats* stats)
{
    return std::visit([&](const auto& p) { return p.find_path(input, start, goal, stats); }, planner);
}

} // namespace starlane::routing
