#pragma once

/// @file route_planner.hpp
/// @brief Route orchestration: name resolution, graph selection, search, plan assembly.

#include "routing/constraints.hpp"
#include "routing/path_search.hpp"
#include "routing/planner.hpp"

#include "graph/graph.hpp"
#include "ship/route_projection.hpp"
#include "ship/ship.hpp"
#include "spatial/spatial_index.hpp"
#include "starmap/fuzzy_matcher.hpp"
#include "starmap/point_set.hpp"

#include "core/config.hpp"
#include "core/error.hpp"
#include "core/types.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace starlane::routing
{
    /// @brief What the caller asks for. Points are referred to by name.
    struct RouteRequest
    {
        std::string start;
        std::string goal;
        RouteAlgorithm algorithm = RouteAlgorithm::AStar;
        std::optional<f64> max_jump;
        std::vector<std::string> avoid;
        bool avoid_gates = false;
        std::optional<f64> max_temperature;
        bool avoid_critical_heat = false;
        std::optional<ship::ShipAttributes> ship;     ///< Enables the fuel/heat projection
        std::optional<ship::ShipLoadout> loadout;     ///< Defaults to a full tank when a ship is given
        bool dynamic_mass = false;                    ///< Projection burns mass off as fuel is used
    };

    struct RouteHop
    {
        PointId from = 0;
        PointId to = 0;
        graph::EdgeKind kind = graph::EdgeKind::Gate;
        std::optional<f64> distance;
    };

    struct RoutePlan
    {
        RouteAlgorithm algorithm = RouteAlgorithm::AStar;
        graph::GraphMode graph_mode = graph::GraphMode::Hybrid;
        PointId start = 0;
        PointId goal = 0;
        std::vector<PointId> steps;            ///< start ... goal
        std::vector<RouteHop> hops;            ///< steps.size() - 1 entries
        std::size_t gate_count = 0;
        std::size_t jump_count = 0;
        f64 total_distance = 0.0;              ///< Sum of defined hop distances
        f64 spatial_distance = 0.0;            ///< Sum of spatial hop distances
        std::optional<ship::RouteProjection> projection;
        SearchStats stats;
        std::vector<std::string> warnings;     ///< Graph build warnings

        [[nodiscard]] std::size_t hop_count() const { return steps.empty() ? 0 : steps.size() - 1; }
    };

    /// @brief Long-lived bundle of a point-set and everything derived from it.
    ///
    /// Owned by the host and shared read-only across requests. Each graph
    /// variant and the spatial index are built at most once, on first use.
    class RouteRuntime
    {
    public:
        /// @brief Bundle a point-set with an optional prebuilt index.
        ///
        /// A supplied index that is stale against the point-set fingerprint is
        /// discarded (with a warning) and rebuilt on first use.
        [[nodiscard]] static std::shared_ptr<RouteRuntime>
            create(std::shared_ptr<const starmap::PointSet> points,
                   core::EngineConfig config = {},
                   std::optional<spatial::SpatialIndex> index = std::nullopt,
                   std::shared_ptr<const starmap::SuggestionProvider> suggestions = nullptr);

        [[nodiscard]] const starmap::PointSet& points() const { return *m_points; }
        [[nodiscard]] const core::EngineConfig& config() const { return m_config; }
        [[nodiscard]] const starmap::SuggestionProvider& suggestions() const { return *m_suggestions; }
        [[nodiscard]] const std::vector<std::string>& names() const { return m_names; }

        /// @brief Graph of the given mode, built on first request.
        [[nodiscard]] const graph::Graph& graph(graph::GraphMode mode) const;

        /// @brief Spatial index, built on first request unless one was supplied.
        [[nodiscard]] const spatial::SpatialIndex& spatial_index() const;

        RouteRuntime(const RouteRuntime&) = delete;
        RouteRuntime& operator=(const RouteRuntime&) = delete;

    private:
        RouteRuntime() = default;

        std::shared_ptr<const starmap::PointSet> m_points;
        core::EngineConfig m_config;
        std::shared_ptr<const starmap::SuggestionProvider> m_suggestions;
        std::vector<std::string> m_names;

        mutable std::once_flag m_index_once;
        mutable std::optional<spatial::SpatialIndex> m_index;

        mutable std::once_flag m_gate_once;
        mutable std::once_flag m_spatial_once;
        mutable std::once_flag m_hybrid_once;
        mutable std::optional<graph::Graph> m_gate_graph;
        mutable std::optional<graph::Graph> m_spatial_graph;
        mutable std::optional<graph::Graph> m_hybrid_graph;
    };

    /// @brief Plan a route on a shared runtime.
    ///
    /// Fails with UnknownPoint (with suggestions), InvalidConstraint (before
    /// any search), RouteNotFound (with a hint naming the most restrictive
    /// rule when one rejected edges), or ShipData/HeatCalculation from the
    /// projection.
    [[nodiscard]] Result<RoutePlan> plan_route(const RouteRuntime& runtime, const RouteRequest& request);

    /// @brief One-off planning on a transient runtime.
    [[nodiscard]] Result<RoutePlan> plan_route(std::shared_ptr<const starmap::PointSet> points,
                                               const RouteRequest& request,
                                               const core::EngineConfig& config = {});

} // namespace starlane::routing
