#pragma once

/// @file graph.hpp
/// @brief Traversal graphs (gate, spatial, hybrid) derived from a point-set.

#include "spatial/spatial_index.hpp"
#include "starmap/point_set.hpp"

#include "core/types.hpp"

#include <functional>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace starlane::graph
{
    enum class EdgeKind : u8
    {
        Gate,      ///< Fixed stargate link
        Spatial,   ///< Free-flight jump between nearby systems
    };

    enum class GraphMode : u8
    {
        Gate,
        Spatial,
        Hybrid,
    };

    [[nodiscard]] const char* to_string(EdgeKind kind);
    [[nodiscard]] const char* to_string(GraphMode mode);

    /// @brief A directed half of a symmetric link, stored in the source's adjacency list.
    struct Edge
    {
        PointId target = 0;
        EdgeKind kind = EdgeKind::Gate;
        std::optional<f64> distance;   ///< Light-years; undefined for gates without coordinates
    };

    struct GraphBuildOptions
    {
        std::size_t max_spatial_neighbors = routing_constants::kDefaultSpatialNeighbours;
        const spatial::SpatialIndex* spatial_index = nullptr;   ///< Built on demand when null
    };

    /// @brief Immutable adjacency structure over every point of a point-set.
    class Graph
    {
    public:
        [[nodiscard]] GraphMode mode() const { return m_mode; }

        /// @brief Outgoing edges of a node; empty for unknown ids.
        [[nodiscard]] std::span<const Edge> neighbours(PointId id) const;

        [[nodiscard]] bool contains(PointId id) const { return m_adjacency.contains(id); }
        [[nodiscard]] std::size_t node_count() const { return m_adjacency.size(); }

        /// @brief Number of directed edges (each symmetric link counts twice).
        [[nodiscard]] std::size_t edge_count() const { return m_edge_count; }

        /// @brief Caller-visible build warnings (e.g. points excluded from spatial edges).
        [[nodiscard]] const std::vector<std::string>& warnings() const { return m_warnings; }

        /// @brief Cheapest edge from -> to accepted by `accept` (all edges when empty).
        ///
        /// Cheapest means smallest defined distance, gate before spatial on a tie,
        /// and any defined distance before an undefined one.
        [[nodiscard]] const Edge* best_edge(PointId from, PointId to,
                                            const std::function<bool(const Edge&)>& accept = {}) const;

    private:
        friend Graph build_gate_graph(const starmap::PointSet& points);
        friend Graph build_spatial_graph(const starmap::PointSet& points,
                                         const GraphBuildOptions& options);
        friend Graph build_hybrid_graph(const starmap::PointSet& points,
                                        const GraphBuildOptions& options);

        GraphMode m_mode = GraphMode::Gate;
        std::unordered_map<PointId, std::vector<Edge>> m_adjacency;
        std::size_t m_edge_count = 0;
        std::vector<std::string> m_warnings;
    };

    /// @brief Gate links only, in the point-set's gate order.
    [[nodiscard]] Graph build_gate_graph(const starmap::PointSet& points);

    /// @brief Each positioned point linked to its nearest positioned neighbours.
    ///
    /// The k-nearest relation is symmetrized, so every link appears in both
    /// endpoints' lists with the same distance. No gate edges.
    [[nodiscard]] Graph build_spatial_graph(const starmap::PointSet& points,
                                            const GraphBuildOptions& options = {});

    /// @brief Union of gate and spatial edges; a pair linked both ways keeps both edges.
    [[nodiscard]] Graph build_hybrid_graph(const starmap::PointSet& points,
                                           const GraphBuildOptions& options = {});

} // namespace starlane::graph
