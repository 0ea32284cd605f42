/// @file graph.cpp
/// @brief Gate, spatial and hybrid graph builders.

#include "graph/graph.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <utility>

namespace starlane::graph
{

namespace
{

using AdjacencyMap = std::unordered_map<PointId, std::vector<Edge>>;

// Undefined distance sorts after every defined one.
bool edge_less(const Edge& a, const Edge& b)
{
    if (a.distance.has_value() != b.distance.has_value())
    {
        return a.distance.has_value();
    }
    if (a.distance && *a.distance != *b.distance)
    {
        return *a.distance < *b.distance;
    }
    if (a.kind != b.kind)
    {
        return a.kind < b.kind;
    }
    return a.target < b.target;
}

AdjacencyMap empty_adjacency(const starmap::PointSet& points)
{
    AdjacencyMap adjacency;
    adjacency.reserve(points.size());
    for (const auto& p : points.points())
    {
        adjacency.emplace(p.id, std::vector<Edge>{});
    }
    return adjacency;
}

void add_gate_edges(const starmap::PointSet& points, AdjacencyMap& adjacency)
{
    for (const auto& p : points.points())
    {
        auto& edges = adjacency[p.id];
        for (const PointId target : points.gates(p.id))
        {
            std::optional<f64> distance;
            const auto target_pos = points.position_of(target);
            if (p.position && target_pos)
            {
                distance = distance_between(*p.position, *target_pos);
            }
            edges.push_back(Edge{.target = target, .kind = EdgeKind::Gate, .distance = distance});
        }
    }
}

/// Symmetrized k-nearest links. Returns the caller-visible warnings.
std::vector<std::string> add_spatial_edges(const starmap::PointSet& points,
                                           const GraphBuildOptions& options,
                                           AdjacencyMap& adjacency)
{
    std::vector<std::string> warnings;

    std::optional<spatial::SpatialIndex> owned;
    const spatial::SpatialIndex* index = options.spatial_index;
    if (index == nullptr)
    {
        SL_CORE_INFO("GraphBuilder: No spatial index supplied, building one for {} points",
                     points.size());
        owned = spatial::SpatialIndex::build(points);
        index = &*owned;
    }

    std::size_t unpositioned = 0;
    std::size_t unindexed = 0;
    std::vector<std::pair<PointId, PointId>> links;
    links.reserve(points.size() * options.max_spatial_neighbors);

    for (const auto& p : points.points())
    {
        if (!p.position)
        {
            ++unpositioned;
            continue;
        }
        if (!index->contains(p.id))
        {
            ++unindexed;
            continue;
        }

        // One extra hit because the query point finds itself.
        const auto hits = index->nearest(*p.position, options.max_spatial_neighbors + 1);
        std::size_t taken = 0;
        for (const auto& hit : hits)
        {
            if (taken == options.max_spatial_neighbors)
            {
                break;
            }
            if (hit.id == p.id || points.find(hit.id) == nullptr)
            {
                continue;
            }
            links.emplace_back(std::min(p.id, hit.id), std::max(p.id, hit.id));
            ++taken;
        }
    }

    std::sort(links.begin(), links.end());
    links.erase(std::unique(links.begin(), links.end()), links.end());

    for (const auto& [a, b] : links)
    {
        const auto pa = points.position_of(a);
        const auto pb = points.position_of(b);
        if (!pa || !pb)
        {
            continue;
        }
        const f64 d = distance_between(*pa, *pb);
        adjacency[a].push_back(Edge{.target = b, .kind = EdgeKind::Spatial, .distance = d});
        adjacency[b].push_back(Edge{.target = a, .kind = EdgeKind::Spatial, .distance = d});
    }

    if (unpositioned > 0)
    {
        warnings.push_back(std::to_string(unpositioned) +
                           " points lack coordinates and were excluded from spatial edges");
    }
    if (unindexed > 0)
    {
        warnings.push_back(std::to_string(unindexed) +
                           " positioned points are missing from the spatial index");
    }
    for (const auto& w : warnings)
    {
        SL_CORE_WARN("GraphBuilder: {}", w);
    }
    return warnings;
}

} // namespace

// -----------------------------------------------------------------
// Graph
// -----------------------------------------------------------------

const char* to_string(EdgeKind kind)
{
    switch (kind)
    {
        case EdgeKind::Gate:    return "gate";
        case EdgeKind::Spatial: return "jump";
    }
    return "unknown";
}

const char* to_string(GraphMode mode)
{
    switch (mode)
    {
        case GraphMode::Gate:    return "gate";
        case GraphMode::Spatial: return "spatial";
        case GraphMode::Hybrid:  return "hybrid";
    }
    return "unknown";
}

std::span<const Edge> Graph::neighbours(PointId id) const
{
    const auto it = m_adjacency.find(id);
    if (it == m_adjacency.end())
    {
        return {};
    }
    return it->second;
}

const Edge* Graph::best_edge(PointId from, PointId to,
                             const std::function<bool(const Edge&)>& accept) const
{
    const Edge* best = nullptr;
    for (const auto& edge : neighbours(from))
    {
        if (edge.target != to || (accept && !accept(edge)))
        {
            continue;
        }
        if (best == nullptr || edge_less(edge, *best))
        {
            best = &edge;
        }
    }
    return best;
}

// -----------------------------------------------------------------
// Builders
// -----------------------------------------------------------------

Graph build_gate_graph(const starmap::PointSet& points)
{
    Graph graph;
    graph.m_mode = GraphMode::Gate;
    graph.m_adjacency = empty_adjacency(points);
    add_gate_edges(points, graph.m_adjacency);

    for (const auto& [id, edges] : graph.m_adjacency)
    {
        graph.m_edge_count += edges.size();
    }

    SL_CORE_INFO("GraphBuilder: Gate graph with {} nodes, {} edges",
                 graph.node_count(), graph.m_edge_count);
    return graph;
}

Graph build_spatial_graph(const starmap::PointSet& points, const GraphBuildOptions& options)
{
    Graph graph;
    graph.m_mode = GraphMode::Spatial;
    graph.m_adjacency = empty_adjacency(points);
    graph.m_warnings = add_spatial_edges(points, options, graph.m_adjacency);

    for (auto& [id, edges] : graph.m_adjacency)
    {
        std::sort(edges.begin(), edges.end(), edge_less);
        graph.m_edge_count += edges.size();
    }

    SL_CORE_INFO("GraphBuilder: Spatial graph with {} nodes, {} edges (k = {})",
                 graph.node_count(), graph.m_edge_count, options.max_spatial_neighbors);
    return graph;
}

Graph build_hybrid_graph(const starmap::PointSet& points, const GraphBuildOptions& options)
{
    Graph graph;
    graph.m_mode = GraphMode::Hybrid;
    graph.m_adjacency = empty_adjacency(points);
    add_gate_edges(points, graph.m_adjacency);
    graph.m_warnings = add_spatial_edges(points, options, graph.m_adjacency);

    for (auto& [id, edges] : graph.m_adjacency)
    {
        std::sort(edges.begin(), edges.end(), edge_less);
        graph.m_edge_count += edges.size();
    }

    SL_CORE_INFO("GraphBuilder: Hybrid graph with {} nodes, {} edges (k = {})",
                 graph.node_count(), graph.m_edge_count, options.max_spatial_neighbors);
    return graph;
}

} // namespace starlane::graph
