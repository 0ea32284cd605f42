/// @file spatial_index.cpp
/// @brief k-d tree build, exact queries with temperature pruning, freshness checks.

#include "spatial/spatial_index.hpp"

#include "core/checksum.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <utility>

namespace starlane::spatial
{

namespace
{

constexpr std::size_t kDimensions = 3;

void build_tree(std::vector<IndexNode>& nodes, std::size_t lo, std::size_t hi, std::size_t depth)
{
    if (hi - lo <= 1)
    {
        return;
    }

    const std::size_t axis = depth % kDimensions;
    const std::size_t mid = lo + (hi - lo) / 2;

    std::nth_element(nodes.begin() + static_cast<std::ptrdiff_t>(lo),
                     nodes.begin() + static_cast<std::ptrdiff_t>(mid),
                     nodes.begin() + static_cast<std::ptrdiff_t>(hi),
                     [axis](const IndexNode& a, const IndexNode& b)
                     {
                         if (a.position[axis] != b.position[axis])
                         {
                             return a.position[axis] < b.position[axis];
                         }
                         return a.id < b.id;
                     });

    build_tree(nodes, lo, mid, depth + 1);
    build_tree(nodes, mid + 1, hi, depth + 1);
}

std::vector<Neighbour> to_neighbours(std::vector<std::pair<f64, PointId>> hits)
{
    std::sort(hits.begin(), hits.end());

    std::vector<Neighbour> out;
    out.reserve(hits.size());
    for (const auto& [d2, id] : hits)
    {
        out.push_back(Neighbour{.id = id, .distance = std::sqrt(d2)});
    }
    return out;
}

} // namespace

/// Query state shared by the recursive descent.
struct SpatialIndex::Search
{
    Vec3d point{0.0};
    std::size_t k = 0;
    f64 radius_sq = 0.0;
    const TemperatureFilter* filter = nullptr;
    std::vector<std::pair<f64, PointId>> hits;   ///< Max-heap for nearest, plain list for radius
};

// -----------------------------------------------------------------
// Build
// -----------------------------------------------------------------

SpatialIndex SpatialIndex::build(const starmap::PointSet& points,
                                 std::optional<IndexMetadata> metadata)
{
    std::vector<IndexNode> nodes;
    nodes.reserve(points.size());

    std::size_t skipped = 0;
    for (const auto& p : points.points())
    {
        if (!p.position)
        {
            ++skipped;
            continue;
        }
        IndexNode node{.id = p.id, .position = *p.position, .temperature = std::nullopt};
        if (p.metadata.temperature)
        {
            node.temperature = p.metadata.temperature;
        }
        nodes.push_back(node);
    }

    build_tree(nodes, 0, nodes.size(), 0);

    if (!metadata)
    {
        const auto now = std::chrono::system_clock::now();
        metadata = IndexMetadata{
            .source_checksum = points.checksum(),
            .release_tag     = points.fingerprint().release_tag,
            .build_timestamp = std::chrono::duration_cast<std::chrono::seconds>(
                                   now.time_since_epoch()).count(),
        };
    }

    SpatialIndex index;
    index.m_nodes = std::move(nodes);
    index.m_metadata = std::move(metadata);
    index.m_format = IndexFormat::Current;
    index.finalize();

    SL_CORE_INFO("SpatialIndex: Built {} nodes ({} points without coordinates skipped)",
                 index.size(), skipped);
    return index;
}

SpatialIndex SpatialIndex::from_tree_nodes(std::vector<IndexNode> nodes,
                                           std::optional<IndexMetadata> metadata,
                                           IndexFormat format)
{
    SpatialIndex index;
    index.m_nodes = std::move(nodes);
    index.m_metadata = std::move(metadata);
    index.m_format = format;
    index.finalize();
    return index;
}

void SpatialIndex::finalize()
{
    m_slot_by_id.clear();
    m_slot_by_id.reserve(m_nodes.size());
    m_has_temperature = false;
    for (std::size_t slot = 0; slot < m_nodes.size(); ++slot)
    {
        m_slot_by_id.emplace(m_nodes[slot].id, slot);
        m_has_temperature = m_has_temperature || m_nodes[slot].temperature.has_value();
    }

    m_subtree.assign(m_nodes.size(), SubtreeTemperature{});
    aggregate(0, m_nodes.size());
}

SpatialIndex::SubtreeTemperature SpatialIndex::aggregate(std::size_t lo, std::size_t hi)
{
    SubtreeTemperature agg;
    if (lo >= hi)
    {
        return agg;
    }

    const std::size_t mid = lo + (hi - lo) / 2;
    const auto& node = m_nodes[mid];
    if (node.temperature)
    {
        agg.min_known = *node.temperature;
        agg.max_known = *node.temperature;
        agg.any_known = true;
    }
    else
    {
        agg.any_unknown = true;
    }

    for (const auto& child : {aggregate(lo, mid), aggregate(mid + 1, hi)})
    {
        if (child.any_known)
        {
            agg.min_known = agg.any_known ? std::min(agg.min_known, child.min_known) : child.min_known;
            agg.max_known = agg.any_known ? std::max(agg.max_known, child.max_known) : child.max_known;
            agg.any_known = true;
        }
        agg.any_unknown = agg.any_unknown || child.any_unknown;
    }

    m_subtree[mid] = agg;
    return agg;
}

// -----------------------------------------------------------------
// Filter helpers
// -----------------------------------------------------------------

bool SpatialIndex::subtree_rejected(const Search& s, std::size_t mid) const
{
    const auto& agg = m_subtree[mid];
    return agg.any_known && !agg.any_unknown &&
           agg.min_known > s.filter->max_temperature;
}

bool SpatialIndex::subtree_accepted(const Search& s, std::size_t mid) const
{
    const auto& agg = m_subtree[mid];
    return !agg.any_known || agg.max_known <= s.filter->max_temperature;
}

bool SpatialIndex::node_passes(const Search& s, std::size_t slot) const
{
    const auto& t = m_nodes[slot].temperature;
    return !t || *t <= s.filter->max_temperature;
}

// -----------------------------------------------------------------
// Nearest
// -----------------------------------------------------------------

void SpatialIndex::search_nearest(Search& s, std::size_t lo, std::size_t hi, std::size_t depth,
                                  bool accept_all) const
{
    if (lo >= hi)
    {
        return;
    }

    const std::size_t mid = lo + (hi - lo) / 2;
    if (s.filter && !accept_all)
    {
        if (subtree_rejected(s, mid))
        {
            return;
        }
        accept_all = subtree_accepted(s, mid);
    }

    const auto& node = m_nodes[mid];
    if (!s.filter || accept_all || node_passes(s, mid))
    {
        const std::pair<f64, PointId> hit{distance_squared(s.point, node.position), node.id};
        if (s.hits.size() < s.k)
        {
            s.hits.push_back(hit);
            std::push_heap(s.hits.begin(), s.hits.end());
        }
        else if (hit < s.hits.front())
        {
            std::pop_heap(s.hits.begin(), s.hits.end());
            s.hits.back() = hit;
            std::push_heap(s.hits.begin(), s.hits.end());
        }
    }

    const std::size_t axis = depth % kDimensions;
    const f64 diff = s.point[axis] - node.position[axis];

    const bool go_left_first = diff < 0.0;
    if (go_left_first)
    {
        search_nearest(s, lo, mid, depth + 1, accept_all);
    }
    else
    {
        search_nearest(s, mid + 1, hi, depth + 1, accept_all);
    }

    // Far side can only help while the heap is short or the splitting plane is within reach.
    if (s.hits.size() < s.k || diff * diff <= s.hits.front().first)
    {
        if (go_left_first)
        {
            search_nearest(s, mid + 1, hi, depth + 1, accept_all);
        }
        else
        {
            search_nearest(s, lo, mid, depth + 1, accept_all);
        }
    }
}

std::vector<Neighbour> SpatialIndex::nearest(const Vec3d& point, std::size_t k) const
{
    if (k == 0 || m_nodes.empty())
    {
        return {};
    }

    Search s{.point = point, .k = k};
    s.hits.reserve(std::min(k, m_nodes.size()));
    search_nearest(s, 0, m_nodes.size(), 0, false);
    return to_neighbours(std::move(s.hits));
}

std::vector<Neighbour> SpatialIndex::nearest_filtered(const Vec3d& point, std::size_t k,
                                                      const TemperatureFilter& filter) const
{
    if (k == 0 || m_nodes.empty())
    {
        return {};
    }

    Search s{.point = point, .k = k, .filter = &filter};
    s.hits.reserve(std::min(k, m_nodes.size()));
    search_nearest(s, 0, m_nodes.size(), 0, false);
    return to_neighbours(std::move(s.hits));
}

// -----------------------------------------------------------------
// Radius
// -----------------------------------------------------------------

void SpatialIndex::search_radius(Search& s, std::size_t lo, std::size_t hi, std::size_t depth,
                                 bool accept_all) const
{
    if (lo >= hi)
    {
        return;
    }

    const std::size_t mid = lo + (hi - lo) / 2;
    if (s.filter && !accept_all)
    {
        if (subtree_rejected(s, mid))
        {
            return;
        }
        accept_all = subtree_accepted(s, mid);
    }

    const auto& node = m_nodes[mid];
    if (!s.filter || accept_all || node_passes(s, mid))
    {
        const f64 d2 = distance_squared(s.point, node.position);
        if (d2 <= s.radius_sq)
        {
            s.hits.emplace_back(d2, node.id);
        }
    }

    const std::size_t axis = depth % kDimensions;
    const f64 diff = s.point[axis] - node.position[axis];

    if (diff <= 0.0 || diff * diff <= s.radius_sq)
    {
        search_radius(s, lo, mid, depth + 1, accept_all);
    }
    if (diff >= 0.0 || diff * diff <= s.radius_sq)
    {
        search_radius(s, mid + 1, hi, depth + 1, accept_all);
    }
}

std::vector<Neighbour> SpatialIndex::within_radius(const Vec3d& point, f64 r) const
{
    if (!(r > 0.0) || m_nodes.empty())
    {
        return {};
    }

    Search s{.point = point, .radius_sq = r * r};
    search_radius(s, 0, m_nodes.size(), 0, false);
    return to_neighbours(std::move(s.hits));
}

std::vector<Neighbour> SpatialIndex::within_radius_filtered(const Vec3d& point, f64 r,
                                                            const TemperatureFilter& filter) const
{
    if (!(r > 0.0) || m_nodes.empty())
    {
        return {};
    }

    Search s{.point = point, .radius_sq = r * r, .filter = &filter};
    search_radius(s, 0, m_nodes.size(), 0, false);
    return to_neighbours(std::move(s.hits));
}

// -----------------------------------------------------------------
// Accessors
// -----------------------------------------------------------------

std::optional<Vec3d> SpatialIndex::position(PointId id) const
{
    const auto it = m_slot_by_id.find(id);
    if (it == m_slot_by_id.end())
    {
        return std::nullopt;
    }
    return m_nodes[it->second].position;
}

std::optional<f64> SpatialIndex::temperature(PointId id) const
{
    const auto it = m_slot_by_id.find(id);
    if (it == m_slot_by_id.end() || !m_nodes[it->second].temperature)
    {
        return std::nullopt;
    }
    return *m_nodes[it->second].temperature;
}

// -----------------------------------------------------------------
// Freshness
// -----------------------------------------------------------------

const char* to_string(Freshness freshness)
{
    switch (freshness)
    {
        case Freshness::Fresh:  return "fresh";
        case Freshness::Stale:  return "stale";
        case Freshness::Legacy: return "legacy";
    }
    return "unknown";
}

FreshnessReport check_freshness(const SpatialIndex& index,
                                const starmap::DatasetFingerprint& fingerprint)
{
    FreshnessReport report;
    report.expected_checksum = core::hex_encode(fingerprint.checksum);
    report.expected_tag = fingerprint.release_tag;

    const IndexMetadata* metadata = index.metadata();
    if (metadata == nullptr || index.format() == IndexFormat::Legacy)
    {
        report.status = Freshness::Legacy;
        return report;
    }

    report.actual_checksum = core::hex_encode(metadata->source_checksum);
    report.actual_tag = metadata->release_tag;
    report.status = metadata->source_checksum == fingerprint.checksum ? Freshness::Fresh
                                                                      : Freshness::Stale;
    return report;
}

} // namespace starlane::spatial
