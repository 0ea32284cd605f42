/// @file point_set.cpp
/// @brief PointSet lookups and Builder freezing (gate symmetrization, fingerprinting).

#include "starmap/point_set.hpp"

#include "core/checksum.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cctype>

namespace starlane::starmap
{

std::string to_lower_ascii(std::string_view text)
{
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// -----------------------------------------------------------------
// Lookups
// -----------------------------------------------------------------

const Point* PointSet::find(PointId id) const
{
    const auto it = m_index_by_id.find(id);
    return it == m_index_by_id.end() ? nullptr : &m_points[it->second];
}

std::optional<PointId> PointSet::id_by_name(std::string_view name) const
{
    if (const auto it = m_id_by_name.find(std::string(name)); it != m_id_by_name.end())
    {
        return it->second;
    }
    if (const auto it = m_id_by_lower_name.find(to_lower_ascii(name)); it != m_id_by_lower_name.end())
    {
        return it->second;
    }
    return std::nullopt;
}

std::string_view PointSet::name_of(PointId id) const
{
    const Point* p = find(id);
    return p ? std::string_view(p->name) : std::string_view{};
}

std::optional<Vec3d> PointSet::position_of(PointId id) const
{
    const Point* p = find(id);
    return p ? p->position : std::nullopt;
}

std::span<const PointId> PointSet::gates(PointId id) const
{
    const auto it = m_index_by_id.find(id);
    if (it == m_index_by_id.end())
    {
        return {};
    }
    return m_gates[it->second];
}

std::vector<std::string> PointSet::names() const
{
    std::vector<std::string> out;
    out.reserve(m_points.size());
    for (const auto& p : m_points)
    {
        out.push_back(p.name);
    }
    return out;
}

// -----------------------------------------------------------------
// Builder
// -----------------------------------------------------------------

bool PointSet::Builder::add_point(Point point)
{
    if (m_index_by_id.contains(point.id))
    {
        SL_CORE_WARN("PointSet: Duplicate point id {} ('{}') ignored", point.id, point.name);
        return false;
    }
    m_index_by_id.emplace(point.id, m_points.size());
    m_points.push_back(std::move(point));
    return true;
}

void PointSet::Builder::add_gate(PointId a, PointId b)
{
    if (a == b)
    {
        return;
    }
    m_gates.emplace_back(a, b);
}

void PointSet::Builder::set_fingerprint(DatasetFingerprint fingerprint)
{
    m_fingerprint = std::move(fingerprint);
}

void PointSet::Builder::set_release_tag(std::string tag)
{
    m_release_tag = std::move(tag);
}

namespace
{

// Canonical content hash: points by ascending id, then undirected gate pairs.
Sha256Digest hash_contents(const std::vector<Point>& points,
                           const std::vector<std::pair<PointId, PointId>>& links)
{
    std::vector<const Point*> sorted;
    sorted.reserve(points.size());
    for (const auto& p : points)
    {
        sorted.push_back(&p);
    }
    std::sort(sorted.begin(), sorted.end(),
              [](const Point* a, const Point* b) { return a->id < b->id; });

    core::Sha256 hasher;
    hasher.update_i64(static_cast<i64>(sorted.size()));
    for (const Point* p : sorted)
    {
        hasher.update_i64(p->id);
        hasher.update_i64(static_cast<i64>(p->name.size()));
        hasher.update(p->name);
        if (p->position)
        {
            hasher.update_i64(1);
            hasher.update_f64(p->position->x);
            hasher.update_f64(p->position->y);
            hasher.update_f64(p->position->z);
        }
        else
        {
            hasher.update_i64(0);
        }
        if (p->metadata.temperature)
        {
            hasher.update_i64(1);
            hasher.update_f64(*p->metadata.temperature);
        }
        else
        {
            hasher.update_i64(0);
        }
    }

    hasher.update_i64(static_cast<i64>(links.size()));
    for (const auto& [a, b] : links)
    {
        hasher.update_i64(a);
        hasher.update_i64(b);
    }
    return hasher.finish();
}

} // namespace

std::shared_ptr<const PointSet> PointSet::Builder::build()
{
    std::shared_ptr<PointSet> set(new PointSet());

    set->m_points = std::move(m_points);
    set->m_index_by_id = std::move(m_index_by_id);
    set->m_gates.resize(set->m_points.size());

    for (const auto& p : set->m_points)
    {
        if (!set->m_id_by_name.emplace(p.name, p.id).second)
        {
            SL_CORE_WARN("PointSet: Name '{}' is shared by several points; resolving to id {}",
                         p.name, set->m_id_by_name.at(p.name));
        }
        set->m_id_by_lower_name.emplace(to_lower_ascii(p.name), p.id);
    }

    // Symmetrize: each undirected pair appears once in both adjacency lists.
    std::vector<std::pair<PointId, PointId>> links;
    links.reserve(m_gates.size());
    std::size_t dropped = 0;
    for (const auto& [a, b] : m_gates)
    {
        const auto ia = set->m_index_by_id.find(a);
        const auto ib = set->m_index_by_id.find(b);
        if (ia == set->m_index_by_id.end() || ib == set->m_index_by_id.end())
        {
            ++dropped;
            continue;
        }

        auto& from_a = set->m_gates[ia->second];
        if (std::find(from_a.begin(), from_a.end(), b) != from_a.end())
        {
            continue;
        }
        from_a.push_back(b);
        set->m_gates[ib->second].push_back(a);
        links.emplace_back(std::min(a, b), std::max(a, b));
    }
    m_gates.clear();

    if (dropped > 0)
    {
        SL_CORE_WARN("PointSet: Dropped {} gate links naming unknown points", dropped);
    }
    set->m_gate_link_count = links.size();

    if (m_fingerprint)
    {
        set->m_fingerprint = std::move(*m_fingerprint);
    }
    else
    {
        std::sort(links.begin(), links.end());
        set->m_fingerprint.checksum = hash_contents(set->m_points, links);
    }
    if (m_release_tag)
    {
        set->m_fingerprint.release_tag = std::move(m_release_tag);
    }

    SL_CORE_INFO("PointSet: Built {} points, {} gate links", set->m_points.size(),
                 set->m_gate_link_count);

    m_index_by_id.clear();
    m_fingerprint.reset();
    m_release_tag.reset();
    return set;
}

} // namespace starlane::starmap
