#pragma once

/// @file point_set.hpp
/// @brief Immutable snapshot of star systems and their gate connections.

#include "starmap/point.hpp"

#include "core/types.hpp"

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace starlane::starmap
{
    /// @brief Identity of the dataset a point-set was built from.
    struct DatasetFingerprint
    {
        Sha256Digest checksum{};
        std::optional<std::string> release_tag;
    };

    /// @brief Read-only collection of points plus a symmetric gate-adjacency relation.
    ///
    /// Built once through PointSet::Builder and never mutated afterwards, so a
    /// single instance can be shared across concurrent route requests.
    class PointSet
    {
    public:
        class Builder;

        [[nodiscard]] const Point* find(PointId id) const;

        /// @brief Resolve a name: exact match first, then case-insensitive.
        [[nodiscard]] std::optional<PointId> id_by_name(std::string_view name) const;

        /// @brief Name of a point, or an empty view for unknown ids.
        [[nodiscard]] std::string_view name_of(PointId id) const;

        /// @brief Position of a point, if it has coordinates.
        [[nodiscard]] std::optional<Vec3d> position_of(PointId id) const;

        /// @brief Gate neighbours of a point, in first-seen order.
        [[nodiscard]] std::span<const PointId> gates(PointId id) const;

        /// @brief All points in insertion order.
        [[nodiscard]] const std::vector<Point>& points() const { return m_points; }

        /// @brief All point names in insertion order (for suggestions).
        [[nodiscard]] std::vector<std::string> names() const;

        [[nodiscard]] std::size_t size() const { return m_points.size(); }
        [[nodiscard]] bool empty() const { return m_points.empty(); }
        [[nodiscard]] std::size_t gate_link_count() const { return m_gate_link_count; }

        [[nodiscard]] const DatasetFingerprint& fingerprint() const { return m_fingerprint; }
        [[nodiscard]] const Sha256Digest& checksum() const { return m_fingerprint.checksum; }

    private:
        PointSet() = default;

        std::vector<Point> m_points;
        std::unordered_map<PointId, std::size_t> m_index_by_id;
        std::unordered_map<std::string, PointId> m_id_by_name;
        std::unordered_map<std::string, PointId> m_id_by_lower_name;
        std::vector<std::vector<PointId>> m_gates;   ///< Parallel to m_points
        std::size_t m_gate_link_count = 0;           ///< Undirected gate links
        DatasetFingerprint m_fingerprint;
    };

    /// @brief Accumulates points and gates, then freezes them into a PointSet.
    class PointSet::Builder
    {
    public:
        /// @brief Add a point. A duplicate id is ignored with a warning (first wins).
        /// @return false when the point was rejected.
        bool add_point(Point point);

        /// @brief Add an undirected gate link. Self links are ignored.
        void add_gate(PointId a, PointId b);

        /// @brief Use a supplier-provided fingerprint instead of hashing the contents.
        void set_fingerprint(DatasetFingerprint fingerprint);

        /// @brief Attach a release tag to the computed fingerprint.
        void set_release_tag(std::string tag);

        /// @brief Freeze the accumulated data. Gates naming unknown ids are dropped.
        [[nodiscard]] std::shared_ptr<const PointSet> build();

    private:
        std::vector<Point> m_points;
        std::unordered_map<PointId, std::size_t> m_index_by_id;
        std::vector<std::pair<PointId, PointId>> m_gates;
        std::optional<DatasetFingerprint> m_fingerprint;
        std::optional<std::string> m_release_tag;
    };

    /// @brief ASCII lowercase copy of a name.
    [[nodiscard]] std::string to_lower_ascii(std::string_view text);

} // namespace starlane::starmap
