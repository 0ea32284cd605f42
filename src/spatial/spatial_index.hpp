#pragma once

/// @file spatial_index.hpp
/// @brief k-d tree over point coordinates with exact nearest/radius queries.

#include "starmap/point_set.hpp"

#include "core/types.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace starlane::spatial
{
    /// @brief A query hit.
    struct Neighbour
    {
        PointId id = 0;
        f64 distance = 0.0;
    };

    /// @brief Accept points whose temperature is at most max_temperature.
    ///
    /// Points with unknown temperature always pass.
    struct TemperatureFilter
    {
        f64 max_temperature = 0.0;
    };

    /// @brief Provenance of an index: which dataset it was built from and when.
    struct IndexMetadata
    {
        Sha256Digest source_checksum{};
        std::optional<std::string> release_tag;
        i64 build_timestamp = 0;   ///< Unix seconds
    };

    /// @brief How an index was produced.
    enum class IndexFormat
    {
        Current,   ///< Built in memory, or decoded from a file carrying metadata
        Legacy,    ///< Decoded from a file without metadata; freshness cannot be checked
    };

    /// @brief One tree node. Nodes are stored in median-split order.
    struct IndexNode
    {
        PointId id = 0;
        Vec3d position{0.0};
        std::optional<f64> temperature;   ///< Kelvin; the file format narrows it to f32
    };

    /// @brief Exact k-d tree, immutable after build.
    ///
    /// Layout is implicit: the node range [lo, hi) at depth d has its split
    /// node at mid = (lo + hi) / 2 on axis d % 3, the left subtree at
    /// [lo, mid) and the right subtree at [mid + 1, hi). Each subtree also
    /// carries the min/max of its known temperatures and whether it holds any
    /// unknown temperature; the filtered queries prune on those aggregates.
    class SpatialIndex
    {
    public:
        SpatialIndex() = default;

        /// @brief Build over every positioned point of a point-set.
        ///
        /// Metadata defaults to the point-set fingerprint stamped with the
        /// current time. Points without coordinates are skipped.
        [[nodiscard]] static SpatialIndex build(const starmap::PointSet& points,
                                                std::optional<IndexMetadata> metadata = std::nullopt);

        /// @brief Adopt nodes already laid out in median-split order (decoder use).
        [[nodiscard]] static SpatialIndex from_tree_nodes(std::vector<IndexNode> nodes,
                                                          std::optional<IndexMetadata> metadata,
                                                          IndexFormat format);

        // ---- Queries ----

        /// @brief The min(k, size()) closest points, nearest first; ties ordered by id.
        [[nodiscard]] std::vector<Neighbour> nearest(const Vec3d& point, std::size_t k) const;

        /// @brief Every point within distance r (inclusive), nearest first.
        [[nodiscard]] std::vector<Neighbour> within_radius(const Vec3d& point, f64 r) const;

        [[nodiscard]] std::vector<Neighbour> nearest_filtered(const Vec3d& point, std::size_t k,
                                                              const TemperatureFilter& filter) const;

        [[nodiscard]] std::vector<Neighbour> within_radius_filtered(const Vec3d& point, f64 r,
                                                                    const TemperatureFilter& filter) const;

        // ---- Accessors ----

        [[nodiscard]] std::size_t size() const { return m_nodes.size(); }
        [[nodiscard]] bool empty() const { return m_nodes.empty(); }
        [[nodiscard]] bool contains(PointId id) const { return m_slot_by_id.contains(id); }
        [[nodiscard]] std::optional<Vec3d> position(PointId id) const;
        [[nodiscard]] std::optional<f64> temperature(PointId id) const;

        /// @brief True when at least one node carries a temperature.
        [[nodiscard]] bool has_temperature() const { return m_has_temperature; }

        [[nodiscard]] const std::vector<IndexNode>& nodes() const { return m_nodes; }
        [[nodiscard]] const IndexMetadata* metadata() const { return m_metadata ? &*m_metadata : nullptr; }
        [[nodiscard]] IndexFormat format() const { return m_format; }

    private:
        struct SubtreeTemperature
        {
            f64 min_known = 0.0;
            f64 max_known = 0.0;
            bool any_known = false;
            bool any_unknown = false;
        };

        struct Search;

        void finalize();
        SubtreeTemperature aggregate(std::size_t lo, std::size_t hi);

        void search_nearest(Search& s, std::size_t lo, std::size_t hi, std::size_t depth,
                            bool accept_all) const;
        void search_radius(Search& s, std::size_t lo, std::size_t hi, std::size_t depth,
                           bool accept_all) const;

        [[nodiscard]] bool subtree_rejected(const Search& s, std::size_t mid) const;
        [[nodiscard]] bool subtree_accepted(const Search& s, std::size_t mid) const;
        [[nodiscard]] bool node_passes(const Search& s, std::size_t slot) const;

        std::vector<IndexNode> m_nodes;
        std::vector<SubtreeTemperature> m_subtree;   ///< Indexed by split-node slot
        std::unordered_map<PointId, std::size_t> m_slot_by_id;
        std::optional<IndexMetadata> m_metadata;
        IndexFormat m_format = IndexFormat::Current;
        bool m_has_temperature = false;
    };

    // -----------------------------------------------------------------
    // Freshness
    // -----------------------------------------------------------------

    enum class Freshness
    {
        Fresh,    ///< Index source checksum matches the point-set
        Stale,    ///< Index was built from different data
        Legacy,   ///< Index carries no metadata; cannot tell
    };

    [[nodiscard]] const char* to_string(Freshness freshness);

    struct FreshnessReport
    {
        Freshness status = Freshness::Legacy;
        std::string expected_checksum;   ///< Point-set checksum, hex
        std::string actual_checksum;     ///< Index source checksum, hex (empty for Legacy)
        std::optional<std::string> expected_tag;
        std::optional<std::string> actual_tag;
    };

    /// @brief Compare an index's recorded source against a dataset fingerprint.
    [[nodiscard]] FreshnessReport check_freshness(const SpatialIndex& index,
                                                  const starmap::DatasetFingerprint& fingerprint);

} // namespace starlane::spatial
