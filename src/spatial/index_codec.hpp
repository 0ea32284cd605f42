#pragma once

/// @file index_codec.hpp
/// @brief Versioned, checksummed binary form of a SpatialIndex.
///
/// Layout (little-endian):
///
///   Header, 16 bytes
///     magic "SLSI" | version u8 | flags u8 | node_count u32 | precision u8 | reserved 5B
///   Metadata, when flags bit1 is set (version 2 and later)
///     source_checksum 32B | tag_len u16 | tag bytes | build_timestamp i64
///   Body
///     zlib stream of nodes in tree order:
///     id i64 | x y z (f32 or f64 by precision) | temp_flag u8 | temp f32 when temp_flag = 1
///   Trailer
///     SHA-256 of the compressed body, 32B

#include "spatial/spatial_index.hpp"

#include "core/error.hpp"
#include "core/types.hpp"

#include <optional>
#include <span>
#include <vector>

namespace starlane::spatial
{
    inline constexpr u8 kIndexMagic[4] = {'S', 'L', 'S', 'I'};
    inline constexpr u8 kLegacyIndexVersion = 1;
    inline constexpr u8 kCurrentIndexVersion = 2;
    inline constexpr std::size_t kIndexHeaderSize = 16;
    inline constexpr std::size_t kIndexTrailerSize = 32;

    inline constexpr u8 kFlagHasTemperature = 0x01;
    inline constexpr u8 kFlagHasMetadata = 0x02;

    /// @brief Width of stored coordinates, in bytes.
    enum class CoordinatePrecision : u8
    {
        F32 = 4,
        F64 = 8,
    };

    struct SerializeOptions
    {
        CoordinatePrecision precision = CoordinatePrecision::F64;
        int compression_level = 6;     ///< zlib level, clamped to [0, 9]
        bool include_metadata = true;  ///< false writes a metadata-less (legacy) file
    };

    /// @brief Decoded header (and metadata block, when present).
    struct IndexHeader
    {
        u8 version = 0;
        u8 flags = 0;
        u32 node_count = 0;
        CoordinatePrecision precision = CoordinatePrecision::F64;
        std::optional<IndexMetadata> metadata;

        [[nodiscard]] bool has_temperature() const { return (flags & kFlagHasTemperature) != 0; }
        [[nodiscard]] bool has_metadata() const { return (flags & kFlagHasMetadata) != 0; }
    };

    /// @brief Encode an index into a fresh byte buffer.
    [[nodiscard]] Result<std::vector<u8>> serialize(const SpatialIndex& index,
                                                    const SerializeOptions& options = {});

    /// @brief Decode and verify an index.
    ///
    /// Fails with CorruptIndex (bad magic, truncated data, checksum mismatch,
    /// decompression failure, node count mismatch) or UnsupportedVersion. A
    /// file without metadata decodes with format() == IndexFormat::Legacy.
    [[nodiscard]] Result<SpatialIndex> deserialize(std::span<const u8> bytes);

    /// @brief Decode only the header and metadata block; the body is not verified.
    [[nodiscard]] Result<IndexHeader> peek_header(std::span<const u8> bytes);

} // namespace starlane::spatial
