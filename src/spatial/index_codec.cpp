/// @file index_codec.cpp
/// @brief SpatialIndex (de)serialization: header, metadata, zlib body, SHA-256 trailer.

#include "spatial/index_codec.hpp"

#include "core/checksum.hpp"
#include "core/logger.hpp"

#include <zlib.h>

#include <algorithm>
#include <bit>
#include <limits>
#include <string>
#include <unordered_set>

namespace starlane::spatial
{

namespace
{

// -----------------------------------------------------------------
// Little-endian byte helpers
// -----------------------------------------------------------------

class ByteWriter
{
public:
    explicit ByteWriter(std::vector<u8>& out) : m_out(out) {}

    void put_u8(u8 v) { m_out.push_back(v); }

    void put_u16(u16 v) { put_le(v, 2); }
    void put_u32(u32 v) { put_le(v, 4); }
    void put_i64(i64 v) { put_le(static_cast<u64>(v), 8); }
    void put_f32(f32 v) { put_le(std::bit_cast<u32>(v), 4); }
    void put_f64(f64 v) { put_le(std::bit_cast<u64>(v), 8); }

    void put_bytes(std::span<const u8> bytes) { m_out.insert(m_out.end(), bytes.begin(), bytes.end()); }

private:
    void put_le(u64 v, int width)
    {
        for (int i = 0; i < width; ++i)
        {
            m_out.push_back(static_cast<u8>(v >> (8 * i)));
        }
    }

    std::vector<u8>& m_out;
};

class ByteReader
{
public:
    explicit ByteReader(std::span<const u8> bytes) : m_bytes(bytes) {}

    [[nodiscard]] std::size_t remaining() const { return m_bytes.size() - m_pos; }
    [[nodiscard]] std::size_t position() const { return m_pos; }

    [[nodiscard]] std::optional<u8> get_u8()
    {
        const auto v = get_le(1);
        return v ? std::optional<u8>(static_cast<u8>(*v)) : std::nullopt;
    }
    [[nodiscard]] std::optional<u16> get_u16()
    {
        const auto v = get_le(2);
        return v ? std::optional<u16>(static_cast<u16>(*v)) : std::nullopt;
    }
    [[nodiscard]] std::optional<u32> get_u32()
    {
        const auto v = get_le(4);
        return v ? std::optional<u32>(static_cast<u32>(*v)) : std::nullopt;
    }
    [[nodiscard]] std::optional<i64> get_i64()
    {
        const auto v = get_le(8);
        return v ? std::optional<i64>(static_cast<i64>(*v)) : std::nullopt;
    }
    [[nodiscard]] std::optional<f32> get_f32()
    {
        const auto v = get_le(4);
        return v ? std::optional<f32>(std::bit_cast<f32>(static_cast<u32>(*v))) : std::nullopt;
    }
    [[nodiscard]] std::optional<f64> get_f64()
    {
        const auto v = get_le(8);
        return v ? std::optional<f64>(std::bit_cast<f64>(*v)) : std::nullopt;
    }

    [[nodiscard]] std::optional<std::span<const u8>> get_bytes(std::size_t n)
    {
        if (remaining() < n)
        {
            return std::nullopt;
        }
        const auto out = m_bytes.subspan(m_pos, n);
        m_pos += n;
        return out;
    }

private:
    std::optional<u64> get_le(std::size_t width)
    {
        if (remaining() < width)
        {
            return std::nullopt;
        }
        u64 v = 0;
        for (std::size_t i = 0; i < width; ++i)
        {
            v |= static_cast<u64>(m_bytes[m_pos + i]) << (8 * i);
        }
        m_pos += width;
        return v;
    }

    std::span<const u8> m_bytes;
    std::size_t m_pos = 0;
};

std::size_t max_node_size(CoordinatePrecision precision)
{
    return 8 + 3 * static_cast<std::size_t>(precision) + 1 + 4;
}

/// Header and metadata block; leaves the reader positioned at the body.
Result<IndexHeader> read_header(ByteReader& reader)
{
    const auto header_bytes = reader.get_bytes(kIndexHeaderSize);
    if (!header_bytes)
    {
        return Error::corrupt_index("truncated header");
    }

    const auto& h = *header_bytes;
    if (!std::equal(h.begin(), h.begin() + 4, std::begin(kIndexMagic)))
    {
        return Error::corrupt_index("bad magic");
    }

    IndexHeader header;
    header.version = h[4];
    header.flags = h[5];
    header.node_count = static_cast<u32>(h[6]) | (static_cast<u32>(h[7]) << 8) |
                        (static_cast<u32>(h[8]) << 16) | (static_cast<u32>(h[9]) << 24);
    const u8 precision = h[10];

    if (header.version == 0)
    {
        return Error::corrupt_index("version 0");
    }
    if (header.version > kCurrentIndexVersion)
    {
        return Error::unsupported_version(header.version, kCurrentIndexVersion);
    }
    if (precision != static_cast<u8>(CoordinatePrecision::F32) &&
        precision != static_cast<u8>(CoordinatePrecision::F64))
    {
        return Error::corrupt_index("invalid coordinate precision " + std::to_string(precision));
    }
    header.precision = static_cast<CoordinatePrecision>(precision);

    if (header.has_metadata())
    {
        if (header.version < kCurrentIndexVersion)
        {
            return Error::corrupt_index("metadata flag set on a version 1 file");
        }

        IndexMetadata metadata;
        const auto checksum = reader.get_bytes(metadata.source_checksum.size());
        const auto tag_len = reader.get_u16();
        if (!checksum || !tag_len)
        {
            return Error::corrupt_index("truncated metadata");
        }
        std::copy(checksum->begin(), checksum->end(), metadata.source_checksum.begin());

        const auto tag = reader.get_bytes(*tag_len);
        const auto timestamp = reader.get_i64();
        if (!tag || !timestamp)
        {
            return Error::corrupt_index("truncated metadata");
        }
        if (*tag_len > 0)
        {
            metadata.release_tag = std::string(tag->begin(), tag->end());
        }
        metadata.build_timestamp = *timestamp;
        header.metadata = std::move(metadata);
    }

    return header;
}

} // namespace

// -----------------------------------------------------------------
// serialize
// -----------------------------------------------------------------

Result<std::vector<u8>> serialize(const SpatialIndex& index, const SerializeOptions& options)
{
    if (index.size() > std::numeric_limits<u32>::max())
    {
        return Error::corrupt_index("too many nodes to encode: " + std::to_string(index.size()));
    }

    const IndexMetadata* metadata = options.include_metadata ? index.metadata() : nullptr;
    if (metadata && metadata->release_tag &&
        metadata->release_tag->size() > std::numeric_limits<u16>::max())
    {
        return Error::corrupt_index("release tag too long to encode");
    }

    // ---- Raw body ----
    std::vector<u8> raw;
    raw.reserve(index.size() * max_node_size(options.precision));
    {
        ByteWriter body(raw);
        for (const auto& node : index.nodes())
        {
            body.put_i64(node.id);
            for (int axis = 0; axis < 3; ++axis)
            {
                if (options.precision == CoordinatePrecision::F32)
                {
                    body.put_f32(static_cast<f32>(node.position[axis]));
                }
                else
                {
                    body.put_f64(node.position[axis]);
                }
            }
            body.put_u8(node.temperature ? 1 : 0);
            if (node.temperature)
            {
                body.put_f32(static_cast<f32>(*node.temperature));
            }
        }
    }

    // ---- Compress ----
    uLongf compressed_len = compressBound(static_cast<uLong>(raw.size()));
    std::vector<u8> compressed(compressed_len);
    const int level = std::clamp(options.compression_level, 0, 9);
    const int rc = compress2(compressed.data(), &compressed_len, raw.data(),
                             static_cast<uLong>(raw.size()), level);
    if (rc != Z_OK)
    {
        return Error::corrupt_index("zlib compression failed (code " + std::to_string(rc) + ")");
    }
    compressed.resize(compressed_len);

    // ---- Assemble ----
    std::vector<u8> out;
    out.reserve(kIndexHeaderSize + 64 + compressed.size() + kIndexTrailerSize);
    ByteWriter writer(out);

    u8 flags = 0;
    if (index.has_temperature())
    {
        flags |= kFlagHasTemperature;
    }
    if (metadata)
    {
        flags |= kFlagHasMetadata;
    }

    writer.put_bytes(kIndexMagic);
    writer.put_u8(kCurrentIndexVersion);
    writer.put_u8(flags);
    writer.put_u32(static_cast<u32>(index.size()));
    writer.put_u8(static_cast<u8>(options.precision));
    for (int i = 0; i < 5; ++i)
    {
        writer.put_u8(0);
    }

    if (metadata)
    {
        writer.put_bytes(metadata->source_checksum);
        const std::string tag = metadata->release_tag.value_or("");
        writer.put_u16(static_cast<u16>(tag.size()));
        writer.put_bytes(std::span<const u8>(reinterpret_cast<const u8*>(tag.data()), tag.size()));
        writer.put_i64(metadata->build_timestamp);
    }

    writer.put_bytes(compressed);
    writer.put_bytes(core::Sha256::digest(compressed));

    SL_CORE_INFO("IndexCodec: Encoded {} nodes into {} bytes ({} body bytes compressed to {})",
                 index.size(), out.size(), raw.size(), compressed.size());
    return out;
}

// -----------------------------------------------------------------
// peek_header
// -----------------------------------------------------------------

Result<IndexHeader> peek_header(std::span<const u8> bytes)
{
    ByteReader reader(bytes);
    return read_header(reader);
}

// -----------------------------------------------------------------
// deserialize
// -----------------------------------------------------------------

Result<SpatialIndex> deserialize(std::span<const u8> bytes)
{
    ByteReader reader(bytes);
    auto header_result = read_header(reader);
    if (!header_result)
    {
        return header_result.error();
    }
    IndexHeader header = std::move(header_result).value();

    if (reader.remaining() < kIndexTrailerSize)
    {
        return Error::corrupt_index("truncated body");
    }

    const std::size_t body_len = reader.remaining() - kIndexTrailerSize;
    const auto body = bytes.subspan(reader.position(), body_len);
    const auto trailer = bytes.subspan(reader.position() + body_len, kIndexTrailerSize);

    // Verify before decompressing so corrupted bytes never reach zlib.
    const Sha256Digest digest = core::Sha256::digest(body);
    if (!std::equal(digest.begin(), digest.end(), trailer.begin()))
    {
        return Error::corrupt_index("checksum mismatch");
    }

    const std::size_t node_size = max_node_size(header.precision);
    if (header.node_count > 0 && body_len == 0)
    {
        return Error::corrupt_index("empty body for " + std::to_string(header.node_count) + " nodes");
    }

    // zlib cannot expand beyond ~1032:1, so a larger claim is a lie about node_count.
    constexpr std::size_t kMaxDeflateRatio = 1032;
    const std::size_t min_node_size = node_size - 4;
    if (static_cast<std::size_t>(header.node_count) * min_node_size > (body_len + 1) * kMaxDeflateRatio)
    {
        return Error::corrupt_index("node count " + std::to_string(header.node_count) +
                                    " exceeds what the body can hold");
    }

    uLongf raw_len = static_cast<uLongf>(std::max<std::size_t>(header.node_count * node_size, 1));
    std::vector<u8> raw(raw_len);
    const int rc = uncompress(raw.data(), &raw_len, body.data(), static_cast<uLong>(body.size()));
    if (rc != Z_OK)
    {
        return Error::corrupt_index("decompression failed (code " + std::to_string(rc) + ")");
    }
    raw.resize(raw_len);

    // ---- Nodes ----
    std::vector<IndexNode> nodes;
    nodes.reserve(header.node_count);
    std::unordered_set<PointId> seen;
    seen.reserve(header.node_count);

    ByteReader body_reader(raw);
    for (u32 i = 0; i < header.node_count; ++i)
    {
        IndexNode node;
        const auto id = body_reader.get_i64();
        if (!id)
        {
            return Error::corrupt_index("body length does not match node count");
        }
        node.id = *id;

        for (int axis = 0; axis < 3; ++axis)
        {
            std::optional<f64> coord;
            if (header.precision == CoordinatePrecision::F32)
            {
                const auto v = body_reader.get_f32();
                coord = v ? std::optional<f64>(static_cast<f64>(*v)) : std::nullopt;
            }
            else
            {
                coord = body_reader.get_f64();
            }
            if (!coord)
            {
                return Error::corrupt_index("body length does not match node count");
            }
            node.position[axis] = *coord;
        }

        const auto temp_flag = body_reader.get_u8();
        if (!temp_flag || *temp_flag > 1)
        {
            return Error::corrupt_index("invalid temperature flag at node " + std::to_string(i));
        }
        if (*temp_flag == 1)
        {
            if (!header.has_temperature())
            {
                return Error::corrupt_index("temperature present but header flag unset");
            }
            const auto temp = body_reader.get_f32();
            if (!temp)
            {
                return Error::corrupt_index("body length does not match node count");
            }
            node.temperature = static_cast<f64>(*temp);
        }

        if (!seen.insert(node.id).second)
        {
            return Error::corrupt_index("duplicate node id " + std::to_string(node.id));
        }
        nodes.push_back(node);
    }

    if (body_reader.remaining() != 0)
    {
        return Error::corrupt_index("body length does not match node count");
    }

    const IndexFormat format = header.metadata ? IndexFormat::Current : IndexFormat::Legacy;
    if (format == IndexFormat::Legacy)
    {
        SL_CORE_WARN("IndexCodec: Index (version {}) carries no source metadata; "
                     "freshness cannot be verified", header.version);
    }

    SL_CORE_DEBUG("IndexCodec: Decoded {} nodes (version {}, flags {:#04x})",
                  nodes.size(), header.version, header.flags);
    return SpatialIndex::from_tree_nodes(std::move(nodes), std::move(header.metadata), format);
}

} // namespace starlane::spatial
