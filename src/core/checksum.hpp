#pragma once

/// @file checksum.hpp
/// @brief SHA-256 digests (OpenSSL EVP) and hex rendering.

#include "core/types.hpp"

#include <span>
#include <string>
#include <string_view>

struct evp_md_ctx_st;

namespace starlane::core
{
    /// @brief Incremental SHA-256 over any number of byte chunks.
    class Sha256
    {
    public:
        Sha256();
        ~Sha256();

        Sha256(const Sha256&) = delete;
        Sha256& operator=(const Sha256&) = delete;

        void update(std::span<const u8> bytes);
        void update(std::string_view text);

        /// @brief Append a value's little-endian byte representation.
        void update_i64(i64 value);
        void update_f64(f64 value);

        /// @brief Finish the digest. The hasher must not be updated afterwards.
        [[nodiscard]] Sha256Digest finish();

        /// @brief One-shot digest of a buffer.
        [[nodiscard]] static Sha256Digest digest(std::span<const u8> bytes);

    private:
        evp_md_ctx_st* m_ctx = nullptr;
    };

    /// @brief Lowercase hex rendering of a byte sequence.
    [[nodiscard]] std::string hex_encode(std::span<const u8> bytes);

} // namespace starlane::core
