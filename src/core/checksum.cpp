/// @file checksum.cpp
/// @brief SHA-256 via the OpenSSL EVP interface.

#include "core/checksum.hpp"

#include "core/logger.hpp"

#include <openssl/evp.h>

#include <bit>
#include <cstdlib>

namespace starlane::core
{

namespace
{

// EVP failures only happen on allocation failure or a broken OpenSSL install.
void check_evp(int rc, const char* what)
{
    if (rc != 1)
    {
        SL_CORE_CRITICAL("Sha256: {} failed", what);
        std::abort();
    }
}

} // namespace

Sha256::Sha256()
    : m_ctx(EVP_MD_CTX_new())
{
    if (m_ctx == nullptr)
    {
        SL_CORE_CRITICAL("Sha256: EVP_MD_CTX_new failed");
        std::abort();
    }
    check_evp(EVP_DigestInit_ex(m_ctx, EVP_sha256(), nullptr), "EVP_DigestInit_ex");
}

Sha256::~Sha256()
{
    EVP_MD_CTX_free(m_ctx);
}

void Sha256::update(std::span<const u8> bytes)
{
    if (bytes.empty())
    {
        return;
    }
    check_evp(EVP_DigestUpdate(m_ctx, bytes.data(), bytes.size()), "EVP_DigestUpdate");
}

void Sha256::update(std::string_view text)
{
    update(std::span<const u8>(reinterpret_cast<const u8*>(text.data()), text.size()));
}

void Sha256::update_i64(i64 value)
{
    u8 buf[8];
    const u64 bits = static_cast<u64>(value);
    for (int i = 0; i < 8; ++i)
    {
        buf[i] = static_cast<u8>(bits >> (8 * i));
    }
    update(std::span<const u8>(buf, 8));
}

void Sha256::update_f64(f64 value)
{
    update_i64(static_cast<i64>(std::bit_cast<u64>(value)));
}

Sha256Digest Sha256::finish()
{
    Sha256Digest out{};
    unsigned int len = 0;
    check_evp(EVP_DigestFinal_ex(m_ctx, out.data(), &len), "EVP_DigestFinal_ex");
    return out;
}

Sha256Digest Sha256::digest(std::span<const u8> bytes)
{
    Sha256 hasher;
    hasher.update(bytes);
    return hasher.finish();
}

std::string hex_encode(std::span<const u8> bytes)
{
    constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (const u8 b : bytes)
    {
        out.push_back(kHex[b >> 4]);
        out.push_back(kHex[b & 0x0F]);
    }
    return out;
}

} // namespace starlane::core
