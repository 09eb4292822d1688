/**
 * @file sha256.cpp
 * @brief SHA-256 (FIPS 180-4)
 *
 * Content identifiers and record digests are built on this hash, so the
 * output must match the standard bit for bit on every platform.
 */

#include "cverify/common.hpp"

#include <algorithm>
#include <bit>
#include <format>

namespace cverify::common {

namespace {

constexpr std::size_t kBlockBytes = 64;
constexpr std::size_t kLengthOffset = kBlockBytes - sizeof(std::uint64_t);

constexpr std::array<std::uint32_t, 8> kInitialState = {
    0x6a09e667U, 0xbb67ae85U, 0x3c6ef372U, 0xa54ff53aU, 0x510e527fU, 0x9b05688cU, 0x1f83d9abU, 0x5be0cd19U,
};

constexpr std::array<std::uint32_t, 64> kRoundConstants = {
    0x428a2f98U, 0x71374491U, 0xb5c0fbcfU, 0xe9b5dba5U, 0x3956c25bU, 0x59f111f1U, 0x923f82a4U, 0xab1c5ed5U,
    0xd807aa98U, 0x12835b01U, 0x243185beU, 0x550c7dc3U, 0x72be5d74U, 0x80deb1feU, 0x9bdc06a7U, 0xc19bf174U,
    0xe49b69c1U, 0xefbe4786U, 0x0fc19dc6U, 0x240ca1ccU, 0x2de92c6fU, 0x4a7484aaU, 0x5cb0a9dcU, 0x76f988daU,
    0x983e5152U, 0xa831c66dU, 0xb00327c8U, 0xbf597fc7U, 0xc6e00bf3U, 0xd5a79147U, 0x06ca6351U, 0x14292967U,
    0x27b70a85U, 0x2e1b2138U, 0x4d2c6dfcU, 0x53380d13U, 0x650a7354U, 0x766a0abbU, 0x81c2c92eU, 0x92722c85U,
    0xa2bfe8a1U, 0xa81a664bU, 0xc24b8b70U, 0xc76c51a3U, 0xd192e819U, 0xd6990624U, 0xf40e3585U, 0x106aa070U,
    0x19a4c116U, 0x1e376c08U, 0x2748774cU, 0x34b0bcb5U, 0x391c0cb3U, 0x4ed8aa4aU, 0x5b9cca4fU, 0x682e6ff3U,
    0x748f82eeU, 0x78a5636fU, 0x84c87814U, 0x8cc70208U, 0x90befffaU, 0xa4506cebU, 0xbef9a3f7U, 0xc67178f2U,
};

[[nodiscard]] constexpr std::uint32_t load_be32(const std::uint8_t* p) noexcept
{
    return (static_cast<std::uint32_t>(p[0]) << 24U) | (static_cast<std::uint32_t>(p[1]) << 16U)
           | (static_cast<std::uint32_t>(p[2]) << 8U) | static_cast<std::uint32_t>(p[3]);
}

constexpr void store_be32(std::uint32_t value, std::uint8_t* p) noexcept
{
    p[0] = static_cast<std::uint8_t>(value >> 24U);
    p[1] = static_cast<std::uint8_t>(value >> 16U);
    p[2] = static_cast<std::uint8_t>(value >> 8U);
    p[3] = static_cast<std::uint8_t>(value);
}

}  // namespace

Sha256::Sha256() noexcept
    : m_state(kInitialState)
    , m_block{}
{}

void Sha256::reset() noexcept
{
    m_state = kInitialState;
    m_block.fill(0);
    m_block_used = 0;
    m_message_bytes = 0;
}

void Sha256::compress(const std::uint8_t* block) noexcept
{
    std::array<std::uint32_t, 64> w{};
    for (std::size_t i = 0; i < 16; ++i) {
        w[i] = load_be32(block + (i * 4));
    }
    for (std::size_t i = 16; i < w.size(); ++i) {
        const std::uint32_t s0 = std::rotr(w[i - 15], 7) ^ std::rotr(w[i - 15], 18) ^ (w[i - 15] >> 3U);
        const std::uint32_t s1 = std::rotr(w[i - 2], 17) ^ std::rotr(w[i - 2], 19) ^ (w[i - 2] >> 10U);
        w[i] = w[i - 16] + s0 + w[i - 7] + s1;
    }

    std::array<std::uint32_t, 8> v = m_state;
    for (std::size_t i = 0; i < w.size(); ++i) {
        auto& [a, b, c, d, e, f, g, h] = v;
        const std::uint32_t big_s1 = std::rotr(e, 6) ^ std::rotr(e, 11) ^ std::rotr(e, 25);
        const std::uint32_t choose = (e & f) ^ (~e & g);
        const std::uint32_t t1 = h + big_s1 + choose + kRoundConstants[i] + w[i];
        const std::uint32_t big_s0 = std::rotr(a, 2) ^ std::rotr(a, 13) ^ std::rotr(a, 22);
        const std::uint32_t majority = (a & b) ^ (a & c) ^ (b & c);
        std::shift_right(v.begin(), v.end(), 1);
        v[0] = t1 + big_s0 + majority;
        v[4] += t1;
    }
    for (std::size_t i = 0; i < m_state.size(); ++i) {
        m_state[i] += v[i];
    }
}

void Sha256::update(std::span<const std::uint8_t> data) noexcept
{
    m_message_bytes += data.size();

    if (m_block_used > 0) {
        const std::size_t take = std::min(kBlockBytes - m_block_used, data.size());
        std::copy_n(data.begin(), take, m_block.begin() + static_cast<std::ptrdiff_t>(m_block_used));
        m_block_used += take;
        data = data.subspan(take);
        if (m_block_used < kBlockBytes) {
            return;
        }
        compress(m_block.data());
        m_block_used = 0;
    }
    while (data.size() >= kBlockBytes) {
        compress(data.data());
        data = data.subspan(kBlockBytes);
    }
    std::ranges::copy(data, m_block.begin());
    m_block_used = data.size();
}

void Sha256::update(std::string_view data) noexcept
{
    update(std::span(reinterpret_cast<const std::uint8_t*>(data.data()), data.size()));
}

Sha256Digest Sha256::finish() noexcept
{
    const std::uint64_t message_bits = m_message_bytes * 8U;

    m_block[m_block_used++] = 0x80;
    if (m_block_used > kLengthOffset) {
        std::fill(m_block.begin() + static_cast<std::ptrdiff_t>(m_block_used), m_block.end(), 0);
        compress(m_block.data());
        m_block_used = 0;
    }
    std::fill(m_block.begin() + static_cast<std::ptrdiff_t>(m_block_used),
              m_block.begin() + static_cast<std::ptrdiff_t>(kLengthOffset),
              0);
    store_be32(static_cast<std::uint32_t>(message_bits >> 32U), m_block.data() + kLengthOffset);
    store_be32(static_cast<std::uint32_t>(message_bits), m_block.data() + kLengthOffset + 4);
    compress(m_block.data());

    Sha256Digest digest{};
    for (std::size_t i = 0; i < m_state.size(); ++i) {
        store_be32(m_state[i], digest.data() + (i * 4));
    }
    reset();
    return digest;
}

std::string to_hex(const Sha256Digest& digest)
{
    std::string hex;
    hex.reserve(digest.size() * 2);
    for (const std::uint8_t byte : digest) {
        hex += std::format("{:02x}", byte);
    }
    return hex;
}

Sha256Digest sha256_digest(std::span<const std::uint8_t> data)
{
    Sha256 hasher;
    hasher.update(data);
    return hasher.finish();
}

std::string sha256(std::string_view data)
{
    Sha256 hasher;
    hasher.update(data);
    return to_hex(hasher.finish());
}

std::string sha256_prefixed(std::string_view data)
{
    return "sha256:" + sha256(data);
}

}  // namespace cverify::common
