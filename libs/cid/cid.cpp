/**
 * @file cid.cpp
 * @brief CIDv1 (raw, sha2-256, base32) computation and parsing
 */

#include "cverify/cid.hpp"

#include <format>

namespace cverify::cid {

namespace {

constexpr std::string_view kBase32Alphabet = "abcdefghijklmnopqrstuvwxyz234567";

[[nodiscard]] int base32_value(char c) noexcept
{
    if (c >= 'a' && c <= 'z') {
        return c - 'a';
    }
    if (c >= '2' && c <= '7') {
        return c - '2' + 26;
    }
    return -1;
}

[[nodiscard]] Result<std::uint64_t> read_varint(std::span<const std::uint8_t> bytes,
                                                std::size_t& offset)
{
    std::uint64_t value = 0;
    unsigned shift = 0;
    while (offset < bytes.size()) {
        const std::uint8_t byte = bytes[offset++];
        if (shift >= 63U && (byte & 0x7FU) > 1U) {
            return std::unexpected(Error::make("InvalidCid", "varint overflows 64 bits"));
        }
        value |= static_cast<std::uint64_t>(byte & 0x7FU) << shift;
        if ((byte & 0x80U) == 0) {
            return value;
        }
        shift += 7U;
    }
    return std::unexpected(Error::make("InvalidCid", "truncated varint"));
}

}  // namespace

void append_varint(Bytes& out, std::uint64_t value)
{
    while (value >= 0x80U) {
        out.push_back(static_cast<std::uint8_t>((value & 0x7FU) | 0x80U));
        value >>= 7U;
    }
    out.push_back(static_cast<std::uint8_t>(value));
}

std::string base32_encode(std::span<const std::uint8_t> bytes)
{
    std::string out;
    out.reserve((bytes.size() * 8 + 4) / 5);
    std::uint32_t buffer = 0;
    int bits = 0;
    for (std::uint8_t byte : bytes) {
        buffer = (buffer << 8U) | byte;
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out.push_back(kBase32Alphabet[(buffer >> static_cast<unsigned>(bits)) & 0x1FU]);
        }
    }
    if (bits > 0) {
        out.push_back(kBase32Alphabet[(buffer << static_cast<unsigned>(5 - bits)) & 0x1FU]);
    }
    return out;
}

Result<Bytes> base32_decode(std::string_view text)
{
    Bytes out;
    out.reserve(text.size() * 5 / 8);
    std::uint32_t buffer = 0;
    int bits = 0;
    for (char c : text) {
        const int value = base32_value(c);
        if (value < 0) {
            return std::unexpected(
                Error::make("InvalidCid", std::format("invalid base32 character '{}'", c)));
        }
        buffer = (buffer << 5U) | static_cast<std::uint32_t>(value);
        bits += 5;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<std::uint8_t>((buffer >> static_cast<unsigned>(bits)) & 0xFFU));
        }
    }
    // Leftover bits are padding and must be zero
    if (bits >= 5 || (buffer & ((1U << static_cast<unsigned>(bits)) - 1U)) != 0) {
        return std::unexpected(Error::make("InvalidCid", "non-canonical base32 padding"));
    }
    return out;
}

std::string compute_cid(std::span<const std::uint8_t> bytes)
{
    const auto digest = common::sha256_digest(bytes);

    Bytes binary;
    binary.reserve(4 + digest.size());
    append_varint(binary, kCidVersion);
    append_varint(binary, kCodecRaw);
    append_varint(binary, kHashSha256);
    append_varint(binary, kSha256Length);
    binary.insert(binary.end(), digest.begin(), digest.end());

    return std::string(1, kMultibaseBase32) + base32_encode(binary);
}

Result<DecodedCid> parse_cid(std::string_view text)
{
    if (text.empty() || text.front() != kMultibaseBase32) {
        return std::unexpected(
            Error::make("InvalidCid", std::format("unsupported multibase in CID '{}'", text)));
    }
    auto binary = base32_decode(text.substr(1));
    if (!binary) {
        return std::unexpected(binary.error());
    }

    DecodedCid decoded;
    std::size_t offset = 0;
    auto version = read_varint(*binary, offset);
    if (!version) {
        return std::unexpected(version.error());
    }
    if (*version != kCidVersion) {
        return std::unexpected(
            Error::make("InvalidCid", std::format("unsupported CID version {}", *version)));
    }
    auto codec = read_varint(*binary, offset);
    if (!codec) {
        return std::unexpected(codec.error());
    }
    auto hash_code = read_varint(*binary, offset);
    if (!hash_code) {
        return std::unexpected(hash_code.error());
    }
    auto length = read_varint(*binary, offset);
    if (!length) {
        return std::unexpected(length.error());
    }
    if (binary->size() - offset != *length) {
        return std::unexpected(Error::make(
            "InvalidCid",
            std::format("multihash length {} does not match {} digest bytes",
                        *length,
                        binary->size() - offset)));
    }

    decoded.version = *version;
    decoded.codec = *codec;
    decoded.hash_code = *hash_code;
    decoded.digest.assign(binary->begin() + static_cast<std::ptrdiff_t>(offset), binary->end());
    decoded.binary = std::move(*binary);
    return decoded;
}

bool same_cid(std::string_view lhs, std::string_view rhs)
{
    auto left = parse_cid(lhs);
    auto right = parse_cid(rhs);
    return left && right && left->binary == right->binary;
}

}  // namespace cverify::cid
