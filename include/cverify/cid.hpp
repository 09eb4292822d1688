#pragma once

/**
 * @file cid.hpp
 * @brief Content identifiers for canonical bytecode
 *
 * The scheme is fixed to what the on-chain registration uses:
 *   CIDv1, multicodec raw (0x55), multihash sha2-256 (0x12, 32 bytes),
 *   multibase base32 lower case without padding ("b" prefix).
 * Changing any part of it makes every verification fail.
 */

#include "cverify/common.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace cverify::cid {

constexpr std::uint64_t kCidVersion = 1;
constexpr std::uint64_t kCodecRaw = 0x55;
constexpr std::uint64_t kHashSha256 = 0x12;
constexpr std::size_t kSha256Length = 32;
constexpr char kMultibaseBase32 = 'b';

/**
 * @brief Decoded CID fields
 */
struct DecodedCid
{
    std::uint64_t version = 0;
    std::uint64_t codec = 0;
    std::uint64_t hash_code = 0;
    Bytes digest;
    Bytes binary;  ///< Full binary CID (version, codec, multihash)
};

/**
 * Compute the CID of canonical bytecode. Pure: bytes in, CID out.
 */
[[nodiscard]] std::string compute_cid(std::span<const std::uint8_t> bytes);

/**
 * Decode and check a CID string produced by the registration scheme
 * @return Decoded fields, or an "InvalidCid" error
 */
[[nodiscard]] cverify::Result<DecodedCid> parse_cid(std::string_view text);

/**
 * Compare two CIDs by their binary form.
 * @return false if either side does not parse
 */
[[nodiscard]] bool same_cid(std::string_view lhs, std::string_view rhs);

/// RFC 4648 base32, lower case, no padding
[[nodiscard]] std::string base32_encode(std::span<const std::uint8_t> bytes);
[[nodiscard]] cverify::Result<Bytes> base32_decode(std::string_view text);

/// Unsigned LEB128 varint as used by multiformats
void append_varint(Bytes& out, std::uint64_t value);

}  // namespace cverify::cid
