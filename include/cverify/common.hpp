#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error type, hash, path normalization
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cverify {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

/// Raw byte buffer (bytecode, file contents)
using Bytes = std::vector<std::uint8_t>;

}  // namespace cverify

namespace cverify::common {

// ============================================================================
// SHA-256 Hash
// ============================================================================

using Sha256Digest = std::array<std::uint8_t, 32>;

/**
 * @brief Incremental SHA-256 (FIPS 180-4)
 *
 * Feeding the input in any split gives the same digest as one update.
 * finish() leaves the object reset for the next message.
 */
class Sha256
{
public:
    Sha256() noexcept;

    void update(std::span<const std::uint8_t> data) noexcept;
    void update(std::string_view data) noexcept;

    [[nodiscard]] Sha256Digest finish() noexcept;

private:
    std::array<std::uint32_t, 8> m_state;
    std::array<std::uint8_t, 64> m_block;
    std::size_t m_block_used = 0;
    std::uint64_t m_message_bytes = 0;

    void reset() noexcept;
    void compress(const std::uint8_t* block) noexcept;
};

/// Lowercase hex of a digest
[[nodiscard]] std::string to_hex(const Sha256Digest& digest);

/**
 * Compute the raw SHA-256 digest of data
 * @param data Input bytes
 * @return 32-byte digest
 */
[[nodiscard]] Sha256Digest sha256_digest(std::span<const std::uint8_t> data);

/**
 * Compute SHA-256 hash of data
 * @param data Input bytes
 * @return Hex-encoded hash string (64 characters)
 */
[[nodiscard]] std::string sha256(std::string_view data);

/**
 * Compute SHA-256 hash of data with prefix
 * @param data Input bytes
 * @return "sha256:" + hex-encoded hash
 */
[[nodiscard]] std::string sha256_prefixed(std::string_view data);

// ============================================================================
// Path Normalization
// ============================================================================

/**
 * Lexically normalize a path: '/' separators, no trailing slash, "." and
 * ".." collapsed. A ".." that climbs above a relative path is kept so
 * callers can see the escape; above "/" it is dropped.
 */
[[nodiscard]] std::string normalize_path(std::string_view input);

/**
 * Check if path is absolute
 */
[[nodiscard]] bool is_absolute_path(std::string_view path);

/**
 * Check that a relative path stays below its root once normalized
 * (not absolute, no leading "..", not ".")
 */
[[nodiscard]] bool is_contained_path(std::string_view path);

/**
 * Split a normalized path into its components
 */
[[nodiscard]] std::vector<std::string> path_components(std::string_view path);

}  // namespace cverify::common
