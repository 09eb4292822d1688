#pragma once

/**
 * @file canonical_json.hpp
 * @brief Canonical JSON serialization for persisted records and dedupe keys
 *
 * Rules:
 * - UTF-8 encoding
 * - Object keys in lexicographic order
 * - No whitespace (minimal representation)
 * - Integers only (no floating point)
 */

#include "cverify/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace cverify::canonical {

/**
 * Serialize JSON to canonical form
 * @param j JSON value
 * @return Canonical byte string or error
 */
[[nodiscard]] cverify::Result<std::string> canonicalize(const nlohmann::json& j);

/**
 * Compute SHA-256 hash of canonical JSON
 * @param j JSON value
 * @return "sha256:" + hex hash or error
 */
[[nodiscard]] cverify::Result<std::string> hash_canonical(const nlohmann::json& j);

}  // namespace cverify::canonical
