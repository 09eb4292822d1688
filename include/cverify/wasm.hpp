#pragma once

/**
 * @file wasm.hpp
 * @brief WebAssembly module canonicalization and inspection
 */

#include "cverify/common.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace cverify::wasm {

/// Binary section ids (WebAssembly core spec 5.5.2)
enum class SectionId : std::uint8_t {
    kCustom = 0,
    kType = 1,
    kImport = 2,
    kFunction = 3,
    kTable = 4,
    kMemory = 5,
    kGlobal = 6,
    kExport = 7,
    kStart = 8,
    kElement = 9,
    kCode = 10,
    kData = 11,
    kDataCount = 12,
    kTag = 13
};

struct Section
{
    std::uint8_t id = 0;
    std::string custom_name;  ///< Only set for custom sections
    std::span<const std::uint8_t> payload;
};

/**
 * Split a module into its sections.
 * @return "InvalidWasm" on a bad header, truncated section or duplicate
 *         non-custom section
 */
[[nodiscard]] cverify::Result<std::vector<Section>> read_sections(std::span<const std::uint8_t> module);

/**
 * Deterministic normalization of a compiled module:
 * - every custom section is dropped (name, producers, DWARF, sourceMappingURL)
 * - the remaining sections are re-emitted in canonical order
 * Idempotent; section payloads are copied byte for byte.
 */
[[nodiscard]] cverify::Result<Bytes> canonicalize(std::span<const std::uint8_t> module);

/**
 * Names of exported functions, in export-section order. Runtime hooks
 * ("_initialize", "alloc") are not part of a contract's interface and are omitted.
 */
[[nodiscard]] cverify::Result<std::vector<std::string>> list_exports(std::span<const std::uint8_t> module);

}  // namespace cverify::wasm
