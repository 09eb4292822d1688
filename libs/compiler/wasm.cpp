/**
 * @file wasm.cpp
 * @brief WebAssembly section walker used by the canonicalization pass
 */

#include "cverify/wasm.hpp"

#include "cverify/cid.hpp"

#include <algorithm>
#include <array>
#include <format>

namespace cverify::wasm {

namespace {

constexpr std::array<std::uint8_t, 8> kHeader = {0x00, 0x61, 0x73, 0x6D, 0x01, 0x00, 0x00, 0x00};

/// Order in which non-custom sections must appear in a valid module
[[nodiscard]] int canonical_rank(std::uint8_t id) noexcept
{
    switch (static_cast<SectionId>(id)) {
        case SectionId::kType:
            return 1;
        case SectionId::kImport:
            return 2;
        case SectionId::kFunction:
            return 3;
        case SectionId::kTable:
            return 4;
        case SectionId::kMemory:
            return 5;
        case SectionId::kTag:
            return 6;
        case SectionId::kGlobal:
            return 7;
        case SectionId::kExport:
            return 8;
        case SectionId::kStart:
            return 9;
        case SectionId::kElement:
            return 10;
        case SectionId::kDataCount:
            return 11;
        case SectionId::kCode:
            return 12;
        case SectionId::kData:
            return 13;
        case SectionId::kCustom:
            return 0;
    }
    return -1;
}

class Reader
{
public:
    explicit Reader(std::span<const std::uint8_t> bytes)
        : m_bytes(bytes)
    {}

    [[nodiscard]] bool at_end() const noexcept { return m_offset >= m_bytes.size(); }
    [[nodiscard]] std::size_t offset() const noexcept { return m_offset; }

    [[nodiscard]] Result<std::uint8_t> byte()
    {
        if (at_end()) {
            return std::unexpected(Error::make("InvalidWasm", "unexpected end of module"));
        }
        return m_bytes[m_offset++];
    }

    [[nodiscard]] Result<std::uint32_t> u32()
    {
        std::uint64_t value = 0;
        for (unsigned shift = 0; shift < 35U; shift += 7U) {
            auto b = byte();
            if (!b) {
                return std::unexpected(b.error());
            }
            value |= static_cast<std::uint64_t>(*b & 0x7FU) << shift;
            if ((*b & 0x80U) == 0) {
                if (value > 0xFFFFFFFFULL) {
                    break;
                }
                return static_cast<std::uint32_t>(value);
            }
        }
        return std::unexpected(
            Error::make("InvalidWasm", std::format("malformed u32 at offset {}", m_offset)));
    }

    [[nodiscard]] Result<std::span<const std::uint8_t>> take(std::size_t count)
    {
        if (count > m_bytes.size() - m_offset) {
            return std::unexpected(Error::make(
                "InvalidWasm",
                std::format("length {} at offset {} runs past end of module", count, m_offset)));
        }
        auto slice = m_bytes.subspan(m_offset, count);
        m_offset += count;
        return slice;
    }

    [[nodiscard]] Result<std::string> name()
    {
        auto length = u32();
        if (!length) {
            return std::unexpected(length.error());
        }
        auto raw = take(*length);
        if (!raw) {
            return std::unexpected(raw.error());
        }
        return std::string(raw->begin(), raw->end());
    }

private:
    std::span<const std::uint8_t> m_bytes;
    std::size_t m_offset = 0;
};

}  // namespace

Result<std::vector<Section>> read_sections(std::span<const std::uint8_t> module)
{
    if (module.size() < kHeader.size() || !std::ranges::equal(module.first(kHeader.size()), kHeader)) {
        return std::unexpected(
            Error::make("InvalidWasm", "missing \\0asm magic or unsupported binary version"));
    }

    Reader reader(module.subspan(kHeader.size()));
    std::vector<Section> sections;
    std::array<bool, 14> seen{};
    while (!reader.at_end()) {
        auto id = reader.byte();
        if (!id) {
            return std::unexpected(id.error());
        }
        if (canonical_rank(*id) < 0) {
            return std::unexpected(
                Error::make("InvalidWasm", std::format("unknown section id {}", *id)));
        }
        auto size = reader.u32();
        if (!size) {
            return std::unexpected(size.error());
        }
        auto payload = reader.take(*size);
        if (!payload) {
            return std::unexpected(payload.error());
        }

        Section section{.id = *id, .custom_name = {}, .payload = *payload};
        if (*id == std::to_underlying(SectionId::kCustom)) {
            Reader name_reader(*payload);
            auto custom_name = name_reader.name();
            if (!custom_name) {
                return std::unexpected(custom_name.error());
            }
            section.custom_name = std::move(*custom_name);
        } else {
            if (seen.at(*id)) {
                return std::unexpected(
                    Error::make("InvalidWasm", std::format("duplicate section id {}", *id)));
            }
            seen.at(*id) = true;
        }
        sections.push_back(std::move(section));
    }
    return sections;
}

Result<Bytes> canonicalize(std::span<const std::uint8_t> module)
{
    auto sections = read_sections(module);
    if (!sections) {
        return std::unexpected(sections.error());
    }

    std::erase_if(*sections, [](const Section& section) {
        return section.id == std::to_underlying(SectionId::kCustom);
    });
    std::ranges::stable_sort(*sections, {}, [](const Section& section) {
        return canonical_rank(section.id);
    });

    Bytes out(kHeader.begin(), kHeader.end());
    out.reserve(module.size());
    for (const auto& section : *sections) {
        out.push_back(section.id);
        cid::append_varint(out, section.payload.size());
        out.insert(out.end(), section.payload.begin(), section.payload.end());
    }
    return out;
}

Result<std::vector<std::string>> list_exports(std::span<const std::uint8_t> module)
{
    auto sections = read_sections(module);
    if (!sections) {
        return std::unexpected(sections.error());
    }

    std::vector<std::string> exports;
    auto export_section = std::ranges::find(*sections,
                                            std::to_underlying(SectionId::kExport),
                                            &Section::id);
    if (export_section == sections->end()) {
        return exports;
    }

    Reader reader(export_section->payload);
    auto count = reader.u32();
    if (!count) {
        return std::unexpected(count.error());
    }
    for (std::uint32_t i = 0; i < *count; ++i) {
        auto name = reader.name();
        if (!name) {
            return std::unexpected(name.error());
        }
        auto kind = reader.byte();
        if (!kind) {
            return std::unexpected(kind.error());
        }
        auto index = reader.u32();
        if (!index) {
            return std::unexpected(index.error());
        }
        constexpr std::uint8_t kFunctionExport = 0x00;
        if (*kind == kFunctionExport && *name != "_initialize" && *name != "alloc") {
            exports.push_back(std::move(*name));
        }
    }
    return exports;
}

}  // namespace cverify::wasm
