/**
 * @file test_wasm.cpp
 * @brief Wasm canonicalization and export listing
 */

#include "cverify/cid.hpp"
#include "cverify/wasm.hpp"

#include <string>

#include <gtest/gtest.h>

using namespace cverify::wasm;
using cverify::Bytes;

namespace {

const Bytes kHeader = {0x00, 0x61, 0x73, 0x6D, 0x01, 0x00, 0x00, 0x00};

void append_name(Bytes& out, const std::string& name)
{
    out.push_back(static_cast<std::uint8_t>(name.size()));
    out.insert(out.end(), name.begin(), name.end());
}

void append_section(Bytes& module, std::uint8_t id, const Bytes& payload)
{
    module.push_back(id);
    cverify::cid::append_varint(module, payload.size());
    module.insert(module.end(), payload.begin(), payload.end());
}

Bytes custom_section_payload(const std::string& name, const Bytes& data)
{
    Bytes payload;
    append_name(payload, name);
    payload.insert(payload.end(), data.begin(), data.end());
    return payload;
}

const Bytes kTypePayload = {0x01, 0x60, 0x00, 0x00};
const Bytes kFunctionPayload = {0x03, 0x00, 0x00, 0x00};
const Bytes kCodePayload = {0x03, 0x02, 0x00, 0x0B, 0x02, 0x00, 0x0B, 0x02, 0x00, 0x0B};

Bytes export_payload()
{
    Bytes payload = {0x05};
    append_name(payload, "transfer");
    payload.insert(payload.end(), {0x00, 0x00});
    append_name(payload, "alloc");
    payload.insert(payload.end(), {0x00, 0x01});
    append_name(payload, "memory");
    payload.insert(payload.end(), {0x02, 0x00});
    append_name(payload, "_initialize");
    payload.insert(payload.end(), {0x00, 0x02});
    append_name(payload, "balanceOf");
    payload.insert(payload.end(), {0x00, 0x02});
    return payload;
}

/// type, function, export, code in canonical order without custom sections
Bytes stripped_module()
{
    Bytes module = kHeader;
    append_section(module, 1, kTypePayload);
    append_section(module, 3, kFunctionPayload);
    append_section(module, 7, export_payload());
    append_section(module, 10, kCodePayload);
    return module;
}

/// Same module as a compiler would emit it: producers first, names and a
/// source map URL at the end
Bytes module_with_metadata(const std::string& build_path)
{
    Bytes module = kHeader;
    append_section(module, 0, custom_section_payload("producers", {0x01, 0x02, 0x03}));
    append_section(module, 1, kTypePayload);
    append_section(module, 3, kFunctionPayload);
    append_section(module, 7, export_payload());
    append_section(module, 10, kCodePayload);
    append_section(module, 0, custom_section_payload("name", {0x00, 0x01, 0x00}));
    Bytes url(build_path.begin(), build_path.end());
    append_section(module, 0, custom_section_payload("sourceMappingURL", url));
    return module;
}

}  // namespace

TEST(Wasm, ReadSections)
{
    auto module = module_with_metadata("/tmp/job-1/out/contract.wasm.map");
    auto sections = read_sections(module);
    ASSERT_TRUE(sections) << sections.error().message;
    ASSERT_EQ(sections->size(), 7U);
    EXPECT_EQ(sections->front().id, 0);
    EXPECT_EQ(sections->front().custom_name, "producers");
    EXPECT_EQ((*sections)[1].id, 1);
    EXPECT_EQ(sections->back().custom_name, "sourceMappingURL");
}

TEST(Wasm, CanonicalizeDropsCustomSections)
{
    auto canonical = canonicalize(module_with_metadata("/tmp/job-1/out/contract.wasm.map"));
    ASSERT_TRUE(canonical) << canonical.error().message;
    EXPECT_EQ(*canonical, stripped_module());
}

TEST(Wasm, BuildPathsDoNotAffectCanonicalBytes)
{
    auto first = canonicalize(module_with_metadata("/srv/work/job-aaaa/out/contract.wasm.map"));
    auto second = canonicalize(module_with_metadata("/srv/work/job-bbbb/out/contract.wasm.map"));
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(cverify::cid::compute_cid(*first), cverify::cid::compute_cid(*second));
}

TEST(Wasm, CanonicalizeIsIdempotent)
{
    auto once = canonicalize(module_with_metadata("x"));
    ASSERT_TRUE(once);
    auto twice = canonicalize(*once);
    ASSERT_TRUE(twice);
    EXPECT_EQ(*once, *twice);
}

TEST(Wasm, CanonicalizeRestoresSectionOrder)
{
    Bytes module = kHeader;
    append_section(module, 10, kCodePayload);
    append_section(module, 7, export_payload());
    append_section(module, 1, kTypePayload);
    append_section(module, 3, kFunctionPayload);

    auto canonical = canonicalize(module);
    ASSERT_TRUE(canonical);
    EXPECT_EQ(*canonical, stripped_module());
}

TEST(Wasm, EmptyModule)
{
    auto canonical = canonicalize(kHeader);
    ASSERT_TRUE(canonical);
    EXPECT_EQ(*canonical, kHeader);
}

TEST(Wasm, ListExportsSkipsRuntimeHooks)
{
    auto exports = list_exports(module_with_metadata("x"));
    ASSERT_TRUE(exports) << exports.error().message;
    EXPECT_EQ(*exports, (std::vector<std::string>{"transfer", "balanceOf"}));
}

TEST(Wasm, ListExportsWithoutExportSection)
{
    auto exports = list_exports(kHeader);
    ASSERT_TRUE(exports);
    EXPECT_TRUE(exports->empty());
}

TEST(Wasm, RejectsBadMagic)
{
    Bytes module = {0x7F, 0x45, 0x4C, 0x46, 0x01, 0x00, 0x00, 0x00};
    auto result = canonicalize(module);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "InvalidWasm");
    EXPECT_FALSE(canonicalize(Bytes{0x00, 0x61}));
}

TEST(Wasm, RejectsTruncatedSection)
{
    Bytes module = kHeader;
    module.insert(module.end(), {0x01, 0x10, 0x01, 0x60});
    EXPECT_FALSE(read_sections(module));
}

TEST(Wasm, RejectsDuplicateSection)
{
    Bytes module = kHeader;
    append_section(module, 1, kTypePayload);
    append_section(module, 1, kTypePayload);
    auto result = read_sections(module);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "InvalidWasm");
}

TEST(Wasm, RejectsUnknownSectionId)
{
    Bytes module = kHeader;
    append_section(module, 42, {0x00});
    EXPECT_FALSE(read_sections(module));
}
