/**
 * @file test_source_bundle.cpp
 * @brief Source bundle validation, digest and directory loading
 */

#include "cverify/source_bundle.hpp"

#include "support/test_support.hpp"

#include <filesystem>

#include <gtest/gtest.h>

using namespace cverify;
using cverify::test::TempDir;

namespace {

SourceBundle bundle_of(std::initializer_list<std::pair<std::string, std::string>> files)
{
    SourceBundle bundle;
    for (const auto& [path, content] : files) {
        bundle.add(path, content);
    }
    return bundle;
}

std::string rejection(const SourceBundle& bundle,
                      const BundleLimits& limits = {},
                      const std::vector<std::string>& reserved = {})
{
    auto result = validate_bundle(bundle, limits, reserved);
    if (result) {
        return "";
    }
    EXPECT_EQ(result.error().code, "InvalidSourceBundle");
    return result.error().message;
}

}  // namespace

TEST(SourceBundle, AcceptsNestedSources)
{
    auto bundle = bundle_of({
        {             "assembly/contracts/main.ts", "export function main(): void {}"},
        {                           "package.json",                               "{}"},
        {"assembly/__tests__/main.spec.ts",                                          ""}
    });
    EXPECT_TRUE(validate_bundle(bundle, {}, {"pnpm-lock.yaml"}));
}

TEST(SourceBundle, RejectsEmptyBundle)
{
    EXPECT_EQ(rejection(SourceBundle{}), "No source files were uploaded for this contract");
}

TEST(SourceBundle, RejectsEscapingPaths)
{
    EXPECT_NE(rejection(bundle_of({{"../evil.ts", "x"}})), "");
    EXPECT_NE(rejection(bundle_of({{"a/../../evil.ts", "x"}})), "");
    EXPECT_NE(rejection(bundle_of({{"/etc/passwd", "x"}})), "");
    EXPECT_NE(rejection(bundle_of({{"a\\b.ts", "x"}})), "");
}

TEST(SourceBundle, RejectsNonCanonicalPaths)
{
    EXPECT_NE(rejection(bundle_of({{"./main.ts", "x"}})), "");
    EXPECT_NE(rejection(bundle_of({{"a//main.ts", "x"}})), "");
    EXPECT_NE(rejection(bundle_of({{"a/./main.ts", "x"}})), "");
}

TEST(SourceBundle, RejectsBadFileNames)
{
    EXPECT_NE(rejection(bundle_of({{"main file.ts", "x"}})), "");
    EXPECT_NE(rejection(bundle_of({{"main$.ts", "x"}})), "");
    EXPECT_NE(rejection(bundle_of({{std::string(51, 'a'), "x"}})), "");
    EXPECT_EQ(rejection(bundle_of({{std::string(50, 'a'), "x"}})), "");
}

TEST(SourceBundle, RejectsReservedNames)
{
    auto message = rejection(bundle_of({{"sub/pnpm-lock.yaml", "{}"}}), {}, {"pnpm-lock.yaml"});
    EXPECT_EQ(message, "pnpm-lock.yaml is a reserved file name");
}

TEST(SourceBundle, EnforcesLimits)
{
    BundleLimits limits{.max_files = 2, .max_file_bytes = 4};
    EXPECT_NE(rejection(bundle_of({{"a", "1"}, {"b", "2"}, {"c", "3"}}), limits), "");
    EXPECT_NE(rejection(bundle_of({{"a", "12345"}}), limits), "");
    EXPECT_EQ(rejection(bundle_of({{"a", "1234"}, {"b", ""}}), limits), "");
}

TEST(SourceBundle, DigestIsContentAddressed)
{
    auto first = bundle_of({{"a.ts", "1"}, {"b.ts", "2"}});
    auto second = bundle_of({{"b.ts", "2"}, {"a.ts", "1"}});
    EXPECT_EQ(first.digest(), second.digest());
    EXPECT_TRUE(first.digest().starts_with("sha256:"));
    EXPECT_EQ(first.digest().size(), 7U + 64U);

    EXPECT_NE(first.digest(), bundle_of({{"a.ts", "1"}, {"b.ts", "3"}}).digest());
    EXPECT_NE(first.digest(), bundle_of({{"a.ts", "1"}, {"c.ts", "2"}}).digest());
}

TEST(SourceBundle, DigestOfBinaryContent)
{
    auto bundle = bundle_of({{"blob.bin", std::string("\xff\x00\xfe", 3)}});
    EXPECT_TRUE(bundle.digest().starts_with("sha256:"));
    EXPECT_EQ(bundle.digest(), bundle.digest());
}

TEST(SourceBundle, LoadFromDirectory)
{
    TempDir dir("bundle_load");
    cverify::test::write_file(dir.path() / "assembly" / "main.ts", "export function main(): void {}");
    cverify::test::write_file(dir.path() / "asconfig.json", "{}");
    std::filesystem::create_symlink("/etc/hostname", dir.path() / "link");

    auto bundle = load_bundle_from_directory(dir.path(), {});
    ASSERT_TRUE(bundle) << bundle.error().message;
    EXPECT_EQ(bundle->size(), 2U);
    EXPECT_TRUE(bundle->files().contains("assembly/main.ts"));
    EXPECT_TRUE(bundle->files().contains("asconfig.json"));
    EXPECT_FALSE(bundle->files().contains("link"));
}

TEST(SourceBundle, LoadMissingDirectory)
{
    auto bundle = load_bundle_from_directory("/nonexistent/cverify/sources", {});
    ASSERT_FALSE(bundle);
    EXPECT_EQ(bundle.error().code, "IOError");
}
