/**
 * @file test_onchain.cpp
 * @brief On-chain CID sources
 */

#include "cverify/onchain.hpp"

#include "support/test_support.hpp"

#include <gtest/gtest.h>

using namespace cverify;
using namespace cverify::onchain;
using cverify::test::TempDir;

namespace {

constexpr const char* kHelloCid = "bafkreibm6jg3ux5qumhcn2b3flc3tyu6dmlb4xa7u5bf44yegnrjhc4yeq";
constexpr const char* kAbcCid = "bafkreif2pall7dybz7vecqka3zo24irdwabwdi4wc55jznaq75q7eaavvu";

}  // namespace

TEST(StaticOnChainCidSource, LookupAndOverwrite)
{
    StaticOnChainCidSource source;
    source.set("AS1a", kHelloCid);

    auto found = source.fetch("AS1a");
    ASSERT_TRUE(found);
    EXPECT_EQ(*found, kHelloCid);

    source.set("AS1a", kAbcCid);
    EXPECT_EQ(*source.fetch("AS1a"), kAbcCid);

    auto missing = source.fetch("AS1b");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, "NotFound");
}

TEST(FileOnChainCidSource, ReadsIndexOnEveryFetch)
{
    TempDir dir("onchain_index");
    const auto index = dir.path() / "onchain.json";
    test::write_file(index, std::string(R"({"AS1a":")") + kHelloCid + R"("})");

    FileOnChainCidSource source(index);
    auto first = source.fetch("AS1a");
    ASSERT_TRUE(first) << first.error().message;
    EXPECT_EQ(*first, kHelloCid);

    auto missing = source.fetch("AS1b");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, "NotFound");

    test::write_file(index, std::string(R"({"AS1a":")") + kHelloCid + R"(","AS1b":")" + kAbcCid + R"("})");
    auto added = source.fetch("AS1b");
    ASSERT_TRUE(added);
    EXPECT_EQ(*added, kAbcCid);
}

TEST(FileOnChainCidSource, NonStringEntryIsNotFound)
{
    TempDir dir("onchain_nonstring");
    const auto index = dir.path() / "onchain.json";
    test::write_file(index, R"({"AS1a": 17})");

    FileOnChainCidSource source(index);
    auto result = source.fetch("AS1a");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "NotFound");
}

TEST(FileOnChainCidSource, UnavailableIndexIsRetryable)
{
    TempDir dir("onchain_unavailable");

    FileOnChainCidSource absent(dir.path() / "missing.json");
    auto missing = absent.fetch("AS1a");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, "InfrastructureError");

    const auto garbled = dir.path() / "garbled.json";
    test::write_file(garbled, "{\"AS1a\": ");
    FileOnChainCidSource torn(garbled);
    auto parse = torn.fetch("AS1a");
    ASSERT_FALSE(parse);
    EXPECT_EQ(parse.error().code, "InfrastructureError");

    const auto array = dir.path() / "array.json";
    test::write_file(array, "[]");
    FileOnChainCidSource wrong_shape(array);
    auto shape = wrong_shape.fetch("AS1a");
    ASSERT_FALSE(shape);
    EXPECT_EQ(shape.error().code, "InfrastructureError");
}
