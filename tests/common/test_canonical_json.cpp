/**
 * @file test_canonical_json.cpp
 * @brief Canonical JSON tests
 */

#include "cverify/canonical_json.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace cverify::canonical;
using Json = nlohmann::json;

TEST(CanonicalJSON, KeyOrder)
{
    Json j = {
        {"z", 1},
        {"a", 2},
        {"m", 3}
    };
    auto canonical = canonicalize(j);
    ASSERT_TRUE(canonical);
    EXPECT_EQ(*canonical, R"({"a":2,"m":3,"z":1})");
}

TEST(CanonicalJSON, NestedKeyOrder)
{
    Json j = {
        {  "outer", {{"z", 1}, {"a", 2}}},
        {"another",                    3}
    };
    auto canonical = canonicalize(j);
    ASSERT_TRUE(canonical);
    EXPECT_EQ(*canonical, R"({"another":3,"outer":{"a":2,"z":1}})");
}

TEST(CanonicalJSON, ArraysKeepOrder)
{
    Json j = {
        {"exports", {"transfer", "balanceOf", "approve"}}
    };
    auto canonical = canonicalize(j);
    ASSERT_TRUE(canonical);
    EXPECT_EQ(*canonical, R"({"exports":["transfer","balanceOf","approve"]})");
}

TEST(CanonicalJSON, FloatRejection)
{
    Json j = {
        {"quotas", {{"cpu", 1.5}}}
    };
    auto canonical = canonicalize(j);
    ASSERT_FALSE(canonical);
    EXPECT_EQ(canonical.error().code, "FloatingPointNotAllowed");
    EXPECT_NE(canonical.error().message.find("$.quotas.cpu"), std::string::npos);
}

TEST(CanonicalJSON, InvalidUtf8Rejected)
{
    Json j = {
        {"content", std::string("\xff\xfe")}
    };
    auto canonical = canonicalize(j);
    ASSERT_FALSE(canonical);
    EXPECT_EQ(canonical.error().code, "InvalidUtf8");
}

TEST(CanonicalJSON, IntegersAllowed)
{
    Json j = {
        {"revision",  2},
        {   "delta", -7}
    };
    auto canonical = canonicalize(j);
    ASSERT_TRUE(canonical);
    EXPECT_EQ(*canonical, R"({"delta":-7,"revision":2})");
}

TEST(CanonicalJSON, HashIsInsertionOrderIndependent)
{
    Json a;
    a["address"] = "AS1abc";
    a["status"] = "verified";
    Json b;
    b["status"] = "verified";
    b["address"] = "AS1abc";

    auto h1 = hash_canonical(a);
    auto h2 = hash_canonical(b);
    ASSERT_TRUE(h1);
    ASSERT_TRUE(h2);
    EXPECT_EQ(*h1, *h2);
    EXPECT_TRUE(h1->starts_with("sha256:"));
}
