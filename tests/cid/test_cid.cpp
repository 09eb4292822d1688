/**
 * @file test_cid.cpp
 * @brief Content identifier computation and parsing
 */

#include "cverify/cid.hpp"

#include <string>
#include <string_view>

#include <gtest/gtest.h>

using namespace cverify::cid;
using cverify::Bytes;

namespace {

std::span<const std::uint8_t> as_bytes(std::string_view text)
{
    return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

}  // namespace

TEST(Cid, KnownVectors)
{
    EXPECT_EQ(compute_cid(as_bytes("")), "bafkreihdwdcefgh4dqkjv67uzcmw7ojee6xedzdetojuzjevtenxquvyku");
    EXPECT_EQ(compute_cid(as_bytes("hello")), "bafkreibm6jg3ux5qumhcn2b3flc3tyu6dmlb4xa7u5bf44yegnrjhc4yeq");
    EXPECT_EQ(compute_cid(as_bytes("abc")), "bafkreif2pall7dybz7vecqka3zo24irdwabwdi4wc55jznaq75q7eaavvu");
}

TEST(Cid, EmptyWasmModule)
{
    const Bytes module = {0x00, 0x61, 0x73, 0x6D, 0x01, 0x00, 0x00, 0x00};
    EXPECT_EQ(compute_cid(module), "bafkreieturf3xfwhkeqy4taa2r46jqkdlajcuoe2zsqwebnr4tinyx4uoy");
}

TEST(Cid, ParseRoundTripsFields)
{
    const std::string text = compute_cid(as_bytes("hello"));
    auto decoded = parse_cid(text);
    ASSERT_TRUE(decoded) << decoded.error().message;
    EXPECT_EQ(decoded->version, kCidVersion);
    EXPECT_EQ(decoded->codec, kCodecRaw);
    EXPECT_EQ(decoded->hash_code, kHashSha256);
    ASSERT_EQ(decoded->digest.size(), kSha256Length);
    EXPECT_EQ(decoded->digest[0], 0x2c);
    EXPECT_EQ(decoded->binary.size(), 4 + kSha256Length);
}

TEST(Cid, ParseRejectsForeignEncodings)
{
    // CIDv0 (base58btc, no multibase prefix)
    EXPECT_FALSE(parse_cid("QmYwAPJzv5CZsnA625s3Xf2nemtYgPpHdWEz79ojWnPbdG"));
    EXPECT_FALSE(parse_cid(""));
    EXPECT_FALSE(parse_cid("b"));
    EXPECT_FALSE(parse_cid("bafkrei!"));

    auto truncated = parse_cid("bafkreihdwdcefgh4dqkjv67uzcmw7ojee6xedzdetojuzjevtenxquvy");
    ASSERT_FALSE(truncated);
    EXPECT_EQ(truncated.error().code, "InvalidCid");
}

TEST(Cid, OtherCodecOverSameDigestIsDifferentCid)
{
    const std::string raw = compute_cid(as_bytes("hello"));
    auto decoded = parse_cid(raw);
    ASSERT_TRUE(decoded);

    Bytes relabeled = decoded->binary;
    ASSERT_EQ(relabeled[1], kCodecRaw);
    relabeled[1] = 0x71;  // dag-cbor
    const std::string other = "b" + base32_encode(relabeled);

    auto parsed = parse_cid(other);
    ASSERT_TRUE(parsed) << parsed.error().message;
    EXPECT_EQ(parsed->codec, 0x71U);
    EXPECT_EQ(parsed->digest, decoded->digest);
    EXPECT_FALSE(same_cid(raw, other));
}

TEST(Cid, SameCidComparesBinaryForm)
{
    const std::string hello = compute_cid(as_bytes("hello"));
    EXPECT_TRUE(same_cid(hello, hello));
    EXPECT_FALSE(same_cid(hello, compute_cid(as_bytes("hello!"))));
    EXPECT_FALSE(same_cid(hello, "not-a-cid"));
    EXPECT_FALSE(same_cid("not-a-cid", "not-a-cid"));
}

TEST(Base32, Rfc4648Vectors)
{
    EXPECT_EQ(base32_encode(as_bytes("")), "");
    EXPECT_EQ(base32_encode(as_bytes("f")), "my");
    EXPECT_EQ(base32_encode(as_bytes("fo")), "mzxq");
    EXPECT_EQ(base32_encode(as_bytes("foo")), "mzxw6");
    EXPECT_EQ(base32_encode(as_bytes("foob")), "mzxw6yq");
    EXPECT_EQ(base32_encode(as_bytes("fooba")), "mzxw6ytb");
    EXPECT_EQ(base32_encode(as_bytes("foobar")), "mzxw6ytboi");
}

TEST(Base32, DecodeInvertsEncode)
{
    auto decoded = base32_decode("mzxw6ytboi");
    ASSERT_TRUE(decoded);
    EXPECT_EQ(std::string(decoded->begin(), decoded->end()), "foobar");
}

TEST(Base32, DecodeRejectsBadInput)
{
    EXPECT_FALSE(base32_decode("mz1"));  // '1' is outside the alphabet
    EXPECT_FALSE(base32_decode("mz"));   // nonzero trailing bits
}

TEST(Varint, Leb128)
{
    Bytes out;
    append_varint(out, 0x55);
    EXPECT_EQ(out, (Bytes{0x55}));

    out.clear();
    append_varint(out, 0x80);
    EXPECT_EQ(out, (Bytes{0x80, 0x01}));

    out.clear();
    append_varint(out, 300);
    EXPECT_EQ(out, (Bytes{0xAC, 0x02}));
}
