/**
 * @file test_request_validator.cpp
 * @brief Request validation order and messages
 */

#include "cverify/request_validator.hpp"

#include "support/record_support.hpp"

#include <map>

#include <gtest/gtest.h>

using namespace cverify;
using namespace cverify::validator;

namespace {

class RequestValidatorTest : public ::testing::Test
{
protected:
    RequestValidatorTest()
        : m_snapshot(test::make_snapshot())
    {}

    [[nodiscard]] ExistingLookup lookup()
    {
        return [this](const std::string& address) -> std::optional<store::ContractRecord> {
            ++m_lookups;
            auto it = m_rows.find(address);
            if (it == m_rows.end()) {
                return std::nullopt;
            }
            return it->second;
        };
    }

    void add_row(const std::string& address, store::Status status)
    {
        auto record = test::make_pending_record(address, "job-1");
        record.status = status;
        m_rows[address] = record;
    }

    registry::RegistrySnapshot m_snapshot;
    std::map<std::string, store::ContractRecord> m_rows;
    int m_lookups = 0;
};

}  // namespace

TEST_F(RequestValidatorTest, AcceptsSupportedRequest)
{
    auto result = validate_request(m_snapshot, lookup(), {.address = "AS1a", .license = "MIT", .language = "tinygo"});
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.code(), "Ok");
    EXPECT_TRUE(result.message().empty());
}

TEST_F(RequestValidatorTest, UnknownLicense)
{
    auto result = validate_request(m_snapshot, lookup(), {.address = "AS1a", .license = "WTFPL", .language = "tinygo"});
    EXPECT_EQ(result.verdict, Verdict::kLicenseUnsupported);
    EXPECT_EQ(result.message(), "License WTFPL is currently unsupported.");
    auto error = result.to_error();
    EXPECT_EQ(error.code, "LicenseUnsupported");
    EXPECT_EQ(error.message, "License WTFPL is currently unsupported.");
}

TEST_F(RequestValidatorTest, UnknownLanguage)
{
    auto result = validate_request(m_snapshot, lookup(), {.address = "AS1a", .license = "MIT", .language = "solidity"});
    EXPECT_EQ(result.verdict, Verdict::kLanguageUnsupported);
    EXPECT_EQ(result.message(), "Language solidity is currently unsupported.");
}

TEST_F(RequestValidatorTest, RetiredLanguage)
{
    auto result = validate_request(m_snapshot, lookup(), {.address = "AS1a", .license = "MIT", .language = "cobol"});
    EXPECT_EQ(result.verdict, Verdict::kLanguageUnsupported);
}

TEST_F(RequestValidatorTest, LanguageNotPermittedByLicense)
{
    auto allowed = validate_request(m_snapshot, lookup(), {.address = "AS1a", .license = "Proprietary-Go", .language = "tinygo"});
    EXPECT_TRUE(allowed.ok());

    auto refused = validate_request(
        m_snapshot, lookup(), {.address = "AS1a", .license = "Proprietary-Go", .language = "assemblyscript"});
    EXPECT_EQ(refused.verdict, Verdict::kLanguageUnsupported);
    EXPECT_EQ(refused.subject, "assemblyscript");
}

TEST_F(RequestValidatorTest, ExistingRecordBlocks)
{
    add_row("AS1a", store::Status::kPending);
    auto result = validate_request(m_snapshot, lookup(), {.address = "AS1a", .license = "MIT", .language = "tinygo"});
    EXPECT_EQ(result.verdict, Verdict::kAlreadyRegistered);
    EXPECT_EQ(result.message(), "Contract is already verified or being verified.");
    EXPECT_EQ(result.to_error().code, "AlreadyRegistered");
}

TEST_F(RequestValidatorTest, FailedRecordBlocksUnlessResubmissionAllowed)
{
    add_row("AS1a", store::Status::kFailedBuild);
    const ValidationRequest request{.address = "AS1a", .license = "MIT", .language = "tinygo"};

    EXPECT_EQ(validate_request(m_snapshot, lookup(), request).verdict, Verdict::kAlreadyRegistered);
    EXPECT_TRUE(validate_request(m_snapshot, lookup(), request, store::ReplacePolicy::kTerminalFailed).ok());

    add_row("AS1b", store::Status::kVerified);
    EXPECT_EQ(validate_request(m_snapshot,
                               lookup(),
                               {.address = "AS1b", .license = "MIT", .language = "tinygo"},
                               store::ReplacePolicy::kTerminalFailed)
                  .verdict,
              Verdict::kAlreadyRegistered);
}

TEST_F(RequestValidatorTest, LicenseCheckedBeforeLanguageAndExistence)
{
    add_row("AS1a", store::Status::kVerified);
    auto result = validate_request(m_snapshot, lookup(), {.address = "AS1a", .license = "WTFPL", .language = "solidity"});
    EXPECT_EQ(result.verdict, Verdict::kLicenseUnsupported);
    EXPECT_EQ(m_lookups, 0);
}

TEST_F(RequestValidatorTest, LanguageCheckedBeforeExistence)
{
    add_row("AS1a", store::Status::kVerified);
    auto result = validate_request(m_snapshot, lookup(), {.address = "AS1a", .license = "MIT", .language = "solidity"});
    EXPECT_EQ(result.verdict, Verdict::kLanguageUnsupported);
    EXPECT_EQ(m_lookups, 0);
}

TEST_F(RequestValidatorTest, ValidationIsSideEffectFree)
{
    const ValidationRequest request{.address = "AS1a", .license = "MIT", .language = "tinygo"};
    EXPECT_TRUE(validate_request(m_snapshot, lookup(), request).ok());
    EXPECT_TRUE(validate_request(m_snapshot, lookup(), request).ok());
    EXPECT_TRUE(m_rows.empty());
}
