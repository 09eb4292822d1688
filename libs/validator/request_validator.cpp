/**
 * @file request_validator.cpp
 * @brief Request validation over a registry snapshot
 */

#include "cverify/request_validator.hpp"

#include <format>

namespace cverify::validator {

std::string ValidationResult::message() const
{
    switch (verdict) {
        case Verdict::kOk:
            return {};
        case Verdict::kLicenseUnsupported:
            return std::format("License {} is currently unsupported.", subject);
        case Verdict::kLanguageUnsupported:
            return std::format("Language {} is currently unsupported.", subject);
        case Verdict::kAlreadyRegistered:
            return "Contract is already verified or being verified.";
    }
    return {};
}

std::string_view ValidationResult::code() const noexcept
{
    switch (verdict) {
        case Verdict::kOk:
            return "Ok";
        case Verdict::kLicenseUnsupported:
            return "LicenseUnsupported";
        case Verdict::kLanguageUnsupported:
            return "LanguageUnsupported";
        case Verdict::kAlreadyRegistered:
            return "AlreadyRegistered";
    }
    return "Ok";
}

Error ValidationResult::to_error() const
{
    return Error::make(std::string(code()), message());
}

ValidationResult validate_request(const registry::RegistrySnapshot& snapshot,
                                  const ExistingLookup& existing,
                                  const ValidationRequest& request,
                                  store::ReplacePolicy policy)
{
    const auto* license = snapshot.find_license(request.license);
    if (license == nullptr) {
        return {.verdict = Verdict::kLicenseUnsupported, .subject = request.license};
    }

    if (snapshot.find_active_language(request.language) == nullptr
        || !license->permits(request.language)) {
        return {.verdict = Verdict::kLanguageUnsupported, .subject = request.language};
    }

    if (existing) {
        if (auto row = existing(request.address); row && store::blocks_submission(*row, policy)) {
            return {.verdict = Verdict::kAlreadyRegistered, .subject = request.address};
        }
    }

    return {.verdict = Verdict::kOk, .subject = {}};
}

}  // namespace cverify::validator
