#pragma once

/**
 * @file request_validator.hpp
 * @brief Accept or reject a verification request before any work starts
 */

#include "cverify/contract_store.hpp"
#include "cverify/registry.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace cverify::validator {

enum class Verdict : std::uint8_t {
    kOk,
    kLicenseUnsupported,
    kLanguageUnsupported,
    kAlreadyRegistered
};

struct ValidationResult
{
    Verdict verdict = Verdict::kOk;
    std::string subject;  ///< the offending license, language or address

    [[nodiscard]] bool ok() const noexcept { return verdict == Verdict::kOk; }

    /// Caller-facing message
    [[nodiscard]] std::string message() const;

    /// Error code matching the verdict name ("LicenseUnsupported", ...)
    [[nodiscard]] std::string_view code() const noexcept;

    [[nodiscard]] Error to_error() const;
};

/// Read-only view of the existing contract rows
using ExistingLookup = std::function<std::optional<store::ContractRecord>(const std::string& address)>;

struct ValidationRequest
{
    std::string address;
    std::string license;
    std::string language;
};

/**
 * Checks, in this order, stopping at the first failure:
 *   1. the license is registered
 *   2. the language is registered, active and permitted by the license
 *   3. no row exists for the address (failed rows are ignored when the
 *      replace policy allows resubmission)
 * Side-effect free.
 */
[[nodiscard]] ValidationResult validate_request(const registry::RegistrySnapshot& snapshot,
                                                const ExistingLookup& existing,
                                                const ValidationRequest& request,
                                                store::ReplacePolicy policy = store::ReplacePolicy::kNever);

}  // namespace cverify::validator
