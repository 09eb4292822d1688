#pragma once

/**
 * @file version.hpp
 * @brief cverify version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace cverify {

/// cverify version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Document schema versions (embedded in every persisted document)
constexpr const char* kConfigSchemaVersion = "verifier_config.v1";
constexpr const char* kRegistrySchemaVersion = "registry.v1";
constexpr const char* kContractRecordSchemaVersion = "contract_record.v1";
constexpr const char* kNotificationSchemaVersion = "notification.v1";
constexpr const char* kLockfileSchemaVersion = "deps_lock.v1";

}  // namespace cverify
