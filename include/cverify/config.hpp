#pragma once

/**
 * @file config.hpp
 * @brief Verifier configuration (verifier_config.v1)
 */

#include "cverify/common.hpp"
#include "cverify/executor.hpp"
#include "cverify/log.hpp"
#include "cverify/retry.hpp"
#include "cverify/source_bundle.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>

#include <nlohmann/json.hpp>

namespace cverify::config {

struct VerifierConfig
{
    std::filesystem::path registry;
    std::filesystem::path data_dir;
    std::filesystem::path work_dir;
    std::filesystem::path dependency_store;
    std::filesystem::path onchain_index;
    std::optional<std::filesystem::path> notifications;  ///< JSON lines file; none disables delivery
    std::size_t workers = 2;
    bool allow_resubmit_failed = false;
    log::Level log_level = log::Level::kInfo;
    sandbox::Quotas quotas;
    retry::RetryPolicy retry;
    bool isolate_network = true;
    BundleLimits limits;
};

/**
 * Convert a verifier_config.v1 document. Relative paths are resolved
 * against @p base_dir; omitted sections keep their defaults.
 */
[[nodiscard]] cverify::Result<VerifierConfig> from_json(const nlohmann::json& doc,
                                                        const std::filesystem::path& base_dir,
                                                        const std::filesystem::path& schema_dir);

/**
 * Read and schema-validate a configuration file.
 */
[[nodiscard]] cverify::Result<VerifierConfig> load_config(const std::filesystem::path& path,
                                                          const std::filesystem::path& schema_dir);

}  // namespace cverify::config
