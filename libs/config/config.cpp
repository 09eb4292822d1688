/**
 * @file config.cpp
 * @brief Configuration loading
 */

#include "cverify/config.hpp"

#include "cverify/schema_validate.hpp"

#include <format>
#include <fstream>
#include <string>

namespace cverify::config {

namespace {

namespace fs = std::filesystem;

[[nodiscard]] fs::path resolve(const fs::path& base_dir, const std::string& value)
{
    fs::path path(value);
    if (path.is_absolute() || base_dir.empty()) {
        return path.lexically_normal();
    }
    return (base_dir / path).lexically_normal();
}

}  // namespace

cverify::Result<VerifierConfig> from_json(const nlohmann::json& doc,
                                          const std::filesystem::path& base_dir,
                                          const std::filesystem::path& schema_dir)
{
    if (auto valid = common::validate_json(doc, (schema_dir / "verifier_config.v1.schema.json").string());
        !valid) {
        return std::unexpected(
            Error::make(valid.error().code, "Config schema validation failed: " + valid.error().message));
    }

    try {
        VerifierConfig config;
        config.registry = resolve(base_dir, doc.at("registry").get<std::string>());
        config.data_dir = resolve(base_dir, doc.at("data_dir").get<std::string>());
        config.work_dir = resolve(base_dir, doc.at("work_dir").get<std::string>());
        config.dependency_store = resolve(base_dir, doc.at("dependency_store").get<std::string>());
        config.onchain_index = resolve(base_dir, doc.at("onchain_index").get<std::string>());
        if (doc.contains("notifications")) {
            config.notifications = resolve(base_dir, doc.at("notifications").get<std::string>());
        }
        config.workers = doc.value("workers", config.workers);
        config.allow_resubmit_failed = doc.value("allow_resubmit_failed", false);

        if (doc.contains("log_level")) {
            auto level = log::parse_level(doc.at("log_level").get<std::string>());
            if (!level) {
                return std::unexpected(Error::make("InvalidConfig", "unknown log_level"));
            }
            config.log_level = *level;
        }

        if (doc.contains("quotas")) {
            const auto& quotas = doc.at("quotas");
            config.quotas.cpu_seconds = quotas.value("cpu_seconds", config.quotas.cpu_seconds);
            config.quotas.wall_seconds = quotas.value("wall_seconds", config.quotas.wall_seconds);
            config.quotas.memory_mb = quotas.value("memory_mb", config.quotas.memory_mb);
            config.quotas.output_bytes = quotas.value("output_bytes", config.quotas.output_bytes);
        }
        if (doc.contains("retry")) {
            const auto& retry = doc.at("retry");
            config.retry.max_attempts = retry.value("max_attempts", config.retry.max_attempts);
            config.retry.initial_backoff = std::chrono::milliseconds(
                retry.value("initial_backoff_ms", config.retry.initial_backoff.count()));
            config.retry.max_backoff =
                std::chrono::milliseconds(retry.value("max_backoff_ms", config.retry.max_backoff.count()));
        }
        if (doc.contains("sandbox")) {
            config.isolate_network = doc.at("sandbox").value("isolate_network", true);
        }
        if (doc.contains("limits")) {
            const auto& limits = doc.at("limits");
            config.limits.max_files = limits.value("max_files", config.limits.max_files);
            config.limits.max_file_bytes = limits.value("max_file_bytes", config.limits.max_file_bytes);
        }

        if (config.retry.max_backoff < config.retry.initial_backoff) {
            return std::unexpected(
                Error::make("InvalidConfig", "retry.max_backoff_ms is smaller than retry.initial_backoff_ms"));
        }
        return config;
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(Error::make("InvalidConfig", std::string("Malformed config: ") + ex.what()));
    }
}

cverify::Result<VerifierConfig> load_config(const std::filesystem::path& path,
                                            const std::filesystem::path& schema_dir)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(Error::make("IOError", "Failed to open config: " + path.string()));
    }
    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("ParseError", std::format("Failed to parse config {}: {}", path.string(), ex.what())));
    }
    return from_json(doc, fs::absolute(path).parent_path(), schema_dir);
}

}  // namespace cverify::config
