/**
 * @file test_config.cpp
 * @brief verifier_config.v1 loading
 */

#include "cverify/config.hpp"

#include "support/test_support.hpp"

#include <chrono>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace cverify;
using cverify::test::TempDir;
namespace fs = std::filesystem;

namespace {

[[nodiscard]] nlohmann::json minimal_config()
{
    return {
        {  "schema_version", "verifier_config.v1"},
        {        "registry",      "registry.json"},
        {        "data_dir",               "data"},
        {        "work_dir",          "/tmp/work"},
        {"dependency_store",         "deps/store"},
        {   "onchain_index",  "data/onchain.json"}
    };
}

}  // namespace

TEST(Config, MinimalConfigUsesDefaults)
{
    auto config = config::from_json(minimal_config(), "/etc/cverify", test::schema_dir());
    ASSERT_TRUE(config) << config.error().message;

    EXPECT_EQ(config->registry, fs::path("/etc/cverify/registry.json"));
    EXPECT_EQ(config->data_dir, fs::path("/etc/cverify/data"));
    EXPECT_EQ(config->work_dir, fs::path("/tmp/work"));
    EXPECT_EQ(config->dependency_store, fs::path("/etc/cverify/deps/store"));
    EXPECT_EQ(config->onchain_index, fs::path("/etc/cverify/data/onchain.json"));
    EXPECT_FALSE(config->notifications.has_value());
    EXPECT_EQ(config->workers, 2U);
    EXPECT_FALSE(config->allow_resubmit_failed);
    EXPECT_EQ(config->log_level, log::Level::kInfo);
    EXPECT_TRUE(config->isolate_network);
    EXPECT_EQ(config->quotas.wall_seconds, sandbox::Quotas{}.wall_seconds);
    EXPECT_EQ(config->retry.max_attempts, retry::RetryPolicy{}.max_attempts);
    EXPECT_EQ(config->limits.max_files, BundleLimits{}.max_files);
}

TEST(Config, RelativePathsAreNormalized)
{
    auto doc = minimal_config();
    doc["registry"] = "../shared/./registry.json";
    doc["notifications"] = "events/notifications.jsonl";

    auto config = config::from_json(doc, "/etc/cverify", test::schema_dir());
    ASSERT_TRUE(config) << config.error().message;
    EXPECT_EQ(config->registry, fs::path("/etc/shared/registry.json"));
    ASSERT_TRUE(config->notifications.has_value());
    EXPECT_EQ(*config->notifications, fs::path("/etc/cverify/events/notifications.jsonl"));
}

TEST(Config, OverridesEverySection)
{
    auto doc = minimal_config();
    doc["workers"] = 8;
    doc["allow_resubmit_failed"] = true;
    doc["log_level"] = "debug";
    doc["quotas"] = {
        {"cpu_seconds",  30},
        {"wall_seconds",  60},
        {"memory_mb",     512},
        {"output_bytes", 4096}
    };
    doc["retry"] = {
        {"max_attempts",       2},
        {"initial_backoff_ms", 50},
        {"max_backoff_ms",    200}
    };
    doc["sandbox"] = {
        {"isolate_network", false}
    };
    doc["limits"] = {
        {"max_files",         10},
        {"max_file_bytes", 2048}
    };

    auto config = config::from_json(doc, "/etc/cverify", test::schema_dir());
    ASSERT_TRUE(config) << config.error().message;
    EXPECT_EQ(config->workers, 8U);
    EXPECT_TRUE(config->allow_resubmit_failed);
    EXPECT_EQ(config->log_level, log::Level::kDebug);
    EXPECT_EQ(config->quotas.cpu_seconds, 30);
    EXPECT_EQ(config->quotas.wall_seconds, 60);
    EXPECT_EQ(config->quotas.memory_mb, 512U);
    EXPECT_EQ(config->quotas.output_bytes, 4096U);
    EXPECT_EQ(config->retry.max_attempts, 2);
    EXPECT_EQ(config->retry.initial_backoff, std::chrono::milliseconds(50));
    EXPECT_EQ(config->retry.max_backoff, std::chrono::milliseconds(200));
    EXPECT_FALSE(config->isolate_network);
    EXPECT_EQ(config->limits.max_files, 10U);
    EXPECT_EQ(config->limits.max_file_bytes, 2048U);
}

TEST(Config, BackoffCapBelowInitialIsInvalid)
{
    auto doc = minimal_config();
    doc["retry"] = {
        {"initial_backoff_ms", 500},
        {"max_backoff_ms",     100}
    };

    auto config = config::from_json(doc, "/etc/cverify", test::schema_dir());
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, "InvalidConfig");
}

TEST(Config, SchemaViolationsAreRejected)
{
    auto missing = minimal_config();
    missing.erase("work_dir");
    auto unknown = minimal_config();
    unknown["listen_port"] = 8080;
    auto workers = minimal_config();
    workers["workers"] = 0;
    auto level = minimal_config();
    level["log_level"] = "trace";

    for (const auto& doc : {missing, unknown, workers, level}) {
        auto config = config::from_json(doc, "/etc/cverify", test::schema_dir());
        ASSERT_FALSE(config) << doc.dump();
        EXPECT_EQ(config.error().code, "SchemaValidationFailed") << doc.dump();
    }
}

TEST(Config, LoadResolvesAgainstFileDirectory)
{
    TempDir dir("config_load");
    const auto path = dir.path() / "etc" / "cverify.json";
    test::write_file(path, minimal_config().dump(2));

    auto config = config::load_config(path, test::schema_dir());
    ASSERT_TRUE(config) << config.error().message;
    EXPECT_EQ(config->registry, (dir.path() / "etc" / "registry.json").lexically_normal());
    EXPECT_EQ(config->work_dir, fs::path("/tmp/work"));
}

TEST(Config, LoadReportsUnreadableFiles)
{
    TempDir dir("config_errors");

    auto missing = config::load_config(dir.path() / "absent.json", test::schema_dir());
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, "IOError");

    const auto garbled = dir.path() / "garbled.json";
    test::write_file(garbled, "{\"schema_version\": ");
    auto parse = config::load_config(garbled, test::schema_dir());
    ASSERT_FALSE(parse);
    EXPECT_EQ(parse.error().code, "ParseError");
}
