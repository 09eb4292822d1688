#pragma once

/**
 * @file publisher.hpp
 * @brief Exactly-once notification of terminal verification outcomes
 */

#include "cverify/common.hpp"
#include "cverify/contract_store.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace cverify::publish {

struct Notification
{
    std::string address;
    store::Status status = store::Status::kFailedBuild;
    std::string job_id;
    std::string diagnostics;
    std::string computed_cid;
    std::string onchain_cid;
    std::string finished_at;
};

/// notification.v1 document
[[nodiscard]] nlohmann::json to_json(const Notification& notification);

/**
 * "sha256:..." over the canonical {"address", "job_id", "status"} triple
 */
[[nodiscard]] cverify::Result<std::string> dedupe_key(const Notification& notification);

/**
 * @brief Destination of notification events (external collaborator)
 */
class NotificationSink
{
public:
    virtual ~NotificationSink() = default;

    [[nodiscard]] virtual cverify::VoidResult deliver(const nlohmann::json& event) = 0;
};

/// Appends one canonical JSON line per event
class JsonLinesSink final : public NotificationSink
{
public:
    explicit JsonLinesSink(std::filesystem::path path);

    [[nodiscard]] cverify::VoidResult deliver(const nlohmann::json& event) override;

private:
    std::filesystem::path m_path;
    std::mutex m_mutex;
};

/// Keeps events in memory
class CollectingSink final : public NotificationSink
{
public:
    [[nodiscard]] cverify::VoidResult deliver(const nlohmann::json& event) override;

    [[nodiscard]] std::vector<nlohmann::json> events() const;

private:
    mutable std::mutex m_mutex;
    std::vector<nlohmann::json> m_events;
};

/**
 * @brief Deduplicating front of a sink
 *
 * Keys of delivered events are appended to a ledger file (JSON lines) when
 * one is configured, so a restarted publisher still suppresses repeats.
 */
class ResultPublisher
{
public:
    ResultPublisher(std::shared_ptr<NotificationSink> sink,
                    std::optional<std::filesystem::path> ledger_path,
                    std::filesystem::path schema_dir);

    /**
     * @return true when the event was delivered, false when it was a repeat
     */
    [[nodiscard]] cverify::Result<bool> publish(const Notification& notification);

private:
    std::shared_ptr<NotificationSink> m_sink;
    std::optional<std::filesystem::path> m_ledger_path;
    std::filesystem::path m_schema_dir;

    std::mutex m_mutex;
    bool m_loaded = false;
    std::set<std::string> m_delivered;

    [[nodiscard]] cverify::VoidResult load_ledger();
    [[nodiscard]] cverify::VoidResult append_ledger(const std::string& key, const Notification& notification);
};

}  // namespace cverify::publish
