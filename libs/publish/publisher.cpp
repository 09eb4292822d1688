/**
 * @file publisher.cpp
 * @brief Notification sinks and the deduplicating publisher
 */

#include "cverify/publisher.hpp"

#include "cverify/canonical_json.hpp"
#include "cverify/log.hpp"
#include "cverify/schema_validate.hpp"
#include "cverify/version.hpp"

#include <format>
#include <fstream>
#include <utility>

namespace cverify::publish {

namespace {

namespace fs = std::filesystem;

[[nodiscard]] VoidResult append_line(const fs::path& path, const std::string& line)
{
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
    }
    std::ofstream out(path, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        return std::unexpected(Error::make("IOError", "Failed to open file for append: " + path.string()));
    }
    out << line << '\n';
    out.flush();
    if (!out) {
        return std::unexpected(Error::make("IOError", "Failed to append to " + path.string()));
    }
    return {};
}

}  // namespace

nlohmann::json to_json(const Notification& notification)
{
    return {
        {"schema_version", kNotificationSchemaVersion},
        {       "address", notification.address},
        {        "status", store::status_name(notification.status)},
        {        "job_id", notification.job_id},
        {   "diagnostics", notification.diagnostics},
        {  "computed_cid", notification.computed_cid},
        {   "onchain_cid", notification.onchain_cid},
        {   "finished_at", notification.finished_at}
    };
}

cverify::Result<std::string> dedupe_key(const Notification& notification)
{
    return canonical::hash_canonical({
        {"address", notification.address},
        { "job_id", notification.job_id},
        { "status", store::status_name(notification.status)}
    });
}

// ============================================================================
// Sinks
// ============================================================================

JsonLinesSink::JsonLinesSink(std::filesystem::path path)
    : m_path(std::move(path))
{}

cverify::VoidResult JsonLinesSink::deliver(const nlohmann::json& event)
{
    auto line = canonical::canonicalize(event);
    if (!line) {
        return std::unexpected(line.error());
    }
    std::lock_guard lock(m_mutex);
    return append_line(m_path, *line);
}

cverify::VoidResult CollectingSink::deliver(const nlohmann::json& event)
{
    std::lock_guard lock(m_mutex);
    m_events.push_back(event);
    return {};
}

std::vector<nlohmann::json> CollectingSink::events() const
{
    std::lock_guard lock(m_mutex);
    return m_events;
}

// ============================================================================
// ResultPublisher
// ============================================================================

ResultPublisher::ResultPublisher(std::shared_ptr<NotificationSink> sink,
                                 std::optional<std::filesystem::path> ledger_path,
                                 std::filesystem::path schema_dir)
    : m_sink(std::move(sink))
    , m_ledger_path(std::move(ledger_path))
    , m_schema_dir(std::move(schema_dir))
{}

cverify::VoidResult ResultPublisher::load_ledger()
{
    if (m_loaded) {
        return {};
    }
    if (m_ledger_path) {
        std::error_code ec;
        if (fs::exists(*m_ledger_path, ec)) {
            std::ifstream in(*m_ledger_path);
            if (!in) {
                return std::unexpected(
                    Error::make("IOError", "Failed to open publish ledger: " + m_ledger_path->string()));
            }
            std::string line;
            std::size_t line_no = 0;
            while (std::getline(in, line)) {
                ++line_no;
                if (line.empty()) {
                    continue;
                }
                try {
                    m_delivered.insert(nlohmann::json::parse(line).at("key").get<std::string>());
                } catch (const nlohmann::json::exception& ex) {
                    // torn line from an interrupted append
                    log::warn("publisher", "{}:{}: skipping unreadable ledger entry: {}",
                              m_ledger_path->string(), line_no, ex.what());
                }
            }
        }
    }
    m_loaded = true;
    return {};
}

cverify::VoidResult ResultPublisher::append_ledger(const std::string& key, const Notification& notification)
{
    if (!m_ledger_path) {
        return {};
    }
    auto line = canonical::canonicalize({
        {    "key", key},
        {"address", notification.address},
        { "job_id", notification.job_id},
        { "status", store::status_name(notification.status)}
    });
    if (!line) {
        return std::unexpected(line.error());
    }
    return append_line(*m_ledger_path, *line);
}

cverify::Result<bool> ResultPublisher::publish(const Notification& notification)
{
    if (!store::is_terminal(notification.status)) {
        return std::unexpected(Error::make("InvalidTransition", "only terminal outcomes are published"));
    }
    auto key = dedupe_key(notification);
    if (!key) {
        return std::unexpected(key.error());
    }
    nlohmann::json event = to_json(notification);
    if (auto valid = common::validate_json(event, (m_schema_dir / "notification.v1.schema.json").string()); !valid) {
        return std::unexpected(
            Error::make(valid.error().code, "Notification schema validation failed: " + valid.error().message));
    }

    std::lock_guard lock(m_mutex);
    if (auto loaded = load_ledger(); !loaded) {
        return std::unexpected(loaded.error());
    }
    if (m_delivered.contains(*key)) {
        log::debug("publisher", "suppressed repeat {} for {}", store::status_name(notification.status),
                   notification.address);
        return false;
    }
    if (auto delivered = m_sink->deliver(event); !delivered) {
        return std::unexpected(delivered.error());
    }
    m_delivered.insert(*key);
    if (auto recorded = append_ledger(*key, notification); !recorded) {
        return std::unexpected(recorded.error());
    }
    log::info("publisher", "{} {} (job {})", notification.address, store::status_name(notification.status),
              notification.job_id);
    return true;
}

}  // namespace cverify::publish
