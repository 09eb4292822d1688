#pragma once

/**
 * @file contract_store.hpp
 * @brief Persistent contract records and the repositories that own them
 *
 * The repository is the single-flight primitive: insert_if_absent is the
 * only way a pending record comes into existence, and finalize only moves
 * a pending record owned by the given job to a terminal status.
 */

#include "cverify/common.hpp"
#include "cverify/manifest.hpp"
#include "cverify/registry.hpp"
#include "cverify/source_bundle.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace cverify::store {

enum class Status : std::uint8_t {
    kPending,
    kVerified,
    kFailedMismatch,
    kFailedBuild
};

[[nodiscard]] std::string_view status_name(Status status) noexcept;
[[nodiscard]] std::optional<Status> parse_status(std::string_view name);
[[nodiscard]] constexpr bool is_terminal(Status status) noexcept
{
    return status != Status::kPending;
}

/// Identity of the job currently (or last) responsible for a record
struct JobInfo
{
    std::string job_id;
    std::string owner;  ///< "<host>:<pid>.<start ticks>:<nonce>" of the owning service instance
    std::string started_at;
    std::string finished_at;
};

struct ContractRecord
{
    std::string address;
    std::string onchain_cid;   ///< empty until fetched at job start
    std::string computed_cid;  ///< empty unless a build produced bytecode
    std::string submitter;
    Status status = Status::kPending;
    std::string license;
    registry::LanguageRef language;
    manifest::DependencyManifest dependencies;
    JobInfo job;
    std::string diagnostics;
    std::vector<std::string> exports;
    std::string request_ts;
    std::string verified_ts;
    std::string source_digest;
};

/// Terminal outcome written by the state machine
struct Outcome
{
    Status status = Status::kFailedBuild;
    std::string onchain_cid;
    std::string computed_cid;
    std::string diagnostics;
    std::vector<std::string> exports;
    std::string finished_at;
};

[[nodiscard]] nlohmann::json to_json(const ContractRecord& record);
[[nodiscard]] cverify::Result<ContractRecord> record_from_json(const nlohmann::json& j);

/// Replace policy for insert_if_absent
enum class ReplacePolicy : std::uint8_t {
    kNever,           ///< any existing row blocks the insert
    kTerminalFailed   ///< failed_build / failed_mismatch rows may be replaced
};

/**
 * @brief Storage for contract records (external collaborator)
 *
 * Error codes: "AlreadyRegistered" when an insert loses, "NotFound",
 * "StaleJob" when a compare-and-set does not hold, "InfrastructureError"
 * for storage faults.
 */
class ContractRepository
{
public:
    virtual ~ContractRepository() = default;

    /**
     * Atomically create a pending record keyed by address, together with
     * the submitted sources.
     */
    [[nodiscard]] virtual cverify::VoidResult insert_if_absent(const ContractRecord& record,
                                                               const SourceBundle& sources,
                                                               ReplacePolicy policy) = 0;

    [[nodiscard]] virtual cverify::Result<std::optional<ContractRecord>> find(const std::string& address) const = 0;

    [[nodiscard]] virtual cverify::Result<SourceBundle> load_sources(const std::string& address) const = 0;

    /**
     * Move a pending record owned by job_id to a terminal status.
     */
    [[nodiscard]] virtual cverify::Result<ContractRecord> finalize(const std::string& address,
                                                                   const std::string& job_id,
                                                                   const Outcome& outcome) = 0;

    /**
     * Hand a pending record over to a new job (recovery requeue).
     */
    [[nodiscard]] virtual cverify::Result<ContractRecord> reassign(const std::string& address,
                                                                   const std::string& expected_job_id,
                                                                   const JobInfo& new_job) = 0;

    /// Current records with @p status, ordered by address
    [[nodiscard]] virtual cverify::Result<std::vector<ContractRecord>> list_by_status(Status status) const = 0;

    /**
     * Failed records superseded by a resubmission, oldest first. Their
     * sources are archived alongside.
     */
    [[nodiscard]] virtual cverify::Result<std::vector<ContractRecord>> history(const std::string& address) const = 0;

    [[nodiscard]] cverify::Result<std::vector<ContractRecord>> list_pending() const
    {
        return list_by_status(Status::kPending);
    }
};

/// Whether an existing row blocks a new submission under the given policy
[[nodiscard]] bool blocks_submission(const ContractRecord& existing, ReplacePolicy policy) noexcept;

/**
 * @brief Mutex-guarded in-process repository
 */
class InMemoryContractRepository final : public ContractRepository
{
public:
    [[nodiscard]] cverify::VoidResult insert_if_absent(const ContractRecord& record,
                                                       const SourceBundle& sources,
                                                       ReplacePolicy policy) override;
    [[nodiscard]] cverify::Result<std::optional<ContractRecord>> find(const std::string& address) const override;
    [[nodiscard]] cverify::Result<SourceBundle> load_sources(const std::string& address) const override;
    [[nodiscard]] cverify::Result<ContractRecord> finalize(const std::string& address,
                                                           const std::string& job_id,
                                                           const Outcome& outcome) override;
    [[nodiscard]] cverify::Result<ContractRecord> reassign(const std::string& address,
                                                           const std::string& expected_job_id,
                                                           const JobInfo& new_job) override;
    [[nodiscard]] cverify::Result<std::vector<ContractRecord>> list_by_status(Status status) const override;
    [[nodiscard]] cverify::Result<std::vector<ContractRecord>> history(const std::string& address) const override;

private:
    struct Row
    {
        ContractRecord record;
        SourceBundle sources;
    };

    mutable std::mutex m_mutex;
    std::map<std::string, Row> m_rows;
    std::map<std::string, std::vector<Row>> m_history;
};

/**
 * @brief Directory-backed repository
 *
 * Layout (sharded like a content store):
 *   <base>/contracts/<2 hex>/<sha256(address)>.json   canonical record
 *   <base>/sources/<sha256(address)>/<relative path>   submitted files
 *   <base>/history/<sha256(address)>/<job id>/        superseded record.json and sources/
 *
 * Inserts publish a fully written temp file with link(2), which fails
 * atomically when the record exists. Updates hold a per-address mutex in
 * process and flock(2) across processes, then rename(2) over the record.
 */
class FileContractRepository final : public ContractRepository
{
public:
    FileContractRepository(std::filesystem::path base_dir, std::filesystem::path schema_dir);

    [[nodiscard]] cverify::VoidResult insert_if_absent(const ContractRecord& record,
                                                       const SourceBundle& sources,
                                                       ReplacePolicy policy) override;
    [[nodiscard]] cverify::Result<std::optional<ContractRecord>> find(const std::string& address) const override;
    [[nodiscard]] cverify::Result<SourceBundle> load_sources(const std::string& address) const override;
    [[nodiscard]] cverify::Result<ContractRecord> finalize(const std::string& address,
                                                           const std::string& job_id,
                                                           const Outcome& outcome) override;
    [[nodiscard]] cverify::Result<ContractRecord> reassign(const std::string& address,
                                                           const std::string& expected_job_id,
                                                           const JobInfo& new_job) override;
    [[nodiscard]] cverify::Result<std::vector<ContractRecord>> list_by_status(Status status) const override;
    [[nodiscard]] cverify::Result<std::vector<ContractRecord>> history(const std::string& address) const override;

private:
    class KeyedMutex;

    std::filesystem::path m_base_dir;
    std::filesystem::path m_schema_dir;
    std::shared_ptr<KeyedMutex> m_locks;

    [[nodiscard]] std::string address_key(const std::string& address) const;
    [[nodiscard]] std::filesystem::path record_path(const std::string& address) const;
    [[nodiscard]] std::filesystem::path sources_dir(const std::string& address) const;
    [[nodiscard]] std::filesystem::path lock_path(const std::string& address) const;
    [[nodiscard]] std::filesystem::path history_dir(const std::string& address) const;

    [[nodiscard]] cverify::Result<ContractRecord> read_record(const std::filesystem::path& path) const;
    [[nodiscard]] cverify::VoidResult write_temp(const std::filesystem::path& path,
                                                 const ContractRecord& record) const;
    [[nodiscard]] cverify::VoidResult write_sources(const std::string& address,
                                                    const SourceBundle& sources) const;
    [[nodiscard]] cverify::VoidResult archive(const std::string& address, const ContractRecord& superseded) const;

    template <typename Mutate>
    [[nodiscard]] cverify::Result<ContractRecord> update(const std::string& address, Mutate&& mutate);
};

}  // namespace cverify::store
