#pragma once

/**
 * @file pipeline.hpp
 * @brief Verification state machine: intake, job execution, recovery
 *
 * pending -> verified | failed_mismatch | failed_build. The repository's
 * insert_if_absent is the only synchronization between jobs, and every
 * terminal write is a compare-and-set on (pending, job_id).
 */

#include "cverify/common.hpp"
#include "cverify/compiler_driver.hpp"
#include "cverify/contract_store.hpp"
#include "cverify/executor.hpp"
#include "cverify/manifest.hpp"
#include "cverify/onchain.hpp"
#include "cverify/publisher.hpp"
#include "cverify/registry.hpp"
#include "cverify/retry.hpp"
#include "cverify/source_bundle.hpp"
#include "cverify/workspace.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cverify::pipeline {

struct SubmitRequest
{
    std::string address;
    std::string license;
    std::string language;
    manifest::DependencyManifest dependencies;
    SourceBundle sources;
    std::string submitter;
};

struct Accepted
{
    std::string address;
    std::string job_id;
};

/// Addresses touched by VerificationPipeline::republish_all
struct RepublishSummary
{
    std::vector<std::string> delivered;    ///< delivered by this pass
    std::vector<std::string> undelivered;  ///< delivery failed again
};

/// "pending", "verified", "failed_mismatch", "failed_build" or "not_found"
[[nodiscard]] std::string_view state_name(const std::optional<store::Status>& status) noexcept;

/**
 * @brief Whether the service instance that owns a job is still running
 */
class LivenessProbe
{
public:
    virtual ~LivenessProbe() = default;

    [[nodiscard]] virtual bool is_live(const std::string& owner) const = 0;
};

/**
 * Owners are "<host>:<pid>.<start ticks>:<nonce>" (the ".<start ticks>" part
 * is absent where /proc is unreadable). Live when the owner is this
 * instance, or another process on this host that still exists and, when the
 * start time was recorded, started at that same clock tick.
 */
class ProcessLivenessProbe final : public LivenessProbe
{
public:
    explicit ProcessLivenessProbe(std::string self_owner);

    [[nodiscard]] bool is_live(const std::string& owner) const override;

private:
    std::string m_self_owner;
};

/// Owner identity for this process: "<host>:<pid>.<start ticks>:<random nonce>"
[[nodiscard]] std::string make_owner_id();

/// Start time of @p pid in clock ticks since boot (/proc/<pid>/stat field 22)
[[nodiscard]] std::optional<std::uint64_t> process_start_ticks(int pid);

/// 32 hex characters from a random 128-bit value
[[nodiscard]] std::string make_job_id();

/// Current UTC time as "YYYY-MM-DDTHH:MM:SSZ"
[[nodiscard]] std::string utc_now();

struct Collaborators
{
    std::shared_ptr<const registry::RegistrySnapshot> registry;
    std::shared_ptr<store::ContractRepository> repository;
    std::shared_ptr<const workspace::WorkspaceBuilder> workspaces;
    std::shared_ptr<const compiler::CompilerDriver> compiler;
    std::shared_ptr<onchain::OnChainCidSource> onchain;
    std::shared_ptr<publish::ResultPublisher> publisher;
};

struct PipelineOptions
{
    sandbox::Quotas quotas;
    retry::RetryPolicy retry;
    store::ReplacePolicy replace_policy = store::ReplacePolicy::kNever;
    std::string owner;                     ///< defaults to make_owner_id()
    std::function<std::string()> clock;    ///< defaults to utc_now
    std::function<std::string()> job_ids;  ///< defaults to make_job_id
    retry::Sleeper sleeper;                ///< defaults to retry::thread_sleeper()
};

class VerificationPipeline
{
public:
    VerificationPipeline(Collaborators collaborators, PipelineOptions options);

    /**
     * Validate the request and create the pending record.
     * @return the new job, or the rejection (LicenseUnsupported,
     *         LanguageUnsupported, AlreadyRegistered, InfrastructureError)
     */
    [[nodiscard]] cverify::Result<Accepted> submit(const SubmitRequest& request);

    /**
     * Build, compile, address, compare and finalize one job.
     * Build and verification failures are recorded on the contract, not
     * returned. Errors mean the job could not be finalized (StaleJob,
     * NotFound, storage faults).
     */
    [[nodiscard]] cverify::Result<store::ContractRecord> run_job(const std::string& address,
                                                                 const std::string& job_id);

    [[nodiscard]] cverify::Result<std::optional<store::Status>> query_status(const std::string& address) const;

    [[nodiscard]] cverify::Result<std::optional<store::ContractRecord>> find(const std::string& address) const;

    /// Sources retained with the current record of @p address (NotFound when unknown)
    [[nodiscard]] cverify::Result<SourceBundle> sources(const std::string& address) const;

    /// One retained source file; NotFound when the contract or the path is unknown
    [[nodiscard]] cverify::Result<std::string> read_source(const std::string& address, const std::string& path) const;

    /// Failed attempts superseded by resubmissions, oldest first
    [[nodiscard]] cverify::Result<std::vector<store::ContractRecord>> history(const std::string& address) const;

    /// Pending records whose owner is not live
    [[nodiscard]] cverify::Result<std::vector<store::ContractRecord>> find_orphans(const LivenessProbe& probe) const;

    /**
     * Hand an orphaned pending record to a fresh job owned by this instance.
     * @return the new job to run
     */
    [[nodiscard]] cverify::Result<Accepted> requeue(const std::string& address, const LivenessProbe& probe);

    /**
     * Close an orphaned pending record as failed_build.
     */
    [[nodiscard]] cverify::Result<store::ContractRecord> fail_out(const std::string& address,
                                                                  const std::string& reason,
                                                                  const LivenessProbe& probe);

    /**
     * Publish the outcome of a terminal record again. The publisher ledger
     * suppresses outcomes that were already delivered.
     * @return true when delivered by this call, false for a repeat or
     *         without a publisher; NotFound, InvalidTransition while pending,
     *         or the delivery error
     */
    [[nodiscard]] cverify::Result<bool> republish(const std::string& address);

    /// republish() over every terminal record
    [[nodiscard]] cverify::Result<RepublishSummary> republish_all();

    [[nodiscard]] const std::string& owner() const noexcept { return m_options.owner; }

private:
    Collaborators m_collab;
    PipelineOptions m_options;

    [[nodiscard]] cverify::Result<bool> notify(const store::ContractRecord& record);
    [[nodiscard]] store::Outcome execute(const store::ContractRecord& record, const std::string& job_id);
    [[nodiscard]] cverify::Result<store::ContractRecord> finalize_and_publish(const std::string& address,
                                                                              const std::string& job_id,
                                                                              const store::Outcome& outcome);
    [[nodiscard]] cverify::Result<store::ContractRecord> require_orphan(const std::string& address,
                                                                        const LivenessProbe& probe) const;
};

}  // namespace cverify::pipeline
