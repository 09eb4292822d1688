/**
 * @file pipeline.cpp
 * @brief Verification state machine
 */

#include "cverify/pipeline.hpp"

#include "cverify/cid.hpp"
#include "cverify/common.hpp"
#include "cverify/log.hpp"
#include "cverify/request_validator.hpp"

#include <array>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <format>
#include <fstream>
#include <random>
#include <sstream>
#include <utility>

#include <signal.h>
#include <unistd.h>

namespace cverify::pipeline {

namespace {

[[nodiscard]] std::string random_hex(std::size_t words)
{
    thread_local std::mt19937_64 engine{[] {
        std::random_device device;
        std::seed_seq seed{device(), device(), device(), device()};
        return std::mt19937_64{seed};
    }()};
    std::string hex;
    for (std::size_t i = 0; i < words; ++i) {
        hex += std::format("{:016x}", engine());
    }
    return hex;
}

[[nodiscard]] std::string host_name()
{
    std::array<char, 256> buffer{};
    if (::gethostname(buffer.data(), buffer.size() - 1) != 0) {
        return "localhost";
    }
    return std::string(buffer.data());
}

[[nodiscard]] std::string describe(const Error& error)
{
    return std::format("{}: {}", error.code, error.message);
}

}  // namespace

std::string_view state_name(const std::optional<store::Status>& status) noexcept
{
    return status ? store::status_name(*status) : std::string_view{"not_found"};
}

std::optional<std::uint64_t> process_start_ticks(int pid)
{
    std::ifstream in(std::format("/proc/{}/stat", pid));
    std::string stat;
    if (!std::getline(in, stat)) {
        return std::nullopt;
    }
    const auto comm_end = stat.rfind(')');
    if (comm_end == std::string::npos || comm_end + 2 > stat.size()) {
        return std::nullopt;
    }
    std::istringstream fields(stat.substr(comm_end + 2));
    // starttime is field 22; fields 3 to 21 precede it.
    std::string skipped;
    for (int field = 3; field <= 21; ++field) {
        fields >> skipped;
    }
    std::uint64_t ticks = 0;
    if (!(fields >> ticks)) {
        return std::nullopt;
    }
    return ticks;
}

std::string make_owner_id()
{
    const pid_t pid = ::getpid();
    const auto started = process_start_ticks(pid);
    const std::string process = started ? std::format("{}.{}", pid, *started) : std::to_string(pid);
    return std::format("{}:{}:{}", host_name(), process, random_hex(1).substr(0, 8));
}

std::string make_job_id()
{
    return random_hex(2);
}

std::string utc_now()
{
    return std::format("{:%FT%TZ}", std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now()));
}

// ============================================================================
// ProcessLivenessProbe
// ============================================================================

ProcessLivenessProbe::ProcessLivenessProbe(std::string self_owner)
    : m_self_owner(std::move(self_owner))
{}

bool ProcessLivenessProbe::is_live(const std::string& owner) const
{
    if (owner == m_self_owner) {
        return true;
    }
    const auto nonce_sep = owner.rfind(':');
    if (nonce_sep == std::string::npos || nonce_sep == 0) {
        return false;
    }
    const auto pid_sep = owner.rfind(':', nonce_sep - 1);
    if (pid_sep == std::string::npos) {
        return false;
    }
    if (owner.substr(0, pid_sep) != host_name()) {
        return false;
    }

    const std::string_view process(owner.data() + pid_sep + 1, nonce_sep - pid_sep - 1);
    const auto dot = process.find('.');
    const std::string_view pid_text = process.substr(0, dot);
    pid_t pid = 0;
    auto [ptr, ec] = std::from_chars(pid_text.data(), pid_text.data() + pid_text.size(), pid);
    if (ec != std::errc{} || ptr != pid_text.data() + pid_text.size() || pid <= 0) {
        return false;
    }
    std::optional<std::uint64_t> recorded_start;
    if (dot != std::string_view::npos) {
        const std::string_view start_text = process.substr(dot + 1);
        std::uint64_t ticks = 0;
        auto [start_ptr, start_ec] =
            std::from_chars(start_text.data(), start_text.data() + start_text.size(), ticks);
        if (start_text.empty() || start_ec != std::errc{} || start_ptr != start_text.data() + start_text.size()) {
            return false;
        }
        recorded_start = ticks;
    }
    // A different nonce under our own pid is an earlier instance in this process.
    if (pid == ::getpid()) {
        return false;
    }
    if (::kill(pid, 0) != 0 && errno != EPERM) {
        return false;
    }
    // A reused pid belongs to a process that started later than the owner.
    if (recorded_start) {
        const auto actual_start = process_start_ticks(pid);
        return !actual_start || *actual_start == *recorded_start;
    }
    return true;
}

// ============================================================================
// VerificationPipeline
// ============================================================================

VerificationPipeline::VerificationPipeline(Collaborators collaborators, PipelineOptions options)
    : m_collab(std::move(collaborators))
    , m_options(std::move(options))
{
    if (m_options.owner.empty()) {
        m_options.owner = make_owner_id();
    }
    if (!m_options.clock) {
        m_options.clock = utc_now;
    }
    if (!m_options.job_ids) {
        m_options.job_ids = make_job_id;
    }
    if (!m_options.sleeper) {
        m_options.sleeper = retry::thread_sleeper();
    }
}

cverify::Result<Accepted> VerificationPipeline::submit(const SubmitRequest& request)
{
    auto existing = m_collab.repository->find(request.address);
    if (!existing) {
        return std::unexpected(existing.error());
    }

    const validator::ValidationResult verdict = validator::validate_request(
        *m_collab.registry,
        [&](const std::string& /*address*/) { return *existing; },
        validator::ValidationRequest{
            .address = request.address,
            .license = request.license,
            .language = request.language,
        },
        m_options.replace_policy);
    if (!verdict.ok()) {
        log::info("pipeline", "rejected {}: {}", request.address, verdict.message());
        return std::unexpected(verdict.to_error());
    }

    const registry::SupportedLanguage* language = m_collab.registry->find_active_language(request.language);
    const std::string now = m_options.clock();
    store::ContractRecord record{
        .address = request.address,
        .onchain_cid = {},
        .computed_cid = {},
        .submitter = request.submitter,
        .status = store::Status::kPending,
        .license = request.license,
        .language = {.name = language->name, .revision = language->revision},
        .dependencies = request.dependencies,
        .job = {.job_id = m_options.job_ids(), .owner = m_options.owner, .started_at = now, .finished_at = {}},
        .diagnostics = {},
        .exports = {},
        .request_ts = now,
        .verified_ts = {},
        .source_digest = request.sources.digest(),
    };

    if (auto inserted = m_collab.repository->insert_if_absent(record, request.sources, m_options.replace_policy);
        !inserted) {
        log::info("pipeline", "rejected {}: {}", request.address, inserted.error().message);
        return std::unexpected(inserted.error());
    }

    log::info("pipeline",
              "accepted {} as job {} ({} r{})",
              record.address,
              record.job.job_id,
              record.language.name,
              record.language.revision);
    return Accepted{.address = record.address, .job_id = record.job.job_id};
}

store::Outcome VerificationPipeline::execute(const store::ContractRecord& record, const std::string& job_id)
{
    store::Outcome outcome{.status = store::Status::kFailedBuild};
    auto failed = [&](const Error& error) {
        outcome.status = store::Status::kFailedBuild;
        outcome.diagnostics = describe(error);
        outcome.finished_at = m_options.clock();
        log::warn("pipeline", "job {} for {} failed: {}", job_id, record.address, error.code);
        return outcome;
    };

    const registry::SupportedLanguage* language = m_collab.registry->find_language(record.language);
    if (language == nullptr) {
        return failed(Error::make("BuildFailure",
                                  std::format("language {} revision {} is not registered",
                                              record.language.name,
                                              record.language.revision)));
    }

    auto sources = retry::with_retry(m_options.retry, m_options.sleeper, [&] {
        return m_collab.repository->load_sources(record.address);
    });
    if (!sources) {
        return failed(sources.error());
    }

    auto built = m_collab.workspaces->build(job_id, *language, record.dependencies, *sources);
    if (!built) {
        return failed(built.error());
    }
    std::unique_ptr<workspace::Workspace> workspace = std::move(*built);

    auto compiled = retry::with_retry(m_options.retry, m_options.sleeper, [&] {
        return m_collab.compiler->compile(*workspace, language->toolchain, m_options.quotas);
    });
    if (auto destroyed = workspace->destroy(); !destroyed) {
        log::warn("pipeline", "{}", destroyed.error().message);
    }
    if (!compiled) {
        return failed(compiled.error());
    }

    outcome.computed_cid = cid::compute_cid(compiled->bytecode);

    auto onchain = retry::with_retry(m_options.retry, m_options.sleeper, [&] {
        return m_collab.onchain->fetch(record.address);
    });
    if (!onchain) {
        return failed(onchain.error());
    }
    outcome.onchain_cid = *onchain;
    outcome.finished_at = m_options.clock();

    if (cid::same_cid(outcome.computed_cid, outcome.onchain_cid)) {
        outcome.status = store::Status::kVerified;
        outcome.exports = std::move(compiled->exports);
        return outcome;
    }
    outcome.status = store::Status::kFailedMismatch;
    outcome.diagnostics = std::format("MismatchError: computed {} but on-chain {}",
                                      outcome.computed_cid,
                                      outcome.onchain_cid);
    return outcome;
}

cverify::Result<store::ContractRecord> VerificationPipeline::finalize_and_publish(const std::string& address,
                                                                                  const std::string& job_id,
                                                                                  const store::Outcome& outcome)
{
    auto record = retry::with_retry(m_options.retry, m_options.sleeper, [&] {
        return m_collab.repository->finalize(address, job_id, outcome);
    });
    if (!record) {
        log::error("pipeline", "could not finalize {} (job {}): {}", address, job_id, describe(record.error()));
        return std::unexpected(record.error());
    }
    log::info("pipeline", "{} -> {}", address, store::status_name(record->status));

    if (auto published = notify(*record); !published) {
        log::error("pipeline",
                   "notification for {} not delivered, republish retries it: {}",
                   address,
                   describe(published.error()));
    }
    return record;
}

cverify::Result<bool> VerificationPipeline::notify(const store::ContractRecord& record)
{
    if (!m_collab.publisher) {
        return false;
    }
    return m_collab.publisher->publish(publish::Notification{
        .address = record.address,
        .status = record.status,
        .job_id = record.job.job_id,
        .diagnostics = record.diagnostics,
        .computed_cid = record.computed_cid,
        .onchain_cid = record.onchain_cid,
        .finished_at = record.job.finished_at,
    });
}

cverify::Result<SourceBundle> VerificationPipeline::sources(const std::string& address) const
{
    return m_collab.repository->load_sources(address);
}

cverify::Result<std::string> VerificationPipeline::read_source(const std::string& address,
                                                               const std::string& path) const
{
    auto bundle = m_collab.repository->load_sources(address);
    if (!bundle) {
        return std::unexpected(bundle.error());
    }
    const auto& files = bundle->files();
    auto it = files.find(common::normalize_path(path));
    if (it == files.end()) {
        return std::unexpected(Error::make("NotFound", std::format("{} has no source file {}", address, path)));
    }
    return it->second;
}

cverify::Result<std::vector<store::ContractRecord>> VerificationPipeline::history(const std::string& address) const
{
    return m_collab.repository->history(address);
}

cverify::Result<bool> VerificationPipeline::republish(const std::string& address)
{
    auto found = m_collab.repository->find(address);
    if (!found) {
        return std::unexpected(found.error());
    }
    if (!*found) {
        return std::unexpected(Error::make("NotFound", "Contract not found: " + address));
    }
    const store::ContractRecord& record = **found;
    if (!store::is_terminal(record.status)) {
        return std::unexpected(Error::make(
            "InvalidTransition", std::format("{} is still pending under job {}", address, record.job.job_id)));
    }
    auto delivered = notify(record);
    if (delivered && *delivered) {
        log::info("pipeline", "republished {} -> {}", address, store::status_name(record.status));
    }
    return delivered;
}

cverify::Result<RepublishSummary> VerificationPipeline::republish_all()
{
    RepublishSummary summary;
    for (const auto status : {store::Status::kVerified, store::Status::kFailedMismatch, store::Status::kFailedBuild}) {
        auto records = m_collab.repository->list_by_status(status);
        if (!records) {
            return std::unexpected(records.error());
        }
        for (const auto& record : *records) {
            auto delivered = notify(record);
            if (!delivered) {
                log::error("pipeline", "notification for {} not delivered: {}", record.address, describe(delivered.error()));
                summary.undelivered.push_back(record.address);
            } else if (*delivered) {
                summary.delivered.push_back(record.address);
            }
        }
    }
    return summary;
}

cverify::Result<store::ContractRecord> VerificationPipeline::run_job(const std::string& address,
                                                                     const std::string& job_id)
{
    auto found = m_collab.repository->find(address);
    if (!found) {
        return std::unexpected(found.error());
    }
    if (!*found) {
        return std::unexpected(Error::make("NotFound", "Contract not found: " + address));
    }
    const store::ContractRecord& record = **found;
    if (record.status != store::Status::kPending || record.job.job_id != job_id) {
        return std::unexpected(Error::make(
            "StaleJob", std::format("job {} does not own a pending record for {}", job_id, address)));
    }

    log::info("pipeline", "running job {} for {}", job_id, address);
    store::Outcome outcome;
    try {
        outcome = execute(record, job_id);
    } catch (const std::exception& ex) {
        outcome = store::Outcome{
            .status = store::Status::kFailedBuild,
            .diagnostics = std::format("InfrastructureError: {}", ex.what()),
            .finished_at = m_options.clock(),
        };
    }
    return finalize_and_publish(address, job_id, outcome);
}

cverify::Result<std::optional<store::Status>> VerificationPipeline::query_status(const std::string& address) const
{
    auto found = m_collab.repository->find(address);
    if (!found) {
        return std::unexpected(found.error());
    }
    if (!*found) {
        return std::optional<store::Status>{};
    }
    return std::optional<store::Status>{(*found)->status};
}

cverify::Result<std::optional<store::ContractRecord>> VerificationPipeline::find(const std::string& address) const
{
    return m_collab.repository->find(address);
}

cverify::Result<std::vector<store::ContractRecord>> VerificationPipeline::find_orphans(const LivenessProbe& probe) const
{
    auto pending = m_collab.repository->list_pending();
    if (!pending) {
        return std::unexpected(pending.error());
    }
    std::vector<store::ContractRecord> orphans;
    for (auto& record : *pending) {
        if (!probe.is_live(record.job.owner)) {
            orphans.push_back(std::move(record));
        }
    }
    return orphans;
}

cverify::Result<store::ContractRecord> VerificationPipeline::require_orphan(const std::string& address,
                                                                            const LivenessProbe& probe) const
{
    auto found = m_collab.repository->find(address);
    if (!found) {
        return std::unexpected(found.error());
    }
    if (!*found) {
        return std::unexpected(Error::make("NotFound", "Contract not found: " + address));
    }
    if ((*found)->status != store::Status::kPending) {
        return std::unexpected(Error::make(
            "NotOrphaned", std::format("{} is {}, not pending", address, store::status_name((*found)->status))));
    }
    if (probe.is_live((*found)->job.owner)) {
        return std::unexpected(Error::make(
            "NotOrphaned", std::format("{} is still owned by live instance {}", address, (*found)->job.owner)));
    }
    return std::move(**found);
}

cverify::Result<Accepted> VerificationPipeline::requeue(const std::string& address, const LivenessProbe& probe)
{
    auto orphan = require_orphan(address, probe);
    if (!orphan) {
        return std::unexpected(orphan.error());
    }
    store::JobInfo job{
        .job_id = m_options.job_ids(),
        .owner = m_options.owner,
        .started_at = m_options.clock(),
        .finished_at = {},
    };
    auto reassigned = m_collab.repository->reassign(address, orphan->job.job_id, job);
    if (!reassigned) {
        return std::unexpected(reassigned.error());
    }
    log::info("pipeline", "requeued {}: job {} replaces {}", address, job.job_id, orphan->job.job_id);
    return Accepted{.address = address, .job_id = job.job_id};
}

cverify::Result<store::ContractRecord> VerificationPipeline::fail_out(const std::string& address,
                                                                      const std::string& reason,
                                                                      const LivenessProbe& probe)
{
    auto orphan = require_orphan(address, probe);
    if (!orphan) {
        return std::unexpected(orphan.error());
    }
    store::Outcome outcome{
        .status = store::Status::kFailedBuild,
        .diagnostics = std::format("InfrastructureError: job {} abandoned by {}: {}",
                                   orphan->job.job_id,
                                   orphan->job.owner,
                                   reason),
        .finished_at = m_options.clock(),
    };
    return finalize_and_publish(address, orphan->job.job_id, outcome);
}

}  // namespace cverify::pipeline
