/**
 * @file memory_repository.cpp
 * @brief In-process contract repository
 */

#include "cverify/contract_store.hpp"

#include <format>

namespace cverify::store {

namespace {

[[nodiscard]] Error already_registered(const std::string& address)
{
    return Error::make("AlreadyRegistered",
                       std::format("Contract {} is already verified or being verified.", address));
}

[[nodiscard]] Error not_found(const std::string& address)
{
    return Error::make("NotFound", "Contract not found: " + address);
}

void apply_outcome(ContractRecord& record, const Outcome& outcome)
{
    record.status = outcome.status;
    record.onchain_cid = outcome.onchain_cid;
    record.computed_cid = outcome.computed_cid;
    record.diagnostics = outcome.diagnostics;
    record.exports = outcome.exports;
    record.job.finished_at = outcome.finished_at;
    if (outcome.status == Status::kVerified) {
        record.verified_ts = outcome.finished_at;
    }
}

}  // namespace

cverify::VoidResult InMemoryContractRepository::insert_if_absent(const ContractRecord& record,
                                                                 const SourceBundle& sources,
                                                                 ReplacePolicy policy)
{
    std::lock_guard lock(m_mutex);
    auto it = m_rows.find(record.address);
    if (it != m_rows.end()) {
        if (blocks_submission(it->second.record, policy)) {
            return std::unexpected(already_registered(record.address));
        }
        m_history[record.address].push_back(std::move(it->second));
        it->second = Row{.record = record, .sources = sources};
        return {};
    }
    m_rows.emplace(record.address, Row{.record = record, .sources = sources});
    return {};
}

cverify::Result<std::optional<ContractRecord>> InMemoryContractRepository::find(const std::string& address) const
{
    std::lock_guard lock(m_mutex);
    auto it = m_rows.find(address);
    if (it == m_rows.end()) {
        return std::optional<ContractRecord>{};
    }
    return std::optional<ContractRecord>{it->second.record};
}

cverify::Result<SourceBundle> InMemoryContractRepository::load_sources(const std::string& address) const
{
    std::lock_guard lock(m_mutex);
    auto it = m_rows.find(address);
    if (it == m_rows.end()) {
        return std::unexpected(not_found(address));
    }
    return it->second.sources;
}

cverify::Result<ContractRecord> InMemoryContractRepository::finalize(const std::string& address,
                                                                     const std::string& job_id,
                                                                     const Outcome& outcome)
{
    std::lock_guard lock(m_mutex);
    auto it = m_rows.find(address);
    if (it == m_rows.end()) {
        return std::unexpected(not_found(address));
    }
    ContractRecord& record = it->second.record;
    if (record.status != Status::kPending || record.job.job_id != job_id) {
        return std::unexpected(Error::make(
            "StaleJob",
            std::format("job {} no longer owns {} ({}, job {})",
                        job_id,
                        address,
                        status_name(record.status),
                        record.job.job_id)));
    }
    if (!is_terminal(outcome.status)) {
        return std::unexpected(Error::make("InvalidTransition", "finalize requires a terminal status"));
    }
    apply_outcome(record, outcome);
    return record;
}

cverify::Result<ContractRecord> InMemoryContractRepository::reassign(const std::string& address,
                                                                     const std::string& expected_job_id,
                                                                     const JobInfo& new_job)
{
    std::lock_guard lock(m_mutex);
    auto it = m_rows.find(address);
    if (it == m_rows.end()) {
        return std::unexpected(not_found(address));
    }
    ContractRecord& record = it->second.record;
    if (record.status != Status::kPending || record.job.job_id != expected_job_id) {
        return std::unexpected(Error::make(
            "StaleJob", std::format("{} is no longer pending under job {}", address, expected_job_id)));
    }
    record.job = new_job;
    return record;
}

cverify::Result<std::vector<ContractRecord>> InMemoryContractRepository::list_by_status(Status status) const
{
    std::lock_guard lock(m_mutex);
    std::vector<ContractRecord> matching;
    for (const auto& [address, row] : m_rows) {
        if (row.record.status == status) {
            matching.push_back(row.record);
        }
    }
    return matching;
}

cverify::Result<std::vector<ContractRecord>> InMemoryContractRepository::history(const std::string& address) const
{
    std::lock_guard lock(m_mutex);
    std::vector<ContractRecord> superseded;
    if (auto it = m_history.find(address); it != m_history.end()) {
        for (const auto& row : it->second) {
            superseded.push_back(row.record);
        }
    }
    return superseded;
}

}  // namespace cverify::store
