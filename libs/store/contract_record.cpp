/**
 * @file contract_record.cpp
 * @brief Contract record serialization and status names
 */

#include "cverify/contract_store.hpp"

#include "cverify/version.hpp"

#include <format>

namespace cverify::store {

std::string_view status_name(Status status) noexcept
{
    switch (status) {
        case Status::kPending:
            return "pending";
        case Status::kVerified:
            return "verified";
        case Status::kFailedMismatch:
            return "failed_mismatch";
        case Status::kFailedBuild:
            return "failed_build";
    }
    return "pending";
}

std::optional<Status> parse_status(std::string_view name)
{
    if (name == "pending") {
        return Status::kPending;
    }
    if (name == "verified") {
        return Status::kVerified;
    }
    if (name == "failed_mismatch") {
        return Status::kFailedMismatch;
    }
    if (name == "failed_build") {
        return Status::kFailedBuild;
    }
    return std::nullopt;
}

bool blocks_submission(const ContractRecord& existing, ReplacePolicy policy) noexcept
{
    if (policy == ReplacePolicy::kNever) {
        return true;
    }
    return existing.status != Status::kFailedBuild && existing.status != Status::kFailedMismatch;
}

nlohmann::json to_json(const ContractRecord& record)
{
    return {
        {"schema_version", kContractRecordSchemaVersion},
        {       "address", record.address},
        {   "onchain_cid", record.onchain_cid},
        {  "computed_cid", record.computed_cid},
        {     "submitter", record.submitter},
        {        "status", status_name(record.status)},
        {       "license", record.license},
        {      "language", {{"name", record.language.name}, {"revision", record.language.revision}}},
        {  "dependencies", manifest::to_json(record.dependencies)},
        {           "job",
         {{"job_id", record.job.job_id},
          {"owner", record.job.owner},
          {"started_at", record.job.started_at},
          {"finished_at", record.job.finished_at}}},
        {   "diagnostics", record.diagnostics},
        {       "exports", record.exports},
        {    "request_ts", record.request_ts},
        {   "verified_ts", record.verified_ts},
        { "source_digest", record.source_digest}
    };
}

cverify::Result<ContractRecord> record_from_json(const nlohmann::json& j)
{
    try {
        ContractRecord record;
        record.address = j.at("address").get<std::string>();
        record.onchain_cid = j.at("onchain_cid").get<std::string>();
        record.computed_cid = j.at("computed_cid").get<std::string>();
        record.submitter = j.at("submitter").get<std::string>();
        auto status = parse_status(j.at("status").get<std::string>());
        if (!status) {
            return std::unexpected(Error::make(
                "ParseError",
                std::format("record {} has unknown status {}", record.address, j.at("status").dump())));
        }
        record.status = *status;
        record.license = j.at("license").get<std::string>();
        record.language.name = j.at("language").at("name").get<std::string>();
        record.language.revision = j.at("language").at("revision").get<int>();
        auto dependencies = manifest::manifest_from_json(j.at("dependencies"));
        if (!dependencies) {
            return std::unexpected(dependencies.error());
        }
        record.dependencies = std::move(*dependencies);
        const auto& job = j.at("job");
        record.job = JobInfo{
            .job_id = job.at("job_id").get<std::string>(),
            .owner = job.at("owner").get<std::string>(),
            .started_at = job.at("started_at").get<std::string>(),
            .finished_at = job.at("finished_at").get<std::string>(),
        };
        record.diagnostics = j.at("diagnostics").get<std::string>();
        record.exports = j.at("exports").get<std::vector<std::string>>();
        record.request_ts = j.at("request_ts").get<std::string>();
        record.verified_ts = j.at("verified_ts").get<std::string>();
        record.source_digest = j.at("source_digest").get<std::string>();
        return record;
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(
            Error::make("ParseError", std::string("Malformed contract record: ") + ex.what()));
    }
}

}  // namespace cverify::store
