/**
 * @file file_repository.cpp
 * @brief Directory-backed contract repository
 */

#include "cverify/canonical_json.hpp"
#include "cverify/contract_store.hpp"
#include "cverify/schema_validate.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>
#include <functional>
#include <iterator>
#include <limits>
#include <tuple>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace cverify::store {

namespace {

namespace fs = std::filesystem;

[[nodiscard]] Error infrastructure(std::string message)
{
    return Error::make("InfrastructureError", std::move(message));
}

[[nodiscard]] Error errno_error(std::string_view what, const fs::path& path)
{
    return infrastructure(std::format("{} {}: {}", what, path.string(), std::strerror(errno)));
}

[[nodiscard]] VoidResult ensure_parent_dir(const fs::path& path)
{
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return std::unexpected(infrastructure(
            std::format("Failed to create directory {}: {}", path.parent_path().string(), ec.message())));
    }
    return {};
}

[[nodiscard]] fs::path temp_path_for(const fs::path& target)
{
    static std::atomic<std::uint64_t> counter{0};
    return fs::path(target.string()
                    + std::format(".tmp.{}.{}", ::getpid(), counter.fetch_add(1, std::memory_order_relaxed)));
}

/// Exclusive flock(2) on a lock file, released on destruction
class FileLock
{
public:
    [[nodiscard]] static Result<FileLock> acquire(const fs::path& path)
    {
        if (auto dir = ensure_parent_dir(path); !dir) {
            return std::unexpected(dir.error());
        }
        int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd < 0) {
            return std::unexpected(errno_error("Failed to open lock file", path));
        }
        while (::flock(fd, LOCK_EX) != 0) {
            if (errno != EINTR) {
                auto error = errno_error("Failed to lock", path);
                ::close(fd);
                return std::unexpected(error);
            }
        }
        return FileLock(fd);
    }

    FileLock(FileLock&& other) noexcept
        : m_fd(std::exchange(other.m_fd, -1))
    {}
    FileLock& operator=(FileLock&&) = delete;
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    ~FileLock()
    {
        if (m_fd >= 0) {
            ::flock(m_fd, LOCK_UN);
            ::close(m_fd);
        }
    }

private:
    explicit FileLock(int fd)
        : m_fd(fd)
    {}

    int m_fd = -1;
};

}  // namespace

/// Striped in-process locks keyed by address hash
class FileContractRepository::KeyedMutex
{
public:
    [[nodiscard]] std::mutex& for_key(const std::string& key)
    {
        return m_stripes[std::hash<std::string>{}(key) % m_stripes.size()];
    }

private:
    std::array<std::mutex, 64> m_stripes;
};

FileContractRepository::FileContractRepository(std::filesystem::path base_dir,
                                               std::filesystem::path schema_dir)
    : m_base_dir(std::move(base_dir))
    , m_schema_dir(std::move(schema_dir))
    , m_locks(std::make_shared<KeyedMutex>())
{}

std::string FileContractRepository::address_key(const std::string& address) const
{
    return common::sha256(address);
}

std::filesystem::path FileContractRepository::record_path(const std::string& address) const
{
    std::string key = address_key(address);
    return m_base_dir / "contracts" / key.substr(0, 2) / (key + ".json");
}

std::filesystem::path FileContractRepository::sources_dir(const std::string& address) const
{
    return m_base_dir / "sources" / address_key(address);
}

std::filesystem::path FileContractRepository::lock_path(const std::string& address) const
{
    return m_base_dir / "locks" / (address_key(address) + ".lock");
}

std::filesystem::path FileContractRepository::history_dir(const std::string& address) const
{
    return m_base_dir / "history" / address_key(address);
}

cverify::Result<ContractRecord> FileContractRepository::read_record(const std::filesystem::path& path) const
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::unexpected(infrastructure("Failed to open record for read: " + path.string()));
    }
    std::string content{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(content);
    } catch (const std::exception& ex) {
        return std::unexpected(
            infrastructure(std::format("Failed to parse record {}: {}", path.string(), ex.what())));
    }
    if (auto valid = common::validate_json(doc, (m_schema_dir / "contract_record.v1.schema.json").string());
        !valid) {
        return std::unexpected(infrastructure(
            std::format("Stored record {} failed schema validation: {}", path.string(), valid.error().message)));
    }
    return record_from_json(doc);
}

cverify::VoidResult FileContractRepository::write_temp(const std::filesystem::path& path,
                                                       const ContractRecord& record) const
{
    nlohmann::json doc = to_json(record);
    if (auto valid = common::validate_json(doc, (m_schema_dir / "contract_record.v1.schema.json").string());
        !valid) {
        return std::unexpected(Error::make(valid.error().code,
                                           "Contract record schema validation failed: " + valid.error().message));
    }
    auto canonical = canonical::canonicalize(doc);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    if (auto dir = ensure_parent_dir(path); !dir) {
        return dir;
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return std::unexpected(infrastructure("Failed to open file for write: " + path.string()));
    }
    out << *canonical;
    out.flush();
    if (!out) {
        return std::unexpected(infrastructure("Failed to write file: " + path.string()));
    }
    return {};
}

cverify::VoidResult FileContractRepository::write_sources(const std::string& address,
                                                          const SourceBundle& sources) const
{
    const fs::path root = sources_dir(address);
    std::error_code ec;
    fs::remove_all(root, ec);
    if (ec) {
        return std::unexpected(
            infrastructure(std::format("Failed to clear {}: {}", root.string(), ec.message())));
    }
    fs::create_directories(root, ec);
    if (ec) {
        return std::unexpected(
            infrastructure(std::format("Failed to create {}: {}", root.string(), ec.message())));
    }

    for (const auto& [relative, content] : sources.files()) {
        if (!common::is_contained_path(relative)) {
            return std::unexpected(
                Error::make("InvalidSourceBundle", std::format("path '{}' escapes the workspace", relative)));
        }
        const fs::path target = root / common::normalize_path(relative);
        if (auto dir = ensure_parent_dir(target); !dir) {
            return dir;
        }
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out << content;
        out.flush();
        if (!out) {
            return std::unexpected(infrastructure("Failed to write source file: " + target.string()));
        }
    }
    return {};
}

cverify::VoidResult FileContractRepository::archive(const std::string& address,
                                                    const ContractRecord& superseded) const
{
    const std::string& job_id = superseded.job.job_id;
    if (job_id.empty() || job_id == "." || job_id == ".." || job_id.find('/') != std::string::npos) {
        return std::unexpected(infrastructure(std::format("cannot archive {} under job id '{}'", address, job_id)));
    }
    const fs::path target = history_dir(address) / job_id;
    std::error_code ec;
    fs::create_directories(target, ec);
    if (ec) {
        return std::unexpected(
            infrastructure(std::format("Failed to create {}: {}", target.string(), ec.message())));
    }
    fs::copy_file(record_path(address), target / "record.json", fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return std::unexpected(
            infrastructure(std::format("Failed to archive record of {}: {}", address, ec.message())));
    }
    const fs::path sources = sources_dir(address);
    if (fs::exists(sources, ec)) {
        fs::remove_all(target / "sources", ec);
        fs::copy(sources, target / "sources", fs::copy_options::recursive, ec);
        if (ec) {
            return std::unexpected(
                infrastructure(std::format("Failed to archive sources of {}: {}", address, ec.message())));
        }
    }
    return {};
}

template <typename Mutate>
cverify::Result<ContractRecord> FileContractRepository::update(const std::string& address, Mutate&& mutate)
{
    std::lock_guard guard(m_locks->for_key(address_key(address)));
    auto lock = FileLock::acquire(lock_path(address));
    if (!lock) {
        return std::unexpected(lock.error());
    }

    const fs::path path = record_path(address);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::unexpected(Error::make("NotFound", "Contract not found: " + address));
    }
    auto record = read_record(path);
    if (!record) {
        return std::unexpected(record.error());
    }
    if (auto applied = std::forward<Mutate>(mutate)(*record); !applied) {
        return std::unexpected(applied.error());
    }

    const fs::path temp = temp_path_for(path);
    if (auto written = write_temp(temp, *record); !written) {
        fs::remove(temp, ec);
        return std::unexpected(written.error());
    }
    if (::rename(temp.c_str(), path.c_str()) != 0) {
        auto error = errno_error("Failed to replace record", path);
        fs::remove(temp, ec);
        return std::unexpected(error);
    }
    return *record;
}

cverify::VoidResult FileContractRepository::insert_if_absent(const ContractRecord& record,
                                                             const SourceBundle& sources,
                                                             ReplacePolicy policy)
{
    std::lock_guard guard(m_locks->for_key(address_key(record.address)));
    auto lock = FileLock::acquire(lock_path(record.address));
    if (!lock) {
        return std::unexpected(lock.error());
    }

    const fs::path path = record_path(record.address);
    std::error_code ec;
    bool replacing = false;
    if (fs::exists(path, ec)) {
        auto existing = read_record(path);
        if (!existing) {
            return std::unexpected(existing.error());
        }
        if (blocks_submission(*existing, policy)) {
            return std::unexpected(
                Error::make("AlreadyRegistered",
                            std::format("Contract {} is already verified or being verified.", record.address)));
        }
        if (auto archived = archive(record.address, *existing); !archived) {
            return archived;
        }
        replacing = true;
    }

    const fs::path temp = temp_path_for(path);
    if (auto written = write_temp(temp, record); !written) {
        fs::remove(temp, ec);
        return written;
    }
    if (auto stored = write_sources(record.address, sources); !stored) {
        fs::remove(temp, ec);
        return stored;
    }

    if (replacing) {
        if (::rename(temp.c_str(), path.c_str()) != 0) {
            auto error = errno_error("Failed to replace record", path);
            fs::remove(temp, ec);
            return std::unexpected(error);
        }
        return {};
    }

    // link(2) fails with EEXIST when the record already exists
    const int linked = ::link(temp.c_str(), path.c_str());
    const int link_errno = errno;
    fs::remove(temp, ec);
    if (linked != 0) {
        if (link_errno == EEXIST) {
            return std::unexpected(
                Error::make("AlreadyRegistered",
                            std::format("Contract {} is already verified or being verified.", record.address)));
        }
        return std::unexpected(infrastructure(
            std::format("Failed to publish record {}: {}", path.string(), std::strerror(link_errno))));
    }
    return {};
}

cverify::Result<std::optional<ContractRecord>> FileContractRepository::find(const std::string& address) const
{
    const fs::path path = record_path(address);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            return std::unexpected(
                infrastructure(std::format("Failed to stat {}: {}", path.string(), ec.message())));
        }
        return std::optional<ContractRecord>{};
    }
    auto record = read_record(path);
    if (!record) {
        return std::unexpected(record.error());
    }
    return std::optional<ContractRecord>{std::move(*record)};
}

cverify::Result<SourceBundle> FileContractRepository::load_sources(const std::string& address) const
{
    std::error_code ec;
    if (!fs::exists(record_path(address), ec)) {
        return std::unexpected(Error::make("NotFound", "Contract not found: " + address));
    }
    const fs::path root = sources_dir(address);
    if (!fs::exists(root, ec)) {
        return SourceBundle{};
    }
    auto bundle = load_bundle_from_directory(root,
                                             BundleLimits{
                                                 .max_files = std::numeric_limits<std::size_t>::max(),
                                                 .max_file_bytes = std::numeric_limits<std::size_t>::max(),
                                             });
    if (!bundle) {
        return std::unexpected(infrastructure(bundle.error().message));
    }
    return bundle;
}

cverify::Result<ContractRecord> FileContractRepository::finalize(const std::string& address,
                                                                 const std::string& job_id,
                                                                 const Outcome& outcome)
{
    if (!is_terminal(outcome.status)) {
        return std::unexpected(Error::make("InvalidTransition", "finalize requires a terminal status"));
    }
    return update(address, [&](ContractRecord& record) -> VoidResult {
        if (record.status != Status::kPending || record.job.job_id != job_id) {
            return std::unexpected(Error::make(
                "StaleJob",
                std::format("job {} no longer owns {} ({}, job {})",
                            job_id,
                            address,
                            status_name(record.status),
                            record.job.job_id)));
        }
        record.status = outcome.status;
        record.onchain_cid = outcome.onchain_cid;
        record.computed_cid = outcome.computed_cid;
        record.diagnostics = outcome.diagnostics;
        record.exports = outcome.exports;
        record.job.finished_at = outcome.finished_at;
        if (outcome.status == Status::kVerified) {
            record.verified_ts = outcome.finished_at;
        }
        return {};
    });
}

cverify::Result<ContractRecord> FileContractRepository::reassign(const std::string& address,
                                                                 const std::string& expected_job_id,
                                                                 const JobInfo& new_job)
{
    return update(address, [&](ContractRecord& record) -> VoidResult {
        if (record.status != Status::kPending || record.job.job_id != expected_job_id) {
            return std::unexpected(Error::make(
                "StaleJob", std::format("{} is no longer pending under job {}", address, expected_job_id)));
        }
        record.job = new_job;
        return {};
    });
}

cverify::Result<std::vector<ContractRecord>> FileContractRepository::list_by_status(Status status) const
{
    std::vector<ContractRecord> matching;
    const fs::path root = m_base_dir / "contracts";
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        return pending;
    }

    fs::recursive_directory_iterator it(root, ec);
    if (ec) {
        return std::unexpected(
            infrastructure(std::format("Failed to list {}: {}", root.string(), ec.message())));
    }
    for (const auto& entry : it) {
        // temp files carry a ".tmp.<pid>.<n>" suffix and never end in ".json"
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }
        auto record = read_record(entry.path());
        if (!record) {
            return std::unexpected(record.error());
        }
        if (record->status == status) {
            matching.push_back(std::move(*record));
        }
    }
    std::ranges::sort(matching, {}, &ContractRecord::address);
    return matching;
}

cverify::Result<std::vector<ContractRecord>> FileContractRepository::history(const std::string& address) const
{
    std::vector<ContractRecord> superseded;
    const fs::path root = history_dir(address);
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        return superseded;
    }
    fs::directory_iterator it(root, ec);
    if (ec) {
        return std::unexpected(
            infrastructure(std::format("Failed to list {}: {}", root.string(), ec.message())));
    }
    for (const auto& entry : it) {
        if (!entry.is_directory()) {
            continue;
        }
        auto record = read_record(entry.path() / "record.json");
        if (!record) {
            return std::unexpected(record.error());
        }
        superseded.push_back(std::move(*record));
    }
    std::ranges::sort(superseded, [](const ContractRecord& lhs, const ContractRecord& rhs) {
        return std::tie(lhs.job.started_at, lhs.job.job_id) < std::tie(rhs.job.started_at, rhs.job.job_id);
    });
    return superseded;
}

}  // namespace cverify::store
