#pragma once

/**
 * @file executor.hpp
 * @brief Running an untrusted toolchain under resource quotas
 */

#include "cverify/common.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace cverify::sandbox {

struct Quotas
{
    int cpu_seconds = 120;
    int wall_seconds = 300;
    std::size_t memory_mb = 2048;
    std::size_t output_bytes = 1024 * 1024;  ///< captured stdout+stderr cap
};

struct ExecRequest
{
    std::string program;            ///< absolute path, not searched in PATH
    std::vector<std::string> args;  ///< arguments after argv[0]
    std::map<std::string, std::string> env;
    std::filesystem::path working_dir;
    Quotas quotas;
    bool isolate_network = true;
    bool confine_filesystem = true;  ///< private root holding only the workspace and read-only system paths
    std::vector<std::filesystem::path> read_only_paths;  ///< extra host paths visible inside the private root
};

struct ExecResult
{
    int exit_code = -1;         ///< -1 when terminated by a signal
    int term_signal = 0;
    bool timed_out = false;     ///< wall clock exceeded, process group killed
    bool quota_exceeded = false;  ///< CPU, memory or file size limit hit
    std::string output;         ///< combined stdout/stderr, at most output_bytes
    bool output_truncated = false;

    [[nodiscard]] bool succeeded() const noexcept
    {
        return exit_code == 0 && term_signal == 0 && !timed_out && !quota_exceeded;
    }
};

/**
 * @brief Isolation boundary around the compiler (external collaborator)
 *
 * An error result means the sandbox itself could not be set up; anything
 * the toolchain does is reported through ExecResult.
 */
class IsolatedExecutor
{
public:
    virtual ~IsolatedExecutor() = default;

    [[nodiscard]] virtual cverify::Result<ExecResult> run(const ExecRequest& request) = 0;
};

/**
 * @brief fork/exec executor with rlimits and user, mount and network namespaces
 *
 * The child gets its own process group, only the capture pipe as
 * stdout/stderr, /dev/null as stdin, and a fixed environment:
 * LC_ALL=C, TZ=UTC, SOURCE_DATE_EPOCH=0, HOME=<working_dir>,
 * PATH=/usr/local/bin:/usr/bin:/bin, then the request env on top.
 *
 * With confine_filesystem the child pivots into a fresh tmpfs root that
 * holds the workspace read-write at its host path, the system directories
 * (/usr, /bin, /sbin, /lib*), the program's directory and read_only_paths
 * read-only, and the /dev/null, /dev/zero and /dev/urandom nodes. Nothing
 * else of the host is reachable. Setup failures are never degraded to an
 * unconfined run.
 *
 * Memory is measured as the resident size of the whole process group; the
 * group is killed once it exceeds quotas.memory_mb.
 */
class ProcessExecutor final : public IsolatedExecutor
{
public:
    [[nodiscard]] cverify::Result<ExecResult> run(const ExecRequest& request) override;
};

/// Deterministic environment for a request, sorted by name
[[nodiscard]] std::vector<std::string> build_environment(const ExecRequest& request);

}  // namespace cverify::sandbox
