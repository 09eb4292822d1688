/**
 * @file process_executor.cpp
 * @brief fork/exec toolchain runner with namespaces, a private root, quotas and output cap
 */

#include "cverify/executor.hpp"

#include "cverify/log.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <format>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string_view>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

namespace cverify::sandbox {

namespace {

namespace fs = std::filesystem;

constexpr rlim_t kMaxFileSizeBytes = 256ULL * 1024ULL * 1024ULL;
constexpr rlim_t kMaxOpenFiles = 256;
constexpr long kMaxInheritedFd = 65536;
constexpr int kPollIntervalMs = 50;

constexpr std::array<std::string_view, 6> kSystemDirectories = {"/usr", "/bin", "/sbin", "/lib", "/lib32", "/lib64"};
constexpr std::array<std::string_view, 3> kDeviceNodes = {"/dev/null", "/dev/zero", "/dev/urandom"};

/// Failure reported by the child through the status pipe before exec
enum class ChildStage : int {
    kChdir = 1,
    kLimits = 2,
    kIsolation = 3,
    kExec = 4
};

struct ChildFailure
{
    ChildStage stage;
    int error;
};

[[nodiscard]] std::string_view stage_name(ChildStage stage)
{
    switch (stage) {
        case ChildStage::kChdir:
            return "chdir";
        case ChildStage::kLimits:
            return "resource limits";
        case ChildStage::kIsolation:
            return "isolation";
        case ChildStage::kExec:
            return "exec";
    }
    return "setup";
}

/// Runs in the forked child: only async-signal-safe calls from here on.
[[noreturn]] void report_and_exit(int status_fd, ChildStage stage)
{
    ChildFailure failure{.stage = stage, .error = errno};
    ssize_t written = ::write(status_fd, &failure, sizeof(failure));
    (void)written;
    ::_exit(127);
}

[[nodiscard]] bool set_limit(int resource, rlim_t soft, rlim_t hard)
{
    struct rlimit rl{};
    rl.rlim_cur = soft;
    rl.rlim_max = hard;
    return ::setrlimit(resource, &rl) == 0;
}

/// One bind mount into the private root, prepared before fork
struct BindMount
{
    std::vector<std::string> parents;  ///< directories to create under the root, outermost first
    std::string source;
    std::string target;
    bool directory = true;
    bool read_only = true;
    unsigned long kept_flags = 0;  ///< locked flags a read-only remount has to repeat
};

/// Namespaces and mounts the child sets up before exec
struct Confinement
{
    int namespaces = 0;
    std::string uid_map;
    std::string gid_map;
    std::string root;  ///< empty without filesystem confinement
    std::vector<BindMount> mounts;
};

[[nodiscard]] fs::path clean(const fs::path& path)
{
    fs::path normal = path.lexically_normal();
    if (!normal.has_filename() && normal != normal.root_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

[[nodiscard]] bool is_within(const fs::path& path, const fs::path& dir)
{
    auto [dir_it, path_it] = std::mismatch(dir.begin(), dir.end(), path.begin(), path.end());
    return dir_it == dir.end();
}

[[nodiscard]] unsigned long kept_mount_flags(const fs::path& source)
{
    struct statvfs info{};
    if (::statvfs(source.c_str(), &info) != 0) {
        return 0;
    }
    unsigned long flags = 0;
    if ((info.f_flag & ST_NOSUID) != 0) {
        flags |= MS_NOSUID;
    }
    if ((info.f_flag & ST_NODEV) != 0) {
        flags |= MS_NODEV;
    }
    if ((info.f_flag & ST_NOEXEC) != 0) {
        flags |= MS_NOEXEC;
    }
    if ((info.f_flag & ST_NOATIME) != 0) {
        flags |= MS_NOATIME;
    }
    if ((info.f_flag & ST_NODIRATIME) != 0) {
        flags |= MS_NODIRATIME;
    }
    if ((info.f_flag & ST_RELATIME) != 0) {
        flags |= MS_RELATIME;
    }
    return flags;
}

void add_mount(Confinement& plan, const fs::path& host_path, bool read_only)
{
    std::error_code ec;
    BindMount mount{
        .parents = {},
        .source = host_path.string(),
        .target = {},
        .directory = fs::is_directory(host_path, ec),
        .read_only = read_only,
        .kept_flags = read_only ? kept_mount_flags(host_path) : 0,
    };
    fs::path target(plan.root);
    const fs::path relative = host_path.relative_path();
    for (auto it = relative.begin(); it != relative.end(); ++it) {
        target /= *it;
        if (std::next(it) != relative.end()) {
            mount.parents.push_back(target.string());
        }
    }
    mount.target = target.string();
    plan.mounts.push_back(std::move(mount));
}

[[nodiscard]] Error infrastructure(std::string message)
{
    return Error::make("InfrastructureError", std::move(message));
}

/// Decide the child's namespaces and, for a confined run, every mount of its private root
[[nodiscard]] cverify::Result<Confinement> plan_confinement(const ExecRequest& request,
                                                            const fs::path& workspace,
                                                            const fs::path& root)
{
    Confinement plan;
    if (request.isolate_network) {
        plan.namespaces |= CLONE_NEWNET;
    }
    if (request.confine_filesystem) {
        plan.namespaces |= CLONE_NEWNS;
    }
    if (plan.namespaces == 0) {
        return plan;
    }
    plan.namespaces |= CLONE_NEWUSER;
    plan.uid_map = std::format("{0} {0} 1\n", ::getuid());
    plan.gid_map = std::format("{0} {0} 1\n", ::getgid());
    if (!request.confine_filesystem) {
        return plan;
    }

    plan.root = root.string();
    std::vector<fs::path> read_only;
    auto add_read_only = [&read_only](const fs::path& candidate) {
        const fs::path path = clean(candidate);
        std::error_code ec;
        if (!path.is_absolute() || path.relative_path().empty() || !fs::exists(path, ec)) {
            return;
        }
        if (std::ranges::any_of(read_only, [&path](const fs::path& listed) { return is_within(path, listed); })) {
            return;
        }
        std::erase_if(read_only, [&path](const fs::path& listed) { return is_within(listed, path); });
        read_only.push_back(path);
    };
    for (auto dir : kSystemDirectories) {
        add_read_only(fs::path(dir));
    }
    add_read_only(fs::path(request.program).parent_path());
    for (const auto& path : request.read_only_paths) {
        add_read_only(path);
    }

    for (const auto& path : read_only) {
        if (is_within(workspace, path)) {
            return std::unexpected(infrastructure(
                std::format("workspace {} lies inside read-only {}", workspace.string(), path.string())));
        }
        add_mount(plan, path, true);
    }
    for (auto node : kDeviceNodes) {
        std::error_code ec;
        if (fs::exists(node, ec)) {
            add_mount(plan, fs::path(node), false);
        }
    }
    add_mount(plan, workspace, false);
    return plan;
}

/// Runs in the forked child. On false errno holds the cause.
[[nodiscard]] bool write_proc_file(const char* path, std::string_view content, bool optional)
{
    int fd = ::open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) {
        return optional && errno == ENOENT;
    }
    ssize_t written = ::write(fd, content.data(), content.size());
    const int saved = errno;
    ::close(fd);
    errno = saved;
    return written == static_cast<ssize_t>(content.size());
}

[[nodiscard]] bool make_mountpoint(const BindMount& mount)
{
    for (const auto& dir : mount.parents) {
        if (::mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) {
            return false;
        }
    }
    if (mount.directory) {
        return ::mkdir(mount.target.c_str(), 0755) == 0 || errno == EEXIST;
    }
    int fd = ::open(mount.target.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return false;
    }
    ::close(fd);
    return true;
}

[[nodiscard]] bool enter_namespaces(const Confinement& plan)
{
    if (plan.namespaces == 0) {
        return true;
    }
    if (::unshare(plan.namespaces) != 0 || !write_proc_file("/proc/self/setgroups", "deny", true)
        || !write_proc_file("/proc/self/uid_map", plan.uid_map, false)
        || !write_proc_file("/proc/self/gid_map", plan.gid_map, false)) {
        return false;
    }
    if (plan.root.empty()) {
        return true;
    }

    if (::mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0
        || ::mount("tmpfs", plan.root.c_str(), "tmpfs", MS_NOSUID | MS_NODEV, "mode=0755") != 0) {
        return false;
    }
    for (const auto& mount : plan.mounts) {
        if (!make_mountpoint(mount)
            || ::mount(mount.source.c_str(), mount.target.c_str(), nullptr, MS_BIND | MS_REC, nullptr) != 0) {
            return false;
        }
        if (mount.read_only
            && ::mount(nullptr, mount.target.c_str(), nullptr, MS_REMOUNT | MS_BIND | MS_RDONLY | mount.kept_flags, nullptr)
                   != 0) {
            return false;
        }
    }
    // pivot_root(".", ".") stacks the old root under the new one; detaching it drops the host tree.
    if (::chdir(plan.root.c_str()) != 0 || ::syscall(SYS_pivot_root, ".", ".") != 0
        || ::umount2(".", MNT_DETACH) != 0) {
        return false;
    }
    return ::mount(nullptr, "/", nullptr, MS_REMOUNT | MS_BIND | MS_RDONLY | MS_NOSUID | MS_NODEV, nullptr) == 0;
}

[[noreturn]] void exec_child(const ExecRequest& request,
                             const Confinement& plan,
                             const char* working_dir,
                             char* const* argv,
                             char* const* envp,
                             int null_fd,
                             int output_fd,
                             int status_fd)
{
    ::setpgid(0, 0);

    ::dup2(null_fd, STDIN_FILENO);
    ::dup2(output_fd, STDOUT_FILENO);
    ::dup2(output_fd, STDERR_FILENO);

    long maxfd = std::min(::sysconf(_SC_OPEN_MAX), kMaxInheritedFd);
    if (maxfd < 256) {
        maxfd = 256;
    }
    for (int fd = 3; fd < static_cast<int>(maxfd); ++fd) {
        if (fd != status_fd) {
            ::close(fd);
        }
    }

    ::umask(077);
    ::prctl(PR_SET_PDEATHSIG, SIGKILL);

    if (::chdir(working_dir) != 0) {
        report_and_exit(status_fd, ChildStage::kChdir);
    }

    const auto cpu = static_cast<rlim_t>(request.quotas.cpu_seconds);
    const bool limited = set_limit(RLIMIT_CPU, cpu, cpu + 1)
                         && set_limit(RLIMIT_FSIZE, kMaxFileSizeBytes, kMaxFileSizeBytes)
                         && set_limit(RLIMIT_NOFILE, kMaxOpenFiles, kMaxOpenFiles);
    if (!limited || ::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        report_and_exit(status_fd, ChildStage::kLimits);
    }

    if (!enter_namespaces(plan)) {
        report_and_exit(status_fd, ChildStage::kIsolation);
    }
    if (::chdir(working_dir) != 0) {
        report_and_exit(status_fd, ChildStage::kChdir);
    }

    ::execve(request.program.c_str(), argv, envp);
    report_and_exit(status_fd, ChildStage::kExec);
}

/// Empty host directory the child mounts its private root on
class RootDir
{
public:
    RootDir() = default;
    RootDir(const RootDir&) = delete;
    RootDir& operator=(const RootDir&) = delete;
    ~RootDir()
    {
        if (!m_path.empty()) {
            std::error_code ec;
            fs::remove(m_path, ec);
        }
    }

    [[nodiscard]] bool create()
    {
        std::error_code ec;
        const fs::path temp = fs::temp_directory_path(ec);
        if (ec) {
            return false;
        }
        std::string pattern = (temp / "cverify-root-XXXXXX").string();
        if (::mkdtemp(pattern.data()) == nullptr) {
            return false;
        }
        m_path = pattern;
        return true;
    }

    [[nodiscard]] const fs::path& path() const noexcept { return m_path; }

private:
    fs::path m_path;
};

/// Resident bytes of every process in @p group
[[nodiscard]] std::size_t group_resident_bytes(pid_t group)
{
    static const auto kPageSize = static_cast<std::size_t>(::sysconf(_SC_PAGESIZE));
    std::size_t total = 0;
    std::error_code ec;
    for (fs::directory_iterator it("/proc", ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.empty() || !std::ranges::all_of(name, [](char c) { return c >= '0' && c <= '9'; })) {
            continue;
        }
        std::ifstream in(it->path() / "stat");
        std::string stat;
        if (!std::getline(in, stat)) {
            continue;
        }
        // comm may contain spaces; the fixed fields start after its closing parenthesis.
        const auto comm_end = stat.rfind(')');
        if (comm_end == std::string::npos || comm_end + 2 > stat.size()) {
            continue;
        }
        std::istringstream fields(stat.substr(comm_end + 2));
        std::string state;
        long parent = 0;
        long process_group = 0;
        fields >> state >> parent >> process_group;
        if (!fields || process_group != group) {
            continue;
        }
        // Fields 6 to 23 sit between the process group and rss.
        std::string skipped;
        for (int field = 6; field <= 23; ++field) {
            fields >> skipped;
        }
        std::size_t rss_pages = 0;
        if (fields >> rss_pages) {
            total += rss_pages * kPageSize;
        }
    }
    return total;
}

/// Owns a descriptor pair from pipe2(2)
class Pipe
{
public:
    Pipe() = default;
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;
    ~Pipe()
    {
        close_read();
        close_write();
    }

    [[nodiscard]] bool open(int flags) { return ::pipe2(m_fds.data(), flags) == 0; }
    [[nodiscard]] int read_end() const noexcept { return m_fds[0]; }
    [[nodiscard]] int write_end() const noexcept { return m_fds[1]; }

    void close_read()
    {
        if (m_fds[0] >= 0) {
            ::close(m_fds[0]);
            m_fds[0] = -1;
        }
    }
    void close_write()
    {
        if (m_fds[1] >= 0) {
            ::close(m_fds[1]);
            m_fds[1] = -1;
        }
    }

private:
    std::array<int, 2> m_fds{-1, -1};
};

/// Append what is readable now; false once the write side is closed
bool drain(int fd, ExecResult& result, std::size_t cap)
{
    std::array<char, 8192> buffer{};
    while (true) {
        ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n > 0) {
            const std::size_t room = cap > result.output.size() ? cap - result.output.size() : 0;
            const auto count = static_cast<std::size_t>(n);
            result.output.append(buffer.data(), std::min(room, count));
            if (count > room) {
                result.output_truncated = true;
            }
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

}  // namespace

std::vector<std::string> build_environment(const ExecRequest& request)
{
    std::map<std::string, std::string> env = {
        {           "LC_ALL",                              "C"},
        {               "TZ",                            "UTC"},
        {"SOURCE_DATE_EPOCH",                              "0"},
        {             "HOME",    request.working_dir.string()},
        {             "PATH", "/usr/local/bin:/usr/bin:/bin"},
    };
    for (const auto& [key, value] : request.env) {
        env.insert_or_assign(key, value);
    }
    std::vector<std::string> entries;
    entries.reserve(env.size());
    for (const auto& [key, value] : env) {
        entries.push_back(key + "=" + value);
    }
    return entries;
}

cverify::Result<ExecResult> ProcessExecutor::run(const ExecRequest& request)
{
    if (request.program.empty() || request.program.front() != '/') {
        return std::unexpected(infrastructure("toolchain program must be an absolute path: " + request.program));
    }

    // argv/envp storage is built before fork; the child must not allocate.
    std::vector<std::string> arg_storage;
    arg_storage.reserve(request.args.size() + 1);
    arg_storage.push_back(request.program);
    arg_storage.insert(arg_storage.end(), request.args.begin(), request.args.end());
    std::vector<char*> argv;
    for (auto& arg : arg_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage = build_environment(request);
    std::vector<char*> envp;
    for (auto& entry : env_storage) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    std::error_code ec;
    const fs::path workspace = clean(fs::absolute(request.working_dir, ec));
    if (ec) {
        return std::unexpected(infrastructure("cannot resolve working directory: " + request.working_dir.string()));
    }
    const std::string working_dir = workspace.string();
    RootDir root;
    if (request.confine_filesystem && !root.create()) {
        return std::unexpected(infrastructure(std::format("cannot create sandbox root: {}", std::strerror(errno))));
    }
    auto plan = plan_confinement(request, workspace, root.path());
    if (!plan) {
        return std::unexpected(plan.error());
    }

    Pipe output;
    Pipe status;
    if (!output.open(O_CLOEXEC) || !status.open(O_CLOEXEC)) {
        return std::unexpected(infrastructure(std::format("pipe failed: {}", std::strerror(errno))));
    }
    int null_fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (null_fd < 0) {
        return std::unexpected(infrastructure(std::format("open /dev/null failed: {}", std::strerror(errno))));
    }

    const auto started = std::chrono::steady_clock::now();
    pid_t pid = ::fork();
    if (pid < 0) {
        const int fork_errno = errno;
        ::close(null_fd);
        return std::unexpected(infrastructure(std::format("fork failed: {}", std::strerror(fork_errno))));
    }
    if (pid == 0) {
        exec_child(request,
                   *plan,
                   working_dir.c_str(),
                   argv.data(),
                   envp.data(),
                   null_fd,
                   output.write_end(),
                   status.write_end());
    }

    ::setpgid(pid, pid);
    ::close(null_fd);
    output.close_write();
    status.close_write();

    // EOF on the status pipe means execve succeeded (O_CLOEXEC) or the child died.
    ChildFailure failure{};
    ssize_t got = 0;
    do {
        got = ::read(status.read_end(), &failure, sizeof(failure));
    } while (got < 0 && errno == EINTR);
    if (got == static_cast<ssize_t>(sizeof(failure))) {
        int ignored = 0;
        ::waitpid(pid, &ignored, 0);
        return std::unexpected(infrastructure(std::format("sandbox {} failed for {}: {}",
                                                          stage_name(failure.stage),
                                                          request.program,
                                                          std::strerror(failure.error))));
    }

    if (int flags = ::fcntl(output.read_end(), F_GETFL, 0); flags >= 0) {
        ::fcntl(output.read_end(), F_SETFL, flags | O_NONBLOCK);
    }

    ExecResult result;
    const auto deadline = started + std::chrono::seconds(request.quotas.wall_seconds);
    const std::size_t memory_limit = request.quotas.memory_mb * 1024U * 1024U;
    bool memory_killed = false;
    bool open_output = true;
    int wait_status = 0;
    struct rusage usage{};
    while (true) {
        if (!result.timed_out && std::chrono::steady_clock::now() >= deadline) {
            ::killpg(pid, SIGKILL);
            result.timed_out = true;
        }
        if (memory_limit > 0 && !memory_killed && !result.timed_out) {
            if (const std::size_t resident = group_resident_bytes(pid); resident > memory_limit) {
                ::killpg(pid, SIGKILL);
                memory_killed = true;
                log::warn("sandbox",
                          "{} killed at {} MiB resident, quota {} MiB",
                          request.program,
                          resident / (1024U * 1024U),
                          request.quotas.memory_mb);
            }
        }
        if (open_output) {
            struct pollfd pfd{.fd = output.read_end(), .events = POLLIN, .revents = 0};
            ::poll(&pfd, 1, kPollIntervalMs);
            open_output = drain(output.read_end(), result, request.quotas.output_bytes);
        } else {
            ::poll(nullptr, 0, kPollIntervalMs);
        }
        pid_t waited = ::wait4(pid, &wait_status, WNOHANG, &usage);
        if (waited == pid) {
            break;
        }
        if (waited < 0 && errno != EINTR) {
            ::killpg(pid, SIGKILL);
            return std::unexpected(infrastructure(std::format("wait failed: {}", std::strerror(errno))));
        }
    }
    // Leftover group members may still hold the pipe open.
    ::killpg(pid, SIGKILL);
    if (open_output) {
        drain(output.read_end(), result, request.quotas.output_bytes);
    }

    if (WIFEXITED(wait_status)) {
        result.exit_code = WEXITSTATUS(wait_status);
    } else if (WIFSIGNALED(wait_status)) {
        result.term_signal = WTERMSIG(wait_status);
    }

    const auto cpu_used = usage.ru_utime.tv_sec + usage.ru_stime.tv_sec;
    // ru_maxrss catches a peak that came and went between two samples.
    const auto peak_resident = static_cast<std::size_t>(usage.ru_maxrss) * 1024U;
    if (result.term_signal == SIGXCPU || result.term_signal == SIGXFSZ
        || (result.term_signal == SIGKILL && !result.timed_out && cpu_used >= request.quotas.cpu_seconds)
        || memory_killed || (memory_limit > 0 && peak_resident > memory_limit)) {
        result.quota_exceeded = true;
    }

    log::debug("sandbox",
               "{} exited code={} signal={} timed_out={} quota_exceeded={} output={}B",
               request.program,
               result.exit_code,
               result.term_signal,
               result.timed_out,
               result.quota_exceeded,
               result.output.size());
    return result;
}

}  // namespace cverify::sandbox
