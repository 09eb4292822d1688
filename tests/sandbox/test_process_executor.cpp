/**
 * @file test_process_executor.cpp
 * @brief fork/exec executor: exit status, output capture, quotas, environment, confinement
 */

#include "cverify/executor.hpp"

#include "support/test_support.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <format>

#include <gtest/gtest.h>

using namespace cverify::sandbox;
using cverify::test::TempDir;

namespace {

ExecRequest shell(const std::string& script, const std::filesystem::path& working_dir)
{
    ExecRequest request;
    request.program = "/bin/sh";
    request.args = {"-c", script};
    request.working_dir = working_dir;
    request.quotas.wall_seconds = 20;
    request.isolate_network = false;
    request.confine_filesystem = false;
    return request;
}

}  // namespace

TEST(ProcessExecutor, CapturesExitCodeAndOutput)
{
    TempDir dir("exec_exit");
    ProcessExecutor executor;
    auto result = executor.run(shell("echo out; echo err 1>&2; exit 3", dir.path()));
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result->exit_code, 3);
    EXPECT_EQ(result->term_signal, 0);
    EXPECT_FALSE(result->timed_out);
    EXPECT_FALSE(result->succeeded());
    EXPECT_NE(result->output.find("out"), std::string::npos);
    EXPECT_NE(result->output.find("err"), std::string::npos);
}

TEST(ProcessExecutor, Success)
{
    TempDir dir("exec_success");
    ProcessExecutor executor;
    auto result = executor.run(shell("exit 0", dir.path()));
    ASSERT_TRUE(result);
    EXPECT_TRUE(result->succeeded());
    EXPECT_TRUE(result->output.empty());
}

TEST(ProcessExecutor, RunsInWorkingDirectory)
{
    TempDir dir("exec_cwd");
    cverify::test::write_file(dir.path() / "marker.txt", "inside");
    ProcessExecutor executor;
    auto result = executor.run(shell("cat marker.txt; echo built > artifact.bin", dir.path()));
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result->output, "inside");
    EXPECT_EQ(cverify::test::read_file(dir.path() / "artifact.bin"), "built\n");
}

TEST(ProcessExecutor, FixedEnvironment)
{
    TempDir dir("exec_env");
    ::setenv("CVERIFY_LEAKED_VARIABLE", "secret", 1);
    ProcessExecutor executor;
    auto request = shell(R"(printf '%s|%s|%s|%s|%s|%s' "$LC_ALL" "$TZ" "$SOURCE_DATE_EPOCH" "$HOME" "$EXTRA" "$CVERIFY_LEAKED_VARIABLE")",
                         dir.path());
    request.env = {
        {"EXTRA",   "1"},
        {   "TZ", "UTC"}
    };
    auto result = executor.run(request);
    ::unsetenv("CVERIFY_LEAKED_VARIABLE");
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result->output, "C|UTC|0|" + dir.path().string() + "|1|");
}

TEST(ProcessExecutor, BuildEnvironmentIsSortedAndOverridable)
{
    ExecRequest request;
    request.working_dir = "/work";
    request.env = {
        {"LC_ALL", "C.UTF-8"},
        {"GOPATH", "/work/deps"}
    };
    auto env = build_environment(request);
    EXPECT_TRUE(std::ranges::is_sorted(env));
    EXPECT_TRUE(std::ranges::contains(env, std::string("LC_ALL=C.UTF-8")));
    EXPECT_TRUE(std::ranges::contains(env, std::string("GOPATH=/work/deps")));
    EXPECT_TRUE(std::ranges::contains(env, std::string("HOME=/work")));
    EXPECT_TRUE(std::ranges::contains(env, std::string("SOURCE_DATE_EPOCH=0")));
}

TEST(ProcessExecutor, OutputIsCapped)
{
    TempDir dir("exec_cap");
    ProcessExecutor executor;
    auto request = shell("i=0; while [ $i -lt 2000 ]; do echo 0123456789; i=$((i+1)); done", dir.path());
    request.quotas.output_bytes = 100;
    auto result = executor.run(request);
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result->exit_code, 0);
    EXPECT_EQ(result->output.size(), 100U);
    EXPECT_TRUE(result->output_truncated);
}

TEST(ProcessExecutor, WallClockTimeoutKillsProcessGroup)
{
    TempDir dir("exec_timeout");
    ProcessExecutor executor;
    auto request = shell("sleep 30 & sleep 30", dir.path());
    request.quotas.wall_seconds = 1;

    const auto started = std::chrono::steady_clock::now();
    auto result = executor.run(request);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(result) << result.error().message;
    EXPECT_TRUE(result->timed_out);
    EXPECT_EQ(result->term_signal, SIGKILL);
    EXPECT_FALSE(result->succeeded());
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST(ProcessExecutor, CpuQuota)
{
    TempDir dir("exec_cpu");
    ProcessExecutor executor;
    auto request = shell("while :; do :; done", dir.path());
    request.quotas.cpu_seconds = 1;
    request.quotas.wall_seconds = 30;

    auto result = executor.run(request);
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_TRUE(result->quota_exceeded);
    EXPECT_FALSE(result->timed_out);
    EXPECT_FALSE(result->succeeded());
}

TEST(ProcessExecutor, RelativeProgramRejected)
{
    TempDir dir("exec_relative");
    ProcessExecutor executor;
    auto request = shell("exit 0", dir.path());
    request.program = "sh";
    auto result = executor.run(request);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "InfrastructureError");
}

TEST(ProcessExecutor, MissingProgramIsSetupFailure)
{
    TempDir dir("exec_missing");
    ProcessExecutor executor;
    auto request = shell("exit 0", dir.path());
    request.program = "/nonexistent/cverify-toolchain";
    auto result = executor.run(request);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "InfrastructureError");
    EXPECT_NE(result.error().message.find("exec"), std::string::npos);
}

TEST(ProcessExecutor, MissingWorkingDirectoryIsSetupFailure)
{
    ProcessExecutor executor;
    auto result = executor.run(shell("exit 0", "/nonexistent/cverify-workspace"));
    ASSERT_FALSE(result);
    EXPECT_NE(result.error().message.find("chdir"), std::string::npos);
}

TEST(ProcessExecutor, NetworkIsolationRunsOrReportsSetupFailure)
{
    TempDir dir("exec_isolation");
    ProcessExecutor executor;
    auto request = shell("exit 0", dir.path());
    request.isolate_network = true;
    auto result = executor.run(request);
    if (result) {
        EXPECT_TRUE(result->succeeded());
    } else {
        // Unprivileged user namespaces may be disabled on the host
        EXPECT_NE(result.error().message.find("isolation"), std::string::npos);
    }
}

TEST(ProcessExecutor, MemoryQuota)
{
    TempDir dir("exec_memory");
    ProcessExecutor executor;
    auto request = shell(R"(x=$(head -c 268435456 /dev/zero | tr '\0' a); echo ${#x})", dir.path());
    request.quotas.memory_mb = 32;
    request.quotas.wall_seconds = 60;

    auto result = executor.run(request);
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_TRUE(result->quota_exceeded);
    EXPECT_FALSE(result->timed_out);
    EXPECT_FALSE(result->succeeded());
}

TEST(ProcessExecutor, ConfinedRunSeesOnlyItsWorkspace)
{
    TempDir dir("exec_confined");
    TempDir outside("exec_outside");
    cverify::test::write_file(outside.path() / "secret.txt", "retained source");
    ProcessExecutor executor;
    auto request = shell(std::format("echo x > {0}/f; cat {0}/secret.txt; echo built > artifact.bin",
                                     outside.path().string()),
                         dir.path());
    request.confine_filesystem = true;

    auto result = executor.run(request);
    EXPECT_FALSE(std::filesystem::exists(outside.path() / "f"));
    if (!result) {
        // Unprivileged user namespaces may be disabled on the host
        EXPECT_NE(result.error().message.find("isolation"), std::string::npos);
        return;
    }
    EXPECT_EQ(result->output.find("retained source"), std::string::npos);
    EXPECT_EQ(cverify::test::read_file(dir.path() / "artifact.bin"), "built\n");
}

TEST(ProcessExecutor, ConfinedRunReadsButCannotWriteReadOnlyPaths)
{
    TempDir dir("exec_readonly");
    TempDir toolchain("exec_toolchain");
    cverify::test::write_file(toolchain.path() / "lib.txt", "runtime");
    ProcessExecutor executor;
    auto request = shell(std::format("cat {0}/lib.txt; echo x > {0}/written", toolchain.path().string()),
                         dir.path());
    request.confine_filesystem = true;
    request.read_only_paths = {toolchain.path()};

    auto result = executor.run(request);
    EXPECT_FALSE(std::filesystem::exists(toolchain.path() / "written"));
    if (!result) {
        EXPECT_NE(result.error().message.find("isolation"), std::string::npos);
        return;
    }
    EXPECT_EQ(result->output.substr(0, 7), "runtime");
    EXPECT_NE(result->exit_code, 0);
}
