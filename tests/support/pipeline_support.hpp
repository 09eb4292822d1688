#pragma once

/**
 * @file pipeline_support.hpp
 * @brief In-process verification stack with a toy compiler
 */

#include "cverify/pipeline.hpp"

#include "support/test_support.hpp"
#include "support/wasm_support.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <stdexcept>
#include <string>

namespace cverify::test {

inline constexpr const char* kContractSource = "export function main(): void {}";

/// Canonical bytecode the toy compiler produces for @p source
[[nodiscard]] inline std::string expected_cid(const std::string& source)
{
    return cid::compute_cid(make_wasm_module({"main", "alloc"}, source));
}

/**
 * Wires the real workspace builder, compiler driver and in-memory
 * repository around a scripted executor. The toy compiler copies
 * src/assembly/main.ts into a data segment and leaves the workspace path
 * behind in a custom section.
 */
class PipelineHarness
{
public:
    enum class Mode : std::uint8_t {
        kCompile,
        kTimeout,
        kCompileError,
        kThrow
    };

    explicit PipelineHarness(const std::string& name)
        : m_dir(name)
        , m_registry(std::make_shared<const registry::RegistrySnapshot>(make_snapshot()))
        , m_repository(std::make_shared<store::InMemoryContractRepository>())
        , m_onchain(std::make_shared<onchain::StaticOnChainCidSource>())
        , m_sink(std::make_shared<publish::CollectingSink>())
        , m_executor(std::make_shared<ScriptedExecutor>(
              [this](const sandbox::ExecRequest& request) { return toy_compile(request); }))
    {
        write_file(store_root() / "@massalabs" / "massa-as-sdk" / "2.5.0" / "index.ts", "export {};");
    }

    [[nodiscard]] std::filesystem::path store_root() const { return m_dir.path() / "store"; }
    [[nodiscard]] std::filesystem::path work_root() const { return m_dir.path() / "work"; }

    [[nodiscard]] pipeline::Collaborators collaborators(bool with_publisher = true) const
    {
        return pipeline::Collaborators{
            .registry = m_registry,
            .repository = m_repository,
            .workspaces = std::make_shared<const workspace::WorkspaceBuilder>(
                work_root(), std::make_shared<const workspace::LocalDependencyStore>(store_root())),
            .compiler = std::make_shared<const compiler::CompilerDriver>(m_executor, true),
            .onchain = m_onchain,
            .publisher = with_publisher ? std::make_shared<publish::ResultPublisher>(m_sink, std::nullopt, schema_dir())
                                        : nullptr,
        };
    }

    [[nodiscard]] pipeline::PipelineOptions options(const std::string& owner = "testhost:1:aaaaaaaa")
    {
        return pipeline::PipelineOptions{
            .quotas = {},
            .retry = {.max_attempts = 3, .initial_backoff = std::chrono::milliseconds(1),
                      .max_backoff = std::chrono::milliseconds(4)},
            .replace_policy = store::ReplacePolicy::kNever,
            .owner = owner,
            .clock = [] { return std::string("2026-01-01T00:00:00Z"); },
            .job_ids = [this] { return std::format("job-{}", ++m_next_job); },
            .sleeper = [](std::chrono::milliseconds) {},
        };
    }

    [[nodiscard]] static pipeline::SubmitRequest request(const std::string& address,
                                                         const std::string& source = kContractSource)
    {
        pipeline::SubmitRequest request{
            .address = address,
            .license = "MIT",
            .language = "assemblyscript",
            .dependencies = {},
            .sources = {},
            .submitter = "AU1submitter",
        };
        request.dependencies.add("@massalabs/massa-as-sdk", "2.5.0");
        request.sources.add("assembly/main.ts", source);
        request.sources.add("asconfig.json", "{}");
        return request;
    }

    TempDir m_dir;
    std::shared_ptr<const registry::RegistrySnapshot> m_registry;
    std::shared_ptr<store::InMemoryContractRepository> m_repository;
    std::shared_ptr<onchain::StaticOnChainCidSource> m_onchain;
    std::shared_ptr<publish::CollectingSink> m_sink;
    std::shared_ptr<ScriptedExecutor> m_executor;
    std::atomic<Mode> m_mode{Mode::kCompile};

private:
    std::atomic<int> m_next_job{0};

    [[nodiscard]] Result<sandbox::ExecResult> toy_compile(const sandbox::ExecRequest& request) const
    {
        switch (m_mode.load()) {
            case Mode::kTimeout: {
                sandbox::ExecResult result = exited(-1, "still linking");
                result.term_signal = 9;
                result.timed_out = true;
                return result;
            }
            case Mode::kCompileError:
                return exited(1, "ERROR TS2304: Cannot find name 'foo'.");
            case Mode::kThrow:
                throw std::runtime_error("executor crashed");
            case Mode::kCompile:
                break;
        }
        const std::string source = read_file(request.working_dir / "src" / "assembly" / "main.ts");
        write_file(request.working_dir / "out" / "contract.wasm",
                   [&] {
                       const Bytes module = make_wasm_module({"main", "alloc"}, source, request.working_dir.string());
                       return std::string(module.begin(), module.end());
                   }());
        return exited(0, "compiled");
    }
};

}  // namespace cverify::test
