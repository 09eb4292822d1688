/**
 * @file compiler_driver.cpp
 * @brief Toolchain invocation and artifact canonicalization
 */

#include "cverify/compiler_driver.hpp"

#include "cverify/log.hpp"
#include "cverify/wasm.hpp"

#include <array>
#include <format>
#include <fstream>
#include <iterator>
#include <utility>

namespace cverify::compiler {

namespace {

namespace fs = std::filesystem;

constexpr std::uintmax_t kMaxArtifactBytes = 64ULL * 1024ULL * 1024ULL;

[[nodiscard]] Error build_failure(std::string_view reason, const std::string& output)
{
    if (output.empty()) {
        return Error::make("BuildFailure", std::string(reason));
    }
    return Error::make("BuildFailure", std::format("{}\n{}", reason, output));
}

[[nodiscard]] std::string describe_exit(const sandbox::ExecResult& result)
{
    if (result.term_signal != 0) {
        return std::format("compiler terminated by signal {}", result.term_signal);
    }
    return std::format("compiler exited with status {}", result.exit_code);
}

[[nodiscard]] Result<Bytes> read_artifact(const fs::path& path, const std::string& output)
{
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::unexpected(build_failure("artifact was not produced: " + path.filename().string(), output));
    }
    const auto size = fs::file_size(path, ec);
    if (ec || size > kMaxArtifactBytes) {
        return std::unexpected(
            build_failure(std::format("artifact {} is unreadable or too large", path.filename().string()), output));
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(build_failure("failed to open artifact " + path.filename().string(), output));
    }
    return Bytes{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
}

}  // namespace

std::string expand_placeholders(std::string_view arg, const workspace::Workspace& workspace)
{
    const std::array<std::pair<std::string_view, std::string>, 4> replacements = {
        {
         {"{workspace}", workspace.root().string()},
         {"{src}", workspace.src_dir().string()},
         {"{deps}", workspace.deps_dir().string()},
         {"{out}", workspace.out_dir().string()},
         }
    };

    std::string expanded;
    std::size_t pos = 0;
    while (pos < arg.size()) {
        bool replaced = false;
        if (arg[pos] == '{') {
            for (const auto& [token, value] : replacements) {
                if (arg.substr(pos).starts_with(token)) {
                    expanded += value;
                    pos += token.size();
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced) {
            expanded += arg[pos];
            ++pos;
        }
    }
    return expanded;
}

cverify::Result<Bytes> canonicalize_artifact(std::span<const std::uint8_t> artifact,
                                             registry::ArtifactFormat format)
{
    if (format == registry::ArtifactFormat::kRaw) {
        return Bytes(artifact.begin(), artifact.end());
    }
    auto canonical = wasm::canonicalize(artifact);
    if (!canonical) {
        return std::unexpected(Error::make("BuildFailure", "malformed wasm artifact: " + canonical.error().message));
    }
    return canonical;
}

CompilerDriver::CompilerDriver(std::shared_ptr<sandbox::IsolatedExecutor> executor, bool isolate_network)
    : m_executor(std::move(executor))
    , m_isolate_network(isolate_network)
{}

cverify::Result<CompileOutput> CompilerDriver::compile(const workspace::Workspace& workspace,
                                                       const registry::ToolchainDescriptor& toolchain,
                                                       const sandbox::Quotas& quotas) const
{
    sandbox::ExecRequest request{
        .program = toolchain.program,
        .args = {},
        .env = {},
        .working_dir = workspace.root(),
        .quotas = quotas,
        .isolate_network = m_isolate_network,
        .confine_filesystem = true,
        .read_only_paths = {},
    };
    request.read_only_paths.assign(toolchain.read_only_paths.begin(), toolchain.read_only_paths.end());
    for (const auto& arg : toolchain.argv) {
        request.args.push_back(expand_placeholders(arg, workspace));
    }
    for (const auto& [key, value] : toolchain.env) {
        request.env.emplace(key, expand_placeholders(value, workspace));
    }

    log::info("compiler", "running {} {} in {}", toolchain.id, toolchain.version, workspace.root().string());
    auto executed = m_executor->run(request);
    if (!executed) {
        return std::unexpected(executed.error());
    }
    const sandbox::ExecResult& result = *executed;

    std::string output = result.output;
    if (result.output_truncated) {
        output += "\n[output truncated]";
    }

    if (result.timed_out) {
        return std::unexpected(Error::make(
            "BuildTimeout", std::format("compiler exceeded the {}s wall clock quota\n{}", quotas.wall_seconds, output)));
    }
    if (result.quota_exceeded) {
        return std::unexpected(Error::make(
            "BuildTimeout", std::format("compiler exceeded its resource quota (signal {})\n{}", result.term_signal, output)));
    }
    if (!result.succeeded()) {
        return std::unexpected(build_failure(describe_exit(result), output));
    }

    const std::string artifact_arg = expand_placeholders(toolchain.artifact, workspace);
    fs::path artifact_path = fs::path(artifact_arg);
    if (artifact_path.is_relative()) {
        if (!common::is_contained_path(artifact_arg)) {
            return std::unexpected(build_failure("artifact path escapes the workspace: " + artifact_arg, output));
        }
        artifact_path = workspace.root() / artifact_path;
    }

    auto raw = read_artifact(artifact_path, output);
    if (!raw) {
        return std::unexpected(raw.error());
    }
    auto canonical = canonicalize_artifact(*raw, toolchain.format);
    if (!canonical) {
        return std::unexpected(build_failure(canonical.error().message, output));
    }

    CompileOutput compiled{.bytecode = std::move(*canonical), .exports = {}, .diagnostics = std::move(output)};
    if (toolchain.format == registry::ArtifactFormat::kWasm) {
        auto exports = wasm::list_exports(compiled.bytecode);
        if (!exports) {
            return std::unexpected(build_failure(exports.error().message, compiled.diagnostics));
        }
        compiled.exports = std::move(*exports);
    }
    log::info("compiler", "{} produced {} canonical bytes", toolchain.id, compiled.bytecode.size());
    return compiled;
}

}  // namespace cverify::compiler
