#pragma once

/**
 * @file compiler_driver.hpp
 * @brief Compile a workspace with its pinned toolchain and canonicalize the artifact
 */

#include "cverify/common.hpp"
#include "cverify/executor.hpp"
#include "cverify/registry.hpp"
#include "cverify/workspace.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace cverify::compiler {

struct CompileOutput
{
    Bytes bytecode;  ///< canonical form, ready for content addressing
    std::vector<std::string> exports;  ///< exported functions (wasm only)
    std::string diagnostics;  ///< captured compiler output
};

/**
 * Substitute {workspace}, {src}, {deps} and {out} in one argv item.
 */
[[nodiscard]] std::string expand_placeholders(std::string_view arg, const workspace::Workspace& workspace);

/**
 * Canonical bytes of an artifact in the given format.
 * @return "BuildFailure" when a wasm artifact is malformed
 */
[[nodiscard]] cverify::Result<Bytes> canonicalize_artifact(std::span<const std::uint8_t> artifact,
                                                           registry::ArtifactFormat format);

class CompilerDriver
{
public:
    CompilerDriver(std::shared_ptr<sandbox::IsolatedExecutor> executor, bool isolate_network);

    /**
     * Run the toolchain inside the workspace.
     * Errors:
     *   BuildTimeout         wall clock or CPU/file quota exceeded
     *   BuildFailure         nonzero exit, signal, missing or malformed artifact;
     *                        the message carries the compiler output
     *   InfrastructureError  the sandbox could not be set up
     */
    [[nodiscard]] cverify::Result<CompileOutput> compile(const workspace::Workspace& workspace,
                                                         const registry::ToolchainDescriptor& toolchain,
                                                         const sandbox::Quotas& quotas) const;

private:
    std::shared_ptr<sandbox::IsolatedExecutor> m_executor;
    bool m_isolate_network;
};

}  // namespace cverify::compiler
