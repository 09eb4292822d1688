#pragma once

/**
 * @file workspace.hpp
 * @brief Per-job build workspace and the dependency store it resolves from
 */

#include "cverify/common.hpp"
#include "cverify/manifest.hpp"
#include "cverify/registry.hpp"
#include "cverify/source_bundle.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace cverify::workspace {

/**
 * @brief Source of pinned dependency trees (external collaborator)
 */
class DependencyStore
{
public:
    virtual ~DependencyStore() = default;

    /**
     * Directory holding exactly name@version.
     * @return "DependencyResolutionError" when the pin is not available
     */
    [[nodiscard]] virtual cverify::Result<std::filesystem::path> resolve(const manifest::DependencyPin& pin) const = 0;
};

/// Resolves <root>/<name>/<version>/ on disk
class LocalDependencyStore final : public DependencyStore
{
public:
    explicit LocalDependencyStore(std::filesystem::path root);

    [[nodiscard]] cverify::Result<std::filesystem::path> resolve(const manifest::DependencyPin& pin) const override;

private:
    std::filesystem::path m_root;
};

/**
 * @brief A job directory, removed when the object is destroyed
 *
 * Layout:
 *   src/              submitted sources
 *   deps/<name>/      resolved dependency trees
 *   out/              toolchain output
 *   deps.lock.json    canonical resolved pins
 */
class Workspace
{
public:
    explicit Workspace(std::filesystem::path root);
    ~Workspace();

    Workspace(Workspace&& other) noexcept;
    Workspace& operator=(Workspace&& other) noexcept;
    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return m_root; }
    [[nodiscard]] std::filesystem::path src_dir() const { return m_root / "src"; }
    [[nodiscard]] std::filesystem::path deps_dir() const { return m_root / "deps"; }
    [[nodiscard]] std::filesystem::path out_dir() const { return m_root / "out"; }
    [[nodiscard]] std::filesystem::path lockfile() const { return m_root / "deps.lock.json"; }

    /// Remove the directory now; safe to call more than once
    [[nodiscard]] cverify::VoidResult destroy();

private:
    std::filesystem::path m_root;
};

class WorkspaceBuilder
{
public:
    WorkspaceBuilder(std::filesystem::path work_root,
                     std::shared_ptr<const DependencyStore> store,
                     BundleLimits limits = {});

    /**
     * Validate the manifest and bundle, then lay out a fresh workspace.
     * Nothing is left on disk when an error is returned.
     */
    [[nodiscard]] cverify::Result<std::unique_ptr<Workspace>> build(const std::string& job_id,
                                                                    const registry::SupportedLanguage& language,
                                                                    const manifest::DependencyManifest& manifest,
                                                                    const SourceBundle& bundle) const;

private:
    std::filesystem::path m_work_root;
    std::shared_ptr<const DependencyStore> m_store;
    BundleLimits m_limits;
};

}  // namespace cverify::workspace
