/**
 * @file workspace.cpp
 * @brief Job workspace layout and dependency resolution
 */

#include "cverify/workspace.hpp"

#include "cverify/canonical_json.hpp"
#include "cverify/log.hpp"
#include "cverify/version.hpp"

#include <format>
#include <fstream>
#include <utility>

#include <nlohmann/json.hpp>

namespace cverify::workspace {

namespace {

namespace fs = std::filesystem;

[[nodiscard]] Error resolution_error(const manifest::DependencyPin& pin, std::string_view detail)
{
    return Error::make("DependencyResolutionError",
                       std::format("{}@{} could not be resolved: {}", pin.name, pin.version, detail));
}

[[nodiscard]] VoidResult write_file(const fs::path& path, std::string_view content)
{
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return std::unexpected(Error::make(
            "InfrastructureError",
            std::format("Failed to create directory {}: {}", path.parent_path().string(), ec.message())));
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
    out.flush();
    if (!out) {
        return std::unexpected(Error::make("InfrastructureError", "Failed to write file: " + path.string()));
    }
    return {};
}

[[nodiscard]] nlohmann::json lock_document(const registry::SupportedLanguage& language,
                                           const manifest::DependencyManifest& manifest)
{
    return {
        {"schema_version", kLockfileSchemaVersion},
        {      "language", {{"name", language.name}, {"revision", language.revision}}},
        {     "toolchain", {{"id", language.toolchain.id}, {"version", language.toolchain.version}}},
        {  "dependencies", manifest::to_json(manifest)}
    };
}

}  // namespace

// ============================================================================
// LocalDependencyStore
// ============================================================================

LocalDependencyStore::LocalDependencyStore(std::filesystem::path root)
    : m_root(std::move(root))
{}

cverify::Result<std::filesystem::path> LocalDependencyStore::resolve(const manifest::DependencyPin& pin) const
{
    if (!manifest::is_valid_dependency_name(pin.name) || !manifest::is_exact_version(pin.version)) {
        return std::unexpected(resolution_error(pin, "not a valid pin"));
    }
    fs::path dir = m_root / pin.name / pin.version;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return std::unexpected(resolution_error(pin, "not present in " + m_root.string()));
    }
    return dir;
}

// ============================================================================
// Workspace
// ============================================================================

Workspace::Workspace(std::filesystem::path root)
    : m_root(std::move(root))
{}

Workspace::~Workspace()
{
    if (auto result = destroy(); !result) {
        log::warn("workspace", "{}", result.error().message);
    }
}

Workspace::Workspace(Workspace&& other) noexcept
    : m_root(std::exchange(other.m_root, {}))
{}

Workspace& Workspace::operator=(Workspace&& other) noexcept
{
    if (this != &other) {
        if (auto result = destroy(); !result) {
            log::warn("workspace", "{}", result.error().message);
        }
        m_root = std::exchange(other.m_root, {});
    }
    return *this;
}

cverify::VoidResult Workspace::destroy()
{
    if (m_root.empty()) {
        return {};
    }
    std::error_code ec;
    fs::remove_all(m_root, ec);
    if (ec) {
        return std::unexpected(Error::make(
            "InfrastructureError",
            std::format("Failed to remove workspace {}: {}", m_root.string(), ec.message())));
    }
    m_root.clear();
    return {};
}

// ============================================================================
// WorkspaceBuilder
// ============================================================================

WorkspaceBuilder::WorkspaceBuilder(std::filesystem::path work_root,
                                   std::shared_ptr<const DependencyStore> store,
                                   BundleLimits limits)
    : m_work_root(std::move(work_root))
    , m_store(std::move(store))
    , m_limits(limits)
{}

cverify::Result<std::unique_ptr<Workspace>> WorkspaceBuilder::build(const std::string& job_id,
                                                                    const registry::SupportedLanguage& language,
                                                                    const manifest::DependencyManifest& manifest,
                                                                    const SourceBundle& bundle) const
{
    if (auto valid = manifest::validate_manifest(manifest, language.required_dependencies); !valid) {
        return std::unexpected(valid.error());
    }
    if (auto valid = validate_bundle(bundle, m_limits, language.reserved_files); !valid) {
        return std::unexpected(valid.error());
    }

    std::vector<std::pair<const manifest::DependencyPin*, fs::path>> resolved;
    resolved.reserve(manifest.size());
    for (const auto& pin : manifest.entries()) {
        auto dir = m_store->resolve(pin);
        if (!dir) {
            return std::unexpected(dir.error());
        }
        resolved.emplace_back(&pin, std::move(*dir));
    }

    if (job_id.empty() || job_id.contains('/') || !common::is_contained_path(job_id)) {
        return std::unexpected(Error::make("InfrastructureError", "invalid job id: " + job_id));
    }

    std::error_code ec;
    fs::create_directories(m_work_root, ec);
    const fs::path root = m_work_root / ("job-" + job_id);
    if (ec || !fs::create_directory(root, ec)) {
        return std::unexpected(Error::make(
            "InfrastructureError",
            std::format("Failed to create workspace {}: {}",
                        root.string(),
                        ec ? ec.message() : std::string("already exists"))));
    }
    // Owned from here on; every early return below removes the directory.
    auto workspace = std::make_unique<Workspace>(root);
    fs::permissions(root, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        return std::unexpected(Error::make(
            "InfrastructureError", std::format("Failed to restrict {}: {}", root.string(), ec.message())));
    }

    for (const auto& [relative, content] : bundle.files()) {
        if (auto written = write_file(workspace->src_dir() / relative, content); !written) {
            return std::unexpected(written.error());
        }
    }

    for (const auto& [pin, source] : resolved) {
        const fs::path target = workspace->deps_dir() / pin->name;
        fs::create_directories(target, ec);
        if (!ec) {
            fs::copy(source,
                     target,
                     fs::copy_options::recursive | fs::copy_options::skip_symlinks,
                     ec);
        }
        if (ec) {
            return std::unexpected(resolution_error(*pin, ec.message()));
        }
    }

    fs::create_directories(workspace->out_dir(), ec);
    if (ec) {
        return std::unexpected(Error::make(
            "InfrastructureError",
            std::format("Failed to create {}: {}", workspace->out_dir().string(), ec.message())));
    }

    auto lock = canonical::canonicalize(lock_document(language, manifest));
    if (!lock) {
        return std::unexpected(lock.error());
    }
    if (auto written = write_file(workspace->lockfile(), *lock); !written) {
        return std::unexpected(written.error());
    }

    log::debug("workspace",
               "job {} laid out {} sources and {} dependencies under {}",
               job_id,
               bundle.size(),
               resolved.size(),
               root.string());
    return workspace;
}

}  // namespace cverify::workspace
