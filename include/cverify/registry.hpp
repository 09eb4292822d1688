#pragma once

/**
 * @file registry.hpp
 * @brief Supported licenses, languages and their pinned toolchains
 *
 * The registry is immutable reference data. Upgrading a toolchain means
 * registering a new revision of the language; jobs already accepted keep
 * the revision recorded at intake.
 */

#include "cverify/common.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace cverify::registry {

enum class ArtifactFormat : std::uint8_t {
    kWasm,  ///< Canonicalized with wasm::canonicalize
    kRaw    ///< Hashed as produced
};

/**
 * @brief How to invoke one pinned compiler
 *
 * argv items may reference {workspace}, {src}, {deps} and {out}; they are
 * expanded against the job workspace before execution.
 */
struct ToolchainDescriptor
{
    std::string id;       ///< e.g. "tinygo"
    std::string version;  ///< exact toolchain version, never a range
    std::string program;  ///< absolute path of the executable
    std::vector<std::string> argv;
    std::map<std::string, std::string> env;
    std::string artifact;  ///< artifact path relative to the workspace
    ArtifactFormat format = ArtifactFormat::kWasm;
    std::vector<std::string> read_only_paths;  ///< host paths the toolchain reads besides the system directories
};

struct SupportedLicense
{
    std::string name;
    std::vector<std::string> permitted_languages;  ///< empty: every language

    [[nodiscard]] bool permits(const std::string& language) const;
};

struct SupportedLanguage
{
    std::string name;
    int revision = 1;
    bool retired = false;
    ToolchainDescriptor toolchain;
    std::vector<std::string> required_dependencies;
    std::vector<std::string> reserved_files;
};

/// A language pinned to one registry revision
struct LanguageRef
{
    std::string name;
    int revision = 0;

    friend bool operator==(const LanguageRef&, const LanguageRef&) = default;
};

class RegistrySnapshot
{
public:
    RegistrySnapshot() = default;
    RegistrySnapshot(std::vector<SupportedLicense> licenses, std::vector<SupportedLanguage> languages);

    [[nodiscard]] const SupportedLicense* find_license(const std::string& name) const;

    /// Highest non-retired revision of a language
    [[nodiscard]] const SupportedLanguage* find_active_language(const std::string& name) const;

    /// Exact revision lookup (retired revisions included)
    [[nodiscard]] const SupportedLanguage* find_language(const LanguageRef& ref) const;

    [[nodiscard]] const std::vector<SupportedLicense>& licenses() const noexcept { return m_licenses; }
    [[nodiscard]] const std::vector<SupportedLanguage>& languages() const noexcept { return m_languages; }

private:
    std::vector<SupportedLicense> m_licenses;
    std::vector<SupportedLanguage> m_languages;
};

[[nodiscard]] std::string_view format_name(ArtifactFormat format) noexcept;
[[nodiscard]] std::optional<ArtifactFormat> parse_format(std::string_view name);

/**
 * Build a snapshot from a registry.v1 document.
 * Rejects duplicate licenses, duplicate (language, revision) pairs and
 * licenses that permit unknown languages.
 */
[[nodiscard]] cverify::Result<RegistrySnapshot> from_json(const nlohmann::json& doc,
                                                          const std::filesystem::path& schema_dir);

/**
 * Read, schema-validate and convert a registry file.
 */
[[nodiscard]] cverify::Result<RegistrySnapshot> load_registry(const std::filesystem::path& path,
                                                              const std::filesystem::path& schema_dir);

[[nodiscard]] nlohmann::json to_json(const RegistrySnapshot& snapshot);

}  // namespace cverify::registry
