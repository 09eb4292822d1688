#pragma once

/**
 * @file manifest.hpp
 * @brief Dependency manifest: ordered, exactly pinned name -> version entries
 *
 * A manifest is kept exactly as submitted (duplicates included) so the
 * record shows what was asked for; validate_manifest is the gate the
 * workspace builder applies before resolving anything.
 */

#include "cverify/common.hpp"

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace cverify::manifest {

struct DependencyPin
{
    std::string name;
    std::string version;

    friend bool operator==(const DependencyPin&, const DependencyPin&) = default;
};

class DependencyManifest
{
public:
    DependencyManifest() = default;
    explicit DependencyManifest(std::vector<DependencyPin> entries);

    void add(std::string name, std::string version);

    [[nodiscard]] const std::vector<DependencyPin>& entries() const noexcept { return m_entries; }
    [[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }

    friend bool operator==(const DependencyManifest&, const DependencyManifest&) = default;

private:
    std::vector<DependencyPin> m_entries;
};

/// "1.2.3", "v1.2.3", "1.2.3-beta.1+build.5"; ranges and wildcards are rejected
[[nodiscard]] bool is_exact_version(std::string_view version);

/// npm style ("@scope/pkg"), plain ("assemblyscript") or module paths ("github.com/a/b")
[[nodiscard]] bool is_valid_dependency_name(std::string_view name);

/**
 * Convert a parsed JSON manifest: either an object of name -> version
 * strings or an array of {"name", "version"} objects.
 * @return "InvalidDependency" when the shape is wrong
 */
[[nodiscard]] cverify::Result<DependencyManifest> manifest_from_json(const nlohmann::json& j);

/**
 * Parse manifest text without losing repeated object keys, so duplicates
 * reach validate_manifest instead of being silently overwritten.
 */
[[nodiscard]] cverify::Result<DependencyManifest> parse_manifest_text(std::string_view text);

/// Array form, submission order
[[nodiscard]] nlohmann::json to_json(const DependencyManifest& manifest);

/**
 * Check every entry and the set as a whole.
 * Error codes, first failure wins in entry order:
 *   InvalidDependency          malformed name or non-exact version
 *   DependencyConflictError    a name pinned more than once
 *   MissingRequiredDependency  a required name absent
 */
[[nodiscard]] cverify::VoidResult validate_manifest(const DependencyManifest& manifest,
                                                    const std::vector<std::string>& required);

}  // namespace cverify::manifest
