#pragma once

/**
 * @file source_bundle.hpp
 * @brief Submitted source files: relative path -> content
 */

#include "cverify/common.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace cverify {

struct BundleLimits
{
    std::size_t max_files = 256;
    std::size_t max_file_bytes = 1024 * 1024;
};

class SourceBundle
{
public:
    void add(std::string path, std::string content);

    [[nodiscard]] const std::map<std::string, std::string>& files() const noexcept { return m_files; }
    [[nodiscard]] bool empty() const noexcept { return m_files.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return m_files.size(); }

    /// "sha256:..." over the canonical {path: content} document
    [[nodiscard]] std::string digest() const;

    friend bool operator==(const SourceBundle&, const SourceBundle&) = default;

private:
    std::map<std::string, std::string> m_files;
};

/**
 * Check paths and sizes before anything touches the filesystem.
 * Each path component must match [A-Za-z0-9._-]+ (at most 50 characters),
 * the path must stay inside the workspace, and reserved names (lock files
 * the toolchain writes itself) are refused.
 * @return "InvalidSourceBundle" on the first violation
 */
[[nodiscard]] cverify::VoidResult validate_bundle(const SourceBundle& bundle,
                                                  const BundleLimits& limits,
                                                  const std::vector<std::string>& reserved_files);

/**
 * Read every regular file below a directory (symlinks are not followed).
 */
[[nodiscard]] cverify::Result<SourceBundle> load_bundle_from_directory(const std::filesystem::path& root,
                                                                       const BundleLimits& limits);

}  // namespace cverify
