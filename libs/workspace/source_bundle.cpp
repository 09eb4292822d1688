/**
 * @file source_bundle.cpp
 * @brief Source bundle validation and loading
 */

#include "cverify/source_bundle.hpp"

#include "cverify/canonical_json.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <iterator>

#include <nlohmann/json.hpp>

namespace cverify {

namespace {

constexpr std::size_t kMaxComponentLength = 50;

[[nodiscard]] bool is_valid_component(std::string_view component)
{
    if (component.empty() || component.size() > kMaxComponentLength || component == "."
        || component == "..") {
        return false;
    }
    return std::ranges::all_of(component, [](char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '.'
               || c == '_' || c == '-';
    });
}

[[nodiscard]] VoidResult invalid(std::string message)
{
    return std::unexpected(Error::make("InvalidSourceBundle", std::move(message)));
}

}  // namespace

void SourceBundle::add(std::string path, std::string content)
{
    m_files.insert_or_assign(std::move(path), std::move(content));
}

std::string SourceBundle::digest() const
{
    nlohmann::json doc = nlohmann::json::object();
    for (const auto& [path, content] : m_files) {
        doc[path] = content;
    }
    auto hash = canonical::hash_canonical(doc);
    // Bundles hold validated UTF-8 text; binary content falls back to a raw digest.
    if (!hash) {
        common::Sha256 hasher;
        for (const auto& [path, content] : m_files) {
            hasher.update(std::format("{}:{}:{}\n", path.size(), path, content.size()));
            hasher.update(content);
        }
        return "sha256:" + common::to_hex(hasher.finish());
    }
    return *hash;
}

cverify::VoidResult validate_bundle(const SourceBundle& bundle,
                                    const BundleLimits& limits,
                                    const std::vector<std::string>& reserved_files)
{
    if (bundle.empty()) {
        return invalid("No source files were uploaded for this contract");
    }
    if (bundle.size() > limits.max_files) {
        return invalid(std::format("{} files exceed the limit of {}", bundle.size(), limits.max_files));
    }
    for (const auto& [path, content] : bundle.files()) {
        if (!common::is_contained_path(path) || path.contains('\\')) {
            return invalid(std::format("path '{}' escapes the workspace", path));
        }
        const auto components = common::path_components(path);
        if (!std::ranges::all_of(components, is_valid_component)
            || common::normalize_path(path) != path) {
            return invalid(std::format("invalid file name '{}'", path));
        }
        if (std::ranges::contains(reserved_files, components.back())) {
            return invalid(std::format("{} is a reserved file name", components.back()));
        }
        if (content.size() > limits.max_file_bytes) {
            return invalid(std::format("file {} is {} bytes, limit is {}",
                                       path,
                                       content.size(),
                                       limits.max_file_bytes));
        }
    }
    return {};
}

cverify::Result<SourceBundle> load_bundle_from_directory(const std::filesystem::path& root,
                                                         const BundleLimits& limits)
{
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        return std::unexpected(
            Error::make("IOError", "Source directory does not exist: " + root.string()));
    }

    SourceBundle bundle;
    std::filesystem::recursive_directory_iterator it(root, ec);
    if (ec) {
        return std::unexpected(
            Error::make("IOError", std::format("Failed to list {}: {}", root.string(), ec.message())));
    }
    for (const auto& entry : it) {
        if (!entry.is_regular_file() || entry.is_symlink()) {
            continue;
        }
        if (entry.file_size() > limits.max_file_bytes) {
            return std::unexpected(Error::make(
                "InvalidSourceBundle",
                std::format("file {} exceeds {} bytes", entry.path().string(), limits.max_file_bytes)));
        }
        std::ifstream in(entry.path(), std::ios::binary);
        if (!in) {
            return std::unexpected(
                Error::make("IOError", "Failed to open source file: " + entry.path().string()));
        }
        std::string content{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
        bundle.add(entry.path().lexically_relative(root).generic_string(), std::move(content));
    }
    return bundle;
}

}  // namespace cverify
