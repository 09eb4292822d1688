/**
 * @file path.cpp
 * @brief Path normalization for workspace containment and config resolution
 */

#include "cverify/common.hpp"

#include <ranges>
#include <string>
#include <vector>

namespace cverify::common {

namespace {

[[nodiscard]] std::string join_path(const std::vector<std::string>& parts)
{
    std::string joined;
    for (const auto& part : parts) {
        if (!joined.empty()) {
            joined += '/';
        }
        joined += part;
    }
    return joined;
}

[[nodiscard]] std::vector<std::string> resolve_parts(const std::vector<std::string>& parts,
                                                     bool absolute_input)
{
    std::vector<std::string> resolved;
    for (const auto& part : parts) {
        if (part == ".") {
            continue;
        }
        if (part == "..") {
            if (!resolved.empty() && resolved.back() != "..") {
                resolved.pop_back();
                continue;
            }
            if (!absolute_input) {
                resolved.emplace_back("..");
            }
            continue;
        }
        resolved.push_back(part);
    }
    return resolved;
}

}  // namespace

std::vector<std::string> path_components(std::string_view path)
{
    std::vector<std::string> parts;
    for (auto part : path | std::views::split('/')) {
        std::string_view sv(part.begin(), part.end());
        for (auto sub : sv | std::views::split('\\')) {
            std::string_view sub_sv(sub.begin(), sub.end());
            if (!sub_sv.empty()) {
                parts.emplace_back(sub_sv);
            }
        }
    }
    return parts;
}

bool is_absolute_path(std::string_view path)
{
    if (path.empty()) {
        return false;
    }
    if (path[0] == '/' || path[0] == '\\') {
        return true;
    }
    // Drive-letter paths are never valid inside a workspace either
    return path.size() >= 2 && path[1] == ':';
}

std::string normalize_path(std::string_view input)
{
    if (input.empty()) {
        return ".";
    }
    const bool absolute_input = is_absolute_path(input);
    const bool drive_letter = input.size() >= 2 && input[1] == ':';
    std::string normalized = join_path(resolve_parts(path_components(input), absolute_input));
    if (absolute_input && !drive_letter) {
        return "/" + normalized;
    }
    return normalized.empty() ? "." : normalized;
}

bool is_contained_path(std::string_view path)
{
    if (path.empty() || is_absolute_path(path)) {
        return false;
    }
    std::string normalized = normalize_path(path);
    if (normalized == "." || normalized == "..") {
        return false;
    }
    return !normalized.starts_with("../");
}

}  // namespace cverify::common
