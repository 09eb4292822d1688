/**
 * @file canonical_json.cpp
 * @brief Canonical JSON serialization
 */

#include "cverify/canonical_json.hpp"

#include <algorithm>
#include <format>
#include <ranges>

namespace cverify::canonical {

namespace {

cverify::VoidResult validate_no_float(const nlohmann::json& j, std::string_view path)
{
    if (j.is_number_float()) {
        return std::unexpected(Error::make(
            "FloatingPointNotAllowed",
            std::format("Floating point numbers not allowed in canonical JSON at: {}", path)));
    }
    if (j.is_object()) {
        for (const auto& [key, val] : j.items()) {
            if (auto result = validate_no_float(val, std::format("{}.{}", path, key)); !result) {
                return result;
            }
        }
    } else if (j.is_array()) {
        for (auto [i, elem] : std::views::enumerate(j)) {
            if (auto result = validate_no_float(elem, std::format("{}[{}]", path, i)); !result) {
                return result;
            }
        }
    }
    return {};
}

}  // namespace

cverify::Result<std::string> canonicalize(const nlohmann::json& j)
{
    if (auto result = validate_no_float(j, "$"); !result) {
        return std::unexpected(result.error());
    }

    // nlohmann::json keeps object keys in a std::map, so dump() already
    // emits them in lexicographic order.
    try {
        return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
    } catch (const nlohmann::json::type_error& ex) {
        return std::unexpected(Error::make("InvalidUtf8", ex.what()));
    }
}

cverify::Result<std::string> hash_canonical(const nlohmann::json& j)
{
    auto canonical = canonicalize(j);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    return common::sha256_prefixed(*canonical);
}

}  // namespace cverify::canonical
