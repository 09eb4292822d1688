/**
 * @file manifest.cpp
 * @brief Dependency manifest parsing and validation
 */

#include "cverify/manifest.hpp"

#include <algorithm>
#include <format>
#include <map>
#include <optional>
#include <regex>

namespace cverify::manifest {

namespace {

const std::regex& exact_version_pattern()
{
    static const std::regex kPattern(
        R"(^v?(0|[1-9][0-9]*)\.(0|[1-9][0-9]*)\.(0|[1-9][0-9]*))"
        R"((-[0-9A-Za-z-]+(\.[0-9A-Za-z-]+)*)?(\+[0-9A-Za-z-]+(\.[0-9A-Za-z-]+)*)?$)");
    return kPattern;
}

const std::regex& dependency_name_pattern()
{
    static const std::regex kPattern(
        R"(^(@[a-z0-9][a-z0-9._-]*/)?[A-Za-z0-9][A-Za-z0-9._-]*(/[A-Za-z0-9][A-Za-z0-9._-]*)*$)");
    return kPattern;
}

/**
 * @brief SAX handler that records top-level key/value pairs in order
 *
 * Only an object whose values are all strings is accepted; anything else
 * is reported as a shape error after parsing.
 */
class ManifestSaxHandler : public nlohmann::json_sax<nlohmann::json>
{
public:
    bool null() override { return scalar(); }
    bool boolean(bool /*val*/) override { return scalar(); }
    bool number_integer(number_integer_t /*val*/) override { return scalar(); }
    bool number_unsigned(number_unsigned_t /*val*/) override { return scalar(); }
    bool number_float(number_float_t /*val*/, const string_t& /*s*/) override { return scalar(); }
    bool binary(binary_t& /*val*/) override { return scalar(); }

    bool string(string_t& val) override
    {
        if (m_depth == 1 && m_pending_key) {
            m_entries.push_back(DependencyPin{.name = std::move(*m_pending_key), .version = val});
            m_pending_key.reset();
            return true;
        }
        return scalar();
    }

    bool start_object(std::size_t /*elements*/) override
    {
        if (m_depth >= 1) {
            m_shape_error = "dependency versions must be strings";
        }
        ++m_depth;
        return true;
    }

    bool key(string_t& val) override
    {
        if (m_depth == 1) {
            m_pending_key = val;
        }
        return true;
    }

    bool end_object() override
    {
        --m_depth;
        return true;
    }

    bool start_array(std::size_t /*elements*/) override
    {
        if (m_depth >= 1) {
            m_shape_error = "dependency versions must be strings";
        }
        m_is_array = m_is_array || m_depth == 0;
        ++m_depth;
        return true;
    }

    bool end_array() override
    {
        --m_depth;
        return true;
    }

    bool parse_error(std::size_t position,
                     const std::string& /*last_token*/,
                     const nlohmann::detail::exception& ex) override
    {
        m_parse_error = std::format("at byte {}: {}", position, ex.what());
        return false;
    }

    [[nodiscard]] bool is_array() const noexcept { return m_is_array; }
    [[nodiscard]] const std::optional<std::string>& parse_error_message() const noexcept { return m_parse_error; }
    [[nodiscard]] const std::optional<std::string>& shape_error() const noexcept { return m_shape_error; }
    [[nodiscard]] std::vector<DependencyPin>& entries() noexcept { return m_entries; }

private:
    bool scalar()
    {
        if (m_depth <= 1) {
            m_shape_error = m_depth == 0 ? "manifest must be a JSON object or array"
                                         : "dependency versions must be strings";
        }
        m_pending_key.reset();
        return true;
    }

    int m_depth = 0;
    bool m_is_array = false;
    std::optional<std::string> m_pending_key;
    std::optional<std::string> m_parse_error;
    std::optional<std::string> m_shape_error;
    std::vector<DependencyPin> m_entries;
};

}  // namespace

DependencyManifest::DependencyManifest(std::vector<DependencyPin> entries)
    : m_entries(std::move(entries))
{}

void DependencyManifest::add(std::string name, std::string version)
{
    m_entries.push_back(DependencyPin{.name = std::move(name), .version = std::move(version)});
}

bool is_exact_version(std::string_view version)
{
    return std::regex_match(version.begin(), version.end(), exact_version_pattern());
}

bool is_valid_dependency_name(std::string_view name)
{
    if (name.empty() || name.size() > 214) {
        return false;
    }
    return std::regex_match(name.begin(), name.end(), dependency_name_pattern());
}

cverify::Result<DependencyManifest> manifest_from_json(const nlohmann::json& j)
{
    DependencyManifest manifest;
    if (j.is_object()) {
        for (const auto& [name, version] : j.items()) {
            if (!version.is_string()) {
                return std::unexpected(Error::make(
                    "InvalidDependency",
                    std::format("version of dependency {} must be a string", name)));
            }
            manifest.add(name, version.get<std::string>());
        }
        return manifest;
    }
    if (j.is_array()) {
        for (const auto& entry : j) {
            if (!entry.is_object() || !entry.contains("name") || !entry.contains("version")
                || !entry.at("name").is_string() || !entry.at("version").is_string()) {
                return std::unexpected(Error::make(
                    "InvalidDependency",
                    "manifest array entries must be {\"name\": string, \"version\": string}"));
            }
            manifest.add(entry.at("name").get<std::string>(), entry.at("version").get<std::string>());
        }
        return manifest;
    }
    return std::unexpected(
        Error::make("InvalidDependency", "manifest must be a JSON object or array"));
}

cverify::Result<DependencyManifest> parse_manifest_text(std::string_view text)
{
    ManifestSaxHandler handler;
    const bool parsed = nlohmann::json::sax_parse(text, &handler);
    if (!parsed || handler.parse_error_message()) {
        return std::unexpected(Error::make(
            "ParseError",
            "Failed to parse dependency manifest " + handler.parse_error_message().value_or("")));
    }
    if (handler.is_array()) {
        // Arrays cannot hide duplicates; the DOM path is enough.
        try {
            return manifest_from_json(nlohmann::json::parse(text));
        } catch (const std::exception& ex) {
            return std::unexpected(
                Error::make("ParseError", std::string("Failed to parse dependency manifest: ") + ex.what()));
        }
    }
    if (handler.shape_error()) {
        return std::unexpected(Error::make("InvalidDependency", *handler.shape_error()));
    }
    return DependencyManifest(std::move(handler.entries()));
}

nlohmann::json to_json(const DependencyManifest& manifest)
{
    nlohmann::json out = nlohmann::json::array();
    for (const auto& pin : manifest.entries()) {
        out.push_back({
            {   "name",    pin.name},
            {"version", pin.version}
        });
    }
    return out;
}

cverify::VoidResult validate_manifest(const DependencyManifest& manifest,
                                      const std::vector<std::string>& required)
{
    std::map<std::string, std::string> seen;
    for (const auto& pin : manifest.entries()) {
        if (!is_valid_dependency_name(pin.name)) {
            return std::unexpected(
                Error::make("InvalidDependency", std::format("invalid dependency name '{}'", pin.name)));
        }
        if (!is_exact_version(pin.version)) {
            return std::unexpected(Error::make(
                "InvalidDependency",
                std::format("dependency {} must be pinned to an exact version, got '{}'",
                            pin.name,
                            pin.version)));
        }
        auto [it, inserted] = seen.emplace(pin.name, pin.version);
        if (!inserted) {
            return std::unexpected(Error::make(
                "DependencyConflictError",
                it->second == pin.version
                    ? std::format("dependency {} is listed twice", pin.name)
                    : std::format("dependency {} pinned to both {} and {}", pin.name, it->second, pin.version)));
        }
    }

    std::vector<std::string> missing;
    for (const auto& name : required) {
        if (!seen.contains(name)) {
            missing.push_back(name);
        }
    }
    if (!missing.empty()) {
        std::string list;
        for (const auto& name : missing) {
            list += list.empty() ? name : ", " + name;
        }
        return std::unexpected(Error::make(
            "MissingRequiredDependency",
            std::format("The following dependencies are required: {}", list)));
    }
    return {};
}

}  // namespace cverify::manifest
