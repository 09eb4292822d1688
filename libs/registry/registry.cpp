/**
 * @file registry.cpp
 * @brief Registry snapshot loading and lookup
 */

#include "cverify/registry.hpp"

#include "cverify/schema_validate.hpp"
#include "cverify/version.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <set>
#include <utility>

namespace cverify::registry {

namespace {

[[nodiscard]] Result<ToolchainDescriptor> toolchain_from_json(const nlohmann::json& j,
                                                              std::string_view language)
{
    auto format = parse_format(j.value("format", "wasm"));
    if (!format) {
        return std::unexpected(Error::make(
            "InvalidRegistry",
            std::format("language {} declares an unknown artifact format", language)));
    }
    ToolchainDescriptor toolchain{
        .id = j.at("id").get<std::string>(),
        .version = j.at("version").get<std::string>(),
        .program = j.at("program").get<std::string>(),
        .argv = j.value("argv", std::vector<std::string>{}),
        .env = j.value("env", std::map<std::string, std::string>{}),
        .artifact = j.at("artifact").get<std::string>(),
        .format = *format,
        .read_only_paths = j.value("read_only_paths", std::vector<std::string>{}),
    };
    return toolchain;
}

[[nodiscard]] nlohmann::json toolchain_to_json(const ToolchainDescriptor& toolchain)
{
    return {
        {      "id",                toolchain.id},
        { "version",           toolchain.version},
        { "program",           toolchain.program},
        {    "argv",              toolchain.argv},
        {     "env",               toolchain.env},
        {"artifact",          toolchain.artifact},
        {  "format", format_name(toolchain.format)},
        {"read_only_paths", toolchain.read_only_paths}
    };
}

}  // namespace

bool SupportedLicense::permits(const std::string& language) const
{
    return permitted_languages.empty() || std::ranges::contains(permitted_languages, language);
}

RegistrySnapshot::RegistrySnapshot(std::vector<SupportedLicense> licenses,
                                   std::vector<SupportedLanguage> languages)
    : m_licenses(std::move(licenses))
    , m_languages(std::move(languages))
{}

const SupportedLicense* RegistrySnapshot::find_license(const std::string& name) const
{
    auto it = std::ranges::find(m_licenses, name, &SupportedLicense::name);
    return it == m_licenses.end() ? nullptr : &*it;
}

const SupportedLanguage* RegistrySnapshot::find_active_language(const std::string& name) const
{
    const SupportedLanguage* active = nullptr;
    for (const auto& language : m_languages) {
        if (language.name != name || language.retired) {
            continue;
        }
        if (active == nullptr || language.revision > active->revision) {
            active = &language;
        }
    }
    return active;
}

const SupportedLanguage* RegistrySnapshot::find_language(const LanguageRef& ref) const
{
    auto it = std::ranges::find_if(m_languages, [&ref](const SupportedLanguage& language) {
        return language.name == ref.name && language.revision == ref.revision;
    });
    return it == m_languages.end() ? nullptr : &*it;
}

std::string_view format_name(ArtifactFormat format) noexcept
{
    return format == ArtifactFormat::kWasm ? "wasm" : "raw";
}

std::optional<ArtifactFormat> parse_format(std::string_view name)
{
    if (name == "wasm") {
        return ArtifactFormat::kWasm;
    }
    if (name == "raw") {
        return ArtifactFormat::kRaw;
    }
    return std::nullopt;
}

cverify::Result<RegistrySnapshot> from_json(const nlohmann::json& doc,
                                            const std::filesystem::path& schema_dir)
{
    if (auto result = common::validate_json(doc, (schema_dir / "registry.v1.schema.json").string());
        !result) {
        return std::unexpected(Error::make(result.error().code,
                                           "Registry schema validation failed: " + result.error().message));
    }

    std::vector<SupportedLanguage> languages;
    std::set<std::pair<std::string, int>> language_keys;
    for (const auto& entry : doc.at("languages")) {
        SupportedLanguage language;
        language.name = entry.at("name").get<std::string>();
        language.revision = entry.value("revision", 1);
        language.retired = entry.value("retired", false);
        language.required_dependencies =
            entry.value("required_dependencies", std::vector<std::string>{});
        language.reserved_files = entry.value("reserved_files", std::vector<std::string>{});
        auto toolchain = toolchain_from_json(entry.at("toolchain"), language.name);
        if (!toolchain) {
            return std::unexpected(toolchain.error());
        }
        language.toolchain = std::move(*toolchain);

        if (!language_keys.emplace(language.name, language.revision).second) {
            return std::unexpected(Error::make(
                "InvalidRegistry",
                std::format("language {} revision {} registered twice", language.name, language.revision)));
        }
        languages.push_back(std::move(language));
    }

    std::vector<SupportedLicense> licenses;
    for (const auto& entry : doc.at("licenses")) {
        SupportedLicense license{
            .name = entry.at("name").get<std::string>(),
            .permitted_languages = entry.value("permitted_languages", std::vector<std::string>{}),
        };
        if (std::ranges::contains(licenses, license.name, &SupportedLicense::name)) {
            return std::unexpected(Error::make(
                "InvalidRegistry", std::format("license {} registered twice", license.name)));
        }
        for (const auto& permitted : license.permitted_languages) {
            if (!std::ranges::contains(languages, permitted, &SupportedLanguage::name)) {
                return std::unexpected(Error::make(
                    "InvalidRegistry",
                    std::format("license {} permits unknown language {}", license.name, permitted)));
            }
        }
        licenses.push_back(std::move(license));
    }

    return RegistrySnapshot(std::move(licenses), std::move(languages));
}

cverify::Result<RegistrySnapshot> load_registry(const std::filesystem::path& path,
                                                const std::filesystem::path& schema_dir)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(Error::make("IOError", "Failed to open registry: " + path.string()));
    }
    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(
            "ParseError", std::format("Failed to parse registry {}: {}", path.string(), ex.what())));
    }
    return from_json(doc, schema_dir);
}

nlohmann::json to_json(const RegistrySnapshot& snapshot)
{
    nlohmann::json licenses = nlohmann::json::array();
    for (const auto& license : snapshot.licenses()) {
        licenses.push_back({
            {               "name",                license.name},
            {"permitted_languages", license.permitted_languages}
        });
    }
    nlohmann::json languages = nlohmann::json::array();
    for (const auto& language : snapshot.languages()) {
        languages.push_back({
            {                 "name",                  language.name},
            {             "revision",              language.revision},
            {              "retired",               language.retired},
            {            "toolchain", toolchain_to_json(language.toolchain)},
            {"required_dependencies", language.required_dependencies},
            {       "reserved_files",        language.reserved_files}
        });
    }
    return {
        {"schema_version", kRegistrySchemaVersion},
        {      "licenses",               licenses},
        {     "languages",              languages}
    };
}

}  // namespace cverify::registry
