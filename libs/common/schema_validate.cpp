/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 *
 * Parsed schemas are cached per path for the life of the process: records
 * and notifications are checked on every write.
 */

#include "cverify/schema_validate.hpp"

#include <format>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace cverify::common {

namespace {

[[nodiscard]] Result<std::shared_ptr<const valijson::Schema>> parse_schema_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(Error::make("SchemaFileOpenFailed", "Failed to open schema file: " + path));
    }
    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("SchemaParseFailed", std::format("Failed to parse schema JSON {}: {}", path, ex.what())));
    }

    auto schema = std::make_shared<valijson::Schema>();
    try {
        valijson::SchemaParser parser;
        valijson::adapters::NlohmannJsonAdapter adapter(doc);
        parser.populateSchema(adapter, *schema);
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("SchemaBuildFailed", std::format("Failed to build schema {}: {}", path, ex.what())));
    }
    return std::shared_ptr<const valijson::Schema>(std::move(schema));
}

class SchemaCache
{
public:
    [[nodiscard]] Result<std::shared_ptr<const valijson::Schema>> get(const std::string& path)
    {
        std::lock_guard lock(m_mutex);
        if (auto it = m_schemas.find(path); it != m_schemas.end()) {
            return it->second;
        }
        auto parsed = parse_schema_file(path);
        if (parsed) {
            m_schemas.emplace(path, *parsed);
        }
        return parsed;
    }

private:
    std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<const valijson::Schema>> m_schemas;
};

[[nodiscard]] SchemaCache& schema_cache()
{
    static SchemaCache cache;
    return cache;
}

/// One "<json pointer>: <description>" line per violation
[[nodiscard]] std::string describe_violations(valijson::ValidationResults& results)
{
    std::string text;
    valijson::ValidationResults::Error error;
    while (results.popError(error)) {
        std::string where;
        for (const auto& part : error.context) {
            // valijson reports the document root as "<root>"
            if (part != "<root>") {
                where += "/" + part;
            }
        }
        if (!text.empty()) {
            text += '\n';
        }
        text += std::format("{}: {}", where.empty() ? "/" : where, error.description);
    }
    return text.empty() ? std::string("Schema validation failed.") : text;
}

}  // namespace

cverify::VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path)
{
    auto schema = schema_cache().get(schema_path);
    if (!schema) {
        return std::unexpected(schema.error());
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target(j);
    if (!validator.validate(**schema, target, &results)) {
        return std::unexpected(Error::make("SchemaValidationFailed", describe_violations(results)));
    }
    return {};
}

}  // namespace cverify::common
