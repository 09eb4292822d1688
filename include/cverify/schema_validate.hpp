#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation utilities
 */

#include "cverify/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace cverify::common {

/**
 * Validate JSON against a JSON Schema file.
 *
 * Cross-schema references use the "cverify:schema/<name>" URI form and are
 * resolved against the directory of @p schema_path.
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error on failure
 */
[[nodiscard]] cverify::VoidResult validate_json(const nlohmann::json& j,
                                                const std::string& schema_path);

}  // namespace cverify::common
