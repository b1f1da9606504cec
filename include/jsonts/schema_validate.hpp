#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation for emitted manifests
 */

#include "jsonts/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace jsonts::common {

/**
 * Validate JSON against a JSON Schema file.
 *
 * Schemas may use `$defs` for local definitions. References to other
 * documents are not resolved and fail with SchemaBuildFailed.
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error on failure
 */
[[nodiscard]] jsonts::VoidResult validate_json(const nlohmann::json& j,
                                               const std::string& schema_path);

}  // namespace jsonts::common
