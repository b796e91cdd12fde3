#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation at the persistence and configuration boundaries
 */

#include "axiom/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace axiom::common {

/**
 * Validate JSON against a JSON Schema file.
 *
 * Schemas may reference siblings as "axiom:schema/<name>", resolved to
 * "<name>.schema.json" in the same directory.
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, ValidationError listing every violation on failure
 */
[[nodiscard]] axiom::VoidResult validate_json(const nlohmann::json& j,
                                              const std::string& schema_path);

}  // namespace axiom::common
