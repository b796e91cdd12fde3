#pragma once

/**
 * @file structural_hash.hpp
 * @brief Layout-insensitive structural digest of source code
 *
 * The code is reduced to a token tree:
 * - line comments ("//", "#"), block comments and intra-line whitespace are dropped
 * - a line whose first token is '#' glued to a name, '[' or '!' is a directive
 *   (#include, #define, #[derive(..)], #!...), kept whole as a "p:" leaf with
 *   its whitespace collapsed; "# text" at line start is still a comment
 * - identifiers, numbers, string literals and operator runs become typed leaves
 *   ("i:", "n:", "s:", "o:" prefixes)
 * - (), [] and {} pairs become nested nodes {"g": "(", "c": [...]}
 * - changes of leading indentation outside brackets become "indent"/"dedent"
 *
 * The tree is serialized as canonical JSON and hashed with SHA-256.
 */

#include "axiom/common.hpp"

#include <string_view>

#include <nlohmann/json.hpp>

namespace axiom::certificate {

/// Token tree of code as a JSON array
[[nodiscard]] nlohmann::json structural_tree(std::string_view code);

/**
 * 64-character hex SHA-256 of the canonical token tree.
 * @return ValidationError if the code is not valid UTF-8
 */
[[nodiscard]] axiom::Result<std::string> structural_hash(std::string_view code);

}  // namespace axiom::certificate
