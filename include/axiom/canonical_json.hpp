#pragma once

/**
 * @file canonical_json.hpp
 * @brief Byte-stable JSON for content hashes, hash chains and certificate files
 *
 * Canonical form: UTF-8, object keys in byte order at every depth, compact
 * separators, integers only. Two documents with equal content always yield
 * the same bytes.
 */

#include "axiom/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace axiom::canonical {

/**
 * @return Canonical bytes, or ValidationError for a float or invalid UTF-8
 *         (the message names the offending path, e.g. "$.details[2]")
 */
[[nodiscard]] axiom::Result<std::string> canonicalize(const nlohmann::json& j);

/// "sha256:" + hex digest of canonicalize(j); the content hash of stored certificates
[[nodiscard]] axiom::Result<std::string> hash_canonical(const nlohmann::json& j);

/// Bare 64-character hex digest of canonicalize(j)
[[nodiscard]] axiom::Result<std::string> digest_canonical(const nlohmann::json& j);

/// Check j could be canonicalized, without serializing it
[[nodiscard]] axiom::VoidResult validate_for_canonical(const nlohmann::json& j);

}  // namespace axiom::canonical
