#pragma once

/**
 * @file version.hpp
 * @brief Release and persisted-format identifiers
 */

namespace axiom {

/// Release reported by `axiom --version`
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Stamped into every certificate as schema_version; also names its schema file
constexpr const char* kCertificateSchemaVersion = "proof_certificate.v1";

/// Required schema_version of axiom.json
constexpr const char* kConfigSchemaVersion = "config.v1";

}  // namespace axiom
