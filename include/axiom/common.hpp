#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error taxonomy, hashing, keyed signatures, ids, time
 */

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace axiom {

/**
 * @brief Machine-readable error codes shared by every component
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */
namespace errc {
inline constexpr std::string_view kAuthentication = "AuthenticationError";
inline constexpr std::string_view kAuthorization = "AuthorizationError";
inline constexpr std::string_view kNotFound = "NotFoundError";
inline constexpr std::string_view kRateLimited = "RateLimited";
inline constexpr std::string_view kCircuitOpen = "CircuitOpen";
inline constexpr std::string_view kBudgetExceeded = "BudgetExceeded";
inline constexpr std::string_view kValidation = "ValidationError";
inline constexpr std::string_view kIntegrityViolation = "IntegrityViolation";
inline constexpr std::string_view kUpstreamUnavailable = "UpstreamUnavailable";
inline constexpr std::string_view kPersistence = "PersistenceError";
inline constexpr std::string_view kConflict = "ConflictError";
inline constexpr std::string_view kIO = "IOError";
inline constexpr std::string_view kParse = "ParseError";
}  // namespace errc

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code (see axiom::errc)
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string_view code, std::string message)
    {
        return Error{.code = std::string(code), .message = std::move(message)};
    }

    [[nodiscard]] bool is(std::string_view other) const noexcept { return code == other; }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

/// Wall clock used for credentials, timestamps and audit records
using WallClock = std::chrono::system_clock;

/// Monotonic clock used for admission gates
using SteadyClock = std::chrono::steady_clock;

}  // namespace axiom

namespace axiom::common {

// ============================================================================
// SHA-256 Hash
// ============================================================================

/**
 * Compute SHA-256 hash of data
 * @param data Input bytes
 * @return Hex-encoded hash string (64 characters)
 */
[[nodiscard]] std::string sha256(std::string_view data);

/**
 * Compute SHA-256 hash of data with prefix
 * @param data Input bytes
 * @return "sha256:" + hex-encoded hash
 */
[[nodiscard]] std::string sha256_prefixed(std::string_view data);

// ============================================================================
// Keyed signatures (OpenSSL)
// ============================================================================

enum class HmacAlgorithm { kSha256, kSha384, kSha512 };

/**
 * Compute a raw HMAC over data
 * @return Raw MAC bytes, or error if OpenSSL rejects the input
 */
[[nodiscard]] Result<std::string> hmac_raw(HmacAlgorithm algorithm,
                                           std::string_view key,
                                           std::string_view data);

/**
 * Compute HMAC-SHA256 over data
 * @return Hex-encoded MAC (64 characters)
 */
[[nodiscard]] Result<std::string> hmac_sha256_hex(std::string_view key, std::string_view data);

/**
 * Compare two byte strings in constant time (length is not secret)
 */
[[nodiscard]] bool constant_time_equals(std::string_view a, std::string_view b) noexcept;

// ============================================================================
// Encodings
// ============================================================================

[[nodiscard]] std::string to_hex(std::string_view bytes);

[[nodiscard]] bool is_hex_digest(std::string_view text, std::size_t length = 64);

[[nodiscard]] std::string base64_encode(std::string_view bytes);

[[nodiscard]] Result<std::string> base64_decode(std::string_view text);

/**
 * Encode bytes as unpadded base64url (RFC 4648 §5)
 */
[[nodiscard]] std::string base64url_encode(std::string_view bytes);

/**
 * Decode unpadded or padded base64url (RFC 4648 §5)
 */
[[nodiscard]] Result<std::string> base64url_decode(std::string_view text);

// ============================================================================
// Identifiers and time
// ============================================================================

/**
 * Generate a random RFC 4122 version 4 UUID string
 */
[[nodiscard]] Result<std::string> random_uuid();

/**
 * Format a wall-clock time as RFC 3339 UTC with second precision
 * ("2024-01-31T12:00:00Z")
 */
[[nodiscard]] std::string format_rfc3339(WallClock::time_point tp);

/**
 * Parse the output of format_rfc3339
 */
[[nodiscard]] Result<WallClock::time_point> parse_rfc3339(std::string_view text);

}  // namespace axiom::common
