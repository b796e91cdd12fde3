#pragma once

/**
 * @file certificate.hpp
 * @brief Hash-chained, keyed-signed proof certificates for verified IVCUs
 *
 * code_hash  = sha256(code)
 * ast_hash   = structural_hash(code)
 * hash_chain = sha256(code_hash "|" ast_hash "|" intent_id "|" timestamp)
 * signature  = HMAC-SHA256(signing key, hash_chain), hex
 * verifier signature = HMAC-SHA256(signing key, name "|" passed "|" confidence)
 */

#include "axiom/common.hpp"
#include "axiom/ivcu.hpp"

#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace axiom::certificate {

/// Version stamped into every issued certificate
inline constexpr std::string_view kVerifierVersion = "1.0.0";

enum class ProofType { kTypeSafety, kMemorySafety, kContractCompliance, kPropertyBased };

[[nodiscard]] std::string_view proof_type_name(ProofType type) noexcept;
[[nodiscard]] std::optional<ProofType> proof_type_from_string(std::string_view text) noexcept;

struct VerifierSignature
{
    std::string verifier;
    std::string signature;  ///< Hex HMAC-SHA256
    std::string timestamp;  ///< RFC 3339
};

/// A formal claim established by a verifier
struct Assertion
{
    std::string type;
    std::string description;
    bool verified = false;
    std::string evidence;
};

struct ProofCertificate
{
    std::string id;
    std::string ivcu_id;
    ProofType proof_type = ProofType::kTypeSafety;
    std::string intent_id;
    std::string verifier_version;
    std::string timestamp;  ///< RFC 3339, bound into hash_chain
    std::string code_hash;
    std::string ast_hash;
    std::vector<VerifierSignature> verifier_signatures;
    std::vector<Assertion> assertions;
    std::string proof_data;  ///< Opaque bytes; base64 in JSON
    std::string hash_chain;
    std::string signature;
    std::string created_at;
};

/// Canonicalizable JSON (no floating point)
[[nodiscard]] nlohmann::json to_json(const ProofCertificate& cert);

/**
 * @return ValidationError if a field is missing or has the wrong type
 */
[[nodiscard]] axiom::Result<ProofCertificate> from_json(const nlohmann::json& j);

/**
 * Digest binding the certificate's identifying fields, joined with '|'.
 * Issuance rejects an intent_id containing '|'; the hex hashes and the
 * RFC 3339 timestamp cannot contain it.
 */
[[nodiscard]] std::string compute_hash_chain(std::string_view code_hash,
                                             std::string_view ast_hash,
                                             std::string_view intent_id,
                                             std::string_view timestamp);

/// Optional content attached to a certificate by the verification collaborator
struct Attachments
{
    std::vector<Assertion> assertions;
    std::string proof_data;
};

class CertificateService
{
public:
    using NowFn = std::function<WallClock::time_point()>;

    /**
     * @param signing_key Service-held HMAC key; must not be empty
     * @param verifier_version Version stamped into certificates
     * @param now Clock source; defaults to std::chrono::system_clock::now
     */
    explicit CertificateService(std::string signing_key,
                                std::string verifier_version = std::string(kVerifierVersion),
                                NowFn now = {});

    /**
     * Build and sign a certificate for a verified IVCU. Does not persist.
     * @return ValidationError unless ivcu is verified, intent_id is set and
     *         every verifier result is well-formed
     */
    [[nodiscard]] axiom::Result<ProofCertificate> generate_certificate(
        const ivcu::IvcuRecord& ivcu,
        const std::string& intent_id,
        std::string_view code,
        ProofType proof_type,
        std::span<const ivcu::VerifierResult> verifier_results,
        const Attachments& attachments = {}) const;

    /**
     * Re-derive hash_chain from the stored fields and the signature over it.
     * @return IntegrityViolation on any mismatch
     */
    [[nodiscard]] axiom::VoidResult verify(const ProofCertificate& cert) const;

    /**
     * verify(cert), then re-sign each verifier result and compare, in order.
     * @return IntegrityViolation on any mismatch
     */
    [[nodiscard]] axiom::VoidResult verify(const ProofCertificate& cert,
                                           std::span<const ivcu::VerifierResult> verifier_results) const;

    /**
     * Check that cert attests exactly this code (code_hash and ast_hash).
     * @return IntegrityViolation on mismatch
     */
    [[nodiscard]] axiom::VoidResult verify_code(const ProofCertificate& cert,
                                                std::string_view code) const;

    /// Keyed signature over "name|passed|confidence"
    [[nodiscard]] axiom::Result<std::string> sign_verifier_result(
        const ivcu::VerifierResult& result) const;

private:
    [[nodiscard]] axiom::Result<std::string> sign(std::string_view data) const;

    std::string m_signing_key;
    std::string m_verifier_version;
    NowFn m_now;
};

}  // namespace axiom::certificate
