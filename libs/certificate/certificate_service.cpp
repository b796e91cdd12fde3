/**
 * @file certificate_service.cpp
 * @brief Certificate issuance, serialization and re-derivation
 */

#include "axiom/certificate.hpp"

#include "axiom/structural_hash.hpp"
#include "axiom/version.hpp"

#include <array>
#include <cmath>
#include <format>
#include <utility>

namespace axiom::certificate {

namespace {

constexpr std::array kProofTypes = {ProofType::kTypeSafety,
                                    ProofType::kMemorySafety,
                                    ProofType::kContractCompliance,
                                    ProofType::kPropertyBased};

/// Joins hash chain and verifier payload fields; free-form fields must not contain it
constexpr char kFieldSeparator = '|';

[[nodiscard]] Error integrity(std::string message)
{
    return Error::make(errc::kIntegrityViolation, std::move(message));
}

[[nodiscard]] std::string verifier_payload(const ivcu::VerifierResult& result)
{
    return std::format("{}|{}|{:.6f}", result.name, result.passed, result.confidence);
}

}  // namespace

std::string_view proof_type_name(ProofType type) noexcept
{
    switch (type) {
        case ProofType::kTypeSafety:
            return "type_safety";
        case ProofType::kMemorySafety:
            return "memory_safety";
        case ProofType::kContractCompliance:
            return "contract_compliance";
        case ProofType::kPropertyBased:
            return "property_based";
    }
    return "unknown";
}

std::optional<ProofType> proof_type_from_string(std::string_view text) noexcept
{
    for (ProofType type : kProofTypes) {
        if (proof_type_name(type) == text) {
            return type;
        }
    }
    return std::nullopt;
}

nlohmann::json to_json(const ProofCertificate& cert)
{
    nlohmann::json signatures = nlohmann::json::array();
    for (const auto& s : cert.verifier_signatures) {
        signatures.push_back(
            {{"verifier", s.verifier}, {"signature", s.signature}, {"timestamp", s.timestamp}});
    }
    nlohmann::json assertions = nlohmann::json::array();
    for (const auto& a : cert.assertions) {
        assertions.push_back({{"type", a.type},
                              {"description", a.description},
                              {"verified", a.verified},
                              {"evidence", a.evidence}});
    }
    return nlohmann::json{
        {"schema_version", kCertificateSchemaVersion},
        {"id", cert.id},
        {"ivcu_id", cert.ivcu_id},
        {"proof_type", std::string(proof_type_name(cert.proof_type))},
        {"intent_id", cert.intent_id},
        {"verifier_version", cert.verifier_version},
        {"timestamp", cert.timestamp},
        {"code_hash", cert.code_hash},
        {"ast_hash", cert.ast_hash},
        {"verifier_signatures", std::move(signatures)},
        {"assertions", std::move(assertions)},
        {"proof_data", common::base64_encode(cert.proof_data)},
        {"hash_chain", cert.hash_chain},
        {"signature", cert.signature},
        {"created_at", cert.created_at},
    };
}

axiom::Result<ProofCertificate> from_json(const nlohmann::json& j)
{
    try {
        ProofCertificate cert;
        cert.id = j.at("id").get<std::string>();
        cert.ivcu_id = j.at("ivcu_id").get<std::string>();
        const auto type_text = j.at("proof_type").get<std::string>();
        auto type = proof_type_from_string(type_text);
        if (!type) {
            return std::unexpected(
                Error::make(errc::kValidation, "Unknown proof_type: " + type_text));
        }
        cert.proof_type = *type;
        cert.intent_id = j.at("intent_id").get<std::string>();
        cert.verifier_version = j.at("verifier_version").get<std::string>();
        cert.timestamp = j.at("timestamp").get<std::string>();
        cert.code_hash = j.at("code_hash").get<std::string>();
        cert.ast_hash = j.at("ast_hash").get<std::string>();
        for (const auto& s : j.at("verifier_signatures")) {
            cert.verifier_signatures.push_back(
                VerifierSignature{.verifier = s.at("verifier").get<std::string>(),
                                  .signature = s.at("signature").get<std::string>(),
                                  .timestamp = s.at("timestamp").get<std::string>()});
        }
        for (const auto& a : j.at("assertions")) {
            cert.assertions.push_back(Assertion{.type = a.at("type").get<std::string>(),
                                                .description = a.at("description").get<std::string>(),
                                                .verified = a.at("verified").get<bool>(),
                                                .evidence = a.at("evidence").get<std::string>()});
        }
        auto proof_data = common::base64_decode(j.at("proof_data").get<std::string>());
        if (!proof_data) {
            return std::unexpected(
                Error::make(errc::kValidation, "proof_data is not base64: " + proof_data.error().message));
        }
        cert.proof_data = std::move(*proof_data);
        cert.hash_chain = j.at("hash_chain").get<std::string>();
        cert.signature = j.at("signature").get<std::string>();
        cert.created_at = j.at("created_at").get<std::string>();
        return cert;
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(
            Error::make(errc::kValidation, std::format("Malformed certificate: {}", ex.what())));
    }
}

std::string compute_hash_chain(std::string_view code_hash,
                               std::string_view ast_hash,
                               std::string_view intent_id,
                               std::string_view timestamp)
{
    return common::sha256(std::format("{}|{}|{}|{}", code_hash, ast_hash, intent_id, timestamp));
}

CertificateService::CertificateService(std::string signing_key,
                                       std::string verifier_version,
                                       NowFn now)
    : m_signing_key(std::move(signing_key))
    , m_verifier_version(std::move(verifier_version))
    , m_now(now ? std::move(now) : NowFn{[] { return WallClock::now(); }})
{}

axiom::Result<std::string> CertificateService::sign(std::string_view data) const
{
    if (m_signing_key.empty()) {
        return std::unexpected(Error::make(errc::kValidation, "certificate signing key is not configured"));
    }
    return common::hmac_sha256_hex(m_signing_key, data);
}

axiom::Result<std::string> CertificateService::sign_verifier_result(
    const ivcu::VerifierResult& result) const
{
    return sign(verifier_payload(result));
}

axiom::Result<ProofCertificate> CertificateService::generate_certificate(
    const ivcu::IvcuRecord& ivcu,
    const std::string& intent_id,
    std::string_view code,
    ProofType proof_type,
    std::span<const ivcu::VerifierResult> verifier_results,
    const Attachments& attachments) const
{
    if (ivcu.status != ivcu::Status::kVerified) {
        return std::unexpected(Error::make(
            errc::kValidation,
            std::format("IVCU {} is {}; certificates are issued only for verified units",
                        ivcu.id,
                        ivcu::status_name(ivcu.status))));
    }
    if (intent_id.empty() || intent_id.contains(kFieldSeparator)) {
        return std::unexpected(Error::make(
            errc::kValidation, std::format("intent_id must be non-empty and free of '{}'", kFieldSeparator)));
    }
    for (const auto& result : verifier_results) {
        if (result.name.empty() || result.name.contains(kFieldSeparator) || !std::isfinite(result.confidence)
            || result.confidence < 0.0 || result.confidence > 1.0) {
            return std::unexpected(Error::make(
                errc::kValidation, "malformed verifier result for '" + result.name + "'"));
        }
    }

    auto ast_hash = structural_hash(code);
    if (!ast_hash) {
        return std::unexpected(ast_hash.error());
    }
    auto id = common::random_uuid();
    if (!id) {
        return std::unexpected(id.error());
    }

    const std::string now = common::format_rfc3339(m_now());
    ProofCertificate cert{.id = std::move(*id),
                          .ivcu_id = ivcu.id,
                          .proof_type = proof_type,
                          .intent_id = intent_id,
                          .verifier_version = m_verifier_version,
                          .timestamp = now,
                          .code_hash = common::sha256(code),
                          .ast_hash = std::move(*ast_hash),
                          .verifier_signatures = {},
                          .assertions = attachments.assertions,
                          .proof_data = attachments.proof_data,
                          .hash_chain = {},
                          .signature = {},
                          .created_at = now};

    for (const auto& result : verifier_results) {
        auto signature = sign_verifier_result(result);
        if (!signature) {
            return std::unexpected(signature.error());
        }
        cert.verifier_signatures.push_back(
            VerifierSignature{.verifier = result.name, .signature = std::move(*signature), .timestamp = now});
    }

    cert.hash_chain = compute_hash_chain(cert.code_hash, cert.ast_hash, cert.intent_id, cert.timestamp);
    auto signature = sign(cert.hash_chain);
    if (!signature) {
        return std::unexpected(signature.error());
    }
    cert.signature = std::move(*signature);
    return cert;
}

axiom::VoidResult CertificateService::verify(const ProofCertificate& cert) const
{
    if (cert.intent_id.contains(kFieldSeparator)) {
        return std::unexpected(
            integrity(std::format("certificate {}: intent_id contains the chain separator", cert.id)));
    }
    const std::string chain =
        compute_hash_chain(cert.code_hash, cert.ast_hash, cert.intent_id, cert.timestamp);
    if (!common::constant_time_equals(chain, cert.hash_chain)) {
        return std::unexpected(
            integrity(std::format("certificate {}: hash chain does not match its fields", cert.id)));
    }
    auto expected = sign(cert.hash_chain);
    if (!expected) {
        return std::unexpected(expected.error());
    }
    if (!common::constant_time_equals(*expected, cert.signature)) {
        return std::unexpected(
            integrity(std::format("certificate {}: signature was not issued by this service", cert.id)));
    }
    return {};
}

axiom::VoidResult CertificateService::verify(const ProofCertificate& cert,
                                             std::span<const ivcu::VerifierResult> verifier_results) const
{
    if (auto ok = verify(cert); !ok) {
        return ok;
    }
    if (verifier_results.size() != cert.verifier_signatures.size()) {
        return std::unexpected(integrity(
            std::format("certificate {}: {} verifier signatures recorded, {} results supplied",
                        cert.id,
                        cert.verifier_signatures.size(),
                        verifier_results.size())));
    }
    for (std::size_t i = 0; i < verifier_results.size(); ++i) {
        const auto& stored = cert.verifier_signatures[i];
        auto expected = sign_verifier_result(verifier_results[i]);
        if (!expected) {
            return std::unexpected(expected.error());
        }
        if (stored.verifier != verifier_results[i].name
            || !common::constant_time_equals(*expected, stored.signature)) {
            return std::unexpected(integrity(std::format(
                "certificate {}: signature of verifier '{}' does not match", cert.id, stored.verifier)));
        }
    }
    return {};
}

axiom::VoidResult CertificateService::verify_code(const ProofCertificate& cert,
                                                  std::string_view code) const
{
    if (!common::constant_time_equals(common::sha256(code), cert.code_hash)) {
        return std::unexpected(integrity(std::format("certificate {}: code hash mismatch", cert.id)));
    }
    auto ast_hash = structural_hash(code);
    if (!ast_hash) {
        return std::unexpected(ast_hash.error());
    }
    if (!common::constant_time_equals(*ast_hash, cert.ast_hash)) {
        return std::unexpected(integrity(std::format("certificate {}: AST hash mismatch", cert.id)));
    }
    return {};
}

}  // namespace axiom::certificate
