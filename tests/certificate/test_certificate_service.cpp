/**
 * @file test_certificate_service.cpp
 * @brief Certificate issuance and tamper detection
 */

#include "axiom/certificate.hpp"
#include "axiom/structural_hash.hpp"

#include <chrono>
#include <string>
#include <vector>

#include <gtest/gtest.h>

using axiom::certificate::CertificateService;
using axiom::certificate::ProofCertificate;
using axiom::certificate::ProofType;
using axiom::ivcu::VerifierResult;

namespace {

const axiom::WallClock::time_point kNow{std::chrono::seconds{1704067200}};

constexpr std::string_view kCode = "def add(a, b):\n    return a + b\n";

axiom::ivcu::IvcuRecord verified_unit()
{
    return axiom::ivcu::IvcuRecord{.id = "ivcu-1",
                                   .project_id = "p1",
                                   .version = 1,
                                   .status = axiom::ivcu::Status::kVerified,
                                   .confidence_score = 0.9,
                                   .parent_ids = {}};
}

const std::vector<VerifierResult> kResults = {
    VerifierResult{.name = "syntax", .tier = 1, .passed = true, .confidence = 1.0},
    VerifierResult{.name = "types", .tier = 2, .passed = true, .confidence = 0.85},
};

void expect_integrity_violation(const axiom::VoidResult& result)
{
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, axiom::errc::kIntegrityViolation) << result.error().message;
}

}  // namespace

class CertificateServiceTest : public ::testing::Test
{
protected:
    ProofCertificate issue()
    {
        auto cert = m_service.generate_certificate(
            verified_unit(), "intent-1", kCode, ProofType::kTypeSafety, kResults);
        EXPECT_TRUE(cert) << cert.error().message;
        return cert.value_or(ProofCertificate{});
    }

    CertificateService m_service{"signing-key", "1.0.0", [] { return kNow; }};
};

TEST_F(CertificateServiceTest, IssuesChainedCertificate)
{
    const ProofCertificate cert = issue();
    EXPECT_FALSE(cert.id.empty());
    EXPECT_EQ(cert.ivcu_id, "ivcu-1");
    EXPECT_EQ(cert.intent_id, "intent-1");
    EXPECT_EQ(cert.verifier_version, "1.0.0");
    EXPECT_EQ(cert.timestamp, axiom::common::format_rfc3339(kNow));
    EXPECT_EQ(cert.created_at, cert.timestamp);
    EXPECT_EQ(cert.code_hash, axiom::common::sha256(kCode));
    EXPECT_EQ(cert.ast_hash, axiom::certificate::structural_hash(kCode).value_or(""));
    EXPECT_EQ(cert.hash_chain,
              axiom::certificate::compute_hash_chain(cert.code_hash, cert.ast_hash, cert.intent_id, cert.timestamp));
    EXPECT_EQ(cert.signature.size(), 64U);

    ASSERT_EQ(cert.verifier_signatures.size(), 2U);
    EXPECT_EQ(cert.verifier_signatures[0].verifier, "syntax");
    EXPECT_EQ(cert.verifier_signatures[1].verifier, "types");

    EXPECT_TRUE(m_service.verify(cert));
    EXPECT_TRUE(m_service.verify(cert, kResults));
    EXPECT_TRUE(m_service.verify_code(cert, kCode));
}

TEST_F(CertificateServiceTest, IdsAreUnique)
{
    EXPECT_NE(issue().id, issue().id);
}

TEST_F(CertificateServiceTest, RequiresVerifiedUnit)
{
    auto unit = verified_unit();
    unit.status = axiom::ivcu::Status::kVerifying;
    auto cert = m_service.generate_certificate(unit, "intent-1", kCode, ProofType::kTypeSafety, kResults);
    ASSERT_FALSE(cert);
    EXPECT_EQ(cert.error().code, axiom::errc::kValidation);
}

TEST_F(CertificateServiceTest, RequiresIntent)
{
    auto cert = m_service.generate_certificate(verified_unit(), "", kCode, ProofType::kTypeSafety, kResults);
    ASSERT_FALSE(cert);
    EXPECT_EQ(cert.error().code, axiom::errc::kValidation);
}

TEST_F(CertificateServiceTest, ChainFieldsCannotHoldSeparator)
{
    // "a|b" + "c" and "a" + "b|c" would join to the same chain input
    EXPECT_EQ(axiom::certificate::compute_hash_chain("x", "a|b", "c", "t"),
              axiom::certificate::compute_hash_chain("x", "a", "b|c", "t"));

    auto cert = m_service.generate_certificate(verified_unit(), "intent|1", kCode, ProofType::kTypeSafety, kResults);
    ASSERT_FALSE(cert);
    EXPECT_EQ(cert.error().code, axiom::errc::kValidation);

    const std::vector<VerifierResult> results = {
        VerifierResult{.name = "types|true", .tier = 2, .passed = true, .confidence = 1.0}};
    auto named = m_service.generate_certificate(verified_unit(), "intent-1", kCode, ProofType::kTypeSafety, results);
    ASSERT_FALSE(named);
    EXPECT_EQ(named.error().code, axiom::errc::kValidation);

    ProofCertificate shifted = issue();
    shifted.intent_id = "intent|1";
    expect_integrity_violation(m_service.verify(shifted));
}

TEST_F(CertificateServiceTest, RejectsMalformedVerifierResult)
{
    const std::vector<VerifierResult> results = {
        VerifierResult{.name = "types", .tier = 2, .passed = true, .confidence = 1.5}};
    auto cert =
        m_service.generate_certificate(verified_unit(), "intent-1", kCode, ProofType::kTypeSafety, results);
    ASSERT_FALSE(cert);
    EXPECT_EQ(cert.error().code, axiom::errc::kValidation);
}

TEST_F(CertificateServiceTest, DetectsTamperedFields)
{
    const ProofCertificate original = issue();

    ProofCertificate cert = original;
    cert.intent_id = "intent-2";
    expect_integrity_violation(m_service.verify(cert));

    cert = original;
    cert.timestamp = axiom::common::format_rfc3339(kNow + std::chrono::seconds{1});
    expect_integrity_violation(m_service.verify(cert));

    cert = original;
    cert.code_hash = axiom::common::sha256("print('pwned')");
    expect_integrity_violation(m_service.verify(cert));

    // Recomputing the chain does not help without the key
    cert.hash_chain = axiom::certificate::compute_hash_chain(cert.code_hash, cert.ast_hash, cert.intent_id, cert.timestamp);
    expect_integrity_violation(m_service.verify(cert));

    cert = original;
    cert.signature[0] = cert.signature[0] == 'a' ? 'b' : 'a';
    expect_integrity_violation(m_service.verify(cert));
}

TEST_F(CertificateServiceTest, OtherKeyCannotVerify)
{
    const ProofCertificate cert = issue();
    CertificateService other("another-key", "1.0.0", [] { return kNow; });
    expect_integrity_violation(other.verify(cert));
}

TEST_F(CertificateServiceTest, VerifierResultsMustMatch)
{
    const ProofCertificate cert = issue();

    auto changed = kResults;
    changed[1].confidence = 0.95;
    expect_integrity_violation(m_service.verify(cert, changed));

    auto failed = kResults;
    failed[0].passed = false;
    expect_integrity_violation(m_service.verify(cert, failed));

    const std::vector<VerifierResult> fewer(kResults.begin(), kResults.begin() + 1);
    expect_integrity_violation(m_service.verify(cert, fewer));
}

TEST_F(CertificateServiceTest, VerifyCodeBindsExactSource)
{
    const ProofCertificate cert = issue();
    expect_integrity_violation(m_service.verify_code(cert, "def add(a, b):\n    return a - b\n"));
    // Same structure, different bytes
    expect_integrity_violation(m_service.verify_code(cert, "def add(a,b):\n    return a+b\n"));
}

TEST_F(CertificateServiceTest, JsonRoundTripPreservesEveryField)
{
    auto cert = m_service.generate_certificate(
        verified_unit(),
        "intent-1",
        kCode,
        ProofType::kMemorySafety,
        kResults,
        axiom::certificate::Attachments{
            .assertions = {{.type = "bounds", .description = "no overflow", .verified = true, .evidence = "smt"}},
            .proof_data = std::string("\x00\x01\xff", 3)});
    ASSERT_TRUE(cert);

    const auto j = axiom::certificate::to_json(*cert);
    EXPECT_EQ(j["schema_version"], "proof_certificate.v1");
    EXPECT_EQ(j["proof_type"], "memory_safety");
    EXPECT_EQ(j["proof_data"], "AAH/");

    auto decoded = axiom::certificate::from_json(j);
    ASSERT_TRUE(decoded) << decoded.error().message;
    EXPECT_EQ(decoded->proof_data, cert->proof_data);
    ASSERT_EQ(decoded->assertions.size(), 1U);
    EXPECT_EQ(decoded->assertions[0].evidence, "smt");
    EXPECT_EQ(decoded->proof_type, ProofType::kMemorySafety);
    EXPECT_EQ(axiom::certificate::to_json(*decoded), j);
    EXPECT_TRUE(m_service.verify(*decoded));
}

TEST(CertificateJson, RejectsBadDocuments)
{
    auto missing = axiom::certificate::from_json(nlohmann::json{{"id", "c1"}});
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, axiom::errc::kValidation);

    CertificateService service("key");
    auto cert = service.generate_certificate(verified_unit(), "intent-1", kCode, ProofType::kTypeSafety, {});
    ASSERT_TRUE(cert);
    auto j = axiom::certificate::to_json(*cert);
    j["proof_type"] = "vibes";
    auto unknown = axiom::certificate::from_json(j);
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, axiom::errc::kValidation);
}

TEST(CertificateService, EmptyKeyCannotSign)
{
    CertificateService service("");
    auto cert = service.generate_certificate(verified_unit(), "intent-1", kCode, ProofType::kTypeSafety, kResults);
    ASSERT_FALSE(cert);
    EXPECT_EQ(cert.error().code, axiom::errc::kValidation);
}

TEST(ProofTypeNames, Parse)
{
    EXPECT_EQ(axiom::certificate::proof_type_from_string("contract_compliance"), ProofType::kContractCompliance);
    EXPECT_EQ(axiom::certificate::proof_type_name(ProofType::kPropertyBased), "property_based");
    EXPECT_FALSE(axiom::certificate::proof_type_from_string("vibes"));
}
