/**
 * @file certstore.cpp
 * @brief Certificate store implementation
 */

#include "axiom/certstore.hpp"

#include "axiom/canonical_json.hpp"
#include "axiom/schema_validate.hpp"
#include "axiom/version.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

namespace axiom::certstore {

namespace {

namespace fs = std::filesystem;

void ensure_parent_dir(const fs::path& path)
{
    fs::path parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
    }
}

}  // namespace

CertStore::CertStore(store::CertificateRepository& repository, std::string schema_dir)
    : m_repository(repository)
    , m_schema_dir(std::move(schema_dir))
{}

std::string CertStore::cert_schema_path() const
{
    return (fs::path(m_schema_dir) / (std::string(kCertificateSchemaVersion) + ".schema.json")).string();
}

axiom::Result<nlohmann::json> CertStore::validated_document(
    const certificate::ProofCertificate& cert) const
{
    nlohmann::json document = certificate::to_json(cert);
    if (auto result = common::validate_json(document, cert_schema_path()); !result) {
        return std::unexpected(
            Error::make(result.error().code,
                        "Certificate schema validation failed: " + result.error().message));
    }
    return document;
}

axiom::Result<std::string> CertStore::put(const certificate::ProofCertificate& cert)
{
    auto document = validated_document(cert);
    if (!document) {
        return std::unexpected(document.error());
    }
    auto canonical = canonical::canonicalize(*document);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    auto hash = canonical::hash_canonical(*document);
    if (!hash) {
        return std::unexpected(hash.error());
    }

    store::CertificateRow row{.id = cert.id,
                              .ivcu_id = cert.ivcu_id,
                              .proof_type = std::string(certificate::proof_type_name(cert.proof_type)),
                              .intent_id = cert.intent_id,
                              .code_hash = cert.code_hash,
                              .ast_hash = cert.ast_hash,
                              .hash_chain = cert.hash_chain,
                              .signature = cert.signature,
                              .content_hash = *hash,
                              .document = std::move(*canonical),
                              .created_at = cert.created_at};
    if (auto result = m_repository.insert_certificate(row); !result) {
        return std::unexpected(result.error());
    }
    return *hash;
}

axiom::Result<certificate::ProofCertificate> CertStore::decode_row(const store::CertificateRow& row) const
{
    nlohmann::json document = nlohmann::json::parse(row.document, nullptr, false);
    if (document.is_discarded()) {
        return std::unexpected(Error::make(errc::kIntegrityViolation,
                                           "Stored certificate is not valid JSON: " + row.id));
    }
    if (auto result = common::validate_json(document, cert_schema_path()); !result) {
        return std::unexpected(
            Error::make(errc::kIntegrityViolation,
                        "Stored certificate schema validation failed: " + result.error().message));
    }

    auto computed_hash = canonical::hash_canonical(document);
    if (!computed_hash) {
        return std::unexpected(computed_hash.error());
    }
    if (*computed_hash != row.content_hash) {
        return std::unexpected(
            Error::make(errc::kIntegrityViolation,
                        "Certificate hash mismatch: expected " + row.content_hash + ", got "
                            + *computed_hash));
    }

    auto cert = certificate::from_json(document);
    if (!cert) {
        return std::unexpected(cert.error());
    }
    if (cert->id != row.id || cert->ivcu_id != row.ivcu_id || cert->hash_chain != row.hash_chain
        || cert->signature != row.signature) {
        return std::unexpected(Error::make(errc::kIntegrityViolation,
                                           "Certificate columns disagree with document: " + row.id));
    }
    return cert;
}

axiom::Result<certificate::ProofCertificate> CertStore::get(const std::string& id) const
{
    auto row = m_repository.find_certificate(id);
    if (!row) {
        return std::unexpected(row.error());
    }
    return decode_row(*row);
}

axiom::Result<std::optional<certificate::ProofCertificate>> CertStore::find_for(
    const std::string& ivcu_id,
    certificate::ProofType proof_type) const
{
    auto row = m_repository.find_certificate_for(ivcu_id,
                                                 std::string(certificate::proof_type_name(proof_type)));
    if (!row) {
        return std::unexpected(row.error());
    }
    if (!row->has_value()) {
        return std::optional<certificate::ProofCertificate>{};
    }
    auto cert = decode_row(**row);
    if (!cert) {
        return std::unexpected(cert.error());
    }
    return std::optional<certificate::ProofCertificate>{std::move(*cert)};
}

axiom::VoidResult CertStore::export_file(const certificate::ProofCertificate& cert,
                                         const std::string& path) const
{
    auto document = validated_document(cert);
    if (!document) {
        return std::unexpected(document.error());
    }
    auto canonical = canonical::canonicalize(*document);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }

    fs::path out_path(path);
    ensure_parent_dir(out_path);
    std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return std::unexpected(
            Error::make(errc::kIO, "Failed to open file for write: " + out_path.string()));
    }
    out << *canonical;
    if (!out) {
        return std::unexpected(Error::make(errc::kIO, "Failed to write file: " + out_path.string()));
    }
    return {};
}

axiom::Result<certificate::ProofCertificate> CertStore::import_file(const std::string& path) const
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::unexpected(Error::make(errc::kIO, "Failed to open file for read: " + path));
    }
    std::string content{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(content);
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make(errc::kParse, "Failed to parse JSON from " + path + ": " + ex.what()));
    }
    if (auto result = common::validate_json(document, cert_schema_path()); !result) {
        return std::unexpected(
            Error::make(result.error().code,
                        "Certificate schema validation failed: " + result.error().message));
    }
    return certificate::from_json(document);
}

}  // namespace axiom::certstore
