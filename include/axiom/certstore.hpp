#pragma once

/**
 * @file certstore.hpp
 * @brief Schema-checked, content-hashed certificate persistence
 *
 * Each certificate is stored once as canonical JSON together with its
 * content hash. A second certificate for the same (ivcu_id, proof_type) is
 * rejected with ConflictError; stored certificates are never overwritten.
 */

#include "axiom/certificate.hpp"
#include "axiom/common.hpp"
#include "axiom/store.hpp"

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace axiom::certstore {

class CertStore
{
public:
    explicit CertStore(store::CertificateRepository& repository, std::string schema_dir = "schemas");

    /**
     * @brief Validate and persist a certificate
     * @return Content hash ("sha256:...") of the stored document or error
     */
    [[nodiscard]] axiom::Result<std::string> put(const certificate::ProofCertificate& cert);

    /**
     * @brief Retrieve a certificate by id, re-validating schema and content hash
     * @return Certificate, NotFoundError, or IntegrityViolation if the stored
     *         document no longer matches its hash
     */
    [[nodiscard]] axiom::Result<certificate::ProofCertificate> get(const std::string& id) const;

    /**
     * @brief The certificate issued for (ivcu_id, proof_type), if any
     */
    [[nodiscard]] axiom::Result<std::optional<certificate::ProofCertificate>> find_for(
        const std::string& ivcu_id,
        certificate::ProofType proof_type) const;

    /**
     * @brief Write a certificate to a file as canonical JSON
     */
    [[nodiscard]] axiom::VoidResult export_file(const certificate::ProofCertificate& cert,
                                                const std::string& path) const;

    /**
     * @brief Read and schema-check a certificate file written by export_file
     */
    [[nodiscard]] axiom::Result<certificate::ProofCertificate> import_file(const std::string& path) const;

private:
    [[nodiscard]] std::string cert_schema_path() const;

    [[nodiscard]] axiom::Result<nlohmann::json> validated_document(
        const certificate::ProofCertificate& cert) const;

    [[nodiscard]] axiom::Result<certificate::ProofCertificate> decode_row(
        const store::CertificateRow& row) const;

    store::CertificateRepository& m_repository;
    std::string m_schema_dir;
};

}  // namespace axiom::certstore
