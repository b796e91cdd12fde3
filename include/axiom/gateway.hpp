#pragma once

/**
 * @file gateway.hpp
 * @brief End-to-end control flow for generation and verification requests
 *
 * admission -> collaborator call -> breaker outcome and usage recording ->
 * certificate (on verification) -> IVCU transition and persistence ->
 * certificate storage -> events. A transition that cannot be persisted, or a
 * certificate that cannot be issued or stored, leaves the unit where it was.
 */

#include "axiom/admission.hpp"
#include "axiom/budget.hpp"
#include "axiom/certificate.hpp"
#include "axiom/certstore.hpp"
#include "axiom/circuit_breaker.hpp"
#include "axiom/common.hpp"
#include "axiom/ivcu.hpp"
#include "axiom/store.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace axiom::gateway {

struct GenerationRequest
{
    std::string intent;
    std::vector<std::string> constraints;
    std::string language;
};

struct GeneratedCode
{
    std::string code;
    double cost = 0.0;
    std::string model;
    std::int64_t input_tokens = 0;
    std::int64_t output_tokens = 0;
};

/**
 * @brief External code-generation collaborator
 */
class GenerationService
{
public:
    virtual ~GenerationService() = default;

    /// Any error is recorded as a failure of the ai_generation dependency
    [[nodiscard]] virtual axiom::Result<GeneratedCode> generate(const GenerationRequest& request) = 0;
};

struct VerificationReport
{
    std::vector<ivcu::VerifierResult> results;  ///< One per verifier tier
    double cost = 0.0;
    std::vector<certificate::Assertion> assertions;
    std::string proof_data;
};

/**
 * @brief External formal-verification collaborator
 */
class VerificationService
{
public:
    virtual ~VerificationService() = default;

    /// Any error is recorded as a failure of the formal_verification dependency
    [[nodiscard]] virtual axiom::Result<VerificationReport> verify(std::string_view code,
                                                                   std::string_view language) = 0;
};

/**
 * @brief Fire-and-forget message bus
 */
class EventPublisher
{
public:
    virtual ~EventPublisher() = default;

    [[nodiscard]] virtual axiom::VoidResult publish(const std::string& subject,
                                                    const nlohmann::json& payload) = 0;
};

inline constexpr std::string_view kEventGenerated = "ivcu.generated";
inline constexpr std::string_view kEventVerified = "ivcu.verified";
inline constexpr std::string_view kEventFailed = "ivcu.failed";
inline constexpr std::string_view kEventCertificateIssued = "certificate.issued";

/// Status callbacks from the workflow engine
enum class WorkflowStatus { kStarted, kCompleted, kFailed, kCancelled };

[[nodiscard]] std::optional<WorkflowStatus> workflow_status_from_string(std::string_view text) noexcept;

struct GenerationResponse
{
    ivcu::IvcuRecord ivcu;
    std::string code;
    double cost = 0.0;
    std::vector<std::pair<std::string, std::string>> headers;
};

struct VerificationResponse
{
    ivcu::IvcuRecord ivcu;
    std::vector<ivcu::VerifierResult> results;
    std::optional<certificate::ProofCertificate> certificate;
    std::string content_hash;  ///< Set when a certificate was stored
    std::vector<std::pair<std::string, std::string>> headers;
};

template <typename T>
using GatewayResult = std::expected<T, admission::Denial>;

struct Collaborators
{
    GenerationService& generation;
    VerificationService& verification;
    EventPublisher& events;
};

class Gateway
{
public:
    Gateway(admission::AdmissionController& admission,
            breaker::Registry& breakers,
            budget::BudgetGuard& budget,
            ivcu::IvcuRegistry& ivcus,
            store::IvcuRepository& ivcu_store,
            certificate::CertificateService& certificates,
            certstore::CertStore& cert_store,
            Collaborators collaborators,
            ivcu::VerificationPolicy policy = {});

    /**
     * Admit, run generation for a draft (or interrupted generating) IVCU and
     * move it to verifying.
     */
    [[nodiscard]] GatewayResult<GenerationResponse> start_generation(
        const admission::AdmissionRequest& request,
        const std::string& ivcu_id,
        const GenerationRequest& generation);

    /**
     * Admit, run verification for a verifying IVCU, settle it as verified or
     * failed and, when verified, issue and store the certificate. Events are
     * published only once the outcome is persisted.
     */
    [[nodiscard]] GatewayResult<VerificationResponse> verify(const admission::AdmissionRequest& request,
                                                             const std::string& ivcu_id,
                                                             const std::string& intent_id,
                                                             const std::string& code,
                                                             const std::string& language,
                                                             certificate::ProofType proof_type);

    /**
     * Apply a workflow engine callback. started: draft -> generating;
     * completed: generating -> verifying; cancelled: -> deprecated;
     * failed: the unit stays in generating so it can be restarted.
     */
    [[nodiscard]] axiom::Result<ivcu::IvcuRecord> on_workflow_status(const std::string& ivcu_id,
                                                                     WorkflowStatus status);

private:
    [[nodiscard]] axiom::Result<ivcu::IvcuRecord> load(const std::string& ivcu_id);
    [[nodiscard]] axiom::VoidResult persist(const ivcu::IvcuRecord& record);
    /// Swap before for after in the registry, then persist; undone if the save fails
    [[nodiscard]] axiom::VoidResult commit(const ivcu::IvcuRecord& before, const ivcu::IvcuRecord& after);
    void rollback(const ivcu::IvcuRecord& current, const ivcu::IvcuRecord& previous);
    void publish(std::string_view subject, const nlohmann::json& payload);

    admission::AdmissionController& m_admission;
    breaker::Registry& m_breakers;
    budget::BudgetGuard& m_budget;
    ivcu::IvcuRegistry& m_ivcus;
    store::IvcuRepository& m_ivcu_store;
    certificate::CertificateService& m_certificates;
    certstore::CertStore& m_cert_store;
    Collaborators m_collaborators;
    ivcu::VerificationPolicy m_policy;
};

}  // namespace axiom::gateway
