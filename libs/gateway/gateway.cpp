/**
 * @file gateway.cpp
 * @brief Generation and verification request handling
 */

#include "axiom/gateway.hpp"

#include "axiom/log.hpp"

#include <format>
#include <utility>

namespace axiom::gateway {

namespace {

[[nodiscard]] nlohmann::json ivcu_event(const ivcu::IvcuRecord& record)
{
    return nlohmann::json{{"ivcu_id", record.id},
                          {"project_id", record.project_id},
                          {"version", record.version},
                          {"status", std::string(ivcu::status_name(record.status))}};
}

}  // namespace

std::optional<WorkflowStatus> workflow_status_from_string(std::string_view text) noexcept
{
    if (text == "started") {
        return WorkflowStatus::kStarted;
    }
    if (text == "completed") {
        return WorkflowStatus::kCompleted;
    }
    if (text == "failed") {
        return WorkflowStatus::kFailed;
    }
    if (text == "cancelled") {
        return WorkflowStatus::kCancelled;
    }
    return std::nullopt;
}

Gateway::Gateway(admission::AdmissionController& admission,
                 breaker::Registry& breakers,
                 budget::BudgetGuard& budget,
                 ivcu::IvcuRegistry& ivcus,
                 store::IvcuRepository& ivcu_store,
                 certificate::CertificateService& certificates,
                 certstore::CertStore& cert_store,
                 Collaborators collaborators,
                 ivcu::VerificationPolicy policy)
    : m_admission(admission)
    , m_breakers(breakers)
    , m_budget(budget)
    , m_ivcus(ivcus)
    , m_ivcu_store(ivcu_store)
    , m_certificates(certificates)
    , m_cert_store(cert_store)
    , m_collaborators(collaborators)
    , m_policy(policy)
{}

axiom::Result<ivcu::IvcuRecord> Gateway::load(const std::string& ivcu_id)
{
    auto cached = m_ivcus.get(ivcu_id);
    if (cached || !cached.error().is(errc::kNotFound)) {
        return cached;
    }
    auto stored = m_ivcu_store.load_ivcu(ivcu_id);
    if (!stored) {
        return stored;
    }
    if (auto adopted = m_ivcus.adopt(*stored); !adopted && !adopted.error().is(errc::kConflict)) {
        return std::unexpected(adopted.error());
    }
    return m_ivcus.get(ivcu_id);
}

axiom::VoidResult Gateway::persist(const ivcu::IvcuRecord& record)
{
    if (auto saved = m_ivcu_store.save_ivcu(record); !saved) {
        return std::unexpected(Error::make(errc::kPersistence,
                                           std::format("IVCU {} not persisted: {}", record.id, saved.error().message)));
    }
    return {};
}

axiom::VoidResult Gateway::commit(const ivcu::IvcuRecord& before, const ivcu::IvcuRecord& after)
{
    if (auto swapped = m_ivcus.replace(after, before.status); !swapped) {
        return swapped;
    }
    if (auto saved = persist(after); !saved) {
        rollback(after, before);
        return saved;
    }
    return {};
}

void Gateway::rollback(const ivcu::IvcuRecord& current, const ivcu::IvcuRecord& previous)
{
    if (auto restored = m_ivcus.replace(previous, current.status); !restored) {
        log::error("gateway",
                   "IVCU {} not restored to {}: {}",
                   previous.id,
                   ivcu::status_name(previous.status),
                   restored.error().message);
        return;
    }
    if (auto saved = m_ivcu_store.save_ivcu(previous); !saved) {
        log::error("gateway", "IVCU {} restored in memory only: {}", previous.id, saved.error().message);
    }
}

void Gateway::publish(std::string_view subject, const nlohmann::json& payload)
{
    if (auto published = m_collaborators.events.publish(std::string(subject), payload); !published) {
        log::error("gateway", "publish {} failed: {}", subject, published.error().message);
    }
}

GatewayResult<GenerationResponse> Gateway::start_generation(const admission::AdmissionRequest& request,
                                                            const std::string& ivcu_id,
                                                            const GenerationRequest& generation)
{
    auto admitted = m_admission.admit(admission::policies::generate(), request);
    if (!admitted) {
        return std::unexpected(std::move(admitted.error()));
    }
    breaker::CircuitBreaker* breaker = m_breakers.find(breaker::kAiGeneration);
    auto abandon = [&](const Error& error) {
        if (breaker != nullptr) {
            breaker->release_trial();
        }
        return std::unexpected(admission::denial_from_error(error));
    };

    auto record = load(ivcu_id);
    if (!record) {
        return abandon(record.error());
    }
    if (record->project_id != request.project_id) {
        return abandon(Error::make(errc::kNotFound,
                                   std::format("IVCU {} does not belong to project {}", ivcu_id, request.project_id)));
    }
    ivcu::IvcuRecord generating = *record;
    if (record->status == ivcu::Status::kDraft) {
        if (auto moved = ivcu::transition(generating, ivcu::Status::kGenerating); !moved) {
            return abandon(moved.error());
        }
        if (auto committed = commit(*record, generating); !committed) {
            return abandon(committed.error());
        }
    } else if (record->status != ivcu::Status::kGenerating) {
        return abandon(Error::make(
            errc::kValidation,
            std::format("IVCU {} is {}; generation needs a draft unit", ivcu_id, ivcu::status_name(record->status))));
    }

    auto generated = m_collaborators.generation.generate(generation);
    if (!generated) {
        if (breaker != nullptr) {
            breaker->record_failure();
        }
        log::warn("gateway", "generation for {} failed: {}", ivcu_id, generated.error().message);
        return std::unexpected(admission::denial_from_error(
            Error::make(errc::kUpstreamUnavailable, "code generation failed: " + generated.error().message)));
    }
    if (breaker != nullptr) {
        breaker->record_success();
    }

    const std::string& user_id = admitted->principal->id;
    auto recorded = m_budget.record_usage(request.project_id,
                                          user_id,
                                          generated->cost,
                                          "generation",
                                          budget::UsageDetails{.ivcu_id = ivcu_id,
                                                               .model = generated->model,
                                                               .language = generation.language,
                                                               .input_tokens = generated->input_tokens,
                                                               .output_tokens = generated->output_tokens});
    if (!recorded) {
        log::error("gateway", "usage for {} not recorded: {}", ivcu_id, recorded.error().message);
    }

    ivcu::IvcuRecord verifying = generating;
    if (auto moved = ivcu::transition(verifying, ivcu::Status::kVerifying); !moved) {
        return std::unexpected(admission::denial_from_error(moved.error()));
    }
    if (auto committed = commit(generating, verifying); !committed) {
        return std::unexpected(admission::denial_from_error(committed.error()));
    }

    nlohmann::json event = ivcu_event(verifying);
    event["language"] = generation.language;
    publish(kEventGenerated, event);

    return GenerationResponse{.ivcu = std::move(verifying),
                              .code = std::move(generated->code),
                              .cost = generated->cost,
                              .headers = admitted->headers()};
}

GatewayResult<VerificationResponse> Gateway::verify(const admission::AdmissionRequest& request,
                                                    const std::string& ivcu_id,
                                                    const std::string& intent_id,
                                                    const std::string& code,
                                                    const std::string& language,
                                                    certificate::ProofType proof_type)
{
    auto admitted = m_admission.admit(admission::policies::verify(), request);
    if (!admitted) {
        return std::unexpected(std::move(admitted.error()));
    }
    breaker::CircuitBreaker* breaker = m_breakers.find(breaker::kFormalVerification);
    auto abandon = [&](const Error& error) {
        if (breaker != nullptr) {
            breaker->release_trial();
        }
        return std::unexpected(admission::denial_from_error(error));
    };

    auto record = load(ivcu_id);
    if (!record) {
        return abandon(record.error());
    }
    if (record->project_id != request.project_id) {
        return abandon(Error::make(errc::kNotFound,
                                   std::format("IVCU {} does not belong to project {}", ivcu_id, request.project_id)));
    }
    if (record->status != ivcu::Status::kVerifying) {
        return abandon(Error::make(
            errc::kValidation,
            std::format("IVCU {} is {}; verification needs a verifying unit", ivcu_id, ivcu::status_name(record->status))));
    }

    auto report = m_collaborators.verification.verify(code, language);
    if (!report) {
        if (breaker != nullptr) {
            breaker->record_failure();
        }
        log::warn("gateway", "verification for {} failed: {}", ivcu_id, report.error().message);
        return std::unexpected(admission::denial_from_error(
            Error::make(errc::kUpstreamUnavailable, "formal verification failed: " + report.error().message)));
    }
    if (breaker != nullptr) {
        breaker->record_success();
    }

    auto recorded = m_budget.record_usage(request.project_id,
                                          admitted->principal->id,
                                          report->cost,
                                          "verification",
                                          budget::UsageDetails{.ivcu_id = ivcu_id, .language = language});
    if (!recorded) {
        log::error("gateway", "usage for {} not recorded: {}", ivcu_id, recorded.error().message);
    }

    ivcu::IvcuRecord settled = *record;
    if (auto outcome = ivcu::complete_verification(settled, report->results, m_policy); !outcome) {
        return std::unexpected(admission::denial_from_error(outcome.error()));
    }

    VerificationResponse response{.ivcu = settled,
                                  .results = report->results,
                                  .certificate = std::nullopt,
                                  .content_hash = {},
                                  .headers = admitted->headers()};

    if (settled.status == ivcu::Status::kFailed) {
        if (auto committed = commit(*record, settled); !committed) {
            return std::unexpected(admission::denial_from_error(committed.error()));
        }
        publish(kEventFailed, ivcu_event(settled));
        return response;
    }

    // Until the certificate is stored the unit stays verifying, so a failed
    // attempt can be verified again.
    auto cert = m_certificates.generate_certificate(
        settled,
        intent_id,
        code,
        proof_type,
        report->results,
        certificate::Attachments{.assertions = report->assertions, .proof_data = report->proof_data});
    if (!cert) {
        return std::unexpected(admission::denial_from_error(cert.error()));
    }
    if (auto committed = commit(*record, settled); !committed) {
        return std::unexpected(admission::denial_from_error(committed.error()));
    }
    auto content_hash = m_cert_store.put(*cert);
    if (!content_hash) {
        rollback(settled, *record);
        return std::unexpected(admission::denial_from_error(content_hash.error()));
    }

    publish(kEventVerified, ivcu_event(settled));
    log::info("gateway",
              "certificate {} issued for {} ({})",
              cert->id,
              ivcu_id,
              certificate::proof_type_name(proof_type));
    publish(kEventCertificateIssued,
            nlohmann::json{{"certificate_id", cert->id},
                           {"ivcu_id", ivcu_id},
                           {"proof_type", std::string(certificate::proof_type_name(proof_type))},
                           {"hash_chain", cert->hash_chain},
                           {"content_hash", *content_hash}});

    response.certificate = std::move(*cert);
    response.content_hash = std::move(*content_hash);
    return response;
}

axiom::Result<ivcu::IvcuRecord> Gateway::on_workflow_status(const std::string& ivcu_id, WorkflowStatus status)
{
    auto record = load(ivcu_id);
    if (!record) {
        return record;
    }

    std::optional<ivcu::Status> target;
    switch (status) {
        case WorkflowStatus::kStarted:
            if (record->status != ivcu::Status::kGenerating) {
                target = ivcu::Status::kGenerating;
            }
            break;
        case WorkflowStatus::kCompleted:
            target = ivcu::Status::kVerifying;
            break;
        case WorkflowStatus::kCancelled:
            target = ivcu::Status::kDeprecated;
            break;
        case WorkflowStatus::kFailed:
            log::warn("gateway",
                      "workflow for {} failed; unit stays {}",
                      ivcu_id,
                      ivcu::status_name(record->status));
            break;
    }
    if (!target) {
        return record;
    }

    ivcu::IvcuRecord moved = *record;
    if (auto result = ivcu::transition(moved, *target); !result) {
        return std::unexpected(result.error());
    }
    if (auto committed = commit(*record, moved); !committed) {
        return std::unexpected(committed.error());
    }
    return moved;
}

}  // namespace axiom::gateway
