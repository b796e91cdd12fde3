/**
 * @file admission_controller.cpp
 * @brief Gate ordering, denial mapping and built-in operation policies
 */

#include "axiom/admission.hpp"

#include "axiom/log.hpp"

#include <array>
#include <format>

namespace axiom::admission {

namespace policies {

OperationPolicy generate()
{
    return OperationPolicy{.name = "generate",
                           .requires_authentication = true,
                           .permission = rbac::Permission::kProjectEdit,
                           .tier = ratelimit::Tier::kStrict,
                           .dependency = std::string(breaker::kAiGeneration),
                           .incurs_cost = true};
}

OperationPolicy verify()
{
    return OperationPolicy{.name = "verify",
                           .requires_authentication = true,
                           .permission = rbac::Permission::kProjectEdit,
                           .tier = ratelimit::Tier::kStrict,
                           .dependency = std::string(breaker::kFormalVerification),
                           .incurs_cost = true};
}

OperationPolicy read_project()
{
    return OperationPolicy{.name = "read_project",
                           .requires_authentication = true,
                           .permission = rbac::Permission::kProjectRead,
                           .tier = ratelimit::Tier::kDefault,
                           .dependency = std::nullopt,
                           .incurs_cost = false};
}

OperationPolicy approve_budget()
{
    return OperationPolicy{.name = "approve_budget",
                           .requires_authentication = true,
                           .permission = rbac::Permission::kBudgetApprove,
                           .tier = ratelimit::Tier::kDefault,
                           .dependency = std::nullopt,
                           .incurs_cost = false};
}

OperationPolicy health()
{
    return OperationPolicy{.name = "health",
                           .requires_authentication = false,
                           .permission = std::nullopt,
                           .tier = ratelimit::Tier::kDefault,
                           .dependency = std::nullopt,
                           .incurs_cost = false};
}

std::optional<OperationPolicy> find(std::string_view name)
{
    for (auto* make : {&generate, &verify, &read_project, &approve_budget, &health}) {
        OperationPolicy policy = make();
        if (policy.name == name) {
            return policy;
        }
    }
    return std::nullopt;
}

}  // namespace policies

namespace {

[[nodiscard]] Denial deny(DenialKind kind, std::string message, std::string details = {})
{
    return Denial{.kind = kind,
                  .message = std::move(message),
                  .details = std::move(details),
                  .retry_after = std::nullopt,
                  .rate = std::nullopt};
}

}  // namespace

Denial denial_from_error(const Error& error)
{
    if (error.is(errc::kNotFound)) {
        return deny(DenialKind::kNotFound, "resource not found", error.message);
    }
    if (error.is(errc::kValidation)) {
        return deny(DenialKind::kBadRequest, "invalid request", error.message);
    }
    if (error.is(errc::kConflict)) {
        return deny(DenialKind::kConflict, "conflict", error.message);
    }
    if (error.is(errc::kUpstreamUnavailable)) {
        return deny(DenialKind::kUpstreamUnavailable, "upstream service unavailable", error.message);
    }
    return deny(DenialKind::kInternal, "internal error", error.message);
}

std::string_view Denial::code() const noexcept
{
    switch (kind) {
        case DenialKind::kBadRequest:
            return "BAD_REQUEST";
        case DenialKind::kUnauthorized:
            return "UNAUTHORIZED";
        case DenialKind::kForbidden:
            return "FORBIDDEN";
        case DenialKind::kNotFound:
            return "NOT_FOUND";
        case DenialKind::kRateLimited:
            return "RATE_LIMITED";
        case DenialKind::kCircuitOpen:
            return "CIRCUIT_OPEN";
        case DenialKind::kBudgetExceeded:
            return "BUDGET_EXCEEDED";
        case DenialKind::kConflict:
            return "CONFLICT";
        case DenialKind::kUpstreamUnavailable:
            return "UPSTREAM_UNAVAILABLE";
        case DenialKind::kInternal:
            return "INTERNAL_ERROR";
    }
    return "INTERNAL_ERROR";
}

int Denial::http_status() const noexcept
{
    switch (kind) {
        case DenialKind::kBadRequest:
            return 400;
        case DenialKind::kUnauthorized:
            return 401;
        case DenialKind::kBudgetExceeded:
            return 402;
        case DenialKind::kForbidden:
            return 403;
        case DenialKind::kNotFound:
            return 404;
        case DenialKind::kConflict:
            return 409;
        case DenialKind::kRateLimited:
            return 429;
        case DenialKind::kCircuitOpen:
        case DenialKind::kUpstreamUnavailable:
            return 503;
        case DenialKind::kInternal:
            return 500;
    }
    return 500;
}

nlohmann::json Denial::to_envelope() const
{
    nlohmann::json error = {{"code", std::string(code())}, {"message", message}};
    if (!details.empty()) {
        error["details"] = details;
    }
    if (retry_after && retry_after->count() > 0) {
        error["retry_after_ms"] = retry_after->count();
    }
    return nlohmann::json{{"error", std::move(error)}};
}

std::vector<std::pair<std::string, std::string>> Admission::headers() const
{
    if (!rate) {
        return {};
    }
    return ratelimit::response_headers(*rate);
}

AdmissionController::AdmissionController(auth::Authenticator& authenticator,
                                         rbac::Authorizer& authorizer,
                                         ratelimit::RateLimiter& default_limiter,
                                         ratelimit::RateLimiter& strict_limiter,
                                         breaker::Registry& breakers,
                                         budget::BudgetGuard& budget)
    : m_authenticator(authenticator)
    , m_authorizer(authorizer)
    , m_default_limiter(default_limiter)
    , m_strict_limiter(strict_limiter)
    , m_breakers(breakers)
    , m_budget(budget)
{}

ratelimit::RateLimiter& AdmissionController::limiter_for(ratelimit::Tier tier) noexcept
{
    return tier == ratelimit::Tier::kStrict ? m_strict_limiter : m_default_limiter;
}

AdmissionResult AdmissionController::admit(const OperationPolicy& policy,
                                           const AdmissionRequest& request)
{
    auto denied = [&](Denial denial) -> AdmissionResult {
        log::info("admission",
                  "{} denied: {} {}{}",
                  policy.name,
                  denial.code(),
                  denial.message,
                  denial.details.empty() ? std::string{} : " (" + denial.details + ")");
        return std::unexpected(std::move(denial));
    };

    Admission admission;

    // 1. Authenticate
    if (policy.requires_authentication) {
        auto principal = m_authenticator.authenticate(request.authorization);
        if (!principal) {
            return denied(deny(DenialKind::kUnauthorized, principal.error().message));
        }
        admission.principal = std::move(*principal);
    }

    // 2. Authorize (project-scoped operations)
    if (policy.permission) {
        if (!admission.principal) {
            return denied(deny(DenialKind::kUnauthorized, "Authorization header required"));
        }
        if (request.project_id.empty()) {
            return denied(deny(DenialKind::kBadRequest, "project id required"));
        }
        auto role = m_authorizer.authorize(*admission.principal, request.project_id, *policy.permission);
        if (!role) {
            if (role.error().is(errc::kAuthorization)) {
                return denied(deny(DenialKind::kForbidden, "insufficient permissions", role.error().message));
            }
            return denied(denial_from_error(role.error()));
        }
        admission.role = *role;
    }

    // 3. Rate limit, keyed by principal or source address
    const std::string rate_key =
        admission.principal ? admission.principal->id : "addr:" + request.source_address;
    const ratelimit::RateDecision rate = limiter_for(policy.tier).check(rate_key);
    admission.rate = rate;
    if (!rate.allowed) {
        Denial denial = deny(DenialKind::kRateLimited,
                             "Rate limit exceeded. Please try again later.",
                             std::format("{} tier", ratelimit::tier_name(policy.tier)));
        denial.retry_after = rate.retry_after;
        denial.rate = rate;
        return denied(std::move(denial));
    }

    // 4. Circuit breaker (downstream-calling operations)
    breaker::CircuitBreaker* breaker = nullptr;
    if (policy.dependency) {
        breaker = m_breakers.find(*policy.dependency);
        if (breaker == nullptr) {
            return denied(deny(DenialKind::kInternal,
                               "internal error",
                               "no circuit breaker registered for " + *policy.dependency));
        }
        if (!breaker->allow()) {
            Denial denial = deny(DenialKind::kCircuitOpen,
                                 "Service temporarily unavailable. Please try again later.",
                                 *policy.dependency);
            denial.retry_after = breaker->retry_after();
            denial.rate = rate;
            return denied(std::move(denial));
        }
    }

    // 5. Budget (cost-incurring operations)
    if (policy.incurs_cost) {
        auto release = [breaker] {
            if (breaker != nullptr) {
                breaker->release_trial();
            }
        };
        if (request.project_id.empty()) {
            release();
            return denied(deny(DenialKind::kBadRequest, "project id required"));
        }
        auto status = m_budget.check_budget(request.project_id, request.estimated_cost);
        if (!status) {
            release();
            return denied(denial_from_error(status.error()));
        }
        if (!status->allowed) {
            release();
            Denial denial = deny(DenialKind::kBudgetExceeded, "budget exceeded", status->reason);
            denial.rate = rate;
            return denied(std::move(denial));
        }
        admission.budget = std::move(*status);
    }

    return admission;
}

}  // namespace axiom::admission
