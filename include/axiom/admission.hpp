#pragma once

/**
 * @file admission.hpp
 * @brief Ordered admission pipeline in front of costly operations
 *
 * Gate order: authenticate -> authorize -> rate limit -> circuit breaker -> budget.
 * The first denial short-circuits; later gates are not consulted. Admission
 * never records usage or breaker outcomes.
 */

#include "axiom/auth.hpp"
#include "axiom/budget.hpp"
#include "axiom/circuit_breaker.hpp"
#include "axiom/common.hpp"
#include "axiom/rate_limiter.hpp"
#include "axiom/rbac.hpp"

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace axiom::admission {

/**
 * @brief Which gates apply to an operation
 */
struct OperationPolicy
{
    std::string name;
    bool requires_authentication = true;
    std::optional<rbac::Permission> permission;  ///< Set for project-scoped operations
    ratelimit::Tier tier = ratelimit::Tier::kDefault;
    std::optional<std::string> dependency;  ///< Breaker consulted for downstream calls
    bool incurs_cost = false;
};

namespace policies {
[[nodiscard]] OperationPolicy generate();
[[nodiscard]] OperationPolicy verify();
[[nodiscard]] OperationPolicy read_project();
[[nodiscard]] OperationPolicy approve_budget();
[[nodiscard]] OperationPolicy health();

/// Built-in policy by name ("generate", "verify", ...)
[[nodiscard]] std::optional<OperationPolicy> find(std::string_view name);
}  // namespace policies

struct AdmissionRequest
{
    std::string authorization;   ///< Authorization header value, may be empty
    std::string source_address;  ///< Rate-limit key when unauthenticated
    std::string project_id;
    double estimated_cost = 0.0;
};

enum class DenialKind {
    kBadRequest,
    kUnauthorized,
    kForbidden,
    kNotFound,
    kRateLimited,
    kCircuitOpen,
    kBudgetExceeded,
    kConflict,
    kUpstreamUnavailable,
    kInternal,
};

/**
 * @brief Structured reason for refusing a request
 */
struct Denial
{
    DenialKind kind;
    std::string message;
    std::string details;
    std::optional<std::chrono::milliseconds> retry_after;
    std::optional<ratelimit::RateDecision> rate;  ///< Set once the rate gate ran

    /// "UNAUTHORIZED", "FORBIDDEN", "RATE_LIMITED", ...
    [[nodiscard]] std::string_view code() const noexcept;
    [[nodiscard]] int http_status() const noexcept;

    /// {"error": {"code", "message", "details"?, "retry_after_ms"?}}
    [[nodiscard]] nlohmann::json to_envelope() const;
};

/// Outcome of a successful admission
struct Admission
{
    std::optional<auth::Principal> principal;
    std::optional<rbac::Role> role;
    std::optional<ratelimit::RateDecision> rate;
    std::optional<budget::BudgetStatus> budget;

    [[nodiscard]] std::vector<std::pair<std::string, std::string>> headers() const;
};

using AdmissionResult = std::expected<Admission, Denial>;

/**
 * Denial for an error raised by a gate's backing store or after admission:
 * NotFoundError -> NOT_FOUND, ValidationError -> BAD_REQUEST,
 * ConflictError -> CONFLICT, UpstreamUnavailable -> UPSTREAM_UNAVAILABLE,
 * anything else -> INTERNAL_ERROR.
 */
[[nodiscard]] Denial denial_from_error(const Error& error);

class AdmissionController
{
public:
    AdmissionController(auth::Authenticator& authenticator,
                        rbac::Authorizer& authorizer,
                        ratelimit::RateLimiter& default_limiter,
                        ratelimit::RateLimiter& strict_limiter,
                        breaker::Registry& breakers,
                        budget::BudgetGuard& budget);

    [[nodiscard]] AdmissionResult admit(const OperationPolicy& policy,
                                        const AdmissionRequest& request);

private:
    [[nodiscard]] ratelimit::RateLimiter& limiter_for(ratelimit::Tier tier) noexcept;

    auth::Authenticator& m_authenticator;
    rbac::Authorizer& m_authorizer;
    ratelimit::RateLimiter& m_default_limiter;
    ratelimit::RateLimiter& m_strict_limiter;
    breaker::Registry& m_breakers;
    budget::BudgetGuard& m_budget;
};

}  // namespace axiom::admission
