/**
 * @file budget_guard.cpp
 * @brief BudgetGuard implementation
 */

#include "axiom/budget.hpp"

#include "axiom/canonical_json.hpp"
#include "axiom/log.hpp"

#include <cmath>
#include <format>

#include <nlohmann/json.hpp>

namespace axiom::budget {

namespace {

[[nodiscard]] bool valid_cost(double cost) noexcept
{
    return std::isfinite(cost) && cost >= 0.0;
}

}  // namespace

axiom::VoidResult validate(const UsageDetails& details)
{
    if (details.input_tokens < 0 || details.output_tokens < 0) {
        return std::unexpected(
            Error::make(errc::kValidation, "usage token counts must not be negative"));
    }
    return {};
}

nlohmann::json to_json(const UsageDetails& details)
{
    nlohmann::json j = nlohmann::json::object();
    if (!details.ivcu_id.empty()) {
        j["ivcu_id"] = details.ivcu_id;
    }
    if (!details.model.empty()) {
        j["model"] = details.model;
    }
    if (!details.language.empty()) {
        j["language"] = details.language;
    }
    j["input_tokens"] = details.input_tokens;
    j["output_tokens"] = details.output_tokens;
    return j;
}

BudgetGuard::BudgetGuard(store::ProjectRepository& projects,
                         store::UsageLogRepository& usage_logs,
                         BudgetSettings settings)
    : m_projects(projects)
    , m_usage_logs(usage_logs)
    , m_settings(settings)
{}

axiom::Result<BudgetStatus> BudgetGuard::check_budget(const std::string& project_id,
                                                      double estimated_cost)
{
    if (!valid_cost(estimated_cost)) {
        return std::unexpected(Error::make(
            errc::kValidation, std::format("estimated cost {} is not a valid amount", estimated_cost)));
    }

    double limit = m_settings.default_budget;
    double usage = 0.0;
    auto row = m_projects.read_budget(project_id);
    if (!row) {
        if (row.error().is(errc::kNotFound) || !m_settings.fail_open) {
            return std::unexpected(row.error());
        }
        log::warn("budget",
                  "budget read failed for project {}, using default {}: {}",
                  project_id,
                  m_settings.default_budget,
                  row.error().message);
    } else {
        limit = row->budget_limit.value_or(m_settings.default_budget);
        usage = row->current_usage;
    }

    const double remaining = limit - usage;
    if (remaining < estimated_cost) {
        return BudgetStatus{
            .allowed = false,
            .remaining = remaining,
            .reason = std::format("Insufficient budget. Remaining: ${:.2f}, Required: ${:.2f}",
                                  remaining,
                                  estimated_cost)};
    }
    return BudgetStatus{.allowed = true, .remaining = remaining, .reason = "Budget available"};
}

axiom::VoidResult BudgetGuard::record_usage(const std::string& project_id,
                                            const std::string& user_id,
                                            double cost,
                                            const std::string& operation_type,
                                            const UsageDetails& details)
{
    if (!valid_cost(cost)) {
        return std::unexpected(Error::make(
            errc::kValidation, std::format("usage cost {} is not a valid amount", cost)));
    }
    if (auto valid = validate(details); !valid) {
        return valid;
    }

    if (auto updated = m_projects.increment_usage(project_id, cost); !updated) {
        return updated;
    }

    auto details_json = canonical::canonicalize(to_json(details));
    if (!details_json) {
        log::error("budget", "usage details for {} not recorded: {}", project_id, details_json.error().message);
        return {};
    }
    auto logged = m_usage_logs.append_usage_log(store::UsageLogEntry{.project_id = project_id,
                                                                     .user_id = user_id,
                                                                     .cost = cost,
                                                                     .operation_type = operation_type,
                                                                     .details_json = *details_json});
    if (!logged) {
        log::error("budget",
                   "usage log append failed for project {} ({} {}): {}",
                   project_id,
                   operation_type,
                   cost,
                   logged.error().message);
    }
    return {};
}

}  // namespace axiom::budget
