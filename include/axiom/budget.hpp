#pragma once

/**
 * @file budget.hpp
 * @brief Per-project spend tracking and pre-flight budget checks
 */

#include "axiom/common.hpp"
#include "axiom/store.hpp"

#include <cstdint>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace axiom::budget {

/// Default budget applied when a project has no explicit limit
inline constexpr double kDefaultBudget = 10.0;

struct BudgetSettings
{
    double default_budget = kDefaultBudget;
    /// Degrade to (default_budget, zero usage) when the store cannot be read
    bool fail_open = true;
};

struct BudgetStatus
{
    bool allowed = false;
    double remaining = 0.0;
    std::string reason;
};

/**
 * @brief Typed audit payload stored with each usage log entry
 */
struct UsageDetails
{
    std::string ivcu_id;
    std::string model;
    std::string language;
    std::int64_t input_tokens = 0;
    std::int64_t output_tokens = 0;
};

[[nodiscard]] axiom::VoidResult validate(const UsageDetails& details);

/// Integer and string fields only, so the result is canonicalizable
[[nodiscard]] nlohmann::json to_json(const UsageDetails& details);

class BudgetGuard
{
public:
    BudgetGuard(store::ProjectRepository& projects,
                store::UsageLogRepository& usage_logs,
                BudgetSettings settings = {});

    /**
     * remaining = limit - usage, allowed when remaining >= estimated_cost.
     * @return NotFoundError for an unknown project; PersistenceError on a
     *         read failure when fail_open is disabled
     */
    [[nodiscard]] axiom::Result<BudgetStatus> check_budget(const std::string& project_id,
                                                           double estimated_cost);

    /**
     * Add cost to the project's usage in one statement, then append the
     * audit entry. An audit failure is logged and does not fail the call.
     */
    [[nodiscard]] axiom::VoidResult record_usage(const std::string& project_id,
                                                 const std::string& user_id,
                                                 double cost,
                                                 const std::string& operation_type,
                                                 const UsageDetails& details = {});

    [[nodiscard]] const BudgetSettings& settings() const noexcept { return m_settings; }

private:
    store::ProjectRepository& m_projects;
    store::UsageLogRepository& m_usage_logs;
    BudgetSettings m_settings;
};

}  // namespace axiom::budget
