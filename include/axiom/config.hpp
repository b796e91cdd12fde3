#pragma once

/**
 * @file config.hpp
 * @brief Gate configuration: JSON file, schema validation, environment overrides
 *
 * Environment overrides: AXIOM_JWT_SECRET, AXIOM_SIGNING_KEY, AXIOM_DATABASE_PATH.
 */

#include "axiom/budget.hpp"
#include "axiom/circuit_breaker.hpp"
#include "axiom/common.hpp"
#include "axiom/ivcu.hpp"
#include "axiom/rate_limiter.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace axiom::config {

inline constexpr std::string_view kDefaultConfigFile = "axiom.json";
inline constexpr std::string_view kDefaultDatabasePath = "axiom.db";

struct Config
{
    std::string database_path = std::string(kDefaultDatabasePath);
    std::string jwt_secret;
    std::string signing_key;
    ratelimit::RateLimitConfig default_tier = ratelimit::kDefaultTier;
    ratelimit::RateLimitConfig strict_tier = ratelimit::kStrictTier;
    std::map<std::string, breaker::BreakerConfig, std::less<>> breakers = {
        {std::string(breaker::kAiGeneration), breaker::kDefaultBreaker},
        {std::string(breaker::kFormalVerification), breaker::kDefaultBreaker},
    };
    budget::BudgetSettings budget;
    ivcu::VerificationPolicy verification;
};

using EnvLookup = std::function<std::optional<std::string>(std::string_view name)>;

/// Reads the process environment
[[nodiscard]] EnvLookup process_env();

/**
 * Overlay a schema-valid document onto the defaults.
 * @return ValidationError if a value is out of range
 */
[[nodiscard]] axiom::Result<Config> from_json(const nlohmann::json& j);

/// Apply environment overrides; empty variables are ignored
void apply_env(Config& config, const EnvLookup& env);

/// Range checks on every tier and breaker
[[nodiscard]] axiom::VoidResult validate(const Config& config);

/**
 * Load path, validate it against schema_dir/config.v1.schema.json, overlay
 * onto defaults and apply environment overrides. A missing file yields the
 * defaults.
 */
[[nodiscard]] axiom::Result<Config> load(const std::string& path,
                                         const std::string& schema_dir,
                                         const EnvLookup& env = process_env());

}  // namespace axiom::config
