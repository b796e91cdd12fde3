/**
 * @file config.cpp
 * @brief Configuration loading
 */

#include "axiom/config.hpp"

#include "axiom/schema_validate.hpp"
#include "axiom/version.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>

namespace axiom::config {

namespace {

namespace fs = std::filesystem;

[[nodiscard]] ratelimit::RateLimitConfig tier_from_json(const nlohmann::json& j)
{
    return ratelimit::RateLimitConfig{
        .max_tokens = j.at("max_tokens").get<int>(),
        .refill_rate = j.at("refill_rate").get<int>(),
        .refill_period = std::chrono::milliseconds{j.at("refill_period_ms").get<std::int64_t>()}};
}

void overlay_breaker(breaker::BreakerConfig& cfg, const nlohmann::json& j)
{
    cfg.failure_threshold = j.value("failure_threshold", cfg.failure_threshold);
    cfg.success_threshold = j.value("success_threshold", cfg.success_threshold);
    if (j.contains("timeout_ms")) {
        cfg.timeout = std::chrono::milliseconds{j.at("timeout_ms").get<std::int64_t>()};
    }
    cfg.max_half_open_trials = j.value("max_half_open_trials", cfg.max_half_open_trials);
}

}  // namespace

EnvLookup process_env()
{
    return [](std::string_view name) -> std::optional<std::string> {
        const char* value = std::getenv(std::string(name).c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

axiom::Result<Config> from_json(const nlohmann::json& j)
{
    Config config;
    try {
        config.database_path = j.value("database_path", config.database_path);
        config.jwt_secret = j.value("jwt_secret", config.jwt_secret);
        config.signing_key = j.value("signing_key", config.signing_key);

        if (auto it = j.find("rate_limits"); it != j.end()) {
            if (it->contains("default")) {
                config.default_tier = tier_from_json(it->at("default"));
            }
            if (it->contains("strict")) {
                config.strict_tier = tier_from_json(it->at("strict"));
            }
        }
        if (auto it = j.find("breakers"); it != j.end()) {
            for (const auto& [name, value] : it->items()) {
                auto [entry, _] = config.breakers.try_emplace(name, breaker::kDefaultBreaker);
                overlay_breaker(entry->second, value);
            }
        }
        if (auto it = j.find("budget"); it != j.end()) {
            config.budget.default_budget = it->value("default_budget", config.budget.default_budget);
            config.budget.fail_open = it->value("fail_open", config.budget.fail_open);
        }
        if (auto it = j.find("verification"); it != j.end()) {
            config.verification.confidence_threshold =
                it->value("confidence_threshold", config.verification.confidence_threshold);
        }
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(
            Error::make(errc::kValidation, std::format("Invalid configuration: {}", ex.what())));
    }

    if (auto result = validate(config); !result) {
        return std::unexpected(result.error());
    }
    return config;
}

void apply_env(Config& config, const EnvLookup& env)
{
    auto override_with = [&env](std::string_view name, std::string& target) {
        if (auto value = env(name); value && !value->empty()) {
            target = std::move(*value);
        }
    };
    override_with("AXIOM_JWT_SECRET", config.jwt_secret);
    override_with("AXIOM_SIGNING_KEY", config.signing_key);
    override_with("AXIOM_DATABASE_PATH", config.database_path);
}

axiom::VoidResult validate(const Config& config)
{
    if (auto result = ratelimit::validate(config.default_tier); !result) {
        return std::unexpected(Error::make(errc::kValidation, "rate_limits.default: " + result.error().message));
    }
    if (auto result = ratelimit::validate(config.strict_tier); !result) {
        return std::unexpected(Error::make(errc::kValidation, "rate_limits.strict: " + result.error().message));
    }
    for (const auto& [name, cfg] : config.breakers) {
        if (auto result = breaker::validate(cfg); !result) {
            return std::unexpected(
                Error::make(errc::kValidation, std::format("breakers.{}: {}", name, result.error().message)));
        }
    }
    if (!(config.budget.default_budget >= 0.0)) {
        return std::unexpected(Error::make(errc::kValidation, "budget.default_budget must not be negative"));
    }
    const double threshold = config.verification.confidence_threshold;
    if (!(threshold >= 0.0 && threshold <= 1.0)) {
        return std::unexpected(
            Error::make(errc::kValidation, "verification.confidence_threshold must lie in [0, 1]"));
    }
    return {};
}

axiom::Result<Config> load(const std::string& path, const std::string& schema_dir, const EnvLookup& env)
{
    Config config;
    std::error_code ec;
    if (fs::exists(path, ec)) {
        std::ifstream in(path);
        if (!in) {
            return std::unexpected(Error::make(errc::kIO, "Failed to open config file: " + path));
        }
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(in);
        } catch (const nlohmann::json::exception& ex) {
            return std::unexpected(
                Error::make(errc::kParse, std::format("Failed to parse config {}: {}", path, ex.what())));
        }
        const auto schema_path = (fs::path(schema_dir) / (std::string(kConfigSchemaVersion) + ".schema.json")).string();
        if (auto result = common::validate_json(j, schema_path); !result) {
            return std::unexpected(Error::make(result.error().code,
                                               "Config schema validation failed: " + result.error().message));
        }
        auto parsed = from_json(j);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        config = std::move(*parsed);
    }
    apply_env(config, env);
    return config;
}

}  // namespace axiom::config
