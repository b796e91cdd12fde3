/**
 * @file main.cpp
 * @brief Axiom gate CLI entry point
 *
 * Commands:
 *   init-db       - Create the relational store
 *   add-project   - Register a project with an owner and optional budget
 *   add-member    - Grant a project role to a user
 *   issue-token   - Mint a bearer credential
 *   admit         - Run the admission pipeline for one request
 *   check-budget  - Pre-flight budget check
 *   record-usage  - Record spend against a project
 *   issue-cert    - Drive an IVCU through verification and issue its certificate
 *   verify-cert   - Re-derive and check a stored or exported certificate
 *   version       - Show version information
 */

#include "axiom/admission.hpp"
#include "axiom/auth.hpp"
#include "axiom/budget.hpp"
#include "axiom/certificate.hpp"
#include "axiom/certstore.hpp"
#include "axiom/circuit_breaker.hpp"
#include "axiom/common.hpp"
#include "axiom/config.hpp"
#include "axiom/ivcu.hpp"
#include "axiom/log.hpp"
#include "axiom/rate_limiter.hpp"
#include "axiom/rbac.hpp"
#include "axiom/store.hpp"
#include "axiom/version.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <exception>
#include <format>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitDenied = 2;             ///< Admission denied or verification failed
constexpr int kExitIntegrityViolation = 3;  ///< Certificate tampered with or forged

void print_version()
{
    std::println("axiom {} ({})", axiom::kVersion, axiom::kBuildId);
    std::println("  certificate: {}", axiom::kCertificateSchemaVersion);
    std::println("  verifier:    {}", axiom::certificate::kVerifierVersion);
    std::println("  config:      {}", axiom::kConfigSchemaVersion);
}

void print_help()
{
    std::print(R"(Axiom - admission gate and proof certificates for verified code units

Usage: axiom <command> [options]

Commands:
  init-db       Create the relational store
  add-project   Register a project
  add-member    Grant a project role to a user
  issue-token   Mint a bearer credential
  admit         Run the admission pipeline for one request
  check-budget  Pre-flight budget check for a project
  record-usage  Record spend against a project
  issue-cert    Verify a code unit and issue its proof certificate
  verify-cert   Check a stored or exported certificate
  version       Show version information

Common Options:
  --config FILE       Configuration file (default: axiom.json)
  --schema-dir DIR    Path to schema directory (default: ./schemas)
  --db FILE           Database path (overrides configuration)
  --verbose           Log debug messages
  --help, -h          Show this help message

Exit status:
  0  success
  1  error
  2  request denied, or verification failed
  3  integrity violation: a certificate was tampered with or forged

Run 'axiom <command> --help' for command-specific options.
)");
}

void print_init_db_help()
{
    std::print(R"(Usage: axiom init-db [common options]

Create every table and index of the relational store if missing.
)");
}

void print_add_project_help()
{
    std::print(R"(Usage: axiom add-project [options]

Options:
  --id ID                   Project id (required)
  --owner USER              Owner user id (required)
  --name NAME               Display name (default: the id)
  --budget AMOUNT           Budget limit (default: configured default)
)");
}

void print_add_member_help()
{
    std::print(R"(Usage: axiom add-member [options]

Options:
  --project ID              Project id (required)
  --user USER               User id (required)
  --role ROLE               viewer|editor|admin|owner (required)
)");
}

void print_issue_token_help()
{
    std::print(R"(Usage: axiom issue-token [options]

Options:
  --user USER               Subject user id (required)
  --email EMAIL             Email claim
  --role ROLE               Role claim
  --ttl SECONDS             Lifetime (default: 3600)
)");
}

void print_admit_help()
{
    std::print(R"(Usage: axiom admit [options]

Options:
  --operation NAME          generate|verify|read_project|approve_budget|health (required)
  --token TOKEN             Bearer credential
  --project ID              Project id
  --cost AMOUNT             Estimated cost (default: 0)
  --source ADDR             Source address (default: 127.0.0.1)

Output:
  Response headers on admission, the error envelope on denial
)");
}

void print_check_budget_help()
{
    std::print(R"(Usage: axiom check-budget [options]

Options:
  --project ID              Project id (required)
  --cost AMOUNT             Estimated cost (required)
)");
}

void print_record_usage_help()
{
    std::print(R"(Usage: axiom record-usage [options]

Options:
  --project ID              Project id (required)
  --user USER               User id (required)
  --cost AMOUNT             Actual cost (required)
  --operation TYPE          Operation type, e.g. generation (required)
)");
}

void print_issue_cert_help()
{
    std::print(R"(Usage: axiom issue-cert [options]

Options:
  --project ID              Project id (required)
  --intent ID               Intent id (required)
  --code FILE               Source file under verification (required)
  --proof-type TYPE         type_safety|memory_safety|contract_compliance|property_based
                            (default: type_safety)
  --verifier SPEC           name:passed:confidence, repeatable (at least one)
  --output FILE, -o         Also export the certificate to FILE
)");
}

void print_verify_cert_help()
{
    std::print(R"(Usage: axiom verify-cert [options]

Options:
  --id ID                   Certificate id in the store
  --file FILE               Exported certificate file
  --code FILE               Also check the certificate attests this source

Exits with 3 when the certificate fails its integrity checks.
)");
}

struct CommonOptions
{
    std::string config_path;
    std::string schema_dir;
    std::optional<std::string> db_path;
    bool verbose;
    bool show_help;
};

/// Options of one subcommand: common options plus its named values
struct CommandOptions
{
    CommonOptions common;
    std::map<std::string, std::string, std::less<>> values;
    std::vector<std::string> verifiers;
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> axiom::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            axiom::Error::make("MissingArgument",
                               std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] axiom::Result<double> parse_amount(std::string_view option, std::string_view value)
{
    double parsed = 0.0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end) {
        return std::unexpected(axiom::Error::make(
            "InvalidArgument", std::format("Invalid {} value: {}", option, value)));
    }
    return parsed;
}

[[nodiscard]] axiom::Result<long long> parse_integer(std::string_view option, std::string_view value)
{
    long long parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end) {
        return std::unexpected(axiom::Error::make(
            "InvalidArgument", std::format("Invalid {} value: {}", option, value)));
    }
    return parsed;
}

/**
 * Parse subcommand arguments. Every option in allowed takes one value;
 * "--verifier" may repeat.
 */
[[nodiscard]] axiom::Result<CommandOptions> parse_command_args(std::span<char*> args,
                                                               std::span<const std::string_view> allowed)
{
    CommandOptions options{.common = CommonOptions{.config_path = std::string(axiom::config::kDefaultConfigFile),
                                                   .schema_dir = "schemas",
                                                   .db_path = std::nullopt,
                                                   .verbose = false,
                                                   .show_help = false},
                           .values = {},
                           .verifiers = {}};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.common.show_help = true;
            continue;
        }
        if (arg == "--verbose") {
            options.common.verbose = true;
            continue;
        }
        if (arg == "--config" || arg == "--schema-dir" || arg == "--db") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            if (arg == "--config") {
                options.common.config_path = *value;
            } else if (arg == "--schema-dir") {
                options.common.schema_dir = *value;
            } else {
                options.common.db_path = *value;
            }
            skip_next = true;
            continue;
        }
        std::string_view name = arg == "-o" ? std::string_view{"--output"} : arg;
        if (std::ranges::find(allowed, name) == allowed.end()) {
            return std::unexpected(
                axiom::Error::make("InvalidArgument", "Unknown option: " + std::string(arg)));
        }
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        if (name == "--verifier") {
            options.verifiers.push_back(*value);
        } else {
            options.values[std::string(name)] = *value;
        }
        skip_next = true;
    }
    return options;
}

[[nodiscard]] std::optional<std::string> option(const CommandOptions& options, std::string_view name)
{
    auto it = options.values.find(name);
    if (it == options.values.end()) {
        return std::nullopt;
    }
    return it->second;
}

[[nodiscard]] axiom::Result<std::string> read_text_file(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::unexpected(axiom::Error::make(axiom::errc::kIO, "Failed to open file for read: " + path));
    }
    return std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
}

/**
 * "name:passed:confidence", e.g. "mypy:true:0.95". Tier follows position.
 */
[[nodiscard]] axiom::Result<axiom::ivcu::VerifierResult> parse_verifier(std::string_view spec, int tier)
{
    const auto first = spec.find(':');
    const auto last = spec.rfind(':');
    if (first == std::string_view::npos || first == last || first == 0) {
        return std::unexpected(axiom::Error::make(
            "InvalidArgument", std::format("Invalid --verifier value (name:passed:confidence): {}", spec)));
    }
    const std::string_view passed = spec.substr(first + 1, last - first - 1);
    if (passed != "true" && passed != "false") {
        return std::unexpected(axiom::Error::make(
            "InvalidArgument", std::format("Invalid verifier outcome '{}': expected true or false", passed)));
    }
    auto confidence = parse_amount("--verifier", spec.substr(last + 1));
    if (!confidence) {
        return std::unexpected(confidence.error());
    }
    return axiom::ivcu::VerifierResult{.name = std::string(spec.substr(0, first)),
                                       .tier = tier,
                                       .passed = passed == "true",
                                       .confidence = *confidence};
}

/// Loaded configuration and the opened, migrated store
struct Context
{
    axiom::config::Config config;
    std::unique_ptr<axiom::store::SqliteStore> store;
};

[[nodiscard]] axiom::Result<axiom::config::Config> load_config(const CommonOptions& common)
{
    if (common.verbose) {
        axiom::log::set_min_level(axiom::log::Level::kDebug);
    }
    auto config = axiom::config::load(common.config_path, common.schema_dir);
    if (!config) {
        return std::unexpected(config.error());
    }
    if (common.db_path) {
        config->database_path = *common.db_path;
    }
    return config;
}

[[nodiscard]] axiom::Result<Context> open_context(const CommonOptions& common)
{
    auto config = load_config(common);
    if (!config) {
        return std::unexpected(config.error());
    }
    auto store = axiom::store::SqliteStore::open(config->database_path);
    if (!store) {
        return std::unexpected(store.error());
    }
    if (auto migrated = (*store)->migrate(); !migrated) {
        return std::unexpected(migrated.error());
    }
    return Context{.config = std::move(*config), .store = std::move(*store)};
}

[[nodiscard]] int fail(const axiom::Error& error)
{
    std::println(stderr, "Error: {} ({})", error.message, error.code);
    return error.is(axiom::errc::kIntegrityViolation) ? kExitIntegrityViolation : kExitFailure;
}

[[nodiscard]] int run_init_db(const CommandOptions& options)
{
    auto ctx = open_context(options.common);
    if (!ctx) {
        return fail(ctx.error());
    }
    std::println("Initialized store: {}", ctx->config.database_path);
    return 0;
}

[[nodiscard]] int run_add_project(const CommandOptions& options)
{
    const auto id = option(options, "--id");
    const auto owner = option(options, "--owner");
    if (!id || !owner) {
        std::println(stderr, "Error: --id and --owner are required");
        print_add_project_help();
        return 1;
    }
    std::optional<double> budget_limit;
    if (auto text = option(options, "--budget")) {
        auto parsed = parse_amount("--budget", *text);
        if (!parsed) {
            return fail(parsed.error());
        }
        budget_limit = *parsed;
    }

    auto ctx = open_context(options.common);
    if (!ctx) {
        return fail(ctx.error());
    }
    axiom::store::ProjectRecord project{.id = *id,
                                        .name = option(options, "--name").value_or(*id),
                                        .owner_id = *owner,
                                        .budget_limit = budget_limit,
                                        .current_usage = 0.0};
    if (auto added = ctx->store->add_project(project); !added) {
        return fail(added.error());
    }
    std::println("Added project: {} (owner {})", project.id, project.owner_id);
    return 0;
}

[[nodiscard]] int run_add_member(const CommandOptions& options)
{
    const auto project = option(options, "--project");
    const auto user = option(options, "--user");
    const auto role = option(options, "--role");
    if (!project || !user || !role) {
        std::println(stderr, "Error: --project, --user and --role are required");
        print_add_member_help();
        return 1;
    }
    if (!axiom::rbac::role_from_string(*role)) {
        std::println(stderr, "Error: unknown role: {}", *role);
        return 1;
    }

    auto ctx = open_context(options.common);
    if (!ctx) {
        return fail(ctx.error());
    }
    if (auto added = ctx->store->add_member(*project, *user, *role); !added) {
        return fail(added.error());
    }
    std::println("Granted {} on {} to {}", *role, *project, *user);
    return 0;
}

[[nodiscard]] int run_issue_token(const CommandOptions& options)
{
    const auto user = option(options, "--user");
    if (!user) {
        std::println(stderr, "Error: --user is required");
        print_issue_token_help();
        return 1;
    }
    long long ttl = 3600;
    if (auto text = option(options, "--ttl")) {
        auto parsed = parse_integer("--ttl", *text);
        if (!parsed) {
            return fail(parsed.error());
        }
        ttl = *parsed;
    }

    auto config = load_config(options.common);
    if (!config) {
        return fail(config.error());
    }
    if (config->jwt_secret.empty()) {
        std::println(stderr, "Error: no credential secret configured (set AXIOM_JWT_SECRET)");
        return 1;
    }
    axiom::auth::Authenticator authenticator(config->jwt_secret);
    auto token = authenticator.issue(axiom::auth::Principal{.id = *user,
                                                            .email = option(options, "--email").value_or(""),
                                                            .role = option(options, "--role").value_or("")},
                                     std::chrono::seconds{ttl});
    if (!token) {
        return fail(token.error());
    }
    std::println("{}", *token);
    return 0;
}

[[nodiscard]] int run_admit(const CommandOptions& options)
{
    const auto operation = option(options, "--operation");
    if (!operation) {
        std::println(stderr, "Error: --operation is required");
        print_admit_help();
        return 1;
    }
    auto policy = axiom::admission::policies::find(*operation);
    if (!policy) {
        std::println(stderr, "Error: unknown operation: {}", *operation);
        return 1;
    }
    double cost = 0.0;
    if (auto text = option(options, "--cost")) {
        auto parsed = parse_amount("--cost", *text);
        if (!parsed) {
            return fail(parsed.error());
        }
        cost = *parsed;
    }

    auto ctx = open_context(options.common);
    if (!ctx) {
        return fail(ctx.error());
    }
    const auto& config = ctx->config;
    axiom::auth::Authenticator authenticator(config.jwt_secret);
    axiom::rbac::Authorizer authorizer(*ctx->store, *ctx->store);
    axiom::ratelimit::RateLimiter default_limiter(config.default_tier);
    axiom::ratelimit::RateLimiter strict_limiter(config.strict_tier);
    axiom::breaker::Registry breakers;
    for (const auto& [name, breaker_config] : config.breakers) {
        breakers.add(name, breaker_config);
    }
    axiom::budget::BudgetGuard budget(*ctx->store, *ctx->store, config.budget);
    axiom::admission::AdmissionController controller(
        authenticator, authorizer, default_limiter, strict_limiter, breakers, budget);

    const auto token = option(options, "--token");
    axiom::admission::AdmissionRequest request{
        .authorization = token ? "Bearer " + *token : std::string{},
        .source_address = option(options, "--source").value_or("127.0.0.1"),
        .project_id = option(options, "--project").value_or(""),
        .estimated_cost = cost};
    auto admitted = controller.admit(*policy, request);
    if (!admitted) {
        std::println("{} {}", admitted.error().http_status(), admitted.error().to_envelope().dump());
        return kExitDenied;
    }
    std::println("200 admitted");
    for (const auto& [name, value] : admitted->headers()) {
        std::println("{}: {}", name, value);
    }
    return 0;
}

[[nodiscard]] int run_check_budget(const CommandOptions& options)
{
    const auto project = option(options, "--project");
    const auto cost_text = option(options, "--cost");
    if (!project || !cost_text) {
        std::println(stderr, "Error: --project and --cost are required");
        print_check_budget_help();
        return 1;
    }
    auto cost = parse_amount("--cost", *cost_text);
    if (!cost) {
        return fail(cost.error());
    }

    auto ctx = open_context(options.common);
    if (!ctx) {
        return fail(ctx.error());
    }
    axiom::budget::BudgetGuard guard(*ctx->store, *ctx->store, ctx->config.budget);
    auto status = guard.check_budget(*project, *cost);
    if (!status) {
        return fail(status.error());
    }
    if (!status->allowed) {
        std::println("denied: {}", status->reason);
        return kExitDenied;
    }
    std::println("allowed: remaining {:.2f}", status->remaining);
    return 0;
}

[[nodiscard]] int run_record_usage(const CommandOptions& options)
{
    const auto project = option(options, "--project");
    const auto user = option(options, "--user");
    const auto cost_text = option(options, "--cost");
    const auto operation = option(options, "--operation");
    if (!project || !user || !cost_text || !operation) {
        std::println(stderr, "Error: --project, --user, --cost and --operation are required");
        print_record_usage_help();
        return 1;
    }
    auto cost = parse_amount("--cost", *cost_text);
    if (!cost) {
        return fail(cost.error());
    }

    auto ctx = open_context(options.common);
    if (!ctx) {
        return fail(ctx.error());
    }
    axiom::budget::BudgetGuard guard(*ctx->store, *ctx->store, ctx->config.budget);
    if (auto recorded = guard.record_usage(*project, *user, *cost, *operation); !recorded) {
        return fail(recorded.error());
    }
    auto project_row = ctx->store->get_project(*project);
    if (!project_row) {
        return fail(project_row.error());
    }
    std::println("Recorded {:.2f} on {}; usage now {:.2f}", *cost, *project, project_row->current_usage);
    return 0;
}

/// Persist each step so the stored unit always matches the registry
[[nodiscard]] axiom::Result<axiom::ivcu::IvcuRecord> step(axiom::ivcu::IvcuRegistry& registry,
                                                          axiom::store::SqliteStore& store,
                                                          const std::string& id,
                                                          axiom::ivcu::Status to)
{
    auto moved = registry.transition(id, to);
    if (!moved) {
        return moved;
    }
    if (auto saved = store.save_ivcu(*moved); !saved) {
        return std::unexpected(saved.error());
    }
    return moved;
}

[[nodiscard]] int run_issue_cert(const CommandOptions& options)
{
    const auto project = option(options, "--project");
    const auto intent = option(options, "--intent");
    const auto code_path = option(options, "--code");
    if (!project || !intent || !code_path || options.verifiers.empty()) {
        std::println(stderr, "Error: --project, --intent, --code and --verifier are required");
        print_issue_cert_help();
        return 1;
    }
    const std::string type_text = option(options, "--proof-type").value_or("type_safety");
    auto proof_type = axiom::certificate::proof_type_from_string(type_text);
    if (!proof_type) {
        std::println(stderr, "Error: unknown proof type: {}", type_text);
        return 1;
    }
    std::vector<axiom::ivcu::VerifierResult> results;
    for (auto [i, spec] : std::views::enumerate(options.verifiers)) {
        auto result = parse_verifier(spec, static_cast<int>(i) + 1);
        if (!result) {
            return fail(result.error());
        }
        results.push_back(std::move(*result));
    }
    auto code = read_text_file(*code_path);
    if (!code) {
        return fail(code.error());
    }

    auto ctx = open_context(options.common);
    if (!ctx) {
        return fail(ctx.error());
    }
    axiom::ivcu::IvcuRegistry registry;
    auto draft = registry.create(*project);
    if (!draft) {
        return fail(draft.error());
    }
    if (auto saved = ctx->store->save_ivcu(*draft); !saved) {
        return fail(saved.error());
    }
    for (auto status : {axiom::ivcu::Status::kGenerating, axiom::ivcu::Status::kVerifying}) {
        if (auto moved = step(registry, *ctx->store, draft->id, status); !moved) {
            return fail(moved.error());
        }
    }
    auto settled = registry.complete_verification(draft->id, results, ctx->config.verification);
    if (!settled) {
        return fail(settled.error());
    }
    if (auto saved = ctx->store->save_ivcu(*settled); !saved) {
        return fail(saved.error());
    }
    if (settled->status != axiom::ivcu::Status::kVerified) {
        std::println(stderr,
                     "IVCU {} failed verification (confidence {:.2f}); no certificate issued",
                     settled->id,
                     settled->confidence_score);
        return kExitDenied;
    }

    axiom::certificate::CertificateService service(ctx->config.signing_key);
    auto cert = service.generate_certificate(*settled, *intent, *code, *proof_type, results);
    if (!cert) {
        return fail(cert.error());
    }
    axiom::certstore::CertStore cert_store(*ctx->store, options.common.schema_dir);
    auto content_hash = cert_store.put(*cert);
    if (!content_hash) {
        return fail(content_hash.error());
    }
    if (auto output = option(options, "--output")) {
        if (auto exported = cert_store.export_file(*cert, *output); !exported) {
            return fail(exported.error());
        }
    }
    std::println("Issued certificate {} for IVCU {}", cert->id, settled->id);
    std::println("  hash_chain:   {}", cert->hash_chain);
    std::println("  content_hash: {}", *content_hash);
    return 0;
}

[[nodiscard]] int run_verify_cert(const CommandOptions& options)
{
    const auto id = option(options, "--id");
    const auto file = option(options, "--file");
    if (id.has_value() == file.has_value()) {
        std::println(stderr, "Error: exactly one of --id and --file is required");
        print_verify_cert_help();
        return 1;
    }

    auto config = load_config(options.common);
    if (!config) {
        return fail(config.error());
    }
    axiom::Result<axiom::certificate::ProofCertificate> cert;
    std::unique_ptr<axiom::store::SqliteStore> store;
    if (id) {
        auto opened = axiom::store::SqliteStore::open(config->database_path);
        if (!opened) {
            return fail(opened.error());
        }
        store = std::move(*opened);
        if (auto migrated = store->migrate(); !migrated) {
            return fail(migrated.error());
        }
        cert = axiom::certstore::CertStore(*store, options.common.schema_dir).get(*id);
    } else {
        // import_file never reads the repository
        auto scratch = axiom::store::SqliteStore::open(":memory:");
        if (!scratch) {
            return fail(scratch.error());
        }
        cert = axiom::certstore::CertStore(**scratch, options.common.schema_dir).import_file(*file);
    }
    if (!cert) {
        return fail(cert.error());
    }

    axiom::certificate::CertificateService service(config->signing_key);
    if (auto verified = service.verify(*cert); !verified) {
        return fail(verified.error());
    }
    if (auto code_path = option(options, "--code")) {
        auto code = read_text_file(*code_path);
        if (!code) {
            return fail(code.error());
        }
        if (auto matched = service.verify_code(*cert, *code); !matched) {
            return fail(matched.error());
        }
    }
    std::println("OK {} ({} for IVCU {})",
                 cert->id,
                 axiom::certificate::proof_type_name(cert->proof_type),
                 cert->ivcu_id);
    return 0;
}

using RunFn = int (*)(const CommandOptions&);
using HelpFn = void (*)();

[[nodiscard]] int dispatch(int argc,
                           char** argv,
                           std::span<const std::string_view> allowed,
                           HelpFn help,
                           RunFn run)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_command_args(args, allowed);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->common.show_help) {
        help();
        return 0;
    }
    return run(*options);
}

constexpr std::string_view kAddProjectOptions[] = {"--id", "--owner", "--name", "--budget"};
constexpr std::string_view kAddMemberOptions[] = {"--project", "--user", "--role"};
constexpr std::string_view kIssueTokenOptions[] = {"--user", "--email", "--role", "--ttl"};
constexpr std::string_view kAdmitOptions[] = {"--operation", "--token", "--project", "--cost", "--source"};
constexpr std::string_view kCheckBudgetOptions[] = {"--project", "--cost"};
constexpr std::string_view kRecordUsageOptions[] = {"--project", "--user", "--cost", "--operation"};
constexpr std::string_view kIssueCertOptions[] =
    {"--project", "--intent", "--code", "--proof-type", "--verifier", "--output"};
constexpr std::string_view kVerifyCertOptions[] = {"--id", "--file", "--code"};

}  // namespace

namespace {

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return 0;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return 0;
        }

        int sub_argc = argc - 2;
        char** sub_argv = argv + 2;

        if (cmd == "init-db") {
            return dispatch(sub_argc, sub_argv, {}, print_init_db_help, run_init_db);
        }
        if (cmd == "add-project") {
            return dispatch(sub_argc, sub_argv, kAddProjectOptions, print_add_project_help, run_add_project);
        }
        if (cmd == "add-member") {
            return dispatch(sub_argc, sub_argv, kAddMemberOptions, print_add_member_help, run_add_member);
        }
        if (cmd == "issue-token") {
            return dispatch(sub_argc, sub_argv, kIssueTokenOptions, print_issue_token_help, run_issue_token);
        }
        if (cmd == "admit") {
            return dispatch(sub_argc, sub_argv, kAdmitOptions, print_admit_help, run_admit);
        }
        if (cmd == "check-budget") {
            return dispatch(sub_argc, sub_argv, kCheckBudgetOptions, print_check_budget_help, run_check_budget);
        }
        if (cmd == "record-usage") {
            return dispatch(sub_argc, sub_argv, kRecordUsageOptions, print_record_usage_help, run_record_usage);
        }
        if (cmd == "issue-cert") {
            return dispatch(sub_argc, sub_argv, kIssueCertOptions, print_issue_cert_help, run_issue_cert);
        }
        if (cmd == "verify-cert") {
            return dispatch(sub_argc, sub_argv, kVerifyCertOptions, print_verify_cert_help, run_verify_cert);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return 1;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return 1;
    } catch (...) {
        try {
            std::println(stderr, "Error: unknown exception");
        } catch (...) {
            std::terminate();
        }
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
