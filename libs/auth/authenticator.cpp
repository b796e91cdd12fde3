/**
 * @file authenticator.cpp
 * @brief JWS parsing and HMAC verification
 */

#include "axiom/auth.hpp"

#include <cstdint>
#include <format>
#include <optional>
#include <utility>

#include <nlohmann/json.hpp>

namespace axiom::auth {

namespace {

constexpr std::string_view kBearerPrefix = "Bearer ";

[[nodiscard]] Error auth_error(std::string message)
{
    return Error::make(errc::kAuthentication, std::move(message));
}

[[nodiscard]] std::optional<common::HmacAlgorithm> algorithm_from_name(std::string_view alg) noexcept
{
    if (alg == "HS256") {
        return common::HmacAlgorithm::kSha256;
    }
    if (alg == "HS384") {
        return common::HmacAlgorithm::kSha384;
    }
    if (alg == "HS512") {
        return common::HmacAlgorithm::kSha512;
    }
    return std::nullopt;
}

[[nodiscard]] std::string_view algorithm_name(common::HmacAlgorithm algorithm) noexcept
{
    switch (algorithm) {
        case common::HmacAlgorithm::kSha256:
            return "HS256";
        case common::HmacAlgorithm::kSha384:
            return "HS384";
        case common::HmacAlgorithm::kSha512:
            return "HS512";
    }
    return "HS256";
}

[[nodiscard]] axiom::Result<nlohmann::json> decode_segment(std::string_view segment,
                                                           std::string_view what)
{
    auto bytes = common::base64url_decode(segment);
    if (!bytes) {
        return std::unexpected(auth_error(std::format("malformed token {}", what)));
    }
    nlohmann::json j = nlohmann::json::parse(*bytes, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::unexpected(auth_error(std::format("malformed token {}", what)));
    }
    return j;
}

[[nodiscard]] std::optional<std::int64_t> numeric_claim(const nlohmann::json& claims,
                                                        std::string_view name)
{
    auto it = claims.find(name);
    if (it == claims.end() || !it->is_number()) {
        return std::nullopt;
    }
    if (it->is_number_float()) {
        return static_cast<std::int64_t>(it->get<double>());
    }
    return it->get<std::int64_t>();
}

[[nodiscard]] std::string string_claim(const nlohmann::json& claims, std::string_view name)
{
    auto it = claims.find(name);
    if (it == claims.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

}  // namespace

Authenticator::Authenticator(std::string secret, NowFn now)
    : m_secret(std::move(secret))
    , m_now(now ? std::move(now) : NowFn{[] { return WallClock::now(); }})
{}

axiom::Result<Principal> Authenticator::authenticate(std::string_view authorization) const
{
    if (authorization.empty()) {
        return std::unexpected(auth_error("Authorization header required"));
    }
    if (!authorization.starts_with(kBearerPrefix)) {
        return std::unexpected(auth_error("Invalid authorization header format"));
    }
    return verify_token(authorization.substr(kBearerPrefix.size()));
}

axiom::Result<Principal> Authenticator::verify_token(std::string_view token) const
{
    if (m_secret.empty()) {
        return std::unexpected(auth_error("token verification is not configured"));
    }
    const auto first = token.find('.');
    const auto second = first == std::string_view::npos ? first : token.find('.', first + 1);
    if (first == std::string_view::npos || second == std::string_view::npos
        || token.find('.', second + 1) != std::string_view::npos) {
        return std::unexpected(auth_error("malformed token"));
    }
    const std::string_view header_b64 = token.substr(0, first);
    const std::string_view payload_b64 = token.substr(first + 1, second - first - 1);
    const std::string_view signature_b64 = token.substr(second + 1);

    auto header = decode_segment(header_b64, "header");
    if (!header) {
        return std::unexpected(header.error());
    }
    const std::string alg = string_claim(*header, "alg");
    auto algorithm = algorithm_from_name(alg);
    if (!algorithm) {
        return std::unexpected(auth_error(std::format("unexpected signing method: {}", alg)));
    }

    auto signature = common::base64url_decode(signature_b64);
    if (!signature) {
        return std::unexpected(auth_error("malformed token signature"));
    }
    const std::string signing_input(token.substr(0, second));
    auto expected = common::hmac_raw(*algorithm, m_secret, signing_input);
    if (!expected) {
        return std::unexpected(auth_error("token signature could not be computed"));
    }
    if (!common::constant_time_equals(*expected, *signature)) {
        return std::unexpected(auth_error("invalid token signature"));
    }

    auto claims = decode_segment(payload_b64, "payload");
    if (!claims) {
        return std::unexpected(claims.error());
    }

    const auto now_s =
        std::chrono::duration_cast<std::chrono::seconds>(m_now().time_since_epoch()).count();
    auto exp = numeric_claim(*claims, "exp");
    if (!exp) {
        return std::unexpected(auth_error("token has no expiry"));
    }
    if (now_s >= *exp) {
        return std::unexpected(auth_error("token is expired"));
    }
    if (auto nbf = numeric_claim(*claims, "nbf"); nbf && now_s < *nbf) {
        return std::unexpected(auth_error("token is not valid yet"));
    }

    Principal principal{.id = string_claim(*claims, "user_id"),
                        .email = string_claim(*claims, "email"),
                        .role = string_claim(*claims, "role")};
    if (principal.id.empty()) {
        return std::unexpected(auth_error("token has no user_id claim"));
    }
    return principal;
}

axiom::Result<std::string> Authenticator::issue(const Principal& principal,
                                                std::chrono::seconds ttl,
                                                common::HmacAlgorithm algorithm) const
{
    if (m_secret.empty()) {
        return std::unexpected(auth_error("token signing is not configured"));
    }
    if (principal.id.empty()) {
        return std::unexpected(Error::make(errc::kValidation, "principal id must not be empty"));
    }
    const auto now = std::chrono::duration_cast<std::chrono::seconds>(m_now().time_since_epoch());

    const nlohmann::json header = {{"alg", std::string(algorithm_name(algorithm))}, {"typ", "JWT"}};
    const nlohmann::json claims = {{"user_id", principal.id},
                                   {"email", principal.email},
                                   {"role", principal.role},
                                   {"iat", now.count()},
                                   {"exp", (now + ttl).count()}};

    std::string signing_input = std::format("{}.{}",
                                            common::base64url_encode(header.dump()),
                                            common::base64url_encode(claims.dump()));
    auto mac = common::hmac_raw(algorithm, m_secret, signing_input);
    if (!mac) {
        return std::unexpected(mac.error());
    }
    return std::format("{}.{}", signing_input, common::base64url_encode(*mac));
}

}  // namespace axiom::auth
